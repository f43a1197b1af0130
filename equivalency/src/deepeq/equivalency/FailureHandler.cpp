#include "deepeq/equivalency/FailureHandler.hpp"

#include "deepeq/diag/AssertionFailure.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace deepeq::equivalency {

ThrowingFailureHandler &ThrowingFailureHandler::instance() {
  static ThrowingFailureHandler handler;
  return handler;
}

void ThrowingFailureHandler::handleFailure(const memory::string &message) {
  diag::assertion_failed(message);
}

void CollectingFailureHandler::handleFailure(const memory::string &message) {
  m_failures.push_back(message);
}

void CollectingFailureHandler::throwIfAny() const {
  if (m_failures.empty()) {
    return;
  }
  diag::assertion_failed(fmt::format("{}", fmt::join(m_failures, "\n")));
}

} // namespace deepeq::equivalency
