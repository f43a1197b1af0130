#pragma once

#include "deepeq/memory/container/string.hpp"
#include <stdexcept>

namespace deepeq::diag {

// Raised when an equivalency assertion fails. The message is the fully
// rendered failure text.
class AssertionFailure : public std::runtime_error {
public:
  explicit AssertionFailure(const memory::string &message)
      : std::runtime_error(message) {}
};

[[noreturn]] inline void assertion_failed(const memory::string &message) {
  throw AssertionFailure(message);
}

} // namespace deepeq::diag
