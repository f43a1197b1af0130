#include "deepeq/equivalency/Verification.hpp"

#include "deepeq/diag/logging.hpp"

namespace deepeq::equivalency {

void Verification::fail(const memory::string &message) const {
  DEEPEQ_DEBUG("assertion failed: {}", message);
  m_handler->handleFailure(message);
}

} // namespace deepeq::equivalency
