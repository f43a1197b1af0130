#pragma once

#include "deepeq/memory/container/string.hpp"
#include <stdexcept>

namespace deepeq::diag {

[[noreturn]] inline void invalid_state(const memory::string &msg) {
  throw std::logic_error(msg);
}

} // namespace deepeq::diag
