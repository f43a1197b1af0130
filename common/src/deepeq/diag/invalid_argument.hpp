#pragma once

#include "deepeq/memory/container/string.hpp"
#include <stdexcept>

namespace deepeq::diag {

[[noreturn]] inline void invalid_argument(const memory::string &msg) {
  throw std::invalid_argument(msg);
}

} // namespace deepeq::diag
