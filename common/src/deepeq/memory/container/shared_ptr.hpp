#pragma once

#include <memory>

namespace deepeq::memory {

template <typename T> using shared_ptr = std::shared_ptr<T>;

template <typename T> using unique_ptr = std::unique_ptr<T>;

} // namespace deepeq::memory
