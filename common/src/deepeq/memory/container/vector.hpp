#pragma once

#include <vector>

namespace deepeq::memory {

template <typename T, typename Allocator = std::allocator<T>>
using vector = std::vector<T, Allocator>;

}
