#pragma once

#include <optional>

namespace deepeq::memory {

template <typename T> using optional = std::optional<T>;
static constexpr std::nullopt_t nullopt = std::nullopt;

} // namespace deepeq::memory
