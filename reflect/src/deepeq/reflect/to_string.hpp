#pragma once

#include "deepeq/memory/container/string.hpp"
#include "deepeq/reflect/Object.hpp"
#include <fmt/core.h>

namespace deepeq::reflect {

// Human readable rendering used in failure messages. Objects nested inside
// the rendered value are printed by type name only.
memory::string to_string(const Object &object);

} // namespace deepeq::reflect

template <> struct fmt::formatter<deepeq::reflect::Object> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const deepeq::reflect::Object &object, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", deepeq::reflect::to_string(object));
  }
};
