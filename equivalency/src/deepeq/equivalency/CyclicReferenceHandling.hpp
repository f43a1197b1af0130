#pragma once

#include <fmt/core.h>

namespace deepeq::equivalency {

enum class CyclicReferenceHandling {
  FailOnCycle,
  // the cyclic node is treated as satisfied and not descended into.
  IgnoreCycle,
};

} // namespace deepeq::equivalency

template <> struct fmt::formatter<deepeq::equivalency::CyclicReferenceHandling> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(deepeq::equivalency::CyclicReferenceHandling handling,
              FormatContext &ctx) const {
    switch (handling) {
    case deepeq::equivalency::CyclicReferenceHandling::FailOnCycle:
      return fmt::format_to(ctx.out(), "FailOnCycle");
    case deepeq::equivalency::CyclicReferenceHandling::IgnoreCycle:
      return fmt::format_to(ctx.out(), "IgnoreCycle");
    }
    return ctx.out();
  }
};
