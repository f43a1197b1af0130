#pragma once

#include <cstddef>
#include <fmt/core.h>

namespace deepeq::equivalency {

struct ValidationSummary {
  std::size_t visitedNodes = 0;
  // value and null comparisons
  std::size_t leafComparisons = 0;
  // members without a counterpart on the expectation
  std::size_t skippedMembers = 0;
  std::size_t cyclicReferences = 0;
};

} // namespace deepeq::equivalency

template <> struct fmt::formatter<deepeq::equivalency::ValidationSummary> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const deepeq::equivalency::ValidationSummary &summary,
              FormatContext &ctx) const {
    return fmt::format_to(
        ctx.out(), "{} node(s), {} leaf comparison(s), {} skipped, {} cycle(s)",
        summary.visitedNodes, summary.leafComparisons, summary.skippedMembers,
        summary.cyclicReferences);
  }
};
