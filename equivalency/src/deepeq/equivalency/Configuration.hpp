#pragma once

#include "deepeq/equivalency/CyclicReferenceHandling.hpp"
#include "deepeq/equivalency/rules/ExcludeMemberByPredicateSelectionRule.hpp"
#include "deepeq/equivalency/rules/IMatchingRule.hpp"
#include "deepeq/equivalency/rules/ISelectionRule.hpp"
#include "deepeq/memory/container/optional.hpp"
#include "deepeq/memory/container/shared_ptr.hpp"
#include "deepeq/memory/container/span.hpp"
#include "deepeq/memory/container/string.hpp"
#include "deepeq/memory/container/vector.hpp"
#include <cstddef>
#include <fmt/core.h>

namespace deepeq::equivalency {

/// Policy of a structural comparison: which members take part, how they
/// are paired with the expectation's members and what a cycle means.
///
/// A configuration is set up before the traversal and shared, read-only, by
/// every context of it. Rules are applied in the order they were added.
class Configuration {
public:
  using SelectionRulePtr = memory::shared_ptr<const ISelectionRule>;
  using MatchingRulePtr = memory::shared_ptr<const IMatchingRule>;

  static constexpr std::size_t DefaultMaxRecursionDepth = 10;

  // all declared members, matched by name (a missing counterpart fails),
  // failing on cycles, at most DefaultMaxRecursionDepth levels deep.
  static Configuration defaults();

  // no rules at all.
  static Configuration empty();

  memory::span<const SelectionRulePtr> selectionRules() const {
    return m_selectionRules;
  }
  memory::span<const MatchingRulePtr> matchingRules() const {
    return m_matchingRules;
  }
  CyclicReferenceHandling cyclicReferenceHandling() const {
    return m_cyclicReferenceHandling;
  }
  // nullopt when recursion is unbounded.
  memory::optional<std::size_t> maxRecursionDepth() const {
    return m_maxRecursionDepth;
  }

  // Both replace the rule that selects all members, keeping it first.
  Configuration &includingAllDeclaredMembers();
  Configuration &includingAllRuntimeMembers();

  // Compares only explicitly included members.
  Configuration &including(memory::string path);
  Configuration &excluding(memory::string path);
  Configuration &excludingIf(ExcludeMemberByPredicateSelectionRule::Predicate
                                 predicate,
                             memory::string description);

  // members without a counterpart are skipped instead of failing.
  Configuration &excludingMissingMembers();

  Configuration &ignoringCyclicReferences();
  Configuration &failingOnCyclicReferences();

  Configuration &withMaxRecursionDepth(std::size_t depth);
  Configuration &allowingInfiniteRecursion();

  Configuration &withSelectionRule(SelectionRulePtr rule);
  Configuration &withMatchingRule(MatchingRulePtr rule);
  Configuration &clearSelectionRules();
  Configuration &clearMatchingRules();

private:
  Configuration() = default;

  template <typename Rule> void removeSelectionRules();

  memory::vector<SelectionRulePtr> m_selectionRules;
  memory::vector<MatchingRulePtr> m_matchingRules;
  CyclicReferenceHandling m_cyclicReferenceHandling =
      CyclicReferenceHandling::FailOnCycle;
  memory::optional<std::size_t> m_maxRecursionDepth = DefaultMaxRecursionDepth;
};

} // namespace deepeq::equivalency

template <> struct fmt::formatter<deepeq::equivalency::Configuration> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const deepeq::equivalency::Configuration &config,
              FormatContext &ctx) const {
    auto out = ctx.out();
    out = fmt::format_to(out, "selection:");
    for (const auto &rule : config.selectionRules()) {
      out = fmt::format_to(out, " [{}]", rule->describe());
    }
    out = fmt::format_to(out, ", matching:");
    for (const auto &rule : config.matchingRules()) {
      out = fmt::format_to(out, " [{}]", rule->describe());
    }
    out = fmt::format_to(out, ", cycles: {}", config.cyclicReferenceHandling());
    if (config.maxRecursionDepth().has_value()) {
      out = fmt::format_to(out, ", max depth: {}", *config.maxRecursionDepth());
    } else {
      out = fmt::format_to(out, ", max depth: unbounded");
    }
    return out;
  }
};
