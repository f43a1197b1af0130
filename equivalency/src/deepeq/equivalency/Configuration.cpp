#include "deepeq/equivalency/Configuration.hpp"

#include "deepeq/diag/invalid_argument.hpp"
#include "deepeq/equivalency/rules/AllDeclaredMembersSelectionRule.hpp"
#include "deepeq/equivalency/rules/AllRuntimeMembersSelectionRule.hpp"
#include "deepeq/equivalency/rules/ExcludeMemberByPathSelectionRule.hpp"
#include "deepeq/equivalency/rules/IncludeMemberByPathSelectionRule.hpp"
#include "deepeq/equivalency/rules/MustMatchByNameRule.hpp"
#include "deepeq/equivalency/rules/TryMatchByNameRule.hpp"
#include <algorithm>
#include <memory>

namespace deepeq::equivalency {

Configuration Configuration::defaults() {
  Configuration config;
  config.m_selectionRules.push_back(
      std::make_shared<AllDeclaredMembersSelectionRule>());
  config.m_matchingRules.push_back(std::make_shared<MustMatchByNameRule>());
  return config;
}

Configuration Configuration::empty() { return Configuration{}; }

template <typename Rule> void Configuration::removeSelectionRules() {
  std::erase_if(m_selectionRules, [](const SelectionRulePtr &rule) {
    return dynamic_cast<const Rule *>(rule.get()) != nullptr;
  });
}

Configuration &Configuration::includingAllDeclaredMembers() {
  removeSelectionRules<AllDeclaredMembersSelectionRule>();
  removeSelectionRules<AllRuntimeMembersSelectionRule>();
  m_selectionRules.insert(m_selectionRules.begin(),
                          std::make_shared<AllDeclaredMembersSelectionRule>());
  return *this;
}

Configuration &Configuration::includingAllRuntimeMembers() {
  removeSelectionRules<AllDeclaredMembersSelectionRule>();
  removeSelectionRules<AllRuntimeMembersSelectionRule>();
  m_selectionRules.insert(m_selectionRules.begin(),
                          std::make_shared<AllRuntimeMembersSelectionRule>());
  return *this;
}

Configuration &Configuration::including(memory::string path) {
  if (path.empty()) {
    diag::invalid_argument("cannot include an empty member path");
  }
  removeSelectionRules<AllDeclaredMembersSelectionRule>();
  removeSelectionRules<AllRuntimeMembersSelectionRule>();
  m_selectionRules.push_back(
      std::make_shared<IncludeMemberByPathSelectionRule>(std::move(path)));
  return *this;
}

Configuration &Configuration::excluding(memory::string path) {
  if (path.empty()) {
    diag::invalid_argument("cannot exclude an empty member path");
  }
  m_selectionRules.push_back(
      std::make_shared<ExcludeMemberByPathSelectionRule>(std::move(path)));
  return *this;
}

Configuration &Configuration::excludingIf(
    ExcludeMemberByPredicateSelectionRule::Predicate predicate,
    memory::string description) {
  if (!predicate) {
    diag::invalid_argument("cannot exclude members by an empty predicate");
  }
  m_selectionRules.push_back(
      std::make_shared<ExcludeMemberByPredicateSelectionRule>(
          std::move(predicate), std::move(description)));
  return *this;
}

Configuration &Configuration::excludingMissingMembers() {
  bool replaced = false;
  for (MatchingRulePtr &rule : m_matchingRules) {
    if (dynamic_cast<const MustMatchByNameRule *>(rule.get()) != nullptr) {
      rule = std::make_shared<TryMatchByNameRule>();
      replaced = true;
    }
  }
  if (!replaced) {
    m_matchingRules.push_back(std::make_shared<TryMatchByNameRule>());
  }
  return *this;
}

Configuration &Configuration::ignoringCyclicReferences() {
  m_cyclicReferenceHandling = CyclicReferenceHandling::IgnoreCycle;
  return *this;
}

Configuration &Configuration::failingOnCyclicReferences() {
  m_cyclicReferenceHandling = CyclicReferenceHandling::FailOnCycle;
  return *this;
}

Configuration &Configuration::withMaxRecursionDepth(std::size_t depth) {
  m_maxRecursionDepth = depth;
  return *this;
}

Configuration &Configuration::allowingInfiniteRecursion() {
  m_maxRecursionDepth = memory::nullopt;
  return *this;
}

Configuration &Configuration::withSelectionRule(SelectionRulePtr rule) {
  if (rule == nullptr) {
    diag::invalid_argument("selection rule is null");
  }
  m_selectionRules.push_back(std::move(rule));
  return *this;
}

Configuration &Configuration::withMatchingRule(MatchingRulePtr rule) {
  if (rule == nullptr) {
    diag::invalid_argument("matching rule is null");
  }
  m_matchingRules.push_back(std::move(rule));
  return *this;
}

Configuration &Configuration::clearSelectionRules() {
  m_selectionRules.clear();
  return *this;
}

Configuration &Configuration::clearMatchingRules() {
  m_matchingRules.clear();
  return *this;
}

} // namespace deepeq::equivalency
