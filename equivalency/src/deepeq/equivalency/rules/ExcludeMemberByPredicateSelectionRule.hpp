#pragma once

#include "deepeq/equivalency/MemberPath.hpp"
#include "deepeq/equivalency/rules/ISelectionRule.hpp"
#include <functional>
#include <fmt/format.h>

namespace deepeq::equivalency {

class ExcludeMemberByPredicateSelectionRule final : public ISelectionRule {
public:
  // receives the member and its full path
  using Predicate =
      std::function<bool(const reflect::Member &, memory::string_view)>;

  ExcludeMemberByPredicateSelectionRule(Predicate predicate,
                                        memory::string description)
      : m_predicate(std::move(predicate)),
        m_description(std::move(description)) {}

  MemberSet selectMembers(MemberSet members,
                          const TypeInfo &info) const final {
    std::erase_if(members, [&](const reflect::Member *member) {
      return m_predicate(*member,
                         combine_path(info.memberPath, member->name()));
    });
    return members;
  }

  memory::string describe() const final {
    return fmt::format("exclude members where {}", m_description);
  }

private:
  Predicate m_predicate;
  memory::string m_description;
};

} // namespace deepeq::equivalency
