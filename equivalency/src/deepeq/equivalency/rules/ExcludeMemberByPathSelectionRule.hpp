#pragma once

#include "deepeq/equivalency/MemberPath.hpp"
#include "deepeq/equivalency/rules/ISelectionRule.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace deepeq::equivalency {

class ExcludeMemberByPathSelectionRule final : public ISelectionRule {
public:
  // `path` is a full member path such as "Address.Street".
  explicit ExcludeMemberByPathSelectionRule(memory::string path)
      : m_path(std::move(path)) {}

  MemberSet selectMembers(MemberSet members,
                          const TypeInfo &info) const final {
    std::erase_if(members, [&](const reflect::Member *member) {
      return combine_path(info.memberPath, member->name()) == m_path;
    });
    return members;
  }

  memory::string describe() const final {
    return fmt::format("exclude member {}", m_path);
  }

private:
  memory::string m_path;
};

} // namespace deepeq::equivalency
