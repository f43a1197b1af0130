#pragma once

#include "deepeq/equivalency/rules/ISelectionRule.hpp"

namespace deepeq::equivalency {

// Replaces the candidate set with every member of the declared type.
class AllDeclaredMembersSelectionRule final : public ISelectionRule {
public:
  MemberSet selectMembers(MemberSet, const TypeInfo &info) const final {
    const reflect::TypeDescriptor *type =
        info.declaredType != nullptr ? info.declaredType : info.runtimeType;
    MemberSet selected;
    if (type == nullptr) {
      return selected;
    }
    for (const reflect::Member &member : type->members()) {
      selected.push_back(&member);
    }
    return selected;
  }

  memory::string describe() const final {
    return "include all declared members";
  }
};

} // namespace deepeq::equivalency
