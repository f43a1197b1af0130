#pragma once

#include "deepeq/equivalency/rules/ISelectionRule.hpp"

namespace deepeq::equivalency {

// Replaces the candidate set with every member of the runtime type.
class AllRuntimeMembersSelectionRule final : public ISelectionRule {
public:
  MemberSet selectMembers(MemberSet, const TypeInfo &info) const final {
    MemberSet selected;
    if (info.runtimeType == nullptr) {
      return selected;
    }
    for (const reflect::Member &member : info.runtimeType->members()) {
      selected.push_back(&member);
    }
    return selected;
  }

  memory::string describe() const final {
    return "include all runtime members";
  }
};

} // namespace deepeq::equivalency
