#pragma once

#include "deepeq/equivalency/rules/IMatchingRule.hpp"
#include "deepeq/reflect/TypeDescriptor.hpp"

namespace deepeq::equivalency {

// The expectation member with the subject member's name, if any.
class TryMatchByNameRule final : public IMatchingRule {
public:
  const reflect::Member *match(const reflect::Member &subjectMember,
                               const reflect::Object &expectation,
                               memory::string_view,
                               const Verification &) const final {
    if (expectation.isNull()) {
      return nullptr;
    }
    return expectation.type().findMember(subjectMember.name());
  }

  memory::string describe() const final {
    return "try to match member by name";
  }
};

} // namespace deepeq::equivalency
