#pragma once

#include "deepeq/equivalency/Verification.hpp"
#include "deepeq/equivalency/rules/IMatchingRule.hpp"
#include "deepeq/reflect/TypeDescriptor.hpp"

namespace deepeq::equivalency {

// Like TryMatchByNameRule, but a subject member without a counterpart is an
// assertion failure.
class MustMatchByNameRule final : public IMatchingRule {
public:
  const reflect::Member *match(const reflect::Member &subjectMember,
                               const reflect::Object &expectation,
                               memory::string_view memberPath,
                               const Verification &verification) const final {
    if (expectation.isNull()) {
      return nullptr;
    }
    const reflect::Member *match =
        expectation.type().findMember(subjectMember.name());
    if (match == nullptr) {
      verification.failWith(
          "Subject has {}{} that the other object does not have.",
          memberPath.empty() ? memory::string("member ")
                             : fmt::format("{}.", memberPath),
          subjectMember.name());
    }
    return match;
  }

  memory::string describe() const final { return "match member by name"; }
};

} // namespace deepeq::equivalency
