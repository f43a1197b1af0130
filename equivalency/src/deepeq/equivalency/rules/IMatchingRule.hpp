#pragma once

#include "deepeq/memory/container/string.hpp"
#include "deepeq/memory/container/string_view.hpp"
#include "deepeq/reflect/Member.hpp"
#include "deepeq/reflect/Object.hpp"

namespace deepeq::equivalency {

class Verification;

// Pairs a subject member with its counterpart on the expectation. Rules are
// consulted in order and the first non-null result wins.
class IMatchingRule {
public:
  virtual ~IMatchingRule() = default;

  // `memberPath` is the description of the node owning `subjectMember`.
  // Returns nullptr when the rule has no counterpart to offer. Rules that
  // consider a missing counterpart a failure report it through
  // `verification`.
  virtual const reflect::Member *
  match(const reflect::Member &subjectMember,
        const reflect::Object &expectation, memory::string_view memberPath,
        const Verification &verification) const = 0;

  virtual memory::string describe() const = 0;
};

} // namespace deepeq::equivalency
