#pragma once

#include "deepeq/equivalency/TypeInfo.hpp"
#include "deepeq/memory/container/string.hpp"
#include "deepeq/memory/container/vector.hpp"
#include "deepeq/reflect/Member.hpp"

namespace deepeq::equivalency {

using MemberSet = memory::vector<const reflect::Member *>;

// Selection rules run as a pipeline: each receives the previous rule's
// output and returns the next candidate set. The first rule starts from an
// empty set.
class ISelectionRule {
public:
  virtual ~ISelectionRule() = default;

  virtual MemberSet selectMembers(MemberSet members,
                                  const TypeInfo &info) const = 0;

  virtual memory::string describe() const = 0;
};

} // namespace deepeq::equivalency
