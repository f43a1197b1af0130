#pragma once

#include "deepeq/equivalency/MemberPath.hpp"
#include "deepeq/equivalency/rules/ISelectionRule.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace deepeq::equivalency {

// Adds the runtime member at `path`. Members on the way to it are added as
// well, so including "Address.Street" also selects "Address" at the root.
class IncludeMemberByPathSelectionRule final : public ISelectionRule {
public:
  explicit IncludeMemberByPathSelectionRule(memory::string path)
      : m_path(std::move(path)) {}

  MemberSet selectMembers(MemberSet members,
                          const TypeInfo &info) const final {
    if (info.runtimeType == nullptr) {
      return members;
    }
    for (const reflect::Member &member : info.runtimeType->members()) {
      const memory::string path = combine_path(info.memberPath, member.name());
      if (!leadsTo(path)) {
        continue;
      }
      const bool present =
          std::ranges::any_of(members, [&](const reflect::Member *m) {
            return m->name() == member.name();
          });
      if (!present) {
        members.push_back(&member);
      }
    }
    return members;
  }

  memory::string describe() const final {
    return fmt::format("include member {}", m_path);
  }

private:
  bool leadsTo(memory::string_view path) const {
    if (!memory::string_view(m_path).starts_with(path)) {
      return false;
    }
    if (m_path.size() == path.size()) {
      return true;
    }
    const char next = m_path[path.size()];
    return next == '.' || next == '[';
  }

  memory::string m_path;
};

} // namespace deepeq::equivalency
