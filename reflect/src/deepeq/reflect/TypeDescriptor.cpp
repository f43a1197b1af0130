#include "deepeq/reflect/TypeDescriptor.hpp"

#include "deepeq/diag/invalid_argument.hpp"
#include "deepeq/diag/invalid_state.hpp"
#include <fmt/format.h>

namespace deepeq::reflect {

TypeDescriptor::TypeDescriptor(std::type_index id, memory::string name,
                               TypeKind kind)
    : m_id(id), m_name(std::move(name)), m_kind(kind) {}

const Member *TypeDescriptor::findMember(memory::string_view name) const {
  for (const Member &member : m_members) {
    if (member.name() == name) {
      return &member;
    }
  }
  return nullptr;
}

bool TypeDescriptor::isAssignableTo(const TypeDescriptor &other) const {
  if (this == &other) {
    return true;
  }
  for (const Base &base : m_bases) {
    if (base.type->isAssignableTo(other)) {
      return true;
    }
  }
  return false;
}

const void *TypeDescriptor::upcast(const void *address,
                                   const TypeDescriptor &target) const {
  if (this == &target) {
    return address;
  }
  for (const Base &base : m_bases) {
    if (const void *sub = base.type->upcast(base.upcast(address), target);
        sub != nullptr) {
      return sub;
    }
  }
  return nullptr;
}

bool TypeDescriptor::equals(const void *lhs, const void *rhs) const {
  if (!m_equals) {
    diag::invalid_state(
        fmt::format("type '{}' ({}) has no equality", m_name, m_kind));
  }
  return m_equals(lhs, rhs);
}

memory::string TypeDescriptor::format(const void *value) const {
  if (!m_format) {
    return m_name;
  }
  return m_format(value);
}

std::size_t TypeDescriptor::size(const void *sequence) const {
  if (m_kind != TypeKind::Sequence) {
    diag::invalid_state(fmt::format("type '{}' is not a sequence", m_name));
  }
  return m_size(sequence);
}

Object TypeDescriptor::at(const void *sequence, std::size_t index) const {
  const std::size_t count = size(sequence);
  if (index >= count) {
    diag::invalid_argument(fmt::format(
        "index {} is out of range for a '{}' of {} item(s)", index, m_name,
        count));
  }
  return m_at(sequence, index);
}

memory::vector<Object> TypeDescriptor::items(const void *sequence) const {
  if (m_kind != TypeKind::Sequence) {
    diag::invalid_state(fmt::format("type '{}' is not a sequence", m_name));
  }
  return m_items(sequence);
}

} // namespace deepeq::reflect
