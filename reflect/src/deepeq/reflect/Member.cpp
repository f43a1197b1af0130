#include "deepeq/reflect/Member.hpp"

#include "deepeq/diag/invalid_argument.hpp"
#include "deepeq/reflect/TypeDescriptor.hpp"
#include <fmt/format.h>

namespace deepeq::reflect {

Member::Member(memory::string name, const TypeDescriptor *owner,
               Reader reader)
    : m_name(std::move(name)), m_owner(owner), m_reader(std::move(reader)) {}

Object Member::read(const Object &instance) const {
  if (instance.isNull()) {
    diag::invalid_argument(fmt::format(
        "cannot read member '{}' of a null {}", m_name, m_owner->name()));
  }
  const void *self = instance.type().upcast(instance.address(), *m_owner);
  if (self == nullptr) {
    diag::invalid_argument(
        fmt::format("cannot read member '{}' of '{}' from an instance of '{}'",
                    m_name, m_owner->name(), instance.type().name()));
  }
  return m_reader(self);
}

} // namespace deepeq::reflect
