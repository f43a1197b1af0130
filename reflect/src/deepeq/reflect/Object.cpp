#include "deepeq/reflect/Object.hpp"

#include "deepeq/diag/invalid_argument.hpp"
#include "deepeq/diag/invalid_state.hpp"
#include "deepeq/reflect/TypeDescriptor.hpp"
#include <fmt/format.h>

namespace deepeq::reflect {

Object::Object(memory::shared_ptr<const void> ptr, const TypeDescriptor *type,
               const void *origin)
    : m_ptr(std::move(ptr)), m_type(m_ptr == nullptr ? nullptr : type),
      m_origin(m_ptr == nullptr ? nullptr
               : origin != nullptr ? origin
                                   : m_ptr.get()) {}

const TypeDescriptor &Object::type() const {
  if (m_type == nullptr) {
    diag::invalid_state("the type of a null object is unknown");
  }
  return *m_type;
}

bool Object::isSameAs(const Object &other) const {
  if (isNull() || other.isNull()) {
    return false;
  }
  if (m_origin == other.m_origin &&
      (m_type->isAssignableTo(*other.m_type) ||
       other.m_type->isAssignableTo(*m_type))) {
    return true;
  }
  // base subobjects that do not start at the derived object's address
  if (const void *base = m_type->upcast(address(), *other.m_type);
      base != nullptr) {
    return base == other.address();
  }
  if (const void *base = other.m_type->upcast(other.address(), *m_type);
      base != nullptr) {
    return base == address();
  }
  return false;
}

void Object::requireType(std::type_index id) const {
  if (isNull()) {
    diag::invalid_argument("cannot access the value of a null object");
  }
  if (m_type->id() != id) {
    diag::invalid_argument(fmt::format("object of type '{}' accessed as '{}'",
                                       m_type->name(), id.name()));
  }
}

} // namespace deepeq::reflect
