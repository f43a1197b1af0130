#pragma once

#include "deepeq/memory/container/shared_ptr.hpp"
#include <typeindex>
#include <typeinfo>

namespace deepeq::reflect {

class TypeDescriptor;

/// Nullable, type-erased handle to a value.
///
/// An Object either borrows a value that lives elsewhere (the subject or
/// expectation graph) or owns a temporary, for example the result of a
/// getter. Copies share ownership of owned temporaries.
class Object {
public:
  Object() = default;
  // `origin` is the address of the complete object for polymorphic values,
  // defaults to the address of `ptr`.
  Object(memory::shared_ptr<const void> ptr, const TypeDescriptor *type,
         const void *origin = nullptr);

  bool isNull() const { return m_ptr == nullptr; }
  explicit operator bool() const { return m_ptr != nullptr; }

  const void *address() const { return m_ptr.get(); }

  // runtime type, throws if the object is null.
  const TypeDescriptor &type() const;
  const TypeDescriptor *typeOrNull() const { return m_type; }

  const void *origin() const { return m_origin; }

  // Reference identity: both handles view the same object, possibly through
  // a base type. A first member shares its enclosing object's address but is
  // of an unrelated type, so it is a different object.
  bool isSameAs(const Object &other) const;

  template <typename T> const T &as() const {
    requireType(typeid(T));
    return *static_cast<const T *>(m_ptr.get());
  }

private:
  void requireType(std::type_index id) const;

  memory::shared_ptr<const void> m_ptr;
  const TypeDescriptor *m_type = nullptr;
  const void *m_origin = nullptr;
};

} // namespace deepeq::reflect
