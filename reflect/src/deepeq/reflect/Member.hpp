#pragma once

#include "deepeq/memory/container/string.hpp"
#include "deepeq/reflect/Object.hpp"
#include <functional>

namespace deepeq::reflect {

class TypeDescriptor;

class Member {
public:
  // receives a pointer to an instance of the owning type
  using Reader = std::function<Object(const void *)>;

  Member(memory::string name, const TypeDescriptor *owner, Reader reader);

  const memory::string &name() const { return m_name; }

  // type that declares the member, a base of the instance type when the
  // member is inherited.
  const TypeDescriptor &owner() const { return *m_owner; }

  // Reads the member off `instance`, upcasting to the owner when the
  // instance is of a derived type. Exceptions thrown by getters propagate.
  Object read(const Object &instance) const;

private:
  memory::string m_name;
  const TypeDescriptor *m_owner;
  Reader m_reader;
};

} // namespace deepeq::reflect
