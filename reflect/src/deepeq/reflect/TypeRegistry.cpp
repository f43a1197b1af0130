#include "deepeq/reflect/TypeRegistry.hpp"

#include <cstdlib>
#include <cxxabi.h>

namespace deepeq::reflect {

TypeRegistry &TypeRegistry::global() {
  static TypeRegistry registry;
  return registry;
}

const TypeDescriptor *TypeRegistry::find(std::type_index id) const {
  auto it = m_types.find(id);
  if (it == m_types.end()) {
    return nullptr;
  }
  return it->second.get();
}

TypeDescriptor &TypeRegistry::insert(std::type_index id, memory::string name,
                                     TypeKind kind) {
  auto [it, inserted] = m_types.emplace(
      id, std::make_unique<TypeDescriptor>(id, std::move(name), kind));
  if (!inserted) {
    diag::invalid_argument(
        fmt::format("type {} is already described", it->second->name()));
  }
  DEEPEQ_TRACE("registered {} as {}", it->second->name(), kind);
  return *it->second;
}

void TypeRegistry::erase(std::type_index id) {
  if (m_types.erase(id) != 0) {
    DEEPEQ_DEBUG("discarded the description of {}", demangle(id.name()));
  }
}

memory::string TypeRegistry::demangle(const char *name) {
  int status = 0;
  std::unique_ptr<char, void (*)(void *)> demangled(
      abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
  if (status != 0 || demangled == nullptr) {
    return name;
  }
  return demangled.get();
}

} // namespace deepeq::reflect
