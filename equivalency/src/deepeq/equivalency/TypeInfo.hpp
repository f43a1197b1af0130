#pragma once

#include "deepeq/memory/container/string_view.hpp"
#include "deepeq/reflect/TypeDescriptor.hpp"

namespace deepeq::equivalency {

// What a selection rule knows about the node whose members it selects.
struct TypeInfo {
  // statically known type, null only for absent subjects.
  const reflect::TypeDescriptor *declaredType;
  const reflect::TypeDescriptor *runtimeType;
  // machine path of the node, e.g. "Address.Lines[2]", empty at the root.
  memory::string_view memberPath;
};

} // namespace deepeq::equivalency
