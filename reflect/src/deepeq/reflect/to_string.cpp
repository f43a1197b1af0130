#include "deepeq/reflect/to_string.hpp"

#include "deepeq/diag/unreachable.hpp"
#include "deepeq/reflect/TypeDescriptor.hpp"
#include <fmt/format.h>

namespace deepeq::reflect {

static memory::string render(const Object &object, unsigned int depth) {
  if (object.isNull()) {
    return "<null>";
  }
  const TypeDescriptor &type = object.type();
  switch (type.kind()) {
  case TypeKind::Value:
    return type.format(object.address());
  case TypeKind::Sequence: {
    memory::string out = "{";
    bool first = true;
    for (const Object &item : type.items(object.address())) {
      if (!first) {
        out += ", ";
      }
      out += render(item, depth + 1);
      first = false;
    }
    out += "}";
    return out;
  }
  case TypeKind::Object: {
    if (depth > 0 || type.members().empty()) {
      return type.name();
    }
    memory::string out = fmt::format("{} {{", type.name());
    bool first = true;
    for (const Member &member : type.members()) {
      out += fmt::format("{} {} = {}", first ? "" : ",", member.name(),
                         render(member.read(object), depth + 1));
      first = false;
    }
    out += " }";
    return out;
  }
  }
  diag::unreachable();
}

memory::string to_string(const Object &object) { return render(object, 0); }

} // namespace deepeq::reflect
