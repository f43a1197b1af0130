#pragma once

#include "deepeq/memory/container/string.hpp"
#include "deepeq/memory/container/string_view.hpp"

namespace deepeq::equivalency {

// Dot-joins member names; subscripts such as "[2]" attach without a
// separator, e.g. combine_path("Address.Lines", "[2]") == "Address.Lines[2]".
inline memory::string combine_path(memory::string_view path,
                                   memory::string_view member) {
  memory::string combined(path);
  if (!combined.empty() && !member.starts_with('[')) {
    combined += '.';
  }
  combined += member;
  return combined;
}

} // namespace deepeq::equivalency
