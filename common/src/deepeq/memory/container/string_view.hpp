#pragma once

#include <string_view>

namespace deepeq::memory {

using string_view = std::string_view;

}
