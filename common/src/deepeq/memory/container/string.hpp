#pragma once

#include <string>

namespace deepeq::memory {

using string = std::string;

}
