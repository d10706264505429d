#pragma once

#include <string>

namespace freightline::util {

// Random RFC4122 version 4 id in lowercase 8-4-4-4-12 form.
std::string NewId();

} // namespace freightline::util
