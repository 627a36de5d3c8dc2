#pragma once

#include <string>

namespace testlog {

// Strips leading and trailing whitespace in place.
void trim_inplace(std::string& s);

} // namespace testlog
