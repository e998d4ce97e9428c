#pragma once

#include <string>

namespace datachat {

// Strip leading and trailing spaces, tabs, CR and LF
std::string trim(const std::string& s);

} // namespace datachat
