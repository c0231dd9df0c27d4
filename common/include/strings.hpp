#pragma once

#include <string>
#include <string_view>

namespace mailhub::strings {

std::string lower(std::string s);
std::string upper(std::string s);

// Strips leading and trailing characters found in chars.
std::string trim(std::string_view s, std::string_view chars = " \t");

}  // namespace mailhub::strings
