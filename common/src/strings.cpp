#include "strings.hpp"
#include <algorithm>
#include <cctype>

namespace mailhub::strings {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string trim(std::string_view s, std::string_view chars) {
    auto start = s.find_first_not_of(chars);
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(chars);
    return std::string(s.substr(start, end - start + 1));
}

}  // namespace mailhub::strings
