#pragma once

#include <string>
#include <string_view>

namespace text {

inline std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

inline bool is_blank(std::string_view s) {
    return s.find_first_not_of(" \t\n\r") == std::string_view::npos;
}

} // namespace text
