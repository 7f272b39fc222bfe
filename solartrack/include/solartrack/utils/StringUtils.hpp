/**
 * @file StringUtils.hpp
 * @brief Small string helpers shared by parsers and lookups
 * @author SolarTrack Team
 */

#ifndef SOLARTRACK_UTILS_STRING_UTILS_HPP
#define SOLARTRACK_UTILS_STRING_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace solartrack::utils {

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace solartrack::utils

#endif // SOLARTRACK_UTILS_STRING_UTILS_HPP
