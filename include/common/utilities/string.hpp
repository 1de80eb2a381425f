// File: common/utilities/string.hpp

#ifndef COMMON_UTILITIES_STRING_HPP
#define COMMON_UTILITIES_STRING_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace common::utilities {

    inline std::string toLower(std::string_view text) {
        std::string lowered(text);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered;
    }

    inline bool containsIgnoreCase(std::string_view haystack, std::string_view needle) {
        return toLower(haystack).find(toLower(needle)) != std::string::npos;
    }

} // namespace common::utilities

#endif // COMMON_UTILITIES_STRING_HPP
