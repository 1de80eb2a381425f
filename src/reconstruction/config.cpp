// File: reconstruction/config.cpp

#include "reconstruction/config.hpp"

#include <utility>

#include "common/utilities/string.hpp"

namespace reconstruction {

    LabelMatcher labelContains(std::string needle) {
        return [needle = std::move(needle)](const std::string_view label) {
            return common::utilities::containsIgnoreCase(label, needle);
        };
    }

    CategoryPolicyTable::CategoryPolicyTable() {
        // {thickness, min height, color, opacity}
        (*this)[Category::Wall] = {0.15, 0.0, 0xffffff, 1.0};
        (*this)[Category::Door] = {0.06, 0.0, 0xa0522d, 1.0};
        (*this)[Category::Window] = {0.08, 0.0, 0x87ceeb, 0.5};
        (*this)[Category::Column] = {0.30, 2.0, 0xffd700, 1.0};
        (*this)[Category::Railing] = {0.05, 0.0, 0x999999, 1.0};
        (*this)[Category::Stair] = {0.25, 2.0, 0x8b4513, 1.0};
        (*this)[Category::Unknown] = {0.10, 0.0, 0xffffff, 1.0};
    }

} // namespace reconstruction
