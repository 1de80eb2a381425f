// File: types/category.cpp

#include "types/category.hpp"

#include <string>

#include "common/utilities/string.hpp"

using common::utilities::toLower;

Category categorize(std::string_view label) {
    const std::string lowered = toLower(label);

    // First hit wins, so "Wall Railing" is a wall.
    if (lowered.find("wall") != std::string::npos) {
        return Category::Wall;
    }
    if (lowered.find("door") != std::string::npos) {
        return Category::Door;
    }
    if (lowered.find("window") != std::string::npos) {
        return Category::Window;
    }
    if (lowered.find("column") != std::string::npos) {
        return Category::Column;
    }
    if (lowered.find("railing") != std::string::npos) {
        return Category::Railing;
    }
    if (lowered.find("stair") != std::string::npos) {
        return Category::Stair;
    }
    return Category::Unknown;
}

std::string_view toString(const Category category) noexcept {
    switch (category) {
        case Category::Wall:
            return "wall";
        case Category::Door:
            return "door";
        case Category::Window:
            return "window";
        case Category::Column:
            return "column";
        case Category::Railing:
            return "railing";
        case Category::Stair:
            return "stair";
        case Category::Unknown:
            break;
    }
    return "unknown";
}

std::string_view toString(const Primitive primitive) noexcept {
    return primitive == Primitive::Cylinder ? "cylinder" : "box";
}

std::optional<Category> categoryFromKey(std::string_view key) {
    const std::string lowered = toLower(key);
    for (const auto category: kAllCategories) {
        if (toString(category) == lowered) {
            return category;
        }
    }
    return std::nullopt;
}
