// File: types/category.hpp

#ifndef CATEGORY_HPP
#define CATEGORY_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

/*
 * Architectural element categories recognised by the reconstruction.
 * Detector labels are free text ("Wall", "Stair Case", ...); categorize() folds them into this closed set.
 * Anything that does not match a known category falls back to Category::Unknown, which owns its own
 * policy entry, so no lookup ever misses.
 */
enum class Category : std::size_t {
    Wall = 0,
    Door,
    Window,
    Column,
    Railing,
    Stair,
    Unknown
};

inline constexpr std::size_t kCategoryCount = 7;

inline constexpr std::array<Category, kCategoryCount> kAllCategories = {
        Category::Wall,    Category::Door,  Category::Window, Category::Column,
        Category::Railing, Category::Stair, Category::Unknown};

// Volumetric primitive used to represent a detection in 3D.
enum class Primitive { Box, Cylinder };

// Maps a detector label onto a category. Case-insensitive.
[[nodiscard]] Category categorize(std::string_view label);

// Lower-case key used in configuration files and JSON output ("wall", "stair", ...).
[[nodiscard]] std::string_view toString(Category category) noexcept;

[[nodiscard]] std::string_view toString(Primitive primitive) noexcept;

// Inverse of toString(Category). Returns std::nullopt for keys that name no category.
[[nodiscard]] std::optional<Category> categoryFromKey(std::string_view key);

[[nodiscard]] constexpr std::size_t toIndex(Category category) noexcept { return static_cast<std::size_t>(category); }

#endif // CATEGORY_HPP
