// File: common/formatting/fmt_scene.hpp

#ifndef FMT_SCENE_HPP
#define FMT_SCENE_HPP

#include <fmt/core.h>
#include <fmt/format.h>
#include <string_view>

#include "common/formatting/fmt_eigen.hpp"
#include "types/category.hpp"
#include "types/scene_bounds.hpp"
#include "types/scene_object.hpp"

template<>
struct fmt::formatter<Category> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const Category category, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(toString(category), ctx);
    }
};

template<>
struct fmt::formatter<Primitive> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const Primitive primitive, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(toString(primitive), ctx);
    }
};

template<>
struct fmt::formatter<ElevationSource> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const ElevationSource source, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(toString(source), ctx);
    }
};

template<>
struct fmt::formatter<SceneObject> {
    constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const SceneObject &object, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "#{} '{}' [{} {}] position: {:3}, size: {:3}, elevation: {}",
                              object.source_index, object.label, object.category, object.primitive, object.position,
                              object.size, object.elevation_source);
    }
};

template<>
struct fmt::formatter<SceneBounds> {
    constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const SceneBounds &bounds, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "center: {:3}, size: {:3}, camera: {:3} -> {:3}", bounds.center, bounds.size,
                              bounds.camera_position, bounds.camera_target);
    }
};

#endif // FMT_SCENE_HPP
