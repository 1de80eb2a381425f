// File: types/scene_object.hpp

#ifndef SCENE_OBJECT_HPP
#define SCENE_OBJECT_HPP

#include <Eigen/Core>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "types/category.hpp"

enum class ElevationSource { DepthHint, Default };

[[nodiscard]] constexpr std::string_view toString(const ElevationSource source) noexcept {
    return source == ElevationSource::DepthHint ? "depth_hint" : "default";
}

/*
 * A positioned volumetric primitive in metric world space.
 * World frame: y is up, the image center sits at the origin of the x/z plane, image x maps to world x and
 * image y maps to world z. `position` is the volume center; `size` is (width, height, depth) along (x, y, z).
 * For cylinders width == depth == 2 * radius.
 */
struct SceneObject {
    std::string label;
    Category category{Category::Unknown};
    Primitive primitive{Primitive::Box};
    Eigen::Vector3d position{Eigen::Vector3d::Zero()};
    Eigen::Vector3d size{Eigen::Vector3d::Zero()};
    ElevationSource elevation_source{ElevationSource::Default};
    std::size_t source_index{}; // index of the originating detection
    std::uint32_t color{0xffffff};
    double opacity{1.0};

    [[nodiscard]] double radius() const noexcept { return primitive == Primitive::Cylinder ? size.x() * 0.5 : 0.0; }

    [[nodiscard]] double lowerExtent() const noexcept { return position.y() - size.y() * 0.5; }

    [[nodiscard]] Eigen::Vector3d min() const { return position - size * 0.5; }

    [[nodiscard]] Eigen::Vector3d max() const { return position + size * 0.5; }
};

#endif // SCENE_OBJECT_HPP
