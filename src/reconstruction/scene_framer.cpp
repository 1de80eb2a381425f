// File: reconstruction/scene_framer.cpp

#include "reconstruction/scene_framer.hpp"

#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <stdexcept>

#include "common/logging/logger.hpp"

namespace reconstruction {

    SceneBounds frameScene(const std::vector<SceneObject> &objects, const FramingConfig &config) {
        if (objects.empty()) {
            LOG_ERROR("Cannot frame an empty scene.");
            throw EmptySceneError("No scene objects to frame");
        }
        if (!std::isfinite(config.camera_distance_multiplier) || config.camera_distance_multiplier <= 0.0) {
            throw std::invalid_argument(fmt::format("Camera distance multiplier must be positive, got {}",
                                                    config.camera_distance_multiplier));
        }

        Eigen::Vector3d aabb_min = Eigen::Vector3d::Constant(std::numeric_limits<double>::max());
        Eigen::Vector3d aabb_max = Eigen::Vector3d::Constant(std::numeric_limits<double>::lowest());
        for (const auto &object: objects) {
            aabb_min = aabb_min.cwiseMin(object.min());
            aabb_max = aabb_max.cwiseMax(object.max());
        }

        SceneBounds bounds;
        bounds.min = aabb_min;
        bounds.max = aabb_max;
        bounds.size = aabb_max - aabb_min;
        bounds.center = (aabb_max + aabb_min) * 0.5;

        const double distance = bounds.size.maxCoeff() * config.camera_distance_multiplier;
        bounds.camera_distance = distance;
        bounds.camera_position =
                bounds.center + Eigen::Vector3d(distance, distance * config.camera_elevation_ratio, distance);
        bounds.camera_target = bounds.center;

        LOG_INFO("Framed {} objects: {}", objects.size(), bounds);
        return bounds;
    }

} // namespace reconstruction
