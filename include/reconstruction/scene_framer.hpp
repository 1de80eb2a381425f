// File: reconstruction/scene_framer.hpp

#ifndef SCENE_FRAMER_HPP
#define SCENE_FRAMER_HPP

#include <vector>

#include "reconstruction/config.hpp"
#include "reconstruction/errors.hpp"
#include "types/scene_bounds.hpp"
#include "types/scene_object.hpp"

namespace reconstruction {

    /**
     * @brief Computes the AABB enclosing every object's full volume and a camera that frames it.
     *
     * distance = max extent * camera_distance_multiplier;
     * camera = center + (distance, distance * camera_elevation_ratio, distance), looking at the center.
     *
     * @throws EmptySceneError if there are no objects.
     */
    [[nodiscard]] SceneBounds frameScene(const std::vector<SceneObject> &objects, const FramingConfig &config = {});

} // namespace reconstruction

#endif // SCENE_FRAMER_HPP
