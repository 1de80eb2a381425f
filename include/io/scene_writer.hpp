// File: io/scene_writer.hpp

#ifndef SCENE_WRITER_HPP
#define SCENE_WRITER_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "reconstruction/measurement.hpp"
#include "reconstruction/pipeline.hpp"

namespace io {

    using json = nlohmann::json;

    /**
     * @brief Serializes a reconstruction into a JSON document.
     *
     * Layout:
     *   scale:        meters_per_pixel, override, reference {index, label, pixel_height}
     *   objects:      label, category, primitive, position, size, radius (cylinders), elevation_source,
     *                 source_index, color ("#rrggbb"), opacity
     *   bounds:       min, max, center, size, camera {position, target, distance}
     *   skipped:      index, label, reason
     *   elevation:    rows, cols, mean, flat (only when a grid was supplied)
     *   measurements: per detection, only when non-empty
     * Vectors are written as [x, y, z].
     */
    [[nodiscard]] json toJson(const reconstruction::ReconstructionResult &result,
                              const std::vector<reconstruction::DetectionMeasurement> &measurements = {});

    // Writes toJson(result, measurements) with a 4-space indent. Throws std::runtime_error on I/O failure.
    void writeScene(const std::string &path, const reconstruction::ReconstructionResult &result,
                    const std::vector<reconstruction::DetectionMeasurement> &measurements = {});

} // namespace io

#endif // SCENE_WRITER_HPP
