// File: reconstruction/pipeline.hpp

#ifndef RECONSTRUCTION_PIPELINE_HPP
#define RECONSTRUCTION_PIPELINE_HPP

#include <optional>
#include <vector>

#include "reconstruction/config.hpp"
#include "reconstruction/depth_normalizer.hpp"
#include "reconstruction/errors.hpp"
#include "reconstruction/geometry_synthesizer.hpp"
#include "reconstruction/scale_calibrator.hpp"
#include "reconstruction/scene_framer.hpp"
#include "types/detection.hpp"
#include "types/elevation.hpp"
#include "types/scene_bounds.hpp"
#include "types/scene_object.hpp"

namespace reconstruction {

    struct ReconstructionResult {
        ScaleContext scale;
        std::vector<SceneObject> objects;
        SceneBounds bounds;
        std::vector<SkippedDetection> skipped;
        std::optional<ElevationSummary> elevation; // set when an elevation grid was supplied

        [[nodiscard]] std::size_t skippedCount() const noexcept { return skipped.size(); }
    };

    /**
     * @brief Calibrate, normalize, synthesize and frame in one pass.
     *
     * Never returns a partial scene: either every stage succeeds or the call throws.
     *
     * @throws CalibrationError if no scale can be established.
     * @throws EmptySceneError if no detection survives synthesis.
     * @throws std::invalid_argument for an unusable elevation grid or configuration.
     */
    [[nodiscard]] ReconstructionResult reconstructScene(const std::vector<Detection> &detections,
                                                        const std::optional<ElevationGrid> &elevation_grid = std::nullopt,
                                                        const ReconstructionConfig &config = {});

} // namespace reconstruction

#endif // RECONSTRUCTION_PIPELINE_HPP
