// File: reconstruction/pipeline.cpp

#include "reconstruction/pipeline.hpp"

#include <fmt/format.h>

#include "common/logging/logger.hpp"

namespace reconstruction {

    ReconstructionResult reconstructScene(const std::vector<Detection> &detections,
                                          const std::optional<ElevationGrid> &elevation_grid,
                                          const ReconstructionConfig &config) {
        LOG_INFO("Reconstructing scene from {} detections ({} elevation grid).", detections.size(),
                 elevation_grid ? "with" : "without");

        ReconstructionResult result;
        result.scale = calibrateScale(detections, config.calibration);

        std::optional<NormalizedGrid> normalized;
        if (elevation_grid) {
            normalized = normalizeElevation(*elevation_grid, config.elevation.target_max_height_m,
                                            config.elevation.gamma);
            result.elevation = summarize(*normalized);
        }

        const GeometrySynthesizer synthesizer(config.synthesis);
        SynthesisResult synthesis =
                synthesizer.synthesize(detections, result.scale, normalized ? &*normalized : nullptr);

        result.skipped = std::move(synthesis.skipped);
        if (synthesis.objects.empty()) {
            LOG_ERROR("No scene objects survived synthesis ({} detections, {} skipped).", detections.size(),
                      result.skipped.size());
            throw EmptySceneError(fmt::format("No scene objects survived synthesis ({} of {} detections skipped)",
                                              result.skipped.size(), detections.size()),
                                  result.skipped.size());
        }

        result.bounds = frameScene(synthesis.objects, config.framing);
        result.objects = std::move(synthesis.objects);

        LOG_INFO("Reconstruction complete: {} objects, {} skipped, scale {} m/px.", result.objects.size(),
                 result.skipped.size(), result.scale.meters_per_pixel);
        return result;
    }

} // namespace reconstruction
