// File: reconstruction/geometry_synthesizer.hpp

#ifndef GEOMETRY_SYNTHESIZER_HPP
#define GEOMETRY_SYNTHESIZER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "reconstruction/config.hpp"
#include "reconstruction/errors.hpp"
#include "reconstruction/scale_calibrator.hpp"
#include "types/detection.hpp"
#include "types/elevation.hpp"
#include "types/scene_object.hpp"

namespace reconstruction {

    // A detection left out of the scene, with the reason it was rejected.
    struct SkippedDetection {
        std::size_t index{};
        std::string label;
        std::string reason;
    };

    struct SynthesisResult {
        std::vector<SceneObject> objects; // input order, skipped entries removed
        std::vector<SkippedDetection> skipped;
    };

    /*
     * Turns calibrated detections into positioned boxes and cylinders.
     *
     * Columns become cylinders, every other category a box whose long side follows the long axis of the bounding
     * box. Heights are the metric bbox height, raised to the category minimum. With a normalized elevation grid the
     * mean elevation under the footprint becomes the floor baseline; without one everything rests on y = 0.
     * Holds only configuration, so one instance may be shared across threads.
     */
    class GeometrySynthesizer {
    public:
        explicit GeometrySynthesizer(SynthesisConfig config = {});

        [[nodiscard]] SynthesisResult synthesize(const std::vector<Detection> &detections, const ScaleContext &scale,
                                                 const NormalizedGrid *elevation = nullptr,
                                                 std::optional<ImageSize> image_size = std::nullopt) const;

        // Builds the volume for one detection.
        // @throws MalformedDetectionError if the detection has no usable bounding box.
        [[nodiscard]] SceneObject synthesizeOne(const Detection &detection, std::size_t index, const ScaleContext &scale,
                                                const NormalizedGrid *elevation, const ImageSize &image_size) const;

        [[nodiscard]] const SynthesisConfig &config() const noexcept { return config_; }

    private:
        SynthesisConfig config_;

        struct Outcome {
            std::optional<SceneObject> object;
            std::optional<SkippedDetection> skipped;
        };

        [[nodiscard]] Outcome attempt(const Detection &detection, std::size_t index, const ScaleContext &scale,
                                      const NormalizedGrid *elevation, const ImageSize &fallback_size) const;

        [[nodiscard]] double clampDimension(double value) const noexcept;
    };

} // namespace reconstruction

#endif // GEOMETRY_SYNTHESIZER_HPP
