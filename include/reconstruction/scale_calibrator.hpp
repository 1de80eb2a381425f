// File: reconstruction/scale_calibrator.hpp

#ifndef SCALE_CALIBRATOR_HPP
#define SCALE_CALIBRATOR_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "reconstruction/config.hpp"
#include "reconstruction/errors.hpp"
#include "types/detection.hpp"

namespace reconstruction {

    // Pixel-to-metric conversion for one detection batch. meters_per_pixel is always > 0.
    struct ScaleContext {
        double meters_per_pixel{};
        std::optional<std::size_t> reference_index; // empty when a manual override was used
        std::string reference_label;
        double reference_pixel_height{};

        [[nodiscard]] bool isOverride() const noexcept { return !reference_index.has_value(); }
        [[nodiscard]] double toMeters(const double pixels) const noexcept { return pixels * meters_per_pixel; }
    };

    /**
     * @brief Derives meters-per-pixel from the first detection whose label satisfies the reference matcher.
     *
     * Detections are scanned in input order and the first match is the reference; later matches are ignored,
     * they are never averaged. scale = reference_real_height_m / |y2 - y1|.
     * A manual meters_per_pixel or pixels_per_meter override in the config short-circuits the search.
     *
     * @throws CalibrationError when no reference matches, the reference has no usable bounding box, its pixel
     *         height is zero, or the override is invalid.
     */
    [[nodiscard]] ScaleContext calibrateScale(const std::vector<Detection> &detections,
                                              const CalibrationConfig &config = {});

} // namespace reconstruction

#endif // SCALE_CALIBRATOR_HPP
