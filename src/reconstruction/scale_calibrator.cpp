// File: reconstruction/scale_calibrator.cpp

#include "reconstruction/scale_calibrator.hpp"

#include <cmath>
#include <fmt/format.h>

#include "common/logging/logger.hpp"

namespace reconstruction {

    namespace {
        ScaleContext fromOverride(const CalibrationConfig &config) {
            if (config.meters_per_pixel && config.pixels_per_meter) {
                LOG_ERROR("Both meters_per_pixel ({}) and pixels_per_meter ({}) were supplied.",
                          *config.meters_per_pixel, *config.pixels_per_meter);
                throw CalibrationError(CalibrationError::Reason::InvalidOverride,
                                       "Provide exactly one scale override: meters_per_pixel OR pixels_per_meter");
            }

            const bool per_meter = config.pixels_per_meter.has_value();
            const double value = per_meter ? *config.pixels_per_meter : *config.meters_per_pixel;
            if (!std::isfinite(value) || value <= 0.0) {
                LOG_ERROR("Scale override must be a positive finite number, got {}", value);
                throw CalibrationError(CalibrationError::Reason::InvalidOverride,
                                       fmt::format("Scale override must be positive, got {}", value));
            }

            ScaleContext scale;
            scale.meters_per_pixel = per_meter ? 1.0 / value : value;
            LOG_INFO("Using manual scale override: {} m/px", scale.meters_per_pixel);
            return scale;
        }
    } // namespace

    ScaleContext calibrateScale(const std::vector<Detection> &detections, const CalibrationConfig &config) {
        if (config.meters_per_pixel || config.pixels_per_meter) {
            return fromOverride(config);
        }

        if (!config.reference_matcher) {
            throw std::invalid_argument("Calibration requires a reference label matcher.");
        }
        if (!std::isfinite(config.reference_real_height_m) || config.reference_real_height_m <= 0.0) {
            throw std::invalid_argument(
                    fmt::format("Reference height must be positive, got {}", config.reference_real_height_m));
        }

        for (std::size_t index = 0; index < detections.size(); ++index) {
            const Detection &detection = detections[index];
            if (!config.reference_matcher(detection.label)) {
                continue;
            }

            if (!detection.hasUsableBoundingBox()) {
                LOG_ERROR("Reference detection #{} '{}' has no usable bounding box.", index, detection.label);
                throw CalibrationError(CalibrationError::Reason::MissingBoundingBox,
                                       fmt::format("Reference detection #{} '{}' has no usable bounding box", index,
                                                   detection.label),
                                       index, detection.label);
            }

            const double pixel_height = detection.bbox->height();
            if (pixel_height == 0.0) {
                LOG_ERROR("Reference detection #{} '{}' has zero pixel height.", index, detection.label);
                throw CalibrationError(CalibrationError::Reason::ZeroPixelHeight,
                                       fmt::format("Reference detection #{} '{}' has zero pixel height", index,
                                                   detection.label),
                                       index, detection.label);
            }

            ScaleContext scale;
            scale.meters_per_pixel = config.reference_real_height_m / pixel_height;
            scale.reference_index = index;
            scale.reference_label = detection.label;
            scale.reference_pixel_height = pixel_height;

            LOG_INFO("Calibrated scale from reference #{} '{}': {} px = {} m -> {} m/px", index, detection.label,
                     pixel_height, config.reference_real_height_m, scale.meters_per_pixel);
            return scale;
        }

        LOG_ERROR("No reference detection found among {} detections.", detections.size());
        throw CalibrationError(CalibrationError::Reason::NoReference,
                               fmt::format("No reference detection found among {} detections", detections.size()));
    }

} // namespace reconstruction
