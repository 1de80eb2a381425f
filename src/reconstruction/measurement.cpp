// File: reconstruction/measurement.cpp

#include "reconstruction/measurement.hpp"

#include <algorithm>

#include "common/logging/logger.hpp"

namespace reconstruction {

    std::vector<DetectionMeasurement> measureDetections(const std::vector<Detection> &detections,
                                                        const ScaleContext &scale) {
        std::vector<DetectionMeasurement> measurements;
        measurements.reserve(detections.size());

        for (std::size_t index = 0; index < detections.size(); ++index) {
            const Detection &detection = detections[index];
            if (!detection.hasUsableBoundingBox()) {
                LOG_DEBUG("Skipping measurement of detection #{} '{}': no usable bounding box.", index,
                          detection.label);
                continue;
            }

            const BoundingBox &bbox = *detection.bbox;
            DetectionMeasurement measurement;
            measurement.index = index;
            measurement.label = detection.label;
            measurement.category = categorize(detection.label);
            measurement.size_px = {bbox.width(), bbox.height()};
            measurement.center_px = {bbox.centerX(), bbox.centerY()};
            measurement.size_m = measurement.size_px * scale.meters_per_pixel;
            measurement.area_m2 = measurement.size_m.x() * measurement.size_m.y();
            measurement.height_ft = measurement.size_m.y() * kFeetPerMeter;

            const double long_side = measurement.size_m.maxCoeff();
            switch (measurement.category) {
                case Category::Wall:
                    measurement.wall_length_m = long_side;
                    measurement.wall_thickness_m = measurement.size_m.minCoeff();
                    break;
                case Category::Door:
                case Category::Window:
                    measurement.opening_span_m = long_side;
                    break;
                default:
                    break;
            }

            measurements.push_back(std::move(measurement));
        }

        LOG_DEBUG("Measured {} of {} detections.", measurements.size(), detections.size());
        return measurements;
    }

} // namespace reconstruction
