// File: reconstruction/measurement.hpp

#ifndef MEASUREMENT_HPP
#define MEASUREMENT_HPP

#include <Eigen/Core>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "reconstruction/scale_calibrator.hpp"
#include "types/category.hpp"
#include "types/detection.hpp"

namespace reconstruction {

    inline constexpr double kFeetPerMeter = 3.281;

    // Real-world dimensions of one detection under a given scale.
    struct DetectionMeasurement {
        std::size_t index{};
        std::string label;
        Category category{Category::Unknown};
        Eigen::Vector2d size_px{Eigen::Vector2d::Zero()};   // (width, height)
        Eigen::Vector2d center_px{Eigen::Vector2d::Zero()};
        Eigen::Vector2d size_m{Eigen::Vector2d::Zero()};
        double area_m2{};
        double height_ft{};
        std::optional<double> wall_length_m;
        std::optional<double> wall_thickness_m;
        std::optional<double> opening_span_m; // doors and windows
    };

    // Measures every detection with a usable bounding box, in input order. Others are logged and left out.
    [[nodiscard]] std::vector<DetectionMeasurement> measureDetections(const std::vector<Detection> &detections,
                                                                      const ScaleContext &scale);

} // namespace reconstruction

#endif // MEASUREMENT_HPP
