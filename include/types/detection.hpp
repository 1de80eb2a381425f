// File: types/detection.hpp

#ifndef DETECTION_HPP
#define DETECTION_HPP

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <optional>
#include <string>

struct ImageSize {
    int width{640}, height{480};

    [[nodiscard]] constexpr bool isValid() const noexcept { return width > 0 && height > 0; }

    constexpr bool operator==(const ImageSize &) const noexcept = default;
};

// Axis-aligned pixel rectangle in detector output order (x1, y1, x2, y2).
struct BoundingBox {
    double x1{}, y1{}, x2{}, y2{};

    [[nodiscard]] double width() const noexcept { return std::abs(x2 - x1); }
    [[nodiscard]] double height() const noexcept { return std::abs(y2 - y1); }
    [[nodiscard]] double centerX() const noexcept { return (x1 + x2) * 0.5; }
    [[nodiscard]] double centerY() const noexcept { return (y1 + y2) * 0.5; }
    [[nodiscard]] double minX() const noexcept { return std::min(x1, x2); }
    [[nodiscard]] double maxX() const noexcept { return std::max(x1, x2); }
    [[nodiscard]] double minY() const noexcept { return std::min(y1, y2); }
    [[nodiscard]] double maxY() const noexcept { return std::max(y1, y2); }

    // Finite, non-negative pixel coordinates whose centers are finite too.
    [[nodiscard]] bool isUsable() const noexcept {
        for (const double value: {x1, y1, x2, y2}) {
            if (!std::isfinite(value) || value < 0.0) {
                return false;
            }
        }
        return std::isfinite(x1 + x2) && std::isfinite(y1 + y2);
    }

    constexpr bool operator==(const BoundingBox &) const noexcept = default;
};

// A single labelled region produced by the external detector. Never modified by the pipeline.
struct Detection {
    std::string label;
    std::optional<BoundingBox> bbox;
    std::optional<ImageSize> image_size;
    std::optional<double> confidence;

    [[nodiscard]] bool hasUsableBoundingBox() const noexcept { return bbox.has_value() && bbox->isUsable(); }
};

#endif // DETECTION_HPP
