// File: reconstruction/config.hpp

#ifndef RECONSTRUCTION_CONFIG_HPP
#define RECONSTRUCTION_CONFIG_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "types/category.hpp"
#include "types/detection.hpp"

/*
 * Explicit parameters for every reconstruction stage. The pipeline never consults global configuration;
 * callers build one of these (directly or via config::loadReconstructionConfig) and pass it in.
 */
namespace reconstruction {

    using LabelMatcher = std::function<bool(std::string_view)>;

    // Case-insensitive substring match.
    [[nodiscard]] LabelMatcher labelContains(std::string needle);

    struct CalibrationConfig {
        LabelMatcher reference_matcher = labelContains("wall");
        double reference_real_height_m = 3.0;

        // Manual overrides. At most one may be set; when present, no reference detection is searched.
        std::optional<double> meters_per_pixel;
        std::optional<double> pixels_per_meter;
    };

    struct ElevationConfig {
        double target_max_height_m = 3.0;
        double gamma = 1.0; // 1.0 keeps the normalization linear
    };

    struct CategoryPolicy {
        double thickness_m{0.10};
        double min_height_m{0.0};
        std::uint32_t color{0xffffff};
        double opacity{1.0};
    };

    // Exhaustive per-category policy. Every Category, Unknown included, has an entry.
    class CategoryPolicyTable {
    public:
        CategoryPolicyTable();

        [[nodiscard]] const CategoryPolicy &operator[](Category category) const noexcept {
            return policies_[toIndex(category)];
        }

        [[nodiscard]] CategoryPolicy &operator[](Category category) noexcept { return policies_[toIndex(category)]; }

    private:
        std::array<CategoryPolicy, kCategoryCount> policies_;
    };

    struct SynthesisConfig {
        CategoryPolicyTable categories;
        ImageSize default_image_size{640, 480};
        double min_dimension_m = 0.01;
        double min_column_radius_m = 0.15;
        double column_radius_factor = 0.25;
        double thickness_factor = 0.2; // share of the short axis kept as thickness
        std::size_t parallel_threshold = 256;
    };

    struct FramingConfig {
        double camera_distance_multiplier = 1.8;
        double camera_elevation_ratio = 0.6;
    };

    struct ReconstructionConfig {
        CalibrationConfig calibration;
        ElevationConfig elevation;
        SynthesisConfig synthesis;
        FramingConfig framing;
    };

} // namespace reconstruction

#endif // RECONSTRUCTION_CONFIG_HPP
