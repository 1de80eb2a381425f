// File: config/reconstruction_settings.cpp

#include "config/reconstruction_settings.hpp"

#include <cmath>
#include <fmt/format.h>
#include <stdexcept>
#include <string>

namespace config {

    namespace {
        double requirePositive(const std::string &key, const double value) {
            if (!std::isfinite(value) || value <= 0.0) {
                LOG_ERROR("Configuration key '{}' must be positive, got {}", key, value);
                throw std::invalid_argument(fmt::format("Configuration key '{}' must be positive, got {}", key, value));
            }
            return value;
        }

        double requireNonNegative(const std::string &key, const double value) {
            if (!std::isfinite(value) || value < 0.0) {
                LOG_ERROR("Configuration key '{}' must be non-negative, got {}", key, value);
                throw std::invalid_argument(
                        fmt::format("Configuration key '{}' must be non-negative, got {}", key, value));
            }
            return value;
        }

        double readPositive(const Configuration &configuration, const std::string &key, const double fallback) {
            return requirePositive(key, configuration.get(key, fallback));
        }

        double readNonNegative(const Configuration &configuration, const std::string &key, const double fallback) {
            return requireNonNegative(key, configuration.get(key, fallback));
        }

        // Accepts 11184810, "0xa0522d" or "#a0522d".
        std::uint32_t readColor(const Configuration &configuration, const std::string &key,
                                const std::uint32_t default_value) {
            const auto text = configuration.get<std::string>(key);
            if (!text || text->empty()) {
                return default_value;
            }
            try {
                if (text->front() == '#') {
                    return static_cast<std::uint32_t>(std::stoul(text->substr(1), nullptr, 16));
                }
                return static_cast<std::uint32_t>(std::stoul(*text, nullptr, 0));
            } catch (const std::logic_error &e) {
                LOG_WARN("Ignoring unreadable color '{}' for key '{}': {}", *text, key, e.what());
                return default_value;
            }
        }

        void loadCategories(const Configuration &configuration, reconstruction::CategoryPolicyTable &table) {
            for (const auto category: kAllCategories) {
                const std::string prefix = fmt::format("synthesis.categories.{}.", toString(category));
                auto &policy = table[category];

                policy.thickness_m = readPositive(configuration, prefix + "thickness", policy.thickness_m);
                policy.min_height_m = readNonNegative(configuration, prefix + "min_height", policy.min_height_m);
                policy.color = readColor(configuration, prefix + "color", policy.color);
                policy.opacity = configuration.get(prefix + "opacity", policy.opacity);
                if (!(policy.opacity >= 0.0 && policy.opacity <= 1.0)) {
                    const auto message = fmt::format("Configuration key '{}opacity' must lie in [0, 1], got {}",
                                                     prefix, policy.opacity);
                    LOG_ERROR("{}", message);
                    throw std::invalid_argument(message);
                }
            }
        }
    } // namespace

    reconstruction::ReconstructionConfig loadReconstructionConfig(const Configuration &configuration) {
        reconstruction::ReconstructionConfig settings;

        // Calibration
        auto &calibration = settings.calibration;
        const std::string reference_label = configuration.get("calibration.reference_label", "wall");
        if (reference_label.empty()) {
            throw std::invalid_argument("Configuration key 'calibration.reference_label' must not be empty");
        }
        calibration.reference_matcher = reconstruction::labelContains(reference_label);
        calibration.reference_real_height_m =
                readPositive(configuration, "calibration.reference_height", calibration.reference_real_height_m);
        calibration.meters_per_pixel = configuration.get<double>("calibration.meters_per_pixel");
        calibration.pixels_per_meter = configuration.get<double>("calibration.pixels_per_meter");

        // Elevation
        auto &elevation = settings.elevation;
        elevation.target_max_height_m =
                readPositive(configuration, "elevation.target_max_height", elevation.target_max_height_m);
        elevation.gamma = readPositive(configuration, "elevation.gamma", elevation.gamma);

        // Synthesis
        auto &synthesis = settings.synthesis;
        auto &image_size = synthesis.default_image_size;
        image_size.width = configuration.get("synthesis.image_width", image_size.width);
        image_size.height = configuration.get("synthesis.image_height", image_size.height);
        if (!image_size.isValid()) {
            throw std::invalid_argument(fmt::format("Configured image size must be positive, got {}x{}",
                                                    image_size.width, image_size.height));
        }
        synthesis.min_dimension_m = readPositive(configuration, "synthesis.min_dimension", synthesis.min_dimension_m);
        synthesis.min_column_radius_m =
                readPositive(configuration, "synthesis.min_column_radius", synthesis.min_column_radius_m);
        synthesis.column_radius_factor =
                readPositive(configuration, "synthesis.column_radius_factor", synthesis.column_radius_factor);
        synthesis.thickness_factor =
                readNonNegative(configuration, "synthesis.thickness_factor", synthesis.thickness_factor);
        synthesis.parallel_threshold = configuration.get("synthesis.parallel_threshold", synthesis.parallel_threshold);
        loadCategories(configuration, synthesis.categories);

        // Framing
        auto &framing = settings.framing;
        framing.camera_distance_multiplier =
                readPositive(configuration, "framing.camera_distance_multiplier", framing.camera_distance_multiplier);
        framing.camera_elevation_ratio =
                readNonNegative(configuration, "framing.camera_elevation_ratio", framing.camera_elevation_ratio);

        LOG_DEBUG("Reconstruction settings loaded: reference '{}' = {} m, target max height {} m, camera x{}",
                  reference_label, calibration.reference_real_height_m, elevation.target_max_height_m,
                  framing.camera_distance_multiplier);
        return settings;
    }

    void applyCalibrationOverrides(const CalibrationOverrides &overrides,
                                   reconstruction::ReconstructionConfig &settings) {
        auto &calibration = settings.calibration;
        if (overrides.meters_per_pixel || overrides.pixels_per_meter) {
            calibration.meters_per_pixel = overrides.meters_per_pixel;
            calibration.pixels_per_meter = overrides.pixels_per_meter;
            LOG_INFO("Manual scale from the command line replaces the configured one.");
        }
        if (overrides.reference_label) {
            if (overrides.reference_label->empty()) {
                LOG_ERROR("Empty reference label override.");
                throw std::invalid_argument("--reference-label must not be empty");
            }
            calibration.reference_matcher = reconstruction::labelContains(*overrides.reference_label);
        }
        if (overrides.reference_height) {
            calibration.reference_real_height_m = *overrides.reference_height;
        }
    }

    common::logging::Logger::Options loadLoggingOptions(const Configuration &configuration) {
        common::logging::Logger::Options options;
        options.level = configuration.get("logging.level", options.level);
        options.pattern = configuration.get("logging.pattern", options.pattern);
        options.to_file = configuration.get("logging.to_file", options.to_file);
        options.directory = configuration.get("logging.directory", options.directory);
        options.filename = configuration.get("logging.file", options.filename);
        return options;
    }

} // namespace config
