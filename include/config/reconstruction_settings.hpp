// File: config/reconstruction_settings.hpp

#ifndef RECONSTRUCTION_SETTINGS_HPP
#define RECONSTRUCTION_SETTINGS_HPP

#include <optional>
#include <string>

#include "common/logging/logger.hpp"
#include "config/configuration.hpp"
#include "reconstruction/config.hpp"

namespace config {

    /**
     * @brief Builds explicit reconstruction settings from a loaded configuration.
     *
     * Missing keys keep the defaults of reconstruction::ReconstructionConfig.
     *
     * @throws std::invalid_argument for values that can never be valid (non-positive heights, image sizes, ...).
     */
    [[nodiscard]] reconstruction::ReconstructionConfig loadReconstructionConfig(const Configuration &configuration);

    // Command line calibration values. Unset members leave the loaded settings alone.
    struct CalibrationOverrides {
        std::optional<double> meters_per_pixel;
        std::optional<double> pixels_per_meter;
        std::optional<std::string> reference_label;
        std::optional<double> reference_height;
    };

    /**
     * @brief Applies command line calibration values on top of loaded settings.
     *
     * Either manual scale replaces both configured ones, so a file's pixels_per_meter cannot shadow a
     * --meters-per-pixel given on the command line.
     *
     * @throws std::invalid_argument for an empty reference label.
     */
    void applyCalibrationOverrides(const CalibrationOverrides &overrides, reconstruction::ReconstructionConfig &settings);

    // Reads the logging.* section.
    [[nodiscard]] common::logging::Logger::Options loadLoggingOptions(const Configuration &configuration);

} // namespace config

#endif // RECONSTRUCTION_SETTINGS_HPP
