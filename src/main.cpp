// File: main.cpp

#include <boost/program_options.hpp>
#include <filesystem>
#include <fmt/format.h>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "common/logging/logger.hpp"
#include "config/configuration.hpp"
#include "config/reconstruction_settings.hpp"
#include "io/detection_reader.hpp"
#include "io/elevation_reader.hpp"
#include "io/scene_writer.hpp"
#include "reconstruction/measurement.hpp"
#include "reconstruction/pipeline.hpp"

namespace po = boost::program_options;

namespace {

    constexpr std::string_view kDefaultConfiguration = "configuration.yaml";

    // Without --config the default file is used when present, otherwise built-in defaults apply.
    const config::Configuration &loadConfiguration(const po::variables_map &vm,
                                                   std::unique_ptr<config::Configuration> &fallback) {
        if (vm.count("config")) {
            config::initialize(vm["config"].as<std::string>());
            return config::Configuration::getInstance();
        }
        if (std::filesystem::exists(kDefaultConfiguration)) {
            config::initialize(std::string(kDefaultConfiguration));
            return config::Configuration::getInstance();
        }
        fallback = config::Configuration::fromString("");
        return *fallback;
    }

    config::CalibrationOverrides readOverrides(const po::variables_map &vm) {
        config::CalibrationOverrides overrides;
        if (vm.count("meters-per-pixel")) {
            overrides.meters_per_pixel = vm["meters-per-pixel"].as<double>();
        }
        if (vm.count("pixels-per-meter")) {
            overrides.pixels_per_meter = vm["pixels-per-meter"].as<double>();
        }
        if (vm.count("reference-label")) {
            overrides.reference_label = vm["reference-label"].as<std::string>();
        }
        if (vm.count("reference-height")) {
            overrides.reference_height = vm["reference-height"].as<double>();
        }
        return overrides;
    }

    void printSummary(const reconstruction::ReconstructionResult &result) {
        const auto &scale = result.scale;
        if (scale.isOverride()) {
            fmt::print("Scale:    {:.6f} m/px (manual override)\n", scale.meters_per_pixel);
        } else {
            fmt::print("Scale:    {:.6f} m/px from #{} '{}' ({} px)\n", scale.meters_per_pixel, *scale.reference_index,
                       scale.reference_label, scale.reference_pixel_height);
        }
        if (result.elevation) {
            fmt::print("Depth:    {}x{} grid, mean {:.4f}{}\n", result.elevation->rows, result.elevation->cols,
                       result.elevation->mean, result.elevation->flat ? " (flat, ignored)" : "");
        }
        fmt::print("Objects:  {} ({} skipped)\n", result.objects.size(), result.skippedCount());
        for (const auto &skipped: result.skipped) {
            fmt::print("  skipped #{} '{}': {}\n", skipped.index, skipped.label, skipped.reason);
        }
        fmt::print("Bounds:   {:3} .. {:3}\n", result.bounds.min, result.bounds.max);
        fmt::print("Camera:   {:3} -> {:3}\n", result.bounds.camera_position, result.bounds.camera_target);
    }

} // namespace

int main(const int argc, char *argv[]) {
    po::options_description desc("blueprint3d options");
    // clang-format off
    desc.add_options()
        ("help,h", "Print this help message")
        ("detections,d", po::value<std::string>()->required(), "Detections JSON file")
        ("depth", po::value<std::string>(), "Optional elevation grid: JSON 2D array or single-channel depth image")
        ("config,c", po::value<std::string>(), "YAML configuration file (default: ./configuration.yaml if present)")
        ("output,o", po::value<std::string>()->default_value("scene.json"), "Scene JSON output path")
        ("meters-per-pixel", po::value<double>(), "Manual scale, skips reference calibration")
        ("pixels-per-meter", po::value<double>(), "Manual inverse scale, skips reference calibration")
        ("reference-label", po::value<std::string>(), "Case-insensitive label substring of the reference object")
        ("reference-height", po::value<double>(), "Real-world height of the reference object in meters")
        ("log-level", po::value<std::string>(), "trace, debug, info, warn, error, critical or off");
    // clang-format on

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << "blueprint3d: Reconstruct a 3D scene from blueprint detections.\n\n" << desc << std::endl;
            return reconstruction::kSuccess;
        }
        po::notify(vm);
    } catch (const po::error &e) {
        std::cerr << "Error: " << e.what() << "\n\n" << desc << std::endl;
        return reconstruction::kFailure;
    }

    try {
        std::unique_ptr<config::Configuration> fallback;
        const auto &configuration = loadConfiguration(vm, fallback);

        auto logging = config::loadLoggingOptions(configuration);
        if (vm.count("log-level")) {
            logging.level = vm["log-level"].as<std::string>();
        }
        common::logging::Logger::configure(logging);
        configuration.show();

        auto settings = config::loadReconstructionConfig(configuration);
        config::applyCalibrationOverrides(readOverrides(vm), settings);

        const auto detections = io::readDetections(vm["detections"].as<std::string>());
        std::optional<ElevationGrid> elevation;
        if (vm.count("depth")) {
            elevation = io::readElevationGrid(vm["depth"].as<std::string>());
        }

        const auto result = reconstruction::reconstructScene(detections, elevation, settings);
        const auto measurements = reconstruction::measureDetections(detections, result.scale);

        const auto output = vm["output"].as<std::string>();
        io::writeScene(output, result, measurements);

        printSummary(result);
        fmt::print("Written:  {}\n", output);
        return reconstruction::kSuccess;
    } catch (const reconstruction::CalibrationError &e) {
        LOG_ERROR("Calibration failed: {}", e.what());
        std::cerr << "Calibration failed: " << e.what() << std::endl;
        return reconstruction::exitCodeFor(e);
    } catch (const reconstruction::EmptySceneError &e) {
        LOG_ERROR("Empty scene ({} detections skipped): {}", e.skipped(), e.what());
        std::cerr << "Empty scene: " << e.what() << std::endl;
        return reconstruction::exitCodeFor(e);
    } catch (const std::exception &e) {
        LOG_CRITICAL("Reconstruction failed: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return reconstruction::exitCodeFor(e);
    }
}
