// File: io/elevation_reader.cpp

#include "io/elevation_reader.hpp"

#include <fmt/format.h>
#include <fstream>
#include <opencv2/imgcodecs.hpp>
#include <stdexcept>

#include "common/io/io.hpp"
#include "common/logging/logger.hpp"
#include "common/utilities/matrix.hpp"

namespace io {

    ElevationGrid parseElevationGrid(const nlohmann::json &document) {
        if (!document.is_array() || document.empty()) {
            throw std::invalid_argument("Elevation grid must be a non-empty array of rows");
        }

        const auto rows = static_cast<Eigen::Index>(document.size());
        const auto &first_row = document.front();
        if (!first_row.is_array() || first_row.empty()) {
            throw std::invalid_argument("Elevation grid rows must be non-empty arrays");
        }
        const auto cols = static_cast<Eigen::Index>(first_row.size());

        ElevationGrid grid(rows, cols);
        for (Eigen::Index row = 0; row < rows; ++row) {
            const auto &values = document[static_cast<std::size_t>(row)];
            if (!values.is_array() || static_cast<Eigen::Index>(values.size()) != cols) {
                LOG_ERROR("Elevation grid row {} has {} entries, expected {}.", row,
                          values.is_array() ? values.size() : 0, cols);
                throw std::invalid_argument(fmt::format("Elevation grid is not rectangular at row {}", row));
            }
            for (Eigen::Index col = 0; col < cols; ++col) {
                const auto &value = values[static_cast<std::size_t>(col)];
                if (!value.is_number()) {
                    throw std::invalid_argument(fmt::format("Elevation grid value at ({}, {}) is not a number", row, col));
                }
                grid(row, col) = value.get<double>();
            }
        }

        LOG_DEBUG("Parsed {}x{} elevation grid.", rows, cols);
        return grid;
    }

    ElevationGrid readDepthImage(const std::string &path) {
        if (!common::io::fileExists(path)) {
            LOG_ERROR("Depth image not found: {}", path);
            throw std::runtime_error(fmt::format("Depth image not found: {}", path));
        }

        const cv::Mat image = cv::imread(path, cv::IMREAD_ANYDEPTH | cv::IMREAD_GRAYSCALE);
        if (image.empty()) {
            LOG_ERROR("Could not decode depth image: {}", path);
            throw std::runtime_error(fmt::format("Could not decode depth image: {}", path));
        }

        LOG_INFO("Loaded depth image {} ({}x{}, depth {}).", path, image.cols, image.rows, image.depth());
        return common::utilities::toEigen<double>(image);
    }

    ElevationGrid readElevationGrid(const std::string &path) {
        if (common::io::extension(path) != ".json") {
            return readDepthImage(path);
        }

        std::ifstream stream(path);
        if (!stream) {
            LOG_ERROR("Could not open elevation grid: {}", path);
            throw std::runtime_error(fmt::format("Could not open elevation grid: {}", path));
        }

        try {
            return parseElevationGrid(nlohmann::json::parse(stream));
        } catch (const nlohmann::json::parse_error &e) {
            LOG_ERROR("Could not parse elevation grid '{}': {}", path, e.what());
            throw std::runtime_error(fmt::format("Could not parse elevation grid '{}': {}", path, e.what()));
        }
    }

} // namespace io
