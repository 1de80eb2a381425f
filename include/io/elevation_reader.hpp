// File: io/elevation_reader.hpp

#ifndef ELEVATION_READER_HPP
#define ELEVATION_READER_HPP

#include <nlohmann/json.hpp>
#include <string>

#include "types/elevation.hpp"

namespace io {

    // Parses a rectangular 2D JSON array of numbers. Throws std::invalid_argument on ragged or non-numeric input.
    [[nodiscard]] ElevationGrid parseElevationGrid(const nlohmann::json &document);

    // Loads a single-channel depth image (8/16-bit PNG, float TIFF, ...) as raw samples.
    [[nodiscard]] ElevationGrid readDepthImage(const std::string &path);

    // Dispatches on extension: ".json" is parsed as a 2D array, anything else is read as a depth image.
    [[nodiscard]] ElevationGrid readElevationGrid(const std::string &path);

} // namespace io

#endif // ELEVATION_READER_HPP
