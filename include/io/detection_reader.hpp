// File: io/detection_reader.hpp

#ifndef DETECTION_READER_HPP
#define DETECTION_READER_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "types/detection.hpp"

namespace io {

    /**
     * @brief Parses detector output.
     *
     * Accepts either a bare array of entries or an object with a "detections" array and an optional shared
     * "image_size": [w, h]. Each entry looks like
     *   {"label": "Wall", "bbox_xyxy": [x1, y1, x2, y2], "image_size": [w, h], "confidence": 0.93}
     * An entry with a missing or malformed bbox_xyxy is kept without a bounding box, so the reconstruction can
     * report it as skipped instead of the whole document being rejected.
     *
     * @throws std::invalid_argument if the document is not an array / detections object, or an entry is not an object.
     */
    [[nodiscard]] std::vector<Detection> parseDetections(const nlohmann::json &document);

    // Reads and parses a detections JSON file. Throws std::runtime_error if the file cannot be read or parsed.
    [[nodiscard]] std::vector<Detection> readDetections(const std::string &path);

} // namespace io

#endif // DETECTION_READER_HPP
