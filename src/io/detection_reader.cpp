// File: io/detection_reader.cpp

#include "io/detection_reader.hpp"

#include <cmath>
#include <fmt/format.h>
#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>

#include "common/io/io.hpp"
#include "common/logging/logger.hpp"

namespace io {

    namespace {
        using json = nlohmann::json;

        std::optional<BoundingBox> parseBoundingBox(const json &entry, const std::size_t index) {
            const auto it = entry.find("bbox_xyxy");
            if (it == entry.end() || it->is_null()) {
                LOG_WARN("Detection #{} has no bbox_xyxy.", index);
                return std::nullopt;
            }
            if (!it->is_array() || it->size() != 4) {
                LOG_WARN("Detection #{} has a bbox_xyxy that is not a 4-element array: {}", index, it->dump());
                return std::nullopt;
            }
            for (const auto &value: *it) {
                if (!value.is_number()) {
                    LOG_WARN("Detection #{} has a non-numeric bbox_xyxy: {}", index, it->dump());
                    return std::nullopt;
                }
            }
            return BoundingBox{(*it)[0].get<double>(), (*it)[1].get<double>(), (*it)[2].get<double>(),
                               (*it)[3].get<double>()};
        }

        // Whole pixel counts in (0, INT_MAX]; 640.0 is accepted, 640.9 and 1e10 are not.
        std::optional<int> parseDimension(const json &value) {
            if (!value.is_number()) {
                return std::nullopt;
            }
            const double number = value.get<double>();
            if (!std::isfinite(number) || number < 1.0 || number > std::numeric_limits<int>::max() ||
                std::floor(number) != number) {
                return std::nullopt;
            }
            return static_cast<int>(number);
        }

        std::optional<ImageSize> parseImageSize(const json &node) {
            if (!node.is_array() || node.size() != 2) {
                return std::nullopt;
            }
            const auto width = parseDimension(node[0]);
            const auto height = parseDimension(node[1]);
            if (!width || !height) {
                LOG_WARN("Ignoring image_size that is not a pair of positive pixel counts: {}", node.dump());
                return std::nullopt;
            }
            return ImageSize{*width, *height};
        }

        Detection parseDetection(const json &entry, const std::size_t index,
                                 const std::optional<ImageSize> &shared_size) {
            if (!entry.is_object()) {
                LOG_ERROR("Detection #{} is not an object: {}", index, entry.dump());
                throw std::invalid_argument(fmt::format("Detection #{} is not a JSON object", index));
            }

            Detection detection;
            if (const auto label = entry.find("label"); label != entry.end() && label->is_string()) {
                detection.label = label->get<std::string>();
            } else {
                LOG_WARN("Detection #{} has no string label.", index);
            }
            detection.bbox = parseBoundingBox(entry, index);

            if (const auto size = entry.find("image_size"); size != entry.end()) {
                detection.image_size = parseImageSize(*size);
            }
            if (!detection.image_size) {
                detection.image_size = shared_size;
            }
            if (const auto confidence = entry.find("confidence"); confidence != entry.end() && confidence->is_number()) {
                detection.confidence = confidence->get<double>();
            }
            return detection;
        }
    } // namespace

    std::vector<Detection> parseDetections(const json &document) {
        const json *entries = &document;
        std::optional<ImageSize> shared_size;

        if (document.is_object()) {
            const auto it = document.find("detections");
            if (it == document.end() || !it->is_array()) {
                throw std::invalid_argument("Expected a JSON array or an object with a 'detections' array");
            }
            entries = &*it;
            if (const auto size = document.find("image_size"); size != document.end()) {
                shared_size = parseImageSize(*size);
            }
        } else if (!document.is_array()) {
            LOG_ERROR("Expected JSON array of detections, got {}", document.type_name());
            throw std::invalid_argument(fmt::format("Expected JSON array of detections, got {}", document.type_name()));
        }

        std::vector<Detection> detections;
        detections.reserve(entries->size());
        for (std::size_t index = 0; index < entries->size(); ++index) {
            detections.push_back(parseDetection((*entries)[index], index, shared_size));
        }

        LOG_DEBUG("Parsed {} detections.", detections.size());
        return detections;
    }

    std::vector<Detection> readDetections(const std::string &path) {
        if (!common::io::fileExists(path)) {
            LOG_ERROR("Detections file not found: {}", path);
            throw std::runtime_error(fmt::format("Detections file not found: {}", path));
        }

        std::ifstream stream(path);
        if (!stream) {
            throw std::runtime_error(fmt::format("Could not open detections file: {}", path));
        }

        json document;
        try {
            document = json::parse(stream);
        } catch (const json::parse_error &e) {
            LOG_ERROR("Could not parse detections file '{}': {}", path, e.what());
            throw std::runtime_error(fmt::format("Could not parse detections file '{}': {}", path, e.what()));
        }

        LOG_INFO("Reading detections from {}", path);
        return parseDetections(document);
    }

} // namespace io
