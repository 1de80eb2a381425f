// File: io/scene_writer.cpp

#include "io/scene_writer.hpp"

#include <fmt/format.h>

#include "common/io/io.hpp"
#include "common/logging/logger.hpp"

namespace io {

    namespace {
        template<typename Derived>
        json vectorToJson(const Eigen::MatrixBase<Derived> &vector) {
            json array = json::array();
            for (Eigen::Index i = 0; i < vector.size(); ++i) {
                array.push_back(vector[i]);
            }
            return array;
        }

        std::string colorToHex(const std::uint32_t color) { return fmt::format("#{:06x}", color & 0xffffffu); }

        json scaleToJson(const reconstruction::ScaleContext &scale) {
            json node = {{"meters_per_pixel", scale.meters_per_pixel}, {"override", scale.isOverride()}};
            if (scale.reference_index) {
                node["reference"] = {{"index", *scale.reference_index},
                                     {"label", scale.reference_label},
                                     {"pixel_height", scale.reference_pixel_height}};
            }
            return node;
        }

        json objectToJson(const SceneObject &object) {
            json node = {{"label", object.label},
                         {"category", std::string(toString(object.category))},
                         {"primitive", std::string(toString(object.primitive))},
                         {"position", vectorToJson(object.position)},
                         {"size", vectorToJson(object.size)},
                         {"elevation_source", std::string(toString(object.elevation_source))},
                         {"source_index", object.source_index},
                         {"color", colorToHex(object.color)},
                         {"opacity", object.opacity}};
            if (object.primitive == Primitive::Cylinder) {
                node["radius"] = object.radius();
            }
            return node;
        }

        json boundsToJson(const SceneBounds &bounds) {
            return {{"min", vectorToJson(bounds.min)},
                    {"max", vectorToJson(bounds.max)},
                    {"center", vectorToJson(bounds.center)},
                    {"size", vectorToJson(bounds.size)},
                    {"camera",
                     {{"position", vectorToJson(bounds.camera_position)},
                      {"target", vectorToJson(bounds.camera_target)},
                      {"distance", bounds.camera_distance}}}};
        }

        json measurementToJson(const reconstruction::DetectionMeasurement &measurement) {
            json node = {{"index", measurement.index},
                         {"label", measurement.label},
                         {"category", std::string(toString(measurement.category))},
                         {"size_px", vectorToJson(measurement.size_px)},
                         {"center_px", vectorToJson(measurement.center_px)},
                         {"size_m", vectorToJson(measurement.size_m)},
                         {"area_m2", measurement.area_m2},
                         {"height_ft", measurement.height_ft}};
            if (measurement.wall_length_m) {
                node["wall_length_m"] = *measurement.wall_length_m;
            }
            if (measurement.wall_thickness_m) {
                node["wall_thickness_m"] = *measurement.wall_thickness_m;
            }
            if (measurement.opening_span_m) {
                node["opening_span_m"] = *measurement.opening_span_m;
            }
            return node;
        }
    } // namespace

    json toJson(const reconstruction::ReconstructionResult &result,
                const std::vector<reconstruction::DetectionMeasurement> &measurements) {
        json document = {{"scale", scaleToJson(result.scale)},
                         {"objects", json::array()},
                         {"bounds", boundsToJson(result.bounds)},
                         {"skipped", json::array()}};

        for (const auto &object: result.objects) {
            document["objects"].push_back(objectToJson(object));
        }
        for (const auto &skipped: result.skipped) {
            document["skipped"].push_back({{"index", skipped.index}, {"label", skipped.label}, {"reason", skipped.reason}});
        }
        if (result.elevation) {
            document["elevation"] = {{"rows", result.elevation->rows},
                                     {"cols", result.elevation->cols},
                                     {"mean", result.elevation->mean},
                                     {"flat", result.elevation->flat}};
        }
        if (!measurements.empty()) {
            auto &nodes = document["measurements"] = json::array();
            for (const auto &measurement: measurements) {
                nodes.push_back(measurementToJson(measurement));
            }
        }
        return document;
    }

    void writeScene(const std::string &path, const reconstruction::ReconstructionResult &result,
                    const std::vector<reconstruction::DetectionMeasurement> &measurements) {
        common::io::writeTextFile(path, toJson(result, measurements).dump(4) + "\n");
        LOG_INFO("Scene with {} objects written to {}", result.objects.size(), path);
    }

} // namespace io
