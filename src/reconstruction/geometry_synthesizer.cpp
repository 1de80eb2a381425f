// File: reconstruction/geometry_synthesizer.cpp

#include "reconstruction/geometry_synthesizer.hpp"

#include <algorithm>
#include <cmath>
#include <execution>
#include <fmt/format.h>
#include <numeric>
#include <stdexcept>
#include <utility>

#include "common/logging/logger.hpp"
#include "reconstruction/footprint_mapper.hpp"

namespace reconstruction {

    GeometrySynthesizer::GeometrySynthesizer(SynthesisConfig config) : config_(std::move(config)) {
        if (!(config_.min_dimension_m > 0.0)) {
            LOG_ERROR("Minimum dimension must be positive, got {}", config_.min_dimension_m);
            throw std::invalid_argument("Minimum dimension must be positive.");
        }
        if (!config_.default_image_size.isValid()) {
            LOG_ERROR("Default image size must be positive, got {}x{}", config_.default_image_size.width,
                      config_.default_image_size.height);
            throw std::invalid_argument("Default image size must be positive.");
        }
    }

    SynthesisResult GeometrySynthesizer::synthesize(const std::vector<Detection> &detections, const ScaleContext &scale,
                                                    const NormalizedGrid *elevation,
                                                    const std::optional<ImageSize> image_size) const {
        if (!std::isfinite(scale.meters_per_pixel) || scale.meters_per_pixel <= 0.0) {
            throw std::invalid_argument(fmt::format("Scale must be positive, got {} m/px", scale.meters_per_pixel));
        }

        const ImageSize fallback_size = image_size.value_or(config_.default_image_size);
        if (!fallback_size.isValid()) {
            throw std::invalid_argument(
                    fmt::format("Image size must be positive, got {}x{}", fallback_size.width, fallback_size.height));
        }

        if (elevation != nullptr && elevation->values.size() == 0) {
            throw std::invalid_argument("Elevation grid is empty.");
        }
        // A grid without relief carries no placement information: same outcome as no grid at all.
        if (elevation != nullptr && elevation->flat) {
            LOG_INFO("Elevation grid is flat; using default placement.");
            elevation = nullptr;
        }

        std::vector<Outcome> outcomes(detections.size());
        std::vector<std::size_t> indices(detections.size());
        std::iota(indices.begin(), indices.end(), std::size_t{0});

        const auto build = [&](const std::size_t index) {
            return attempt(detections[index], index, scale, elevation, fallback_size);
        };

        if (detections.size() >= config_.parallel_threshold) {
            LOG_DEBUG("Synthesizing {} detections in parallel.", detections.size());
            std::transform(std::execution::par, indices.begin(), indices.end(), outcomes.begin(), build);
        } else {
            std::transform(indices.begin(), indices.end(), outcomes.begin(), build);
        }

        SynthesisResult result;
        result.objects.reserve(detections.size());
        for (auto &outcome: outcomes) {
            if (outcome.object) {
                result.objects.push_back(std::move(*outcome.object));
            } else if (outcome.skipped) {
                result.skipped.push_back(std::move(*outcome.skipped));
            }
        }

        LOG_INFO("Synthesized {} objects from {} detections ({} skipped).", result.objects.size(), detections.size(),
                 result.skipped.size());
        return result;
    }

    GeometrySynthesizer::Outcome GeometrySynthesizer::attempt(const Detection &detection, const std::size_t index,
                                                              const ScaleContext &scale,
                                                              const NormalizedGrid *elevation,
                                                              const ImageSize &fallback_size) const {
        Outcome outcome;
        try {
            outcome.object = synthesizeOne(detection, index, scale, elevation, fallback_size);
        } catch (const MalformedDetectionError &error) {
            LOG_WARN("Skipping detection #{} '{}': {}", error.index(), error.label(), error.what());
            outcome.skipped = SkippedDetection{error.index(), error.label(), error.what()};
        }
        return outcome;
    }

    SceneObject GeometrySynthesizer::synthesizeOne(const Detection &detection, const std::size_t index,
                                                   const ScaleContext &scale, const NormalizedGrid *elevation,
                                                   const ImageSize &image_size) const {
        if (!detection.bbox) {
            throw MalformedDetectionError(index, detection.label,
                                          fmt::format("detection #{} '{}' has no bounding box", index, detection.label));
        }
        if (!detection.bbox->isUsable()) {
            const BoundingBox &bbox = *detection.bbox;
            throw MalformedDetectionError(index, detection.label,
                                          fmt::format("detection #{} '{}' has an unusable bounding box ({}, {}, {}, {})",
                                                      index, detection.label, bbox.x1, bbox.y1, bbox.x2, bbox.y2));
        }

        const BoundingBox &bbox = *detection.bbox;
        const ImageSize image =
                detection.image_size && detection.image_size->isValid() ? *detection.image_size : image_size;
        const Category category = categorize(detection.label);
        const CategoryPolicy &policy = config_.categories[category];

        const double width_m = scale.toMeters(bbox.width());
        const double height_m = scale.toMeters(bbox.height());
        const double volume_height = std::max(height_m, policy.min_height_m);

        SceneObject object;
        object.label = detection.label;
        object.category = category;
        object.source_index = index;
        object.color = policy.color;
        object.opacity = policy.opacity;

        if (category == Category::Column) {
            const double radius =
                    std::max(config_.min_column_radius_m, std::min(width_m, height_m) * config_.column_radius_factor);
            object.primitive = Primitive::Cylinder;
            object.size = {2.0 * radius, volume_height, 2.0 * radius};
        } else {
            const double length = std::max(width_m, height_m);
            const double thickness =
                    std::max(policy.thickness_m, std::min(width_m, height_m) * config_.thickness_factor);
            object.primitive = Primitive::Box;
            object.size = width_m >= height_m ? Eigen::Vector3d(length, volume_height, thickness)
                                              : Eigen::Vector3d(thickness, volume_height, length);
        }
        object.size = object.size.unaryExpr([this](const double value) { return clampDimension(value); });

        // Image center sits at the world origin; image y runs along world z.
        const double x = scale.toMeters(bbox.centerX() - image.width * 0.5);
        const double z = scale.toMeters(bbox.centerY() - image.height * 0.5);

        double baseline = 0.0;
        if (elevation != nullptr) {
            const GridRegion region = mapFootprint(bbox, image, elevation->rows(), elevation->cols());
            baseline = std::max(0.0, sampleMean(elevation->values, region));
            object.elevation_source = ElevationSource::DepthHint;
        } else {
            object.elevation_source = ElevationSource::Default;
        }

        object.position = {x, baseline + object.size.y() * 0.5, z};

        LOG_DEBUG("Synthesized {}", object);
        return object;
    }

    double GeometrySynthesizer::clampDimension(const double value) const noexcept {
        return std::max(value, config_.min_dimension_m);
    }

} // namespace reconstruction
