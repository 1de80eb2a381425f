// File: reconstruction/depth_normalizer.cpp

#include "reconstruction/depth_normalizer.hpp"

#include <cmath>
#include <fmt/format.h>
#include <stdexcept>

#include "common/logging/logger.hpp"

namespace reconstruction {

    NormalizedGrid normalizeElevation(const ElevationGrid &grid, const double target_max_height, const double gamma) {
        if (grid.size() == 0) {
            LOG_ERROR("Elevation grid is empty ({}x{}).", grid.rows(), grid.cols());
            throw std::invalid_argument("Elevation grid must contain at least one sample.");
        }
        if (!std::isfinite(target_max_height) || target_max_height <= 0.0) {
            LOG_ERROR("Invalid target max height: {}", target_max_height);
            throw std::invalid_argument(fmt::format("Target max height must be positive, got {}", target_max_height));
        }
        if (!std::isfinite(gamma) || gamma <= 0.0) {
            LOG_ERROR("Invalid relief gamma: {}", gamma);
            throw std::invalid_argument(fmt::format("Relief gamma must be positive, got {}", gamma));
        }
        if (!grid.allFinite()) {
            LOG_ERROR("Elevation grid ({}x{}) contains non-finite samples.", grid.rows(), grid.cols());
            throw std::invalid_argument("Elevation grid contains non-finite samples.");
        }

        const double min_value = grid.minCoeff();
        const double max_value = grid.maxCoeff();
        LOG_DEBUG("Elevation grid {}x{} min: {}, max: {}.", grid.rows(), grid.cols(), min_value, max_value);

        NormalizedGrid normalized;
        normalized.target_max_height = target_max_height;

        if (max_value == min_value) {
            LOG_INFO("Elevation grid is flat (value {}); treating it as zero relief.", min_value);
            normalized.values = Eigen::MatrixXd::Zero(grid.rows(), grid.cols());
            normalized.flat = true;
            return normalized;
        }

        // Halved before subtracting so extremes near the double limits cannot overflow the range.
        const double half_range = 0.5 * max_value - 0.5 * min_value;
        Eigen::ArrayXXd unit = (0.5 * grid.array() - 0.5 * min_value) / half_range;
        if (gamma != 1.0) {
            unit = unit.pow(gamma);
        }
        // Guard against rounding pushing a sample a hair outside the unit interval.
        normalized.values = (unit.max(0.0).min(1.0) * target_max_height).matrix();

        LOG_DEBUG("Elevation grid normalized to [0, {}] (gamma {}).", target_max_height, gamma);
        return normalized;
    }

    ElevationSummary summarize(const NormalizedGrid &grid) noexcept {
        ElevationSummary summary;
        summary.rows = grid.rows();
        summary.cols = grid.cols();
        summary.mean = grid.values.size() > 0 ? grid.values.mean() : 0.0;
        summary.flat = grid.flat;
        return summary;
    }

} // namespace reconstruction
