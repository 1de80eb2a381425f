// File: reconstruction/depth_normalizer.hpp

#ifndef DEPTH_NORMALIZER_HPP
#define DEPTH_NORMALIZER_HPP

#include "types/elevation.hpp"

namespace reconstruction {

    /**
     * @brief Rescales a raw elevation grid into [0, target_max_height].
     *
     * norm = ((v - min) / (max - min))^gamma * target_max_height, so the grid minimum maps to 0 and the maximum
     * to target_max_height. A flat grid (max == min) has no relief and yields an all-zero grid flagged `flat`.
     *
     * @throws std::invalid_argument on an empty grid, non-finite samples, or a non-positive target height or gamma.
     */
    [[nodiscard]] NormalizedGrid normalizeElevation(const ElevationGrid &grid, double target_max_height,
                                                    double gamma = 1.0);

    [[nodiscard]] ElevationSummary summarize(const NormalizedGrid &grid) noexcept;

} // namespace reconstruction

#endif // DEPTH_NORMALIZER_HPP
