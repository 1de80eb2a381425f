// File: types/elevation.hpp

#ifndef ELEVATION_HPP
#define ELEVATION_HPP

#include <Eigen/Core>

// Raw samples from the depth-estimation service, arbitrary units. Row-major image layout (row = image y).
using ElevationGrid = Eigen::MatrixXd;

struct NormalizedGrid {
    Eigen::MatrixXd values; // every entry in [0, target_max_height]
    double target_max_height{};
    bool flat{false}; // input had no relief (max == min); values are all zero

    [[nodiscard]] Eigen::Index rows() const noexcept { return values.rows(); }
    [[nodiscard]] Eigen::Index cols() const noexcept { return values.cols(); }
};

// Cheap stand-in for a normalized grid when the full matrix is not needed downstream.
struct ElevationSummary {
    Eigen::Index rows{}, cols{};
    double mean{};
    bool flat{false};
};

#endif // ELEVATION_HPP
