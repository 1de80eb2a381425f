// File: types/scene_bounds.hpp

#ifndef SCENE_BOUNDS_HPP
#define SCENE_BOUNDS_HPP

#include <Eigen/Core>

// Axis-aligned bounds of a reconstructed scene together with a camera that frames it.
struct SceneBounds {
    Eigen::Vector3d min{Eigen::Vector3d::Zero()};
    Eigen::Vector3d max{Eigen::Vector3d::Zero()};
    Eigen::Vector3d center{Eigen::Vector3d::Zero()};
    Eigen::Vector3d size{Eigen::Vector3d::Zero()};
    Eigen::Vector3d camera_position{Eigen::Vector3d::Zero()};
    Eigen::Vector3d camera_target{Eigen::Vector3d::Zero()};
    double camera_distance{};

    template<typename Derived>
    [[nodiscard]] bool contains(const Eigen::MatrixBase<Derived> &point, const double epsilon = 1e-9) const {
        return ((point.array() - min.array()) >= -epsilon).all() && ((max.array() - point.array()) >= -epsilon).all();
    }
};

#endif // SCENE_BOUNDS_HPP
