// File: common/utilities/matrix.hpp

#ifndef COMMON_UTILITIES_MATRIX_HPP
#define COMMON_UTILITIES_MATRIX_HPP

#include <Eigen/Core>
#include <opencv2/core.hpp>
#include <stdexcept>
#include <type_traits>

#include "common/logging/logger.hpp"

namespace common::utilities {

    /**
     * @brief Converts a single-channel OpenCV matrix of any depth into a dynamic Eigen matrix.
     *
     * Samples are converted to the Eigen scalar type (8-bit, 16-bit and float depth maps alike).
     *
     * @tparam Scalar float or double.
     * @param cv_matrix The input OpenCV matrix.
     * @return rows x cols Eigen matrix with the same layout (row = image y).
     * @throws std::invalid_argument if the matrix is empty or has more than one channel.
     */
    template<typename Scalar = double>
    Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> toEigen(const cv::Mat &cv_matrix) {
        static_assert(std::is_floating_point_v<Scalar>, "toEigen converts into floating point matrices only.");
        constexpr int type = std::is_same_v<Scalar, float> ? CV_32F : CV_64F;

        if (cv_matrix.empty()) {
            LOG_ERROR("Cannot convert an empty cv::Mat.");
            throw std::invalid_argument("cv::Mat is empty.");
        }
        if (cv_matrix.channels() != 1) {
            LOG_ERROR("cv::Mat has {} channels, expected a single channel.", cv_matrix.channels());
            throw std::invalid_argument("cv::Mat must have a single channel.");
        }

        LOG_DEBUG("Converting OpenCV matrix to Eigen matrix (size: {}x{})", cv_matrix.rows, cv_matrix.cols);

        cv::Mat converted;
        cv_matrix.convertTo(converted, type);

        Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> eigen_matrix(converted.rows, converted.cols);
        for (int i = 0; i < converted.rows; ++i) {
            const auto *row = converted.ptr<Scalar>(i);
            for (int j = 0; j < converted.cols; ++j) {
                eigen_matrix(i, j) = row[j];
            }
        }
        return eigen_matrix;
    }

}

#endif // COMMON_UTILITIES_MATRIX_HPP
