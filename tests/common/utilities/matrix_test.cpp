// File: tests/common/utilities/matrix_test.cpp

#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <opencv2/core.hpp>

#include "common/utilities/matrix.hpp"

// 8-bit depth maps keep their raw sample values
TEST(MatrixUtilsTest, EightBitToEigen) {
    cv::Mat cv_matrix = (cv::Mat_<uchar>(2, 3) << 0, 128, 255,
            10, 20, 30);

    const Eigen::MatrixXd result = common::utilities::toEigen<double>(cv_matrix);

    ASSERT_EQ(result.rows(), 2);
    ASSERT_EQ(result.cols(), 3);
    EXPECT_DOUBLE_EQ(result(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(result(0, 1), 128.0);
    EXPECT_DOUBLE_EQ(result(0, 2), 255.0);
    EXPECT_DOUBLE_EQ(result(1, 2), 30.0);
}

// 16-bit depth PNGs exceed the 8-bit range
TEST(MatrixUtilsTest, SixteenBitToEigen) {
    cv::Mat cv_matrix = (cv::Mat_<ushort>(2, 2) << 0, 1000,
            40000, 65535);

    const Eigen::MatrixXd result = common::utilities::toEigen<double>(cv_matrix);

    EXPECT_DOUBLE_EQ(result(0, 1), 1000.0);
    EXPECT_DOUBLE_EQ(result(1, 0), 40000.0);
    EXPECT_DOUBLE_EQ(result(1, 1), 65535.0);
}

TEST(MatrixUtilsTest, FloatScalarType) {
    cv::Mat cv_matrix = (cv::Mat_<double>(2, 2) << 1.5, 2.5,
            3.5, 4.5);

    const Eigen::MatrixXf result = common::utilities::toEigen<float>(cv_matrix);

    Eigen::MatrixXf expected(2, 2);
    expected << 1.5f, 2.5f,
            3.5f, 4.5f;
    EXPECT_EQ(result, expected);
}

TEST(MatrixUtilsTest, EmptyMatrixThrows) {
    const cv::Mat cv_matrix;
    EXPECT_THROW(common::utilities::toEigen<double>(cv_matrix), std::invalid_argument);
}

TEST(MatrixUtilsTest, MultiChannelThrows) {
    const cv::Mat cv_matrix(2, 2, CV_8UC3, cv::Scalar(1, 2, 3));

    EXPECT_THROW({
                 try {
                 const Eigen::MatrixXd result = common::utilities::toEigen<double>(cv_matrix);
                 } catch (const std::invalid_argument& e) {
                 EXPECT_STREQ("cv::Mat must have a single channel.", e.what());
                 throw;
                 }
                 }, std::invalid_argument);
}
