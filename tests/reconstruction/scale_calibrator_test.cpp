// File: tests/reconstruction/scale_calibrator_test.cpp

#include <gtest/gtest.h>

#include "reconstruction/scale_calibrator.hpp"

using namespace reconstruction;

namespace {
    Detection makeDetection(std::string label, const BoundingBox &bbox) {
        Detection detection;
        detection.label = std::move(label);
        detection.bbox = bbox;
        return detection;
    }

    CalibrationError::Reason reasonOf(const std::vector<Detection> &detections, const CalibrationConfig &config = {}) {
        try {
            static_cast<void>(calibrateScale(detections, config));
        } catch (const CalibrationError &e) {
            return e.reason();
        }
        ADD_FAILURE() << "calibrateScale did not throw";
        return CalibrationError::Reason::NoReference;
    }
} // namespace

TEST(ScaleCalibratorTest, WallOfThreeHundredPixels) {
    const std::vector<Detection> detections = {makeDetection("Wall", {0, 0, 100, 300})};

    const ScaleContext scale = calibrateScale(detections);

    EXPECT_DOUBLE_EQ(scale.meters_per_pixel, 0.01);
    ASSERT_TRUE(scale.reference_index.has_value());
    EXPECT_EQ(*scale.reference_index, 0u);
    EXPECT_EQ(scale.reference_label, "Wall");
    EXPECT_DOUBLE_EQ(scale.reference_pixel_height, 300.0);
    EXPECT_FALSE(scale.isOverride());
}

TEST(ScaleCalibratorTest, ScaleIsReferenceHeightOverPixelHeight) {
    CalibrationConfig config;
    for (const double real_height: {2.4, 3.0, 4.5}) {
        for (const double pixel_height: {37.0, 120.0, 333.0}) {
            config.reference_real_height_m = real_height;
            const std::vector<Detection> detections = {makeDetection("wall", {5, 10, 25, 10 + pixel_height})};
            EXPECT_NEAR(calibrateScale(detections, config).meters_per_pixel, real_height / pixel_height, 1e-12);
        }
    }
}

TEST(ScaleCalibratorTest, FirstMatchInInputOrderWins) {
    const std::vector<Detection> detections = {makeDetection("Door", {0, 0, 10, 50}),
                                               makeDetection("Interior Wall", {0, 0, 10, 100}),
                                               makeDetection("Wall", {0, 0, 10, 300})};

    const ScaleContext scale = calibrateScale(detections);

    EXPECT_EQ(*scale.reference_index, 1u);
    EXPECT_EQ(scale.reference_label, "Interior Wall");
    EXPECT_DOUBLE_EQ(scale.meters_per_pixel, 0.03);
}

TEST(ScaleCalibratorTest, MatchIsCaseInsensitive) {
    const std::vector<Detection> detections = {makeDetection("EXTERIOR WALL", {0, 0, 50, 150})};
    EXPECT_DOUBLE_EQ(calibrateScale(detections).meters_per_pixel, 0.02);
}

TEST(ScaleCalibratorTest, ReversedCornersUseAbsoluteHeight) {
    const std::vector<Detection> detections = {makeDetection("Wall", {100, 300, 0, 0})};
    EXPECT_DOUBLE_EQ(calibrateScale(detections).meters_per_pixel, 0.01);
}

TEST(ScaleCalibratorTest, CustomReferenceLabel) {
    CalibrationConfig config;
    config.reference_matcher = labelContains("door");
    config.reference_real_height_m = 2.0;
    const std::vector<Detection> detections = {makeDetection("Wall", {0, 0, 10, 300}),
                                               makeDetection("Door", {0, 0, 10, 100})};

    const ScaleContext scale = calibrateScale(detections, config);

    EXPECT_EQ(*scale.reference_index, 1u);
    EXPECT_DOUBLE_EQ(scale.meters_per_pixel, 0.02);
}

TEST(ScaleCalibratorTest, EmptyBatchFails) {
    EXPECT_THROW(static_cast<void>(calibrateScale({})), CalibrationError);
    EXPECT_EQ(reasonOf({}), CalibrationError::Reason::NoReference);
}

TEST(ScaleCalibratorTest, NoReferenceFails) {
    const std::vector<Detection> detections = {makeDetection("Door", {0, 0, 10, 50}),
                                               makeDetection("Window", {0, 0, 10, 50})};
    EXPECT_EQ(reasonOf(detections), CalibrationError::Reason::NoReference);
}

TEST(ScaleCalibratorTest, ReferenceWithoutBoundingBoxFails) {
    Detection wall;
    wall.label = "Wall";
    const std::vector<Detection> detections = {wall, makeDetection("Wall", {0, 0, 10, 300})};

    try {
        static_cast<void>(calibrateScale(detections));
        FAIL() << "Expected CalibrationError";
    } catch (const CalibrationError &e) {
        EXPECT_EQ(e.reason(), CalibrationError::Reason::MissingBoundingBox);
        ASSERT_TRUE(e.index().has_value());
        EXPECT_EQ(*e.index(), 0u);
        EXPECT_EQ(e.label(), "Wall");
    }
}

TEST(ScaleCalibratorTest, ZeroPixelHeightFails) {
    const std::vector<Detection> detections = {makeDetection("Wall", {0, 40, 100, 40})};
    EXPECT_EQ(reasonOf(detections), CalibrationError::Reason::ZeroPixelHeight);
}

TEST(ScaleCalibratorTest, MetersPerPixelOverrideSkipsSearch) {
    CalibrationConfig config;
    config.meters_per_pixel = 0.02;

    const ScaleContext scale = calibrateScale({}, config);

    EXPECT_DOUBLE_EQ(scale.meters_per_pixel, 0.02);
    EXPECT_TRUE(scale.isOverride());
}

TEST(ScaleCalibratorTest, PixelsPerMeterOverrideIsInverted) {
    CalibrationConfig config;
    config.pixels_per_meter = 50.0;
    const std::vector<Detection> detections = {makeDetection("Wall", {0, 0, 100, 300})};

    EXPECT_DOUBLE_EQ(calibrateScale(detections, config).meters_per_pixel, 0.02);
}

TEST(ScaleCalibratorTest, InvalidOverridesFail) {
    CalibrationConfig both;
    both.meters_per_pixel = 0.01;
    both.pixels_per_meter = 100.0;
    EXPECT_EQ(reasonOf({}, both), CalibrationError::Reason::InvalidOverride);

    CalibrationConfig negative;
    negative.meters_per_pixel = -0.01;
    EXPECT_EQ(reasonOf({}, negative), CalibrationError::Reason::InvalidOverride);

    CalibrationConfig zero;
    zero.pixels_per_meter = 0.0;
    EXPECT_EQ(reasonOf({}, zero), CalibrationError::Reason::InvalidOverride);
}

TEST(ScaleCalibratorTest, InvalidConfigurationThrows) {
    const std::vector<Detection> detections = {makeDetection("Wall", {0, 0, 100, 300})};

    CalibrationConfig no_matcher;
    no_matcher.reference_matcher = nullptr;
    EXPECT_THROW(static_cast<void>(calibrateScale(detections, no_matcher)), std::invalid_argument);

    CalibrationConfig zero_height;
    zero_height.reference_real_height_m = 0.0;
    EXPECT_THROW(static_cast<void>(calibrateScale(detections, zero_height)), std::invalid_argument);
}
