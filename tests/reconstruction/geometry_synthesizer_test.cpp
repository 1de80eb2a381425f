// File: tests/reconstruction/geometry_synthesizer_test.cpp

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "reconstruction/depth_normalizer.hpp"
#include "reconstruction/geometry_synthesizer.hpp"

using namespace reconstruction;
using ::testing::HasSubstr;

namespace {
    Detection makeDetection(std::string label, const BoundingBox &bbox) {
        Detection detection;
        detection.label = std::move(label);
        detection.bbox = bbox;
        return detection;
    }

    Detection withoutBoundingBox(std::string label) {
        Detection detection;
        detection.label = std::move(label);
        return detection;
    }
} // namespace

class GeometrySynthesizerTest : public ::testing::Test {
protected:
    GeometrySynthesizer synthesizer;
    ScaleContext scale{0.01, 0, "Wall", 300.0};
    const ImageSize image{640, 480};

    SceneObject build(const Detection &detection, const NormalizedGrid *elevation = nullptr) const {
        return synthesizer.synthesizeOne(detection, 0, scale, elevation, image);
    }
};

TEST_F(GeometrySynthesizerTest, WallBecomesBoxAlongLongAxis) {
    const SceneObject wall = build(makeDetection("Wall", {0, 0, 100, 300}));

    EXPECT_EQ(wall.category, Category::Wall);
    EXPECT_EQ(wall.primitive, Primitive::Box);
    // 1.0 m wide, 3.0 m tall in the image: the wall runs along z.
    EXPECT_NEAR(wall.size.x(), 0.2, 1e-12);
    EXPECT_NEAR(wall.size.y(), 3.0, 1e-12);
    EXPECT_NEAR(wall.size.z(), 3.0, 1e-12);
    EXPECT_NEAR(wall.position.x(), -2.7, 1e-12);
    EXPECT_NEAR(wall.position.y(), 1.5, 1e-12);
    EXPECT_NEAR(wall.position.z(), -0.9, 1e-12);
    EXPECT_EQ(wall.elevation_source, ElevationSource::Default);
    EXPECT_EQ(wall.color, 0xffffffu);
}

TEST_F(GeometrySynthesizerTest, DoorHeightIsMetricBoundingBoxHeight) {
    const SceneObject door = build(makeDetection("Door", {10, 50, 40, 250}));

    EXPECT_EQ(door.category, Category::Door);
    EXPECT_NEAR(door.size.y(), 2.0, 1e-12);
    EXPECT_NEAR(door.lowerExtent(), 0.0, 1e-12);
}

TEST_F(GeometrySynthesizerTest, HorizontalWindowUsesCategoryThickness) {
    const SceneObject window = build(makeDetection("Window", {0, 0, 200, 20}));

    EXPECT_NEAR(window.size.x(), 2.0, 1e-12);
    EXPECT_NEAR(window.size.y(), 0.2, 1e-12);
    EXPECT_NEAR(window.size.z(), 0.08, 1e-12);
    EXPECT_DOUBLE_EQ(window.opacity, 0.5);
}

TEST_F(GeometrySynthesizerTest, ColumnBecomesCylinder) {
    const SceneObject column = build(makeDetection("Column", {100, 100, 140, 140}));

    EXPECT_EQ(column.primitive, Primitive::Cylinder);
    EXPECT_NEAR(column.radius(), 0.15, 1e-12);
    EXPECT_DOUBLE_EQ(column.size.x(), column.size.z());
    // Raised to the column minimum height.
    EXPECT_NEAR(column.size.y(), 2.0, 1e-12);
    EXPECT_NEAR(column.position.y(), 1.0, 1e-12);
}

TEST_F(GeometrySynthesizerTest, LargeColumnRadiusFollowsShortSide) {
    const SceneObject column = build(makeDetection("Column", {0, 0, 200, 100}));
    EXPECT_NEAR(column.radius(), 0.25, 1e-12);
}

TEST_F(GeometrySynthesizerTest, UnknownLabelUsesDefaultPolicy) {
    const SceneObject sofa = build(makeDetection("Sofa", {0, 0, 300, 100}));

    EXPECT_EQ(sofa.category, Category::Unknown);
    EXPECT_EQ(sofa.primitive, Primitive::Box);
    EXPECT_NEAR(sofa.size.z(), 0.2, 1e-12);
    EXPECT_EQ(sofa.label, "Sofa");
}

TEST_F(GeometrySynthesizerTest, DegenerateBoxIsClampedPositive) {
    const SceneObject point = build(makeDetection("Wall", {10, 10, 10, 10}));

    EXPECT_GT(point.size.x(), 0.0);
    EXPECT_GT(point.size.y(), 0.0);
    EXPECT_GT(point.size.z(), 0.0);
    EXPECT_DOUBLE_EQ(point.size.y(), synthesizer.config().min_dimension_m);
    EXPECT_GE(point.lowerExtent(), -1e-9);
}

TEST_F(GeometrySynthesizerTest, DetectionImageSizeOverridesFallback) {
    Detection wall = makeDetection("Wall", {0, 0, 100, 300});
    wall.image_size = ImageSize{200, 300};

    const SceneObject object = build(wall);

    EXPECT_NEAR(object.position.x(), -0.5, 1e-12);
    EXPECT_NEAR(object.position.z(), 0.0, 1e-12);
}

TEST_F(GeometrySynthesizerTest, MalformedDetectionThrows) {
    EXPECT_THROW(static_cast<void>(build(withoutBoundingBox("Door"))), MalformedDetectionError);
    EXPECT_THROW(static_cast<void>(build(makeDetection("Door", {-5, 0, 10, 10}))), MalformedDetectionError);
    EXPECT_THROW(static_cast<void>(build(makeDetection("Door", {1e308, 0, 1e308, 200}))), MalformedDetectionError);
}

TEST_F(GeometrySynthesizerTest, SynthesizeSkipsMalformedDetections) {
    const std::vector<Detection> detections = {makeDetection("Wall", {0, 0, 100, 300}), withoutBoundingBox("Door"),
                                               makeDetection("Window", {200, 0, 400, 20})};

    const SynthesisResult result = synthesizer.synthesize(detections, scale);

    ASSERT_EQ(result.objects.size(), 2u);
    EXPECT_EQ(result.objects[0].source_index, 0u);
    EXPECT_EQ(result.objects[1].source_index, 2u);
    ASSERT_EQ(result.skipped.size(), 1u);
    EXPECT_EQ(result.skipped[0].index, 1u);
    EXPECT_EQ(result.skipped[0].label, "Door");
    EXPECT_THAT(result.skipped[0].reason, HasSubstr("no bounding box"));
}

TEST_F(GeometrySynthesizerTest, ElevationGridSetsBaseline) {
    ElevationGrid raw(2, 2);
    raw << 0, 1,
            0, 1;
    const NormalizedGrid elevation = normalizeElevation(raw, 3.0);

    const SceneObject right = build(makeDetection("Wall", {400, 0, 600, 100}), &elevation);
    EXPECT_EQ(right.elevation_source, ElevationSource::DepthHint);
    EXPECT_NEAR(right.lowerExtent(), 3.0, 1e-12);
    EXPECT_NEAR(right.position.y(), 3.5, 1e-12);

    const SceneObject left = build(makeDetection("Wall", {0, 0, 200, 100}), &elevation);
    EXPECT_EQ(left.elevation_source, ElevationSource::DepthHint);
    EXPECT_NEAR(left.lowerExtent(), 0.0, 1e-12);
}

TEST_F(GeometrySynthesizerTest, FlatGridFallsBackToDefaultPlacement) {
    const NormalizedGrid flat = normalizeElevation(ElevationGrid::Constant(3, 3, 7.0), 3.0);
    const std::vector<Detection> detections = {makeDetection("Wall", {400, 0, 600, 100})};

    const SynthesisResult with_flat = synthesizer.synthesize(detections, scale, &flat);
    const SynthesisResult without = synthesizer.synthesize(detections, scale);

    ASSERT_EQ(with_flat.objects.size(), 1u);
    EXPECT_EQ(with_flat.objects[0].elevation_source, ElevationSource::Default);
    EXPECT_EQ(with_flat.objects[0].position, without.objects[0].position);
    EXPECT_EQ(with_flat.objects[0].size, without.objects[0].size);
}

TEST_F(GeometrySynthesizerTest, ParallelPathMatchesSequential) {
    std::vector<Detection> detections;
    for (int i = 0; i < 300; ++i) {
        const double x = (i * 37) % 600;
        const double y = (i * 53) % 440;
        const char *labels[] = {"Wall", "Door", "Window", "Column", "Railing", "Stair Case", "Sofa"};
        detections.push_back(makeDetection(labels[i % 7], {x, y, x + 5 + i % 40, y + 3 + i % 25}));
    }
    detections[17].bbox.reset();

    SynthesisConfig parallel_config;
    parallel_config.parallel_threshold = 1;
    SynthesisConfig sequential_config;
    sequential_config.parallel_threshold = detections.size() + 1;

    const SynthesisResult parallel = GeometrySynthesizer(parallel_config).synthesize(detections, scale);
    const SynthesisResult sequential = GeometrySynthesizer(sequential_config).synthesize(detections, scale);

    ASSERT_EQ(parallel.objects.size(), 299u);
    ASSERT_EQ(parallel.objects.size(), sequential.objects.size());
    for (std::size_t i = 0; i < parallel.objects.size(); ++i) {
        EXPECT_EQ(parallel.objects[i].source_index, sequential.objects[i].source_index);
        EXPECT_EQ(parallel.objects[i].position, sequential.objects[i].position);
        EXPECT_EQ(parallel.objects[i].size, sequential.objects[i].size);
    }
    ASSERT_EQ(parallel.skipped.size(), 1u);
    EXPECT_EQ(parallel.skipped[0].index, 17u);
}

TEST_F(GeometrySynthesizerTest, InvalidArgumentsThrow) {
    const std::vector<Detection> detections = {makeDetection("Wall", {0, 0, 100, 300})};

    EXPECT_THROW(static_cast<void>(synthesizer.synthesize(detections, ScaleContext{})), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(synthesizer.synthesize(detections, scale, nullptr, ImageSize{0, 0})),
                 std::invalid_argument);

    SynthesisConfig config;
    config.min_dimension_m = 0.0;
    EXPECT_THROW(GeometrySynthesizer{config}, std::invalid_argument);
}
