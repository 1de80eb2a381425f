// File: tests/io/detection_reader_test.cpp

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

#include "io/detection_reader.hpp"

using nlohmann::json;

TEST(DetectionReaderTest, ParsesBareArray) {
    const json document = json::parse(R"([
        {"label": "Wall", "bbox_xyxy": [0, 0, 100, 300], "image_size": [800, 600], "confidence": 0.93},
        {"label": "Door", "bbox_xyxy": [10.5, 50, 40, 250]}
    ])");

    const auto detections = io::parseDetections(document);

    ASSERT_EQ(detections.size(), 2u);
    EXPECT_EQ(detections[0].label, "Wall");
    ASSERT_TRUE(detections[0].bbox.has_value());
    EXPECT_EQ(*detections[0].bbox, (BoundingBox{0, 0, 100, 300}));
    EXPECT_EQ(detections[0].image_size, (ImageSize{800, 600}));
    EXPECT_DOUBLE_EQ(*detections[0].confidence, 0.93);
    EXPECT_DOUBLE_EQ(detections[1].bbox->x1, 10.5);
    EXPECT_FALSE(detections[1].image_size.has_value());
    EXPECT_FALSE(detections[1].confidence.has_value());
}

TEST(DetectionReaderTest, ParsesObjectWithSharedImageSize) {
    const json document = json::parse(R"({
        "image_size": [1024, 768],
        "detections": [
            {"label": "Wall", "bbox_xyxy": [0, 0, 100, 300]},
            {"label": "Window", "bbox_xyxy": [0, 0, 10, 10], "image_size": [640, 480]}
        ]
    })");

    const auto detections = io::parseDetections(document);

    ASSERT_EQ(detections.size(), 2u);
    EXPECT_EQ(detections[0].image_size, (ImageSize{1024, 768}));
    EXPECT_EQ(detections[1].image_size, (ImageSize{640, 480}));
}

TEST(DetectionReaderTest, ImageSizeMustBeWholePositivePixels) {
    const json document = json::parse(R"({
        "image_size": [1024, 768],
        "detections": [
            {"label": "Wall", "bbox_xyxy": [0, 0, 1, 1], "image_size": [1e10, 480]},
            {"label": "Wall", "bbox_xyxy": [0, 0, 1, 1], "image_size": [640.9, 480]},
            {"label": "Wall", "bbox_xyxy": [0, 0, 1, 1], "image_size": [-640, 480]},
            {"label": "Wall", "bbox_xyxy": [0, 0, 1, 1], "image_size": [640, "480"]},
            {"label": "Wall", "bbox_xyxy": [0, 0, 1, 1], "image_size": [640.0, 480]}
        ]
    })");

    const auto detections = io::parseDetections(document);

    ASSERT_EQ(detections.size(), 5u);
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(detections[i].image_size, (ImageSize{1024, 768})) << "detection " << i;
    }
    EXPECT_EQ(detections[4].image_size, (ImageSize{640, 480}));

    const auto standalone = io::parseDetections(json::parse(R"([
        {"label": "Wall", "bbox_xyxy": [0, 0, 1, 1], "image_size": [4294967296, 480]}
    ])"));
    ASSERT_EQ(standalone.size(), 1u);
    EXPECT_FALSE(standalone[0].image_size.has_value());
}

TEST(DetectionReaderTest, MalformedBoundingBoxesAreKeptWithoutBox) {
    const json document = json::parse(R"([
        {"label": "Door"},
        {"label": "Door", "bbox_xyxy": null},
        {"label": "Door", "bbox_xyxy": [1, 2, 3]},
        {"label": "Door", "bbox_xyxy": [1, "2", 3, 4]}
    ])");

    const auto detections = io::parseDetections(document);

    ASSERT_EQ(detections.size(), 4u);
    for (const auto &detection: detections) {
        EXPECT_EQ(detection.label, "Door");
        EXPECT_FALSE(detection.bbox.has_value());
    }
}

TEST(DetectionReaderTest, MissingLabelIsEmpty) {
    const auto detections = io::parseDetections(json::parse(R"([{"bbox_xyxy": [0, 0, 1, 1]}])"));

    ASSERT_EQ(detections.size(), 1u);
    EXPECT_TRUE(detections[0].label.empty());
    EXPECT_TRUE(detections[0].bbox.has_value());
}

TEST(DetectionReaderTest, RejectsWrongShapes) {
    EXPECT_THROW(static_cast<void>(io::parseDetections(json::parse("42"))), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(io::parseDetections(json::parse(R"({"items": []})"))), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(io::parseDetections(json::parse(R"([1, 2])"))), std::invalid_argument);
}

TEST(DetectionReaderTest, ReadsFile) {
    const auto path = std::filesystem::temp_directory_path() / "blueprint3d_detections_test.json";
    {
        std::ofstream file(path);
        file << R"([{"label": "Wall", "bbox_xyxy": [0, 0, 100, 300]}])";
    }

    const auto detections = io::readDetections(path.string());
    std::filesystem::remove(path);

    ASSERT_EQ(detections.size(), 1u);
    EXPECT_EQ(detections[0].label, "Wall");
}

TEST(DetectionReaderTest, FileErrors) {
    EXPECT_THROW(static_cast<void>(io::readDetections("/nonexistent/detections.json")), std::runtime_error);

    const auto path = std::filesystem::temp_directory_path() / "blueprint3d_detections_broken.json";
    {
        std::ofstream file(path);
        file << "[{\"label\": ";
    }
    EXPECT_THROW(static_cast<void>(io::readDetections(path.string())), std::runtime_error);
    std::filesystem::remove(path);
}
