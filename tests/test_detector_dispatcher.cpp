#include "DetectorDispatcher.hpp"
#include "SyntheticImages.hpp"
#include "TerraScanErrors.hpp"
#include <gtest/gtest.h>

using namespace TerraScan;
using namespace TerraScanTest;

namespace {

void expectSameDetections(const std::vector<Detection>& actual, const std::vector<Detection>& expected) {
    ASSERT_EQ(actual.size(), expected.size());
    for (size_t i = 0; i < actual.size(); ++i) {
        EXPECT_EQ(actual[i].featureClass, expected[i].featureClass) << "detection " << i;
        EXPECT_EQ(actual[i].box, expected[i].box) << "detection " << i;
        EXPECT_EQ(actual[i].area, expected[i].area) << "detection " << i;
        EXPECT_EQ(actual[i].center, expected[i].center) << "detection " << i;
        EXPECT_EQ(actual[i].severity, expected[i].severity) << "detection " << i;
        EXPECT_DOUBLE_EQ(actual[i].confidence, expected[i].confidence) << "detection " << i;
        EXPECT_EQ(actual[i].metrics, expected[i].metrics) << "detection " << i;
        EXPECT_EQ(actual[i].labels, expected[i].labels) << "detection " << i;
    }
}

// A frame with something for most detectors to find
cv::Mat compositeScene() {
    cv::Mat frame = solidImage(400, 300);
    paint(frame, cv::Rect(10, 20, 40, 50), kMixedSoilVegetation);
    paint(frame, cv::Rect(120, 20, 60, 60), kWaterBlue);
    paint(frame, cv::Rect(220, 20, 50, 50), kForestGreen);
    paint(frame, cv::Rect(300, 150, 60, 60), kFireRed);
    paintStripes(frame, cv::Rect(20, 150, 120, 100), 4, kDarkRock, kLightRock);
    return frame;
}

ImageProcessor::ProcessingParams sequentialParams() {
    ImageProcessor::ProcessingParams params;
    params.parallelGeneral = false;
    return params;
}

} // namespace

TEST(DetectorDispatcherTest, EveryClassHasADetector) {
    for (FeatureClass featureClass : kAllFeatureClasses) {
        EXPECT_NE(DetectorDispatcher::detectorFor(featureClass), nullptr) << featureClassName(featureClass);
    }
    EXPECT_THROW(DetectorDispatcher::detectorFor(FeatureClass::Count), UnsupportedClassError);
}

TEST(DetectorDispatcherTest, RejectsEmptyRaster) {
    ImageProcessor::ProcessingParams params;
    EXPECT_THROW(DetectorDispatcher::dispatch("deforestation", cv::Mat(), params), InvalidInputError);
    EXPECT_THROW(DetectorDispatcher::dispatch("general", cv::Mat(), params), InvalidInputError);
}

TEST(DetectorDispatcherTest, ClearedBlockWithVegetationScoresSixty) {
    cv::Mat frame = solidImage(200, 200);
    paint(frame, cv::Rect(10, 20, 40, 50), kMixedSoilVegetation);

    ImageProcessor::ProcessingParams params;
    DetectorOutput output = DetectorDispatcher::dispatch("deforestation", frame, params);

    ASSERT_EQ(output.detections.size(), 1u);
    const Detection& detection = output.detections[0];
    EXPECT_EQ(detection.featureClass, FeatureClass::Deforestation);
    EXPECT_EQ(detection.box, cv::Rect(10, 20, 40, 50));
    EXPECT_EQ(detection.area, 2000);
    EXPECT_EQ(detection.center, cv::Point(30, 45));
    EXPECT_DOUBLE_EQ(detection.confidence, 60.0);
    EXPECT_EQ(detection.severity, Severity::Low);
    EXPECT_DOUBLE_EQ(detection.metrics.at("vegetation_loss"), 0.0);
    EXPECT_DOUBLE_EQ(output.confidence, 60.0);
}

TEST(DetectorDispatcherTest, HalfVegetatedClearingIsMediumSeverity) {
    cv::Mat frame = solidImage(300, 300);
    paint(frame, cv::Rect(100, 100, 20, 50), kBrownSoil);
    paint(frame, cv::Rect(120, 100, 20, 50), kMixedSoilVegetation);

    ImageProcessor::ProcessingParams params;
    DetectorOutput output = DetectorDispatcher::dispatch("deforestation", frame, params);

    ASSERT_EQ(output.detections.size(), 1u);
    EXPECT_DOUBLE_EQ(output.detections[0].metrics.at("vegetation_loss"), 50.0);
    EXPECT_DOUBLE_EQ(output.detections[0].confidence, 80.0);
    EXPECT_EQ(output.detections[0].severity, Severity::Medium);
}

TEST(DetectorDispatcherTest, EmptyRunsReportClassFloor) {
    ImageProcessor::ProcessingParams params;

    DetectorOutput deforestation = DetectorDispatcher::dispatch("deforestation", solidImage(200, 200), params);
    EXPECT_TRUE(deforestation.detections.empty());
    EXPECT_DOUBLE_EQ(deforestation.confidence, 25.0);

    // Small enough that the dark frame stays under the burned-area gate
    DetectorOutput general = DetectorDispatcher::dispatch("general", solidImage(20, 20), params);
    EXPECT_TRUE(general.detections.empty());
    EXPECT_DOUBLE_EQ(general.confidence, 35.0);
}

TEST(DetectorDispatcherTest, LargeDarkFrameIsBurnedArea) {
    ImageProcessor::ProcessingParams params;
    DetectorOutput output = DetectorDispatcher::dispatch("forest_fire", solidImage(100, 100), params);

    ASSERT_EQ(output.detections.size(), 1u);
    const Detection& detection = output.detections[0];
    EXPECT_EQ(detection.labels.at("fire_type"), "burned_area");
    EXPECT_EQ(detection.severity, Severity::High);
    EXPECT_EQ(detection.area, 10000);
    EXPECT_DOUBLE_EQ(detection.confidence, 60.0);
    EXPECT_DOUBLE_EQ(detection.metrics.at("burned_ratio"), 1.0);
    EXPECT_DOUBLE_EQ(output.confidence, 60.0);
}

TEST(DetectorDispatcherTest, TerracedPitIsCriticalQuarry) {
    cv::Mat frame = solidImage(400, 300);
    paintStripes(frame, cv::Rect(50, 50, 300, 200), 4, kDarkRock, kLightRock);

    ImageProcessor::ProcessingParams params;
    DetectorOutput output = DetectorDispatcher::dispatch("mining", frame, params);

    ASSERT_EQ(output.detections.size(), 1u);
    const Detection& detection = output.detections[0];
    EXPECT_EQ(detection.featureClass, FeatureClass::Mining);
    EXPECT_EQ(detection.area, 60000);
    EXPECT_GT(detection.metrics.at("edge_density"), 0.15);
    EXPECT_DOUBLE_EQ(detection.confidence, 90.0);
    EXPECT_EQ(detection.severity, Severity::Critical);
    EXPECT_EQ(detection.labels.at("mining_type"), "quarry");
    EXPECT_DOUBLE_EQ(output.confidence, 60.0);
}

TEST(DetectorDispatcherTest, FixedScoreClasses) {
    ImageProcessor::ProcessingParams params;

    cv::Mat lake = solidImage(200, 200);
    paint(lake, cv::Rect(50, 50, 60, 60), kWaterBlue);
    DetectorOutput water = DetectorDispatcher::dispatch("water_body", lake, params);
    ASSERT_EQ(water.detections.size(), 1u);
    EXPECT_DOUBLE_EQ(water.detections[0].confidence, 75.0);
    EXPECT_EQ(water.detections[0].area, 3600);
    EXPECT_DOUBLE_EQ(water.confidence, 55.0);

    cv::Mat field = solidImage(200, 200);
    paint(field, cv::Rect(50, 50, 60, 60), kForestGreen);
    DetectorOutput crops = DetectorDispatcher::dispatch("agriculture", field, params);
    ASSERT_EQ(crops.detections.size(), 1u);
    EXPECT_DOUBLE_EQ(crops.detections[0].confidence, 60.0);
    EXPECT_EQ(crops.detections[0].severity, Severity::Low);
}

TEST(DetectorDispatcherTest, TexturedPatchIsUrbanExpansion) {
    cv::Mat frame = solidImage(200, 200);
    paintCheckerboard(frame, cv::Rect(50, 50, 60, 60), 60, 200);

    ImageProcessor::ProcessingParams params;
    DetectorOutput output = DetectorDispatcher::dispatch("urban_expansion", frame, params);

    ASSERT_EQ(output.detections.size(), 1u);
    EXPECT_GE(output.detections[0].area, 3600);
    EXPECT_DOUBLE_EQ(output.detections[0].confidence, 70.0);
    EXPECT_EQ(output.detections[0].severity, Severity::Medium);
}

TEST(DetectorDispatcherTest, AliasesResolveToTheirClass) {
    cv::Mat frame = compositeScene();
    ImageProcessor::ProcessingParams params;

    expectSameDetections(DetectorDispatcher::dispatch("urban", frame, params).detections,
                         DetectorDispatcher::runClass(FeatureClass::UrbanExpansion, frame, params).detections);
    expectSameDetections(DetectorDispatcher::dispatch("water", frame, params).detections,
                         DetectorDispatcher::runClass(FeatureClass::WaterBody, frame, params).detections);
}

TEST(DetectorDispatcherTest, UnknownModelTypeRunsGeneral) {
    cv::Mat frame = compositeScene();
    ImageProcessor::ProcessingParams params = sequentialParams();

    DetectorOutput unknown = DetectorDispatcher::dispatch("lava_flow", frame, params);
    DetectorOutput general = DetectorDispatcher::dispatch("general", frame, params);
    expectSameDetections(unknown.detections, general.detections);
    EXPECT_DOUBLE_EQ(unknown.confidence, general.confidence);
}

TEST(DetectorDispatcherTest, GeneralConcatenatesClassesInOrder) {
    cv::Mat frame = compositeScene();
    ImageProcessor::ProcessingParams params = sequentialParams();

    std::vector<Detection> expected;
    for (FeatureClass featureClass : kAllFeatureClasses) {
        DetectorOutput single = DetectorDispatcher::runClass(featureClass, frame, params);
        expected.insert(expected.end(), single.detections.begin(), single.detections.end());
    }
    ASSERT_FALSE(expected.empty());

    DetectorOutput sequential = DetectorDispatcher::runGeneral(frame, params);
    expectSameDetections(sequential.detections, expected);

    params.parallelGeneral = true;
    DetectorOutput parallel = DetectorDispatcher::runGeneral(frame, params);
    expectSameDetections(parallel.detections, expected);

    double expectedConfidence = std::min(90.0, expected.size() * 8.0 + 50.0);
    EXPECT_DOUBLE_EQ(parallel.confidence, expectedConfidence);
}

TEST(DetectorDispatcherTest, RepeatedRunsAreIdentical) {
    cv::Mat frame = compositeScene();
    ImageProcessor::ProcessingParams params;

    DetectorOutput first = DetectorDispatcher::dispatch("general", frame, params);
    DetectorOutput second = DetectorDispatcher::dispatch("general", frame, params);
    expectSameDetections(second.detections, first.detections);
    EXPECT_DOUBLE_EQ(second.confidence, first.confidence);
}

TEST(DetectorDispatcherTest, DebugMasksWrittenPerClass) {
    TempDir dir;
    ImageProcessor::ProcessingParams params;
    params.enableDebugOutput = true;
    params.debugOutputPath = (dir.path() / "debug").string();

    cv::Mat frame = solidImage(100, 100);
    paint(frame, cv::Rect(10, 10, 40, 40), kMixedSoilVegetation);
    DetectorDispatcher::dispatch("deforestation", frame, params);

    EXPECT_TRUE(std::filesystem::exists(dir.path() / "debug" / "deforestation_mask.png"));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "debug" / "deforestation_cleaned.png"));
}
