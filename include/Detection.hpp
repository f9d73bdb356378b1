#pragma once

#include <opencv2/core.hpp>
#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace TerraScan {

enum class FeatureClass {
    Deforestation = 0,
    Mining,
    ForestFire,
    Agriculture,
    UrbanExpansion,
    WaterBody,
    Count
};

constexpr std::size_t kFeatureClassCount = static_cast<std::size_t>(FeatureClass::Count);

// Fixed order used by general mode and by the profile table
constexpr std::array<FeatureClass, kFeatureClassCount> kAllFeatureClasses = {
    FeatureClass::Deforestation,
    FeatureClass::Mining,
    FeatureClass::ForestFire,
    FeatureClass::Agriculture,
    FeatureClass::UrbanExpansion,
    FeatureClass::WaterBody
};

enum class Severity {
    Low = 0,
    Medium,
    High,
    Critical
};

const char* featureClassName(FeatureClass featureClass);
const char* severityName(Severity severity);

/**
 * Resolve a requested model type to a single feature class.
 * Accepts the six class names and the short aliases "urban" and "water".
 * @return false for "general" and for any unknown name
 */
bool parseFeatureClass(const std::string& name, FeatureClass& out);

// One connected component of a cleaned mask
struct Region {
    cv::Rect box;
    int area = 0;                   // pixels inside the outer contour
    cv::Point center;               // bounding-box center
};

struct Detection {
    FeatureClass featureClass = FeatureClass::Deforestation;
    double confidence = 0.0;        // 0..100, two decimals
    cv::Rect box;
    int area = 0;
    cv::Point center;
    Severity severity = Severity::Low;

    // Class-specific extras, already rounded for output
    std::map<std::string, double> metrics;
    std::map<std::string, std::string> labels;
};

struct ClassSummary {
    int count = 0;
    double averageConfidence = 0.0;
    long long totalArea = 0;
    std::array<int, 4> severityDistribution = {0, 0, 0, 0};
};

struct SegmentationResult {
    std::vector<Detection> detections;
    double confidence = 0.0;
    double processingTime = 0.0;    // seconds
    cv::Size imageSize;
    std::string modelUsed;
    std::string resultImagePath;

    std::map<std::string, ClassSummary> summary;
    std::string environmentalRisk = "Low";
};

// Round to a fixed number of decimals for serialized fields
double roundTo(double value, int decimals);

} // namespace TerraScan
