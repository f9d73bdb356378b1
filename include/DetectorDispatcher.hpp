#pragma once

#include "Detection.hpp"
#include "ImageProcessor.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace TerraScan {

struct DetectorOutput {
    std::vector<Detection> detections;
    double confidence = 0.0;        // run-level aggregate
};

class DetectorDispatcher {
public:
    using DetectorFn = std::vector<Detection> (*)(const cv::Mat& bgrImg,
                                                  const ImageProcessor::ProcessingParams& params);

    // Per-class pipelines: masks -> cleanup -> regions -> scoring
    static std::vector<Detection> detectDeforestation(const cv::Mat& bgrImg, const ImageProcessor::ProcessingParams& params);
    static std::vector<Detection> detectMining(const cv::Mat& bgrImg, const ImageProcessor::ProcessingParams& params);
    static std::vector<Detection> detectForestFire(const cv::Mat& bgrImg, const ImageProcessor::ProcessingParams& params);
    static std::vector<Detection> detectAgriculture(const cv::Mat& bgrImg, const ImageProcessor::ProcessingParams& params);
    static std::vector<Detection> detectUrbanExpansion(const cv::Mat& bgrImg, const ImageProcessor::ProcessingParams& params);
    static std::vector<Detection> detectWaterBodies(const cv::Mat& bgrImg, const ImageProcessor::ProcessingParams& params);

    // Throws UnsupportedClassError when no pipeline is registered for the class
    static DetectorFn detectorFor(FeatureClass featureClass);

    static DetectorOutput runClass(FeatureClass featureClass, const cv::Mat& bgrImg,
                                   const ImageProcessor::ProcessingParams& params);

    // All six pipelines, concatenated in class order
    static DetectorOutput runGeneral(const cv::Mat& bgrImg, const ImageProcessor::ProcessingParams& params);

    // "general" and unknown model types fall back to runGeneral
    static DetectorOutput dispatch(const std::string& modelType, const cv::Mat& bgrImg,
                                   const ImageProcessor::ProcessingParams& params);
};

} // namespace TerraScan
