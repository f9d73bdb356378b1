#pragma once

#include "Detection.hpp"
#include "ImageProcessor.hpp"
#include <ctime>
#include <string>

namespace TerraScan {

struct SegmentationRequest {
    std::string imagePath;
    std::string outputDir;
    std::string modelType = "general";
};

class SegmentationPipeline {
public:
    /**
     * Load, detect, render and summarize one image.
     * Processing time covers loading and detection; rendering is excluded.
     * Throws InvalidInputError, ImageLoadError, UnsupportedClassError or OutputWriteError.
     */
    static SegmentationResult run(const SegmentationRequest& request,
                                  const ImageProcessor::ProcessingParams& params);

    // <outputDir>/segmentation_result_<modelType>_<YYYYMMDD_HHMMSS>.jpg in local time
    static std::string resultImagePath(const std::string& outputDir, const std::string& modelType,
                                       std::time_t timestamp);

    // Throws InvalidInputError when the OpenCV build cannot encode JPEG
    static void requireJpegEncoder();
};

} // namespace TerraScan
