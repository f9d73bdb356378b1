#pragma once

#include "Detection.hpp"
#include "ImageProcessor.hpp"
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace TerraScan {

class ResultRenderer {
public:
    // Box outline width: critical 4, high 3, otherwise 2
    static int thicknessFor(Severity severity);

    // "<class>: <confidence>%" with one decimal
    static std::string labelFor(const Detection& detection);

    // Draws every detection on a copy of the raster
    static cv::Mat renderDetections(const cv::Mat& bgrImg, const std::vector<Detection>& detections);

    // Renders and writes the annotated image, throws OutputWriteError on failure
    static void writeResultImage(const cv::Mat& bgrImg, const std::vector<Detection>& detections,
                                 const std::string& outputPath,
                                 const ImageProcessor::ProcessingParams& params);
};

} // namespace TerraScan
