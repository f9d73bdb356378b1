#pragma once

#include "Detection.hpp"
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace TerraScan {

class ImageProcessor {
public:
    struct ProcessingParams {
        // Run the six detectors of general mode concurrently
        bool parallelGeneral = true;

        // JPEG quality of the annotated result image (1-100)
        int jpegQuality = 95;

        // Logging and debug visualization
        bool verboseOutput = false;      // [INFO]/[WARN] lines on stderr
        bool enableDebugOutput = false;  // Write every intermediate mask
        std::string debugOutputPath = "./debug/";
    };

    static cv::Mat loadImage(const std::string& path, const ProcessingParams& params);

    // Throws InvalidInputError unless the raster is a non-empty 8-bit BGR image
    static void requireRaster(const cv::Mat& img);

    static cv::Mat convertToHSV(const cv::Mat& bgrImg);
    static cv::Mat convertToGrayscale(const cv::Mat& bgrImg);

    /**
     * Closing then opening with square structuring elements.
     * @param closeKernel side of the closing element, 0 skips closing
     * @param openKernel side of the opening element, 0 skips opening
     * @return a new mask, the input is left untouched
     */
    static cv::Mat morphologicalCleanup(const cv::Mat& mask, int closeKernel, int openKernel);

    /**
     * Outer contours of a binary mask with their box, filled pixel area and box center.
     * Contours whose bounding box cannot hold more than minArea pixels are skipped.
     */
    static std::vector<Region> extractRegions(const cv::Mat& mask, int minArea = 0);

    // Fraction of set pixels of mask inside box
    static double maskRatio(const cv::Mat& mask, const cv::Rect& box);

    static void saveDebugImage(const cv::Mat& image, const std::string& filename, const ProcessingParams& params);
};

} // namespace TerraScan
