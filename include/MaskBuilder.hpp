#pragma once

#include <opencv2/opencv.hpp>

namespace TerraScan {

// Inclusive HSV range on OpenCV's 8-bit scale (H 0-180, S/V 0-255)
struct HsvBand {
    cv::Scalar lower;
    cv::Scalar upper;
};

struct DeforestationMasks {
    cv::Mat vegetation;
    cv::Mat cleared;        // bare soil and cleared land
};

struct MiningMasks {
    cv::Mat rock;
    cv::Mat metal;
    cv::Mat disturbed;
    cv::Mat combined;
    cv::Mat edges;          // Canny response of the grayscale frame
};

struct FireMasks {
    cv::Mat activeFire;     // red hues and flame
    cv::Mat smoke;
    cv::Mat burned;
    cv::Mat combined;
};

class MaskBuilder {
public:
    static cv::Mat bandMask(const cv::Mat& hsv, const HsvBand& band);
    static cv::Mat unionOf(const cv::Mat& a, const cv::Mat& b);

    // All builders take the BGR raster and throw InvalidInputError when it is empty
    static DeforestationMasks buildDeforestationMasks(const cv::Mat& bgrImg);
    static MiningMasks buildMiningMasks(const cv::Mat& bgrImg);
    static FireMasks buildFireMasks(const cv::Mat& bgrImg);
    static cv::Mat buildCropMask(const cv::Mat& bgrImg);
    static cv::Mat buildWaterMask(const cv::Mat& bgrImg);

    // |Laplacian| of the grayscale frame saturated to 8 bit and thresholded
    static cv::Mat buildTextureMask(const cv::Mat& bgrImg);
};

} // namespace TerraScan
