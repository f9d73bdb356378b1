#include "MaskBuilder.hpp"
#include "ImageProcessor.hpp"

using namespace cv;

namespace TerraScan {

namespace {

// Deforestation
const HsvBand kVegetationGreen   = { Scalar(35, 40, 40),   Scalar(85, 255, 255) };
const HsvBand kVegetationYellow  = { Scalar(25, 30, 30),   Scalar(45, 255, 255) };
const HsvBand kBareSoil          = { Scalar(8, 50, 20),    Scalar(25, 255, 200) };
const HsvBand kClearedLand       = { Scalar(15, 30, 100),  Scalar(30, 150, 255) };

// Mining
const HsvBand kExposedRock       = { Scalar(0, 0, 80),     Scalar(30, 80, 255) };
const HsvBand kMetal             = { Scalar(0, 0, 150),    Scalar(180, 50, 255) };
const HsvBand kDisturbedEarth    = { Scalar(5, 100, 50),   Scalar(20, 255, 200) };

// Forest fire
const HsvBand kFireLowRed        = { Scalar(0, 100, 100),  Scalar(10, 255, 255) };
const HsvBand kFireHighRed       = { Scalar(170, 100, 100), Scalar(180, 255, 255) };
const HsvBand kFlame             = { Scalar(15, 150, 150), Scalar(35, 255, 255) };
const HsvBand kSmoke             = { Scalar(0, 0, 100),    Scalar(180, 30, 200) };
const HsvBand kBurned            = { Scalar(0, 0, 0),      Scalar(180, 255, 80) };

const HsvBand kCropGreen         = { Scalar(25, 30, 30),   Scalar(95, 255, 255) };
const HsvBand kWaterBlue         = { Scalar(100, 50, 50),  Scalar(130, 255, 255) };

const double kCannyLower = 50.0;
const double kCannyUpper = 150.0;
const double kTextureThreshold = 30.0;

} // namespace

Mat MaskBuilder::bandMask(const Mat& hsv, const HsvBand& band) {
    Mat mask;
    inRange(hsv, band.lower, band.upper, mask);
    return mask;
}

Mat MaskBuilder::unionOf(const Mat& a, const Mat& b) {
    Mat combined;
    bitwise_or(a, b, combined);
    return combined;
}

DeforestationMasks MaskBuilder::buildDeforestationMasks(const Mat& bgrImg) {
    Mat hsv = ImageProcessor::convertToHSV(bgrImg);

    DeforestationMasks masks;
    masks.vegetation = unionOf(bandMask(hsv, kVegetationGreen), bandMask(hsv, kVegetationYellow));
    masks.cleared = unionOf(bandMask(hsv, kBareSoil), bandMask(hsv, kClearedLand));
    return masks;
}

MiningMasks MaskBuilder::buildMiningMasks(const Mat& bgrImg) {
    Mat hsv = ImageProcessor::convertToHSV(bgrImg);
    Mat gray = ImageProcessor::convertToGrayscale(bgrImg);

    MiningMasks masks;
    masks.rock = bandMask(hsv, kExposedRock);
    masks.metal = bandMask(hsv, kMetal);
    masks.disturbed = bandMask(hsv, kDisturbedEarth);
    masks.combined = unionOf(unionOf(masks.rock, masks.metal), masks.disturbed);

    // Pits and terraces show up as dense straight edges
    Canny(gray, masks.edges, kCannyLower, kCannyUpper);
    return masks;
}

FireMasks MaskBuilder::buildFireMasks(const Mat& bgrImg) {
    Mat hsv = ImageProcessor::convertToHSV(bgrImg);

    FireMasks masks;
    Mat redFire = unionOf(bandMask(hsv, kFireLowRed), bandMask(hsv, kFireHighRed));
    masks.activeFire = unionOf(redFire, bandMask(hsv, kFlame));
    masks.smoke = bandMask(hsv, kSmoke);
    masks.burned = bandMask(hsv, kBurned);
    masks.combined = unionOf(unionOf(masks.activeFire, masks.smoke), masks.burned);
    return masks;
}

Mat MaskBuilder::buildCropMask(const Mat& bgrImg) {
    return bandMask(ImageProcessor::convertToHSV(bgrImg), kCropGreen);
}

Mat MaskBuilder::buildWaterMask(const Mat& bgrImg) {
    return bandMask(ImageProcessor::convertToHSV(bgrImg), kWaterBlue);
}

Mat MaskBuilder::buildTextureMask(const Mat& bgrImg) {
    Mat gray = ImageProcessor::convertToGrayscale(bgrImg);

    Mat laplacian;
    Laplacian(gray, laplacian, CV_64F);

    Mat response;
    convertScaleAbs(laplacian, response);

    Mat mask;
    threshold(response, mask, kTextureThreshold, 255, THRESH_BINARY);
    return mask;
}

} // namespace TerraScan
