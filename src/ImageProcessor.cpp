#include "ImageProcessor.hpp"
#include "TerraScanErrors.hpp"
#include <climits>
#include <filesystem>
#include <iostream>
#include <system_error>

using namespace cv;
using namespace std;

namespace TerraScan {

Mat ImageProcessor::loadImage(const string& path, const ProcessingParams& params) {
    if (path.empty()) {
        throw InvalidInputError("Image path cannot be empty");
    }

    if (params.verboseOutput) {
        cerr << "[INFO] Loading image from: " << path << endl;
    }

    Mat img;
    try {
        img = imread(path, IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw ImageLoadError("Failed to load image: " + path + " (" + e.what() + ")");
    }

    if (img.empty()) {
        throw ImageLoadError("Could not load image from " + path);
    }

    if (params.verboseOutput) {
        cerr << "[INFO] Image loaded successfully. Shape: " << img.rows << " x " << img.cols << endl;
    }
    return img;
}

void ImageProcessor::requireRaster(const Mat& img) {
    if (img.empty() || img.rows == 0 || img.cols == 0) {
        throw InvalidInputError("Raster is empty");
    }
    if (img.type() != CV_8UC3) {
        throw InvalidInputError("Raster must be an 8-bit 3-channel BGR image");
    }
}

Mat ImageProcessor::convertToHSV(const Mat& bgrImg) {
    requireRaster(bgrImg);
    Mat hsv;
    cvtColor(bgrImg, hsv, COLOR_BGR2HSV);
    return hsv;
}

Mat ImageProcessor::convertToGrayscale(const Mat& bgrImg) {
    requireRaster(bgrImg);
    Mat gray;
    cvtColor(bgrImg, gray, COLOR_BGR2GRAY);
    return gray;
}

Mat ImageProcessor::morphologicalCleanup(const Mat& mask, int closeKernel, int openKernel) {
    Mat cleaned = mask.clone();
    if (cleaned.empty()) {
        return cleaned;
    }

    // Close first to bridge gaps between fragments
    if (closeKernel > 0) {
        Mat kernel = getStructuringElement(MORPH_RECT, Size(closeKernel, closeKernel));
        morphologyEx(cleaned, cleaned, MORPH_CLOSE, kernel);
    }

    // Then open to drop isolated speckle
    if (openKernel > 0) {
        Mat kernel = getStructuringElement(MORPH_RECT, Size(openKernel, openKernel));
        morphologyEx(cleaned, cleaned, MORPH_OPEN, kernel);
    }

    return cleaned;
}

vector<Region> ImageProcessor::extractRegions(const Mat& mask, int minArea) {
    vector<Region> regions;
    if (mask.empty() || countNonZero(mask) == 0) {
        return regions;
    }

    vector<vector<Point>> contours;
    findContours(mask, contours, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);

    for (const auto& contour : contours) {
        Rect box = boundingRect(contour);
        if (box.area() <= minArea) continue;

        // Fill the outer contour in box coordinates; holes count towards the area
        Mat filled = Mat::zeros(box.size(), CV_8UC1);
        vector<vector<Point>> single{contour};
        drawContours(filled, single, 0, Scalar(255), FILLED, LINE_8, noArray(), INT_MAX, -box.tl());

        Region region;
        region.box = box;
        region.area = countNonZero(filled);
        region.center = Point(box.x + box.width / 2, box.y + box.height / 2);
        regions.push_back(std::move(region));
    }

    return regions;
}

double ImageProcessor::maskRatio(const Mat& mask, const Rect& box) {
    Rect clipped = box & Rect(0, 0, mask.cols, mask.rows);
    if (box.area() <= 0 || clipped.area() <= 0) {
        return 0.0;
    }
    return static_cast<double>(countNonZero(mask(clipped))) / static_cast<double>(box.area());
}

void ImageProcessor::saveDebugImage(const Mat& image, const string& filename, const ProcessingParams& params) {
    if (!params.enableDebugOutput) return;

    std::error_code ec;
    std::filesystem::create_directories(params.debugOutputPath, ec);
    if (ec) {
        cerr << "[WARN] Could not create debug directory " << params.debugOutputPath << ": " << ec.message() << endl;
        return;
    }

    string fullPath = (std::filesystem::path(params.debugOutputPath) / filename).string();
    bool success = false;
    try {
        success = imwrite(fullPath, image);
    } catch (const cv::Exception& e) {
        cerr << "[WARN] " << e.what() << endl;
    }

    if (success) {
        if (params.verboseOutput) {
            cerr << "[DEBUG] Saved debug image: " << fullPath << endl;
        }
    } else {
        cerr << "[WARN] Failed to save debug image: " << fullPath << endl;
    }
}

} // namespace TerraScan
