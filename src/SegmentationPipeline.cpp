#include "SegmentationPipeline.hpp"
#include "DetectorDispatcher.hpp"
#include "ResultRenderer.hpp"
#include "ResultSummary.hpp"
#include "TerraScanErrors.hpp"
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iostream>

using namespace cv;
using namespace std;

namespace TerraScan {

namespace {

// Model types end up in a file name; keep them to a safe character set
string fileSafe(const string& name) {
    string safe = name;
    for (char& c : safe) {
        if (!isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            c = '_';
        }
    }
    return safe;
}

} // namespace

void SegmentationPipeline::requireJpegEncoder() {
    if (!haveImageWriter(".jpg")) {
        throw InvalidInputError("JPEG encoder is not available in this OpenCV build");
    }
}

string SegmentationPipeline::resultImagePath(const string& outputDir, const string& modelType, time_t timestamp) {
    tm local{};
    localtime_r(&timestamp, &local);

    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);

    string filename = "segmentation_result_" + fileSafe(modelType) + "_" + stamp + ".jpg";
    return (filesystem::path(outputDir) / filename).string();
}

SegmentationResult SegmentationPipeline::run(const SegmentationRequest& request,
                                             const ImageProcessor::ProcessingParams& params) {
    if (request.imagePath.empty()) {
        throw InvalidInputError("imagePath is required");
    }
    if (request.outputDir.empty()) {
        throw InvalidInputError("outputDir is required");
    }
    string modelType = request.modelType.empty() ? "general" : request.modelType;

    requireJpegEncoder();

    auto startTime = chrono::steady_clock::now();

    Mat image = ImageProcessor::loadImage(request.imagePath, params);
    DetectorOutput output = DetectorDispatcher::dispatch(modelType, image, params);

    double processingTime = chrono::duration<double>(chrono::steady_clock::now() - startTime).count();

    if (params.verboseOutput) {
        cerr << "[INFO] Detection finished in " << processingTime * 1000.0 << " ms with "
             << output.detections.size() << " detections" << endl;
    }

    string outputPath = resultImagePath(request.outputDir, modelType, time(nullptr));
    ResultRenderer::writeResultImage(image, output.detections, outputPath, params);

    SegmentationResult result;
    result.summary = ResultSummary::summarize(output.detections);
    result.environmentalRisk = ResultSummary::environmentalRisk(output.detections);
    result.detections = std::move(output.detections);
    result.confidence = output.confidence;
    result.processingTime = processingTime;
    result.imageSize = image.size();
    result.modelUsed = "OpenCV_Enhanced_" + modelType;
    result.resultImagePath = outputPath;
    return result;
}

} // namespace TerraScan
