#include "ResultRenderer.hpp"
#include "ClassProfiles.hpp"
#include "TerraScanErrors.hpp"
#include <cstdio>
#include <iostream>

using namespace cv;
using namespace std;

namespace TerraScan {

int ResultRenderer::thicknessFor(Severity severity) {
    switch (severity) {
        case Severity::Critical: return 4;
        case Severity::High: return 3;
        default: return 2;
    }
}

string ResultRenderer::labelFor(const Detection& detection) {
    char confidence[32];
    snprintf(confidence, sizeof(confidence), "%.1f", detection.confidence);
    return string(featureClassName(detection.featureClass)) + ": " + confidence + "%";
}

Mat ResultRenderer::renderDetections(const Mat& bgrImg, const vector<Detection>& detections) {
    ImageProcessor::requireRaster(bgrImg);
    Mat annotated = bgrImg.clone();

    for (const Detection& detection : detections) {
        const Scalar& color = profileFor(detection.featureClass).renderColor;
        const Rect& box = detection.box;

        rectangle(annotated, Point(box.x, box.y), Point(box.x + box.width, box.y + box.height),
                  color, thicknessFor(detection.severity));
        putText(annotated, labelFor(detection), Point(box.x, box.y - 10),
                FONT_HERSHEY_SIMPLEX, 0.6, color, 2);
    }

    return annotated;
}

void ResultRenderer::writeResultImage(const Mat& bgrImg, const vector<Detection>& detections,
                                      const string& outputPath,
                                      const ImageProcessor::ProcessingParams& params) {
    if (outputPath.empty()) {
        throw OutputWriteError("Result image path cannot be empty");
    }

    Mat annotated = renderDetections(bgrImg, detections);

    if (params.verboseOutput) {
        cerr << "[INFO] Writing " << detections.size() << " detections to: " << outputPath << endl;
    }

    bool success = false;
    try {
        success = imwrite(outputPath, annotated, {IMWRITE_JPEG_QUALITY, params.jpegQuality});
    } catch (const cv::Exception& e) {
        throw OutputWriteError("Failed to write result image " + outputPath + ": " + e.what());
    }

    if (!success) {
        throw OutputWriteError("Failed to write result image " + outputPath);
    }
}

} // namespace TerraScan
