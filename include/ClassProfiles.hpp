#pragma once

#include "Detection.hpp"
#include <opencv2/core.hpp>
#include <cstddef>

namespace TerraScan {

// Saturating run-level confidence: min(cap, count * slope + base), or whenEmpty for no detections
struct AggregateConfidence {
    double slope;
    double base;
    double cap;
    double whenEmpty;

    double evaluate(std::size_t detectionCount) const;
};

// Per-class constants shared by the scorer, the dispatcher and the renderer
struct ClassProfile {
    FeatureClass featureClass;
    int minArea;                    // regions must be strictly larger
    int closeKernel;                // square closing element, 0 = skip
    int openKernel;                 // square opening element, 0 = skip
    AggregateConfidence aggregate;
    cv::Scalar renderColor;         // BGR
};

const ClassProfile& profileFor(FeatureClass featureClass);

// Aggregate used when all six detectors run together
const AggregateConfidence& generalAggregate();

} // namespace TerraScan
