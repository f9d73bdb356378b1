#pragma once

#include "Detection.hpp"
#include "MaskBuilder.hpp"
#include <opencv2/core.hpp>

namespace TerraScan {

/**
 * Turns one extracted region into a scored Detection, or rejects it.
 *
 * The formula helpers are pure functions of the measured ratios so they can be
 * checked in isolation. The score* entry points measure the ratios over the
 * region's bounding box, apply the class area gate, and return false when the
 * region is discarded (too small or below the class confidence floor).
 */
class FeatureScorer {
public:
    struct FireAssessment {
        double confidence;
        const char* fireType;
    };

    // coverage and vegetationLoss are percentages (0-100)
    static double deforestationConfidence(double coverage, double vegetationLoss);
    static Severity deforestationSeverity(int area, double vegetationLoss);

    static double miningConfidence(double aspectRatio, double extent, double edgeDensity);
    static Severity miningSeverity(int area, double edgeDensity);
    static const char* miningType(double extent, double edgeDensity);

    // Ratios are fractions (0-1)
    static FireAssessment fireAssessment(double activeFireRatio, double smokeRatio, double burnedRatio);
    static Severity fireSeverity(int area, double activeFireRatio, double smokeRatio, double burnedRatio);

    static bool scoreDeforestation(const Region& region, const cv::Mat& cleanedMask,
                                   const DeforestationMasks& masks, Detection& out);
    static bool scoreMining(const Region& region, const MiningMasks& masks, Detection& out);
    static bool scoreForestFire(const Region& region, const FireMasks& masks, Detection& out);

    // Agriculture, urban expansion and water bodies carry fixed confidence and severity
    static bool scoreFixed(FeatureClass featureClass, const Region& region, Detection& out);

    static bool passesAreaGate(FeatureClass featureClass, const Region& region);
};

} // namespace TerraScan
