#include "FeatureScorer.hpp"
#include "ClassProfiles.hpp"
#include "ImageProcessor.hpp"
#include "TerraScanErrors.hpp"
#include <algorithm>

using namespace cv;
using namespace std;

namespace TerraScan {

namespace {

const double kDeforestationFloor = 35.0;
const double kMiningFloor = 60.0;
const double kFireFloor = 50.0;
const double kConfidenceCap = 95.0;

Detection makeDetection(FeatureClass featureClass, const Region& region, double confidence, Severity severity) {
    Detection detection;
    detection.featureClass = featureClass;
    detection.confidence = roundTo(confidence, 2);
    detection.box = region.box;
    detection.area = region.area;
    detection.center = region.center;
    detection.severity = severity;
    return detection;
}

} // namespace

double FeatureScorer::deforestationConfidence(double coverage, double vegetationLoss) {
    double confidence = coverage * 0.4 + vegetationLoss * 0.4 + 20.0;
    return min(kConfidenceCap, max(30.0, confidence));
}

Severity FeatureScorer::deforestationSeverity(int area, double vegetationLoss) {
    if (area > 10000 && vegetationLoss > 70.0) return Severity::Critical;
    if (area > 5000 && vegetationLoss > 50.0) return Severity::High;
    if (vegetationLoss > 30.0) return Severity::Medium;
    return Severity::Low;
}

double FeatureScorer::miningConfidence(double aspectRatio, double extent, double edgeDensity) {
    double confidence = 50.0;
    if (aspectRatio > 0.3 && aspectRatio < 3.0) confidence += 15.0;   // pits are roughly compact
    if (extent > 0.5) confidence += 10.0;
    if (edgeDensity > 0.1) confidence += 15.0;
    return min(kConfidenceCap, confidence);
}

Severity FeatureScorer::miningSeverity(int area, double edgeDensity) {
    if (area > 50000 && edgeDensity > 0.15) return Severity::Critical;
    if (area > 20000) return Severity::High;
    if (area > 10000) return Severity::Medium;
    return Severity::Low;
}

const char* FeatureScorer::miningType(double extent, double edgeDensity) {
    if (edgeDensity > 0.15) return "quarry";
    if (extent > 0.5) return "surface";
    return "unknown";
}

FeatureScorer::FireAssessment FeatureScorer::fireAssessment(double activeFireRatio, double smokeRatio, double burnedRatio) {
    FireAssessment assessment = { 40.0, "fire_risk" };

    // First matching indicator wins
    if (activeFireRatio > 0.1) {
        assessment.confidence += 30.0;
        assessment.fireType = "active_fire";
    } else if (smokeRatio > 0.3) {
        assessment.confidence += 25.0;
        assessment.fireType = "smoke";
    } else if (burnedRatio > 0.5) {
        assessment.confidence += 20.0;
        assessment.fireType = "burned_area";
    }

    assessment.confidence = min(kConfidenceCap, assessment.confidence);
    return assessment;
}

Severity FeatureScorer::fireSeverity(int area, double activeFireRatio, double smokeRatio, double burnedRatio) {
    double indicators = activeFireRatio + smokeRatio + burnedRatio * 0.5;
    if (indicators > 0.7 || area > 20000) return Severity::Critical;
    if (indicators > 0.4 || area > 10000) return Severity::High;
    if (indicators > 0.2) return Severity::Medium;
    return Severity::Low;
}

bool FeatureScorer::passesAreaGate(FeatureClass featureClass, const Region& region) {
    return region.area > profileFor(featureClass).minArea;
}

bool FeatureScorer::scoreDeforestation(const Region& region, const Mat& cleanedMask,
                                       const DeforestationMasks& masks, Detection& out) {
    if (!passesAreaGate(FeatureClass::Deforestation, region)) return false;

    double coverage = ImageProcessor::maskRatio(cleanedMask, region.box) * 100.0;
    double vegetationLoss = 100.0 - ImageProcessor::maskRatio(masks.vegetation, region.box) * 100.0;

    double confidence = deforestationConfidence(coverage, vegetationLoss);
    if (confidence <= kDeforestationFloor) return false;

    out = makeDetection(FeatureClass::Deforestation, region, confidence,
                        deforestationSeverity(region.area, vegetationLoss));
    out.metrics["vegetation_loss"] = roundTo(vegetationLoss, 2);
    return true;
}

bool FeatureScorer::scoreMining(const Region& region, const MiningMasks& masks, Detection& out) {
    if (!passesAreaGate(FeatureClass::Mining, region)) return false;

    const Rect& box = region.box;
    double aspectRatio = static_cast<double>(box.width) / static_cast<double>(box.height);
    double extent = static_cast<double>(region.area) / static_cast<double>(box.area());
    double edgeDensity = ImageProcessor::maskRatio(masks.edges, box);

    double confidence = miningConfidence(aspectRatio, extent, edgeDensity);
    if (confidence <= kMiningFloor) return false;

    out = makeDetection(FeatureClass::Mining, region, confidence, miningSeverity(region.area, edgeDensity));
    out.metrics["aspect_ratio"] = roundTo(aspectRatio, 2);
    out.metrics["edge_density"] = roundTo(edgeDensity, 3);
    out.labels["mining_type"] = miningType(extent, edgeDensity);
    return true;
}

bool FeatureScorer::scoreForestFire(const Region& region, const FireMasks& masks, Detection& out) {
    if (!passesAreaGate(FeatureClass::ForestFire, region)) return false;

    double activeFireRatio = ImageProcessor::maskRatio(masks.activeFire, region.box);
    double smokeRatio = ImageProcessor::maskRatio(masks.smoke, region.box);
    double burnedRatio = ImageProcessor::maskRatio(masks.burned, region.box);

    FireAssessment assessment = fireAssessment(activeFireRatio, smokeRatio, burnedRatio);
    if (assessment.confidence <= kFireFloor) return false;

    out = makeDetection(FeatureClass::ForestFire, region, assessment.confidence,
                        fireSeverity(region.area, activeFireRatio, smokeRatio, burnedRatio));
    out.labels["fire_type"] = assessment.fireType;
    out.metrics["active_fire_ratio"] = roundTo(activeFireRatio, 3);
    out.metrics["smoke_ratio"] = roundTo(smokeRatio, 3);
    out.metrics["burned_ratio"] = roundTo(burnedRatio, 3);
    return true;
}

bool FeatureScorer::scoreFixed(FeatureClass featureClass, const Region& region, Detection& out) {
    double confidence = 0.0;
    Severity severity = Severity::Low;

    switch (featureClass) {
        case FeatureClass::Agriculture:
            confidence = 60.0;
            severity = Severity::Low;
            break;
        case FeatureClass::UrbanExpansion:
            confidence = 70.0;
            severity = Severity::Medium;
            break;
        case FeatureClass::WaterBody:
            confidence = 75.0;
            severity = Severity::Low;
            break;
        default:
            throw UnsupportedClassError(string("No fixed score for ") + featureClassName(featureClass));
    }

    if (!passesAreaGate(featureClass, region)) return false;

    out = makeDetection(featureClass, region, confidence, severity);
    return true;
}

} // namespace TerraScan
