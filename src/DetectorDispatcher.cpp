#include "DetectorDispatcher.hpp"
#include "ClassProfiles.hpp"
#include "FeatureScorer.hpp"
#include "MaskBuilder.hpp"
#include "TerraScanErrors.hpp"
#include <exception>
#include <iostream>

using namespace cv;
using namespace std;

namespace TerraScan {

namespace {

const DetectorDispatcher::DetectorFn kDetectors[] = {
    &DetectorDispatcher::detectDeforestation,
    &DetectorDispatcher::detectMining,
    &DetectorDispatcher::detectForestFire,
    &DetectorDispatcher::detectAgriculture,
    &DetectorDispatcher::detectUrbanExpansion,
    &DetectorDispatcher::detectWaterBodies,
};

static_assert(sizeof(kDetectors) / sizeof(kDetectors[0]) == kFeatureClassCount,
              "every feature class needs exactly one detector");

// Clean the class mask with the profile's kernels and pull out candidate regions
vector<Region> cleanAndExtract(FeatureClass featureClass, const Mat& mask, Mat& cleaned,
                               const ImageProcessor::ProcessingParams& params) {
    const ClassProfile& profile = profileFor(featureClass);
    string name = featureClassName(featureClass);

    ImageProcessor::saveDebugImage(mask, name + "_mask.png", params);
    cleaned = ImageProcessor::morphologicalCleanup(mask, profile.closeKernel, profile.openKernel);
    ImageProcessor::saveDebugImage(cleaned, name + "_cleaned.png", params);

    return ImageProcessor::extractRegions(cleaned, profile.minArea);
}

void logDetections(FeatureClass featureClass, size_t regionCount, size_t detectionCount,
                   const ImageProcessor::ProcessingParams& params) {
    if (!params.verboseOutput) return;
    cerr << "[INFO] " << featureClassName(featureClass) << ": " << regionCount
         << " candidate regions, " << detectionCount << " detections" << endl;
}

vector<Detection> detectFixed(FeatureClass featureClass, const Mat& mask,
                              const ImageProcessor::ProcessingParams& params) {
    Mat cleaned;
    vector<Region> regions = cleanAndExtract(featureClass, mask, cleaned, params);

    vector<Detection> detections;
    for (const Region& region : regions) {
        Detection detection;
        if (FeatureScorer::scoreFixed(featureClass, region, detection)) {
            detections.push_back(std::move(detection));
        }
    }

    logDetections(featureClass, regions.size(), detections.size(), params);
    return detections;
}

} // namespace

vector<Detection> DetectorDispatcher::detectDeforestation(const Mat& bgrImg, const ImageProcessor::ProcessingParams& params) {
    DeforestationMasks masks = MaskBuilder::buildDeforestationMasks(bgrImg);
    ImageProcessor::saveDebugImage(masks.vegetation, "deforestation_vegetation.png", params);

    Mat cleaned;
    vector<Region> regions = cleanAndExtract(FeatureClass::Deforestation, masks.cleared, cleaned, params);

    vector<Detection> detections;
    for (const Region& region : regions) {
        Detection detection;
        if (FeatureScorer::scoreDeforestation(region, cleaned, masks, detection)) {
            detections.push_back(std::move(detection));
        }
    }

    logDetections(FeatureClass::Deforestation, regions.size(), detections.size(), params);
    return detections;
}

vector<Detection> DetectorDispatcher::detectMining(const Mat& bgrImg, const ImageProcessor::ProcessingParams& params) {
    MiningMasks masks = MaskBuilder::buildMiningMasks(bgrImg);
    ImageProcessor::saveDebugImage(masks.edges, "mining_edges.png", params);

    Mat cleaned;
    vector<Region> regions = cleanAndExtract(FeatureClass::Mining, masks.combined, cleaned, params);

    vector<Detection> detections;
    for (const Region& region : regions) {
        Detection detection;
        if (FeatureScorer::scoreMining(region, masks, detection)) {
            detections.push_back(std::move(detection));
        }
    }

    logDetections(FeatureClass::Mining, regions.size(), detections.size(), params);
    return detections;
}

vector<Detection> DetectorDispatcher::detectForestFire(const Mat& bgrImg, const ImageProcessor::ProcessingParams& params) {
    FireMasks masks = MaskBuilder::buildFireMasks(bgrImg);
    ImageProcessor::saveDebugImage(masks.activeFire, "forest_fire_active.png", params);
    ImageProcessor::saveDebugImage(masks.smoke, "forest_fire_smoke.png", params);
    ImageProcessor::saveDebugImage(masks.burned, "forest_fire_burned.png", params);

    Mat cleaned;
    vector<Region> regions = cleanAndExtract(FeatureClass::ForestFire, masks.combined, cleaned, params);

    vector<Detection> detections;
    for (const Region& region : regions) {
        Detection detection;
        if (FeatureScorer::scoreForestFire(region, masks, detection)) {
            detections.push_back(std::move(detection));
        }
    }

    logDetections(FeatureClass::ForestFire, regions.size(), detections.size(), params);
    return detections;
}

vector<Detection> DetectorDispatcher::detectAgriculture(const Mat& bgrImg, const ImageProcessor::ProcessingParams& params) {
    return detectFixed(FeatureClass::Agriculture, MaskBuilder::buildCropMask(bgrImg), params);
}

vector<Detection> DetectorDispatcher::detectUrbanExpansion(const Mat& bgrImg, const ImageProcessor::ProcessingParams& params) {
    return detectFixed(FeatureClass::UrbanExpansion, MaskBuilder::buildTextureMask(bgrImg), params);
}

vector<Detection> DetectorDispatcher::detectWaterBodies(const Mat& bgrImg, const ImageProcessor::ProcessingParams& params) {
    return detectFixed(FeatureClass::WaterBody, MaskBuilder::buildWaterMask(bgrImg), params);
}

DetectorDispatcher::DetectorFn DetectorDispatcher::detectorFor(FeatureClass featureClass) {
    size_t index = static_cast<size_t>(featureClass);
    if (index >= kFeatureClassCount || kDetectors[index] == nullptr) {
        throw UnsupportedClassError(string("No detector registered for ") + featureClassName(featureClass));
    }
    return kDetectors[index];
}

DetectorOutput DetectorDispatcher::runClass(FeatureClass featureClass, const Mat& bgrImg,
                                            const ImageProcessor::ProcessingParams& params) {
    ImageProcessor::requireRaster(bgrImg);

    DetectorOutput output;
    output.detections = detectorFor(featureClass)(bgrImg, params);
    output.confidence = profileFor(featureClass).aggregate.evaluate(output.detections.size());
    return output;
}

DetectorOutput DetectorDispatcher::runGeneral(const Mat& bgrImg, const ImageProcessor::ProcessingParams& params) {
    ImageProcessor::requireRaster(bgrImg);

    // One slot per class keeps the concatenation order fixed regardless of scheduling
    vector<vector<Detection>> perClass(kFeatureClassCount);
    vector<exception_ptr> failures(kFeatureClassCount);

    auto runSlot = [&](int i) {
        try {
            perClass[i] = detectorFor(kAllFeatureClasses[i])(bgrImg, params);
        } catch (...) {
            failures[i] = current_exception();
        }
    };

    if (params.parallelGeneral) {
        parallel_for_(Range(0, static_cast<int>(kFeatureClassCount)), [&](const Range& range) {
            for (int i = range.start; i < range.end; ++i) {
                runSlot(i);
            }
        });
    } else {
        for (int i = 0; i < static_cast<int>(kFeatureClassCount); ++i) {
            runSlot(i);
        }
    }

    for (const exception_ptr& failure : failures) {
        if (failure) {
            rethrow_exception(failure);
        }
    }

    DetectorOutput output;
    for (auto& detections : perClass) {
        for (auto& detection : detections) {
            output.detections.push_back(std::move(detection));
        }
    }
    output.confidence = generalAggregate().evaluate(output.detections.size());
    return output;
}

DetectorOutput DetectorDispatcher::dispatch(const string& modelType, const Mat& bgrImg,
                                            const ImageProcessor::ProcessingParams& params) {
    FeatureClass featureClass;
    if (parseFeatureClass(modelType, featureClass)) {
        return runClass(featureClass, bgrImg, params);
    }

    if (params.verboseOutput && modelType != "general") {
        cerr << "[WARN] Unknown model type '" << modelType << "', running all detectors" << endl;
    }
    return runGeneral(bgrImg, params);
}

} // namespace TerraScan
