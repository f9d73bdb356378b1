#include "ClassProfiles.hpp"
#include "TerraScanErrors.hpp"
#include <algorithm>
#include <string>

namespace TerraScan {

namespace {

const ClassProfile kProfiles[] = {
    //  class                         minArea close open  slope base  cap  empty   color (BGR)
    { FeatureClass::Deforestation,    1000,   5,    5,   { 15.0, 45.0, 90.0, 25.0 }, cv::Scalar(0, 0, 255) },
    { FeatureClass::Mining,           2000,   7,    0,   { 20.0, 40.0, 85.0, 30.0 }, cv::Scalar(0, 165, 255) },
    { FeatureClass::ForestFire,       500,    0,    0,   { 25.0, 35.0, 90.0, 20.0 }, cv::Scalar(0, 69, 255) },
    { FeatureClass::Agriculture,      1500,   0,    0,   { 12.0, 30.0, 75.0, 20.0 }, cv::Scalar(0, 255, 0) },
    { FeatureClass::UrbanExpansion,   2500,   0,    0,   { 18.0, 25.0, 70.0, 15.0 }, cv::Scalar(128, 128, 128) },
    { FeatureClass::WaterBody,        1000,   0,    0,   { 25.0, 30.0, 80.0, 20.0 }, cv::Scalar(255, 0, 0) },
};

static_assert(sizeof(kProfiles) / sizeof(kProfiles[0]) == kFeatureClassCount,
              "every feature class needs exactly one profile");

const AggregateConfidence kGeneralAggregate = { 8.0, 50.0, 90.0, 35.0 };

} // namespace

double AggregateConfidence::evaluate(std::size_t detectionCount) const {
    if (detectionCount == 0) {
        return whenEmpty;
    }
    return std::min(cap, static_cast<double>(detectionCount) * slope + base);
}

const ClassProfile& profileFor(FeatureClass featureClass) {
    std::size_t index = static_cast<std::size_t>(featureClass);
    if (index >= kFeatureClassCount || kProfiles[index].featureClass != featureClass) {
        throw UnsupportedClassError("No profile for feature class index " + std::to_string(index));
    }
    return kProfiles[index];
}

const AggregateConfidence& generalAggregate() {
    return kGeneralAggregate;
}

} // namespace TerraScan
