#include "Detection.hpp"
#include <cmath>

namespace TerraScan {

const char* featureClassName(FeatureClass featureClass) {
    switch (featureClass) {
        case FeatureClass::Deforestation: return "deforestation";
        case FeatureClass::Mining: return "mining";
        case FeatureClass::ForestFire: return "forest_fire";
        case FeatureClass::Agriculture: return "agriculture";
        case FeatureClass::UrbanExpansion: return "urban_expansion";
        case FeatureClass::WaterBody: return "water_body";
        case FeatureClass::Count: break;
    }
    return "unknown";
}

const char* severityName(Severity severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "low";
}

bool parseFeatureClass(const std::string& name, FeatureClass& out) {
    for (FeatureClass featureClass : kAllFeatureClasses) {
        if (name == featureClassName(featureClass)) {
            out = featureClass;
            return true;
        }
    }

    // Short names used by the upload form
    if (name == "urban") {
        out = FeatureClass::UrbanExpansion;
        return true;
    }
    if (name == "water") {
        out = FeatureClass::WaterBody;
        return true;
    }
    return false;
}

double roundTo(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace TerraScan
