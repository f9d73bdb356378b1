#include "ResultSummary.hpp"

using namespace std;

namespace TerraScan {

map<string, ClassSummary> ResultSummary::summarize(const vector<Detection>& detections) {
    map<string, ClassSummary> summary;
    map<string, double> confidenceSums;

    for (const Detection& detection : detections) {
        string name = featureClassName(detection.featureClass);
        ClassSummary& entry = summary[name];
        entry.count++;
        entry.totalArea += detection.area;
        entry.severityDistribution[static_cast<size_t>(detection.severity)]++;
        confidenceSums[name] += detection.confidence;
    }

    for (auto& item : summary) {
        item.second.averageConfidence = roundTo(confidenceSums[item.first] / item.second.count, 2);
    }
    return summary;
}

string ResultSummary::environmentalRisk(const vector<Detection>& detections) {
    if (detections.empty()) return "Low";

    int criticalCount = 0;
    int highCount = 0;
    int fireCount = 0;
    int miningCount = 0;
    for (const Detection& detection : detections) {
        if (detection.severity == Severity::Critical) criticalCount++;
        if (detection.severity == Severity::High) highCount++;
        if (detection.featureClass == FeatureClass::ForestFire) fireCount++;
        if (detection.featureClass == FeatureClass::Mining) miningCount++;
    }

    if (criticalCount > 2 || fireCount > 0) return "Critical";
    if (criticalCount > 0 || highCount > 2 || miningCount > 1) return "High";
    if (highCount > 0) return "Medium";
    return "Low";
}

} // namespace TerraScan
