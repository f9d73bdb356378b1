#pragma once

#include "Detection.hpp"
#include <map>
#include <string>
#include <vector>

namespace TerraScan {

class ResultSummary {
public:
    // Per-class count, mean confidence, total area and severity histogram
    static std::map<std::string, ClassSummary> summarize(const std::vector<Detection>& detections);

    /**
     * Whole-run rating: "Low", "Medium", "High" or "Critical".
     * Any fire, or more than two critical findings, is Critical. Any critical
     * finding, more than two high ones, or more than one mining site is High.
     */
    static std::string environmentalRisk(const std::vector<Detection>& detections);
};

} // namespace TerraScan
