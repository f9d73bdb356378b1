#include "JsonIO.hpp"
#include "TerraScanErrors.hpp"
#include <fstream>
#include <sstream>

using namespace std;
using nlohmann::json;

namespace TerraScan {

namespace {

string requireString(const json& request, const char* field, bool required, const string& fallback) {
    auto it = request.find(field);
    if (it == request.end() || it->is_null()) {
        if (required) {
            throw InvalidInputError(string("Missing required field '") + field + "'");
        }
        return fallback;
    }
    if (!it->is_string()) {
        throw InvalidInputError(string("Field '") + field + "' must be a string");
    }
    return it->get<string>();
}

} // namespace

string JsonIO::readRequestArgument(const string& argument) {
    if (argument.empty() || argument[0] != '@') {
        return argument;
    }

    string path = argument.substr(1);
    ifstream file(path);
    if (!file.good()) {
        throw InvalidInputError("Cannot read request file: " + path);
    }

    stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

SegmentationRequest JsonIO::parseRequest(const string& jsonText) {
    json request;
    try {
        request = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw InvalidInputError(string("Malformed request JSON: ") + e.what());
    }

    if (!request.is_object()) {
        throw InvalidInputError("Request must be a JSON object");
    }

    SegmentationRequest parsed;
    parsed.imagePath = requireString(request, "imagePath", true, "");
    parsed.outputDir = requireString(request, "outputDir", true, "");
    parsed.modelType = requireString(request, "modelType", false, "general");
    return parsed;
}

json JsonIO::toJson(const Detection& detection) {
    json out = {
        {"class", featureClassName(detection.featureClass)},
        {"confidence", detection.confidence},
        {"bbox", {detection.box.x, detection.box.y, detection.box.width, detection.box.height}},
        {"area", detection.area},
        {"center", {detection.center.x, detection.center.y}},
        {"severity", severityName(detection.severity)}
    };

    for (const auto& metric : detection.metrics) {
        out[metric.first] = metric.second;
    }
    for (const auto& label : detection.labels) {
        out[label.first] = label.second;
    }
    return out;
}

json JsonIO::toJson(const SegmentationResult& result) {
    json detections = json::array();
    for (const Detection& detection : result.detections) {
        detections.push_back(toJson(detection));
    }

    json summary = json::object();
    for (const auto& item : result.summary) {
        const ClassSummary& entry = item.second;
        summary[item.first] = {
            {"count", entry.count},
            {"average_confidence", entry.averageConfidence},
            {"total_area", entry.totalArea},
            {"severity_distribution", {
                {"low", entry.severityDistribution[0]},
                {"medium", entry.severityDistribution[1]},
                {"high", entry.severityDistribution[2]},
                {"critical", entry.severityDistribution[3]}
            }}
        };
    }

    return {
        {"detections", detections},
        {"confidence", result.confidence},
        {"processing_time", result.processingTime},
        {"image_size", {{"width", result.imageSize.width}, {"height", result.imageSize.height}}},
        {"model_used", result.modelUsed},
        {"resultImagePath", result.resultImagePath},
        {"summary", summary},
        {"environmental_risk", result.environmentalRisk}
    };
}

string JsonIO::dump(const json& document) {
    return document.dump(-1, ' ', false, json::error_handler_t::replace);
}

json JsonIO::errorJson(const string& message) {
    return {
        {"error", message},
        {"detections", json::array()},
        {"confidence", 0},
        {"processing_time", 0},
        {"image_size", {{"width", 0}, {"height", 0}}},
        {"model_used", "error"},
        {"resultImagePath", ""}
    };
}

} // namespace TerraScan
