#pragma once

#include "Detection.hpp"
#include "SegmentationPipeline.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace TerraScan {

class JsonIO {
public:
    // Returns the argument itself, or the contents of the file when it starts with '@'
    static std::string readRequestArgument(const std::string& argument);

    // Throws InvalidInputError on malformed JSON or missing/mistyped fields
    static SegmentationRequest parseRequest(const std::string& jsonText);

    static nlohmann::json toJson(const Detection& detection);
    static nlohmann::json toJson(const SegmentationResult& result);

    // Failure shape: empty detections, zero confidence and size, model_used "error"
    static nlohmann::json errorJson(const std::string& message);

    // Compact text; invalid UTF-8 from paths or messages is replaced, never thrown
    static std::string dump(const nlohmann::json& document);
};

} // namespace TerraScan
