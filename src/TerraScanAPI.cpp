#include "TerraScanAPI.h"
#include "ImageProcessor.hpp"
#include "JsonIO.hpp"
#include "SegmentationPipeline.hpp"
#include "TerraScanErrors.hpp"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>

using namespace TerraScan;

// Internal helper functions
namespace {

    // Convert C parameters to C++ parameters
    ImageProcessor::ProcessingParams convertParams(const TerraScanParams* params) {
        ImageProcessor::ProcessingParams cpp_params;
        if (params) {
            cpp_params.parallelGeneral = params->parallel_general;
            cpp_params.jpegQuality = params->jpeg_quality;
            cpp_params.verboseOutput = params->verbose_output;
            cpp_params.enableDebugOutput = params->enable_debug_output;
            cpp_params.debugOutputPath = params->debug_output_path;
        }
        return cpp_params;
    }

    // Hand a JSON document to the caller as a malloc'd C string
    char* copyJson(const nlohmann::json& document) {
        std::string text = JsonIO::dump(document);
        char* copy = static_cast<char*>(malloc(text.size() + 1));
        if (copy) {
            memcpy(copy, text.c_str(), text.size() + 1);
        }
        return copy;
    }

    TerraScanResult fail(TerraScanResult code, const std::string& message, char** result_json,
                         TerraScanErrorCallback error_callback, void* user_data) {
        if (error_callback) {
            error_callback(code, message.c_str(), user_data);
        }
        if (result_json) {
            *result_json = copyJson(JsonIO::errorJson(message));
        }
        return code;
    }

    // Progress reporting helper
    void reportProgress(TerraScanProgressCallback callback, double progress, const char* stage, void* user_data) {
        if (callback) {
            callback(progress, stage, user_data);
        }
    }
}

// API Implementation

void terra_scan_get_default_params(TerraScanParams* params) {
    if (!params) return;

    params->parallel_general = true;
    params->jpeg_quality = 95;

    // Logging and debug settings
    params->verbose_output = false;
    params->enable_debug_output = false;
    strncpy(params->debug_output_path, "./debug/", TERRA_SCAN_MAX_PATH - 1);
    params->debug_output_path[TERRA_SCAN_MAX_PATH - 1] = '\0';
}

TerraScanResult terra_scan_validate_params(const TerraScanParams* params) {
    if (!params) return TERRA_SCAN_ERROR_INVALID_PARAMETERS;

    if (params->jpeg_quality < 1 || params->jpeg_quality > 100) {
        return TERRA_SCAN_ERROR_INVALID_PARAMETERS;
    }

    // Debug path must be terminated inside the buffer
    if (memchr(params->debug_output_path, '\0', TERRA_SCAN_MAX_PATH) == nullptr) {
        return TERRA_SCAN_ERROR_INVALID_PARAMETERS;
    }

    if (params->enable_debug_output && params->debug_output_path[0] == '\0') {
        return TERRA_SCAN_ERROR_INVALID_PARAMETERS;
    }

    return TERRA_SCAN_SUCCESS;
}

TerraScanResult terra_scan_segment_image(
    const char* request_json,
    const TerraScanParams* params,
    char** result_json,
    TerraScanProgressCallback progress_callback,
    TerraScanErrorCallback error_callback,
    void* user_data
) {
    if (result_json) {
        *result_json = nullptr;
    }

    if (!request_json || !result_json) {
        return fail(TERRA_SCAN_ERROR_INVALID_INPUT, "Invalid input parameters", result_json, error_callback, user_data);
    }

    // Validate parameters
    TerraScanParams default_params;
    if (!params) {
        terra_scan_get_default_params(&default_params);
        params = &default_params;
    }

    TerraScanResult validation_result = terra_scan_validate_params(params);
    if (validation_result != TERRA_SCAN_SUCCESS) {
        return fail(validation_result, "Invalid processing parameters", result_json, error_callback, user_data);
    }

    try {
        reportProgress(progress_callback, 0.0, "Parsing request", user_data);
        SegmentationRequest request = JsonIO::parseRequest(request_json);

        // Check file exists
        if (!std::ifstream(request.imagePath).good()) {
            return fail(TERRA_SCAN_ERROR_FILE_NOT_FOUND, "Could not load image from " + request.imagePath,
                        result_json, error_callback, user_data);
        }

        reportProgress(progress_callback, 0.1, "Segmenting image", user_data);
        SegmentationResult result = SegmentationPipeline::run(request, convertParams(params));

        reportProgress(progress_callback, 0.9, "Serializing result", user_data);
        *result_json = copyJson(JsonIO::toJson(result));
        if (!*result_json) {
            return fail(TERRA_SCAN_ERROR_PROCESSING_FAILED, "Out of memory", result_json, error_callback, user_data);
        }

        reportProgress(progress_callback, 1.0, "Segmentation complete", user_data);
        return TERRA_SCAN_SUCCESS;

    } catch (const InvalidInputError& e) {
        return fail(TERRA_SCAN_ERROR_INVALID_INPUT, e.what(), result_json, error_callback, user_data);
    } catch (const ImageLoadError& e) {
        return fail(TERRA_SCAN_ERROR_IMAGE_LOAD_FAILED, e.what(), result_json, error_callback, user_data);
    } catch (const UnsupportedClassError& e) {
        return fail(TERRA_SCAN_ERROR_UNSUPPORTED_CLASS, e.what(), result_json, error_callback, user_data);
    } catch (const OutputWriteError& e) {
        return fail(TERRA_SCAN_ERROR_OUTPUT_WRITE_FAILED, e.what(), result_json, error_callback, user_data);
    } catch (const std::exception& e) {
        return fail(TERRA_SCAN_ERROR_PROCESSING_FAILED, e.what(), result_json, error_callback, user_data);
    }
}

void terra_scan_free_string(char* str) {
    free(str);
}

const char* terra_scan_get_error_message(TerraScanResult error_code) {
    switch (error_code) {
        case TERRA_SCAN_SUCCESS: return "Success";
        case TERRA_SCAN_ERROR_INVALID_INPUT: return "Invalid input - check the request JSON and the image";
        case TERRA_SCAN_ERROR_FILE_NOT_FOUND: return "Input image not found or not readable";
        case TERRA_SCAN_ERROR_IMAGE_LOAD_FAILED: return "Failed to load image - check format and file integrity";
        case TERRA_SCAN_ERROR_UNSUPPORTED_CLASS: return "No detector available for the requested feature class";
        case TERRA_SCAN_ERROR_OUTPUT_WRITE_FAILED: return "Failed to write result image - check output directory permissions";
        case TERRA_SCAN_ERROR_INVALID_PARAMETERS: return "Invalid processing parameters - check parameter ranges";
        case TERRA_SCAN_ERROR_PROCESSING_FAILED: return "Image processing failed - see error callback for details";
        default: return "Unknown error";
    }
}

const char* terra_scan_get_version(void) {
    return "1.0.0";
}

bool terra_scan_is_valid_image_file(const char* file_path) {
    if (!file_path) return false;

    try {
        cv::Mat img = cv::imread(file_path);
        return !img.empty();
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] " << e.what() << std::endl;
        return false;
    }
}
