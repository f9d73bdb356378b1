#include <TerraScanAPI.h>
#include "CommandLine.hpp"
#include "JsonIO.hpp"
#include "TerraScanErrors.hpp"
#include <iostream>
#include <string>
#include <cstring>

using namespace std;
using TerraScan::Arguments;
using TerraScan::JsonIO;

void printUsage(const char* progName) {
    cerr << "TerraScan CLI - Detect environmental change in aerial and satellite frames\n"
         << "Using libterrascan v" << terra_scan_get_version() << "\n"
         << "\n"
         << "Usage: " << progName << " [options] <request-json | @request-file>\n"
         << "\n"
         << "Request fields:\n"
         << "  imagePath   Input image file path (required)\n"
         << "  outputDir   Directory for the annotated result image (required)\n"
         << "  modelType   deforestation, mining, forest_fire, agriculture,\n"
         << "              urban_expansion, water_body or general (default: general)\n"
         << "\n"
         << "Options:\n"
         << "  -v, --verbose       Log progress to stderr\n"
         << "  -d, --debug         Save every intermediate mask\n"
         << "  --debug-dir <dir>   Debug image directory (default: ./debug/, enables debug)\n"
         << "  --sequential        Run general-mode detectors one after another\n"
         << "  -h, --help          Show this help message\n"
         << "\n"
         << "Examples:\n"
         << "  " << progName << " '{\"imagePath\":\"frame.jpg\",\"outputDir\":\"out\",\"modelType\":\"mining\"}'\n"
         << "  " << progName << " @request.json -v\n"
         << endl;
}

// Progress callback for verbose mode
void progressCallback(double progress, const char* stage, void* user_data) {
    (void)user_data;
    cerr << "[PROGRESS] " << stage << ": " << (int)(progress * 100) << "%" << endl;
}

// Error callback for detailed error reporting
void errorCallback(TerraScanResult error_code, const char* error_message, void* user_data) {
    (void)user_data;
    cerr << "[ERROR] Code " << error_code << ": " << error_message << endl;
}

// Writes the failure document to stdout and returns the process exit code
int reportFailure(const string& message) {
    cout << JsonIO::dump(JsonIO::errorJson(message)) << endl;
    return 1;
}

int run(const Arguments& args, const char* progName) {
    if (args.help) {
        printUsage(progName);
        return 0;
    }

    if (!args.valid) {
        printUsage(progName);
        cerr << "[ERROR] " << args.error << endl;
        return reportFailure(args.error);
    }

    string requestJson;
    try {
        requestJson = JsonIO::readRequestArgument(args.request);
    } catch (const TerraScan::InvalidInputError& e) {
        cerr << "[ERROR] " << e.what() << endl;
        return reportFailure(e.what());
    }

    // Get default parameters
    TerraScanParams params;
    terra_scan_get_default_params(&params);

    params.verbose_output = args.verbose;
    params.parallel_general = !args.sequential;

    if (args.debug) {
        params.enable_debug_output = true;
        strncpy(params.debug_output_path, args.debugDir.c_str(), TERRA_SCAN_MAX_PATH - 1);
        params.debug_output_path[TERRA_SCAN_MAX_PATH - 1] = '\0';
        cerr << "[INFO] Debug mode enabled - masks will be saved to " << params.debug_output_path << endl;
    }

    if (args.verbose) {
        cerr << "[INFO] TerraScan CLI v" << terra_scan_get_version() << endl;
        cerr << "[INFO] General mode: " << (params.parallel_general ? "parallel" : "sequential") << endl;
    }

    char* resultJson = nullptr;
    TerraScanResult result = terra_scan_segment_image(
        requestJson.c_str(),
        &params,
        &resultJson,
        args.verbose ? progressCallback : nullptr,
        errorCallback,
        nullptr  // No user data needed for CLI
    );

    if (!resultJson) {
        return reportFailure(terra_scan_get_error_message(result));
    }
    cout << resultJson << endl;
    terra_scan_free_string(resultJson);

    if (result != TERRA_SCAN_SUCCESS) {
        cerr << "[ERROR] Processing failed: " << terra_scan_get_error_message(result) << endl;
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        return run(TerraScan::parseArguments(argc, argv), argv[0]);
    } catch (const std::exception& e) {
        cerr << "[ERROR] " << e.what() << endl;
        return reportFailure(e.what());
    }
}
