#ifndef TERRA_SCAN_API_H
#define TERRA_SCAN_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stdbool.h>

// Version information
#define TERRA_SCAN_VERSION_MAJOR 1
#define TERRA_SCAN_VERSION_MINOR 0
#define TERRA_SCAN_VERSION_PATCH 0

#define TERRA_SCAN_MAX_PATH 1024

// Error codes for host integration
typedef enum {
    TERRA_SCAN_SUCCESS = 0,
    TERRA_SCAN_ERROR_INVALID_INPUT = -1,
    TERRA_SCAN_ERROR_FILE_NOT_FOUND = -2,
    TERRA_SCAN_ERROR_IMAGE_LOAD_FAILED = -3,
    TERRA_SCAN_ERROR_UNSUPPORTED_CLASS = -4,
    TERRA_SCAN_ERROR_OUTPUT_WRITE_FAILED = -5,
    TERRA_SCAN_ERROR_INVALID_PARAMETERS = -6,
    TERRA_SCAN_ERROR_PROCESSING_FAILED = -7
} TerraScanResult;

// Processing parameters structure
typedef struct {
    bool parallel_general;          // Run the six detectors concurrently in general mode (default: true)
    int32_t jpeg_quality;           // Result image JPEG quality, 1-100 (default: 95)

    // Logging and debug visualization
    bool verbose_output;            // Log progress to stderr (default: false)
    bool enable_debug_output;       // Save intermediate masks (default: false)
    char debug_output_path[TERRA_SCAN_MAX_PATH]; // Debug image directory (default: "./debug/")
} TerraScanParams;

// Progress callback function type
typedef void (*TerraScanProgressCallback)(double progress, const char* stage, void* user_data);

// Error callback function type for detailed error reporting
typedef void (*TerraScanErrorCallback)(TerraScanResult error_code, const char* error_message, void* user_data);

// Core API Functions

/**
 * Get default processing parameters
 * @param params Pointer to parameters structure to fill
 */
void terra_scan_get_default_params(TerraScanParams* params);

/**
 * Validate processing parameters
 * @param params Pointer to parameters to validate
 * @return TERRA_SCAN_SUCCESS if valid, error code otherwise
 */
TerraScanResult terra_scan_validate_params(const TerraScanParams* params);

/**
 * Segment one image described by a JSON request
 * @param request_json {"imagePath": ..., "outputDir": ..., "modelType": ...}
 * @param params Processing parameters (defaults if NULL)
 * @param result_json Receives the result JSON, or the error JSON on failure (free with terra_scan_free_string)
 * @param progress_callback Optional progress callback
 * @param error_callback Optional error callback for detailed error reporting
 * @param user_data Passed through to both callbacks
 * @return TERRA_SCAN_SUCCESS if successful, error code otherwise
 */
TerraScanResult terra_scan_segment_image(
    const char* request_json,
    const TerraScanParams* params,
    char** result_json,
    TerraScanProgressCallback progress_callback,
    TerraScanErrorCallback error_callback,
    void* user_data
);

/**
 * Free a string returned by the library
 * @param str String to free
 */
void terra_scan_free_string(char* str);

/**
 * Get error message for error code
 * @param error_code Error code
 * @return Human-readable error message
 */
const char* terra_scan_get_error_message(TerraScanResult error_code);

/**
 * Get library version string
 * @return Version string (e.g., "1.0.0")
 */
const char* terra_scan_get_version(void);

/**
 * Check if an image file can be decoded
 * @param file_path Path to image file
 * @return true if valid image file, false otherwise
 */
bool terra_scan_is_valid_image_file(const char* file_path);

#ifdef __cplusplus
}
#endif

#endif // TERRA_SCAN_API_H
