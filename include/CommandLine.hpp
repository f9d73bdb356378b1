#pragma once

#include <string>

namespace TerraScan {

struct Arguments {
    std::string request;            // inline JSON or @path
    std::string error;              // set when the command line is rejected
    bool valid = false;
    bool help = false;
    bool verbose = false;
    bool debug = false;
    std::string debugDir = "./debug/";
    bool sequential = false;
};

/**
 * Parse the terrascan_cli command line.
 * Unknown options, a second positional argument and a missing request all
 * leave valid false with a message in error.
 */
Arguments parseArguments(int argc, const char* const argv[]);

} // namespace TerraScan
