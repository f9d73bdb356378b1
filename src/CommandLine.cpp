#include "CommandLine.hpp"

using namespace std;

namespace TerraScan {

Arguments parseArguments(int argc, const char* const argv[]) {
    Arguments args;

    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-d" || arg == "--debug") {
            args.debug = true;
        } else if (arg == "--debug-dir") {
            if (i + 1 >= argc) {
                args.error = "Option --debug-dir requires a directory";
                return args;
            }
            args.debugDir = argv[++i];
            args.debug = true; // Auto-enable when a directory is given
        } else if (arg == "--sequential") {
            args.sequential = true;
        } else if (arg == "--help" || arg == "-h") {
            args.help = true;
            return args;
        } else if (arg.size() > 1 && arg[0] == '-') {
            args.error = "Unknown option: " + arg;
            return args;
        } else if (args.request.empty()) {
            args.request = arg;
        } else {
            args.error = "Unexpected argument: " + arg;
            return args;
        }
    }

    if (args.request.empty()) {
        args.error = "Missing request argument";
    }
    args.valid = args.error.empty();
    return args;
}

} // namespace TerraScan
