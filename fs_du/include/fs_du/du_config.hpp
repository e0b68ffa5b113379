#pragma once

#include <string>

namespace fs_du {

const std::string DEFAULT_PATH = ".";
const int DEFAULT_MAX_DEPTH = -1;  // No limit

struct DuConfig {
    std::string path = DEFAULT_PATH;
    int max_depth = DEFAULT_MAX_DEPTH;
    bool all = false;
    bool human_readable = false;
    bool include_hidden = false;
    bool print_tree = false;
    bool verbose = false;
    std::string find;  // Empty: produce the size report
    bool show_help = false;
    bool valid = true;  // False if an option value was rejected
};

/**
 * Parse fs_du command-line arguments
 *
 * Unknown arguments are reported on std::cerr and ignored. A bad option
 * value (e.g. "--max-depth abc" or a negative depth) is reported on
 * std::cerr and leaves config.valid == false.
 */
DuConfig ParseArgs(int argc, const char* const argv[]);

}  // namespace fs_du
