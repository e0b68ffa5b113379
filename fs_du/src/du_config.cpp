#include "fs_du/du_config.hpp"
#include <exception>
#include <iostream>

namespace fs_du {

namespace {

// Non-negative decimal integer with nothing trailing; false otherwise
bool ParseDepth(const std::string& text, int& out_depth) {
    try {
        size_t consumed = 0;
        int depth = std::stoi(text, &consumed);
        if (consumed != text.size() || depth < 0) {
            return false;
        }
        out_depth = depth;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}  // namespace

DuConfig ParseArgs(int argc, const char* const argv[]) {
    DuConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--path" && i + 1 < argc) {
            config.path = argv[++i];
        } else if (arg == "--max-depth" && i + 1 < argc) {
            std::string value = argv[++i];
            if (!ParseDepth(value, config.max_depth)) {
                std::cerr << "Invalid value for --max-depth: '" << value
                          << "' (expected a non-negative integer)" << std::endl;
                config.valid = false;
            }
        } else if (arg == "--all" || arg == "-a") {
            config.all = true;
        } else if (arg == "--human" || arg == "-h") {
            config.human_readable = true;
        } else if (arg == "--hidden") {
            config.include_hidden = true;
        } else if (arg == "--tree") {
            config.print_tree = true;
        } else if (arg == "--find" && i + 1 < argc) {
            config.find = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--help") {
            config.show_help = true;
        } else {
            std::cerr << "Unknown argument: " << arg << " (ignored)" << std::endl;
        }
    }

    return config;
}

}  // namespace fs_du
