#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include "fs_du/disk_scanner.hpp"
#include "fs_du/du_config.hpp"
#include "fs_du/du_report.hpp"
#include "fs_tree/tree_map.hpp"
#include "fs_tree/tree_printer.hpp"

void PrintUsage() {
    std::cout << "Usage: fs_du [options]" << std::endl
              << "Options:" << std::endl
              << "  --path <dir>       Directory to scan (default: .)" << std::endl
              << "  --max-depth <n>    Deepest level to report (default: no limit)" << std::endl
              << "  --all, -a          Report files as well as directories" << std::endl
              << "  --human, -h        Sizes in K/M/G units" << std::endl
              << "  --hidden           Include entries starting with '.'" << std::endl
              << "  --tree             Print the scanned tree instead of the report" << std::endl
              << "  --find <substr>    Check whether any file name contains <substr>" << std::endl
              << "  --verbose, -v      Log configuration and scan progress" << std::endl
              << "  --help             Show this help message" << std::endl;
}

// ============================================================================
// Helper: Print configuration
// ============================================================================
void PrintConfig(const fs_du::DuConfig& config) {
    std::cout << "========================================" << std::endl;
    std::cout << "  fs_du: directory size report" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Path: " << config.path << std::endl;
    std::cout << "Max Depth: "
              << (config.max_depth < 0 ? std::string("unlimited") : std::to_string(config.max_depth))
              << std::endl;
    std::cout << "All Entries: " << (config.all ? "true" : "false") << std::endl;
    std::cout << "Human Readable: " << (config.human_readable ? "true" : "false") << std::endl;
    std::cout << "Include Hidden: " << (config.include_hidden ? "true" : "false") << std::endl;
    std::cout << "========================================" << std::endl;
}

int Run(const fs_du::DuConfig& config) {
    fs_du::ScanOptions scan_options;
    scan_options.include_hidden = config.include_hidden;
    scan_options.verbose = config.verbose;

    fs_tree::TreeMap<uint64_t> tree;
    fs_du::DiskScanner scanner(scan_options);
    if (!scanner.ScanDirectory(config.path, tree)) {
        return 1;
    }

    auto stats = scanner.GetStats();
    if (stats.errors > 0) {
        std::cerr << "fs_du: " << stats.errors
                  << " entries could not be read; totals may be incomplete" << std::endl;
    }

    if (!config.find.empty()) {
        const std::string& needle = config.find;
        bool found = tree.Any([&needle](const std::string& name, const uint64_t&) {
            return name.find(needle) != std::string::npos;
        });
        std::cout << (found ? "found" : "not found") << ": " << needle << std::endl;
        return found ? 0 : 1;
    }

    if (config.print_tree) {
        fs_tree::PrintTree(tree, std::cout);
        return 0;
    }

    fs_du::ReportOptions report_options;
    report_options.all = config.all;
    report_options.max_depth = config.max_depth;
    fs_du::WriteReport(fs_du::BuildReport(tree, report_options), std::cout,
                       config.human_readable);
    return 0;
}

// ============================================================================
// Main
// ============================================================================
int main(int argc, char* argv[]) {
    try {
        fs_du::DuConfig config = fs_du::ParseArgs(argc, argv);
        if (config.show_help) {
            PrintUsage();
            return 0;
        }
        if (!config.valid) {
            std::cerr << "Try 'fs_du --help' for usage." << std::endl;
            return 2;
        }
        if (config.verbose) {
            PrintConfig(config);
        }
        return Run(config);
    } catch (const std::exception& e) {
        std::cerr << "fs_du: " << e.what() << std::endl;
        return 2;
    }
}
