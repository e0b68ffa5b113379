#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include "fs_tree/tree_map.hpp"

namespace fs_du {

// One output line of a report
struct ReportEntry {
    std::string path;        // "." for the root, "./a/b" below it
    uint64_t bytes = 0;      // File size, or directory subtree total
    bool is_directory = false;
    int depth = 0;           // 0 for the root
};

struct ReportOptions {
    bool all = false;    // Emit files too, not only directories
    int max_depth = -1;  // Deepest level to emit, -1 for no limit
};

/**
 * Build a du-style report from a tree of file sizes
 *
 * Directories are listed in post-order (contents before the directory
 * itself), children in tree order, with the root last as ".". Entries
 * beyond max_depth are not emitted, but their bytes still count toward
 * the totals of their ancestors.
 */
std::vector<ReportEntry> BuildReport(const fs_tree::TreeMap<uint64_t>& tree,
                                     const ReportOptions& options);

/**
 * Render a byte count
 *
 * @param human_readable false: plain bytes ("1536").
 *        true: 1024-based units, one decimal below 10 ("1.5K", "12M"),
 *        rounded up like du; under 1024 bytes stays plain ("512")
 */
std::string FormatSize(uint64_t bytes, bool human_readable);

// "<size>\t<path>" per entry
void WriteReport(const std::vector<ReportEntry>& entries, std::ostream& out,
                 bool human_readable);

}  // namespace fs_du
