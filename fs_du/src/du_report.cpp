#include "fs_du/du_report.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace fs_du {

namespace {

using SizeNode = fs_tree::Node<uint64_t>;

bool WithinDepth(int depth, const ReportOptions& options) {
    return options.max_depth < 0 || depth <= options.max_depth;
}

void AppendEntries(const SizeNode& dir, const std::string& path, int depth,
                   const ReportOptions& options, std::vector<ReportEntry>& entries) {
    bool children_visible = WithinDepth(depth + 1, options);
    for (const SizeNode* child : dir.GetChildren()) {
        std::string child_path = path + "/" + child->GetName();
        if (child->IsDirectory()) {
            if (children_visible) {
                AppendEntries(*child, child_path, depth + 1, options, entries);
            }
        } else if (options.all && children_visible) {
            entries.push_back({child_path, child->GetFileValue(), false, depth + 1});
        }
    }
    if (WithinDepth(depth, options)) {
        entries.push_back({path, dir.GetValue(), true, depth});
    }
}

}  // namespace

std::vector<ReportEntry> BuildReport(const fs_tree::TreeMap<uint64_t>& tree,
                                     const ReportOptions& options) {
    std::vector<ReportEntry> entries;
    AppendEntries(tree.Root(), ".", 0, options, entries);
    return entries;
}

std::string FormatSize(uint64_t bytes, bool human_readable) {
    if (!human_readable || bytes < 1024) {
        return std::to_string(bytes);
    }

    static const char* const kUnits[] = {"K", "M", "G", "T", "P", "E"};
    constexpr size_t kNumUnits = sizeof(kUnits) / sizeof(kUnits[0]);

    double value = static_cast<double>(bytes) / 1024.0;
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kNumUnits) {
        value /= 1024.0;
        ++unit;
    }

    // Round up before picking the format: 9.95K is printed as 10K, and
    // 1023.5K carries over into the next unit as 1.0M
    while (true) {
        if (value < 10.0) {
            double tenths = std::ceil(value * 10.0) / 10.0;
            if (tenths < 10.0) {
                std::ostringstream ss;
                ss << std::fixed << std::setprecision(1) << tenths << kUnits[unit];
                return ss.str();
            }
            value = tenths;
        }
        double whole = std::ceil(value);
        if (whole < 1024.0 || unit + 1 == kNumUnits) {
            return std::to_string(static_cast<uint64_t>(whole)) + kUnits[unit];
        }
        value = whole / 1024.0;
        ++unit;
    }
}

void WriteReport(const std::vector<ReportEntry>& entries, std::ostream& out,
                 bool human_readable) {
    for (const auto& entry : entries) {
        out << FormatSize(entry.bytes, human_readable) << '\t' << entry.path << '\n';
    }
}

}  // namespace fs_du
