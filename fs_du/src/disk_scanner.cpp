#include "fs_du/disk_scanner.hpp"
#include <algorithm>
#include <iostream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace fs_du {

DiskScanner::DiskScanner(ScanOptions options)
    : options_(options) {}

void DiskScanner::ResetStats() {
    stats_ = ScanStats();
}

bool DiskScanner::ShouldSkip(const std::string& name) const {
    return !options_.include_hidden && !name.empty() && name[0] == '.';
}

bool DiskScanner::ScanDirectory(const std::string& root_dir,
                                fs_tree::TreeMap<uint64_t>& tree) {
    std::error_code ec;
    if (!fs::is_directory(root_dir, ec)) {
        std::cerr << "DiskScanner: Not a directory: " << root_dir;
        if (ec) {
            std::cerr << " (" << ec.message() << ")";
        }
        std::cerr << std::endl;
        return false;
    }

    ScanInto(fs::path(root_dir), "", tree);

    if (options_.verbose) {
        std::cout << "DiskScanner: Scanned " << root_dir << ": "
                  << stats_.files << " files, " << stats_.directories
                  << " directories, " << stats_.total_bytes << " bytes, "
                  << stats_.errors << " errors" << std::endl;
    }
    return true;
}

void DiskScanner::ScanInto(const fs::path& dir, const std::string& rel_prefix,
                           fs_tree::TreeMap<uint64_t>& tree) {
    if (options_.verbose) {
        std::cout << "DiskScanner: Reading " << dir.string() << std::endl;
    }

    // Step 1: Collect entries, then sort by name for a stable child order.
    // An unreadable directory stays in the tree as empty and counts as an error.
    std::error_code ec;
    std::vector<fs::directory_entry> entries;
    fs::directory_iterator it(dir, ec);
    for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        std::cerr << "DiskScanner: Failed to read directory " << dir.string()
                  << ": " << ec.message() << std::endl;
        stats_.errors++;
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });

    // Step 2: Record each entry under its path relative to the scan root
    for (const auto& entry : entries) {
        std::string name = entry.path().filename().string();
        if (ShouldSkip(name)) {
            stats_.skipped++;
            continue;
        }
        std::string rel_path = rel_prefix.empty() ? name : rel_prefix + "/" + name;

        std::error_code status_ec;
        if (entry.is_symlink(status_ec)) {
            stats_.symlinks++;
            if (options_.include_symlinks) {
                tree.InsertWithParents(rel_path, 0);
            }
            continue;
        }

        if (entry.is_directory(status_ec)) {
            tree.MakeDirectory(rel_path);
            stats_.directories++;
            ScanInto(entry.path(), rel_path, tree);
            continue;
        }

        if (entry.is_regular_file(status_ec)) {
            uint64_t size = entry.file_size(status_ec);
            if (!status_ec) {
                tree.InsertWithParents(rel_path, size);
                stats_.files++;
                stats_.total_bytes += size;
                continue;
            }
        }

        if (status_ec) {
            std::cerr << "DiskScanner: Cannot stat " << entry.path().string()
                      << ": " << status_ec.message() << std::endl;
            stats_.errors++;
        } else {
            // Sockets, fifos, devices
            stats_.skipped++;
        }
    }
}

}  // namespace fs_du
