#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "fs_tree/tree_map.hpp"

namespace fs_du {

struct ScanOptions {
    bool include_hidden = false;    // Descend into / record names starting with '.'
    bool include_symlinks = false;  // Record symlinks as zero-size files
    bool verbose = false;           // Log each directory as it is read
};

/**
 * DiskScanner: mirrors a real directory tree into a TreeMap of file sizes
 *
 * Responsibilities:
 * - Record every directory with TreeMap::MakeDirectory, so empty
 *   directories show up in reports
 * - Record every regular file with TreeMap::InsertWithParents, the value
 *   being its size in bytes
 * - Keep going past unreadable entries, logging and counting them
 *
 * Paths in the tree are relative to the scanned root. Entries of each
 * directory are visited sorted by name, so the resulting tree (and every
 * fold over it) is deterministic. Symlinks are never followed.
 *
 * Usage:
 *   fs_tree::TreeMap<uint64_t> tree;
 *   DiskScanner scanner;
 *   if (scanner.ScanDirectory("/var/log", tree)) {
 *       std::cout << tree.ValueSum() << std::endl;
 *   }
 */
class DiskScanner {
public:
    struct ScanStats {
        uint64_t files = 0;
        uint64_t directories = 0;
        uint64_t symlinks = 0;
        uint64_t skipped = 0;
        uint64_t errors = 0;
        uint64_t total_bytes = 0;
    };

    explicit DiskScanner(ScanOptions options = ScanOptions());

    /**
     * Scan `root_dir` into `tree`
     *
     * @param root_dir Directory to scan; it becomes the tree's root
     * @param tree [OUTPUT] Tree receiving the entries
     * @return false if root_dir is missing or not a directory
     */
    bool ScanDirectory(const std::string& root_dir, fs_tree::TreeMap<uint64_t>& tree);

    ScanStats GetStats() const { return stats_; }
    void ResetStats();

private:
    void ScanInto(const std::filesystem::path& dir, const std::string& rel_prefix,
                  fs_tree::TreeMap<uint64_t>& tree);

    bool ShouldSkip(const std::string& name) const;

    ScanOptions options_;
    ScanStats stats_;
};

}  // namespace fs_du
