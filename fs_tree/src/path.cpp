#include "fs_tree/path.hpp"
#include <utility>

namespace fs_tree {

std::vector<std::string> SplitPath(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return segments;
}

PathParts SplitStem(const std::string& path) {
    PathParts parts;
    parts.dirpath = SplitPath(path);
    parts.stem = std::move(parts.dirpath.back());
    parts.dirpath.pop_back();
    return parts;
}

std::string JoinPath(const std::vector<std::string>& segments) {
    std::string joined;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            joined += '/';
        }
        joined += segments[i];
    }
    return joined;
}

}  // namespace fs_tree
