#pragma once

#include <string>
#include <vector>

namespace fs_tree {

/**
 * A path split into the directories to walk and the final name
 *
 * "home/users/answer.txt" -> dirpath {"home", "users"}, stem "answer.txt"
 */
struct PathParts {
    std::vector<std::string> dirpath;
    std::string stem;
};

/**
 * Split a path on every '/'
 *
 * Segments are matched literally against node names, so nothing is
 * normalized: empty segments are kept ("a//b" -> {"a", "", "b"}),
 * a leading slash yields a leading empty segment, and "" yields {""}.
 * The result always holds at least one segment.
 */
std::vector<std::string> SplitPath(const std::string& path);

/**
 * SplitPath with the last segment split off as the stem
 */
PathParts SplitStem(const std::string& path);

/**
 * Join segments with '/' (inverse of SplitPath)
 */
std::string JoinPath(const std::vector<std::string>& segments);

}  // namespace fs_tree
