#pragma once

#include <stdexcept>
#include <string>

namespace fs_tree {

// Kinds of structural violation a TreeMap operation can hit
enum class ErrorKind {
    NotADirectory,  // Traversal, mkdir or insert through a File
    NotAFile,       // Value requested from a Directory
    NotFound,       // Required path segment is missing
    AlreadyExists   // Insert target name is already taken
};

/**
 * Stable lowercase name for an ErrorKind, e.g. "not_a_directory"
 */
const char* ErrorKindName(ErrorKind kind);

/**
 * TreeError: thrown when an operation violates the shape of the tree
 *
 * Plain absence on read lookups (GetNode, GetChildren) is not an error and
 * is reported through nullptr / std::nullopt instead.
 */
class TreeError : public std::runtime_error {
public:
    TreeError(ErrorKind kind, const std::string& path);

    ErrorKind kind() const { return kind_; }
    const std::string& path() const { return path_; }

private:
    ErrorKind kind_;
    std::string path_;
};

}  // namespace fs_tree
