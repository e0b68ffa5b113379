#include "fs_tree/tree_error.hpp"

namespace fs_tree {

namespace {

std::string DescribeError(ErrorKind kind, const std::string& path) {
    switch (kind) {
        case ErrorKind::NotADirectory:
            return "TreeMap: path is not a directory: '" + path + "'";
        case ErrorKind::NotAFile:
            return "TreeMap: no value defined on directories: '" + path + "'";
        case ErrorKind::NotFound:
            return "TreeMap: path does not exist: '" + path + "'";
        case ErrorKind::AlreadyExists:
            return "TreeMap: path already exists: '" + path + "'";
    }
    return "TreeMap: unknown error at '" + path + "'";
}

}  // namespace

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotADirectory: return "not_a_directory";
        case ErrorKind::NotAFile:      return "not_a_file";
        case ErrorKind::NotFound:      return "not_found";
        case ErrorKind::AlreadyExists: return "already_exists";
    }
    return "unknown";
}

TreeError::TreeError(ErrorKind kind, const std::string& path)
    : std::runtime_error(DescribeError(kind, path)), kind_(kind), path_(path) {}

}  // namespace fs_tree
