#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "fs_tree/node.hpp"
#include "fs_tree/path.hpp"
#include "fs_tree/tree_error.hpp"

namespace fs_tree {

constexpr char kRootName[] = "root";

/**
 * TreeMap: path-addressed hierarchical container shaped like a filesystem
 *
 * Owns a single Directory node named "root". Paths are '/'-delimited and
 * start at root's children ("root" itself is never a path segment).
 * Segments are matched literally; see SplitPath.
 *
 * Error model:
 * - A missing node on a read lookup is plain absence (nullptr / nullopt)
 * - Walking through a File, asking a Directory for its value, or
 *   inserting over an existing name throws TreeError
 *
 * Duplicate names: Insert and InsertWithParents reject a stem that is
 * already taken in the target directory (AlreadyExists), so siblings
 * created through TreeMap are always uniquely named.
 *
 * Thread-safety:
 * - None. Pointers returned by lookups are invalidated by any mutation.
 *
 * Usage:
 *   TreeMap<uint64_t> tree;
 *   tree.InsertWithParents("home/users/arthur/answer.txt", 42);
 *   uint64_t total = tree.ValueSum();
 */
template <typename V>
class TreeMap {
public:
    using NodeType = Node<V>;

    TreeMap() : root_(NodeType::NewDirectory(kRootName)) {}

    TreeMap(const TreeMap& other) : root_(other.RootNode().Clone()) {}

    TreeMap& operator=(const TreeMap& other) {
        if (this != &other) {
            root_ = other.RootNode().Clone();
        }
        return *this;
    }

    // A moved-from TreeMap behaves as an empty tree; its root is
    // allocated again on the next mutation
    TreeMap(TreeMap&& other) noexcept : root_(std::move(other.root_)) {}

    TreeMap& operator=(TreeMap&& other) noexcept {
        if (this != &other) {
            root_ = std::move(other.root_);
        }
        return *this;
    }

    const NodeType& Root() const { return RootNode(); }

    /**
     * Resolve a path to a node
     *
     * @return the node at the last segment, or nullptr if any segment is missing
     * @throws TreeError(NotADirectory) if a non-terminal segment is a File
     */
    const NodeType* GetNode(const std::string& path) const {
        const NodeType* current = &RootNode();
        for (const auto& part : SplitPath(path)) {
            if (!current->IsDirectory()) {
                throw TreeError(ErrorKind::NotADirectory, path);
            }
            current = current->GetChild(part);
            if (current == nullptr) {
                return nullptr;
            }
        }
        return current;
    }

    bool Contains(const std::string& path) const {
        return GetNode(path) != nullptr;
    }

    /**
     * Value stored in the File at `path`
     *
     * @throws TreeError(NotFound) if nothing exists at `path`
     * @throws TreeError(NotAFile) if `path` is a Directory
     */
    const V& GetSize(const std::string& path) const {
        const NodeType* node = GetNode(path);
        if (node == nullptr) {
            throw TreeError(ErrorKind::NotFound, path);
        }
        if (!node->IsFile()) {
            throw TreeError(ErrorKind::NotAFile, path);
        }
        return node->GetFileValue();
    }

    /**
     * Children of the Directory at `path`, in insertion order
     *
     * @return std::nullopt unless `path` is an existing Directory
     */
    std::optional<std::vector<const NodeType*>> GetChildren(const std::string& path) const {
        const NodeType* node = GetNode(path);
        if (node == nullptr || !node->IsDirectory()) {
            return std::nullopt;
        }
        return node->GetChildren();
    }

    /**
     * Add a File at `path`; every intermediate directory must already exist
     *
     * @throws TreeError(NotFound) for a missing intermediate directory
     * @throws TreeError(NotADirectory) if an intermediate segment is a File
     * @throws TreeError(AlreadyExists) if the stem is already taken
     */
    void Insert(const std::string& path, V value) {
        PathParts parts = SplitStem(path);
        NodeType& dir = WalkDirectories(parts.dirpath, path, false);
        AddUniqueFile(dir, parts.stem, std::move(value), path);
    }

    /**
     * Add a File at `path`, creating missing intermediate directories
     *
     * @throws TreeError(NotADirectory) if an intermediate segment is a File
     * @throws TreeError(AlreadyExists) if the stem is already taken
     */
    void InsertWithParents(const std::string& path, V value) {
        PathParts parts = SplitStem(path);
        NodeType& dir = WalkDirectories(parts.dirpath, path, true);
        AddUniqueFile(dir, parts.stem, std::move(value), path);
    }

    /**
     * Find-or-create every segment of `path` as a Directory
     *
     * Idempotent: existing directories are walked, not duplicated.
     * @throws TreeError(NotADirectory) if any segment names an existing File
     */
    void MakeDirectory(const std::string& path) {
        WalkDirectories(SplitPath(path), path, true);
    }

    /**
     * Remove every child named after the stem from the terminal directory
     *
     * @return number of nodes removed, 0 if the stem did not exist
     * @throws TreeError(NotFound) for a missing intermediate directory
     * @throws TreeError(NotADirectory) if an intermediate segment is a File
     */
    size_t Remove(const std::string& path) {
        PathParts parts = SplitStem(path);
        NodeType& dir = WalkDirectories(parts.dirpath, path, false);
        return dir.RemoveChildren(parts.stem);
    }

    template <typename T, typename F>
    T ValueReduce(T seed, F combine) const {
        return RootNode().ValueReduce(std::move(seed), std::move(combine));
    }

    template <typename T, typename F>
    T Reduce(T seed, F combine) const {
        return RootNode().Reduce(std::move(seed), std::move(combine));
    }

    // Sum of every leaf value; V{} is the identity
    V ValueSum() const {
        return ValueReduce(V{}, [](V total, const V& value) { return total + value; });
    }

    /**
     * Whether any leaf satisfies pred(name, value)
     *
     * Every leaf is evaluated, even after a match. False on an empty tree.
     */
    template <typename Pred>
    bool Any(Pred pred) const {
        return Reduce(false, [&pred](bool found, const std::string& name, const V& value) {
            bool matched = pred(name, value);
            return found || matched;
        });
    }

    // Number of Files in the tree
    size_t LeafCount() const {
        return ValueReduce(size_t{0}, [](size_t count, const V&) { return count + 1; });
    }

private:
    // Shared empty root standing in for a moved-from tree
    const NodeType& RootNode() const {
        if (root_) {
            return *root_;
        }
        static const std::unique_ptr<NodeType> empty_root = NodeType::NewDirectory(kRootName);
        return *empty_root;
    }

    NodeType& MutRoot() {
        if (!root_) {
            root_ = NodeType::NewDirectory(kRootName);
        }
        return *root_;
    }

    NodeType& WalkDirectories(const std::vector<std::string>& dirpath,
                              const std::string& path, bool create_parents) {
        NodeType* current = &MutRoot();
        for (const auto& part : dirpath) {
            NodeType* next = current->GetMutChild(part);
            if (next == nullptr) {
                if (!create_parents) {
                    throw TreeError(ErrorKind::NotFound, path);
                }
                next = &current->MakeDirectory(part);
            } else if (!next->IsDirectory()) {
                throw TreeError(ErrorKind::NotADirectory, path);
            }
            current = next;
        }
        return *current;
    }

    void AddUniqueFile(NodeType& dir, const std::string& stem, V value,
                       const std::string& path) {
        if (dir.GetChild(stem) != nullptr) {
            throw TreeError(ErrorKind::AlreadyExists, path);
        }
        dir.AddFile(stem, std::move(value));
    }

    std::unique_ptr<NodeType> root_;
};

}  // namespace fs_tree
