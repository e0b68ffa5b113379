#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "fs_tree/tree_error.hpp"

namespace fs_tree {

/**
 * Node: one element of a TreeMap, either a Directory or a File
 *
 * - Directory: name + ordered list of exclusively owned children
 * - File: name + payload value of type V
 *
 * A node is always exactly one of the two. Children are owned through
 * unique_ptr, so destroying a directory destroys its whole subtree and
 * no cycles can form. Child lookup is a linear scan by exact name, first
 * match wins.
 *
 * Folds (ValueReduce, Reduce) visit leaves depth-first in pre-order:
 * children in insertion order, a subdirectory fully before its next
 * sibling. Directories themselves never contribute.
 */
template <typename V>
class Node {
public:
    using NodePtr = std::unique_ptr<Node>;

    static NodePtr NewDirectory(const std::string& name) {
        return NodePtr(new Node(name, Directory{}));
    }

    static NodePtr NewFile(const std::string& name, V value) {
        return NodePtr(new Node(name, File{std::move(value)}));
    }

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    const std::string& GetName() const { return name_; }

    bool IsDirectory() const { return std::holds_alternative<Directory>(content_); }
    bool IsFile() const { return std::holds_alternative<File>(content_); }

    /**
     * Find a direct child by name
     *
     * @return the first child named `name`, or nullptr if there is none
     *         or this node is a File
     */
    const Node* GetChild(const std::string& name) const {
        const Directory* dir = std::get_if<Directory>(&content_);
        if (dir == nullptr) {
            return nullptr;
        }
        for (const auto& child : dir->children) {
            if (child->name_ == name) {
                return child.get();
            }
        }
        return nullptr;
    }

    Node* GetMutChild(const std::string& name) {
        Directory* dir = std::get_if<Directory>(&content_);
        if (dir == nullptr) {
            return nullptr;
        }
        for (auto& child : dir->children) {
            if (child->name_ == name) {
                return child.get();
            }
        }
        return nullptr;
    }

    // Borrowed children in insertion order, empty for a File
    std::vector<const Node*> GetChildren() const {
        std::vector<const Node*> result;
        if (const Directory* dir = std::get_if<Directory>(&content_)) {
            result.reserve(dir->children.size());
            for (const auto& child : dir->children) {
                result.push_back(child.get());
            }
        }
        return result;
    }

    /**
     * Payload of a File
     *
     * @throws TreeError(NotAFile) on a Directory
     */
    const V& GetFileValue() const {
        const File* file = std::get_if<File>(&content_);
        if (file == nullptr) {
            throw TreeError(ErrorKind::NotAFile, name_);
        }
        return file->value;
    }

    V& GetMutFileValue() {
        File* file = std::get_if<File>(&content_);
        if (file == nullptr) {
            throw TreeError(ErrorKind::NotAFile, name_);
        }
        return file->value;
    }

    /**
     * Append a new empty Directory child
     *
     * No duplicate check: the caller decides whether the name is free.
     * @return the new child
     * @throws TreeError(NotADirectory) on a File
     */
    Node& MakeDirectory(const std::string& name) {
        return Append(NewDirectory(name));
    }

    /**
     * Append a new File child holding `value`
     *
     * @throws TreeError(NotADirectory) on a File
     */
    Node& AddFile(const std::string& name, V value) {
        return Append(NewFile(name, std::move(value)));
    }

    /**
     * Remove every child named `name`
     *
     * @return number of children removed (0 if none matched)
     * @throws TreeError(NotADirectory) on a File
     */
    size_t RemoveChildren(const std::string& name) {
        auto& children = MutDirectory().children;
        size_t before = children.size();
        children.erase(
            std::remove_if(children.begin(), children.end(),
                           [&name](const NodePtr& child) { return child->name_ == name; }),
            children.end());
        return before - children.size();
    }

    /**
     * Fold over every leaf value of the subtree
     *
     * @param seed initial accumulator
     * @param combine called as combine(acc, value) -> new acc, once per File
     */
    template <typename T, typename F>
    T ValueReduce(T seed, F combine) const {
        return FoldValues(std::move(seed), combine);
    }

    /**
     * Same traversal as ValueReduce, but combine also receives the leaf name:
     * combine(acc, name, value) -> new acc
     */
    template <typename T, typename F>
    T Reduce(T seed, F combine) const {
        return FoldEntries(std::move(seed), combine);
    }

    /**
     * Total of the subtree: a File's own value, or the sum of all leaves
     * under a Directory. Needs V{} as identity and operator+.
     */
    V GetValue() const {
        return ValueReduce(V{}, [](V total, const V& value) { return total + value; });
    }

    // Deep copy of this subtree
    NodePtr Clone() const {
        if (const File* file = std::get_if<File>(&content_)) {
            return NewFile(name_, file->value);
        }
        NodePtr copy = NewDirectory(name_);
        for (const auto& child : std::get<Directory>(content_).children) {
            copy->Append(child->Clone());
        }
        return copy;
    }

private:
    struct Directory {
        std::vector<NodePtr> children;
    };

    struct File {
        V value;
    };

    Node(const std::string& name, Directory dir)
        : name_(name), content_(std::move(dir)) {}
    Node(const std::string& name, File file)
        : name_(name), content_(std::move(file)) {}

    Directory& MutDirectory() {
        Directory* dir = std::get_if<Directory>(&content_);
        if (dir == nullptr) {
            throw TreeError(ErrorKind::NotADirectory, name_);
        }
        return *dir;
    }

    Node& Append(NodePtr child) {
        auto& children = MutDirectory().children;
        children.push_back(std::move(child));
        return *children.back();
    }

    template <typename T, typename F>
    T FoldValues(T acc, F& combine) const {
        if (const File* file = std::get_if<File>(&content_)) {
            return combine(std::move(acc), file->value);
        }
        for (const auto& child : std::get<Directory>(content_).children) {
            acc = child->FoldValues(std::move(acc), combine);
        }
        return acc;
    }

    template <typename T, typename F>
    T FoldEntries(T acc, F& combine) const {
        if (const File* file = std::get_if<File>(&content_)) {
            return combine(std::move(acc), name_, file->value);
        }
        for (const auto& child : std::get<Directory>(content_).children) {
            acc = child->FoldEntries(std::move(acc), combine);
        }
        return acc;
    }

    std::string name_;
    std::variant<Directory, File> content_;
};

}  // namespace fs_tree
