#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include "fs_tree/node.hpp"
#include "fs_tree/tree_map.hpp"

namespace fs_tree {

/**
 * Print a subtree, one line per node
 *
 * Two spaces of indentation per level; directories as "name",
 * files as "name: value". Diagnostic output only.
 */
template <typename V>
void PrintNode(const Node<V>& node, std::ostream& out, size_t depth = 0) {
    out << std::string(depth * 2, ' ') << node.GetName();
    if (node.IsFile()) {
        out << ": " << node.GetFileValue();
    }
    out << '\n';
    for (const Node<V>* child : node.GetChildren()) {
        PrintNode(*child, out, depth + 1);
    }
}

template <typename V>
void PrintTree(const TreeMap<V>& tree, std::ostream& out = std::cout) {
    PrintNode(tree.Root(), out);
}

}  // namespace fs_tree
