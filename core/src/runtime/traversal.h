#pragma once

#include <functional>
#include <string>
#include <vector>

#include "hql/tree.h"

namespace hql::runtime {

/// Visits node and every node below it in document order.
/// MUST use an explicit work-list so traversal depth is not bounded by the call stack.
void for_each_in_subtree(const TreeAdapter& tree,
                         NodeHandle node,
                         const std::function<void(NodeHandle)>& visit);

/// Collects node and all of its descendants in document order.
std::vector<NodeHandle> subtree_nodes(const TreeAdapter& tree, NodeHandle node);

/// Concatenates the content of every text node in the subtree, in document order, without separators.
std::string subtree_text(const TreeAdapter& tree, NodeHandle node);

/// Sorts nodes into document order and removes duplicates.
std::vector<NodeHandle> normalize_node_set(const TreeAdapter& tree, std::vector<NodeHandle> nodes);

}  // namespace hql::runtime
