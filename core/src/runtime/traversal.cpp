#include "traversal.h"

#include <algorithm>

namespace hql::runtime {

void for_each_in_subtree(const TreeAdapter& tree,
                         NodeHandle node,
                         const std::function<void(NodeHandle)>& visit) {
  std::vector<NodeHandle> stack;
  stack.push_back(node);
  while (!stack.empty()) {
    NodeHandle current = stack.back();
    stack.pop_back();
    visit(current);
    const auto& children = tree.children(current);
    // Push in reverse so the first child is visited next.
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      stack.push_back(*it);
    }
  }
}

std::vector<NodeHandle> subtree_nodes(const TreeAdapter& tree, NodeHandle node) {
  std::vector<NodeHandle> out;
  for_each_in_subtree(tree, node, [&](NodeHandle n) { out.push_back(n); });
  return out;
}

std::string subtree_text(const TreeAdapter& tree, NodeHandle node) {
  std::string out;
  for_each_in_subtree(tree, node, [&](NodeHandle n) {
    if (tree.kind(n) == NodeKind::Text) out += tree.text_content(n);
  });
  return out;
}

std::vector<NodeHandle> normalize_node_set(const TreeAdapter& tree, std::vector<NodeHandle> nodes) {
  std::sort(nodes.begin(), nodes.end(), [&](NodeHandle a, NodeHandle b) {
    return tree.document_position(a) < tree.document_position(b);
  });
  nodes.erase(std::unique(nodes.begin(), nodes.end(),
                          [&](NodeHandle a, NodeHandle b) {
                            return tree.document_position(a) == tree.document_position(b);
                          }),
              nodes.end());
  return nodes;
}

}  // namespace hql::runtime
