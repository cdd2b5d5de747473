#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hql {

/// Opaque reference to a node owned by a TreeAdapter.
/// MUST only be interpreted by the adapter that produced it.
using NodeHandle = int64_t;

/// Classifies nodes the engine can see; other markup (comments, doctype) is never exposed.
enum class NodeKind {
  Element,
  Text,
};

/// Read-only view over a document tree that the evaluator queries.
/// MUST be safe for concurrent reads when evaluations run in parallel.
/// Inputs are node handles; outputs are copies or views with no side effects.
class TreeAdapter {
 public:
  virtual ~TreeAdapter() = default;

  /// Returns the handle used as the default evaluation context.
  virtual NodeHandle root() const = 0;
  virtual NodeKind kind(NodeHandle node) const = 0;
  /// Returns the element tag name; empty for text nodes.
  virtual const std::string& tag(NodeHandle node) const = 0;
  /// Returns the text content of a text node; empty for elements.
  virtual const std::string& text_content(NodeHandle node) const = 0;
  /// Looks up an attribute value by exact name.
  /// MUST return nullopt for text nodes and for missing attributes.
  virtual std::optional<std::string> attribute(NodeHandle node, const std::string& name) const = 0;
  /// Returns all attributes in stored order; names are unique within a node.
  virtual std::vector<std::pair<std::string, std::string>> attributes(NodeHandle node) const = 0;
  /// Returns direct children in stored order.
  virtual const std::vector<NodeHandle>& children(NodeHandle node) const = 0;
  virtual std::optional<NodeHandle> parent(NodeHandle node) const = 0;
  /// Returns the pre-order position of the node within its document.
  /// MUST be a strict total order consistent with depth-first traversal.
  virtual int64_t document_position(NodeHandle node) const = 0;
};

}  // namespace hql
