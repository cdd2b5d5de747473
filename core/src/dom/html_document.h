#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "hql/hql.h"
#include "hql/tree.h"

namespace hql {

/// One materialized node. Element nodes carry tag/attributes; text nodes carry text.
struct HtmlNode {
  int64_t id = 0;
  NodeKind kind = NodeKind::Element;
  std::string tag;
  std::string text;
  std::vector<std::pair<std::string, std::string>> attributes;
  std::optional<int64_t> parent_id;
  std::vector<int64_t> children;
};

/// Arena-backed document tree; node ids are assigned in pre-order so id == document position.
/// Node 0 is a synthetic root (Element with empty tag) whose children are the top-level nodes.
/// MUST be immutable once built so it can be shared across concurrent evaluations.
class HtmlDocument : public TreeAdapter {
 public:
  HtmlDocument();

  NodeHandle root() const override;
  NodeKind kind(NodeHandle node) const override;
  const std::string& tag(NodeHandle node) const override;
  const std::string& text_content(NodeHandle node) const override;
  std::optional<std::string> attribute(NodeHandle node, const std::string& name) const override;
  std::vector<std::pair<std::string, std::string>> attributes(NodeHandle node) const override;
  const std::vector<NodeHandle>& children(NodeHandle node) const override;
  std::optional<NodeHandle> parent(NodeHandle node) const override;
  int64_t document_position(NodeHandle node) const override;

  const std::vector<HtmlNode>& nodes() const { return nodes_; }
  size_t size() const { return nodes_.size(); }

 private:
  friend class HtmlDocumentBuilder;

  /// MUST throw std::out_of_range for handles that do not belong to this document.
  const HtmlNode& at(NodeHandle node) const;

  std::vector<HtmlNode> nodes_;
};

/// Builds documents in pre-order: open an element, add its content, close it.
/// Used by the libxml2 loader and by callers that bring their own parser output.
class HtmlDocumentBuilder {
 public:
  HtmlDocumentBuilder();

  /// Appends an element under the currently open node and makes it current.
  /// Duplicate attribute names keep the first value.
  int64_t open_element(const std::string& tag,
                       const std::vector<std::pair<std::string, std::string>>& attributes = {});
  /// Appends a text node under the currently open node.
  int64_t add_text(const std::string& text);
  /// Closes the current element.
  /// MUST throw std::logic_error when only the synthetic root is open.
  void close_element();
  /// Returns the finished document, implicitly closing any open elements.
  HtmlDocument finish();

 private:
  int64_t append(HtmlNode node);

  HtmlDocument doc_;
  std::vector<int64_t> open_;
};

/// Parses markup with libxml2's recovering HTML parser.
/// MUST NOT throw on malformed markup; unparsable input yields an empty root.
/// Comments, processing instructions and doctypes are dropped; names are lowercased.
/// MUST throw std::length_error when the input exceeds INT_MAX bytes (libxml2's length limit).
HtmlDocument parse_html(std::string_view html, ParseMode mode = ParseMode::Document);

}  // namespace hql
