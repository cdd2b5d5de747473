#include "html_document.h"

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include <climits>
#include <memory>
#include <stdexcept>

#include "../util/string_util.h"

namespace hql {

HtmlDocument::HtmlDocument() {
  HtmlNode root;
  root.id = 0;
  root.kind = NodeKind::Element;
  nodes_.push_back(std::move(root));
}

NodeHandle HtmlDocument::root() const { return 0; }

NodeKind HtmlDocument::kind(NodeHandle node) const { return at(node).kind; }

const std::string& HtmlDocument::tag(NodeHandle node) const { return at(node).tag; }

const std::string& HtmlDocument::text_content(NodeHandle node) const { return at(node).text; }

std::optional<std::string> HtmlDocument::attribute(NodeHandle node, const std::string& name) const {
  const HtmlNode& n = at(node);
  for (const auto& attr : n.attributes) {
    if (attr.first == name) return attr.second;
  }
  return std::nullopt;
}

std::vector<std::pair<std::string, std::string>> HtmlDocument::attributes(NodeHandle node) const {
  return at(node).attributes;
}

const std::vector<NodeHandle>& HtmlDocument::children(NodeHandle node) const { return at(node).children; }

std::optional<NodeHandle> HtmlDocument::parent(NodeHandle node) const { return at(node).parent_id; }

int64_t HtmlDocument::document_position(NodeHandle node) const { return at(node).id; }

const HtmlNode& HtmlDocument::at(NodeHandle node) const {
  if (node < 0 || static_cast<size_t>(node) >= nodes_.size()) {
    throw std::out_of_range("Node handle out of range: " + std::to_string(node));
  }
  return nodes_[static_cast<size_t>(node)];
}

HtmlDocumentBuilder::HtmlDocumentBuilder() {
  open_.push_back(doc_.root());
}

int64_t HtmlDocumentBuilder::open_element(const std::string& tag,
                                          const std::vector<std::pair<std::string, std::string>>& attributes) {
  HtmlNode node;
  node.kind = NodeKind::Element;
  node.tag = tag;
  for (const auto& attr : attributes) {
    bool seen = false;
    for (const auto& existing : node.attributes) {
      if (existing.first == attr.first) {
        seen = true;
        break;
      }
    }
    if (!seen) node.attributes.push_back(attr);
  }
  int64_t id = append(std::move(node));
  open_.push_back(id);
  return id;
}

int64_t HtmlDocumentBuilder::add_text(const std::string& text) {
  HtmlNode node;
  node.kind = NodeKind::Text;
  node.text = text;
  return append(std::move(node));
}

void HtmlDocumentBuilder::close_element() {
  if (open_.size() <= 1) {
    throw std::logic_error("close_element called with no open element");
  }
  open_.pop_back();
}

HtmlDocument HtmlDocumentBuilder::finish() {
  open_.resize(1);
  return std::move(doc_);
}

int64_t HtmlDocumentBuilder::append(HtmlNode node) {
  int64_t id = static_cast<int64_t>(doc_.nodes_.size());
  int64_t parent = open_.back();
  node.id = id;
  node.parent_id = parent;
  doc_.nodes_.push_back(std::move(node));
  doc_.nodes_[static_cast<size_t>(parent)].children.push_back(id);
  return id;
}

namespace {

void ensure_libxml_initialized() {
  // WHY: xmlInitParser is not safe to race; a function-local static serializes the first call.
  static const bool initialized = [] {
    xmlInitParser();
    return true;
  }();
  (void)initialized;
}

std::vector<std::pair<std::string, std::string>> read_attributes(xmlNode* node) {
  std::vector<std::pair<std::string, std::string>> out;
  for (xmlAttr* attr = node->properties; attr != nullptr; attr = attr->next) {
    std::string name = util::to_lower(reinterpret_cast<const char*>(attr->name));
    xmlChar* value = xmlNodeListGetString(node->doc, attr->children, 1);
    if (value) {
      out.emplace_back(std::move(name), reinterpret_cast<const char*>(value));
      xmlFree(value);
    } else {
      out.emplace_back(std::move(name), "");
    }
  }
  return out;
}

/// Copies the libxml2 tree into the builder in pre-order.
/// Uses an explicit stack so deeply nested markup cannot exhaust the call stack.
void walk_nodes(HtmlDocumentBuilder& builder, xmlNode* first) {
  struct Frame {
    xmlNode* next = nullptr;
    bool closes_element = false;
  };
  std::vector<Frame> stack;
  stack.push_back(Frame{first, false});
  while (!stack.empty()) {
    Frame& frame = stack.back();
    xmlNode* cur = frame.next;
    if (cur == nullptr) {
      bool closes = frame.closes_element;
      stack.pop_back();
      if (closes) builder.close_element();
      continue;
    }
    frame.next = cur->next;
    if (cur->type == XML_ELEMENT_NODE) {
      builder.open_element(util::to_lower(reinterpret_cast<const char*>(cur->name)), read_attributes(cur));
      stack.push_back(Frame{cur->children, true});
    } else if (cur->type == XML_TEXT_NODE || cur->type == XML_CDATA_SECTION_NODE) {
      if (cur->content && *cur->content) {
        builder.add_text(reinterpret_cast<const char*>(cur->content));
      }
    } else if (cur->type != XML_COMMENT_NODE && cur->type != XML_PI_NODE &&
               cur->type != XML_DTD_NODE && cur->children) {
      stack.push_back(Frame{cur->children, false});
    }
  }
}

}  // namespace

HtmlDocument parse_html(std::string_view html, ParseMode mode) {
  if (html.size() > static_cast<size_t>(INT_MAX)) {
    throw std::length_error("HTML input too large: " + std::to_string(html.size()) + " bytes");
  }
  ensure_libxml_initialized();
  HtmlDocumentBuilder builder;
  int options = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET;
  if (mode == ParseMode::Fragment) {
    options |= HTML_PARSE_NOIMPLIED;
  }
  std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)> html_doc(
      htmlReadMemory(html.data(), static_cast<int>(html.size()), nullptr, "UTF-8", options),
      &xmlFreeDoc);
  if (!html_doc) {
    return builder.finish();
  }
  if (html_doc->children) {
    walk_nodes(builder, html_doc->children);
  }
  return builder.finish();
}

}  // namespace hql
