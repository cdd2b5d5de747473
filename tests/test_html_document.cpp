#include "test_harness.h"
#include "test_utils.h"

#include <climits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

void test_builder_assigns_preorder_ids() {
  hql::HtmlDocument doc = build_sample_tree();
  expect_eq(doc.size(), 14, "node count including synthetic root");
  expect_true(doc.root() == 0, "root is node 0");
  expect_true(doc.tag(doc.root()).empty(), "root has an empty tag");
  expect_true(doc.children(0) == std::vector<hql::NodeHandle>({1, 9}), "top-level children");
  expect_true(doc.parent(4) == std::optional<hql::NodeHandle>(2), "b is inside the first p");
  expect_true(!doc.parent(0).has_value(), "root has no parent");
  expect_true(doc.kind(3) == hql::NodeKind::Text, "text node kind");
  expect_eq(doc.text_content(3), "  Hi ", "text node content");
  expect_eq(static_cast<size_t>(doc.document_position(12)), 12, "id doubles as document position");
}

void test_builder_keeps_first_duplicate_attribute() {
  hql::HtmlDocumentBuilder builder;
  builder.open_element("a", {{"href", "first"}, {"rel", "x"}, {"href", "second"}});
  hql::HtmlDocument doc = builder.finish();
  expect_true(doc.attribute(1, "href") == std::optional<std::string>("first"), "first value wins");
  expect_eq(doc.attributes(1).size(), 2, "duplicate dropped");
  expect_true(!doc.attribute(1, "missing").has_value(), "missing attribute");
}

void test_builder_rejects_unbalanced_close() {
  hql::HtmlDocumentBuilder builder;
  bool threw = false;
  try {
    builder.close_element();
  } catch (const std::logic_error&) {
    threw = true;
  }
  expect_true(threw, "closing the root is a logic error");
}

void test_unknown_handle_throws() {
  hql::HtmlDocument doc = build_sample_tree();
  bool threw = false;
  try {
    doc.kind(99);
  } catch (const std::out_of_range&) {
    threw = true;
  }
  expect_true(threw, "foreign handle is rejected");
}

void test_parse_html_document_mode_wraps_body() {
  hql::HtmlDocument doc = hql::parse_html("<p>Hi</p>", hql::ParseMode::Document);
  hql::EvalResult result = eval_query(doc, "@path(`/html/body/p`) | #text()");
  expect_true(result.value.has_value() && result.value->text == "Hi", "implied html/body wrappers");
}

void test_parse_html_fragment_mode_keeps_top_level() {
  hql::HtmlDocument doc = hql::parse_html("<p>Hi</p>", hql::ParseMode::Fragment);
  expect_eq(eval_nodes(doc, "@path(`/p`)").size(), 1, "fragment keeps p at top level");
  expect_eq(eval_nodes(doc, "@path(`//html`)").size(), 0, "fragment adds no html element");
}

void test_parse_html_lowercases_names() {
  hql::HtmlDocument doc = hql::parse_html("<DIV CLASS=\"Big\" Data-X=\"1\">t</DIV>", hql::ParseMode::Fragment);
  std::vector<hql::NodeHandle> divs = eval_nodes(doc, "@path(`/div`)");
  expect_eq(divs.size(), 1, "uppercase tag found as div");
  if (divs.empty()) return;
  expect_eq(doc.tag(divs[0]), "div", "tag lowercased");
  expect_true(doc.attribute(divs[0], "class") == std::optional<std::string>("Big"), "attribute values keep case");
  expect_true(doc.attribute(divs[0], "data-x").has_value(), "attribute names lowercased");
}

void test_parse_html_drops_comments() {
  hql::HtmlDocument doc = hql::parse_html("<div><!-- note --><p>a</p></div>", hql::ParseMode::Fragment);
  std::vector<hql::NodeHandle> first = eval_nodes(doc, "@path(`/div`) | @child(0)");
  expect_eq(first.size(), 1, "div has a first child");
  if (first.empty()) return;
  expect_eq(doc.tag(first[0]), "p", "comment is not a child");
}

void test_parse_html_empty_input() {
  hql::HtmlDocument doc = hql::parse_html("", hql::ParseMode::Document);
  expect_true(doc.size() >= 1, "empty input still has a root");
  expect_eq(eval_nodes(doc, "@path(`//p`)").size(), 0, "nothing to select");
}

void test_parse_html_rejects_oversized_input() {
  // The length check runs before libxml2 reads any byte, so a view over a small buffer is enough.
  const char buffer[] = "<p>x</p>";
  std::string_view oversized(buffer, static_cast<size_t>(INT_MAX) + 1);
  bool threw = false;
  try {
    hql::parse_html(oversized, hql::ParseMode::Fragment);
  } catch (const std::length_error&) {
    threw = true;
  }
  expect_true(threw, "input past INT_MAX bytes is rejected");
}

}  // namespace

void register_html_document_tests(std::vector<TestCase>& tests) {
  tests.push_back({"builder_assigns_preorder_ids", test_builder_assigns_preorder_ids});
  tests.push_back({"builder_keeps_first_duplicate_attribute", test_builder_keeps_first_duplicate_attribute});
  tests.push_back({"builder_rejects_unbalanced_close", test_builder_rejects_unbalanced_close});
  tests.push_back({"unknown_handle_throws", test_unknown_handle_throws});
  tests.push_back({"parse_html_document_mode_wraps_body", test_parse_html_document_mode_wraps_body});
  tests.push_back({"parse_html_fragment_mode_keeps_top_level", test_parse_html_fragment_mode_keeps_top_level});
  tests.push_back({"parse_html_lowercases_names", test_parse_html_lowercases_names});
  tests.push_back({"parse_html_drops_comments", test_parse_html_drops_comments});
  tests.push_back({"parse_html_empty_input", test_parse_html_empty_input});
  tests.push_back({"parse_html_rejects_oversized_input", test_parse_html_rejects_oversized_input});
}
