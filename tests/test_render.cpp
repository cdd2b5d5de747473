#include "test_harness.h"
#include "test_utils.h"

#include <string>
#include <vector>

#include "render/result_renderer.h"

namespace {

void test_plain_text_result() {
  auto result = run_query("<p> a </p>", "@path(`/p`) | #text() | #trim()");
  expect_eq(hql::render::render_plain(result), "a\n", "text prints as one line");
}

void test_plain_node_rows() {
  auto result = run_query("<div><a href=\"/x\" rel=\"me\">L</a>tail</div>", "@path(`/div`) | @child(0) | @flat()");
  expect_eq(hql::render::render_plain(result), "<a href=\"/x\" rel=\"me\">\nL\n",
            "elements print as start tags and text nodes as content");
}

void test_plain_escapes_attribute_values() {
  auto result = run_query("<a title='say \"hi\" &amp; go'>x</a>", "@path(`/a`)");
  expect_eq(hql::render::render_plain(result), "<a title=\"say &quot;hi&quot; &amp; go\">\n",
            "quotes and ampersands in attribute values are escaped");
}

void test_json_text_result() {
  auto result = run_query("<p>say \"hi\"</p>", "@path(`/p`) | #text()");
  expect_eq(hql::render::render_json(result), "{\"kind\":\"text\",\"value\":\"say \\\"hi\\\"\"}",
            "text result json");
}

void test_json_node_rows() {
  auto result = run_query("<ul><li class=\"a\">x</li></ul>", "@path(`//li`)");
  std::string json = hql::render::render_json(result);
  expect_true(json.rfind("{\"kind\":\"nodes\",\"nodes\":[{\"node_id\":", 0) == 0, "nodes header");
  expect_true(json.find("\"kind\":\"element\",\"tag\":\"li\",\"text\":\"x\",\"attributes\":{\"class\":\"a\"}}") !=
                  std::string::npos,
              "row fields in stable order");
  auto empty = run_query("<ul></ul>", "@path(`//li`)");
  expect_eq(hql::render::render_json(empty), "{\"kind\":\"nodes\",\"nodes\":[]}", "empty node-set json");
}

}  // namespace

void register_render_tests(std::vector<TestCase>& tests) {
  tests.push_back({"plain_text_result", test_plain_text_result});
  tests.push_back({"plain_node_rows", test_plain_node_rows});
  tests.push_back({"plain_escapes_attribute_values", test_plain_escapes_attribute_values});
  tests.push_back({"json_text_result", test_json_text_result});
  tests.push_back({"json_node_rows", test_json_node_rows});
}
