#include "test_harness.h"

#include <string>
#include <variant>
#include <vector>

#include "hql/pipeline.h"

namespace {

hql::Pipeline parse_ok(const std::string& query) {
  hql::ParseResult parsed = hql::parse_pipeline(query);
  expect_true(parsed.pipeline.has_value(), "query parses: " + query);
  expect_true(!parsed.error.has_value(), "no error for: " + query);
  return parsed.pipeline.value_or(hql::Pipeline{});
}

void expect_parse_error(const std::string& query, hql::ParseError::Kind kind) {
  hql::ParseResult parsed = hql::parse_pipeline(query);
  expect_true(!parsed.pipeline.has_value(), "query rejected: " + query);
  if (!parsed.error.has_value()) {
    expect_true(false, "error present for: " + query);
    return;
  }
  expect_eq(hql::parse_error_kind_name(parsed.error->kind), hql::parse_error_kind_name(kind),
            "error kind for: " + query);
}

void test_compile_is_deterministic() {
  const std::string query = "@path(`//div/p`) | @class(`x`, 0) | @child(-1) | #text() | #trim()";
  hql::Pipeline first = parse_ok(query);
  hql::Pipeline second = parse_ok(query);
  expect_true(hql::same_stages(first, second), "same input compiles to the same stages");
  expect_eq(hql::describe_pipeline(first), hql::describe_pipeline(second), "same normalized text");
}

void test_path_literal_decomposes_into_segments() {
  hql::Pipeline pipeline = parse_ok("@path(`/a//b/c`)");
  expect_eq(pipeline.stages.size(), 3, "three path segments");
  if (pipeline.stages.size() != 3) return;
  const auto* a = std::get_if<hql::PathStage>(&pipeline.stages[0]);
  const auto* b = std::get_if<hql::PathStage>(&pipeline.stages[1]);
  const auto* c = std::get_if<hql::PathStage>(&pipeline.stages[2]);
  expect_true(a && a->kind == hql::PathKind::Child && a->tag == "a", "first is child a");
  expect_true(b && b->kind == hql::PathKind::Descendant && b->tag == "b", "second is descendant b");
  expect_true(c && c->kind == hql::PathKind::Child && c->tag == "c", "third is child c");
}

void test_every_operator_parses() {
  hql::Pipeline pipeline = parse_ok(
      "@flat() | @path(`/x`) | @attr(`data-k`) | @attr(`k`, `v_1`) | @id(`main`) | @id(`main`, 0) | "
      "@class(`card`, 1) | @child(2)");
  expect_eq(pipeline.stages.size(), 8, "eight map stages");
  hql::Pipeline extract = parse_ok("#text() | #trim() | #trimPrefix(`ab`) | #trimSuffix(`cd`)");
  expect_eq(extract.stages.size(), 4, "four extract stages");
  hql::Pipeline attr = parse_ok("#attr(`href`)");
  expect_true(std::holds_alternative<hql::AttrExtractStage>(attr.stages[0]), "#attr is an extract stage");
}

void test_case_flag_defaults_and_values() {
  hql::Pipeline pipeline = parse_ok("@id(`a`) | @id(`a`, 0) | @class(`b`, 1)");
  const auto* id_default = std::get_if<hql::IdStage>(&pipeline.stages[0]);
  const auto* id_ci = std::get_if<hql::IdStage>(&pipeline.stages[1]);
  const auto* cls = std::get_if<hql::ClassStage>(&pipeline.stages[2]);
  expect_true(id_default && id_default->case_sensitive, "case sensitive by default");
  expect_true(id_ci && !id_ci->case_sensitive, "0 selects case-insensitive");
  expect_true(cls && cls->case_sensitive, "1 selects case-sensitive");
}

void test_child_index_values() {
  hql::Pipeline zero = parse_ok("@child(-0)");
  const auto* z = std::get_if<hql::ChildStage>(&zero.stages[0]);
  expect_true(z && z->index == 0, "-0 equals 0");
  hql::Pipeline padded = parse_ok("@child(007)");
  const auto* p = std::get_if<hql::ChildStage>(&padded.stages[0]);
  expect_true(p && p->index == 7, "leading zeros allowed");
  hql::Pipeline last = parse_ok("@child(-1)");
  const auto* l = std::get_if<hql::ChildStage>(&last.stages[0]);
  expect_true(l && l->index == -1, "negative index kept");
}

void test_whitespace_is_insignificant_between_tokens() {
  hql::Pipeline spaced = parse_ok("  @path( `/a` )\n|\t#text( )  ");
  hql::Pipeline tight = parse_ok("@path(`/a`)|#text()");
  expect_true(hql::same_stages(spaced, tight), "whitespace does not change stages");
}

void test_parser_allows_map_after_extract() {
  hql::Pipeline pipeline = parse_ok("#text() | @child(0)");
  expect_eq(pipeline.stages.size(), 2, "stage order is checked at evaluation time");
}

void test_describe_pipeline_is_canonical() {
  hql::Pipeline pipeline = parse_ok("@path(`/a//b`)|@id(`x`)|  #trimPrefix(`ab`)");
  expect_eq(hql::describe_pipeline(pipeline), "@path(`/a//b`) | @id(`x`, 1) | #trimPrefix(`ab`)",
            "normalized pipeline text");
  hql::Pipeline split = parse_ok("@path(`/a`) | @path(`/b`)");
  expect_eq(hql::describe_pipeline(split), "@path(`/a`) | @path(`/b`)", "separate @path stages stay separate");
}

void test_malformed_stages() {
  using Kind = hql::ParseError::Kind;
  expect_parse_error("", Kind::MalformedStage);
  expect_parse_error("   ", Kind::MalformedStage);
  expect_parse_error("@path(`/a`) |", Kind::MalformedStage);
  expect_parse_error("| #text()", Kind::MalformedStage);
  expect_parse_error("@path(`/a`) #text()", Kind::MalformedStage);
  expect_parse_error("@flat", Kind::MalformedStage);
  expect_parse_error("@path(`a`)", Kind::MalformedStage);
  expect_parse_error("@path(`///a`)", Kind::MalformedStage);
  expect_parse_error("@path(`/`)", Kind::MalformedStage);
  expect_parse_error("@path(``)", Kind::MalformedStage);
  expect_parse_error("@path(`/h1`)", Kind::MalformedStage);
  expect_parse_error("@attr(`a|b`)", Kind::MalformedStage);
  expect_parse_error("@id(`x`, 2)", Kind::MalformedStage);
  expect_parse_error("@class(`x`, `1`)", Kind::MalformedStage);
  expect_parse_error("#trimPrefix(`a b`)", Kind::MalformedStage);
  expect_parse_error("#trimSuffix(`a1`)", Kind::MalformedStage);
  expect_parse_error("text()", Kind::MalformedStage);
}

void test_arity_mismatch() {
  using Kind = hql::ParseError::Kind;
  expect_parse_error("@attr()", Kind::ArityMismatch);
  expect_parse_error("@attr(`a`, `b`, `c`)", Kind::ArityMismatch);
  expect_parse_error("@id()", Kind::ArityMismatch);
  expect_parse_error("@class(`a`, 1, 0)", Kind::ArityMismatch);
  expect_parse_error("@flat(`a`)", Kind::ArityMismatch);
  expect_parse_error("#text(`a`)", Kind::ArityMismatch);
  expect_parse_error("@path()", Kind::ArityMismatch);
  expect_parse_error("@child()", Kind::ArityMismatch);
  expect_parse_error("@child(1, 2)", Kind::ArityMismatch);
  expect_parse_error("#attr(`a`, `b`)", Kind::ArityMismatch);
}

void test_invalid_numbers() {
  using Kind = hql::ParseError::Kind;
  expect_parse_error("@child(1a)", Kind::InvalidNumber);
  expect_parse_error("@child(-)", Kind::InvalidNumber);
  expect_parse_error("@child(99999999999999999999)", Kind::InvalidNumber);
  expect_parse_error("@child(`1`)", Kind::InvalidNumber);
}

void test_unterminated_and_unknown() {
  using Kind = hql::ParseError::Kind;
  expect_parse_error("@path(`//a)", Kind::UnterminatedLiteral);
  expect_parse_error("#trimPrefix(`ab", Kind::UnterminatedLiteral);
  expect_parse_error("@foo()", Kind::UnknownOperator);
  expect_parse_error("@Path(`/a`)", Kind::UnknownOperator);
  expect_parse_error("#Text()", Kind::UnknownOperator);
}

void test_error_reports_position_and_segment() {
  hql::ParseResult parsed = hql::parse_pipeline("@path(`//a`) | @foo()");
  if (!parsed.error.has_value()) {
    expect_true(false, "unknown operator rejected");
    return;
  }
  expect_eq(parsed.error->position, 15, "position of the unknown operator");
  expect_eq(parsed.error->segment, "@foo()", "segment is the failing stage");
  expect_true(parsed.error->message.find("@foo") != std::string::npos, "message names the operator");
}

void test_stage_spans_cover_source() {
  hql::Pipeline pipeline = parse_ok("@flat() | #text()");
  const auto* flat = std::get_if<hql::FlatStage>(&pipeline.stages[0]);
  const auto* text = std::get_if<hql::TextStage>(&pipeline.stages[1]);
  expect_true(flat && flat->span.start == 0 && flat->span.end == 7, "span of @flat()");
  expect_true(text && text->span.start == 10 && text->span.end == 17, "span of #text()");
}

}  // namespace

void register_parser_tests(std::vector<TestCase>& tests) {
  tests.push_back({"compile_is_deterministic", test_compile_is_deterministic});
  tests.push_back({"path_literal_decomposes_into_segments", test_path_literal_decomposes_into_segments});
  tests.push_back({"every_operator_parses", test_every_operator_parses});
  tests.push_back({"case_flag_defaults_and_values", test_case_flag_defaults_and_values});
  tests.push_back({"child_index_values", test_child_index_values});
  tests.push_back({"whitespace_is_insignificant_between_tokens", test_whitespace_is_insignificant_between_tokens});
  tests.push_back({"parser_allows_map_after_extract", test_parser_allows_map_after_extract});
  tests.push_back({"describe_pipeline_is_canonical", test_describe_pipeline_is_canonical});
  tests.push_back({"malformed_stages", test_malformed_stages});
  tests.push_back({"arity_mismatch", test_arity_mismatch});
  tests.push_back({"invalid_numbers", test_invalid_numbers});
  tests.push_back({"unterminated_and_unknown", test_unterminated_and_unknown});
  tests.push_back({"error_reports_position_and_segment", test_error_reports_position_and_segment});
  tests.push_back({"stage_spans_cover_source", test_stage_spans_cover_source});
}
