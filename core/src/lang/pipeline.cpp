#include "hql/pipeline.h"

#include <sstream>

namespace hql {

namespace {

std::string quote(const std::string& s) {
  return "`" + s + "`";
}

struct NameVisitor {
  std::string operator()(const FlatStage&) const { return "@flat"; }
  std::string operator()(const PathStage&) const { return "@path"; }
  std::string operator()(const AttrStage&) const { return "@attr"; }
  std::string operator()(const IdStage&) const { return "@id"; }
  std::string operator()(const ClassStage&) const { return "@class"; }
  std::string operator()(const ChildStage&) const { return "@child"; }
  std::string operator()(const TextStage&) const { return "#text"; }
  std::string operator()(const TrimStage&) const { return "#trim"; }
  std::string operator()(const TrimPrefixStage&) const { return "#trimPrefix"; }
  std::string operator()(const TrimSuffixStage&) const { return "#trimSuffix"; }
  std::string operator()(const AttrExtractStage&) const { return "#attr"; }
};

std::string path_segment(const PathStage& stage) {
  return (stage.kind == PathKind::Descendant ? "//" : "/") + stage.tag;
}

struct FormatVisitor {
  std::string operator()(const FlatStage&) const { return "@flat()"; }
  std::string operator()(const PathStage& s) const { return "@path(" + quote(path_segment(s)) + ")"; }
  std::string operator()(const AttrStage& s) const {
    if (s.value.has_value()) return "@attr(" + quote(s.field) + ", " + quote(*s.value) + ")";
    return "@attr(" + quote(s.field) + ")";
  }
  std::string operator()(const IdStage& s) const {
    return "@id(" + quote(s.value) + ", " + (s.case_sensitive ? "1" : "0") + ")";
  }
  std::string operator()(const ClassStage& s) const {
    return "@class(" + quote(s.value) + ", " + (s.case_sensitive ? "1" : "0") + ")";
  }
  std::string operator()(const ChildStage& s) const { return "@child(" + std::to_string(s.index) + ")"; }
  std::string operator()(const TextStage&) const { return "#text()"; }
  std::string operator()(const TrimStage&) const { return "#trim()"; }
  std::string operator()(const TrimPrefixStage& s) const { return "#trimPrefix(" + quote(s.text) + ")"; }
  std::string operator()(const TrimSuffixStage& s) const { return "#trimSuffix(" + quote(s.text) + ")"; }
  std::string operator()(const AttrExtractStage& s) const { return "#attr(" + quote(s.field) + ")"; }
};

struct SameVisitor {
  const Stage& other;

  bool operator()(const FlatStage&) const { return std::holds_alternative<FlatStage>(other); }
  bool operator()(const PathStage& s) const {
    const auto* o = std::get_if<PathStage>(&other);
    return o && o->kind == s.kind && o->tag == s.tag;
  }
  bool operator()(const AttrStage& s) const {
    const auto* o = std::get_if<AttrStage>(&other);
    return o && o->field == s.field && o->value == s.value;
  }
  bool operator()(const IdStage& s) const {
    const auto* o = std::get_if<IdStage>(&other);
    return o && o->value == s.value && o->case_sensitive == s.case_sensitive;
  }
  bool operator()(const ClassStage& s) const {
    const auto* o = std::get_if<ClassStage>(&other);
    return o && o->value == s.value && o->case_sensitive == s.case_sensitive;
  }
  bool operator()(const ChildStage& s) const {
    const auto* o = std::get_if<ChildStage>(&other);
    return o && o->index == s.index;
  }
  bool operator()(const TextStage&) const { return std::holds_alternative<TextStage>(other); }
  bool operator()(const TrimStage&) const { return std::holds_alternative<TrimStage>(other); }
  bool operator()(const TrimPrefixStage& s) const {
    const auto* o = std::get_if<TrimPrefixStage>(&other);
    return o && o->text == s.text;
  }
  bool operator()(const TrimSuffixStage& s) const {
    const auto* o = std::get_if<TrimSuffixStage>(&other);
    return o && o->text == s.text;
  }
  bool operator()(const AttrExtractStage& s) const {
    const auto* o = std::get_if<AttrExtractStage>(&other);
    return o && o->field == s.field;
  }
};

}  // namespace

bool is_extract_stage(const Stage& stage) {
  return std::holds_alternative<TextStage>(stage) ||
         std::holds_alternative<TrimStage>(stage) ||
         std::holds_alternative<TrimPrefixStage>(stage) ||
         std::holds_alternative<TrimSuffixStage>(stage) ||
         std::holds_alternative<AttrExtractStage>(stage);
}

bool consumes_text(const Stage& stage) {
  return std::holds_alternative<TrimStage>(stage) ||
         std::holds_alternative<TrimPrefixStage>(stage) ||
         std::holds_alternative<TrimSuffixStage>(stage);
}

std::string stage_name(const Stage& stage) {
  return std::visit(NameVisitor{}, stage);
}

std::string format_stage(const Stage& stage) {
  return std::visit(FormatVisitor{}, stage);
}

std::string describe_pipeline(const Pipeline& pipeline) {
  std::ostringstream out;
  for (size_t i = 0; i < pipeline.stages.size(); ++i) {
    const Stage& stage = pipeline.stages[i];
    if (i != 0) out << " | ";
    const auto* path = std::get_if<PathStage>(&stage);
    if (!path) {
      out << format_stage(stage);
      continue;
    }
    // Segments that came from one literal share the same span; print them as one @path.
    std::string literal = path_segment(*path);
    while (i + 1 < pipeline.stages.size()) {
      const auto* next = std::get_if<PathStage>(&pipeline.stages[i + 1]);
      if (!next || next->span.start != path->span.start || next->span.end != path->span.end) break;
      literal += path_segment(*next);
      ++i;
    }
    out << "@path(" << quote(literal) << ")";
  }
  return out.str();
}

std::string parse_error_kind_name(ParseError::Kind kind) {
  switch (kind) {
    case ParseError::Kind::MalformedStage:
      return "MalformedStage";
    case ParseError::Kind::ArityMismatch:
      return "ArityMismatch";
    case ParseError::Kind::InvalidNumber:
      return "InvalidNumber";
    case ParseError::Kind::UnterminatedLiteral:
      return "UnterminatedLiteral";
    case ParseError::Kind::UnknownOperator:
      return "UnknownOperator";
  }
  return "MalformedStage";
}

bool same_stage(const Stage& left, const Stage& right) {
  return std::visit(SameVisitor{right}, left);
}

bool same_stages(const Pipeline& left, const Pipeline& right) {
  if (left.stages.size() != right.stages.size()) return false;
  for (size_t i = 0; i < left.stages.size(); ++i) {
    if (!same_stage(left.stages[i], right.stages[i])) return false;
  }
  return true;
}

}  // namespace hql
