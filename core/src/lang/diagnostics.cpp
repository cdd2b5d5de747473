#include "hql/diagnostics.h"

#include <algorithm>
#include <sstream>
#include <string_view>

#include "../util/string_util.h"

namespace hql {

namespace {

DiagnosticSpan span_from_bytes(const std::string& query, size_t byte_start, size_t byte_end) {
  DiagnosticSpan span;
  const size_t size = query.size();
  if (size == 0) {
    return span;
  }
  span.byte_start = std::min(byte_start, size - 1);
  span.byte_end = std::min(std::max(byte_end, span.byte_start + 1), size);

  size_t line = 1;
  size_t col = 1;
  for (size_t i = 0; i < span.byte_start; ++i) {
    if (query[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  span.start_line = line;
  span.start_col = col;

  for (size_t i = span.byte_start; i < span.byte_end; ++i) {
    if (query[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  span.end_line = line;
  span.end_col = col;
  return span;
}

std::string severity_name(DiagnosticSeverity severity) {
  switch (severity) {
    case DiagnosticSeverity::Error:
      return "ERROR";
    case DiagnosticSeverity::Warning:
      return "WARNING";
    case DiagnosticSeverity::Note:
      return "NOTE";
  }
  return "ERROR";
}

std::string render_code_frame(const std::string& query, const DiagnosticSpan& span) {
  if (query.empty()) return "";
  size_t line_start = 0;
  size_t current_line = 1;
  while (current_line < span.start_line && line_start < query.size()) {
    size_t nl = query.find('\n', line_start);
    if (nl == std::string::npos) break;
    line_start = nl + 1;
    ++current_line;
  }
  size_t line_end = query.find('\n', line_start);
  if (line_end == std::string::npos) line_end = query.size();
  std::string line_text = query.substr(line_start, line_end - line_start);
  if (!line_text.empty() && line_text.back() == '\r') line_text.pop_back();

  const size_t caret_start = span.start_col > 0 ? span.start_col - 1 : 0;
  size_t caret_width = 1;
  if (span.start_line == span.end_line && span.end_col > span.start_col) {
    caret_width = span.end_col - span.start_col;
  }
  if (caret_start > line_text.size()) {
    return "";
  }
  if (caret_start + caret_width > line_text.size() + 1) {
    caret_width = std::max<size_t>(1, line_text.size() > caret_start ? line_text.size() - caret_start : 1);
  }
  const size_t line_digits = std::to_string(span.start_line).size();

  std::ostringstream out;
  out << " --> line " << span.start_line << ", col " << span.start_col << "\n";
  out << std::string(line_digits, ' ') << " |\n";
  out << span.start_line << " | " << line_text << "\n";
  out << std::string(line_digits, ' ') << " | " << std::string(caret_start, ' ')
      << std::string(caret_width, '^');
  return out.str();
}

void set_syntax_code_help(Diagnostic& d, ParseError::Kind kind) {
  switch (kind) {
    case ParseError::Kind::MalformedStage:
      d.code = "HQL-SYN-0001";
      d.help = "Write each stage as @op(args) or #op(args) and separate stages with '|'.";
      return;
    case ParseError::Kind::ArityMismatch:
      d.code = "HQL-SYN-0002";
      d.help = "Check the argument count: @attr/@id/@class take 1 or 2, @path/@child/#attr/#trimPrefix/#trimSuffix take 1, the rest take none.";
      return;
    case ParseError::Kind::InvalidNumber:
      d.code = "HQL-SYN-0003";
      d.help = "Use a decimal integer such as 0, 2 or -1.";
      return;
    case ParseError::Kind::UnterminatedLiteral:
      d.code = "HQL-SYN-0004";
      d.help = "Close the literal with a matching backtick.";
      return;
    case ParseError::Kind::UnknownOperator:
      d.code = "HQL-SYN-0005";
      d.help = "Known operators: @flat @path @attr @id @class @child #text #trim #trimPrefix #trimSuffix #attr.";
      return;
  }
}

}  // namespace

Diagnostic make_syntax_diagnostic(const std::string& query, const ParseError& error) {
  Diagnostic d;
  d.severity = DiagnosticSeverity::Error;
  d.message = error.message;
  d.span = span_from_bytes(query, error.position, error.position + 1);
  set_syntax_code_help(d, error.kind);
  d.snippet = render_code_frame(query, d.span);
  return d;
}

Diagnostic make_runtime_diagnostic(const std::string& query, const EvalError& error) {
  Diagnostic d;
  d.severity = DiagnosticSeverity::Error;
  d.message = error.message;
  d.span = span_from_bytes(query, error.span.start, error.span.end);
  d.code = "HQL-RUN-0001";
  if (error.expected == EvalValue::Kind::Text) {
    d.help = error.stage + " only applies to text; add #text() or #attr(...) before it.";
  } else {
    d.help = error.stage + " needs a node-set; move it before the first #text()/#attr() stage.";
  }
  d.snippet = render_code_frame(query, d.span);
  return d;
}

Diagnostic make_io_diagnostic(const std::string& message) {
  Diagnostic d;
  d.severity = DiagnosticSeverity::Error;
  d.message = message;
  d.code = "HQL-RUN-0002";
  d.help = "Verify the input path and file permissions.";
  return d;
}

std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics) {
  std::ostringstream out;
  for (size_t i = 0; i < diagnostics.size(); ++i) {
    const auto& d = diagnostics[i];
    out << severity_name(d.severity) << "[" << d.code << "]: " << d.message << "\n";
    if (!d.snippet.empty()) out << d.snippet << "\n";
    out << "help: " << d.help << "\n";
    if (i + 1 < diagnostics.size()) out << "\n";
  }
  return out.str();
}

std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics) {
  std::ostringstream out;
  out << "[";
  for (size_t i = 0; i < diagnostics.size(); ++i) {
    const auto& d = diagnostics[i];
    if (i != 0) out << ",";
    out << "{";
    out << "\"severity\":\"" << util::json_escape(severity_name(d.severity)) << "\",";
    out << "\"code\":\"" << util::json_escape(d.code) << "\",";
    out << "\"message\":\"" << util::json_escape(d.message) << "\",";
    out << "\"help\":\"" << util::json_escape(d.help) << "\",";
    out << "\"span\":{"
        << "\"start_line\":" << d.span.start_line << ","
        << "\"start_col\":" << d.span.start_col << ","
        << "\"end_line\":" << d.span.end_line << ","
        << "\"end_col\":" << d.span.end_col << ","
        << "\"byte_start\":" << d.span.byte_start << ","
        << "\"byte_end\":" << d.span.byte_end
        << "},";
    out << "\"snippet\":\"" << util::json_escape(d.snippet) << "\"";
    out << "}";
  }
  out << "]";
  return out.str();
}

bool has_error_diagnostics(const std::vector<Diagnostic>& diagnostics) {
  for (const auto& d : diagnostics) {
    if (d.severity == DiagnosticSeverity::Error) return true;
  }
  return false;
}

std::vector<Diagnostic> lint_query(const std::string& query) {
  std::vector<Diagnostic> out;
  ParseResult parsed = parse_pipeline(query);
  if (!parsed.pipeline.has_value()) {
    out.push_back(make_syntax_diagnostic(query, parsed.error.value_or(ParseError{})));
    return out;
  }
  // The value kind flowing between stages is fixed by the stage sequence, so a mismatch is certain.
  bool have_text = false;
  const auto& stages = parsed.pipeline->stages;
  for (size_t i = 0; i < stages.size(); ++i) {
    const Stage& stage = stages[i];
    if (consumes_text(stage) != have_text) {
      Diagnostic d;
      d.severity = DiagnosticSeverity::Warning;
      d.code = "HQL-LNT-0001";
      d.message = stage_name(stage) + " at stage " + std::to_string(i + 1) + " expects " +
                  (consumes_text(stage) ? "Text" : "NodeSet") + " and will fail at run time";
      d.help = have_text ? "Stages after #text()/#attr() may only be #trim(), #trimPrefix() or #trimSuffix()."
                         : "Insert #text() or #attr(...) before text stages.";
      Span span = std::visit([](const auto& s) { return s.span; }, stage);
      d.span = span_from_bytes(query, span.start, span.end);
      d.snippet = render_code_frame(query, d.span);
      out.push_back(std::move(d));
      break;
    }
    if (is_extract_stage(stage)) have_text = true;
  }
  return out;
}

}  // namespace hql
