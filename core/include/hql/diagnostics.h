#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "hql/pipeline.h"
#include "hql/value.h"

namespace hql {

/// Classifies diagnostic urgency for linting and execution error rendering.
/// MUST remain stable for text/JSON outputs and tests.
enum class DiagnosticSeverity {
  Error,
  Warning,
  Note,
};

/// Describes a source span in both byte offsets and line/column coordinates.
/// MUST use 1-based line/column values; byte offsets are 0-based.
struct DiagnosticSpan {
  size_t start_line = 1;
  size_t start_col = 1;
  size_t end_line = 1;
  size_t end_col = 1;
  size_t byte_start = 0;
  size_t byte_end = 0;
};

/// Structured query diagnostic for syntax, lint and run-time failures.
/// MUST include a stable code and actionable help.
struct Diagnostic {
  DiagnosticSeverity severity = DiagnosticSeverity::Error;
  std::string code;
  std::string message;
  std::string help;
  DiagnosticSpan span;
  std::string snippet;
};

/// Builds a syntax diagnostic from a parser error.
/// MUST map each ParseError kind to its own stable code.
Diagnostic make_syntax_diagnostic(const std::string& query, const ParseError& error);
/// Builds a run-time diagnostic anchored at the failing stage.
Diagnostic make_runtime_diagnostic(const std::string& query, const EvalError& error);
/// Builds a run-time diagnostic for failures outside evaluation (file IO, bad input).
Diagnostic make_io_diagnostic(const std::string& message);

/// Renders diagnostics in a human-readable multi-block text format.
/// MUST be deterministic for stable golden tests.
std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics);
/// Renders diagnostics as a stable JSON array for machine consumption.
/// MUST keep key ordering stable across runs.
std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics);
/// Returns true when at least one ERROR severity diagnostic exists.
bool has_error_diagnostics(const std::vector<Diagnostic>& diagnostics);

/// Parses only (no execution) and returns diagnostics.
/// MUST return an empty list for valid queries whose stage order can run.
std::vector<Diagnostic> lint_query(const std::string& query);

}  // namespace hql
