#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hql {

/// Byte range of a stage within the source text; end is exclusive.
struct Span {
  size_t start = 0;
  size_t end = 0;
};

enum class PathKind {
  Child,
  Descendant,
};

struct FlatStage {
  Span span;
};

/// One path segment: `/tag` selects direct children, `//tag` selects descendants.
struct PathStage {
  PathKind kind = PathKind::Child;
  std::string tag;
  Span span;
};

/// Keeps elements carrying `field`; when `value` is set the attribute must equal it byte for byte.
struct AttrStage {
  std::string field;
  std::optional<std::string> value;
  Span span;
};

struct IdStage {
  std::string value;
  bool case_sensitive = true;
  Span span;
};

struct ClassStage {
  std::string value;
  bool case_sensitive = true;
  Span span;
};

/// Selects the index-th direct child; negative indexes count from the end (-1 is last).
struct ChildStage {
  int64_t index = 0;
  Span span;
};

struct TextStage {
  Span span;
};

struct TrimStage {
  Span span;
};

struct TrimPrefixStage {
  std::string text;
  Span span;
};

struct TrimSuffixStage {
  std::string text;
  Span span;
};

struct AttrExtractStage {
  std::string field;
  Span span;
};

/// Closed set of pipeline operators. Map stages come first in the list, extract stages after.
/// MUST stay exhaustively handled by every visitor (evaluator, formatter, equality).
using Stage = std::variant<FlatStage,
                           PathStage,
                           AttrStage,
                           IdStage,
                           ClassStage,
                           ChildStage,
                           TextStage,
                           TrimStage,
                           TrimPrefixStage,
                           TrimSuffixStage,
                           AttrExtractStage>;

/// Compiled, immutable stage sequence.
/// MUST be non-empty when produced by parse_pipeline and MUST NOT be mutated after compilation.
struct Pipeline {
  std::vector<Stage> stages;
  std::string source;
};

/// Structural compile-time failure. Compilation is all-or-nothing.
struct ParseError {
  enum class Kind {
    MalformedStage,
    ArityMismatch,
    InvalidNumber,
    UnterminatedLiteral,
    UnknownOperator,
  } kind = Kind::MalformedStage;
  std::string message;
  size_t position = 0;
  /// Source text of the stage (or token) that failed.
  std::string segment;
};

struct ParseResult {
  std::optional<Pipeline> pipeline;
  std::optional<ParseError> error;
};

/// Compiles HQL text into a pipeline.
/// MUST be deterministic and MUST set exactly one of pipeline/error.
ParseResult parse_pipeline(const std::string& input);

/// True for stages that consume a node-set and produce text, or transform text.
bool is_extract_stage(const Stage& stage);
/// True for stages whose input is a text value (#trim, #trimPrefix, #trimSuffix).
/// Every other stage consumes a node-set.
bool consumes_text(const Stage& stage);
/// Returns the operator spelling, e.g. "@path" or "#trimPrefix".
std::string stage_name(const Stage& stage);
/// Renders a stage in canonical HQL syntax, e.g. "@id(`main`, 0)".
std::string format_stage(const Stage& stage);
/// Renders a pipeline in canonical HQL syntax with " | " separators.
/// Consecutive path segments are merged back into a single @path literal.
std::string describe_pipeline(const Pipeline& pipeline);
std::string parse_error_kind_name(ParseError::Kind kind);

/// Structural equality ignoring source spans.
bool same_stage(const Stage& left, const Stage& right);
bool same_stages(const Pipeline& left, const Pipeline& right);

}  // namespace hql
