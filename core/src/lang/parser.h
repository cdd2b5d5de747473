#pragma once

#include <optional>
#include <string>
#include <vector>

#include "hql/pipeline.h"
#include "lexer.h"

namespace hql {

/// Recursive-descent parser for the HQL pipeline grammar.
/// MUST stop at the first error and MUST never return a partial pipeline.
class Parser {
 public:
  explicit Parser(const std::string& input);
  ParseResult parse();

 private:
  /// Parses one `@op(...)` or `#op(...)` segment, appending one or more stages.
  bool parse_stage(std::vector<Stage>& out);
  /// Parses a parenthesized argument list of literals and numbers.
  /// MUST leave current_ after the closing paren.
  bool parse_arguments(const Token& op, std::vector<Token>& args, size_t& end);
  bool build_stage(const Token& op, const std::vector<Token>& args, Span span, std::vector<Stage>& out);
  /// Splits a path literal into consecutive Child/Descendant segments.
  bool parse_path_literal(const Token& literal, Span span, std::vector<Stage>& out);
  bool expect_field_literal(const Token& op, const Token& arg, std::string& out);
  bool expect_text_literal(const Token& op, const Token& arg, std::string& out);
  bool expect_case_flag(const Token& op, const Token& arg, bool& out);
  bool expect_child_index(const Token& arg, int64_t& out);
  /// Converts a lexer failure into the matching parse error.
  bool set_lex_error(const Token& token);
  bool set_error(ParseError::Kind kind, const std::string& message, size_t position);
  /// Returns the trimmed `|`-delimited segment containing position, ignoring pipes inside literals.
  std::string segment_at(size_t position) const;
  void advance();

  const std::string& input_;
  Lexer lexer_;
  Token current_;
  std::optional<ParseError> error_;
};

}  // namespace hql
