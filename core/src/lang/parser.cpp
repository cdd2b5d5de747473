#include "parser.h"

#include <charconv>
#include <cstddef>
#include <utility>

#include "../util/string_util.h"

namespace hql {

namespace {

enum class OperatorId {
  Flat,
  Path,
  Attr,
  Id,
  Class,
  Child,
  Text,
  Trim,
  TrimPrefix,
  TrimSuffix,
  AttrExtract
};

struct OperatorSpec {
  const char* name;
  OperatorId id;
  size_t min_args;
  size_t max_args;
};

// Operator names are matched exactly; `@attr` and `#attr` are distinct operators.
constexpr OperatorSpec kOperators[] = {
    {"@flat", OperatorId::Flat, 0, 0},
    {"@path", OperatorId::Path, 1, 1},
    {"@attr", OperatorId::Attr, 1, 2},
    {"@id", OperatorId::Id, 1, 2},
    {"@class", OperatorId::Class, 1, 2},
    {"@child", OperatorId::Child, 1, 1},
    {"#text", OperatorId::Text, 0, 0},
    {"#trim", OperatorId::Trim, 0, 0},
    {"#trimPrefix", OperatorId::TrimPrefix, 1, 1},
    {"#trimSuffix", OperatorId::TrimSuffix, 1, 1},
    {"#attr", OperatorId::AttrExtract, 1, 1},
};

const OperatorSpec* find_operator(const std::string& name) {
  for (const auto& spec : kOperators) {
    if (name == spec.name) return &spec;
  }
  return nullptr;
}

bool is_tag_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '-';
}

bool is_field_char(char c) {
  return is_tag_char(c) || (c >= '0' && c <= '9');
}

bool is_text_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

template <typename Pred>
bool all_chars(const std::string& s, Pred pred) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!pred(c)) return false;
  }
  return true;
}

std::string describe_arity(const OperatorSpec& spec) {
  if (spec.min_args == spec.max_args) {
    if (spec.min_args == 0) return "no arguments";
    if (spec.min_args == 1) return "exactly 1 argument";
    return "exactly " + std::to_string(spec.min_args) + " arguments";
  }
  return std::to_string(spec.min_args) + " or " + std::to_string(spec.max_args) + " arguments";
}

}  // namespace

Parser::Parser(const std::string& input) : input_(input), lexer_(input) {
  advance();
}

ParseResult Parser::parse() {
  ParseResult result;
  Pipeline pipeline;
  pipeline.source = input_;
  if (current_.type == TokenType::End) {
    set_error(ParseError::Kind::MalformedStage, "Empty pipeline", current_.pos);
    result.error = error_;
    return result;
  }
  while (true) {
    if (!parse_stage(pipeline.stages)) {
      result.error = error_;
      return result;
    }
    if (current_.type == TokenType::End) break;
    if (current_.type == TokenType::Invalid) {
      set_lex_error(current_);
      result.error = error_;
      return result;
    }
    if (current_.type != TokenType::Pipe) {
      set_error(ParseError::Kind::MalformedStage, "Expected | between stages", current_.pos);
      result.error = error_;
      return result;
    }
    advance();
  }
  result.pipeline = std::move(pipeline);
  return result;
}

bool Parser::parse_stage(std::vector<Stage>& out) {
  if (current_.type == TokenType::Invalid) {
    return set_lex_error(current_);
  }
  if (current_.type == TokenType::End || current_.type == TokenType::Pipe) {
    return set_error(ParseError::Kind::MalformedStage, "Expected stage before |", current_.pos);
  }
  if (current_.type != TokenType::MapOperator && current_.type != TokenType::ExtractOperator) {
    return set_error(ParseError::Kind::MalformedStage,
                     "Expected stage starting with @ or #", current_.pos);
  }
  Token op = current_;
  const OperatorSpec* spec = find_operator(op.text);
  if (!spec) {
    return set_error(ParseError::Kind::UnknownOperator, "Unknown operator '" + op.text + "'", op.pos);
  }
  advance();
  if (current_.type != TokenType::LParen) {
    return set_error(ParseError::Kind::MalformedStage, "Expected ( after " + op.text, current_.pos);
  }
  std::vector<Token> args;
  size_t end = 0;
  if (!parse_arguments(op, args, end)) return false;
  if (args.size() < spec->min_args || args.size() > spec->max_args) {
    return set_error(ParseError::Kind::ArityMismatch,
                     op.text + " takes " + describe_arity(*spec) + ", got " + std::to_string(args.size()),
                     op.pos);
  }
  return build_stage(op, args, Span{op.pos, end}, out);
}

bool Parser::parse_arguments(const Token& op, std::vector<Token>& args, size_t& end) {
  advance();
  if (current_.type == TokenType::RParen) {
    end = current_.end;
    advance();
    return true;
  }
  while (true) {
    if (current_.type == TokenType::Invalid) {
      // WHY: a malformed number is still an argument so arity and kind checks report it precisely.
      if (current_.error != LexError::InvalidNumber) return set_lex_error(current_);
      args.push_back(current_);
    } else if (current_.type == TokenType::Literal || current_.type == TokenType::Number) {
      args.push_back(current_);
    } else if (current_.type == TokenType::End) {
      return set_error(ParseError::Kind::MalformedStage, "Expected ) to close " + op.text + "(", current_.pos);
    } else {
      return set_error(ParseError::Kind::MalformedStage,
                       "Expected literal or number inside " + op.text + "()", current_.pos);
    }
    advance();
    if (current_.type == TokenType::Comma) {
      advance();
      continue;
    }
    if (current_.type == TokenType::RParen) {
      end = current_.end;
      advance();
      return true;
    }
    if (current_.type == TokenType::Invalid && current_.error == LexError::UnterminatedLiteral) {
      return set_lex_error(current_);
    }
    return set_error(ParseError::Kind::MalformedStage,
                     "Expected , or ) in " + op.text + "() arguments", current_.pos);
  }
}

bool Parser::build_stage(const Token& op, const std::vector<Token>& args, Span span, std::vector<Stage>& out) {
  const OperatorSpec* spec = find_operator(op.text);
  switch (spec->id) {
    case OperatorId::Flat:
      out.emplace_back(FlatStage{span});
      return true;
    case OperatorId::Path:
      return parse_path_literal(args[0], span, out);
    case OperatorId::Attr: {
      AttrStage stage;
      stage.span = span;
      if (!expect_field_literal(op, args[0], stage.field)) return false;
      if (args.size() == 2) {
        std::string value;
        if (!expect_field_literal(op, args[1], value)) return false;
        stage.value = std::move(value);
      }
      out.emplace_back(std::move(stage));
      return true;
    }
    case OperatorId::Id: {
      IdStage stage;
      stage.span = span;
      if (!expect_field_literal(op, args[0], stage.value)) return false;
      if (args.size() == 2 && !expect_case_flag(op, args[1], stage.case_sensitive)) return false;
      out.emplace_back(std::move(stage));
      return true;
    }
    case OperatorId::Class: {
      ClassStage stage;
      stage.span = span;
      if (!expect_field_literal(op, args[0], stage.value)) return false;
      if (args.size() == 2 && !expect_case_flag(op, args[1], stage.case_sensitive)) return false;
      out.emplace_back(std::move(stage));
      return true;
    }
    case OperatorId::Child: {
      ChildStage stage;
      stage.span = span;
      if (!expect_child_index(args[0], stage.index)) return false;
      out.emplace_back(stage);
      return true;
    }
    case OperatorId::Text:
      out.emplace_back(TextStage{span});
      return true;
    case OperatorId::Trim:
      out.emplace_back(TrimStage{span});
      return true;
    case OperatorId::TrimPrefix: {
      TrimPrefixStage stage;
      stage.span = span;
      if (!expect_text_literal(op, args[0], stage.text)) return false;
      out.emplace_back(std::move(stage));
      return true;
    }
    case OperatorId::TrimSuffix: {
      TrimSuffixStage stage;
      stage.span = span;
      if (!expect_text_literal(op, args[0], stage.text)) return false;
      out.emplace_back(std::move(stage));
      return true;
    }
    case OperatorId::AttrExtract: {
      AttrExtractStage stage;
      stage.span = span;
      if (!expect_field_literal(op, args[0], stage.field)) return false;
      out.emplace_back(std::move(stage));
      return true;
    }
  }
  return set_error(ParseError::Kind::UnknownOperator, "Unknown operator '" + op.text + "'", op.pos);
}

bool Parser::parse_path_literal(const Token& literal, Span span, std::vector<Stage>& out) {
  if (literal.type != TokenType::Literal) {
    return set_error(ParseError::Kind::MalformedStage, "Expected backtick path literal in @path()", literal.pos);
  }
  const std::string& s = literal.text;
  if (s.empty()) {
    return set_error(ParseError::Kind::MalformedStage, "Empty path in @path()", literal.pos);
  }
  // Content starts one byte after the opening backtick.
  const size_t base = literal.pos + 1;
  std::vector<Stage> segments;
  size_t i = 0;
  while (i < s.size()) {
    if (s[i] != '/') {
      return set_error(ParseError::Kind::MalformedStage,
                       "Path segment must start with / or //", base + i);
    }
    PathStage stage;
    stage.span = span;
    if (i + 1 < s.size() && s[i + 1] == '/') {
      stage.kind = PathKind::Descendant;
      i += 2;
    } else {
      stage.kind = PathKind::Child;
      i += 1;
    }
    size_t tag_start = i;
    while (i < s.size() && is_tag_char(s[i])) {
      ++i;
    }
    if (i == tag_start) {
      return set_error(ParseError::Kind::MalformedStage, "Expected tag name after / in path", base + i);
    }
    stage.tag = s.substr(tag_start, i - tag_start);
    segments.emplace_back(std::move(stage));
  }
  for (auto& segment : segments) {
    out.push_back(std::move(segment));
  }
  return true;
}

bool Parser::expect_field_literal(const Token& op, const Token& arg, std::string& out) {
  if (arg.type != TokenType::Literal) {
    return set_error(ParseError::Kind::MalformedStage,
                     "Expected backtick field literal in " + op.text + "()", arg.pos);
  }
  if (!all_chars(arg.text, is_field_char)) {
    return set_error(ParseError::Kind::MalformedStage,
                     "Field literal must match [A-Za-z0-9_-]+ in " + op.text + "()", arg.pos);
  }
  out = arg.text;
  return true;
}

bool Parser::expect_text_literal(const Token& op, const Token& arg, std::string& out) {
  if (arg.type != TokenType::Literal) {
    return set_error(ParseError::Kind::MalformedStage,
                     "Expected backtick text literal in " + op.text + "()", arg.pos);
  }
  if (!all_chars(arg.text, is_text_char)) {
    return set_error(ParseError::Kind::MalformedStage,
                     "Text literal must contain letters only in " + op.text + "()", arg.pos);
  }
  out = arg.text;
  return true;
}

bool Parser::expect_case_flag(const Token& op, const Token& arg, bool& out) {
  if (arg.type == TokenType::Number && arg.text == "0") {
    out = false;
    return true;
  }
  if (arg.type == TokenType::Number && arg.text == "1") {
    out = true;
    return true;
  }
  return set_error(ParseError::Kind::MalformedStage,
                   "Expected case flag 0 or 1 in " + op.text + "()", arg.pos);
}

bool Parser::expect_child_index(const Token& arg, int64_t& out) {
  if (arg.type != TokenType::Number) {
    return set_error(ParseError::Kind::InvalidNumber, "Expected integer index in @child()", arg.pos);
  }
  const char* first = arg.text.data();
  const char* last = first + arg.text.size();
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return set_error(ParseError::Kind::InvalidNumber, "Index out of range in @child(): " + arg.text, arg.pos);
  }
  out = value;
  return true;
}

bool Parser::set_lex_error(const Token& token) {
  switch (token.error) {
    case LexError::UnterminatedLiteral:
      return set_error(ParseError::Kind::UnterminatedLiteral, "Unterminated backtick literal", token.pos);
    case LexError::InvalidNumber:
      return set_error(ParseError::Kind::InvalidNumber, "Invalid number '" + token.text + "'", token.pos);
    case LexError::UnexpectedCharacter:
    case LexError::None:
      break;
  }
  return set_error(ParseError::Kind::MalformedStage, "Unexpected character '" + token.text + "'", token.pos);
}

bool Parser::set_error(ParseError::Kind kind, const std::string& message, size_t position) {
  if (error_.has_value()) return false;
  ParseError error;
  error.kind = kind;
  error.message = message;
  error.position = position;
  error.segment = segment_at(position);
  error_ = std::move(error);
  return false;
}

std::string Parser::segment_at(size_t position) const {
  size_t start = 0;
  size_t end = input_.size();
  bool in_literal = false;
  for (size_t i = 0; i < input_.size(); ++i) {
    char c = input_[i];
    if (c == '`') {
      in_literal = !in_literal;
      continue;
    }
    if (in_literal || c != '|') continue;
    if (i < position) {
      start = i + 1;
    } else {
      end = i;
      break;
    }
  }
  return util::trim_ws(std::string_view(input_).substr(start, end - start));
}

void Parser::advance() {
  current_ = lexer_.next();
}

ParseResult parse_pipeline(const std::string& input) {
  Parser parser(input);
  return parser.parse();
}

}  // namespace hql
