#include "lexer.h"

#include <cctype>
#include <utility>

#include "../util/string_util.h"

namespace hql {

namespace {

bool is_ascii_alpha(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_ascii_digit(char c) {
  return c >= '0' && c <= '9';
}

bool is_number_tail_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}  // namespace

Lexer::Lexer(const std::string& input) : input_(input) {}

Token Lexer::next() {
  skip_ws();
  if (pos_ >= input_.size()) {
    return make_token(TokenType::End, "", pos_);
  }

  size_t start = pos_;
  char c = input_[pos_];
  if (c == '(') {
    ++pos_;
    return make_token(TokenType::LParen, "(", start);
  }
  if (c == ')') {
    ++pos_;
    return make_token(TokenType::RParen, ")", start);
  }
  if (c == ',') {
    ++pos_;
    return make_token(TokenType::Comma, ",", start);
  }
  if (c == '|') {
    ++pos_;
    return make_token(TokenType::Pipe, "|", start);
  }
  if (c == '@' || c == '#') {
    return lex_operator();
  }
  if (c == '`') {
    return lex_literal();
  }
  if (c == '-' || is_ascii_digit(c)) {
    return lex_number();
  }

  // WHY: advance on unknown input to avoid infinite loops on malformed pipelines.
  ++pos_;
  return make_invalid(LexError::UnexpectedCharacter, std::string(1, c), start);
}

Token Lexer::lex_operator() {
  size_t start = pos_;
  std::string out(1, input_[pos_++]);
  while (pos_ < input_.size() && is_ascii_alpha(input_[pos_])) {
    out.push_back(input_[pos_++]);
  }
  TokenType type = out[0] == '@' ? TokenType::MapOperator : TokenType::ExtractOperator;
  return make_token(type, out, start);
}

Token Lexer::lex_literal() {
  size_t start = pos_;
  ++pos_;
  std::string out;
  while (pos_ < input_.size()) {
    char c = input_[pos_++];
    if (c == '`') {
      return make_token(TokenType::Literal, out, start);
    }
    out.push_back(c);
  }
  return make_invalid(LexError::UnterminatedLiteral, input_.substr(start), start);
}

Token Lexer::lex_number() {
  size_t start = pos_;
  std::string out;
  if (input_[pos_] == '-') {
    out.push_back(input_[pos_++]);
  }
  bool all_digits = true;
  size_t digits = 0;
  while (pos_ < input_.size() && is_number_tail_char(input_[pos_])) {
    char c = input_[pos_++];
    if (!is_ascii_digit(c)) all_digits = false;
    ++digits;
    out.push_back(c);
  }
  if (digits == 0 || !all_digits) {
    return make_invalid(LexError::InvalidNumber, out, start);
  }
  return make_token(TokenType::Number, out, start);
}

void Lexer::skip_ws() {
  while (pos_ < input_.size() && util::is_hql_space(input_[pos_])) {
    ++pos_;
  }
}

Token Lexer::make_token(TokenType type, std::string text, size_t start_pos) const {
  Token token;
  token.type = type;
  token.text = std::move(text);
  token.pos = start_pos;
  token.end = pos_;
  return token;
}

Token Lexer::make_invalid(LexError error, std::string text, size_t start_pos) const {
  Token token = make_token(TokenType::Invalid, std::move(text), start_pos);
  token.error = error;
  return token;
}

}  // namespace hql
