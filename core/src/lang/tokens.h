#pragma once

#include <cstddef>
#include <string>

namespace hql {

/// Enumerates lexical tokens produced by the HQL lexer.
/// MUST remain consistent with parser expectations.
enum class TokenType {
  MapOperator,
  ExtractOperator,
  Literal,
  Number,
  LParen,
  RParen,
  Comma,
  Pipe,
  End,
  Invalid
};

/// Reason attached to Invalid tokens so the parser can pick the matching error kind.
enum class LexError {
  None,
  UnterminatedLiteral,
  InvalidNumber,
  UnexpectedCharacter
};

/// Represents a single token with source text and position metadata.
/// For literals, text holds the content between the backticks.
/// For operators, text includes the leading '@' or '#'.
struct Token {
  TokenType type = TokenType::End;
  std::string text;
  size_t pos = 0;
  size_t end = 0;
  LexError error = LexError::None;
};

}  // namespace hql
