#pragma once

#include <string>

#include "tokens.h"

namespace hql {

/// Tokenizes HQL input into a stream for the parser.
/// MUST be deterministic and MUST not skip meaningful characters.
/// Whitespace is skipped between tokens but never inside backtick literals.
class Lexer {
 public:
  /// Constructs a lexer over a stable input string reference.
  /// MUST NOT outlive the referenced input buffer.
  explicit Lexer(const std::string& input);
  /// Produces the next token from the input stream.
  /// MUST advance the cursor and MUST return End at input exhaustion.
  Token next();

 private:
  /// Lexes `@name` or `#name`; the name is a run of ASCII letters.
  Token lex_operator();
  /// Lexes a backtick literal; content is taken verbatim up to the closing backtick.
  Token lex_literal();
  /// Lexes a signed integer.
  /// Consumes trailing identifier characters so "12a" is reported as one bad number.
  Token lex_number();
  void skip_ws();
  Token make_token(TokenType type, std::string text, size_t start_pos) const;
  Token make_invalid(LexError error, std::string text, size_t start_pos) const;

  const std::string& input_;
  size_t pos_ = 0;
};

}  // namespace hql
