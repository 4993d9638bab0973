// kleis/syntax/lexer.hpp - Tokenizer for .kleis structure sources
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "kleis/syntax/token.hpp"

namespace kleis::syntax
{

/**
 * Splits UTF-8 source text into tokens.
 *
 * Comments (`// ...` and `/* ... *\/`) and whitespace are dropped. Bytes of
 * multi-byte UTF-8 sequences are identifier characters, except for the
 * arrow `→` and the product sign `×`. The token vector always ends with Eof.
 */
class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src) : file_id_(file_id), src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  /// Skip whitespace and comments; returns false on an unterminated block comment
  bool skip_trivia();

  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token lex_symbol();

  [[nodiscard]] Token make_token(TokenKind kind, size_t start) const noexcept;

  FileId file_id_;
  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace kleis::syntax
