// kleis/syntax/lexer.cpp
#include "kleis/syntax/lexer.hpp"

#include <cctype>

namespace kleis::syntax
{
namespace
{

constexpr std::string_view k_arrow_utf8 = "\xE2\x86\x92";  // →
constexpr std::string_view k_times_utf8 = "\xC3\x97";      // ×

bool is_ascii_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ascii_ident_continue(unsigned char c)
{
  return (std::isalnum(c) != 0) || c == '_' || c == '\'';
}
bool is_non_ascii(unsigned char c) { return c >= 0x80; }

bool is_symbol_char(char c)
{
  switch (c) {
    case '+':
    case '-':
    case '*':
    case '/':
    case '^':
    case '<':
    case '>':
    case '!':
    case '%':
    case '&':
    case '|':
    case '~':
    case '.':
    case ';':
    case '?':
    case '@':
    case '#':
    case '$':
    case '\\':
      return true;
    default:
      return false;
  }
}

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

Token Lexer::make_token(TokenKind kind, size_t start) const noexcept
{
  Token t;
  t.kind = kind;
  t.range = SourceRange(file_id_, static_cast<uint32_t>(start), static_cast<uint32_t>(pos_));
  t.text = src_.substr(start, pos_ - start);
  return t;
}

bool Lexer::skip_trivia()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance();
      continue;
    }
    if (starts_with("//")) {
      while (!eof() && peek() != '\n') {
        advance();
      }
      continue;
    }
    if (starts_with("/*")) {
      advance(2);
      while (!eof() && !starts_with("*/")) {
        advance();
      }
      if (eof()) {
        return false;
      }
      advance(2);
      continue;
    }
    break;
  }
  return true;
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    Token t = next_token();
    const bool done = t.kind == TokenKind::Eof;
    out.push_back(t);
    if (done) {
      break;
    }
  }
  return out;
}

Token Lexer::next_token()
{
  const size_t comment_start = pos_;
  if (!skip_trivia()) {
    // Unterminated block comment: report it as one unknown token.
    Token t = make_token(TokenKind::Unknown, comment_start);
    t.text = "/*";
    return t;
  }

  const size_t start = pos_;
  if (eof()) {
    return make_token(TokenKind::Eof, start);
  }

  if (starts_with(k_arrow_utf8)) {
    advance(k_arrow_utf8.size());
    return make_token(TokenKind::Arrow, start);
  }
  if (starts_with(k_times_utf8)) {
    advance(k_times_utf8.size());
    return make_token(TokenKind::Times, start);
  }
  if (starts_with("->")) {
    advance(2);
    return make_token(TokenKind::Arrow, start);
  }

  const auto c = static_cast<unsigned char>(peek());
  if (is_ascii_ident_start(c) || is_non_ascii(c)) {
    return lex_identifier();
  }
  if (std::isdigit(c) != 0) {
    return lex_number();
  }

  switch (c) {
    case '"':
      return lex_string();
    case '(':
      advance();
      return make_token(TokenKind::LParen, start);
    case ')':
      advance();
      return make_token(TokenKind::RParen, start);
    case '{':
      advance();
      return make_token(TokenKind::LBrace, start);
    case '}':
      advance();
      return make_token(TokenKind::RBrace, start);
    case '[':
      advance();
      return make_token(TokenKind::LBracket, start);
    case ']':
      advance();
      return make_token(TokenKind::RBracket, start);
    case ',':
      advance();
      return make_token(TokenKind::Comma, start);
    case ':':
      advance();
      return make_token(TokenKind::Colon, start);
    case '=':
      // `==` is an operator symbol, `=` introduces a definition
      if (peek(1) == '=') {
        advance(2);
        return make_token(TokenKind::Symbol, start);
      }
      advance();
      return make_token(TokenKind::Eq, start);
    default:
      break;
  }

  if (is_symbol_char(static_cast<char>(c))) {
    return lex_symbol();
  }

  advance();
  return make_token(TokenKind::Unknown, start);
}

Token Lexer::lex_identifier()
{
  const size_t start = pos_;
  while (!eof()) {
    if (starts_with(k_arrow_utf8) || starts_with(k_times_utf8)) {
      break;
    }
    const auto c = static_cast<unsigned char>(peek());
    if (!is_ascii_ident_continue(c) && !is_non_ascii(c)) {
      break;
    }
    advance();
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const size_t start = pos_;
  while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
    advance();
  }

  if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0) {
    advance();
    while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
      advance();
    }
    return make_token(TokenKind::FloatLiteral, start);
  }
  return make_token(TokenKind::IntLiteral, start);
}

Token Lexer::lex_string()
{
  const size_t start = pos_;
  advance();  // opening quote
  const size_t content_start = pos_;
  while (!eof() && peek() != '"' && peek() != '\n') {
    if (peek() == '\\') {
      advance();
    }
    advance();
  }
  if (eof() || peek() != '"') {
    return make_token(TokenKind::Unknown, start);
  }
  const size_t content_end = pos_;
  advance();  // closing quote

  Token t = make_token(TokenKind::StringLiteral, start);
  t.text = src_.substr(content_start, content_end - content_start);
  return t;
}

Token Lexer::lex_symbol()
{
  const size_t start = pos_;
  while (!eof() && is_symbol_char(peek()) && !starts_with("->") && !starts_with("//") &&
         !starts_with("/*")) {
    advance();
  }
  return make_token(TokenKind::Symbol, start);
}

}  // namespace kleis::syntax
