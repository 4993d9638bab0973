// kleis/syntax/token.hpp - Tokens of the structure language
#pragma once

#include <cstdint>
#include <string_view>

#include "kleis/basic/source_manager.hpp"

namespace kleis::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  Identifier,     // ASCII or Unicode letters: Ring, ℝ, α
  IntLiteral,     // 42
  FloatLiteral,   // 0.5 (only inside axiom and definition bodies)
  StringLiteral,  // token.text is the interior, without quotes

  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Colon,
  Eq,     // =
  Arrow,  // → or ->
  Times,  // ×

  Symbol,  // any other operator character run: + - * / ^ < <= ...
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;
  std::string_view text;

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().offset(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "integer";
    case TokenKind::FloatLiteral:
      return "number";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Colon:
      return ":";
    case TokenKind::Eq:
      return "=";
    case TokenKind::Arrow:
      return "→";
    case TokenKind::Times:
      return "×";
    case TokenKind::Symbol:
      return "operator";
  }
  return "<unknown>";
}

}  // namespace kleis::syntax
