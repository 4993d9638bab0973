// kleis/syntax/parser.cpp - Recursive-descent parser for the structure language
#include "kleis/syntax/parser.hpp"

#include <algorithm>
#include <charconv>
#include <utility>

namespace kleis::syntax
{

namespace
{

constexpr std::string_view k_structure = "structure";
constexpr std::string_view k_implements = "implements";
constexpr std::string_view k_operation = "operation";
constexpr std::string_view k_element = "element";
constexpr std::string_view k_axiom = "axiom";
constexpr std::string_view k_define = "define";
constexpr std::string_view k_data = "data";

bool is_kw(std::string_view kw, const Token & t)
{
  return t.kind == TokenKind::Identifier && t.text == kw;
}

bool opens_group(TokenKind k)
{
  return k == TokenKind::LParen || k == TokenKind::LBrace || k == TokenKind::LBracket;
}

bool closes_group(TokenKind k)
{
  return k == TokenKind::RParen || k == TokenKind::RBrace || k == TokenKind::RBracket;
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i < tokens_.size()) {
    return tokens_[i];
  }
  return tokens_.back();
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::at_kw(std::string_view kw) const { return is_kw(kw, cur()); }

bool Parser::at_member_start() const
{
  return at_kw(k_operation) || at_kw(k_element) || at_kw(k_axiom) || at_kw(k_define) ||
         at_kw(k_structure);
}

bool Parser::at_toplevel_start() const
{
  return at_kw(k_structure) || at_kw(k_implements) || at_kw(k_operation) || at_kw(k_data);
}

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    idx_++;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }
  error_at(cur(), std::string("expected ") + std::string(what), std::string(to_string(k)));
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg, std::string_view label)
{
  std::string label_text;
  if (!label.empty()) {
    label_text = "expected `" + std::string(label) + "`";
  }
  diags_.report_error(t.range, std::string(msg), std::move(label_text))
    .with_code(diag_code::k_syntax);
}

SourceRange Parser::range_from(const Token & first) const
{
  const uint32_t end = idx_ > 0 ? tokens_[idx_ - 1].end() : first.end();
  return SourceRange(file_id_, first.begin(), std::max(end, first.begin()));
}

// ============================================================================
// Recovery
// ============================================================================

void Parser::synchronize_to_toplevel()
{
  int depth = 0;
  while (!at_eof()) {
    if (depth == 0 && at_toplevel_start()) {
      return;
    }
    const TokenKind k = cur().kind;
    if (opens_group(k)) {
      depth++;
    } else if (closes_group(k) && depth > 0) {
      depth--;
    }
    advance();
  }
}

SourceRange Parser::skip_member_body()
{
  const Token & first = cur();
  const size_t start_idx = idx_;
  int depth = 0;
  while (!at_eof()) {
    const TokenKind k = cur().kind;
    if (depth == 0 && (at_member_start() || k == TokenKind::RBrace)) {
      break;
    }
    if (opens_group(k)) {
      depth++;
    } else if (closes_group(k) && depth > 0) {
      depth--;
    }
    advance();
  }
  if (idx_ == start_idx) {
    return SourceRange(file_id_, first.begin(), first.begin());
  }
  return range_from(first);
}

// ============================================================================
// Program
// ============================================================================

StructureProgram Parser::parse_program()
{
  StructureProgram program;
  program.file_id = file_id_;

  while (!at_eof()) {
    if (at(TokenKind::Unknown)) {
      error_at(cur(), "unexpected character '" + std::string(cur().text) + "'");
      advance();
      synchronize_to_toplevel();
      continue;
    }

    if (at_kw(k_structure)) {
      if (auto s = parse_structure()) {
        program.declarations.emplace_back(std::move(*s));
      } else {
        synchronize_to_toplevel();
      }
      continue;
    }

    if (at_kw(k_implements)) {
      if (auto impl = parse_implements()) {
        program.declarations.emplace_back(std::move(*impl));
      } else {
        synchronize_to_toplevel();
      }
      continue;
    }

    if (at_kw(k_operation)) {
      advance();
      if (auto op = parse_operation_signature(false)) {
        program.declarations.emplace_back(std::move(*op));
      } else {
        synchronize_to_toplevel();
      }
      continue;
    }

    if (at_kw(k_data)) {
      if (auto d = parse_data()) {
        program.declarations.emplace_back(std::move(*d));
      } else {
        synchronize_to_toplevel();
      }
      continue;
    }

    error_at(cur(), "expected 'structure', 'implements', 'operation' or 'data'");
    advance();
    synchronize_to_toplevel();
  }

  return program;
}

// ============================================================================
// Declarations
// ============================================================================

// structure Name(params) [extends T] [over T] { members }
std::optional<StructureDef> Parser::parse_structure()
{
  const Token & kw = advance();  // structure

  StructureDef s;
  if (!at(TokenKind::Identifier)) {
    error_at(cur(), "expected structure name");
    return std::nullopt;
  }
  const Token & name_tok = advance();
  s.name = std::string(name_tok.text);
  s.name_range = name_tok.range;

  if (match(TokenKind::LParen)) {
    if (!at(TokenKind::RParen)) {
      do {
        auto param = parse_type_param();
        if (!param) {
          return std::nullopt;
        }
        s.params.push_back(std::move(*param));
      } while (match(TokenKind::Comma));
    }
    if (!expect(TokenKind::RParen, "')' after structure parameters")) {
      return std::nullopt;
    }
  }

  // Clauses may appear in either order, at most once each.
  while (at_kw("extends") || at_kw("over")) {
    const Token & clause_tok = advance();
    const bool is_extends = clause_tok.text == "extends";
    auto & slot = is_extends ? s.extends_clause : s.over_clause;
    if (slot.has_value()) {
      error_at(clause_tok, "duplicate '" + std::string(clause_tok.text) + "' clause");
      return std::nullopt;
    }
    auto type = parse_type();
    if (!type) {
      return std::nullopt;
    }
    slot = std::move(*type);
  }

  if (!expect(TokenKind::LBrace, "'{' to begin structure body")) {
    return std::nullopt;
  }
  if (!parse_members(s.operations, s.axioms, s.nested, &s.definitions)) {
    return std::nullopt;
  }
  s.range = range_from(kw);
  return s;
}

// data Name(params) = Variant(fields) | Variant ...
std::optional<DataDef> Parser::parse_data()
{
  const Token & kw = advance();  // data

  DataDef d;
  if (!at(TokenKind::Identifier)) {
    error_at(cur(), "expected data type name");
    return std::nullopt;
  }
  const Token & name_tok = advance();
  d.name = std::string(name_tok.text);
  d.name_range = name_tok.range;

  if (match(TokenKind::LParen)) {
    if (!at(TokenKind::RParen)) {
      do {
        auto param = parse_type_param();
        if (!param) {
          return std::nullopt;
        }
        d.params.push_back(std::move(*param));
      } while (match(TokenKind::Comma));
    }
    if (!expect(TokenKind::RParen, "')' after data type parameters")) {
      return std::nullopt;
    }
  }

  if (!expect(TokenKind::Eq, "'=' before data variants")) {
    return std::nullopt;
  }

  for (;;) {
    if (!at(TokenKind::Identifier)) {
      error_at(cur(), "expected variant name");
      return std::nullopt;
    }
    const Token & variant_tok = advance();
    DataVariant variant;
    variant.name = std::string(variant_tok.text);

    if (match(TokenKind::LParen)) {
      if (!at(TokenKind::RParen)) {
        do {
          // Field names are optional: `Some(value : T)` or `Some(T)`.
          if (at(TokenKind::Identifier) && cur(1).kind == TokenKind::Colon) {
            advance();
            advance();
          }
          auto field = parse_type();
          if (!field) {
            return std::nullopt;
          }
          variant.fields.push_back(std::move(*field));
        } while (match(TokenKind::Comma));
      }
      if (!expect(TokenKind::RParen, "')' after variant fields")) {
        return std::nullopt;
      }
    }
    variant.range = range_from(variant_tok);
    d.variants.push_back(std::move(variant));

    if (!at(TokenKind::Symbol) || cur().text != "|") {
      break;
    }
    advance();
  }

  d.range = range_from(kw);
  return d;
}

std::optional<TypeParam> Parser::parse_type_param()
{
  if (!at(TokenKind::Identifier)) {
    error_at(cur(), "expected type parameter name");
    return std::nullopt;
  }
  const Token & name_tok = advance();

  TypeParam param;
  param.name = std::string(name_tok.text);
  param.range = name_tok.range;

  if (match(TokenKind::Colon)) {
    if (!at(TokenKind::Identifier)) {
      error_at(cur(), "expected parameter kind");
      return std::nullopt;
    }
    const Token & kind_tok = advance();
    if (kind_tok.text == "Nat" || kind_tok.text == "ℕ") {
      param.kind = ParamKind::Nat;
    } else if (kind_tok.text == "Type") {
      param.kind = ParamKind::Type;
    } else {
      error_at(kind_tok, "unknown parameter kind '" + std::string(kind_tok.text) + "'");
      return std::nullopt;
    }
    param.range = range_from(name_tok);
  }
  return param;
}

std::optional<std::string> Parser::parse_operation_name()
{
  if (at(TokenKind::Identifier) || at(TokenKind::Symbol)) {
    return std::string(advance().text);
  }
  // (+), (×), (==)
  if (at(TokenKind::LParen)) {
    const TokenKind inner = cur(1).kind;
    const bool symbolic = inner == TokenKind::Symbol || inner == TokenKind::Identifier ||
                          inner == TokenKind::Times || inner == TokenKind::Arrow;
    if (symbolic && cur(2).kind == TokenKind::RParen) {
      advance();
      std::string name(advance().text);
      advance();
      return name;
    }
  }
  error_at(cur(), "expected operation name");
  return std::nullopt;
}

// operation name : type    (the keyword is already consumed)
std::optional<OperationSignature> Parser::parse_operation_signature(bool is_element)
{
  const Token & first = cur();
  auto name = parse_operation_name();
  if (!name) {
    return std::nullopt;
  }
  if (!expect(TokenKind::Colon, "':' before operation type")) {
    return std::nullopt;
  }
  auto type = parse_type();
  if (!type) {
    return std::nullopt;
  }
  auto sig = OperationSignature::from_type(std::move(*name), std::move(*type), range_from(first));
  sig.is_element = is_element;
  return sig;
}

bool Parser::parse_members(
  std::vector<OperationSignature> & operations, std::vector<AxiomDecl> & axioms,
  std::vector<NestedStructure> & nested, std::vector<std::string> * definitions)
{
  while (!at(TokenKind::RBrace)) {
    if (at_eof()) {
      error_at(cur(), "expected '}' to end structure body", "}");
      return false;
    }

    if (at_kw(k_operation) || at_kw(k_element)) {
      const bool is_element = advance().text == k_element;
      if (auto op = parse_operation_signature(is_element)) {
        operations.push_back(std::move(*op));
      } else {
        skip_member_body();
      }
      continue;
    }

    if (at_kw(k_axiom)) {
      if (auto ax = parse_axiom()) {
        axioms.push_back(std::move(*ax));
      } else {
        skip_member_body();
      }
      continue;
    }

    if (at_kw(k_define)) {
      advance();
      if (at(TokenKind::Identifier) || at(TokenKind::LParen) || at(TokenKind::Symbol)) {
        auto name = parse_operation_name();
        if (name && definitions != nullptr) {
          definitions->push_back(std::move(*name));
        }
      } else {
        error_at(cur(), "expected definition name");
      }
      skip_member_body();
      continue;
    }

    if (at_kw(k_structure)) {
      if (auto n = parse_nested_structure()) {
        nested.push_back(std::move(*n));
      } else {
        skip_member_body();
      }
      continue;
    }

    error_at(cur(), "expected 'operation', 'element', 'axiom', 'define' or 'structure'");
    advance();
    skip_member_body();
  }

  advance();  // }
  return true;
}

// structure name : Type { members }
std::optional<NestedStructure> Parser::parse_nested_structure()
{
  const Token & kw = advance();  // structure

  NestedStructure n;
  if (!at(TokenKind::Identifier)) {
    error_at(cur(), "expected nested structure name");
    return std::nullopt;
  }
  n.name = std::string(advance().text);

  if (!expect(TokenKind::Colon, "':' after nested structure name")) {
    return std::nullopt;
  }
  auto type = parse_type();
  if (!type) {
    return std::nullopt;
  }
  n.type = std::move(*type);

  if (!expect(TokenKind::LBrace, "'{' to begin nested structure body")) {
    return std::nullopt;
  }
  if (!parse_members(n.operations, n.axioms, n.nested, nullptr)) {
    return std::nullopt;
  }
  n.range = range_from(kw);
  return n;
}

// axiom name : proposition
std::optional<AxiomDecl> Parser::parse_axiom()
{
  const Token & kw = advance();  // axiom

  if (!at(TokenKind::Identifier)) {
    error_at(cur(), "expected axiom name");
    return std::nullopt;
  }
  AxiomDecl ax;
  ax.name = std::string(advance().text);
  if (!expect(TokenKind::Colon, "':' after axiom name")) {
    return std::nullopt;
  }
  const SourceRange body = skip_member_body();
  ax.text = std::string(source_.get_slice(body));
  ax.range = range_from(kw);
  return ax;
}

// implements Name(args) [over T] [where C(T), ...] [{ members }]
std::optional<ImplementsDef> Parser::parse_implements()
{
  const Token & kw = advance();  // implements

  ImplementsDef impl;
  if (!at(TokenKind::Identifier)) {
    error_at(cur(), "expected structure name after 'implements'");
    return std::nullopt;
  }
  impl.structure_name = std::string(advance().text);

  if (match(TokenKind::LParen)) {
    if (!at(TokenKind::RParen)) {
      do {
        auto arg = parse_type();
        if (!arg) {
          return std::nullopt;
        }
        impl.type_args.push_back(std::move(*arg));
      } while (match(TokenKind::Comma));
    }
    if (!expect(TokenKind::RParen, "')' after implementation type arguments")) {
      return std::nullopt;
    }
  }

  if (at_kw("over")) {
    advance();
    auto over = parse_type();
    if (!over) {
      return std::nullopt;
    }
    impl.over_clause = std::move(*over);
  }

  if (at_kw("where")) {
    advance();
    do {
      auto constraint = parse_type();
      if (!constraint) {
        return std::nullopt;
      }
      impl.where_clause.push_back(std::move(*constraint));
    } while (match(TokenKind::Comma));
  }

  if (match(TokenKind::LBrace)) {
    if (!parse_implements_members(impl)) {
      return std::nullopt;
    }
  }
  impl.range = range_from(kw);
  return impl;
}

bool Parser::parse_implements_members(ImplementsDef & impl)
{
  while (!at(TokenKind::RBrace)) {
    if (at_eof()) {
      error_at(cur(), "expected '}' to end implementation body", "}");
      return false;
    }

    if (at_kw(k_operation) || at_kw(k_element)) {
      const Token & first = advance();
      ImplementsMember member;
      member.is_element = first.text == k_element;
      auto name = parse_operation_name();
      if (!name) {
        skip_member_body();
        continue;
      }
      member.name = std::move(*name);
      match(TokenKind::Eq);
      member.body = std::string(source_.get_slice(skip_member_body()));
      member.range = range_from(first);
      impl.members.push_back(std::move(member));
      continue;
    }

    // axioms and definitions restated inside an implementation are not used
    if (at_kw(k_axiom) || at_kw(k_define)) {
      advance();
      skip_member_body();
      continue;
    }

    error_at(cur(), "expected 'operation' or 'element' in implementation body");
    advance();
    skip_member_body();
  }

  advance();  // }
  return true;
}

// ============================================================================
// Types
// ============================================================================

// type := product [→ type]
std::optional<TypeExpr> Parser::parse_type()
{
  const Token & first = cur();
  auto lhs = parse_product();
  if (!lhs) {
    return std::nullopt;
  }
  if (match(TokenKind::Arrow)) {
    auto rhs = parse_type();
    if (!rhs) {
      return std::nullopt;
    }
    return TypeExpr::function(std::move(*lhs), std::move(*rhs), range_from(first));
  }
  return lhs;
}

// product := atom {× atom}
std::optional<TypeExpr> Parser::parse_product()
{
  const Token & first = cur();
  auto head = parse_type_atom();
  if (!head) {
    return std::nullopt;
  }
  if (!at(TokenKind::Times)) {
    return head;
  }

  std::vector<TypeExpr> elements;
  elements.push_back(std::move(*head));
  while (match(TokenKind::Times)) {
    auto next = parse_type_atom();
    if (!next) {
      return std::nullopt;
    }
    elements.push_back(std::move(*next));
  }
  auto product = TypeExpr::product(std::move(elements), range_from(first));
  return product;
}

// atom := ident ['(' types ')'] | natural | '(' type ')'
std::optional<TypeExpr> Parser::parse_type_atom()
{
  const Token & first = cur();

  if (at(TokenKind::Identifier)) {
    std::string name(advance().text);
    if (!match(TokenKind::LParen)) {
      return TypeExpr::named(std::move(name), first.range);
    }
    std::vector<TypeExpr> args;
    if (!at(TokenKind::RParen)) {
      do {
        auto arg = parse_type();
        if (!arg) {
          return std::nullopt;
        }
        args.push_back(std::move(*arg));
      } while (match(TokenKind::Comma));
    }
    if (!expect(TokenKind::RParen, "')' after type arguments")) {
      return std::nullopt;
    }
    return TypeExpr::parametric(std::move(name), std::move(args), range_from(first));
  }

  if (at(TokenKind::IntLiteral)) {
    const Token & num = advance();
    uint64_t value = 0;
    const char * begin = num.text.data();
    const char * end = begin + num.text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
      error_at(num, "dimension literal '" + std::string(num.text) + "' is out of range");
      return std::nullopt;
    }
    return TypeExpr::number_literal(value, num.range);
  }

  if (match(TokenKind::LParen)) {
    auto inner = parse_type();
    if (!inner) {
      return std::nullopt;
    }
    if (!expect(TokenKind::RParen, "')' to close parenthesized type")) {
      return std::nullopt;
    }
    return inner;
  }

  error_at(cur(), "expected type");
  return std::nullopt;
}

}  // namespace kleis::syntax
