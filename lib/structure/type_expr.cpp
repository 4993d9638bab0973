// kleis/structure/type_expr.cpp
#include "kleis/structure/type_expr.hpp"

#include "kleis/types/type.hpp"

namespace kleis
{

namespace
{

void append(std::string & out, const TypeExpr & t, bool canonical, bool parenthesize_compound)
{
  switch (t.kind) {
    case TypeExprKind::Named:
      out += canonical ? std::string(TypeContext::canonical_name(t.name)) : t.name;
      return;
    case TypeExprKind::Number:
      out += std::to_string(t.number);
      return;
    case TypeExprKind::Parametric:
      out += canonical ? std::string(TypeContext::canonical_name(t.name)) : t.name;
      out += '(';
      for (size_t i = 0; i < t.args.size(); ++i) {
        if (i > 0) out += ", ";
        append(out, t.args[i], canonical, false);
      }
      out += ')';
      return;
    case TypeExprKind::Function:
      if (parenthesize_compound) out += '(';
      append(out, t.domain(), canonical, true);
      out += " → ";
      append(out, t.codomain(), canonical, false);
      if (parenthesize_compound) out += ')';
      return;
    case TypeExprKind::Product:
      if (parenthesize_compound) out += '(';
      for (size_t i = 0; i < t.args.size(); ++i) {
        if (i > 0) out += " × ";
        append(out, t.args[i], canonical, true);
      }
      if (parenthesize_compound) out += ')';
      return;
  }
}

}  // namespace

TypeExpr TypeExpr::named(std::string name, SourceRange range)
{
  TypeExpr t;
  t.kind = TypeExprKind::Named;
  t.name = std::move(name);
  t.range = range;
  return t;
}

TypeExpr TypeExpr::parametric(std::string name, std::vector<TypeExpr> args, SourceRange range)
{
  TypeExpr t;
  t.kind = TypeExprKind::Parametric;
  t.name = std::move(name);
  t.args = std::move(args);
  t.range = range;
  return t;
}

TypeExpr TypeExpr::function(TypeExpr domain, TypeExpr codomain, SourceRange range)
{
  TypeExpr t;
  t.kind = TypeExprKind::Function;
  t.args.push_back(std::move(domain));
  t.args.push_back(std::move(codomain));
  t.range = range;
  return t;
}

TypeExpr TypeExpr::product(std::vector<TypeExpr> elements, SourceRange range)
{
  TypeExpr t;
  t.kind = TypeExprKind::Product;
  t.args = std::move(elements);
  t.range = range;
  return t;
}

TypeExpr TypeExpr::number_literal(uint64_t value, SourceRange range)
{
  TypeExpr t;
  t.kind = TypeExprKind::Number;
  t.number = value;
  t.range = range;
  return t;
}

const std::string & TypeExpr::head() const noexcept
{
  static const std::string k_empty;
  return (kind == TypeExprKind::Named || kind == TypeExprKind::Parametric) ? name : k_empty;
}

bool TypeExpr::operator==(const TypeExpr & other) const noexcept
{
  return kind == other.kind && name == other.name && number == other.number &&
         args == other.args;
}

std::string to_string(const TypeExpr & t)
{
  std::string out;
  append(out, t, false, false);
  return out;
}

std::string to_canonical_string(const TypeExpr & t)
{
  std::string out;
  append(out, t, true, false);
  return out;
}

}  // namespace kleis
