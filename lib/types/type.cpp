// kleis/types/type.cpp - Semantic type implementation
#include "kleis/types/type.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <utility>

namespace kleis
{

namespace
{

struct BuiltinSpelling
{
  std::string_view spelling;
  std::string_view constructor;
  std::string_view canonical;
};

// Every accepted spelling of a builtin type, with the constructor it denotes.
constexpr std::array<BuiltinSpelling, 14> k_builtins = {{
  {"ℝ", "Scalar", "ℝ"},
  {"Real", "Scalar", "ℝ"},
  {"Scalar", "Scalar", "ℝ"},
  {"ℕ", "Nat", "ℕ"},
  {"Nat", "Nat", "ℕ"},
  {"ℤ", "Int", "ℤ"},
  {"Int", "Int", "ℤ"},
  {"ℚ", "Rational", "ℚ"},
  {"Rational", "Rational", "ℚ"},
  {"ℂ", "Complex", "ℂ"},
  {"Complex", "Complex", "ℂ"},
  {"Bool", "Bool", "Bool"},
  {"Unit", "Unit", "Unit"},
  {"String", "String", "String"},
}};

const BuiltinSpelling * find_builtin(std::string_view name) noexcept
{
  const auto it = std::find_if(k_builtins.begin(), k_builtins.end(), [&](const auto & b) {
    return b.spelling == name;
  });
  return it != k_builtins.end() ? &*it : nullptr;
}

// Display spelling of a nullary builtin constructor.
std::string_view builtin_display(std::string_view constructor) noexcept
{
  for (const auto & b : k_builtins) {
    if (b.constructor == constructor) {
      return b.canonical;
    }
  }
  return constructor;
}

void append_type(std::string & out, const Type & t, bool parenthesize_compound);

void append_list(std::string & out, const std::vector<TypePtr> & items)
{
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += ", ";
    append_type(out, *items[i], false);
  }
}

void append_type(std::string & out, const Type & t, bool parenthesize_compound)
{
  switch (t.kind) {
    case TypeKind::Var:
      out += fmt::format("α{}", t.var_id);
      return;
    case TypeKind::NatValue:
      out += std::to_string(t.nat);
      return;
    case TypeKind::String:
      out += "String";
      return;
    case TypeKind::Data:
      if (t.args.empty()) {
        out += t.type_name == "Type" ? std::string(builtin_display(t.constructor)) : t.constructor;
        return;
      }
      out += t.constructor;
      out += '(';
      append_list(out, t.args);
      out += ')';
      return;
    case TypeKind::Function:
      if (parenthesize_compound) out += '(';
      append_type(out, *t.domain(), true);
      out += " → ";
      append_type(out, *t.codomain(), false);
      if (parenthesize_compound) out += ')';
      return;
    case TypeKind::Product:
      if (parenthesize_compound) out += '(';
      for (size_t i = 0; i < t.args.size(); ++i) {
        if (i > 0) out += " × ";
        append_type(out, *t.args[i], true);
      }
      if (parenthesize_compound) out += ')';
      return;
  }
}

}  // namespace

// ============================================================================
// Type queries
// ============================================================================

bool Type::contains_var() const noexcept
{
  if (kind == TypeKind::Var) return true;
  return std::any_of(args.begin(), args.end(), [](const TypePtr & a) { return a->contains_var(); });
}

bool Type::occurs(TypeVarId id) const noexcept
{
  if (kind == TypeKind::Var) return var_id == id;
  return std::any_of(args.begin(), args.end(), [id](const TypePtr & a) { return a->occurs(id); });
}

void Type::collect_vars(std::set<TypeVarId> & out) const
{
  if (kind == TypeKind::Var) {
    out.insert(var_id);
    return;
  }
  for (const auto & a : args) {
    a->collect_vars(out);
  }
}

size_t Type::concrete_node_count() const noexcept
{
  size_t count = (kind == TypeKind::Data || kind == TypeKind::NatValue) ? 1 : 0;
  for (const auto & a : args) {
    count += a->concrete_node_count();
  }
  return count;
}

int64_t Type::max_var_id() const noexcept
{
  int64_t result = kind == TypeKind::Var ? static_cast<int64_t>(var_id) : -1;
  for (const auto & a : args) {
    result = std::max(result, a->max_var_id());
  }
  return result;
}

bool operator==(const Type & a, const Type & b) noexcept
{
  if (a.kind != b.kind) return false;
  switch (a.kind) {
    case TypeKind::Var:
      return a.var_id == b.var_id;
    case TypeKind::NatValue:
      return a.nat == b.nat;
    case TypeKind::String:
      return true;
    case TypeKind::Data:
      if (a.constructor != b.constructor || a.type_name != b.type_name) return false;
      break;
    case TypeKind::Function:
    case TypeKind::Product:
      break;
  }
  return std::equal(
    a.args.begin(), a.args.end(), b.args.begin(), b.args.end(),
    [](const TypePtr & x, const TypePtr & y) { return *x == *y; });
}

bool same_type(const TypePtr & a, const TypePtr & b) noexcept
{
  if (a == b) return true;
  if (!a || !b) return false;
  return *a == *b;
}

// ============================================================================
// Construction
// ============================================================================

TypePtr make_var(TypeVarId id)
{
  auto t = std::make_shared<Type>();
  t->kind = TypeKind::Var;
  t->var_id = id;
  return t;
}

TypePtr make_data(std::string type_name, std::string constructor, std::vector<TypePtr> args)
{
  auto t = std::make_shared<Type>();
  t->kind = TypeKind::Data;
  t->type_name = std::move(type_name);
  t->constructor = std::move(constructor);
  t->args = std::move(args);
  return t;
}

TypePtr make_nat(uint64_t value)
{
  auto t = std::make_shared<Type>();
  t->kind = TypeKind::NatValue;
  t->nat = value;
  return t;
}

TypePtr make_function(TypePtr domain, TypePtr codomain)
{
  auto t = std::make_shared<Type>();
  t->kind = TypeKind::Function;
  t->args = {std::move(domain), std::move(codomain)};
  return t;
}

TypePtr make_product(std::vector<TypePtr> elements)
{
  auto t = std::make_shared<Type>();
  t->kind = TypeKind::Product;
  t->args = std::move(elements);
  return t;
}

TypePtr make_string()
{
  auto t = std::make_shared<Type>();
  t->kind = TypeKind::String;
  return t;
}

TypePtr with_args(const Type & t, std::vector<TypePtr> args)
{
  auto copy = std::make_shared<Type>(t);
  copy->args = std::move(args);
  return copy;
}

// ============================================================================
// Display
// ============================================================================

std::string to_string(const Type & t)
{
  std::string out;
  append_type(out, t, false);
  return out;
}

std::string to_string(const TypePtr & t) { return t ? to_string(*t) : std::string("<null>"); }

// ============================================================================
// TypeContext
// ============================================================================

TypeContext::TypeContext()
: scalar_(make_data("Type", "Scalar")),
  nat_(make_data("Type", "Nat")),
  int_(make_data("Type", "Int")),
  rational_(make_data("Type", "Rational")),
  complex_(make_data("Type", "Complex")),
  bool_(make_data("Type", "Bool")),
  unit_(make_data("Type", "Unit")),
  string_(make_string())
{
}

TypePtr TypeContext::lookup_builtin(std::string_view name) const noexcept
{
  const BuiltinSpelling * b = find_builtin(name);
  if (b == nullptr) return nullptr;

  const std::string_view ctor = b->constructor;
  if (ctor == "Scalar") return scalar_;
  if (ctor == "Nat") return nat_;
  if (ctor == "Int") return int_;
  if (ctor == "Rational") return rational_;
  if (ctor == "Complex") return complex_;
  if (ctor == "Bool") return bool_;
  if (ctor == "Unit") return unit_;
  return string_;
}

std::string_view TypeContext::canonical_name(std::string_view name) noexcept
{
  const BuiltinSpelling * b = find_builtin(name);
  return b != nullptr ? b->canonical : name;
}

bool TypeContext::is_builtin_name(std::string_view name) noexcept
{
  return find_builtin(name) != nullptr;
}

}  // namespace kleis
