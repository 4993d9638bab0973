// kleis/structure/type_expr.hpp - Syntactic type expressions of structure declarations
//
// A TypeExpr is what the structure language writes down (`Matrix(m, n, T)`,
// `ℝ → ℝ`); the signature interpreter turns it into a semantic Type once the
// names in it are bound.
//
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "kleis/basic/source_manager.hpp"

namespace kleis
{

enum class TypeExprKind : uint8_t {
  Named,       ///< T, ℝ, Field
  Parametric,  ///< Matrix(m, n, T)
  Function,    ///< A → B
  Product,     ///< A × B
  Number,      ///< 2 (dimension literal)
};

struct TypeExpr
{
  TypeExprKind kind = TypeExprKind::Named;

  /// Named: the name; Parametric: the constructor
  std::string name;

  /// Number
  uint64_t number = 0;

  /// Parametric: arguments; Product: elements; Function: {domain, codomain}
  std::vector<TypeExpr> args;

  SourceRange range;

  [[nodiscard]] static TypeExpr named(std::string name, SourceRange range = {});
  [[nodiscard]] static TypeExpr parametric(
    std::string name, std::vector<TypeExpr> args, SourceRange range = {});
  [[nodiscard]] static TypeExpr function(TypeExpr domain, TypeExpr codomain, SourceRange range = {});
  [[nodiscard]] static TypeExpr product(std::vector<TypeExpr> elements, SourceRange range = {});
  [[nodiscard]] static TypeExpr number_literal(uint64_t value, SourceRange range = {});

  [[nodiscard]] const TypeExpr & domain() const noexcept { return args[0]; }
  [[nodiscard]] const TypeExpr & codomain() const noexcept { return args[1]; }

  /// Head name of a Named or Parametric expression, empty otherwise
  [[nodiscard]] const std::string & head() const noexcept;

  /// Structural equality ignoring source ranges
  [[nodiscard]] bool operator==(const TypeExpr & other) const noexcept;
  [[nodiscard]] bool operator!=(const TypeExpr & other) const noexcept { return !(*this == other); }
};

/// Source-like rendering: `Matrix(m, n, T) → T`
[[nodiscard]] std::string to_string(const TypeExpr & t);

/// Like to_string, with builtin aliases written canonically (Real -> ℝ)
[[nodiscard]] std::string to_canonical_string(const TypeExpr & t);

}  // namespace kleis
