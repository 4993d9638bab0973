// kleis/types/type.hpp - Semantic type representation
//
// Types are immutable values shared through TypePtr. Structurally equal types
// compare equal regardless of which node instances represent them.
//
#pragma once

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace kleis
{

// ============================================================================
// Type Kind
// ============================================================================

enum class TypeKind : uint8_t {
  Var,       ///< unresolved type variable α<id>
  Data,      ///< constructed type, e.g. Scalar, Matrix(m, n, T)
  NatValue,  ///< natural number in a type-argument position
  Function,  ///< domain → codomain
  Product,   ///< A × B × ...
  String,    ///< text
};

using TypeVarId = uint32_t;

struct Type;
using TypePtr = std::shared_ptr<const Type>;

// ============================================================================
// Type
// ============================================================================

struct Type
{
  TypeKind kind = TypeKind::Var;

  /// For Var
  TypeVarId var_id = 0;

  /// For Data: the declaring type family ("Type" for builtins) and the constructor
  std::string type_name;
  std::string constructor;

  /// For Data: constructor arguments
  /// For Product: elements
  /// For Function: {domain, codomain}
  std::vector<TypePtr> args;

  /// For NatValue
  uint64_t nat = 0;

  // ===========================================================================
  // Type Queries
  // ===========================================================================

  [[nodiscard]] bool is_var() const noexcept { return kind == TypeKind::Var; }
  [[nodiscard]] bool is_data() const noexcept { return kind == TypeKind::Data; }
  [[nodiscard]] bool is_nat() const noexcept { return kind == TypeKind::NatValue; }
  [[nodiscard]] bool is_function() const noexcept { return kind == TypeKind::Function; }
  [[nodiscard]] bool is_product() const noexcept { return kind == TypeKind::Product; }
  [[nodiscard]] bool is_string() const noexcept { return kind == TypeKind::String; }

  /// Data constructor check, e.g. t.is_constructor("Matrix")
  [[nodiscard]] bool is_constructor(std::string_view ctor) const noexcept
  {
    return kind == TypeKind::Data && constructor == ctor;
  }

  [[nodiscard]] const TypePtr & domain() const noexcept { return args[0]; }
  [[nodiscard]] const TypePtr & codomain() const noexcept { return args[1]; }

  /// True if any type variable occurs in this type
  [[nodiscard]] bool contains_var() const noexcept;

  /// True if variable `id` occurs in this type
  [[nodiscard]] bool occurs(TypeVarId id) const noexcept;

  /// Collect the ids of all variables occurring in this type
  void collect_vars(std::set<TypeVarId> & out) const;

  /// Number of Data and NatValue nodes (how concrete the type is)
  [[nodiscard]] size_t concrete_node_count() const noexcept;

  /// Largest variable id occurring in this type, or -1 when there is none
  [[nodiscard]] int64_t max_var_id() const noexcept;
};

[[nodiscard]] bool operator==(const Type & a, const Type & b) noexcept;
[[nodiscard]] inline bool operator!=(const Type & a, const Type & b) noexcept { return !(a == b); }

/// Structural equality on shared types (null equals only null)
[[nodiscard]] bool same_type(const TypePtr & a, const TypePtr & b) noexcept;

// ============================================================================
// Construction
// ============================================================================

[[nodiscard]] TypePtr make_var(TypeVarId id);
[[nodiscard]] TypePtr make_data(
  std::string type_name, std::string constructor, std::vector<TypePtr> args = {});
[[nodiscard]] TypePtr make_nat(uint64_t value);
[[nodiscard]] TypePtr make_function(TypePtr domain, TypePtr codomain);
[[nodiscard]] TypePtr make_product(std::vector<TypePtr> elements);
[[nodiscard]] TypePtr make_string();

/// Copy of a Data/Product/Function node with replaced children
[[nodiscard]] TypePtr with_args(const Type & t, std::vector<TypePtr> args);

// ============================================================================
// Display
// ============================================================================

/**
 * Human-readable rendering: α3, ℝ, Matrix(2, 3, ℝ), ℝ → ℝ, ℝ × ℝ.
 */
[[nodiscard]] std::string to_string(const Type & t);
[[nodiscard]] std::string to_string(const TypePtr & t);

// ============================================================================
// TypeContext - builtin types
// ============================================================================

/**
 * Owns the builtin type singletons and resolves builtin type names.
 *
 * Builtins are nullary Data types with type_name "Type":
 *   ℝ / Real / Scalar  -> Scalar
 *   ℕ / Nat            -> Nat
 *   ℤ / Int            -> Int
 *   ℚ / Rational       -> Rational
 *   ℂ / Complex        -> Complex
 *   Bool, Unit
 * and String maps to the structural String type.
 */
class TypeContext
{
public:
  TypeContext();

  [[nodiscard]] const TypePtr & scalar_type() const noexcept { return scalar_; }
  [[nodiscard]] const TypePtr & nat_type() const noexcept { return nat_; }
  [[nodiscard]] const TypePtr & int_type() const noexcept { return int_; }
  [[nodiscard]] const TypePtr & rational_type() const noexcept { return rational_; }
  [[nodiscard]] const TypePtr & complex_type() const noexcept { return complex_; }
  [[nodiscard]] const TypePtr & bool_type() const noexcept { return bool_; }
  [[nodiscard]] const TypePtr & unit_type() const noexcept { return unit_; }
  [[nodiscard]] const TypePtr & string_type() const noexcept { return string_; }

  /// Builtin type by any of its spellings, or nullptr
  [[nodiscard]] TypePtr lookup_builtin(std::string_view name) const noexcept;

  /// Canonical spelling of a builtin name ("Real" -> "ℝ"), or the name itself
  [[nodiscard]] static std::string_view canonical_name(std::string_view name) noexcept;

  [[nodiscard]] static bool is_builtin_name(std::string_view name) noexcept;

private:
  TypePtr scalar_;
  TypePtr nat_;
  TypePtr int_;
  TypePtr rational_;
  TypePtr complex_;
  TypePtr bool_;
  TypePtr unit_;
  TypePtr string_;
};

}  // namespace kleis
