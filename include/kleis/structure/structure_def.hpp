// kleis/structure/structure_def.hpp - Structure, implementation and operation declarations
//
// These are the parsed forms of the structure language. They are created
// once when a declaration is loaded and never modified afterwards; the
// registry shares them through shared_ptr<const ...>.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "kleis/basic/source_manager.hpp"
#include "kleis/structure/type_expr.hpp"

namespace kleis
{

// ============================================================================
// Parameters and members
// ============================================================================

enum class ParamKind : uint8_t {
  Type,  ///< ordinary type parameter
  Nat,   ///< natural-number dimension parameter
};

struct TypeParam
{
  std::string name;
  ParamKind kind = ParamKind::Type;
  SourceRange range;
};

/**
 * Declared type of an operation.
 *
 * `type` is the full declared type; `params` and `result` are its curried
 * split. `A → B → C` and `A × B → C` both give params [A, B] and result C;
 * a type without an arrow declares a nullary operation (constant).
 */
struct OperationSignature
{
  std::string name;
  TypeExpr type;
  std::vector<TypeExpr> params;
  TypeExpr result;
  bool is_element = false;
  SourceRange range;

  [[nodiscard]] size_t arity() const noexcept { return params.size(); }

  [[nodiscard]] static OperationSignature from_type(
    std::string name, TypeExpr type, SourceRange range = {});
};

struct AxiomDecl
{
  std::string name;
  std::string text;  ///< proposition as written
  SourceRange range;
};

/**
 * `structure additive : AbelianGroup(R) { ... }` inside another structure.
 */
struct NestedStructure
{
  std::string name;
  TypeExpr type;
  std::vector<OperationSignature> operations;
  std::vector<AxiomDecl> axioms;
  std::vector<NestedStructure> nested;
  SourceRange range;
};

// ============================================================================
// StructureDef
// ============================================================================

struct StructureDef
{
  std::string name;
  std::vector<TypeParam> params;
  std::vector<OperationSignature> operations;  ///< operations and elements, in order
  std::vector<AxiomDecl> axioms;
  std::vector<NestedStructure> nested;
  std::vector<std::string> definitions;  ///< names of `define` members
  std::optional<TypeExpr> extends_clause;
  std::optional<TypeExpr> over_clause;
  SourceRange range;
  SourceRange name_range;

  /// Own operations followed by those of nested structures (depth-first)
  [[nodiscard]] std::vector<const OperationSignature *> all_operations() const;

  [[nodiscard]] bool declares_operation(std::string_view op) const;

  /// `Name(p1, p2)` rendering used in messages
  [[nodiscard]] std::string display_name() const;
};

// ============================================================================
// ImplementsDef
// ============================================================================

struct ImplementsMember
{
  std::string name;
  bool is_element = false;
  std::string body;  ///< implementation text as written (builtin tag or definition)
  SourceRange range;
};

struct ImplementsDef
{
  std::string structure_name;
  std::vector<TypeExpr> type_args;
  std::vector<ImplementsMember> members;
  std::optional<TypeExpr> over_clause;
  std::vector<TypeExpr> where_clause;
  SourceRange range;

  [[nodiscard]] const ImplementsMember * find_member(std::string_view name) const noexcept;

  /// Canonical text of the type arguments: "ℝ", "2, 2, ℝ"
  [[nodiscard]] std::string type_args_text() const;

  /// `Numeric(ℝ)` rendering used in messages
  [[nodiscard]] std::string display_name() const;
};

// ============================================================================
// DataDef
// ============================================================================

struct DataVariant
{
  std::string name;
  std::vector<TypeExpr> fields;
  SourceRange range;
};

/**
 * `data Option(T) = None | Some(T)`.
 *
 * Declares the type constructor `Option` with its parameter kinds, and one
 * constructor operation per variant (`Some : T → Option(T)`).
 */
struct DataDef
{
  std::string name;
  std::vector<TypeParam> params;
  std::vector<DataVariant> variants;
  SourceRange range;
  SourceRange name_range;

  /// `Option(T)` as a type expression over the parameters
  [[nodiscard]] TypeExpr self_type() const;

  /// Constructor signature of a variant: fields curried into `self_type()`
  [[nodiscard]] OperationSignature constructor_signature(const DataVariant & variant) const;
};

// ============================================================================
// StructureProgram - one parsed source
// ============================================================================

using TopLevelDecl = std::variant<StructureDef, ImplementsDef, OperationSignature, DataDef>;

struct StructureProgram
{
  /// Declarations in source order (registration follows this order)
  std::vector<TopLevelDecl> declarations;
  FileId file_id = FileId::invalid();

  void append(StructureProgram && other);
};

}  // namespace kleis
