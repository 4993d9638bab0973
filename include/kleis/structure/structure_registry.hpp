// kleis/structure/structure_registry.hpp - Loaded structures, implementations and operations
//
// The registry is built during a load phase and read-only afterwards. It is
// cheap to copy: definitions are shared immutable objects, so a copy is a new
// snapshot that can be extended without affecting sessions reading the old one.
//
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "kleis/structure/structure_def.hpp"
#include "kleis/types/type_error.hpp"

namespace kleis
{

// ============================================================================
// OperationCandidate
// ============================================================================

/**
 * One declaration of an operation that dispatch may select.
 *
 * - owner set, implementation null: the structure's own generic signature
 * - owner and implementation set: the signature instantiated at the
 *   implementation's type arguments
 * - owner null: a top-level `operation` declaration, or with `data` set,
 *   the constructor of a data variant
 *
 * `signature` aliases into the owning definition, so candidates stay valid
 * for as long as any copy of them exists.
 */
struct OperationCandidate
{
  std::shared_ptr<const StructureDef> owner;
  std::shared_ptr<const ImplementsDef> implementation;
  std::shared_ptr<const OperationSignature> signature;
  std::shared_ptr<const DataDef> data;  ///< set for a data variant constructor
  size_t order = 0;  ///< registration order

  /// Top-level operations and data constructors
  [[nodiscard]] bool is_toplevel() const noexcept { return owner == nullptr; }

  /// "Arithmetic(T)", "Numeric(ℝ)", "operation sin", or "data Option"
  [[nodiscard]] std::string describe() const;
};

// ============================================================================
// Result types
// ============================================================================

struct RegisterResult
{
  std::optional<TypeError> error;

  [[nodiscard]] bool success() const noexcept { return !error.has_value(); }

  static RegisterResult ok() { return {}; }
  static RegisterResult fail(TypeError e)
  {
    RegisterResult r;
    r.error = std::move(e);
    return r;
  }
};

struct ClosureResult
{
  /// The structure itself first, then its dependencies in depth-first order
  std::vector<std::shared_ptr<const StructureDef>> structures;
  std::optional<TypeError> error;

  [[nodiscard]] bool success() const noexcept { return !error.has_value(); }

  static ClosureResult fail(TypeError e)
  {
    ClosureResult r;
    r.error = std::move(e);
    return r;
  }
};

// ============================================================================
// StructureRegistry
// ============================================================================

class StructureRegistry
{
public:
  StructureRegistry() = default;

  // ===========================================================================
  // Registration (load phase only)
  // ===========================================================================

  /// Fails with DuplicateName if a structure of the same name exists.
  RegisterResult register_structure(StructureDef structure);

  /**
   * Fails with UnknownStructure if the target is not registered,
   * ArityMismatch if the argument count differs from its parameters, and
   * DuplicateName if the target is already implemented at the same
   * (canonical) type arguments.
   */
  RegisterResult register_implements(ImplementsDef implementation);

  /// Top-level operation; DuplicateName if the same name and arity exist.
  RegisterResult register_operation(OperationSignature operation);

  /**
   * Data type and one constructor candidate per variant. Fails with
   * DuplicateName if the type name is taken (builtin, structure or data
   * type) or a variant name is already declared.
   */
  RegisterResult register_data(DataDef data);

  /**
   * Check that every extends/over target is registered and that the
   * dependency graph is acyclic.
   */
  [[nodiscard]] RegisterResult validate() const;

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] std::shared_ptr<const StructureDef> find_structure(std::string_view name) const;

  [[nodiscard]] bool has_structure(std::string_view name) const
  {
    return find_structure(name) != nullptr;
  }

  /// Structure names in registration order
  [[nodiscard]] std::vector<std::string> structure_names() const;

  [[nodiscard]] std::shared_ptr<const DataDef> find_data_type(std::string_view name) const;

  [[nodiscard]] bool has_data_type(std::string_view name) const
  {
    return find_data_type(name) != nullptr;
  }

  [[nodiscard]] const std::vector<std::shared_ptr<const DataDef>> & data_types() const noexcept
  {
    return data_types_;
  }

  /**
   * Declared parameters of a type constructor: a data type's, or those of
   * the structure of the same name (`Matrix(m: Nat, n: Nat, T)`). Null when
   * the constructor is not declared.
   */
  [[nodiscard]] const std::vector<TypeParam> * constructor_params(std::string_view name) const;

  [[nodiscard]] std::vector<std::shared_ptr<const ImplementsDef>> implementations_of(
    std::string_view structure_name) const;

  [[nodiscard]] const std::vector<std::shared_ptr<const ImplementsDef>> & implementations()
    const noexcept
  {
    return implementations_;
  }

  /// Every candidate declaring `op` with `arity` parameters, in registration order
  [[nodiscard]] std::vector<OperationCandidate> signatures_for(
    std::string_view op, size_t arity) const;

  /// Every candidate declaring `op`, at any arity
  [[nodiscard]] std::vector<OperationCandidate> candidates_named(std::string_view op) const;

  /// Names of the structures declaring `op` (own or nested members)
  [[nodiscard]] std::vector<std::string> operation_owners(std::string_view op) const;

  /**
   * Transitive closure over extends/over edges.
   *
   * Fails with CyclicDependency (path included) or UnknownStructure.
   */
  [[nodiscard]] ClosureResult dependency_closure(std::string_view structure_name) const;

  /**
   * Canonical type identifiers for which `op` is available, sorted and
   * without duplicates.
   *
   * An implementation whose dependency closure contains a structure
   * declaring `op` contributes the type it binds to that structure's
   * subject parameter, followed through extends/over arguments:
   * `implements VectorSpace(V3, ℝ)` with `VectorSpace(V, F) over Field(F)`
   * gives V3 for `vadd` and ℝ for `reciprocal`. When no concrete binding is
   * found the implementation's first type argument is used. Concrete
   * top-level declarations contribute their first parameter type.
   */
  [[nodiscard]] std::vector<std::string> types_supporting(std::string_view op) const;

  [[nodiscard]] bool type_supports_operation(std::string_view type, std::string_view op) const;

  [[nodiscard]] size_t structure_count() const noexcept { return structures_.size(); }
  [[nodiscard]] size_t implementation_count() const noexcept { return implementations_.size(); }
  [[nodiscard]] size_t candidate_count() const noexcept { return candidates_.size(); }
  [[nodiscard]] size_t data_type_count() const noexcept { return data_types_.size(); }

private:
  /// Arities seen for constructors that no declaration describes
  using ConstructorArities = std::unordered_map<std::string, size_t>;

  void add_candidate(OperationCandidate candidate);

  /**
   * Check every constructor applied in `t` against its declared parameters
   * (count and Nat/type kinds), or, for undeclared constructors, against the
   * arity of earlier uses. New arities are recorded in `seen`.
   */
  [[nodiscard]] std::optional<TypeError> check_constructor_uses(
    const TypeExpr & t, const std::vector<TypeParam> & scope, std::string_view context,
    ConstructorArities & seen) const;

  [[nodiscard]] std::optional<TypeError> check_constructor_uses(
    const OperationSignature & op, const std::vector<TypeParam> & scope,
    ConstructorArities & seen) const;

  [[nodiscard]] std::vector<std::string> subject_types(
    const ImplementsDef & impl, std::string_view op) const;

  std::vector<std::shared_ptr<const StructureDef>> structures_;
  std::unordered_map<std::string, size_t> structure_index_;
  std::vector<std::shared_ptr<const ImplementsDef>> implementations_;
  std::vector<std::shared_ptr<const OperationSignature>> toplevel_operations_;
  std::vector<std::shared_ptr<const DataDef>> data_types_;
  std::unordered_map<std::string, size_t> data_index_;
  std::unordered_map<std::string, std::string> variant_owner_;
  ConstructorArities constructor_arities_;
  std::vector<OperationCandidate> candidates_;
  std::unordered_map<std::string, std::vector<size_t>> candidates_by_name_;
};

}  // namespace kleis
