// kleis/driver/type_checker.hpp - Type checker facade
//
// Single entry point for loading structure definitions and checking
// expressions. Used by the kleisc CLI and embedders (editor, REPL).
//
#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kleis/ast/expression.hpp"
#include "kleis/basic/diagnostic.hpp"
#include "kleis/basic/source_manager.hpp"
#include "kleis/project/project_config.hpp"
#include "kleis/sema/inference_driver.hpp"
#include "kleis/sema/signature_interpreter.hpp"
#include "kleis/sema/type_check_result.hpp"
#include "kleis/structure/structure_registry.hpp"

namespace kleis
{

// ============================================================================
// Options and results
// ============================================================================

struct CheckerOptions
{
  /// Candidate selection for overloaded operations
  DispatchPolicy dispatch = DispatchPolicy::FirstMatch;

  /// Receives inference trace lines when set (kleisc --verbose)
  std::ostream * trace = nullptr;
};

struct LoadResult
{
  /// Whether the load succeeded; on failure the checker is unchanged
  bool success = false;

  /// Syntax and registration diagnostics
  DiagnosticBag diagnostics;

  /// Declarations added by this load
  size_t structures = 0;
  size_t implementations = 0;
  size_t candidates = 0;
  size_t data_types = 0;
};

/// Outcome of `infer`: a type, or an error message
struct InferResult
{
  TypePtr type;
  std::string error;

  [[nodiscard]] bool success() const noexcept { return type != nullptr; }

  static InferResult ok(TypePtr t)
  {
    InferResult r;
    r.type = std::move(t);
    return r;
  }
  static InferResult fail(std::string msg)
  {
    InferResult r;
    r.error = std::move(msg);
    return r;
  }
};

class TypeChecker;

struct CheckerLoadResult
{
  /**
   * Always set. After a failed load the checker holds none of the failed
   * declarations but keeps their sources, so the diagnostics can be printed.
   */
  std::unique_ptr<TypeChecker> checker;
  DiagnosticBag diagnostics;
  bool success = false;
};

// ============================================================================
// TypeChecker
// ============================================================================

/**
 * Owns a structure registry and checks expressions against it.
 *
 * Loads are atomic: declarations are registered into a copy of the
 * registry, and the copy replaces the current one only if the whole load
 * succeeds. Checks never modify the checker; each call runs in its own
 * InferenceSession.
 */
class TypeChecker
{
public:
  /// An empty checker: no structures, no operations
  explicit TypeChecker(CheckerOptions options = {});

  TypeChecker(const TypeChecker &) = delete;
  TypeChecker & operator=(const TypeChecker &) = delete;
  TypeChecker(TypeChecker &&) = default;
  TypeChecker & operator=(TypeChecker &&) = default;
  ~TypeChecker() = default;

  /**
   * Checker with the bundled standard library loaded.
   *
   * @param options Checker options
   * @param stdlib_dir Standard library directory; auto-detected when empty
   * @return the checker, or diagnostics explaining why a bundled file did
   *         not load
   */
  [[nodiscard]] static CheckerLoadResult with_standard_library(
    CheckerOptions options = {}, std::optional<std::filesystem::path> stdlib_dir = std::nullopt);

  /// Checker configured by kleis.yaml: stdlib, extra files, dispatch policy
  [[nodiscard]] static CheckerLoadResult from_project(
    const ProjectConfig & config, CheckerOptions options = {});

  // ===========================================================================
  // Loading
  // ===========================================================================

  LoadResult load_source(std::string text, const std::filesystem::path & virtual_path = "<input>");
  LoadResult load_file(const std::filesystem::path & path);

  /// All files in one atomic load; later files may use earlier ones
  LoadResult load_files(const std::vector<std::filesystem::path> & paths);

  LoadResult load(StructureProgram program);

  /**
   * Declare the type of a free identifier for all later checks.
   * Lowercase unknown names in `type` are type variables shared between
   * bindings.
   *
   * @return the bound type
   */
  TypePtr bind(const std::string & name, const TypeExpr & type);

  // ===========================================================================
  // Checking
  // ===========================================================================

  [[nodiscard]] TypeCheckResult check(const Expression & expr) const;

  /// Infer with extra identifier types; entries override bindings of the same name
  [[nodiscard]] InferResult infer(
    const Expression & expr, const TypeEnvironment & environment = {}) const;

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] std::vector<std::string> types_supporting(std::string_view op) const
  {
    return registry_.types_supporting(op);
  }

  [[nodiscard]] bool type_supports_operation(std::string_view type, std::string_view op) const
  {
    return registry_.type_supports_operation(type, op);
  }

  [[nodiscard]] std::optional<std::string> suggest_operation(std::string_view op) const;

  [[nodiscard]] const StructureRegistry & registry() const noexcept { return registry_; }
  [[nodiscard]] const SourceRegistry & sources() const noexcept { return sources_; }
  [[nodiscard]] const TypeEnvironment & bindings() const noexcept { return bindings_; }
  [[nodiscard]] const CheckerOptions & options() const noexcept { return options_; }

private:
  [[nodiscard]] InferenceDriver make_driver() const;

  /// Register parsed programs into a registry snapshot; commit on success
  LoadResult commit(std::vector<StructureProgram> programs, DiagnosticBag diags);

  CheckerOptions options_;
  TypeContext types_;
  StructureRegistry registry_;
  SourceRegistry sources_;

  TypeEnvironment bindings_;
  SignatureScope binding_scope_;
  TypeVarId next_binding_var_ = 0;
};

}  // namespace kleis
