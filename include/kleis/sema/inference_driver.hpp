// kleis/sema/inference_driver.hpp - Type inference over expression trees
#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kleis/ast/expression.hpp"
#include "kleis/sema/inference_session.hpp"
#include "kleis/sema/signature_interpreter.hpp"
#include "kleis/sema/type_check_result.hpp"
#include "kleis/structure/structure_registry.hpp"

namespace kleis
{

/// How an operation call picks among candidates that all accept its arguments
enum class DispatchPolicy : uint8_t {
  FirstMatch,    ///< first accepting candidate in registration order
  MostSpecific,  ///< accepting candidate with the most concrete parameter types
};

[[nodiscard]] std::string_view to_string(DispatchPolicy policy) noexcept;
[[nodiscard]] std::optional<DispatchPolicy> parse_dispatch_policy(std::string_view text) noexcept;

struct InferenceOptions
{
  DispatchPolicy dispatch = DispatchPolicy::FirstMatch;

  /// Receives one line per candidate attempt when set
  std::ostream * trace = nullptr;
};

/// Type of a subexpression, or the first hard error met while inferring it
struct InferOutcome
{
  TypePtr type;
  std::optional<TypeError> error;

  [[nodiscard]] bool success() const noexcept { return !error.has_value(); }

  static InferOutcome ok(TypePtr t)
  {
    InferOutcome r;
    r.type = std::move(t);
    return r;
  }
  static InferOutcome fail(TypeError e)
  {
    InferOutcome r;
    r.error = std::move(e);
    return r;
  }
};

/**
 * Depth-first, left-to-right inference.
 *
 *   Const        -> ℝ
 *   Object       -> environment entry, or a fresh variable recorded there
 *   Placeholder  -> a fresh variable per occurrence
 *   List         -> List(T) with every item unified into T
 *   Matrix(r, c, e...) literal -> Matrix(r, c, ℝ)
 *   Operation    -> dispatch over the registry's candidates
 *
 * Inference stops at the first hard error. Every type leaving the driver
 * has the final substitution applied.
 */
class InferenceDriver
{
public:
  InferenceDriver(
    const StructureRegistry & registry, const TypeContext & types, InferenceOptions options = {})
  : registry_(registry), types_(types), interpreter_(registry, types), options_(options)
  {
  }

  /// Classify the type of `expr` as Success, Error or Polymorphic
  [[nodiscard]] TypeCheckResult check(const Expression & expr, TypeEnvironment environment = {}) const;

  /// Infer within an existing session (substitution applied to the result)
  [[nodiscard]] InferOutcome infer(const Expression & expr, InferenceSession & session) const;

  /// "Operation 'abs' is available for types: ℝ", or nullopt if no type supports it
  [[nodiscard]] std::optional<std::string> suggest_operation(std::string_view op) const;

  [[nodiscard]] const InferenceOptions & options() const noexcept { return options_; }

private:
  [[nodiscard]] InferOutcome infer_node(const Expression & expr, InferenceSession & session) const;
  [[nodiscard]] InferOutcome infer_list(const Expression & expr, InferenceSession & session) const;
  [[nodiscard]] InferOutcome infer_matrix_literal(
    const Expression & expr, InferenceSession & session) const;
  [[nodiscard]] InferOutcome infer_operation(
    const Expression & expr, InferenceSession & session) const;

  /// Try the candidates for a call whose argument types are known
  [[nodiscard]] InferOutcome dispatch(
    std::string_view op, const std::vector<TypePtr> & arg_types, InferenceSession & session) const;

  [[nodiscard]] bool tracing() const noexcept { return options_.trace != nullptr; }
  void trace(const std::string & line) const;

  const StructureRegistry & registry_;
  const TypeContext & types_;
  SignatureInterpreter interpreter_;
  InferenceOptions options_;
};

/// Constructor names that introduce matrix literals
[[nodiscard]] bool is_matrix_literal_name(std::string_view name) noexcept;

}  // namespace kleis
