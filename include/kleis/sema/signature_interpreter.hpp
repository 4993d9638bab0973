// kleis/sema/signature_interpreter.hpp - Instantiates operation signatures at call sites
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>

#include <gsl/span>

#include "kleis/sema/inference_session.hpp"
#include "kleis/structure/structure_registry.hpp"
#include "kleis/types/type.hpp"
#include "kleis/types/type_error.hpp"

namespace kleis
{

struct InterpretResult
{
  /// Return type under the committed substitution (only meaningful if success)
  TypePtr type;

  /// Concrete nodes in the instantiated parameter types; used by most-specific dispatch
  size_t specificity = 0;

  std::optional<TypeError> error;

  [[nodiscard]] bool success() const noexcept { return !error.has_value(); }

  static InterpretResult ok(TypePtr type, size_t specificity)
  {
    InterpretResult r;
    r.type = std::move(type);
    r.specificity = specificity;
    return r;
  }
  static InterpretResult fail(TypeError e)
  {
    InterpretResult r;
    r.error = std::move(e);
    return r;
  }
};

/// Names in scope while converting a signature, mapped to their types
using SignatureScope = std::map<std::string, TypePtr, std::less<>>;

/**
 * Turns an operation candidate and the argument types of a call into the
 * call's return type.
 *
 * For a candidate the interpreter:
 *   1. checks the argument count against the signature
 *   2. gives every structure parameter a fresh variable, or the
 *      implementation's type argument when the candidate comes from an
 *      `implements` declaration
 *   3. unifies each declared parameter type with the argument type, left
 *      to right, on a copy of the session substitution
 *   4. applies the result to the declared return type
 *   5. rejects the candidate if a structure parameter used by the signature
 *      is left undetermined by the arguments
 * and commits the substitution to the session only when every step succeeds.
 */
class SignatureInterpreter
{
public:
  SignatureInterpreter(const StructureRegistry & registry, const TypeContext & types)
  : registry_(registry), types_(types)
  {
  }

  [[nodiscard]] InterpretResult interpret(
    const OperationCandidate & candidate, gsl::span<const TypePtr> args,
    InferenceSession & session) const;

  /**
   * Convert a declared type. Names bound in `scope` resolve to their
   * types; builtin names to builtin types; other names to nullary data
   * types, except that names accepted by `is_implicit` become fresh
   * variables recorded in `scope`.
   */
  [[nodiscard]] TypePtr convert(
    const TypeExpr & expr, SignatureScope & scope, InferenceSession & session,
    const std::function<bool(std::string_view)> & is_implicit) const;

  /// Implicit-parameter rule of top-level operation signatures
  [[nodiscard]] bool is_unknown_name(std::string_view name) const;

  /// Implicit-parameter rule of structure signatures and bound identifiers
  [[nodiscard]] bool is_unknown_lowercase_name(std::string_view name) const;

private:
  const StructureRegistry & registry_;
  const TypeContext & types_;
};

}  // namespace kleis
