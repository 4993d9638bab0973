// kleis/types/unifier.hpp - Most general unification of two types
#pragma once

#include <optional>

#include "kleis/types/substitution.hpp"
#include "kleis/types/type.hpp"
#include "kleis/types/type_error.hpp"

namespace kleis
{

struct UnifyResult
{
  /// Extended substitution (only meaningful if success)
  Substitution substitution;

  /// Failure reason (only set if !success)
  std::optional<TypeError> error;

  [[nodiscard]] bool success() const noexcept { return !error.has_value(); }

  static UnifyResult ok(Substitution s)
  {
    UnifyResult r;
    r.substitution = std::move(s);
    return r;
  }

  static UnifyResult fail(TypeError e)
  {
    UnifyResult r;
    r.error = std::move(e);
    return r;
  }
};

/**
 * Unify `a` with `b` under `substitution`.
 *
 * Rules, in order:
 *   Var(x) ~ t        bind x -> t after the occurs check (no-op if t is x)
 *   Data ~ Data       same constructor and argument count, then arguments
 *                     pairwise left to right
 *   Nat(m) ~ Nat(n)   m == n, else DimensionMismatch{expected: m, found: n}
 *   Function/Product  component-wise; products of different length mismatch
 *   String ~ String   always
 *   otherwise         TypeMismatch
 *
 * `a` is the expected side of any DimensionMismatch or TypeMismatch.
 */
[[nodiscard]] UnifyResult unify(const TypePtr & a, const TypePtr & b, const Substitution & substitution);

/**
 * In-place variant used by the signature interpreter when threading one
 * substitution through many argument pairs.
 *
 * On failure `substitution` may hold bindings made before the conflicting
 * component was reached; callers that need the old state keep a copy.
 */
[[nodiscard]] std::optional<TypeError> unify_into(
  const TypePtr & a, const TypePtr & b, Substitution & substitution);

/// True if variable `id` occurs in `t` after applying `substitution`
[[nodiscard]] bool occurs_in(TypeVarId id, const TypePtr & t, const Substitution & substitution);

}  // namespace kleis
