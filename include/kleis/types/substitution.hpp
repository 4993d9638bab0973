// kleis/types/substitution.hpp - Idempotent mapping from type variables to types
#pragma once

#include <map>

#include "kleis/types/type.hpp"

namespace kleis
{

/**
 * Finite mapping from type-variable id to type.
 *
 * Invariant: the substitution is idempotent. No bound type mentions a bound
 * variable, so apply(apply(t)) == apply(t) for every type t. bind() and
 * compose() maintain the invariant; callers run the occurs check (see
 * unifier.hpp) before binding.
 */
class Substitution
{
public:
  using Map = std::map<TypeVarId, TypePtr>;

  Substitution() = default;

  /**
   * Rewrite every bound variable in `t`.
   *
   * Returns `t` itself (same pointer) when nothing in it is bound.
   */
  [[nodiscard]] TypePtr apply(const TypePtr & t) const;

  /// Binding for `id`, or nullptr
  [[nodiscard]] TypePtr lookup(TypeVarId id) const;

  [[nodiscard]] bool contains(TypeVarId id) const noexcept { return bindings_.count(id) != 0; }
  [[nodiscard]] bool empty() const noexcept { return bindings_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return bindings_.size(); }
  [[nodiscard]] const Map & bindings() const noexcept { return bindings_; }

  /**
   * Add id -> type.
   *
   * `type` is resolved against the current bindings first, then the new
   * binding is applied to every existing binding so the result stays
   * idempotent. Rebinding an already-bound id is ignored.
   */
  void bind(TypeVarId id, const TypePtr & type);

  [[nodiscard]] bool operator==(const Substitution & other) const;
  [[nodiscard]] bool operator!=(const Substitution & other) const { return !(*this == other); }

private:
  Map bindings_;
};

/// apply(s, t) == s.apply(t)
[[nodiscard]] inline TypePtr apply(const Substitution & s, const TypePtr & t)
{
  return s.apply(t);
}

/**
 * Extend `old` with `new_bindings`.
 *
 * Every binding of `new_bindings` is applied to the bindings already in
 * `old`; a variable bound by both keeps its `old` binding.
 */
[[nodiscard]] Substitution compose(const Substitution & old, const Substitution & new_bindings);

}  // namespace kleis
