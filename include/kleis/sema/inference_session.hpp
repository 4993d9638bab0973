// kleis/sema/inference_session.hpp - Per-call inference state
#pragma once

#include <functional>
#include <map>
#include <string>

#include "kleis/types/substitution.hpp"
#include "kleis/types/type.hpp"

namespace kleis
{

/// Types of free identifiers, keyed by name
using TypeEnvironment = std::map<std::string, TypePtr, std::less<>>;

/**
 * Fresh-variable counter, accumulated substitution and identifier
 * environment of one check/infer call.
 *
 * A session is created at the start of a call and discarded at its end.
 * It is never shared between calls.
 */
class InferenceSession
{
public:
  explicit InferenceSession(TypeVarId first_id = 0) : next_id_(first_id) {}

  /// Session whose counter starts after every variable used in `environment`
  [[nodiscard]] static InferenceSession with_environment(TypeEnvironment environment);

  [[nodiscard]] TypePtr fresh_var() { return make_var(next_id_++); }
  [[nodiscard]] TypeVarId next_id() const noexcept { return next_id_; }

  [[nodiscard]] Substitution & substitution() noexcept { return substitution_; }
  [[nodiscard]] const Substitution & substitution() const noexcept { return substitution_; }

  [[nodiscard]] TypePtr apply(const TypePtr & t) const { return substitution_.apply(t); }

  [[nodiscard]] TypeEnvironment & environment() noexcept { return environment_; }
  [[nodiscard]] const TypeEnvironment & environment() const noexcept { return environment_; }

private:
  TypeVarId next_id_;
  Substitution substitution_;
  TypeEnvironment environment_;
};

}  // namespace kleis
