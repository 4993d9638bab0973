// kleis/types/type_error.hpp - Typed failures of unification, dispatch and loading
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kleis/types/type.hpp"

namespace kleis
{

enum class TypeErrorKind : uint8_t {
  UnboundOperation,          ///< no structure declares the operation at this arity
  NoMatchingImplementation,  ///< candidates exist but none accepts the arguments
  ArityMismatch,             ///< signature/call argument-count disagreement
  DimensionMismatch,         ///< conflicting natural-number type arguments
  TypeMismatch,              ///< incompatible constructors or kinds
  OccursCheckFailure,        ///< binding would create an infinite type
  UnresolvedTypeParameter,   ///< structure parameter not determined by the call
  CyclicDependency,          ///< extends/over graph contains a cycle
  DuplicateName,             ///< two structures or implementations collide
  UnknownStructure,          ///< reference to a structure that is not registered
  InvalidSignature,          ///< declaration that cannot be turned into types
};

[[nodiscard]] std::string_view to_string(TypeErrorKind kind) noexcept;

struct TypeError
{
  TypeErrorKind kind = TypeErrorKind::TypeMismatch;
  std::string message;
  std::optional<std::string> suggestion;

  /// DimensionMismatch payload
  uint64_t expected = 0;
  uint64_t found = 0;
  std::string parameter;

  /// CyclicDependency: the cycle, first and last equal.
  /// UnknownStructure from validation: the referring structure, then the missing name.
  std::vector<std::string> path;

  [[nodiscard]] static TypeError make(TypeErrorKind kind, std::string message);

  [[nodiscard]] static TypeError type_mismatch(const TypePtr & expected, const TypePtr & found);
  [[nodiscard]] static TypeError dimension_mismatch(uint64_t expected, uint64_t found);
  [[nodiscard]] static TypeError occurs_check(TypeVarId var, const TypePtr & in);
  [[nodiscard]] static TypeError cyclic_dependency(std::vector<std::string> path);

  TypeError & with_suggestion(std::string text) &
  {
    suggestion = std::move(text);
    return *this;
  }
};

}  // namespace kleis
