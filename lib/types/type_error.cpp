// kleis/types/type_error.cpp
#include "kleis/types/type_error.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace kleis
{

std::string_view to_string(TypeErrorKind kind) noexcept
{
  switch (kind) {
    case TypeErrorKind::UnboundOperation:
      return "UnboundOperation";
    case TypeErrorKind::NoMatchingImplementation:
      return "NoMatchingImplementation";
    case TypeErrorKind::ArityMismatch:
      return "ArityMismatch";
    case TypeErrorKind::DimensionMismatch:
      return "DimensionMismatch";
    case TypeErrorKind::TypeMismatch:
      return "TypeMismatch";
    case TypeErrorKind::OccursCheckFailure:
      return "OccursCheckFailure";
    case TypeErrorKind::UnresolvedTypeParameter:
      return "UnresolvedTypeParameter";
    case TypeErrorKind::CyclicDependency:
      return "CyclicDependency";
    case TypeErrorKind::DuplicateName:
      return "DuplicateName";
    case TypeErrorKind::UnknownStructure:
      return "UnknownStructure";
    case TypeErrorKind::InvalidSignature:
      return "InvalidSignature";
  }
  return "TypeError";
}

TypeError TypeError::make(TypeErrorKind kind, std::string message)
{
  TypeError e;
  e.kind = kind;
  e.message = std::move(message);
  return e;
}

TypeError TypeError::type_mismatch(const TypePtr & expected, const TypePtr & found)
{
  return make(
    TypeErrorKind::TypeMismatch,
    fmt::format("type mismatch: cannot unify {} with {}", to_string(expected), to_string(found)));
}

TypeError TypeError::dimension_mismatch(uint64_t expected, uint64_t found)
{
  TypeError e = make(
    TypeErrorKind::DimensionMismatch,
    fmt::format("dimension mismatch: expected {}, found {}", expected, found));
  e.expected = expected;
  e.found = found;
  return e;
}

TypeError TypeError::occurs_check(TypeVarId var, const TypePtr & in)
{
  return make(
    TypeErrorKind::OccursCheckFailure,
    fmt::format("occurs check failed: α{} occurs in {} (infinite type)", var, to_string(in)));
}

TypeError TypeError::cyclic_dependency(std::vector<std::string> path)
{
  TypeError e = make(
    TypeErrorKind::CyclicDependency,
    fmt::format("cyclic structure dependency: {}", fmt::join(path, " -> ")));
  e.path = std::move(path);
  return e;
}

}  // namespace kleis
