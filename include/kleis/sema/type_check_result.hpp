// kleis/sema/type_check_result.hpp - Three-way outcome of checking an expression
#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "kleis/types/type.hpp"
#include "kleis/types/type_error.hpp"

namespace kleis
{

/**
 * Result of `check`.
 *
 * - Success: the type is fully resolved.
 * - Error: a hard failure with an optional remediation hint.
 * - Polymorphic: the type still contains unresolved variables. This is not
 *   an error; `available_types` lists types that support the operations of
 *   the expression.
 */
class TypeCheckResult
{
public:
  struct Success
  {
    TypePtr type;
  };

  struct Error
  {
    TypeErrorKind kind = TypeErrorKind::TypeMismatch;
    std::string message;
    std::optional<std::string> suggestion;
  };

  struct Polymorphic
  {
    TypePtr type_var;
    std::vector<std::string> available_types;
  };

  [[nodiscard]] static TypeCheckResult success(TypePtr type)
  {
    return TypeCheckResult(Success{std::move(type)});
  }
  [[nodiscard]] static TypeCheckResult error(const TypeError & err)
  {
    return TypeCheckResult(Error{err.kind, err.message, err.suggestion});
  }
  [[nodiscard]] static TypeCheckResult polymorphic(
    TypePtr type_var, std::vector<std::string> available_types)
  {
    return TypeCheckResult(Polymorphic{std::move(type_var), std::move(available_types)});
  }

  [[nodiscard]] bool is_success() const noexcept { return std::holds_alternative<Success>(value_); }
  [[nodiscard]] bool is_error() const noexcept { return std::holds_alternative<Error>(value_); }
  [[nodiscard]] bool is_polymorphic() const noexcept
  {
    return std::holds_alternative<Polymorphic>(value_);
  }

  /// Preconditions: the matching is_*() is true
  [[nodiscard]] const Success & as_success() const { return std::get<Success>(value_); }
  [[nodiscard]] const Error & as_error() const { return std::get<Error>(value_); }
  [[nodiscard]] const Polymorphic & as_polymorphic() const { return std::get<Polymorphic>(value_); }

  /// Success type or Polymorphic type; nullptr for errors
  [[nodiscard]] TypePtr type() const noexcept
  {
    if (const auto * s = std::get_if<Success>(&value_)) return s->type;
    if (const auto * p = std::get_if<Polymorphic>(&value_)) return p->type_var;
    return nullptr;
  }

  [[nodiscard]] const std::variant<Success, Error, Polymorphic> & value() const noexcept
  {
    return value_;
  }

private:
  template <typename T>
  explicit TypeCheckResult(T alt) : value_(std::move(alt))
  {
  }

  std::variant<Success, Error, Polymorphic> value_;
};

/// One-line rendering: "ℝ", "error: ...", "polymorphic α0 (available: ℝ)"
[[nodiscard]] std::string to_string(const TypeCheckResult & result);

}  // namespace kleis
