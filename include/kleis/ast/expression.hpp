// kleis/ast/expression.hpp - Editor expression tree consumed by type inference
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <gsl/span>

namespace kleis
{

enum class ExprKind : uint8_t {
  Const,        ///< numeric literal text
  Object,       ///< free identifier
  Placeholder,  ///< unfilled slot with an id and an editor hint
  Operation,    ///< named operation applied to arguments
  List,         ///< bracketed sequence of items
};

/**
 * Immutable expression value.
 *
 * `text()` is the literal for Const, the identifier for Object, the
 * operation name for Operation and the hint for Placeholder. `args()` holds
 * Operation arguments and List items.
 */
class Expression
{
public:
  [[nodiscard]] static Expression constant(std::string text);
  [[nodiscard]] static Expression object(std::string name);
  [[nodiscard]] static Expression placeholder(uint32_t id, std::string hint = "");
  [[nodiscard]] static Expression operation(std::string name, std::vector<Expression> args);
  [[nodiscard]] static Expression list(std::vector<Expression> items);

  [[nodiscard]] ExprKind kind() const noexcept { return kind_; }
  [[nodiscard]] bool is(ExprKind k) const noexcept { return kind_ == k; }

  [[nodiscard]] const std::string & text() const noexcept { return text_; }
  [[nodiscard]] uint32_t placeholder_id() const noexcept { return id_; }
  [[nodiscard]] gsl::span<const Expression> args() const noexcept { return args_; }

  [[nodiscard]] bool operator==(const Expression & other) const;
  [[nodiscard]] bool operator!=(const Expression & other) const { return !(*this == other); }

private:
  Expression(ExprKind kind, std::string text) : kind_(kind), text_(std::move(text)) {}

  ExprKind kind_;
  std::string text_;
  uint32_t id_ = 0;
  std::vector<Expression> args_;
};

struct PlaceholderInfo
{
  uint32_t id = 0;
  std::string hint;
};

/// Placeholders in depth-first, left-to-right order
[[nodiscard]] std::vector<PlaceholderInfo> find_placeholders(const Expression & expr);

/// Smallest placeholder id greater than `current`
[[nodiscard]] std::optional<uint32_t> next_placeholder(const Expression & expr, uint32_t current);

/// Largest placeholder id smaller than `current`
[[nodiscard]] std::optional<uint32_t> prev_placeholder(const Expression & expr, uint32_t current);

/// Operation names occurring anywhere in the tree, in first-occurrence order
[[nodiscard]] std::vector<std::string> operation_names(const Expression & expr);

/// Compact rendering for messages: plus(1, x, □0)
[[nodiscard]] std::string to_string(const Expression & expr);

}  // namespace kleis
