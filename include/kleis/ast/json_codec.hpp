// kleis/ast/json_codec.hpp - JSON wire form of expressions, types and check results
//
// Expressions arrive from the editor as externally tagged objects:
//   {"Const": "1"}, {"Object": "x"}, {"Placeholder": {"id": 0, "hint": "x"}},
//   {"Operation": {"name": "plus", "args": [...]}}, {"List": [...]}
//
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "kleis/ast/expression.hpp"
#include "kleis/sema/type_check_result.hpp"
#include "kleis/types/type.hpp"

namespace kleis
{

struct ExpressionParseResult
{
  std::optional<Expression> expr;
  std::string error;

  [[nodiscard]] bool success() const noexcept { return expr.has_value(); }

  static ExpressionParseResult ok(Expression e)
  {
    ExpressionParseResult r;
    r.expr = std::move(e);
    return r;
  }
  static ExpressionParseResult fail(std::string msg)
  {
    ExpressionParseResult r;
    r.error = std::move(msg);
    return r;
  }
};

/// Decode the wire form; the error names the offending JSON pointer
[[nodiscard]] ExpressionParseResult expression_from_json(const nlohmann::json & j);

/// Parse JSON text, then decode it
[[nodiscard]] ExpressionParseResult parse_expression_json(std::string_view text);

[[nodiscard]] nlohmann::json to_json(const Expression & expr);

/**
 * Structured type:
 *   {"kind": "Data", "constructor": "Matrix", "args": [...], "display": "Matrix(2, 3, ℝ)"}
 */
[[nodiscard]] nlohmann::json to_json(const TypePtr & type);

/// {"status": "success" | "error" | "polymorphic", ...}
[[nodiscard]] nlohmann::json to_json(const TypeCheckResult & result);

}  // namespace kleis
