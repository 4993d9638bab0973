// kleis/ast/expression.cpp
#include "kleis/ast/expression.hpp"

#include <algorithm>

#include <fmt/core.h>

namespace kleis
{

namespace
{

void collect_placeholders(const Expression & expr, std::vector<PlaceholderInfo> & out)
{
  if (expr.is(ExprKind::Placeholder)) {
    out.push_back(PlaceholderInfo{expr.placeholder_id(), expr.text()});
    return;
  }
  for (const auto & child : expr.args()) {
    collect_placeholders(child, out);
  }
}

void collect_operation_names(const Expression & expr, std::vector<std::string> & out)
{
  if (expr.is(ExprKind::Operation) &&
      std::find(out.begin(), out.end(), expr.text()) == out.end()) {
    out.push_back(expr.text());
  }
  for (const auto & child : expr.args()) {
    collect_operation_names(child, out);
  }
}

std::string join_args(gsl::span<const Expression> args)
{
  std::string out;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0) out += ", ";
    out += to_string(args[i]);
  }
  return out;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

Expression Expression::constant(std::string text) { return {ExprKind::Const, std::move(text)}; }

Expression Expression::object(std::string name) { return {ExprKind::Object, std::move(name)}; }

Expression Expression::placeholder(uint32_t id, std::string hint)
{
  Expression e(ExprKind::Placeholder, std::move(hint));
  e.id_ = id;
  return e;
}

Expression Expression::operation(std::string name, std::vector<Expression> args)
{
  Expression e(ExprKind::Operation, std::move(name));
  e.args_ = std::move(args);
  return e;
}

Expression Expression::list(std::vector<Expression> items)
{
  Expression e(ExprKind::List, "");
  e.args_ = std::move(items);
  return e;
}

bool Expression::operator==(const Expression & other) const
{
  return kind_ == other.kind_ && text_ == other.text_ && id_ == other.id_ && args_ == other.args_;
}

// ============================================================================
// Queries
// ============================================================================

std::vector<PlaceholderInfo> find_placeholders(const Expression & expr)
{
  std::vector<PlaceholderInfo> out;
  collect_placeholders(expr, out);
  return out;
}

std::optional<uint32_t> next_placeholder(const Expression & expr, uint32_t current)
{
  std::optional<uint32_t> best;
  for (const auto & p : find_placeholders(expr)) {
    if (p.id > current && (!best || p.id < *best)) {
      best = p.id;
    }
  }
  return best;
}

std::optional<uint32_t> prev_placeholder(const Expression & expr, uint32_t current)
{
  std::optional<uint32_t> best;
  for (const auto & p : find_placeholders(expr)) {
    if (p.id < current && (!best || p.id > *best)) {
      best = p.id;
    }
  }
  return best;
}

std::vector<std::string> operation_names(const Expression & expr)
{
  std::vector<std::string> out;
  collect_operation_names(expr, out);
  return out;
}

std::string to_string(const Expression & expr)
{
  switch (expr.kind()) {
    case ExprKind::Const:
    case ExprKind::Object:
      return expr.text();
    case ExprKind::Placeholder:
      return fmt::format("□{}", expr.placeholder_id());
    case ExprKind::Operation:
      return fmt::format("{}({})", expr.text(), join_args(expr.args()));
    case ExprKind::List:
      return fmt::format("[{}]", join_args(expr.args()));
  }
  return "";
}

}  // namespace kleis
