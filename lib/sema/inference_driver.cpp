// kleis/sema/inference_driver.cpp
#include "kleis/sema/inference_driver.hpp"

#include <algorithm>
#include <charconv>
#include <limits>
#include <ostream>
#include <set>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "kleis/types/unifier.hpp"

namespace kleis
{

namespace
{

std::optional<uint64_t> parse_natural(const Expression & e)
{
  if (!e.is(ExprKind::Const) || e.text().empty()) {
    return std::nullopt;
  }
  uint64_t value = 0;
  const char * begin = e.text().data();
  const char * end = begin + e.text().size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::string describe_types(const std::vector<TypePtr> & types)
{
  std::vector<std::string> parts;
  parts.reserve(types.size());
  for (const auto & t : types) {
    parts.push_back(to_string(t));
  }
  return fmt::format("({})", fmt::join(parts, ", "));
}

}  // namespace

std::string_view to_string(DispatchPolicy policy) noexcept
{
  switch (policy) {
    case DispatchPolicy::FirstMatch:
      return "first_match";
    case DispatchPolicy::MostSpecific:
      return "most_specific";
  }
  return "first_match";
}

std::optional<DispatchPolicy> parse_dispatch_policy(std::string_view text) noexcept
{
  if (text == "first_match") return DispatchPolicy::FirstMatch;
  if (text == "most_specific") return DispatchPolicy::MostSpecific;
  return std::nullopt;
}

bool is_matrix_literal_name(std::string_view name) noexcept
{
  return name == "Matrix" || name == "PMatrix" || name == "VMatrix" || name == "BMatrix";
}

void InferenceDriver::trace(const std::string & line) const
{
  if (options_.trace != nullptr) {
    *options_.trace << line << '\n';
  }
}

// ============================================================================
// Entry points
// ============================================================================

TypeCheckResult InferenceDriver::check(const Expression & expr, TypeEnvironment environment) const
{
  InferenceSession session = InferenceSession::with_environment(std::move(environment));
  InferOutcome outcome = infer(expr, session);
  if (!outcome.success()) {
    return TypeCheckResult::error(*outcome.error);
  }
  if (!outcome.type->contains_var()) {
    return TypeCheckResult::success(std::move(outcome.type));
  }

  std::set<std::string> available;
  for (const auto & op : operation_names(expr)) {
    for (auto & t : registry_.types_supporting(op)) {
      available.insert(std::move(t));
    }
  }
  return TypeCheckResult::polymorphic(
    std::move(outcome.type), std::vector<std::string>(available.begin(), available.end()));
}

InferOutcome InferenceDriver::infer(const Expression & expr, InferenceSession & session) const
{
  InferOutcome outcome = infer_node(expr, session);
  if (outcome.success()) {
    outcome.type = session.apply(outcome.type);
  }
  return outcome;
}

std::optional<std::string> InferenceDriver::suggest_operation(std::string_view op) const
{
  const auto types = registry_.types_supporting(op);
  if (types.empty()) {
    return std::nullopt;
  }
  return fmt::format("Operation '{}' is available for types: {}", op, fmt::join(types, ", "));
}

// ============================================================================
// Expression nodes
// ============================================================================

InferOutcome InferenceDriver::infer_node(const Expression & expr, InferenceSession & session) const
{
  switch (expr.kind()) {
    case ExprKind::Const:
      return InferOutcome::ok(types_.scalar_type());

    case ExprKind::Object: {
      auto & env = session.environment();
      if (const auto it = env.find(expr.text()); it != env.end()) {
        return InferOutcome::ok(session.apply(it->second));
      }
      // Later references to the same identifier share this variable.
      TypePtr var = session.fresh_var();
      env.emplace(expr.text(), var);
      return InferOutcome::ok(std::move(var));
    }

    case ExprKind::Placeholder:
      return InferOutcome::ok(session.fresh_var());

    case ExprKind::List:
      return infer_list(expr, session);

    case ExprKind::Operation:
      if (is_matrix_literal_name(expr.text())) {
        return infer_matrix_literal(expr, session);
      }
      return infer_operation(expr, session);
  }
  return InferOutcome::ok(session.fresh_var());
}

InferOutcome InferenceDriver::infer_list(const Expression & expr, InferenceSession & session) const
{
  const TypePtr element = session.fresh_var();
  const auto items = expr.args();
  for (size_t i = 0; i < items.size(); ++i) {
    InferOutcome item = infer_node(items[i], session);
    if (!item.success()) {
      return item;
    }
    if (auto err = unify_into(element, item.type, session.substitution())) {
      err->message = fmt::format("list item {}: {}", i + 1, err->message);
      return InferOutcome::fail(std::move(*err));
    }
  }
  return InferOutcome::ok(make_data("List", "List", {session.apply(element)}));
}

// Matrix(rows, cols, e1, ..., ek)
InferOutcome InferenceDriver::infer_matrix_literal(
  const Expression & expr, InferenceSession & session) const
{
  const auto args = expr.args();
  if (args.size() < 2) {
    return InferOutcome::fail(TypeError::make(
      TypeErrorKind::ArityMismatch,
      fmt::format("matrix literal '{}' needs row and column counts", expr.text())));
  }

  const auto rows = parse_natural(args[0]);
  const auto cols = parse_natural(args[1]);
  if (!rows || !cols) {
    return InferOutcome::fail(TypeError::make(
      TypeErrorKind::TypeMismatch,
      fmt::format(
        "dimensions of matrix literal '{}' must be natural-number constants", expr.text())));
  }

  const size_t elements = args.size() - 2;
  if (elements != 0 && *cols != 0 && *rows > std::numeric_limits<uint64_t>::max() / *cols) {
    return InferOutcome::fail(TypeError::make(
      TypeErrorKind::ArityMismatch,
      fmt::format(
        "matrix literal {}x{} is too large for its {} elements", *rows, *cols, elements)));
  }
  if (elements != 0 && elements != *rows * *cols) {
    return InferOutcome::fail(TypeError::make(
      TypeErrorKind::ArityMismatch,
      fmt::format(
        "matrix literal {}x{} needs {} elements, found {}", *rows, *cols, *rows * *cols,
        elements)));
  }

  for (size_t i = 2; i < args.size(); ++i) {
    InferOutcome element = infer_node(args[i], session);
    if (!element.success()) {
      return element;
    }
    if (auto err = unify_into(types_.scalar_type(), element.type, session.substitution())) {
      err->message = fmt::format("matrix element {}: {}", i - 1, err->message);
      return InferOutcome::fail(std::move(*err));
    }
  }

  return InferOutcome::ok(
    make_data("Matrix", "Matrix", {make_nat(*rows), make_nat(*cols), types_.scalar_type()}));
}

InferOutcome InferenceDriver::infer_operation(
  const Expression & expr, InferenceSession & session) const
{
  std::vector<TypePtr> arg_types;
  arg_types.reserve(expr.args().size());
  for (const auto & arg : expr.args()) {
    InferOutcome r = infer_node(arg, session);
    if (!r.success()) {
      return r;
    }
    arg_types.push_back(std::move(r.type));
  }

  // Later arguments may have refined earlier ones.
  for (auto & t : arg_types) {
    t = session.apply(t);
  }
  return dispatch(expr.text(), arg_types, session);
}

// ============================================================================
// Dispatch
// ============================================================================

InferOutcome InferenceDriver::dispatch(
  std::string_view op, const std::vector<TypePtr> & arg_types, InferenceSession & session) const
{
  const size_t arity = arg_types.size();
  const auto candidates = registry_.signatures_for(op, arity);

  if (candidates.empty()) {
    TypeError err = TypeError::make(
      TypeErrorKind::UnboundOperation,
      fmt::format("unknown operation '{}' with {} argument(s)", op, arity));

    std::set<size_t> arities;
    for (const auto & c : registry_.candidates_named(op)) {
      arities.insert(c.signature->arity());
    }
    if (!arities.empty()) {
      err.with_suggestion(
        fmt::format("'{}' is declared with {} argument(s)", op, fmt::join(arities, " or ")));
    }
    return InferOutcome::fail(std::move(err));
  }

  std::vector<TypeError> failures;
  std::optional<InferenceSession> best_session;
  TypePtr best_type;
  size_t best_specificity = 0;

  for (const auto & candidate : candidates) {
    InferenceSession attempt = session;
    InterpretResult r = interpreter_.interpret(candidate, arg_types, attempt);

    if (!r.success()) {
      if (tracing()) {
        trace(fmt::format(
          "[infer] {}/{}: candidate {} rejected: {}", op, arity, candidate.describe(),
          r.error->message));
      }
      failures.push_back(std::move(*r.error));
      continue;
    }

    if (tracing()) {
      trace(fmt::format(
        "[infer] {}/{}: candidate {} -> {}", op, arity, candidate.describe(), to_string(r.type)));
    }

    if (options_.dispatch == DispatchPolicy::FirstMatch) {
      session = std::move(attempt);
      return InferOutcome::ok(std::move(r.type));
    }
    // Ties keep the earlier candidate.
    if (!best_session || r.specificity > best_specificity) {
      best_session = std::move(attempt);
      best_type = std::move(r.type);
      best_specificity = r.specificity;
    }
  }

  if (best_session) {
    session = std::move(*best_session);
    return InferOutcome::ok(std::move(best_type));
  }

  // A dimension conflict is the near miss worth reporting. An unresolved
  // parameter is a defect of the signature, not of the call.
  for (const auto kind :
       {TypeErrorKind::DimensionMismatch, TypeErrorKind::UnresolvedTypeParameter}) {
    const auto it = std::find_if(failures.begin(), failures.end(), [kind](const TypeError & e) {
      return e.kind == kind;
    });
    if (it != failures.end()) {
      return InferOutcome::fail(std::move(*it));
    }
  }

  const std::string attempted = describe_types(arg_types);
  TypeError err = TypeError::make(
    TypeErrorKind::NoMatchingImplementation,
    fmt::format("no implementation of '{}' accepts argument types {}", op, attempted));
  if (auto hint = suggest_operation(op)) {
    err.with_suggestion(fmt::format("{}; attempted argument types: {}", *hint, attempted));
  } else {
    err.with_suggestion(fmt::format("attempted argument types: {}", attempted));
  }
  return InferOutcome::fail(std::move(err));
}

}  // namespace kleis
