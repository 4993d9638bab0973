// kleis/sema/signature_interpreter.cpp
#include "kleis/sema/signature_interpreter.hpp"

#include <algorithm>
#include <set>
#include <vector>

#include <fmt/core.h>

#include "kleis/types/unifier.hpp"

namespace kleis
{

namespace
{

void collect_names(const TypeExpr & e, std::set<std::string, std::less<>> & out)
{
  if (e.kind == TypeExprKind::Named) {
    out.insert(e.name);
  }
  for (const auto & arg : e.args) {
    collect_names(arg, out);
  }
}

/**
 * Walk a declared parameter type against the argument type and return the
 * name of the dimension parameter bound to `expected` at the position where
 * the argument holds `found`.
 */
std::optional<std::string> find_dimension_parameter(
  const TypeExpr & declared, const TypePtr & actual, const TypeError & err,
  const SignatureScope & scope, const Substitution & s)
{
  const TypePtr a = s.apply(actual);

  switch (declared.kind) {
    case TypeExprKind::Named: {
      if (!a->is_nat() || a->nat != err.found) {
        return std::nullopt;
      }
      const auto it = scope.find(declared.name);
      if (it == scope.end()) {
        return std::nullopt;
      }
      const TypePtr bound = s.apply(it->second);
      if (bound->is_nat() && bound->nat == err.expected) {
        return declared.name;
      }
      return std::nullopt;
    }
    case TypeExprKind::Parametric:
      if (!a->is_constructor(declared.name)) {
        return std::nullopt;
      }
      break;
    case TypeExprKind::Function:
      if (!a->is_function()) {
        return std::nullopt;
      }
      break;
    case TypeExprKind::Product:
      if (!a->is_product()) {
        return std::nullopt;
      }
      break;
    case TypeExprKind::Number:
      return std::nullopt;
  }

  if (a->args.size() != declared.args.size()) {
    return std::nullopt;
  }
  for (size_t i = 0; i < declared.args.size(); ++i) {
    if (auto name = find_dimension_parameter(declared.args[i], a->args[i], err, scope, s)) {
      return name;
    }
  }
  return std::nullopt;
}

}  // namespace

// ============================================================================
// Name classification
// ============================================================================

bool SignatureInterpreter::is_unknown_name(std::string_view name) const
{
  return !TypeContext::is_builtin_name(name) && !registry_.has_structure(name) &&
         !registry_.has_data_type(name);
}

bool SignatureInterpreter::is_unknown_lowercase_name(std::string_view name) const
{
  if (name.empty() || !is_unknown_name(name)) {
    return false;
  }
  const auto c = static_cast<unsigned char>(name.front());
  // Non-ASCII leading letters are Greek variables (α, β) here.
  return (c >= 'a' && c <= 'z') || c >= 0x80;
}

// ============================================================================
// Conversion
// ============================================================================

TypePtr SignatureInterpreter::convert(
  const TypeExpr & expr, SignatureScope & scope, InferenceSession & session,
  const std::function<bool(std::string_view)> & is_implicit) const
{
  switch (expr.kind) {
    case TypeExprKind::Named: {
      if (const auto it = scope.find(expr.name); it != scope.end()) {
        return it->second;
      }
      if (auto builtin = types_.lookup_builtin(expr.name)) {
        return builtin;
      }
      if (is_implicit && is_implicit(expr.name)) {
        TypePtr var = session.fresh_var();
        scope.emplace(expr.name, var);
        return var;
      }
      return make_data(expr.name, expr.name);
    }
    case TypeExprKind::Parametric: {
      std::vector<TypePtr> args;
      args.reserve(expr.args.size());
      for (const auto & arg : expr.args) {
        args.push_back(convert(arg, scope, session, is_implicit));
      }
      return make_data(expr.name, expr.name, std::move(args));
    }
    case TypeExprKind::Number:
      return make_nat(expr.number);
    case TypeExprKind::Function: {
      TypePtr domain = convert(expr.domain(), scope, session, is_implicit);
      TypePtr codomain = convert(expr.codomain(), scope, session, is_implicit);
      return make_function(std::move(domain), std::move(codomain));
    }
    case TypeExprKind::Product: {
      std::vector<TypePtr> elements;
      elements.reserve(expr.args.size());
      for (const auto & element : expr.args) {
        elements.push_back(convert(element, scope, session, is_implicit));
      }
      return make_product(std::move(elements));
    }
  }
  return session.fresh_var();
}

// ============================================================================
// Interpretation
// ============================================================================

InterpretResult SignatureInterpreter::interpret(
  const OperationCandidate & candidate, gsl::span<const TypePtr> args,
  InferenceSession & session) const
{
  const OperationSignature & sig = *candidate.signature;

  if (args.size() != sig.arity()) {
    return InterpretResult::fail(TypeError::make(
      TypeErrorKind::ArityMismatch,
      fmt::format(
        "operation '{}' expects {} argument(s), found {}", sig.name, sig.arity(), args.size())));
  }

  std::function<bool(std::string_view)> is_implicit;
  if (candidate.is_toplevel()) {
    is_implicit = [this](std::string_view n) { return is_unknown_name(n); };
  } else {
    is_implicit = [this](std::string_view n) { return is_unknown_lowercase_name(n); };
  }

  // Structure parameters: fresh variables, or the implementation's arguments.
  SignatureScope scope;
  if (candidate.owner) {
    SignatureScope impl_scope;
    const auto & params = candidate.owner->params;
    for (size_t i = 0; i < params.size(); ++i) {
      const auto * impl = candidate.implementation.get();
      if (impl != nullptr && i < impl->type_args.size()) {
        scope[params[i].name] = convert(impl->type_args[i], impl_scope, session, is_implicit);
      } else {
        scope[params[i].name] = session.fresh_var();
      }
    }
  }

  std::vector<TypePtr> declared;
  declared.reserve(sig.params.size());
  for (const auto & p : sig.params) {
    declared.push_back(convert(p, scope, session, is_implicit));
  }
  const TypePtr result = convert(sig.result, scope, session, is_implicit);

  // Measured before unification: a parameter bound to an argument type is not concrete.
  size_t specificity = 0;
  for (const auto & d : declared) {
    specificity += d->concrete_node_count();
  }

  Substitution local = session.substitution();
  for (size_t i = 0; i < declared.size(); ++i) {
    const Substitution before = local;
    auto err = unify_into(declared[i], args[i], local);
    if (!err) {
      continue;
    }

    if (err->kind == TypeErrorKind::DimensionMismatch) {
      const auto param = find_dimension_parameter(sig.params[i], args[i], *err, scope, local);
      err->parameter = param.value_or("");
      err->message = fmt::format(
        "dimension mismatch in '{}': {} vs {} ({}expected {}, found {})", sig.name,
        to_string(before.apply(declared[i])), to_string(before.apply(args[i])),
        param ? fmt::format("parameter {}: ", *param) : std::string(), err->expected, err->found);
    } else {
      err->message = fmt::format("argument {} of '{}': {}", i + 1, sig.name, err->message);
    }
    return InterpretResult::fail(std::move(*err));
  }

  // Every structure parameter the signature mentions must be fixed by the arguments.
  if (candidate.owner) {
    std::set<std::string, std::less<>> used;
    collect_names(sig.type, used);

    std::set<TypeVarId> arg_vars;
    for (const auto & a : args) {
      local.apply(a)->collect_vars(arg_vars);
    }

    for (const auto & p : candidate.owner->params) {
      if (used.count(p.name) == 0) continue;
      std::set<TypeVarId> vars;
      local.apply(scope[p.name])->collect_vars(vars);
      const bool undetermined = std::any_of(
        vars.begin(), vars.end(), [&](TypeVarId v) { return arg_vars.count(v) == 0; });
      if (undetermined) {
        TypeError e = TypeError::make(
          TypeErrorKind::UnresolvedTypeParameter,
          fmt::format(
            "cannot determine type parameter '{}' of {} from the arguments of '{}'", p.name,
            candidate.describe(), sig.name));
        e.parameter = p.name;
        return InterpretResult::fail(std::move(e));
      }
    }
  }

  session.substitution() = std::move(local);
  return InterpretResult::ok(session.apply(result), specificity);
}

}  // namespace kleis
