// kleis/structure/structure_registry.cpp
#include "kleis/structure/structure_registry.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <functional>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <unordered_set>

#include "kleis/types/type.hpp"

namespace kleis
{

namespace
{

std::vector<std::string> dependency_names(const StructureDef & s)
{
  std::vector<std::string> out;
  for (const auto * clause : {&s.extends_clause, &s.over_clause}) {
    if (!clause->has_value()) continue;
    const std::string & head = (*clause)->head();
    // `over ℝ` names a builtin type, not a structure.
    if (!head.empty() && !TypeContext::is_builtin_name(head)) {
      out.push_back(head);
    }
  }
  return out;
}

// A top-level signature type is concrete when all of its names are builtins.
bool is_concrete_type_expr(const TypeExpr & t)
{
  if (t.kind == TypeExprKind::Named) {
    return TypeContext::is_builtin_name(t.name);
  }
  return std::all_of(t.args.begin(), t.args.end(), is_concrete_type_expr);
}

using ParamBindings = std::map<std::string, TypeExpr, std::less<>>;

TypeExpr substitute_params(const TypeExpr & t, const ParamBindings & bindings)
{
  if (t.kind == TypeExprKind::Named) {
    const auto it = bindings.find(t.name);
    return it != bindings.end() ? it->second : t;
  }
  TypeExpr out = t;
  for (auto & arg : out.args) {
    arg = substitute_params(arg, bindings);
  }
  return out;
}

bool mentions_name(const TypeExpr & t, std::string_view name)
{
  if (t.kind == TypeExprKind::Named) {
    return t.name == name;
  }
  return std::any_of(
    t.args.begin(), t.args.end(), [&](const TypeExpr & a) { return mentions_name(a, name); });
}

// The type parameter of `owner` that `op` is about: the first one its
// leading parameter (or, for a constant, its result) mentions.
const TypeParam * subject_param(const StructureDef & owner, std::string_view op)
{
  const OperationSignature * sig = nullptr;
  for (const auto * candidate : owner.all_operations()) {
    if (candidate->name == op) {
      sig = candidate;
      break;
    }
  }
  const TypeParam * first_type = nullptr;
  for (const auto & p : owner.params) {
    if (p.kind != ParamKind::Type) continue;
    if (first_type == nullptr) first_type = &p;
    if (sig != nullptr) {
      const TypeExpr & subject = sig->params.empty() ? sig->result : sig->params.front();
      if (mentions_name(subject, p.name)) {
        return &p;
      }
    }
  }
  return first_type;
}

const std::vector<TypeParam> k_no_params;

const TypeParam * find_param(const std::vector<TypeParam> & params, std::string_view name)
{
  const auto it = std::find_if(
    params.begin(), params.end(), [&](const TypeParam & p) { return p.name == name; });
  return it != params.end() ? &*it : nullptr;
}

std::optional<std::string> repeated_param(const std::vector<TypeParam> & params)
{
  for (size_t i = 0; i < params.size(); ++i) {
    for (size_t j = 0; j < i; ++j) {
      if (params[i].name == params[j].name) {
        return params[i].name;
      }
    }
  }
  return std::nullopt;
}

// Numerals and dimension parameters may only appear as constructor arguments.
std::optional<std::string> misplaced_dimension(
  const TypeExpr & t, const std::vector<TypeParam> & params)
{
  switch (t.kind) {
    case TypeExprKind::Number:
      return std::to_string(t.number);
    case TypeExprKind::Named: {
      const TypeParam * p = find_param(params, t.name);
      if (p != nullptr && p->kind == ParamKind::Nat) {
        return t.name;
      }
      return std::nullopt;
    }
    case TypeExprKind::Parametric:
      for (const auto & arg : t.args) {
        if (arg.kind == TypeExprKind::Function || arg.kind == TypeExprKind::Product) {
          if (auto bad = misplaced_dimension(arg, params)) return bad;
        }
      }
      return std::nullopt;
    case TypeExprKind::Function:
    case TypeExprKind::Product:
      for (const auto & arg : t.args) {
        if (auto bad = misplaced_dimension(arg, params)) return bad;
      }
      return std::nullopt;
  }
  return std::nullopt;
}

std::optional<TypeError> check_signature(
  const OperationSignature & op, const std::vector<TypeParam> & params)
{
  if (auto bad = misplaced_dimension(op.type, params)) {
    return TypeError::make(
      TypeErrorKind::InvalidSignature,
      fmt::format("dimension '{}' is used as a type in the signature of '{}'", *bad, op.name));
  }
  return std::nullopt;
}

// A Nat parameter takes a numeral or a dimension name; a type parameter
// takes anything but those.
std::optional<TypeError> check_argument_kind(
  const TypeExpr & arg, const TypeParam & param, std::string_view ctor,
  const std::vector<TypeParam> & scope, std::string_view context)
{
  const TypeParam * named = arg.kind == TypeExprKind::Named ? find_param(scope, arg.name) : nullptr;

  if (param.kind == ParamKind::Nat) {
    const bool dimension =
      arg.kind == TypeExprKind::Number ||
      (arg.kind == TypeExprKind::Named && !TypeContext::is_builtin_name(arg.name) &&
       (named == nullptr || named->kind == ParamKind::Nat));
    if (!dimension) {
      return TypeError::make(
        TypeErrorKind::InvalidSignature,
        fmt::format(
          "'{}' is not a dimension, but parameter '{}' of '{}' is Nat ({})", to_string(arg),
          param.name, ctor, context));
    }
    return std::nullopt;
  }

  const bool dimension = arg.kind == TypeExprKind::Number ||
                         (named != nullptr && named->kind == ParamKind::Nat);
  if (dimension) {
    return TypeError::make(
      TypeErrorKind::InvalidSignature,
      fmt::format(
        "dimension '{}' given for type parameter '{}' of '{}' ({})", to_string(arg), param.name,
        ctor, context));
  }
  return std::nullopt;
}

}  // namespace

std::string OperationCandidate::describe() const
{
  if (data) {
    return "data " + data->name;
  }
  if (is_toplevel()) {
    return "operation " + signature->name;
  }
  if (implementation) {
    return implementation->display_name();
  }
  return owner->display_name();
}

// ============================================================================
// Registration
// ============================================================================

void StructureRegistry::add_candidate(OperationCandidate candidate)
{
  candidate.order = candidates_.size();
  candidates_by_name_[candidate.signature->name].push_back(candidates_.size());
  candidates_.push_back(std::move(candidate));
}

std::optional<TypeError> StructureRegistry::check_constructor_uses(
  const TypeExpr & t, const std::vector<TypeParam> & scope, std::string_view context,
  ConstructorArities & seen) const
{
  switch (t.kind) {
    case TypeExprKind::Number:
      return std::nullopt;
    case TypeExprKind::Named: {
      if (find_param(scope, t.name) != nullptr) {
        return std::nullopt;
      }
      const auto data = find_data_type(t.name);
      if (data && !data->params.empty()) {
        return TypeError::make(
          TypeErrorKind::ArityMismatch,
          fmt::format(
            "type '{}' takes {} argument(s), found 0 ({})", data->name, data->params.size(),
            context));
      }
      return std::nullopt;
    }
    case TypeExprKind::Parametric:
      if (const auto * params = constructor_params(t.name)) {
        if (params->size() != t.args.size()) {
          return TypeError::make(
            TypeErrorKind::ArityMismatch,
            fmt::format(
              "type '{}' takes {} argument(s), found {} ({})", t.name, params->size(),
              t.args.size(), context));
        }
        for (size_t i = 0; i < t.args.size(); ++i) {
          if (auto err = check_argument_kind(t.args[i], (*params)[i], t.name, scope, context)) {
            return err;
          }
        }
      } else if (!TypeContext::is_builtin_name(t.name)) {
        std::optional<size_t> earlier;
        if (const auto it = seen.find(t.name); it != seen.end()) {
          earlier = it->second;
        } else if (const auto it2 = constructor_arities_.find(t.name);
                   it2 != constructor_arities_.end()) {
          earlier = it2->second;
        }
        if (earlier && *earlier != t.args.size()) {
          return TypeError::make(
            TypeErrorKind::ArityMismatch,
            fmt::format(
              "type '{}' is applied to {} argument(s) ({}), but to {} elsewhere", t.name,
              t.args.size(), context, *earlier));
        }
        seen.emplace(t.name, t.args.size());
      }
      break;
    case TypeExprKind::Function:
    case TypeExprKind::Product:
      break;
  }

  for (const auto & arg : t.args) {
    if (auto err = check_constructor_uses(arg, scope, context, seen)) {
      return err;
    }
  }
  return std::nullopt;
}

std::optional<TypeError> StructureRegistry::check_constructor_uses(
  const OperationSignature & op, const std::vector<TypeParam> & scope,
  ConstructorArities & seen) const
{
  return check_constructor_uses(
    op.type, scope, fmt::format("in the signature of '{}'", op.name), seen);
}

RegisterResult StructureRegistry::register_structure(StructureDef structure)
{
  if (structure_index_.count(structure.name) != 0) {
    return RegisterResult::fail(TypeError::make(
      TypeErrorKind::DuplicateName,
      fmt::format("structure '{}' is already registered", structure.name)));
  }
  if (data_index_.count(structure.name) != 0) {
    return RegisterResult::fail(TypeError::make(
      TypeErrorKind::DuplicateName,
      fmt::format("'{}' is already declared as a data type", structure.name)));
  }

  if (auto repeated = repeated_param(structure.params)) {
    return RegisterResult::fail(TypeError::make(
      TypeErrorKind::InvalidSignature,
      fmt::format("structure '{}' declares parameter '{}' twice", structure.name, *repeated)));
  }
  ConstructorArities seen;
  for (const OperationSignature * op : structure.all_operations()) {
    if (auto err = check_signature(*op, structure.params)) {
      return RegisterResult::fail(std::move(*err));
    }
    if (auto err = check_constructor_uses(*op, structure.params, seen)) {
      return RegisterResult::fail(std::move(*err));
    }
  }
  constructor_arities_.insert(seen.begin(), seen.end());

  auto owner = std::make_shared<const StructureDef>(std::move(structure));
  structure_index_.emplace(owner->name, structures_.size());
  structures_.push_back(owner);

  for (const OperationSignature * op : owner->all_operations()) {
    OperationCandidate c;
    c.owner = owner;
    c.signature = std::shared_ptr<const OperationSignature>(owner, op);
    add_candidate(std::move(c));
  }
  return RegisterResult::ok();
}

RegisterResult StructureRegistry::register_implements(ImplementsDef implementation)
{
  auto target = find_structure(implementation.structure_name);
  if (!target) {
    return RegisterResult::fail(TypeError::make(
      TypeErrorKind::UnknownStructure,
      fmt::format(
        "cannot implement unknown structure '{}'", implementation.structure_name)));
  }

  if (implementation.type_args.size() != target->params.size()) {
    return RegisterResult::fail(TypeError::make(
      TypeErrorKind::ArityMismatch,
      fmt::format(
        "structure '{}' takes {} type argument(s), implementation gives {}",
        target->display_name(), target->params.size(), implementation.type_args.size())));
  }

  ConstructorArities seen;
  const std::string context = fmt::format("in 'implements {}'", implementation.display_name());
  for (size_t i = 0; i < implementation.type_args.size(); ++i) {
    const TypeExpr & arg = implementation.type_args[i];
    if (auto err = check_argument_kind(arg, target->params[i], target->name, k_no_params, context)) {
      return RegisterResult::fail(std::move(*err));
    }
    if (auto err = check_constructor_uses(arg, k_no_params, context, seen)) {
      return RegisterResult::fail(std::move(*err));
    }
  }

  for (const auto & constraint : implementation.where_clause) {
    const auto required = find_structure(constraint.head());
    if (!required) {
      TypeError err = TypeError::make(
        TypeErrorKind::UnknownStructure,
        fmt::format(
          "where clause of '{}' names unknown structure '{}'", implementation.display_name(),
          constraint.head()));
      err.path = {implementation.structure_name, constraint.head()};
      return RegisterResult::fail(std::move(err));
    }
    if (constraint.args.size() != required->params.size()) {
      return RegisterResult::fail(TypeError::make(
        TypeErrorKind::ArityMismatch,
        fmt::format(
          "where clause of '{}': structure '{}' takes {} type argument(s), found {}",
          implementation.display_name(), required->display_name(), required->params.size(),
          constraint.args.size())));
    }
  }

  const std::string args_text = implementation.type_args_text();
  for (const auto & existing : implementations_) {
    if (existing->structure_name == implementation.structure_name &&
        existing->type_args_text() == args_text) {
      return RegisterResult::fail(TypeError::make(
        TypeErrorKind::DuplicateName,
        fmt::format("structure '{}' is already implemented for {}", target->name, args_text)));
    }
  }

  constructor_arities_.insert(seen.begin(), seen.end());
  auto impl = std::make_shared<const ImplementsDef>(std::move(implementation));
  implementations_.push_back(impl);

  for (const OperationSignature * op : target->all_operations()) {
    OperationCandidate c;
    c.owner = target;
    c.implementation = impl;
    c.signature = std::shared_ptr<const OperationSignature>(target, op);
    add_candidate(std::move(c));
  }
  return RegisterResult::ok();
}

RegisterResult StructureRegistry::register_operation(OperationSignature operation)
{
  if (auto err = check_signature(operation, k_no_params)) {
    return RegisterResult::fail(std::move(*err));
  }
  for (const auto & existing : toplevel_operations_) {
    if (existing->name == operation.name && existing->arity() == operation.arity()) {
      return RegisterResult::fail(TypeError::make(
        TypeErrorKind::DuplicateName,
        fmt::format(
          "top-level operation '{}' with {} argument(s) is already declared", operation.name,
          operation.arity())));
    }
  }

  ConstructorArities seen;
  if (auto err = check_constructor_uses(operation, k_no_params, seen)) {
    return RegisterResult::fail(std::move(*err));
  }
  constructor_arities_.insert(seen.begin(), seen.end());

  auto op = std::make_shared<const OperationSignature>(std::move(operation));
  toplevel_operations_.push_back(op);

  OperationCandidate c;
  c.signature = op;
  add_candidate(std::move(c));
  return RegisterResult::ok();
}

RegisterResult StructureRegistry::register_data(DataDef data)
{
  if (TypeContext::is_builtin_name(data.name)) {
    return RegisterResult::fail(TypeError::make(
      TypeErrorKind::DuplicateName, fmt::format("'{}' is a builtin type", data.name)));
  }
  if (has_structure(data.name)) {
    return RegisterResult::fail(TypeError::make(
      TypeErrorKind::DuplicateName,
      fmt::format("'{}' is already declared as a structure", data.name)));
  }
  if (has_data_type(data.name)) {
    return RegisterResult::fail(TypeError::make(
      TypeErrorKind::DuplicateName,
      fmt::format("data type '{}' is already declared", data.name)));
  }
  if (auto repeated = repeated_param(data.params)) {
    return RegisterResult::fail(TypeError::make(
      TypeErrorKind::InvalidSignature,
      fmt::format("data type '{}' declares parameter '{}' twice", data.name, *repeated)));
  }
  if (const auto it = constructor_arities_.find(data.name);
      it != constructor_arities_.end() && it->second != data.params.size()) {
    return RegisterResult::fail(TypeError::make(
      TypeErrorKind::ArityMismatch,
      fmt::format(
        "data type '{}' declares {} parameter(s), but is applied to {} elsewhere", data.name,
        data.params.size(), it->second)));
  }

  std::set<std::string> variant_names;
  for (const auto & variant : data.variants) {
    const auto owner = variant_owner_.find(variant.name);
    if (owner != variant_owner_.end() || !variant_names.insert(variant.name).second) {
      return RegisterResult::fail(TypeError::make(
        TypeErrorKind::DuplicateName,
        fmt::format(
          "variant '{}' is already declared by data type '{}'", variant.name,
          owner != variant_owner_.end() ? owner->second : data.name)));
    }
  }

  // Registered before its fields are checked, so variants may refer to the type itself.
  auto def = std::make_shared<const DataDef>(std::move(data));
  data_index_.emplace(def->name, data_types_.size());
  data_types_.push_back(def);

  ConstructorArities seen;
  for (const auto & variant : def->variants) {
    const std::string context =
      fmt::format("in variant '{}' of '{}'", variant.name, def->name);
    std::optional<TypeError> err;
    for (const auto & field : variant.fields) {
      if (auto bad = misplaced_dimension(field, def->params)) {
        err = TypeError::make(
          TypeErrorKind::InvalidSignature,
          fmt::format("dimension '{}' is used as a type {}", *bad, context));
      } else {
        err = check_constructor_uses(field, def->params, context, seen);
      }
      if (err) break;
    }
    if (err) {
      data_types_.pop_back();
      data_index_.erase(def->name);
      return RegisterResult::fail(std::move(*err));
    }
  }
  constructor_arities_.insert(seen.begin(), seen.end());

  for (const auto & variant : def->variants) {
    variant_owner_.emplace(variant.name, def->name);
    OperationCandidate c;
    c.data = def;
    c.signature = std::make_shared<const OperationSignature>(def->constructor_signature(variant));
    add_candidate(std::move(c));
  }
  return RegisterResult::ok();
}

RegisterResult StructureRegistry::validate() const
{
  for (const auto & s : structures_) {
    for (const auto & dep : dependency_names(*s)) {
      if (!has_structure(dep)) {
        TypeError err = TypeError::make(
          TypeErrorKind::UnknownStructure,
          fmt::format("structure '{}' depends on unknown structure '{}'", s->name, dep));
        err.path = {s->name, dep};
        return RegisterResult::fail(std::move(err));
      }
    }
  }
  for (const auto & s : structures_) {
    auto closure = dependency_closure(s->name);
    if (!closure.success()) {
      return RegisterResult::fail(std::move(*closure.error));
    }
  }
  return RegisterResult::ok();
}

// ============================================================================
// Queries
// ============================================================================

std::shared_ptr<const StructureDef> StructureRegistry::find_structure(std::string_view name) const
{
  const auto it = structure_index_.find(std::string(name));
  return it != structure_index_.end() ? structures_[it->second] : nullptr;
}

std::shared_ptr<const DataDef> StructureRegistry::find_data_type(std::string_view name) const
{
  const auto it = data_index_.find(std::string(name));
  return it != data_index_.end() ? data_types_[it->second] : nullptr;
}

const std::vector<TypeParam> * StructureRegistry::constructor_params(std::string_view name) const
{
  if (const auto data = find_data_type(name)) {
    return &data->params;
  }
  if (const auto structure = find_structure(name)) {
    return &structure->params;
  }
  return nullptr;
}

std::vector<std::string> StructureRegistry::structure_names() const
{
  std::vector<std::string> out;
  out.reserve(structures_.size());
  for (const auto & s : structures_) {
    out.push_back(s->name);
  }
  return out;
}

std::vector<std::shared_ptr<const ImplementsDef>> StructureRegistry::implementations_of(
  std::string_view structure_name) const
{
  std::vector<std::shared_ptr<const ImplementsDef>> out;
  std::copy_if(
    implementations_.begin(), implementations_.end(), std::back_inserter(out),
    [&](const auto & impl) { return impl->structure_name == structure_name; });
  return out;
}

std::vector<OperationCandidate> StructureRegistry::candidates_named(std::string_view op) const
{
  std::vector<OperationCandidate> out;
  const auto it = candidates_by_name_.find(std::string(op));
  if (it == candidates_by_name_.end()) {
    return out;
  }
  out.reserve(it->second.size());
  for (const size_t idx : it->second) {
    out.push_back(candidates_[idx]);
  }
  return out;
}

std::vector<OperationCandidate> StructureRegistry::signatures_for(
  std::string_view op, size_t arity) const
{
  std::vector<OperationCandidate> out = candidates_named(op);
  out.erase(
    std::remove_if(
      out.begin(), out.end(),
      [arity](const OperationCandidate & c) { return c.signature->arity() != arity; }),
    out.end());
  return out;
}

std::vector<std::string> StructureRegistry::operation_owners(std::string_view op) const
{
  std::vector<std::string> out;
  for (const auto & s : structures_) {
    if (s->declares_operation(op)) {
      out.push_back(s->name);
    }
  }
  return out;
}

ClosureResult StructureRegistry::dependency_closure(std::string_view structure_name) const
{
  ClosureResult result;
  std::vector<std::string> path;
  std::unordered_set<std::string> visited;

  std::function<std::optional<TypeError>(const std::string &)> visit =
    [&](const std::string & name) -> std::optional<TypeError> {
    const auto on_path = std::find(path.begin(), path.end(), name);
    if (on_path != path.end()) {
      std::vector<std::string> cycle(on_path, path.end());
      cycle.push_back(name);
      return TypeError::cyclic_dependency(std::move(cycle));
    }
    if (!visited.insert(name).second) {
      return std::nullopt;
    }

    auto structure = find_structure(name);
    if (!structure) {
      return TypeError::make(
        TypeErrorKind::UnknownStructure, fmt::format("unknown structure '{}'", name));
    }

    path.push_back(name);
    result.structures.push_back(structure);
    for (const auto & dep : dependency_names(*structure)) {
      if (auto err = visit(dep)) {
        return err;
      }
    }
    path.pop_back();
    return std::nullopt;
  };

  if (auto err = visit(std::string(structure_name))) {
    return ClosureResult::fail(std::move(*err));
  }
  return result;
}

std::vector<std::string> StructureRegistry::subject_types(
  const ImplementsDef & impl, std::string_view op) const
{
  std::vector<std::string> out;
  bool unresolved = false;
  std::unordered_set<std::string> visited;

  std::function<void(const std::string &, const std::vector<TypeExpr> &)> visit =
    [&](const std::string & name, const std::vector<TypeExpr> & args) {
      if (!visited.insert(name).second) return;
      const auto structure = find_structure(name);
      if (!structure) return;

      ParamBindings bindings;
      for (size_t i = 0; i < structure->params.size() && i < args.size(); ++i) {
        bindings.emplace(structure->params[i].name, args[i]);
      }

      if (structure->declares_operation(op)) {
        const TypeParam * p = subject_param(*structure, op);
        const auto bound = p != nullptr ? bindings.find(p->name) : bindings.end();
        if (bound != bindings.end()) {
          out.push_back(to_canonical_string(bound->second));
        } else {
          unresolved = true;
        }
      }

      for (const auto * clause : {&structure->extends_clause, &structure->over_clause}) {
        if (!clause->has_value()) continue;
        const TypeExpr & target = **clause;
        if (target.head().empty() || TypeContext::is_builtin_name(target.head())) continue;
        std::vector<TypeExpr> target_args;
        for (const auto & a : target.args) {
          target_args.push_back(substitute_params(a, bindings));
        }
        visit(target.head(), target_args);
      }
    };

  visit(impl.structure_name, impl.type_args);
  if (unresolved && out.empty() && !impl.type_args.empty()) {
    out.push_back(to_canonical_string(impl.type_args.front()));
  }
  return out;
}

std::vector<std::string> StructureRegistry::types_supporting(std::string_view op) const
{
  std::set<std::string> types;

  if (!operation_owners(op).empty()) {
    for (const auto & impl : implementations_) {
      for (auto & t : subject_types(*impl, op)) {
        types.insert(std::move(t));
      }
    }
  }

  for (const auto & top : toplevel_operations_) {
    if (top->name != op) continue;
    const TypeExpr & subject = top->params.empty() ? top->result : top->params.front();
    if (is_concrete_type_expr(subject)) {
      types.insert(to_canonical_string(subject));
    }
  }

  return {types.begin(), types.end()};
}

bool StructureRegistry::type_supports_operation(std::string_view type, std::string_view op) const
{
  const auto types = types_supporting(op);
  const std::string_view wanted = TypeContext::canonical_name(type);
  return std::find(types.begin(), types.end(), wanted) != types.end();
}

}  // namespace kleis
