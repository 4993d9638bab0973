// kleis/types/substitution.cpp
#include "kleis/types/substitution.hpp"

#include <vector>

namespace kleis
{

namespace
{

// Replace every occurrence of variable `id` in `t` by `replacement`.
TypePtr replace_var(const TypePtr & t, TypeVarId id, const TypePtr & replacement)
{
  if (t->kind == TypeKind::Var) {
    return t->var_id == id ? replacement : t;
  }
  if (t->args.empty() || !t->occurs(id)) {
    return t;
  }
  std::vector<TypePtr> args;
  args.reserve(t->args.size());
  for (const auto & a : t->args) {
    args.push_back(replace_var(a, id, replacement));
  }
  return with_args(*t, std::move(args));
}

}  // namespace

TypePtr Substitution::apply(const TypePtr & t) const
{
  if (!t || bindings_.empty()) {
    return t;
  }

  if (t->kind == TypeKind::Var) {
    const auto it = bindings_.find(t->var_id);
    // Bound types never mention bound variables, so one lookup suffices.
    return it != bindings_.end() ? it->second : t;
  }

  if (t->args.empty()) {
    return t;
  }

  std::vector<TypePtr> args;
  args.reserve(t->args.size());
  bool changed = false;
  for (const auto & a : t->args) {
    TypePtr applied = apply(a);
    changed = changed || applied != a;
    args.push_back(std::move(applied));
  }
  return changed ? with_args(*t, std::move(args)) : t;
}

TypePtr Substitution::lookup(TypeVarId id) const
{
  const auto it = bindings_.find(id);
  return it != bindings_.end() ? it->second : nullptr;
}

void Substitution::bind(TypeVarId id, const TypePtr & type)
{
  if (contains(id)) {
    return;
  }

  const TypePtr resolved = apply(type);
  if (resolved->kind == TypeKind::Var && resolved->var_id == id) {
    return;
  }

  for (auto & entry : bindings_) {
    entry.second = replace_var(entry.second, id, resolved);
  }
  bindings_.emplace(id, resolved);
}

bool Substitution::operator==(const Substitution & other) const
{
  if (bindings_.size() != other.bindings_.size()) {
    return false;
  }
  auto it = other.bindings_.begin();
  for (const auto & [id, type] : bindings_) {
    if (it->first != id || !same_type(it->second, type)) {
      return false;
    }
    ++it;
  }
  return true;
}

Substitution compose(const Substitution & old, const Substitution & new_bindings)
{
  Substitution result = old;
  for (const auto & [id, type] : new_bindings.bindings()) {
    result.bind(id, type);
  }
  return result;
}

}  // namespace kleis
