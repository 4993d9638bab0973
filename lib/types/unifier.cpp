// kleis/types/unifier.cpp - Hindley-Milner unification with natural-number arguments
#include "kleis/types/unifier.hpp"

namespace kleis
{

namespace
{

std::optional<TypeError> bind_var(TypeVarId id, const TypePtr & other, Substitution & s)
{
  if (other->kind == TypeKind::Var && other->var_id == id) {
    return std::nullopt;
  }
  if (other->occurs(id)) {
    return TypeError::occurs_check(id, other);
  }
  s.bind(id, other);
  return std::nullopt;
}

std::optional<TypeError> unify_sequences(
  const std::vector<TypePtr> & as, const std::vector<TypePtr> & bs, Substitution & s)
{
  for (size_t i = 0; i < as.size(); ++i) {
    // Later arguments see the bindings made by earlier ones.
    if (auto err = unify_into(as[i], bs[i], s)) {
      return err;
    }
  }
  return std::nullopt;
}

}  // namespace

bool occurs_in(TypeVarId id, const TypePtr & t, const Substitution & substitution)
{
  return substitution.apply(t)->occurs(id);
}

std::optional<TypeError> unify_into(const TypePtr & a, const TypePtr & b, Substitution & s)
{
  const TypePtr left = s.apply(a);
  const TypePtr right = s.apply(b);

  if (left->kind == TypeKind::Var) {
    return bind_var(left->var_id, right, s);
  }
  if (right->kind == TypeKind::Var) {
    return bind_var(right->var_id, left, s);
  }

  if (left->kind != right->kind) {
    return TypeError::type_mismatch(left, right);
  }

  switch (left->kind) {
    case TypeKind::Data:
      if (left->constructor != right->constructor || left->args.size() != right->args.size()) {
        return TypeError::type_mismatch(left, right);
      }
      return unify_sequences(left->args, right->args, s);

    case TypeKind::NatValue:
      if (left->nat != right->nat) {
        return TypeError::dimension_mismatch(left->nat, right->nat);
      }
      return std::nullopt;

    case TypeKind::Function:
      return unify_sequences(left->args, right->args, s);

    case TypeKind::Product:
      if (left->args.size() != right->args.size()) {
        return TypeError::type_mismatch(left, right);
      }
      return unify_sequences(left->args, right->args, s);

    case TypeKind::String:
      return std::nullopt;

    case TypeKind::Var:
      break;
  }
  return TypeError::type_mismatch(left, right);
}

UnifyResult unify(const TypePtr & a, const TypePtr & b, const Substitution & substitution)
{
  Substitution s = substitution;
  if (auto err = unify_into(a, b, s)) {
    return UnifyResult::fail(std::move(*err));
  }
  return UnifyResult::ok(std::move(s));
}

}  // namespace kleis
