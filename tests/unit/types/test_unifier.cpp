// tests/unit/types/test_unifier.cpp - Unit tests for types, substitutions and unification
//
#include <gtest/gtest.h>

#include <map>

#include "kleis/types/substitution.hpp"
#include "kleis/types/type.hpp"
#include "kleis/types/unifier.hpp"

using namespace kleis;

namespace
{

TypePtr matrix(uint64_t rows, uint64_t cols, TypePtr elem)
{
  return make_data("Matrix", "Matrix", {make_nat(rows), make_nat(cols), std::move(elem)});
}

// Structural equality up to a consistent renaming of variables.
bool alpha_equivalent(
  const TypePtr & a, const TypePtr & b, std::map<TypeVarId, TypeVarId> & a_to_b,
  std::map<TypeVarId, TypeVarId> & b_to_a)
{
  if (a->kind != b->kind) return false;
  if (a->is_var()) {
    const auto ia = a_to_b.emplace(a->var_id, b->var_id).first;
    const auto ib = b_to_a.emplace(b->var_id, a->var_id).first;
    return ia->second == b->var_id && ib->second == a->var_id;
  }
  if (a->is_nat()) return a->nat == b->nat;
  if (a->constructor != b->constructor || a->args.size() != b->args.size()) return false;
  for (size_t i = 0; i < a->args.size(); ++i) {
    if (!alpha_equivalent(a->args[i], b->args[i], a_to_b, b_to_a)) return false;
  }
  return true;
}

bool alpha_equivalent(const TypePtr & a, const TypePtr & b)
{
  std::map<TypeVarId, TypeVarId> ab;
  std::map<TypeVarId, TypeVarId> ba;
  return alpha_equivalent(a, b, ab, ba);
}

}  // namespace

// ============================================================================
// Types
// ============================================================================

TEST(TypesType, BuiltinSpellingsShareOneType)
{
  TypeContext types;
  EXPECT_TRUE(same_type(types.lookup_builtin("ℝ"), types.lookup_builtin("Real")));
  EXPECT_TRUE(same_type(types.lookup_builtin("Scalar"), types.scalar_type()));
  EXPECT_TRUE(same_type(types.lookup_builtin("ℕ"), types.nat_type()));
  EXPECT_EQ(types.lookup_builtin("Matrix"), nullptr);

  EXPECT_EQ(TypeContext::canonical_name("Real"), "ℝ");
  EXPECT_EQ(TypeContext::canonical_name("Complex"), "ℂ");
  EXPECT_EQ(TypeContext::canonical_name("Vector"), "Vector");
}

TEST(TypesType, Rendering)
{
  TypeContext types;
  EXPECT_EQ(to_string(types.scalar_type()), "ℝ");
  EXPECT_EQ(to_string(matrix(2, 3, types.scalar_type())), "Matrix(2, 3, ℝ)");
  EXPECT_EQ(to_string(make_var(4)), "α4");

  const auto fn = make_function(
    make_function(types.scalar_type(), types.scalar_type()), types.scalar_type());
  EXPECT_EQ(to_string(fn), "(ℝ → ℝ) → ℝ");
  EXPECT_EQ(
    to_string(make_product({types.scalar_type(), types.int_type()})), "ℝ × ℤ");
}

TEST(TypesType, StructuralQueries)
{
  TypeContext types;
  const auto t = make_data("Pair", "Pair", {make_var(2), matrix(2, 2, make_var(7))});

  EXPECT_TRUE(t->contains_var());
  EXPECT_TRUE(t->occurs(7));
  EXPECT_FALSE(t->occurs(3));
  EXPECT_EQ(t->max_var_id(), 7);
  EXPECT_EQ(types.scalar_type()->max_var_id(), -1);

  std::set<TypeVarId> vars;
  t->collect_vars(vars);
  EXPECT_EQ(vars, (std::set<TypeVarId>{2, 7}));

  // Pair, Matrix and two dimensions
  EXPECT_EQ(t->concrete_node_count(), 4u);
}

// ============================================================================
// Substitution
// ============================================================================

TEST(TypesSubstitution, ApplyReturnsSamePointerWhenUnbound)
{
  TypeContext types;
  Substitution s;
  s.bind(1, types.scalar_type());

  const auto t = matrix(2, 2, make_var(0));
  EXPECT_EQ(s.apply(t), t);
}

TEST(TypesSubstitution, BindKeepsSubstitutionIdempotent)
{
  TypeContext types;
  Substitution s;
  s.bind(0, make_data("List", "List", {make_var(1)}));
  s.bind(1, types.scalar_type());

  // The earlier binding was rewritten when α1 was bound.
  EXPECT_EQ(to_string(s.lookup(0)), "List(ℝ)");

  const auto t = make_product({make_var(0), make_var(1), make_var(2)});
  const auto once = s.apply(t);
  EXPECT_TRUE(same_type(s.apply(once), once));
  EXPECT_EQ(to_string(once), "List(ℝ) × ℝ × α2");
}

TEST(TypesSubstitution, BindResolvesAgainstExistingBindings)
{
  TypeContext types;
  Substitution s;
  s.bind(1, types.scalar_type());
  s.bind(0, matrix(2, 2, make_var(1)));
  EXPECT_EQ(to_string(s.lookup(0)), "Matrix(2, 2, ℝ)");
}

TEST(TypesSubstitution, RebindingIsIgnored)
{
  TypeContext types;
  Substitution s;
  s.bind(0, types.scalar_type());
  s.bind(0, types.int_type());
  EXPECT_EQ(to_string(s.lookup(0)), "ℝ");
  EXPECT_EQ(s.size(), 1u);
}

TEST(TypesSubstitution, ComposeKeepsOldBindings)
{
  TypeContext types;
  Substitution old;
  old.bind(0, make_var(1));

  Substitution fresh;
  fresh.bind(1, types.scalar_type());
  fresh.bind(0, types.int_type());

  const Substitution s = compose(old, fresh);
  EXPECT_EQ(to_string(s.lookup(0)), "ℝ");
  EXPECT_EQ(to_string(s.lookup(1)), "ℝ");
}

// ============================================================================
// Unification
// ============================================================================

TEST(TypesUnifier, BindsVariableOnEitherSide)
{
  TypeContext types;
  const auto left = unify(make_var(0), types.scalar_type(), {});
  ASSERT_TRUE(left.success());
  EXPECT_EQ(to_string(left.substitution.apply(make_var(0))), "ℝ");

  const auto right = unify(types.scalar_type(), make_var(0), {});
  ASSERT_TRUE(right.success());
  EXPECT_EQ(to_string(right.substitution.apply(make_var(0))), "ℝ");
}

TEST(TypesUnifier, VariableWithItselfIsNoOp)
{
  const auto r = unify(make_var(3), make_var(3), {});
  ASSERT_TRUE(r.success());
  EXPECT_TRUE(r.substitution.empty());
}

TEST(TypesUnifier, ArgumentsSeeEarlierBindings)
{
  TypeContext types;
  const auto a = make_data("Pair", "Pair", {make_var(0), make_var(0)});
  const auto b = make_data("Pair", "Pair", {types.scalar_type(), make_var(1)});

  const auto r = unify(a, b, {});
  ASSERT_TRUE(r.success());
  EXPECT_EQ(to_string(r.substitution.apply(make_var(1))), "ℝ");
}

TEST(TypesUnifier, MismatchedConstructors)
{
  TypeContext types;
  const auto r = unify(types.scalar_type(), types.complex_type(), {});
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, TypeErrorKind::TypeMismatch);
  EXPECT_NE(r.error->message.find("ℝ"), std::string::npos);
  EXPECT_NE(r.error->message.find("ℂ"), std::string::npos);
}

TEST(TypesUnifier, DifferentArgumentCountsMismatch)
{
  TypeContext types;
  const auto a = make_data("Vector", "Vector", {make_nat(3)});
  const auto b = make_data("Vector", "Vector", {make_nat(3), types.scalar_type()});
  const auto r = unify(a, b, {});
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, TypeErrorKind::TypeMismatch);
}

TEST(TypesUnifier, NatValuesMustBeEqual)
{
  TypeContext types;
  ASSERT_TRUE(unify(make_nat(3), make_nat(3), {}).success());

  const auto r = unify(matrix(2, 3, types.scalar_type()), matrix(2, 5, types.scalar_type()), {});
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, TypeErrorKind::DimensionMismatch);
  EXPECT_EQ(r.error->expected, 3u);
  EXPECT_EQ(r.error->found, 5u);
}

TEST(TypesUnifier, NatValueDoesNotUnifyWithType)
{
  TypeContext types;
  const auto r = unify(make_nat(2), types.nat_type(), {});
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, TypeErrorKind::TypeMismatch);
}

TEST(TypesUnifier, VariableBindsToNatValue)
{
  TypeContext types;
  const auto generic =
    make_data("Matrix", "Matrix", {make_var(0), make_var(1), types.scalar_type()});
  const auto r = unify(generic, matrix(2, 4, types.scalar_type()), {});
  ASSERT_TRUE(r.success());
  EXPECT_EQ(to_string(r.substitution.apply(generic)), "Matrix(2, 4, ℝ)");
}

TEST(TypesUnifier, OccursCheck)
{
  const auto r = unify(make_var(0), make_data("List", "List", {make_var(0)}), {});
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, TypeErrorKind::OccursCheckFailure);
}

TEST(TypesUnifier, OccursCheckThroughSubstitution)
{
  Substitution s;
  s.bind(1, make_data("List", "List", {make_var(0)}));
  const auto r = unify(make_var(0), make_var(1), s);
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, TypeErrorKind::OccursCheckFailure);
}

TEST(TypesUnifier, FunctionsAndProducts)
{
  TypeContext types;
  const auto f = make_function(make_var(0), make_var(1));
  const auto g = make_function(types.scalar_type(), types.bool_type());
  const auto r = unify(f, g, {});
  ASSERT_TRUE(r.success());
  EXPECT_EQ(to_string(r.substitution.apply(f)), "ℝ → Bool");

  const auto short_product = make_product({types.scalar_type(), types.scalar_type()});
  const auto long_product =
    make_product({types.scalar_type(), types.scalar_type(), types.scalar_type()});
  EXPECT_FALSE(unify(short_product, long_product, {}).success());

  EXPECT_TRUE(unify(make_string(), make_string(), {}).success());
  EXPECT_FALSE(unify(make_string(), types.scalar_type(), {}).success());
}

TEST(TypesUnifier, ResultIsUnifier)
{
  TypeContext types;
  const auto a = make_data("Pair", "Pair", {make_var(0), matrix(2, 2, make_var(1))});
  const auto b = make_data("Pair", "Pair", {make_var(2), matrix(2, 2, types.scalar_type())});

  const auto r = unify(a, b, {});
  ASSERT_TRUE(r.success());
  EXPECT_TRUE(same_type(r.substitution.apply(a), r.substitution.apply(b)));
}

TEST(TypesUnifier, SymmetricUpToRenaming)
{
  TypeContext types;
  const auto a = make_data("Pair", "Pair", {make_var(0), make_var(1)});
  const auto b = make_data("Pair", "Pair", {make_var(2), make_data("List", "List", {make_var(0)})});

  const auto ab = unify(a, b, {});
  const auto ba = unify(b, a, {});
  ASSERT_TRUE(ab.success());
  ASSERT_TRUE(ba.success());
  EXPECT_TRUE(alpha_equivalent(ab.substitution.apply(a), ba.substitution.apply(a)));
}

TEST(TypesUnifier, FailureLeavesInputSubstitutionUntouched)
{
  TypeContext types;
  Substitution s;
  s.bind(5, types.int_type());

  const auto r = unify(
    make_data("Pair", "Pair", {make_var(0), types.scalar_type()}),
    make_data("Pair", "Pair", {types.int_type(), types.bool_type()}), s);
  ASSERT_FALSE(r.success());
  EXPECT_EQ(s.size(), 1u);
  EXPECT_FALSE(s.contains(0));
}
