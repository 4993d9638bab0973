// tests/unit/structure/test_structure_registry.cpp - Unit tests for the structure registry
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "kleis/structure/structure_registry.hpp"
#include "kleis/test_support/checker_helpers.hpp"

using namespace kleis;

namespace
{

// Parse `src` and register every declaration; returns the first failure.
std::optional<TypeError> register_all(StructureRegistry & registry, const std::string & src)
{
  auto unit = test_support::parse(src);
  EXPECT_FALSE(unit.diags.has_errors()) << "test source does not parse";

  for (auto & decl : unit.program.declarations) {
    RegisterResult r;
    if (auto * s = std::get_if<StructureDef>(&decl)) {
      r = registry.register_structure(std::move(*s));
    } else if (auto * impl = std::get_if<ImplementsDef>(&decl)) {
      r = registry.register_implements(std::move(*impl));
    } else if (auto * data = std::get_if<DataDef>(&decl)) {
      r = registry.register_data(std::move(*data));
    } else {
      r = registry.register_operation(std::move(std::get<OperationSignature>(decl)));
    }
    if (!r.success()) {
      return r.error;
    }
  }
  return std::nullopt;
}

std::vector<std::string> describe_all(const std::vector<OperationCandidate> & candidates)
{
  std::vector<std::string> out;
  for (const auto & c : candidates) {
    out.push_back(c.describe());
  }
  return out;
}

constexpr const char * k_numeric_src = R"(
structure Arithmetic(T) {
  operation plus : T → T → T
  operation negate : T → T
}
structure Numeric(N) extends Arithmetic(N) {
  operation abs : N → N
}
implements Numeric(ℝ)
implements Arithmetic(Real)
operation sqrt : ℝ → ℝ
)";

}  // namespace

// ============================================================================
// Registration
// ============================================================================

TEST(StructureRegistry, RegistersStructuresInOrder)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, k_numeric_src));

  EXPECT_EQ(registry.structure_names(), (std::vector<std::string>{"Arithmetic", "Numeric"}));
  EXPECT_EQ(registry.structure_count(), 2u);
  EXPECT_EQ(registry.implementation_count(), 2u);
  EXPECT_TRUE(registry.has_structure("Numeric"));
  EXPECT_FALSE(registry.has_structure("Ring"));
}

TEST(StructureRegistry, CandidatesFollowRegistrationOrder)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, k_numeric_src));

  // The structure's own generic signature, then the implementation of it.
  EXPECT_EQ(
    describe_all(registry.signatures_for("plus", 2)),
    (std::vector<std::string>{"Arithmetic(T)", "Arithmetic(ℝ)"}));
  EXPECT_EQ(
    describe_all(registry.signatures_for("abs", 1)),
    (std::vector<std::string>{"Numeric(N)", "Numeric(ℝ)"}));
  EXPECT_EQ(
    describe_all(registry.signatures_for("sqrt", 1)),
    (std::vector<std::string>{"operation sqrt"}));

  EXPECT_TRUE(registry.signatures_for("plus", 1).empty());
  EXPECT_TRUE(registry.signatures_for("nonexistent_op", 0).empty());
}

TEST(StructureRegistry, DuplicateStructureIsRejected)
{
  StructureRegistry registry;
  const auto err = register_all(registry, R"(
structure Ring(R) { operation add : R → R → R }
structure Ring(S) { operation mul : S → S → S }
)");
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind, TypeErrorKind::DuplicateName);
  EXPECT_NE(err->message.find("Ring"), std::string::npos);
  // The first definition stays.
  ASSERT_EQ(registry.structure_count(), 1u);
  EXPECT_TRUE(registry.find_structure("Ring")->declares_operation("add"));
}

TEST(StructureRegistry, DuplicateImplementationIsRejected)
{
  StructureRegistry registry;
  const auto err = register_all(registry, R"(
structure Numeric(N) { operation abs : N → N }
implements Numeric(ℝ)
implements Numeric(Scalar)
)");
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind, TypeErrorKind::DuplicateName);
}

TEST(StructureRegistry, ImplementationOfUnknownStructure)
{
  StructureRegistry registry;
  const auto err = register_all(registry, "implements Monoid(ℝ)\n");
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind, TypeErrorKind::UnknownStructure);
}

TEST(StructureRegistry, ImplementationArgumentCount)
{
  StructureRegistry registry;
  const auto err = register_all(registry, R"(
structure VectorSpace(V, F) { operation scale : F → V → V }
implements VectorSpace(ℝ)
)");
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind, TypeErrorKind::ArityMismatch);
}

TEST(StructureRegistry, DuplicateTopLevelOperationNeedsSameArity)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, R"(
operation norm : ℝ → ℝ
operation norm : ℝ → ℝ → ℝ
)"));

  const auto err = register_all(registry, "operation norm : ℂ → ℝ\n");
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind, TypeErrorKind::DuplicateName);
}

TEST(StructureRegistry, DimensionUsedAsTypeIsInvalid)
{
  StructureRegistry registry;
  const auto err = register_all(registry, R"(
structure Sized(n: Nat, T) {
  operation size : Matrix(n, n, T) → n
}
)");
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind, TypeErrorKind::InvalidSignature);
  EXPECT_NE(err->message.find("'n'"), std::string::npos);
  EXPECT_EQ(registry.structure_count(), 0u);
}

TEST(StructureRegistry, NumeralOutsideConstructorIsInvalid)
{
  StructureRegistry registry;
  const auto err = register_all(registry, "operation three : ℝ → 3\n");
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind, TypeErrorKind::InvalidSignature);
}

TEST(StructureRegistry, RepeatedParameterIsInvalid)
{
  StructureRegistry registry;
  const auto err = register_all(registry, "structure Pair(T, T) { operation first : T → T }\n");
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind, TypeErrorKind::InvalidSignature);
}

TEST(StructureRegistry, ConstructorArityMustBeConsistent)
{
  StructureRegistry registry;
  const auto err = register_all(registry, R"(
structure Box(T) { operation unbox : Box(T) → T }
operation make : Box(ℝ, ℝ, ℝ) → Box(ℝ)
)");
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind, TypeErrorKind::ArityMismatch);
  EXPECT_EQ(err->message, "type 'Box' takes 1 argument(s), found 3 (in the signature of 'make')");
  EXPECT_EQ(registry.candidate_count(), 1u);
}

TEST(StructureRegistry, UndeclaredConstructorKeepsItsFirstArity)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, "operation first : Pair(ℝ, ℤ) → ℝ\n"));
  const auto err = register_all(registry, "operation second : Pair(ℝ) → ℝ\n");
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind, TypeErrorKind::ArityMismatch);
  EXPECT_EQ(
    err->message,
    "type 'Pair' is applied to 1 argument(s) (in the signature of 'second'), but to 2 elsewhere");
}

TEST(StructureRegistry, DimensionSlotsFollowParameterKinds)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, R"(
structure Matrix(m: Nat, n: Nat, T) {
  operation transpose : Matrix(m, n, T) → Matrix(n, m, T)
}
)"));

  const auto type_for_dimension = register_all(registry, "operation bad : Matrix(ℝ, 2, ℝ) → ℝ\n");
  ASSERT_TRUE(type_for_dimension);
  EXPECT_EQ(type_for_dimension->kind, TypeErrorKind::InvalidSignature);
  EXPECT_EQ(
    type_for_dimension->message,
    "'ℝ' is not a dimension, but parameter 'm' of 'Matrix' is Nat (in the signature of 'bad')");

  const auto dimension_for_type = register_all(registry, "operation worse : Matrix(2, 2, 3) → ℝ\n");
  ASSERT_TRUE(dimension_for_type);
  EXPECT_EQ(dimension_for_type->kind, TypeErrorKind::InvalidSignature);

  EXPECT_FALSE(register_all(registry, "operation trace : Matrix(n, n, ℝ) → ℝ\n"));
}

TEST(StructureRegistry, ImplementationArgumentKinds)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, "structure Metric(dim: Nat) { operation g : ℝ → ℝ }\n"));
  const auto err = register_all(registry, "implements Metric(ℝ)\n");
  ASSERT_TRUE(err);
  EXPECT_EQ(err->kind, TypeErrorKind::InvalidSignature);
  EXPECT_EQ(registry.implementation_count(), 0u);
  EXPECT_FALSE(register_all(registry, "implements Metric(4)\n"));
}

// ============================================================================
// Data types
// ============================================================================

TEST(StructureRegistry, DataTypeRegistersConstructors)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, R"(
data Option(T) = None | Some(T)
data List2(T) = Nil2 | Cons2(T, List2(T))
)"));

  EXPECT_TRUE(registry.has_data_type("Option"));
  EXPECT_EQ(registry.data_type_count(), 2u);
  ASSERT_NE(registry.constructor_params("Option"), nullptr);
  EXPECT_EQ(registry.constructor_params("Option")->size(), 1u);

  const auto some = registry.signatures_for("Some", 1);
  ASSERT_EQ(some.size(), 1u);
  EXPECT_TRUE(some[0].is_toplevel());
  EXPECT_EQ(some[0].describe(), "data Option");
  EXPECT_EQ(to_string(some[0].signature->type), "T → Option(T)");
  EXPECT_EQ(registry.signatures_for("None", 0).size(), 1u);
  EXPECT_EQ(registry.signatures_for("Cons2", 2).size(), 1u);
}

TEST(StructureRegistry, DataTypeNameConflicts)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, R"(
structure Ring(R) { operation add : R → R → R }
data Option(T) = None | Some(T)
)"));

  const auto builtin = register_all(registry, "data ℝ = Zero\n");
  ASSERT_TRUE(builtin);
  EXPECT_EQ(builtin->kind, TypeErrorKind::DuplicateName);

  const auto structure = register_all(registry, "data Ring = Trivial\n");
  ASSERT_TRUE(structure);
  EXPECT_EQ(structure->message, "'Ring' is already declared as a structure");

  const auto variant = register_all(registry, "data Maybe(T) = Nothing | Some(T)\n");
  ASSERT_TRUE(variant);
  EXPECT_EQ(variant->kind, TypeErrorKind::DuplicateName);
  EXPECT_EQ(variant->message, "variant 'Some' is already declared by data type 'Option'");

  const auto shadowed = register_all(registry, "structure Option(T) { }\n");
  ASSERT_TRUE(shadowed);
  EXPECT_EQ(shadowed->message, "'Option' is already declared as a data type");

  EXPECT_EQ(registry.data_type_count(), 1u);
}

TEST(StructureRegistry, DataTypeUsesAreChecked)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, "data Option(T) = None | Some(T)\n"));

  const auto bare = register_all(registry, "operation get : Option → ℝ\n");
  ASSERT_TRUE(bare);
  EXPECT_EQ(bare->kind, TypeErrorKind::ArityMismatch);

  const auto recursive = register_all(registry, "data Tree(T) = Leaf | Node(Tree(T, T))\n");
  ASSERT_TRUE(recursive);
  EXPECT_EQ(recursive->kind, TypeErrorKind::ArityMismatch);
  EXPECT_FALSE(registry.has_data_type("Tree"));

  const auto arity = register_all(registry, "operation b : Boxed(ℝ) → ℝ\ndata Boxed = Boxed0\n");
  ASSERT_TRUE(arity);
  EXPECT_EQ(arity->message, "data type 'Boxed' declares 0 parameter(s), but is applied to 1 elsewhere");
}

// ============================================================================
// Dependencies
// ============================================================================

TEST(StructureRegistry, DependencyClosure)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, R"(
structure Monoid(M) { operation op : M → M → M }
structure Group(G) extends Monoid(G) { operation inv : G → G }
structure Field(F) { operation reciprocal : F → F }
structure VectorSpace(V, F) extends Group(V) over Field(F) { operation scale : F → V → V }
)"));
  ASSERT_TRUE(registry.validate().success());

  const auto closure = registry.dependency_closure("VectorSpace");
  ASSERT_TRUE(closure.success());
  std::vector<std::string> names;
  for (const auto & s : closure.structures) names.push_back(s->name);
  EXPECT_EQ(names, (std::vector<std::string>{"VectorSpace", "Group", "Monoid", "Field"}));
}

TEST(StructureRegistry, OverBuiltinIsNotADependency)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, "structure RealSpace(V) over ℝ { operation len : V → ℝ }\n"));
  EXPECT_TRUE(registry.validate().success());
}

TEST(StructureRegistry, CycleIsReportedWithPath)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, R"(
structure A(T) extends B(T) { operation a : T → T }
structure B(T) extends C(T) { operation b : T → T }
structure C(T) extends A(T) { operation c : T → T }
)"));

  const auto r = registry.validate();
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, TypeErrorKind::CyclicDependency);
  EXPECT_EQ(r.error->path, (std::vector<std::string>{"A", "B", "C", "A"}));
}

TEST(StructureRegistry, UnknownDependency)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, "structure Lattice(L) extends Poset(L) { }\n"));

  const auto r = registry.validate();
  ASSERT_FALSE(r.success());
  EXPECT_EQ(r.error->kind, TypeErrorKind::UnknownStructure);
  EXPECT_EQ(r.error->path, (std::vector<std::string>{"Lattice", "Poset"}));
}

// ============================================================================
// Queries
// ============================================================================

TEST(StructureRegistry, TypesSupportingFollowsExtends)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, k_numeric_src));

  EXPECT_EQ(registry.types_supporting("abs"), (std::vector<std::string>{"ℝ"}));
  // Numeric(ℝ) provides plus through Arithmetic; both implementations name ℝ.
  EXPECT_EQ(registry.types_supporting("plus"), (std::vector<std::string>{"ℝ"}));
  EXPECT_EQ(registry.types_supporting("sqrt"), (std::vector<std::string>{"ℝ"}));
  EXPECT_TRUE(registry.types_supporting("nonexistent_op").empty());

  EXPECT_TRUE(registry.type_supports_operation("Real", "abs"));
  EXPECT_FALSE(registry.type_supports_operation("ℂ", "abs"));
}

TEST(StructureRegistry, NestedStructureOperations)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, R"(
structure Ring(R) {
  structure additive : AbelianGroup(R) {
    operation (+) : R → R → R
  }
  operation (*) : R → R → R
}
implements Ring(ℤ)
)"));

  const auto ring = registry.find_structure("Ring");
  ASSERT_TRUE(ring);
  EXPECT_TRUE(ring->declares_operation("+"));
  EXPECT_EQ(registry.operation_owners("+"), (std::vector<std::string>{"Ring"}));
  EXPECT_EQ(registry.types_supporting("+"), (std::vector<std::string>{"ℤ"}));
  EXPECT_EQ(registry.signatures_for("+", 2).size(), 2u);
}

TEST(StructureRegistry, TypesSupportingUsesSubjectParameter)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, R"(
structure Field(F) {
  operation reciprocal : F → F
}
structure VectorSpace(V, F) over Field(F) {
  operation vadd : V → V → V
  operation scale : F → V → V
}
implements Field(ℂ)
implements VectorSpace(Vec3, ℝ)
)"));

  EXPECT_EQ(registry.types_supporting("vadd"), (std::vector<std::string>{"Vec3"}));
  EXPECT_EQ(registry.types_supporting("scale"), (std::vector<std::string>{"ℝ"}));
  // VectorSpace(Vec3, ℝ) reaches Field through `over Field(F)` with F = ℝ.
  EXPECT_EQ(registry.types_supporting("reciprocal"), (std::vector<std::string>{"ℂ", "ℝ"}));
  EXPECT_FALSE(registry.type_supports_operation("Vec3", "reciprocal"));
}

TEST(StructureRegistry, TypesSupportingWithoutTypeParameter)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, R"(
structure Metric(dim: Nat) {
  operation signature_of : ℝ → ℝ
}
implements Metric(4)
)"));
  EXPECT_EQ(registry.types_supporting("signature_of"), (std::vector<std::string>{"4"}));
}

TEST(StructureRegistry, CopyIsIndependentSnapshot)
{
  StructureRegistry registry;
  ASSERT_FALSE(register_all(registry, k_numeric_src));

  StructureRegistry next = registry;
  ASSERT_FALSE(register_all(next, "structure Ordered(T) { operation less : T → T → Bool }\n"));

  EXPECT_EQ(next.structure_count(), 3u);
  EXPECT_EQ(registry.structure_count(), 2u);
  EXPECT_TRUE(registry.signatures_for("less", 2).empty());

  // Candidates handed out by the original stay valid after it is replaced.
  const auto plus = registry.signatures_for("plus", 2);
  registry = std::move(next);
  EXPECT_EQ(plus.front().signature->name, "plus");
  EXPECT_EQ(plus.front().owner->name, "Arithmetic");
}
