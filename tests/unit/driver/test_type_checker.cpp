// tests/unit/driver/test_type_checker.cpp - TypeChecker facade: loading, binding, checking
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "kleis/driver/stdlib_finder.hpp"
#include "kleis/driver/type_checker.hpp"
#include "kleis/test_support/checker_helpers.hpp"

using namespace kleis;
using test_support::matrix;
using test_support::num;
using test_support::obj;
using test_support::op;
using test_support::ph;

namespace
{

std::string type_text(const TypeCheckResult & r)
{
  EXPECT_TRUE(r.is_success()) << to_string(r);
  return r.is_success() ? to_string(r.as_success().type) : std::string();
}

constexpr const char * k_base = R"(
structure Arithmetic(T) {
  operation plus : T → T → T
}
implements Arithmetic(ℝ)
)";

}  // namespace

// ============================================================================
// Standard library scenarios
// ============================================================================

TEST(DriverTypeChecker, StandardLibraryLoads)
{
  auto checker = test_support::stdlib_checker();
  ASSERT_TRUE(checker);
  EXPECT_TRUE(checker->registry().has_structure("Arithmetic"));
  EXPECT_TRUE(checker->registry().has_structure("MatrixMultipliable"));
  EXPECT_TRUE(checker->registry().has_structure("GeneralRelativity"));
  EXPECT_EQ(stdlib_files().front(), "prelude.kleis");
}

TEST(DriverTypeChecker, ScalarAddition)
{
  auto checker = test_support::stdlib_checker();
  EXPECT_EQ(type_text(checker->check(op("plus", {num("1"), num("2")}))), "ℝ");
  EXPECT_EQ(type_text(checker->check(op("sqrt", {obj("x")}))), "ℝ");
}

TEST(DriverTypeChecker, TensorOperationWithPlaceholders)
{
  auto checker = test_support::stdlib_checker();
  const auto einstein = op("einstein", {ph(0), ph(1), ph(2)});
  EXPECT_EQ(type_text(checker->check(einstein)), "Tensor(0, 2, 4, ℝ)");
  EXPECT_EQ(type_text(checker->check(op("plus", {einstein, ph(3)}))), "Tensor(0, 2, 4, ℝ)");
}

TEST(DriverTypeChecker, MatrixDimensions)
{
  auto checker = test_support::stdlib_checker();

  const auto add = checker->check(op("matrix_add", {matrix(2, 3), matrix(4, 5)}));
  ASSERT_TRUE(add.is_error());
  EXPECT_EQ(add.as_error().kind, TypeErrorKind::DimensionMismatch);

  EXPECT_EQ(
    type_text(checker->check(op("multiply", {matrix(2, 3), matrix(3, 4)}))), "Matrix(2, 4, ℝ)");

  const auto mul = checker->check(op("multiply", {matrix(2, 3), matrix(5, 6)}));
  ASSERT_TRUE(mul.is_error());
  EXPECT_EQ(mul.as_error().kind, TypeErrorKind::DimensionMismatch);
}

TEST(DriverTypeChecker, SupportQueries)
{
  auto checker = test_support::stdlib_checker();
  EXPECT_EQ(checker->types_supporting("abs"), (std::vector<std::string>{"ℝ", "ℤ"}));
  EXPECT_TRUE(checker->types_supporting("nonexistent").empty());

  EXPECT_TRUE(checker->type_supports_operation("ℝ", "abs"));
  EXPECT_TRUE(checker->type_supports_operation("Real", "abs"));
  EXPECT_FALSE(checker->type_supports_operation("ℂ", "abs"));

  EXPECT_EQ(checker->suggest_operation("abs"), "Operation 'abs' is available for types: ℝ, ℤ");
  EXPECT_EQ(checker->types_supporting("reciprocal"), (std::vector<std::string>{"ℂ", "ℝ"}));
  EXPECT_EQ(checker->types_supporting("vadd"), (std::vector<std::string>{"ℝ"}));
  EXPECT_FALSE(checker->suggest_operation("nonexistent").has_value());
}

TEST(DriverTypeChecker, PolymorphicResult)
{
  auto checker = test_support::stdlib_checker();
  const auto r = checker->check(op("abs", {obj("x")}));
  ASSERT_TRUE(r.is_polymorphic());
  EXPECT_EQ(r.as_polymorphic().available_types, (std::vector<std::string>{"ℝ", "ℤ"}));
}

TEST(DriverTypeChecker, MissingStandardLibraryDirectory)
{
  const test_support::TempDir dir("kleis_test_empty_stdlib");
  const auto loaded = TypeChecker::with_standard_library({}, dir.path);
  EXPECT_FALSE(loaded.success);
  ASSERT_TRUE(loaded.checker);
  ASSERT_TRUE(loaded.diagnostics.has_errors());
  EXPECT_EQ(loaded.diagnostics.first_error()->code, std::string(diag_code::k_unreadable_file));
}

// ============================================================================
// Loading
// ============================================================================

TEST(DriverTypeChecker, LoadCountsDeclarations)
{
  TypeChecker checker;
  const auto r = checker.load_source(R"(
structure Arithmetic(T) {
  operation plus : T → T → T
  operation negate : T → T
}
implements Arithmetic(ℝ)
operation sqrt : ℝ → ℝ
)");
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.structures, 1u);
  EXPECT_EQ(r.implementations, 1u);
  EXPECT_EQ(r.candidates, 5u);
}

TEST(DriverTypeChecker, LaterLoadsSeeEarlierStructures)
{
  auto checker = test_support::checker_with(k_base);
  const auto r = checker->load_source("implements Arithmetic(ℤ)\n");
  ASSERT_TRUE(r.success);
  EXPECT_EQ(checker->types_supporting("plus"), (std::vector<std::string>{"ℝ", "ℤ"}));
}

TEST(DriverTypeChecker, FailedLoadLeavesRegistryUnchanged)
{
  auto checker = test_support::checker_with(k_base);
  const size_t structures = checker->registry().structure_count();
  const size_t candidates = checker->registry().candidate_count();

  const auto r = checker->load_source(R"(
structure Fresh(T) { operation fresh : T → T }
implements Missing(ℝ)
)");
  EXPECT_FALSE(r.success);
  ASSERT_TRUE(r.diagnostics.has_errors());
  EXPECT_EQ(r.diagnostics.first_error()->code, std::string(diag_code::k_unknown_structure));

  EXPECT_FALSE(checker->registry().has_structure("Fresh"));
  EXPECT_EQ(checker->registry().structure_count(), structures);
  EXPECT_EQ(checker->registry().candidate_count(), candidates);

  const auto unknown = checker->check(op("fresh", {num("1")}));
  ASSERT_TRUE(unknown.is_error());
  EXPECT_EQ(unknown.as_error().kind, TypeErrorKind::UnboundOperation);
}

TEST(DriverTypeChecker, SyntaxErrorRegistersNothing)
{
  TypeChecker checker;
  const auto r = checker.load_source("structure Good(T) { operation g : T → T }\nstructure (\n");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.diagnostics.first_error()->code, std::string(diag_code::k_syntax));
  EXPECT_EQ(checker.registry().structure_count(), 0u);
}

TEST(DriverTypeChecker, UnreadableFile)
{
  TypeChecker checker;
  const auto r = checker.load_file("/nonexistent/kleis/missing.kleis");
  EXPECT_FALSE(r.success);
  ASSERT_TRUE(r.diagnostics.has_errors());
  const auto * err = r.diagnostics.first_error();
  EXPECT_EQ(err->code, std::string(diag_code::k_unreadable_file));
  EXPECT_NE(err->message.find("missing.kleis"), std::string::npos);
}

TEST(DriverTypeChecker, LoadFilesInOrder)
{
  const test_support::TempDir dir("kleis_test_load_files");
  const auto base = dir.write("base.kleis", k_base);
  const auto more = dir.write("more.kleis", "implements Arithmetic(ℂ)\n");

  TypeChecker checker;
  const auto r = checker.load_files({base, more});
  ASSERT_TRUE(r.success);
  EXPECT_EQ(checker.types_supporting("plus"), (std::vector<std::string>{"ℂ", "ℝ"}));
  EXPECT_EQ(checker.sources().size(), 2u);
}

TEST(DriverTypeChecker, WhereClauseNamesKnownStructures)
{
  auto checker = test_support::checker_with(k_base);

  const auto unknown = checker->load_source("implements Arithmetic(ℚ) where NoSuchStructure(ℚ)\n");
  EXPECT_FALSE(unknown.success);
  ASSERT_TRUE(unknown.diagnostics.has_errors());
  EXPECT_EQ(unknown.diagnostics.first_error()->code, std::string(diag_code::k_unknown_structure));
  EXPECT_EQ(
    unknown.diagnostics.first_error()->message,
    "where clause of 'Arithmetic(ℚ)' names unknown structure 'NoSuchStructure'");
  EXPECT_FALSE(checker->type_supports_operation("ℚ", "plus"));

  const auto known = checker->load_source("implements Arithmetic(ℚ) where Arithmetic(ℚ)\n");
  EXPECT_TRUE(known.success);
  EXPECT_TRUE(checker->type_supports_operation("ℚ", "plus"));
}

TEST(DriverTypeChecker, DuplicateStructurePointsAtFirstDeclaration)
{
  TypeChecker checker;
  ASSERT_TRUE(checker.load_source("structure Ring(R) { operation add : R → R → R }\n").success);

  const auto r = checker.load_source("\nstructure Ring(S) { operation mul : S → S → S }\n");
  EXPECT_FALSE(r.success);
  const auto * err = r.diagnostics.first_error();
  ASSERT_NE(err, nullptr);
  EXPECT_EQ(err->code, std::string(diag_code::k_duplicate_name));
  ASSERT_EQ(err->labels.size(), 2u);

  const Label & primary = err->labels[0];
  const Label & earlier = err->labels[1];
  EXPECT_EQ(primary.style, LabelStyle::Primary);
  EXPECT_EQ(earlier.style, LabelStyle::Secondary);
  EXPECT_EQ(earlier.message, "first declared here");
  EXPECT_NE(earlier.range.file_id(), primary.range.file_id());

  // Both "<input>" texts stay readable.
  EXPECT_EQ(checker.sources().get_slice(primary.range), "Ring");
  EXPECT_EQ(checker.sources().get_slice(earlier.range), "Ring");
  EXPECT_EQ(checker.sources().get_full_range(primary.range).start_line, 2u);
  EXPECT_EQ(checker.sources().get_full_range(earlier.range).start_line, 1u);
}

TEST(DriverTypeChecker, DataConstructorsInfer)
{
  TypeChecker checker;
  const auto r = checker.load_source(R"(
data Option(T) = None | Some(value : T)
operation unwrap : Option(T) → T
)");
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.data_types, 1u);
  EXPECT_EQ(r.candidates, 3u);

  EXPECT_EQ(type_text(checker.check(op("Some", {num("1")}))), "Option(ℝ)");
  EXPECT_EQ(type_text(checker.check(op("unwrap", {op("Some", {num("1")})}))), "ℝ");

  const auto none = checker.check(op("None"));
  ASSERT_TRUE(none.is_polymorphic());
  EXPECT_EQ(to_string(none.as_polymorphic().type_var).rfind("Option(α", 0), 0u);

  const auto wrong = checker.check(op("Some", {num("1"), num("2")}));
  ASSERT_TRUE(wrong.is_error());
  EXPECT_EQ(wrong.as_error().kind, TypeErrorKind::UnboundOperation);
}

TEST(DriverTypeChecker, UnknownImplementationMemberWarns)
{
  TypeChecker checker;
  const auto r = checker.load_source(R"(
structure S(T) { operation f : T → T }
implements S(ℝ) {
  operation g = builtin_g
}
)");
  EXPECT_TRUE(r.success);
  const auto warnings = r.diagnostics.warnings();
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_EQ(warnings[0].message, "structure 'S' has no operation 'g'");
  EXPECT_EQ(warnings[0].code, std::string(diag_code::k_invalid_signature));
}

TEST(DriverTypeChecker, CycleReportedAtStructureName)
{
  TypeChecker checker;
  const auto r = checker.load_source(R"(
structure A(T) extends B(T) { }
structure B(T) extends A(T) { }
)");
  EXPECT_FALSE(r.success);
  const auto * err = r.diagnostics.first_error();
  ASSERT_NE(err, nullptr);
  EXPECT_EQ(err->code, std::string(diag_code::k_cyclic_dependency));
  EXPECT_EQ(checker.sources().get_slice(err->primary_range()), "A");
}

// ============================================================================
// Bindings and inference
// ============================================================================

TEST(DriverTypeChecker, BoundIdentifiers)
{
  auto checker = test_support::stdlib_checker();
  checker->bind("x", TypeExpr::named("ℤ"));
  checker->bind(
    "A", TypeExpr::parametric(
           "Matrix", {TypeExpr::number_literal(2), TypeExpr::number_literal(3), TypeExpr::named("ℝ")}));

  EXPECT_EQ(type_text(checker->check(obj("x"))), "ℤ");
  EXPECT_EQ(type_text(checker->check(op("plus", {obj("x"), obj("x")}))), "ℤ");
  EXPECT_EQ(type_text(checker->check(op("matrix_add", {obj("A"), obj("A")}))), "Matrix(2, 3, ℝ)");
  EXPECT_EQ(checker->bindings().size(), 2u);
}

TEST(DriverTypeChecker, BindingsShareTypeVariables)
{
  auto checker = test_support::checker_with(k_base);
  const TypePtr list = checker->bind("xs", TypeExpr::parametric("List", {TypeExpr::named("a")}));
  const TypePtr head = checker->bind("h", TypeExpr::named("a"));
  EXPECT_EQ(to_string(list), "List(α0)");
  EXPECT_TRUE(same_type(head, make_var(0)));

  // The shared variable stays open; a fresh one for `y` must not collide with it.
  const auto r = checker->check(op("plus", {obj("h"), obj("y")}));
  ASSERT_TRUE(r.is_polymorphic());
  EXPECT_EQ(r.as_polymorphic().available_types, (std::vector<std::string>{"ℝ"}));
}

TEST(DriverTypeChecker, InferWithEnvironmentOverride)
{
  auto checker = test_support::checker_with(k_base);
  checker->bind("x", TypeExpr::named("ℝ"));

  const TypeContext types;
  const auto complex = checker->infer(op("plus", {obj("x"), obj("x")}), {{"x", types.complex_type()}});
  ASSERT_TRUE(complex.success()) << complex.error;
  EXPECT_EQ(to_string(complex.type), "ℂ");

  const auto bound = checker->infer(op("plus", {obj("x"), num("1")}));
  ASSERT_TRUE(bound.success()) << bound.error;
  EXPECT_EQ(to_string(bound.type), "ℝ");

  const auto failed = checker->infer(op("plus", {obj("x"), matrix(2, 2)}));
  ASSERT_FALSE(failed.success());
  EXPECT_EQ(failed.error.rfind("no implementation of 'plus' accepts", 0), 0u);
}

TEST(DriverTypeChecker, ChecksDoNotMutateChecker)
{
  auto checker = test_support::checker_with(k_base);
  EXPECT_TRUE(checker->check(op("plus", {obj("x"), obj("x")})).is_polymorphic());
  EXPECT_TRUE(checker->bindings().empty());
  EXPECT_EQ(type_text(checker->check(op("plus", {obj("x"), num("1")}))), "ℝ");
}

// ============================================================================
// Dispatch policy and projects
// ============================================================================

TEST(DriverTypeChecker, OptionsReachDispatch)
{
  constexpr const char * src = R"(
structure Shape(T) { operation area : T → ℝ }
structure SquareShape(n: Nat) { operation area : Matrix(n, n, ℝ) → ℤ }
)";
  EXPECT_EQ(type_text(test_support::checker_with(src)->check(op("area", {matrix(3, 3)}))), "ℝ");

  CheckerOptions options;
  options.dispatch = DispatchPolicy::MostSpecific;
  EXPECT_EQ(
    type_text(test_support::checker_with(src, options)->check(op("area", {matrix(3, 3)}))), "ℤ");
}

TEST(DriverTypeChecker, FromProjectWithoutStandardLibrary)
{
  const test_support::TempDir dir("kleis_test_from_project");
  ProjectConfig config;
  config.project_root = dir.path;
  config.checker.stdlib = false;
  config.checker.dispatch = DispatchPolicy::MostSpecific;
  config.checker.load = {dir.write("defs/base.kleis", k_base)};

  const auto loaded = TypeChecker::from_project(config);
  ASSERT_TRUE(loaded.success);
  EXPECT_EQ(loaded.checker->options().dispatch, DispatchPolicy::MostSpecific);
  EXPECT_TRUE(loaded.checker->registry().has_structure("Arithmetic"));
  EXPECT_FALSE(loaded.checker->registry().has_structure("Numeric"));
}

TEST(DriverTypeChecker, FromProjectReportsBadFile)
{
  const test_support::TempDir dir("kleis_test_from_project_bad");
  ProjectConfig config;
  config.checker.stdlib = false;
  config.checker.load = {dir.write("bad.kleis", "implements Nowhere(ℝ)\n")};

  const auto loaded = TypeChecker::from_project(config);
  EXPECT_FALSE(loaded.success);
  ASSERT_TRUE(loaded.checker);
  EXPECT_TRUE(loaded.diagnostics.has_errors());
  EXPECT_EQ(loaded.checker->registry().structure_count(), 0u);
}
