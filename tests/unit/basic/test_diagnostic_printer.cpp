// tests/unit/basic/test_diagnostic_printer.cpp - Golden output of the diagnostic printer
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "kleis/basic/diagnostic.hpp"
#include "kleis/basic/diagnostic_printer.hpp"
#include "kleis/basic/source_manager.hpp"

using namespace kleis;

TEST(BasicDiagnosticPrinter, DuplicateWithEarlierDeclaration)
{
  SourceRegistry sources;
  const FileId file =
    sources.register_file("ring.kleis", "structure Ring(R) { }\nstructure Ring(S) { }\n");

  DiagnosticBag diags;
  diags
    .report_error(
      SourceRange(file, 32, 36), "structure 'Ring' is already registered", "duplicate declaration")
    .with_code(diag_code::k_duplicate_name)
    .with_secondary_label(SourceRange(file, 10, 14), "first declared here")
    .with_help("rename one of the declarations");
  ASSERT_EQ(diags.size(), 1u);

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print(diags.all().front(), sources);

  EXPECT_EQ(
    out.str(),
    "error[E0101]: structure 'Ring' is already registered\n"
    "  --> ring.kleis:2:11\n"
    "      |\n"
    "    2 | structure Ring(S) { }\n"
    "      |           ^^^^ duplicate declaration\n"
    "    1 | structure Ring(R) { }\n"
    "      |           ---- first declared here\n"
    "      |\n"
    "   = help: rename one of the declarations\n"
    "\n");
}

TEST(BasicDiagnosticPrinter, PrintAllOrdersByPosition)
{
  SourceRegistry sources;
  const FileId file = sources.register_file(
    "s.kleis", "structure S(T) { operation f : T → T }\nimplements S(ℝ, ℝ)\n");

  DiagnosticBag diags;
  diags
    .report_error(
      SourceRange(file, 52, 53),
      "structure 'S' takes 1 type argument(s), implementation gives 2")
    .with_code(diag_code::k_invalid_signature)
    .with_label(SourceRange{}, "while loading s.kleis");
  diags.report_warning(
    SourceRange(file, 27, 28), "operation 'f' is never implemented", "declared here");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, sources);

  EXPECT_EQ(
    out.str(),
    "warning: operation 'f' is never implemented\n"
    "  --> s.kleis:1:28\n"
    "      |\n"
    "    1 | structure S(T) { operation f : T → T }\n"
    "      |                            ^ declared here\n"
    "\n"
    "error[E0104]: structure 'S' takes 1 type argument(s), implementation gives 2\n"
    "  --> s.kleis:2:12\n"
    "      |\n"
    "    2 | implements S(ℝ, ℝ)\n"
    "      |            ^\n"
    "      |\n"
    "   = note: while loading s.kleis\n"
    "\n");
}
