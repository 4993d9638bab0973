// kleis/test_support/checker_helpers.hpp - helpers for unit/integration tests
//
// Expression builders and a single-file parsing pipeline, so tests can state
// inputs as compactly as the editor would send them.
//
#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "kleis/ast/expression.hpp"
#include "kleis/basic/diagnostic.hpp"
#include "kleis/basic/source_manager.hpp"
#include "kleis/driver/type_checker.hpp"
#include "kleis/syntax/frontend.hpp"

namespace kleis::test_support
{

// ============================================================================
// Parsing
// ============================================================================

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  DiagnosticBag diags;
  StructureProgram program;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return sources.get_slice(r);
  }

  template <typename T>
  [[nodiscard]] const T & decl(size_t index) const
  {
    return std::get<T>(program.declarations.at(index));
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.kleis")
{
  TestParseUnit out;
  ParseOutput parsed = parse_source(out.sources, virtual_path, std::move(src), out.diags);
  out.file_id = parsed.file_id;
  out.program = std::move(parsed.program);
  return out;
}

// ============================================================================
// Expressions
// ============================================================================

[[nodiscard]] inline Expression num(std::string text) { return Expression::constant(std::move(text)); }

[[nodiscard]] inline Expression obj(std::string name) { return Expression::object(std::move(name)); }

[[nodiscard]] inline Expression ph(uint32_t id) { return Expression::placeholder(id); }

[[nodiscard]] inline Expression op(std::string name, std::vector<Expression> args = {})
{
  return Expression::operation(std::move(name), std::move(args));
}

/// Dimension-only matrix literal: Matrix(rows, cols)
[[nodiscard]] inline Expression matrix(int rows, int cols)
{
  return op("Matrix", {num(std::to_string(rows)), num(std::to_string(cols))});
}

// ============================================================================
// Files
// ============================================================================

/// Directory removed with everything in it when the test ends
struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(const std::string & name)
  : path(std::filesystem::temp_directory_path() / name)
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  /// Write `text` to `relative` below the directory, creating parents
  std::filesystem::path write(const std::filesystem::path & relative, const std::string & text) const
  {
    const std::filesystem::path file = path / relative;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream(file, std::ios::binary) << text;
    return file;
  }
};

// ============================================================================
// Checkers
// ============================================================================

/// Checker with the standard library from the source tree; fails the test on load errors
[[nodiscard]] inline std::unique_ptr<TypeChecker> stdlib_checker(CheckerOptions options = {})
{
  CheckerLoadResult loaded = TypeChecker::with_standard_library(options);
  EXPECT_TRUE(loaded.success) << (loaded.diagnostics.first_error() != nullptr
                                    ? loaded.diagnostics.first_error()->message
                                    : std::string("no diagnostics"));
  return std::move(loaded.checker);
}

/// Empty checker with `src` loaded; fails the test on load errors
[[nodiscard]] inline std::unique_ptr<TypeChecker> checker_with(
  const std::string & src, CheckerOptions options = {})
{
  auto checker = std::make_unique<TypeChecker>(options);
  LoadResult loaded = checker->load_source(src);
  EXPECT_TRUE(loaded.success) << (loaded.diagnostics.first_error() != nullptr
                                    ? loaded.diagnostics.first_error()->message
                                    : std::string("no diagnostics"));
  return checker;
}

}  // namespace kleis::test_support
