// kleis/basic/diagnostic_printer.hpp
//
// Prints load diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "kleis/basic/diagnostic.hpp"
#include "kleis/basic/source_manager.hpp"

namespace kleis
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0101]: structure 'Ring' is already registered
 *     --> std/spaces.kleis:12:11
 *      |
 *   12 | structure Ring(R) {
 *      |           ^^^^ duplicate declaration
 *      |
 *      = help: rename one of the declarations
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print every diagnostic of the bag, ordered by file and position.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label_context(const Label & label, const SourceRegistry & sources);
  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace kleis
