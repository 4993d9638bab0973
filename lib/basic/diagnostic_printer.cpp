// kleis/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "kleis/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace kleis
{

namespace
{

std::string_view severity_name(Severity s) noexcept
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
  }
  return "error";
}

rang::fg severity_color(Severity s) noexcept
{
  switch (s) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
  }
  return rang::fg::red;
}

std::string display_path(const std::filesystem::path & abs_path)
{
  if (abs_path.empty()) {
    return "<unknown>";
  }
  std::error_code ec;
  auto rel_path = std::filesystem::relative(abs_path, std::filesystem::current_path(), ec);
  return (ec || rel_path.empty()) ? abs_path.string() : rel_path.string();
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceRange primary_range = diag.primary_range();
  const std::string filename = display_path(sources.get_path(primary_range.file_id()));
  const FullSourceRange primary_fr = sources.get_full_range(primary_range);

  print_severity_header(diag);

  if (primary_fr.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), filename, primary_fr.start_line,
      primary_fr.start_column);
  } else if (primary_range.file_id().is_valid()) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label_context(label, sources);
  }

  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      const SourceRange ra = a.primary_range();
      const SourceRange rb = b.primary_range();
      if (ra.file_id() != rb.file_id()) {
        return ra.file_id().value < rb.file_id().value;
      }
      return ra.get_begin() < rb.get_begin();
    });

  for (const auto & d : sorted_diags) {
    print(d, sources);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string head = diag.code.empty()
                             ? std::string(severity_name(diag.severity))
                             : fmt::format("{}[{}]", severity_name(diag.severity), diag.code);
  if (use_color_) {
    os_ << rang::style::bold << severity_color(diag.severity) << head << rang::fg::reset << ": "
        << diag.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}: {}\n", head, diag.message);
  }
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceRegistry & sources)
{
  if (!label.range.is_valid()) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  const SourceFile * source = sources.get_file(label.range.file_id());
  if (source == nullptr) {
    return;
  }

  const FullSourceRange fr = source->get_full_range(label.range);
  if (!fr.is_valid()) {
    return;
  }

  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : (fr.start_column + 1);

  print_source_line(
    *source, fr.start_line - 1, fr.start_column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = source.get_line(line_index);
  if (line.empty()) {
    return;
  }

  std::string cleaned_line;
  std::string marker_prefix;
  cleaned_line.reserve(line.size());
  uint32_t column = 1;
  for (const char c : line) {
    const bool before_marker = column < start_col;
    if (c == '\t') {
      cleaned_line += "    ";
      if (before_marker) marker_prefix += "    ";
    } else if (c != '\r') {
      cleaned_line += c;
      // Continuation bytes of a UTF-8 sequence occupy no column of their own.
      if (before_marker && (static_cast<unsigned char>(c) & 0xC0U) != 0x80U) {
        marker_prefix += ' ';
      }
    }
    ++column;
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_index + 1);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_index + 1);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;
  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';
  std::string marker = fmt::format("{}{}", marker_prefix, std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    marker = fmt::format("{} {}", marker, label_message);
  }

  fmt::print(os_, "{} ", gutter_pipe());
  if (use_color_) {
    os_ << (style == LabelStyle::Primary ? rang::fg::red : rang::fg::cyan) << rang::style::bold
        << marker << rang::style::reset << rang::fg::reset << "\n";
  } else {
    fmt::print(os_, "{}\n", marker);
  }
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", kind, message);
  } else {
    fmt::print(os_, "   = {}: {}\n", kind, message);
  }
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  return use_color_ ? "\033[1;36m  -->\033[0m" : "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  return use_color_ ? "\033[1;36m      |\033[0m" : "      |";
}

}  // namespace kleis
