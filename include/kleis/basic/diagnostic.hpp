// kleis/basic/diagnostic.hpp - Diagnostics produced while loading structure sources
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kleis/basic/source_manager.hpp"

namespace kleis
{

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
};

enum class LabelStyle : uint8_t {
  Primary,    // the location that caused the diagnostic
  Secondary,  // related location (e.g. the earlier declaration)
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/**
 * Stable diagnostic codes, printed as error[CODE].
 */
namespace diag_code
{
inline constexpr std::string_view k_syntax = "E0001";
inline constexpr std::string_view k_duplicate_name = "E0101";
inline constexpr std::string_view k_unknown_structure = "E0102";
inline constexpr std::string_view k_cyclic_dependency = "E0103";
inline constexpr std::string_view k_invalid_signature = "E0104";
inline constexpr std::string_view k_unreadable_file = "E0201";
}  // namespace diag_code

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that adds its diagnostic to the bag when destroyed (RAII).
 *
 *   diags.report_error(range, "duplicate structure 'Ring'")
 *     .with_code(diag_code::k_duplicate_name)
 *     .with_secondary_label(previous, "first declared here");
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string_view code);

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label_message = "");

  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "")
  {
    return report(Severity::Error, range, std::move(message), std::move(label_message));
  }
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "")
  {
    return report(Severity::Warning, range, std::move(message), std::move(label_message));
  }

  void add(Diagnostic && diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return diagnostics_; }
  [[nodiscard]] bool empty() const noexcept { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;

  /// First error in report order, or nullptr.
  [[nodiscard]] const Diagnostic * first_error() const noexcept;

  void merge(DiagnosticBag && other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace kleis
