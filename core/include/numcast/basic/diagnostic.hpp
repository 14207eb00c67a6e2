// numcast/basic/diagnostic.hpp - Diagnostics for script parsing and evaluation
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "numcast/basic/source_manager.hpp"

namespace numcast
{

// ============================================================================
// Diagnostic Codes
// ============================================================================

namespace diag_code
{

// E01xx: lexical and syntax
inline constexpr const char * k_unknown_token = "E0101";
inline constexpr const char * k_expected_token = "E0102";
inline constexpr const char * k_expected_expression = "E0103";
inline constexpr const char * k_unknown_type = "E0104";
inline constexpr const char * k_invalid_literal = "E0105";
inline constexpr const char * k_chained_equality = "E0106";
inline constexpr const char * k_unexpected_statement = "E0107";

// E02xx: evaluation
inline constexpr const char * k_undefined_name = "E0201";
inline constexpr const char * k_redefinition = "E0202";
inline constexpr const char * k_unsupported_arithmetic = "E0203";
inline constexpr const char * k_invalid_cast = "E0204";
inline constexpr const char * k_invalid_reinterpret = "E0205";
inline constexpr const char * k_invalid_comparison = "E0206";
inline constexpr const char * k_non_boolean_assert = "E0207";
inline constexpr const char * k_unknown_constant = "E0208";

// E03xx: assertions
inline constexpr const char * k_assertion_failed = "E0301";

}  // namespace diag_code

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

[[nodiscard]] constexpr const char * to_string(Severity s) noexcept
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

enum class LabelStyle {
  Primary,    // where the problem is
  Secondary,  // related context
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct FixIt
{
  SourceRange range;
  std::string replacement_text;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g., "E0301"
  std::string message;

  std::vector<Label> labels;
  std::vector<FixIt> fixits;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that adds its diagnostic to the bag when destroyed.
 *
 * @code
 *   diags.report_error(range, "assertion failed")
 *     .with_code(diag_code::k_assertion_failed)
 *     .with_help("...");
 * @endcode
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_fixit(SourceRange range, std::string replacement);

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

  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_info(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] size_t error_count() const;

  /// True if any diagnostic carries `code`
  [[nodiscard]] bool has_code(std::string_view code) const;

  void merge(DiagnosticBag && other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label_message);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace numcast
