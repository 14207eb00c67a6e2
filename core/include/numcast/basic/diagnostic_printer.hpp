// numcast/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "numcast/basic/diagnostic.hpp"
#include "numcast/basic/source_manager.hpp"

namespace numcast
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0301]: assertion failed
 *     --> conformance/bool.ncs:12:8
 *      |
 *   12 | assert(<bool>f0 == true);
 *      |        ^^^^^^^^^^^^^^^^ evaluated to `false == true`
 *      |
 *      = help: `f0` is f32 -0.0
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to emit terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print all diagnostics ordered by primary location
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label_context(const Label & label, const SourceRegistry & sources);
  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);
  void print_fixit(const FixIt & fixit);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace numcast
