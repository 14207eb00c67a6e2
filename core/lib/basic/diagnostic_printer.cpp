// numcast/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "numcast/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <vector>

namespace numcast
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceRange primary = diag.primary_range();

  std::string filename = "<unknown>";
  if (primary.file_id().is_valid()) {
    const fs::path & abs_path = sources.get_path(primary.file_id());
    std::error_code ec;
    const fs::path rel = fs::relative(abs_path, fs::current_path(), ec);
    filename = (ec || rel.empty()) ? abs_path.string() : rel.string();
  }

  print_severity_header(diag);

  const FullSourceRange fr = sources.get_full_range(primary);
  if (fr.is_valid()) {
    fmt::print(os_, "{} {}:{}:{}\n", gutter_arrow(), filename, fr.start_line, fr.start_column);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }
  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label_context(label, sources);
  }
  for (const auto & f : diag.fixits) {
    print_fixit(f);
  }
  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<const Diagnostic *> sorted;
  sorted.reserve(diags.size());
  for (const auto & d : diags) {
    sorted.push_back(&d);
  }

  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->primary_range().get_begin() < b->primary_range().get_begin();
  });

  for (const Diagnostic * d : sorted) {
    print(*d, sources);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string head =
    diag.code.empty() ? to_string(diag.severity)
                      : fmt::format("{}[{}]", to_string(diag.severity), diag.code);

  if (!use_color_) {
    fmt::print(os_, "{}: {}\n", head, diag.message);
    return;
  }

  os_ << rang::style::bold;
  switch (diag.severity) {
    case Severity::Error:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
    case Severity::Info:
      os_ << rang::fg::cyan;
      break;
    case Severity::Hint:
      os_ << rang::fg::green;
      break;
  }
  os_ << head << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceRegistry & sources)
{
  const SourceFile * source = sources.get_file(label.range.file_id());
  const FullSourceRange fr = sources.get_full_range(label.range);
  if (source == nullptr || !fr.is_valid()) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  // Multi-line ranges are marked on their first line only.
  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : fr.start_column + 1;

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

  std::string cleaned;
  std::string marker_prefix;
  for (size_t i = 0; i < line.size(); ++i) {
    const bool before_marker = i + 1 < start_col;
    if (line[i] == '\t') {
      cleaned += "    ";
      if (before_marker) marker_prefix += "    ";
    } else {
      cleaned += line[i];
      if (before_marker) marker_prefix += ' ';
    }
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_index + 1);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_index + 1);
  }
  fmt::print(os_, "{}\n", cleaned);

  const size_t marker_len = std::max<size_t>(1, end_col - start_col);
  const std::string markers(marker_len, style == LabelStyle::Primary ? '^' : '-');
  const std::string suffix = label_message.empty() ? "" : fmt::format(" {}", label_message);

  fmt::print(os_, "      | {}", marker_prefix);
  if (use_color_) {
    os_ << (style == LabelStyle::Primary ? rang::fg::red : rang::fg::cyan) << rang::style::bold
        << markers << suffix << rang::style::reset << rang::fg::reset << "\n";
  } else {
    fmt::print(os_, "{}{}\n", markers, suffix);
  }
}

void DiagnosticPrinter::print_fixit(const FixIt & fixit)
{
  print_trailer("help", fmt::format("insert `{}`", fixit.replacement_text));
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

}  // namespace numcast
