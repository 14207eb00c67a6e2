// numcast/driver/runner.hpp - Conformance run driver
//
// Single entry point for load -> parse -> evaluate over one or more scripts.
// Used by the CLI and by the end-to-end tests.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "numcast/basic/diagnostic.hpp"
#include "numcast/basic/source_manager.hpp"
#include "numcast/eval/script_evaluator.hpp"
#include "numcast/project/suite_config.hpp"

namespace numcast
{

// ============================================================================
// Run Options
// ============================================================================

struct RunOptions
{
  /// Stop after the first script with errors or failed assertions
  bool fail_fast = false;

  /// Log each script to std::cerr
  bool verbose = false;
};

// ============================================================================
// Run Result
// ============================================================================

struct ScriptResult
{
  std::filesystem::path path;
  FileId file_id = FileId::invalid();
  ScriptOutcome outcome;

  /// Syntax or evaluation errors (failed assertions included)
  bool has_errors = false;
};

struct RunResult
{
  /// Whether every script parsed, evaluated and passed
  bool success = false;

  /// Collected diagnostics for all scripts
  DiagnosticBag diagnostics;

  std::vector<ScriptResult> scripts;

  /// Owns the script text the diagnostics point into
  std::unique_ptr<SourceRegistry> sources = std::make_unique<SourceRegistry>();

  [[nodiscard]] size_t assertions_passed() const;
  [[nodiscard]] size_t assertions_failed() const;
};

// ============================================================================
// Runner
// ============================================================================

class Runner
{
public:
  [[nodiscard]] static RunResult run_file(
    const std::filesystem::path & file, const RunOptions & options);

  [[nodiscard]] static RunResult run_files(
    const std::vector<std::filesystem::path> & files, const RunOptions & options);

  /**
   * Run every script listed in a suite configuration.
   *
   * `suite.fail_fast` from the config is combined with `options.fail_fast`.
   */
  [[nodiscard]] static RunResult run_suite(const SuiteConfig & config, const RunOptions & options);

  /// Run an in-memory script registered under `name`
  [[nodiscard]] static RunResult run_source(
    const std::filesystem::path & name, std::string text, const RunOptions & options);

private:
  /// Parse and evaluate one script into `result`; returns false if it failed
  static bool run_script(
    RunResult & result, const std::filesystem::path & path, std::string text,
    const RunOptions & options);

  static void finish(RunResult & result);
};

}  // namespace numcast
