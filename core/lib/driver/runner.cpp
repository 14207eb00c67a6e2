// numcast/driver/runner.cpp - Conformance run driver implementation
//
#include "numcast/driver/runner.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>

#include "numcast/ast/ast_context.hpp"
#include "numcast/syntax/frontend.hpp"

namespace numcast
{

namespace
{

std::optional<std::string> read_file(const std::filesystem::path & path)
{
  std::ifstream file(path);
  if (!file.is_open()) {
    return std::nullopt;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return std::nullopt;
  }
  return buffer.str();
}

}  // namespace

size_t RunResult::assertions_passed() const
{
  size_t n = 0;
  for (const auto & s : scripts) {
    n += s.outcome.passed;
  }
  return n;
}

size_t RunResult::assertions_failed() const
{
  size_t n = 0;
  for (const auto & s : scripts) {
    n += s.outcome.failed;
  }
  return n;
}

RunResult Runner::run_file(const std::filesystem::path & file, const RunOptions & options)
{
  return run_files({file}, options);
}

RunResult Runner::run_files(
  const std::vector<std::filesystem::path> & files, const RunOptions & options)
{
  namespace fs = std::filesystem;

  RunResult result;

  if (files.empty()) {
    result.diagnostics.report_error(SourceRange{}, "no scripts to run");
    finish(result);
    return result;
  }

  for (const auto & path : files) {
    if (!fs::exists(path)) {
      result.diagnostics.report_error(SourceRange{}, "file not found: " + path.string());
      if (options.fail_fast) break;
      continue;
    }
    if (!fs::is_regular_file(path)) {
      result.diagnostics.report_error(SourceRange{}, "not a file: " + path.string());
      if (options.fail_fast) break;
      continue;
    }

    auto text = read_file(path);
    if (!text) {
      result.diagnostics.report_error(SourceRange{}, "cannot open file: " + path.string());
      if (options.fail_fast) break;
      continue;
    }

    if (!run_script(result, path, std::move(*text), options) && options.fail_fast) {
      if (options.verbose) {
        std::cerr << "Stopping after first failure: " << path.string() << "\n";
      }
      break;
    }
  }

  finish(result);
  return result;
}

RunResult Runner::run_suite(const SuiteConfig & config, const RunOptions & options)
{
  RunOptions effective = options;
  effective.fail_fast = options.fail_fast || config.suite.fail_fast;

  if (options.verbose) {
    std::cerr << "Checking suite: "
              << (config.package.name.empty() ? config.project_root.string()
                                               : config.package.name)
              << " (" << config.suite.scripts.size() << " scripts)\n";
  }
  return run_files(config.suite.scripts, effective);
}

RunResult Runner::run_source(
  const std::filesystem::path & name, std::string text, const RunOptions & options)
{
  RunResult result;
  (void)run_script(result, name, std::move(text), options);
  finish(result);
  return result;
}

bool Runner::run_script(
  RunResult & result, const std::filesystem::path & path, std::string text,
  const RunOptions & options)
{
  if (options.verbose) {
    std::cerr << "Checking: " << path.string() << "\n";
  }

  // Each script gets its own bag so its errors can be attributed to it.
  DiagnosticBag diags;
  AstContext ast;
  const ParseOutput parsed = parse_source(*result.sources, path, std::move(text), ast, diags);

  ScriptResult script;
  script.path = path;
  script.file_id = parsed.file_id;

  ScriptEvaluator evaluator(*parsed.program, *result.sources, diags);
  script.outcome = evaluator.run();
  script.has_errors = diags.has_errors();

  if (options.verbose) {
    std::cerr << "  " << script.outcome.passed << " passed, " << script.outcome.failed
              << " failed, " << diags.error_count() << " errors\n";
  }

  const bool ok = !script.has_errors;
  result.diagnostics.merge(std::move(diags));
  result.scripts.push_back(std::move(script));
  return ok;
}

void Runner::finish(RunResult & result)
{
  result.success = !result.diagnostics.has_errors();
}

}  // namespace numcast
