// numcast - numeric coercion conformance checker
//
// Usage:
//   numcast check [script.ncs ...] [--project] [--format text|json] [--fail-fast]
//   numcast eval <expression>
//   numcast bits <f32|f64> <pattern>
//
#include <cctype>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <fmt/format.h>

#include "numcast/ast/ast_context.hpp"
#include "numcast/basic/diagnostic_printer.hpp"
#include "numcast/driver/report_json.hpp"
#include "numcast/driver/runner.hpp"
#include "numcast/eval/script_evaluator.hpp"
#include "numcast/project/suite_config.hpp"
#include "numcast/syntax/frontend.hpp"
#include "numcast/value/bit_reinterpret.hpp"
#include "numcast/value/coercion.hpp"
#include "numcast/value/value_format.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_failure = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "numcast v0.1.0 - numeric coercion conformance checker\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [script.ncs ...]   Run conformance scripts (default: numcast.yaml)\n"
            << "  eval <expression>        Evaluate one expression\n"
            << "  bits <f32|f64> <pattern> Reinterpret a bit pattern as a float\n\n"
            << "Options:\n"
            << "  --project                Run the suite from numcast.yaml\n"
            << "  --format <text|json>     Report format for check\n"
            << "  --fail-fast              Stop after the first failing script\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

bool stderr_is_tty() { return isatty(fileno(stderr)) != 0; }

void print_diagnostics(
  const numcast::DiagnosticBag & diags, const numcast::SourceRegistry & sources)
{
  numcast::DiagnosticPrinter printer(std::cerr, stderr_is_tty());
  printer.print_all(diags, sources);
}

void print_text_summary(const numcast::RunResult & result)
{
  for (const auto & s : result.scripts) {
    std::error_code ec;
    const fs::path rel = fs::relative(s.path, fs::current_path(), ec);
    fmt::print(
      "{}: {} passed, {} failed{}\n", (ec || rel.empty()) ? s.path.string() : rel.string(),
      s.outcome.passed, s.outcome.failed, s.has_errors ? " (errors)" : "");
  }
  fmt::print(
    "{}: {} assertions passed, {} failed, {} errors\n", result.success ? "ok" : "FAILED",
    result.assertions_passed(), result.assertions_failed(), result.diagnostics.error_count());
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::optional<std::string> format;
  bool use_project = false;
  bool fail_fast = false;
  bool verbose = false;
  bool show_help = false;
  std::string usage_error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--format") {
      if (i + 1 < argc) {
        args.format = argv[++i];
      } else {
        args.usage_error = "--format requires a value";
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--fail-fast") {
      args.fail_fast = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (
      arg.size() > 1 && arg[0] == '-' && args.command != "eval" &&
      std::isdigit(static_cast<unsigned char>(arg[1])) == 0) {
      args.usage_error = "unknown option '" + arg + "'";
    } else {
      // `eval -1` and `eval -f32.MAX_VALUE` are expressions, not options.
      args.positional.push_back(arg);
    }
  }

  return args;
}

/// Parse a 0x/0b/0o-prefixed or decimal unsigned integer
std::optional<uint64_t> parse_pattern(std::string_view text)
{
  int base = 10;
  if (text.size() > 2 && text[0] == '0') {
    const char p = text[1];
    if (p == 'x' || p == 'X') {
      base = 16;
    } else if (p == 'b' || p == 'B') {
      base = 2;
    } else if (p == 'o' || p == 'O') {
      base = 8;
    }
    if (base != 10) {
      text.remove_prefix(2);
    }
  }

  uint64_t value = 0;
  const char * last = text.data() + text.size();
  const auto res = std::from_chars(text.data(), last, value, base);
  if (text.empty() || res.ec != std::errc{} || res.ptr != last) {
    return std::nullopt;
  }
  return value;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  numcast::RunOptions options;
  options.fail_fast = args.fail_fast;
  options.verbose = args.verbose;

  std::optional<numcast::ReportFormat> format;
  if (args.format) {
    format = numcast::parse_report_format(*args.format);
    if (!format) {
      std::cerr << "error: invalid --format '" << *args.format << "' (expected text or json)\n";
      return k_exit_usage;
    }
  }

  numcast::RunResult result;
  if (args.use_project || args.positional.empty()) {
    const auto config_path = numcast::find_suite_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << numcast::k_suite_config_file_name
                << " found in current directory or parents\n";
      return k_exit_failure;
    }

    auto config_result = numcast::load_suite_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_path->string() << ": " << config_result.error << "\n";
      return k_exit_failure;
    }

    if (args.verbose) {
      std::cerr << "Using configuration: " << config_path->string() << "\n";
    }
    if (!format) {
      format = config_result.config.suite.report;
    }
    result = numcast::Runner::run_suite(config_result.config, options);
  } else {
    std::vector<fs::path> files(args.positional.begin(), args.positional.end());
    result = numcast::Runner::run_files(files, options);
  }

  if (format.value_or(numcast::ReportFormat::Text) == numcast::ReportFormat::Json) {
    std::cout << numcast::to_json(result).dump(2) << "\n";
  } else {
    print_diagnostics(result.diagnostics, *result.sources);
    print_text_summary(result);
  }

  return result.success ? k_exit_ok : k_exit_failure;
}

int cmd_eval(const CommandArgs & args)
{
  if (args.positional.empty()) {
    std::cerr << "error: expression required\n"
              << "usage: numcast eval <expression>\n";
    return k_exit_usage;
  }

  std::string text;
  for (const auto & part : args.positional) {
    if (!text.empty()) text += ' ';
    text += part;
  }

  numcast::SourceRegistry sources;
  numcast::AstContext ast;
  numcast::DiagnosticBag diags;

  const numcast::Expr * expr =
    numcast::parse_expression(sources, "<eval>", std::move(text), ast, diags);

  numcast::ScriptValue value = numcast::ScriptValue::make_error();
  if (!diags.has_errors()) {
    const numcast::Program * empty = ast.create<numcast::Program>(numcast::SourceRange{});
    numcast::ScriptEvaluator evaluator(*empty, sources, diags);
    value = evaluator.evaluate(expr);
  }

  if (diags.has_errors() || value.is_error()) {
    print_diagnostics(diags, sources);
    return k_exit_failure;
  }

  fmt::print("{}\n", value.describe());
  if (value.is_typed()) {
    fmt::print("bits: {}\n", numcast::format_bits(value.as_typed()));
  }
  if (const auto truth = value.truthiness()) {
    fmt::print("bool: {}\n", *truth);
  }
  return k_exit_ok;
}

int cmd_bits(const CommandArgs & args)
{
  if (args.positional.size() != 2) {
    std::cerr << "error: expected a width and a bit pattern\n"
              << "usage: numcast bits <f32|f64> <pattern>\n";
    return k_exit_usage;
  }

  const std::string & width = args.positional[0];
  const auto pattern = parse_pattern(args.positional[1]);
  if (!pattern) {
    std::cerr << "error: invalid bit pattern '" << args.positional[1] << "'\n";
    return k_exit_usage;
  }

  std::optional<numcast::TypedNumeric> value;
  numcast::FloatFields fields;
  if (width == "f32") {
    if (*pattern > UINT32_MAX) {
      std::cerr << "error: pattern does not fit in 32 bits\n";
      return k_exit_usage;
    }
    const auto bits = static_cast<uint32_t>(*pattern);
    value = numcast::TypedNumeric::make_f32(numcast::reinterpret32(bits));
    fields = numcast::decompose32(bits);
  } else if (width == "f64") {
    value = numcast::TypedNumeric::make_f64(numcast::reinterpret64(*pattern));
    fields = numcast::decompose64(*pattern);
  } else {
    std::cerr << "error: width must be f32 or f64, got '" << width << "'\n";
    return k_exit_usage;
  }

  fmt::print("bits:     {}\n", numcast::format_bits(*value));
  fmt::print("class:    {}\n", numcast::to_string(fields.klass));
  fmt::print("sign:     {}\n", fields.negative ? "-" : "+");
  if (
    fields.klass == numcast::FloatClass::Normal ||
    fields.klass == numcast::FloatClass::Subnormal) {
    fmt::print("exponent: {:#x} (2^{})\n", fields.exponent, fields.unbiased_exponent);
  } else {
    fmt::print("exponent: {:#x}\n", fields.exponent);
  }
  fmt::print("mantissa: {:#x}\n", fields.mantissa);
  fmt::print("value:    {}\n", numcast::format_typed(*value));
  fmt::print("bool:     {}\n", numcast::to_bool(*value));
  return k_exit_ok;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.usage_error.empty()) {
    std::cerr << "error: " << args.usage_error << "\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "eval") {
    return cmd_eval(args);
  }

  if (args.command == "bits") {
    return cmd_bits(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return k_exit_usage;
}
