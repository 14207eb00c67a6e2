// numcast/test_support/parse_helpers.hpp - helpers for unit/integration tests
//
// A single-script parse (and optionally evaluate) pipeline over in-memory
// text. Ownership stays explicit: the unit owns its SourceRegistry and
// AstContext, so ranges and AST pointers stay valid for its lifetime.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "numcast/ast/ast_context.hpp"
#include "numcast/basic/diagnostic.hpp"
#include "numcast/basic/source_manager.hpp"
#include "numcast/eval/script_evaluator.hpp"
#include "numcast/syntax/frontend.hpp"

namespace numcast::test_support
{

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  Program * program = nullptr;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return sources.get_slice(r);
  }

  [[nodiscard]] FullSourceRange full_range(SourceRange r) const noexcept
  {
    return sources.get_full_range(r);
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.ncs")
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>();

  const ParseOutput parsed =
    parse_source(out.sources, virtual_path, std::move(src), *out.ast, out.diags);
  out.file_id = parsed.file_id;
  out.program = parsed.program;
  return out;
}

struct TestRunUnit : TestParseUnit
{
  ScriptOutcome outcome;
};

/// Parse and evaluate; evaluation diagnostics land in the same bag
[[nodiscard]] inline TestRunUnit run(std::string src)
{
  TestRunUnit out;
  static_cast<TestParseUnit &>(out) = parse(std::move(src));
  ScriptEvaluator evaluator(*out.program, out.sources, out.diags);
  out.outcome = evaluator.run();
  return out;
}

/**
 * Evaluate one expression after running `prelude` (var declarations).
 *
 * @code
 *   auto v = eval_expr("<f32>-0.0");
 *   EXPECT_TRUE(v.is_typed());
 * @endcode
 */
[[nodiscard]] inline ScriptValue eval_expr(
  std::string_view expr, DiagnosticBag * diags_out = nullptr, std::string prelude = "")
{
  SourceRegistry sources;
  AstContext ast;
  DiagnosticBag diags;

  const ParseOutput parsed = parse_source(sources, "<prelude>.ncs", std::move(prelude), ast, diags);
  ScriptEvaluator evaluator(*parsed.program, sources, diags);
  (void)evaluator.run();

  const Expr * e = parse_expression(sources, "<expr>", std::string(expr), ast, diags);
  ScriptValue v = diags.has_errors() ? ScriptValue::make_error() : evaluator.evaluate(e);
  if (diags_out != nullptr) {
    *diags_out = std::move(diags);
  }
  return v;
}

}  // namespace numcast::test_support
