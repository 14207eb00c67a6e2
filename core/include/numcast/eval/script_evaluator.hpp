// numcast/eval/script_evaluator.hpp - Conformance script evaluator
//
// Walks a parsed script in order, binding `var` declarations and checking
// every `assert`. Problems are reported to a DiagnosticBag; evaluation never
// throws.
//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "numcast/ast/ast.hpp"
#include "numcast/basic/diagnostic.hpp"
#include "numcast/basic/source_manager.hpp"
#include "numcast/eval/script_value.hpp"

namespace numcast
{

/// Result of one `assert(...)` statement
struct AssertionRecord
{
  SourceRange range;
  std::string text;  ///< Source text of the statement
  bool passed = false;
};

struct ScriptOutcome
{
  std::vector<AssertionRecord> assertions;
  size_t passed = 0;
  size_t failed = 0;

  [[nodiscard]] bool all_passed() const noexcept { return failed == 0; }
};

/**
 * Evaluates one script.
 *
 * ## Usage
 * ```cpp
 * ScriptEvaluator eval(*parsed.program, sources, diags);
 * ScriptOutcome outcome = eval.run();
 *
 * // Or evaluate a single expression against the current bindings
 * ScriptValue v = eval.evaluate(expr);
 * ```
 */
class ScriptEvaluator
{
public:
  /**
   * @param program Parsed script
   * @param sources Registry owning the script text (for assertion records)
   * @param diags DiagnosticBag for error reporting
   */
  ScriptEvaluator(const Program & program, const SourceRegistry & sources, DiagnosticBag & diags)
  : program_(program), sources_(sources), diags_(diags)
  {
  }

  /// Execute every statement; may be called once per evaluator
  ScriptOutcome run();

  /**
   * Evaluate a single expression.
   *
   * @return the value, or ScriptValue::make_error() after reporting
   */
  ScriptValue evaluate(const Expr * expr);

private:
  // ===========================================================================
  // Statements
  // ===========================================================================

  void exec_var_decl(const VarDeclStmt * node);
  void exec_assert(const AssertStmt * node, ScriptOutcome & outcome);

  // ===========================================================================
  // Expressions
  // ===========================================================================

  ScriptValue eval_var_ref(const VarRefExpr * node);
  ScriptValue eval_type_constant(const TypeConstantExpr * node);
  ScriptValue eval_unary_expr(const UnaryExpr * node);
  ScriptValue eval_binary_expr(const BinaryExpr * node);
  ScriptValue eval_cast_expr(const CastExpr * node);
  ScriptValue eval_reinterpret_expr(const ReinterpretExpr * node);

  ScriptValue eval_comparison(
    BinaryOp op, const ScriptValue & lhs, const ScriptValue & rhs, const BinaryExpr * node);
  ScriptValue eval_bool_cast(const ScriptValue & operand);
  ScriptValue eval_numeric_cast(NumericKind target, const ScriptValue & operand, SourceRange range);

  struct Binding
  {
    ScriptValue value;
    SourceRange name_range;
  };

  const Program & program_;
  const SourceRegistry & sources_;
  DiagnosticBag & diags_;
  std::unordered_map<std::string_view, Binding> bindings_;
};

}  // namespace numcast
