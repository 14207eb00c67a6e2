// numcast/eval/script_evaluator.cpp - Conformance script evaluator
#include "numcast/eval/script_evaluator.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <utility>

#include "numcast/value/bit_reinterpret.hpp"

namespace numcast
{

namespace
{

[[nodiscard]] std::string kind_name(const ScriptValue & v)
{
  switch (v.kind()) {
    case ScriptValueKind::UntypedInt:
      return "integer constant";
    case ScriptValueKind::UntypedFloat:
      return "float constant";
    case ScriptValueKind::Bool:
      return "bool";
    case ScriptValueKind::Typed:
      return std::string(to_string(v.as_typed().kind()));
    case ScriptValueKind::Error:
      break;
  }
  return "<error>";
}

}  // namespace

// ============================================================================
// Entry Points
// ============================================================================

ScriptOutcome ScriptEvaluator::run()
{
  ScriptOutcome outcome;
  for (const Stmt * stmt : program_.stmts) {
    if (const auto * decl = dyn_cast<VarDeclStmt>(stmt)) {
      exec_var_decl(decl);
    } else if (const auto * check = dyn_cast<AssertStmt>(stmt)) {
      exec_assert(check, outcome);
    }
  }
  return outcome;
}

ScriptValue ScriptEvaluator::evaluate(const Expr * expr)
{
  if (expr == nullptr) {
    return ScriptValue::make_error();
  }

  switch (expr->get_kind()) {
    case NodeKind::IntLiteral:
      return ScriptValue::make_untyped_uint(cast<IntLiteralExpr>(expr)->value);
    case NodeKind::FloatLiteral:
      return ScriptValue::make_untyped_float(cast<FloatLiteralExpr>(expr)->value);
    case NodeKind::BoolLiteral:
      return ScriptValue::make_bool(cast<BoolLiteralExpr>(expr)->value);
    case NodeKind::VarRef:
      return eval_var_ref(cast<VarRefExpr>(expr));
    case NodeKind::TypeConstant:
      return eval_type_constant(cast<TypeConstantExpr>(expr));
    case NodeKind::UnaryExpr:
      return eval_unary_expr(cast<UnaryExpr>(expr));
    case NodeKind::BinaryExpr:
      return eval_binary_expr(cast<BinaryExpr>(expr));
    case NodeKind::CastExpr:
      return eval_cast_expr(cast<CastExpr>(expr));
    case NodeKind::ReinterpretExpr:
      return eval_reinterpret_expr(cast<ReinterpretExpr>(expr));
    case NodeKind::MissingExpr:
      // Already reported by the parser.
      return ScriptValue::make_error();
    default:
      break;
  }
  return ScriptValue::make_error();
}

// ============================================================================
// Statements
// ============================================================================

void ScriptEvaluator::exec_var_decl(const VarDeclStmt * node)
{
  ScriptValue value = evaluate(node->init);

  if (const auto it = bindings_.find(node->name); it != bindings_.end()) {
    diags_
      .report_error(
        node->name_range, fmt::format("redefinition of `{}`", node->name), "redefined here")
      .with_code(diag_code::k_redefinition)
      .with_secondary_label(it->second.name_range, "first defined here");
    return;
  }

  // Bind even on error so later uses do not cascade into "undefined name".
  bindings_.emplace(node->name, Binding{std::move(value), node->name_range});
}

void ScriptEvaluator::exec_assert(const AssertStmt * node, ScriptOutcome & outcome)
{
  AssertionRecord record;
  record.range = node->get_range();
  record.text = std::string(sources_.get_slice(node->get_range()));

  const Expr * cond = node->condition;
  std::string evaluated;
  ScriptValue result = ScriptValue::make_error();

  const auto * cmp = dyn_cast<BinaryExpr>(cond);
  if (cmp != nullptr && (cmp->op == BinaryOp::Eq || cmp->op == BinaryOp::Ne)) {
    const ScriptValue lhs = evaluate(cmp->lhs);
    const ScriptValue rhs = evaluate(cmp->rhs);
    result = eval_comparison(cmp->op, lhs, rhs, cmp);
    evaluated = fmt::format("{} {} {}", lhs.describe(), to_string(cmp->op), rhs.describe());
  } else {
    result = evaluate(cond);
    evaluated = result.describe();
  }

  if (result.is_bool()) {
    record.passed = result.as_bool();
    if (!record.passed) {
      diags_
        .report_error(
          cond->get_range(), "assertion failed", fmt::format("evaluated to `{}`", evaluated))
        .with_code(diag_code::k_assertion_failed);
    }
  } else if (!result.is_error()) {
    diags_
      .report_error(
        cond->get_range(), "assertion condition is not a bool",
        fmt::format("this is {} `{}`", kind_name(result), evaluated))
      .with_code(diag_code::k_non_boolean_assert)
      .with_help("convert with `<bool>` or compare with `==`");
  }

  if (record.passed) {
    ++outcome.passed;
  } else {
    ++outcome.failed;
  }
  outcome.assertions.push_back(std::move(record));
}

// ============================================================================
// Expressions
// ============================================================================

ScriptValue ScriptEvaluator::eval_var_ref(const VarRefExpr * node)
{
  const auto it = bindings_.find(node->name);
  if (it == bindings_.end()) {
    diags_.report_error(node->get_range(), fmt::format("undefined name `{}`", node->name))
      .with_code(diag_code::k_undefined_name);
    return ScriptValue::make_error();
  }
  return it->second.value;
}

ScriptValue ScriptEvaluator::eval_type_constant(const TypeConstantExpr * node)
{
  const NumericKind kind = node->type;
  const std::string_view member = node->member;

  if (member == "MAX_VALUE") {
    return ScriptValue::make_typed(TypedNumeric::max_value(kind));
  }
  if (member == "MIN_VALUE") {
    return ScriptValue::make_typed(TypedNumeric::min_value(kind));
  }
  if (is_float_kind(kind)) {
    if (member == "MIN_NORMAL_VALUE") {
      return ScriptValue::make_typed(TypedNumeric::min_normal_value(kind));
    }
    if (member == "EPSILON") {
      return ScriptValue::make_typed(TypedNumeric::epsilon(kind));
    }
  }

  DiagnosticBuilder builder = diags_.report_error(
    node->get_range(), fmt::format("`{}` has no constant `{}`", to_string(kind), member));
  builder.with_code(diag_code::k_unknown_constant);
  if (is_float_kind(kind)) {
    builder.with_help("available: MAX_VALUE, MIN_VALUE, MIN_NORMAL_VALUE, EPSILON");
  } else {
    builder.with_help("available: MAX_VALUE, MIN_VALUE");
  }
  return ScriptValue::make_error();
}

ScriptValue ScriptEvaluator::eval_unary_expr(const UnaryExpr * node)
{
  const ScriptValue operand = evaluate(node->operand);
  if (operand.is_error()) {
    return operand;
  }

  const bool neg = node->op == UnaryOp::Neg;
  switch (operand.kind()) {
    case ScriptValueKind::UntypedInt:
      if (!neg) return operand;
      return ScriptValue::make_untyped_int(
        static_cast<int64_t>(uint64_t{0} - static_cast<uint64_t>(operand.as_untyped_int())));
    case ScriptValueKind::UntypedFloat:
      if (!neg) return operand;
      return ScriptValue::make_untyped_float(
        reinterpret64(bits_of(operand.as_untyped_float()) ^ 0x8000000000000000ULL));
    case ScriptValueKind::Typed:
      return ScriptValue::make_typed(
        neg ? operand.as_typed().negate() : operand.as_typed().plus());
    default:
      break;
  }

  diags_
    .report_error(
      node->get_range(), fmt::format("unary `{}` is not defined for bool", neg ? "-" : "+"))
    .with_code(diag_code::k_unsupported_arithmetic);
  return ScriptValue::make_error();
}

ScriptValue ScriptEvaluator::eval_binary_expr(const BinaryExpr * node)
{
  const ScriptValue lhs = evaluate(node->lhs);
  const ScriptValue rhs = evaluate(node->rhs);

  if (node->op == BinaryOp::Eq || node->op == BinaryOp::Ne) {
    return eval_comparison(node->op, lhs, rhs, node);
  }

  if (lhs.is_error() || rhs.is_error()) {
    return ScriptValue::make_error();
  }

  if (!lhs.is_untyped_int() || !rhs.is_untyped_int()) {
    diags_
      .report_error(
        node->get_range(),
        fmt::format(
          "`{}` is only defined between integer constants", to_string(node->op)),
        fmt::format("{} {} {}", kind_name(lhs), to_string(node->op), kind_name(rhs)))
      .with_code(diag_code::k_unsupported_arithmetic)
      .with_help("offset the bit pattern before the cast, e.g. `reinterpret<f32>(0x7F800000 + 1)`");
    return ScriptValue::make_error();
  }

  const auto a = static_cast<uint64_t>(lhs.as_untyped_int());
  const auto b = static_cast<uint64_t>(rhs.as_untyped_int());
  const uint64_t r = (node->op == BinaryOp::Add) ? a + b : a - b;
  // An offset from an unsigned constant such as 0xFFF0000000000000 stays unsigned.
  if (lhs.is_unsigned_magnitude() || rhs.is_unsigned_magnitude()) {
    return ScriptValue::make_untyped_uint(r);
  }
  return ScriptValue::make_untyped_int(static_cast<int64_t>(r));
}

ScriptValue ScriptEvaluator::eval_comparison(
  BinaryOp op, const ScriptValue & lhs, const ScriptValue & rhs, const BinaryExpr * node)
{
  if (lhs.is_error() || rhs.is_error()) {
    return ScriptValue::make_error();
  }

  bool equal = false;
  if (lhs.is_bool() && rhs.is_bool()) {
    equal = lhs.as_bool() == rhs.as_bool();
  } else if (
    lhs.is_typed() && rhs.is_typed() && lhs.as_typed().kind() == rhs.as_typed().kind()) {
    equal = lhs.as_typed().equals(rhs.as_typed());
  } else {
    diags_
      .report_error(
        node->get_range(),
        fmt::format("cannot compare {} with {}", kind_name(lhs), kind_name(rhs)))
      .with_code(diag_code::k_invalid_comparison)
      .with_help("both sides must be bool, or numbers of the same type (add a `<T>` cast)");
    return ScriptValue::make_error();
  }

  return ScriptValue::make_bool(op == BinaryOp::Eq ? equal : !equal);
}

ScriptValue ScriptEvaluator::eval_cast_expr(const CastExpr * node)
{
  const ScriptValue operand = evaluate(node->operand);
  if (operand.is_error()) {
    return operand;
  }

  if (node->target.is_bool()) {
    return eval_bool_cast(operand);
  }
  return eval_numeric_cast(*node->target.numeric, operand, node->get_range());
}

ScriptValue ScriptEvaluator::eval_bool_cast(const ScriptValue & operand)
{
  if (const auto truth = operand.truthiness()) {
    return ScriptValue::make_bool(*truth);
  }
  return ScriptValue::make_error();
}

ScriptValue ScriptEvaluator::eval_numeric_cast(
  NumericKind target, const ScriptValue & operand, SourceRange range)
{
  switch (operand.kind()) {
    case ScriptValueKind::UntypedInt:
      if (operand.is_unsigned_magnitude()) {
        const auto bits = static_cast<uint64_t>(operand.as_untyped_int());
        return ScriptValue::make_typed(TypedNumeric::from_unsigned(target, bits));
      }
      return ScriptValue::make_typed(TypedNumeric::from_integer(target, operand.as_untyped_int()));
    case ScriptValueKind::UntypedFloat:
      if (is_float_kind(target)) {
        return ScriptValue::make_typed(
          TypedNumeric::from_double(target, operand.as_untyped_float()));
      }
      break;
    case ScriptValueKind::Typed:
      if (operand.as_typed().kind() == target) {
        return operand;
      }
      break;
    default:
      break;
  }

  diags_
    .report_error(
      range, fmt::format("cannot cast {} to {}", kind_name(operand), to_string(target)),
      fmt::format("value is `{}`", operand.describe()))
    .with_code(diag_code::k_invalid_cast)
    .with_help("only untyped constants can be given a numeric type");
  return ScriptValue::make_error();
}

ScriptValue ScriptEvaluator::eval_reinterpret_expr(const ReinterpretExpr * node)
{
  const ScriptValue operand = evaluate(node->operand);
  if (operand.is_error()) {
    return operand;
  }

  const auto & target = node->target;
  const bool untyped = operand.is_untyped_int();
  const auto typed_kind =
    operand.is_typed() ? std::optional<NumericKind>(operand.as_typed().kind()) : std::nullopt;

  if (target.numeric == NumericKind::F32) {
    if (untyped) {
      const int64_t v = operand.as_untyped_int();
      if (v >= 0 && v <= static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        return ScriptValue::make_typed(
          TypedNumeric::make_f32(reinterpret32(static_cast<uint32_t>(v))));
      }
    } else if (typed_kind == NumericKind::I32) {
      const auto bits = static_cast<uint32_t>(operand.as_typed().as<int32_t>());
      return ScriptValue::make_typed(TypedNumeric::make_f32(reinterpret32(bits)));
    } else if (typed_kind == NumericKind::U32) {
      return ScriptValue::make_typed(
        TypedNumeric::make_f32(reinterpret32(operand.as_typed().as<uint32_t>())));
    }
  } else if (target.numeric == NumericKind::F64) {
    if (untyped) {
      const auto bits = static_cast<uint64_t>(operand.as_untyped_int());
      return ScriptValue::make_typed(TypedNumeric::make_f64(reinterpret64(bits)));
    }
    if (typed_kind == NumericKind::I64) {
      const auto bits = static_cast<uint64_t>(operand.as_typed().as<int64_t>());
      return ScriptValue::make_typed(TypedNumeric::make_f64(reinterpret64(bits)));
    }
    if (typed_kind == NumericKind::U64) {
      return ScriptValue::make_typed(
        TypedNumeric::make_f64(reinterpret64(operand.as_typed().as<uint64_t>())));
    }
  } else if (typed_kind == NumericKind::F32) {
    const uint32_t bits = bits_of(operand.as_typed().as<float>());
    if (target.numeric == NumericKind::U32) {
      return ScriptValue::make_typed(TypedNumeric::make_u32(bits));
    }
    if (target.numeric == NumericKind::I32) {
      return ScriptValue::make_typed(TypedNumeric::make_i32(static_cast<int32_t>(bits)));
    }
  } else if (typed_kind == NumericKind::F64) {
    const uint64_t bits = bits_of(operand.as_typed().as<double>());
    if (target.numeric == NumericKind::U64) {
      return ScriptValue::make_typed(TypedNumeric::make_u64(bits));
    }
    if (target.numeric == NumericKind::I64) {
      return ScriptValue::make_typed(TypedNumeric::make_i64(static_cast<int64_t>(bits)));
    }
  }

  diags_
    .report_error(
      node->get_range(),
      fmt::format("cannot reinterpret {} as {}", kind_name(operand), target.name()),
      fmt::format("value is `{}`", operand.describe()))
    .with_code(diag_code::k_invalid_reinterpret)
    .with_help(
      "reinterpret needs operands of equal width: f32 <-> i32/u32/32-bit constant, "
      "f64 <-> i64/u64/64-bit constant");
  return ScriptValue::make_error();
}

}  // namespace numcast
