// tests/unit/eval/test_script_evaluator.cpp - Conformance script evaluation
//
#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

#include "numcast/basic/diagnostic.hpp"
#include "numcast/eval/script_evaluator.hpp"
#include "numcast/test_support/parse_helpers.hpp"
#include "numcast/value/bit_reinterpret.hpp"

using namespace numcast;
using test_support::eval_expr;

namespace
{

bool eval_truth(std::string_view expr)
{
  DiagnosticBag diags;
  const ScriptValue v = eval_expr(expr, &diags);
  EXPECT_FALSE(diags.has_errors()) << expr;
  EXPECT_TRUE(v.is_bool()) << expr;
  return v.is_bool() && v.as_bool();
}

bool has_code(std::string_view expr, const char * code, std::string prelude = "")
{
  DiagnosticBag diags;
  const ScriptValue v = eval_expr(expr, &diags, std::move(prelude));
  EXPECT_TRUE(v.is_error()) << expr;
  return diags.has_code(code);
}

}  // namespace

// ============================================================================
// Values
// ============================================================================

TEST(EvalScript, LiteralsStayUntyped)
{
  EXPECT_TRUE(eval_expr("42").is_untyped_int());
  EXPECT_TRUE(eval_expr("0.5").is_untyped_float());
  EXPECT_TRUE(eval_expr("NaN").is_untyped_float());
  EXPECT_TRUE(eval_expr("true").is_bool());
  EXPECT_EQ(eval_expr("-1").as_untyped_int(), -1);
  EXPECT_EQ(eval_expr("0xFFFFFFFFFFFFFFFF").as_untyped_int(), -1);
}

TEST(EvalScript, CastGivesType)
{
  const ScriptValue v = eval_expr("<u8>0x1FF");
  ASSERT_TRUE(v.is_typed());
  EXPECT_EQ(v.as_typed().kind(), NumericKind::U8);
  EXPECT_EQ(v.as_typed().as<uint8_t>(), 0xFF);

  const ScriptValue f = eval_expr("<f32>-0.0");
  ASSERT_TRUE(f.is_typed());
  EXPECT_EQ(bits_of(f.as_typed().as<float>()), 0x80000000U);

  // Same-kind cast is the identity
  EXPECT_TRUE(eval_expr("<f64><f64>2").is_typed());
}

TEST(EvalScript, LargeIntegerConstantsCastAsUnsigned)
{
  const ScriptValue big = eval_expr("0xFFFFFFFFFFFFFFFF");
  ASSERT_TRUE(big.is_untyped_int());
  EXPECT_TRUE(big.is_unsigned_magnitude());
  EXPECT_EQ(big.describe(), "18446744073709551615");

  const ScriptValue f = eval_expr("<f64>0xFFFFFFFFFFFFFFFF");
  ASSERT_TRUE(f.is_typed());
  EXPECT_EQ(f.as_typed().as<double>(), 0x1p64);

  const ScriptValue offset = eval_expr("<f64>(0xFFF0000000000000 + 1)");
  ASSERT_TRUE(offset.is_typed());
  EXPECT_GT(offset.as_typed().as<double>(), 0.0);

  // Negated constants are signed again
  const ScriptValue neg = eval_expr("<f64>-1");
  ASSERT_TRUE(neg.is_typed());
  EXPECT_EQ(neg.as_typed().as<double>(), -1.0);
  EXPECT_FALSE(eval_expr("-1").is_unsigned_magnitude());
}

TEST(EvalScript, TypeConstants)
{
  const ScriptValue v = eval_expr("-f32.MAX_VALUE");
  ASSERT_TRUE(v.is_typed());
  EXPECT_EQ(v.as_typed().as<float>(), -std::numeric_limits<float>::max());

  EXPECT_EQ(
    eval_expr("f64.MIN_VALUE").as_typed().as<double>(),
    std::numeric_limits<double>::denorm_min());
  EXPECT_EQ(
    eval_expr("f32.MIN_NORMAL_VALUE").as_typed().as<float>(), std::numeric_limits<float>::min());
  EXPECT_EQ(eval_expr("u8.MAX_VALUE").as_typed().as<uint8_t>(), 255);
}

TEST(EvalScript, ReinterpretBoundaries)
{
  EXPECT_TRUE(std::isinf(eval_expr("reinterpret<f32>(0x7F800000)").as_typed().as<float>()));
  EXPECT_TRUE(std::isnan(eval_expr("reinterpret<f32>(0x7F800000 + 1)").as_typed().as<float>()));
  EXPECT_TRUE(std::isnan(eval_expr("reinterpret<f32>(0xFF800000 + 1)").as_typed().as<float>()));
  EXPECT_TRUE(
    std::isfinite(eval_expr("reinterpret<f64>(0x7FF0000000000000 - 1)").as_typed().as<double>()));
  EXPECT_TRUE(
    std::isnan(eval_expr("reinterpret<f64>(0xFFF0000000000000 + 1)").as_typed().as<double>()));

  const ScriptValue back = eval_expr("reinterpret<u32>(<f32>1)");
  ASSERT_TRUE(back.is_typed());
  EXPECT_EQ(back.as_typed().as<uint32_t>(), 0x3F800000U);

  EXPECT_EQ(eval_expr("reinterpret<i64>(<f64>-0.0)").as_typed().as<int64_t>(), INT64_MIN);
  EXPECT_TRUE(eval_expr("reinterpret<f32>(<i32>-1)").is_typed());
}

// ============================================================================
// Coercion to bool
// ============================================================================

TEST(EvalScript, BoolCastOfIntegers)
{
  EXPECT_TRUE(eval_truth("<bool><i32>2 == true"));
  EXPECT_TRUE(eval_truth("<bool><u8>0 == false"));
  EXPECT_TRUE(eval_truth("<bool><u8>256 == false"));
  EXPECT_TRUE(eval_truth("<bool><i64>0x100000000 == true"));
  // An untyped constant that does not fit i32 is tested as i64.
  EXPECT_TRUE(eval_truth("<bool>0x100000000 == true"));
  EXPECT_TRUE(eval_truth("<bool>0 == false"));
}

TEST(EvalScript, BoolCastOfFloats)
{
  EXPECT_TRUE(eval_truth("<bool><f32>+0.0 == false"));
  EXPECT_TRUE(eval_truth("<bool><f32>-0.0 == false"));
  EXPECT_TRUE(eval_truth("<bool><f32>NaN == false"));
  EXPECT_TRUE(eval_truth("<bool><f64>-NaN == false"));
  EXPECT_TRUE(eval_truth("<bool>-Infinity == true"));
  EXPECT_TRUE(eval_truth("<bool>-f64.MIN_VALUE == true"));
  EXPECT_TRUE(eval_truth("<bool>reinterpret<f32>(0x7F800000 - 1) == true"));
  EXPECT_TRUE(eval_truth("<bool>true == true"));
}

TEST(EvalScript, ComparisonsUseIeeeSemantics)
{
  EXPECT_TRUE(eval_truth("<f32>0.0 == <f32>-0.0"));
  EXPECT_TRUE(eval_truth("<f64>NaN != <f64>NaN"));
  EXPECT_TRUE(eval_truth("true != false"));
  EXPECT_TRUE(eval_truth("-f32.MAX_VALUE != f32.MAX_VALUE"));
}

TEST(EvalScript, NegatingUntypedFloatFlipsSignBit)
{
  const ScriptValue nan = eval_expr("-NaN");
  ASSERT_TRUE(nan.is_untyped_float());
  EXPECT_EQ(
    bits_of(nan.as_untyped_float()),
    bits_of(std::numeric_limits<double>::quiet_NaN()) ^ 0x8000000000000000ULL);

  const ScriptValue zero = eval_expr("-0.0");
  ASSERT_TRUE(zero.is_untyped_float());
  EXPECT_EQ(bits_of(zero.as_untyped_float()), 0x8000000000000000ULL);

  const ScriptValue twice = eval_expr("--Infinity");
  ASSERT_TRUE(twice.is_untyped_float());
  EXPECT_EQ(twice.as_untyped_float(), std::numeric_limits<double>::infinity());
}

TEST(EvalScript, VariablesKeepUntypedConstants)
{
  DiagnosticBag diags;
  const ScriptValue v = eval_expr("x", &diags, "var x = 0x7F800000;");
  EXPECT_FALSE(diags.has_errors());
  EXPECT_TRUE(v.is_untyped_int());

  const ScriptValue y = eval_expr("reinterpret<f32>(x + 1)", &diags, "var x = 0x7F800000;");
  ASSERT_TRUE(y.is_typed());
  EXPECT_TRUE(std::isnan(y.as_typed().as<float>()));
}

// ============================================================================
// Errors
// ============================================================================

TEST(EvalScript, UndefinedName)
{
  EXPECT_TRUE(has_code("nope", diag_code::k_undefined_name));
}

TEST(EvalScript, ArithmeticOnlyBetweenIntegerConstants)
{
  EXPECT_TRUE(has_code("<f32>1 + <f32>1", diag_code::k_unsupported_arithmetic));
  EXPECT_TRUE(has_code("0.5 + 1", diag_code::k_unsupported_arithmetic));
  EXPECT_TRUE(has_code("-true", diag_code::k_unsupported_arithmetic));
}

TEST(EvalScript, InvalidCasts)
{
  EXPECT_TRUE(has_code("<i32>0.5", diag_code::k_invalid_cast));
  EXPECT_TRUE(has_code("<f64><f32>1", diag_code::k_invalid_cast));
  EXPECT_TRUE(has_code("<u8>true", diag_code::k_invalid_cast));
}

TEST(EvalScript, InvalidReinterprets)
{
  EXPECT_TRUE(has_code("reinterpret<f32>(0x100000000)", diag_code::k_invalid_reinterpret));
  EXPECT_TRUE(has_code("reinterpret<f32>(-1)", diag_code::k_invalid_reinterpret));
  EXPECT_TRUE(has_code("reinterpret<f32>(<i64>1)", diag_code::k_invalid_reinterpret));
  EXPECT_TRUE(has_code("reinterpret<u32>(<f64>1)", diag_code::k_invalid_reinterpret));
  EXPECT_TRUE(has_code("reinterpret<u8>(<f32>1)", diag_code::k_invalid_reinterpret));
  EXPECT_TRUE(has_code("reinterpret<bool>(1)", diag_code::k_invalid_reinterpret));
  EXPECT_TRUE(has_code("reinterpret<f32>(1.5)", diag_code::k_invalid_reinterpret));
}

TEST(EvalScript, InvalidComparisons)
{
  EXPECT_TRUE(has_code("<i32>1 == <i64>1", diag_code::k_invalid_comparison));
  EXPECT_TRUE(has_code("1 == 1", diag_code::k_invalid_comparison));
  EXPECT_TRUE(has_code("<bool>1 == <i32>1", diag_code::k_invalid_comparison));
}

TEST(EvalScript, UnknownTypeConstant)
{
  EXPECT_TRUE(has_code("i32.EPSILON", diag_code::k_unknown_constant));
  EXPECT_TRUE(has_code("f32.MAXIMUM", diag_code::k_unknown_constant));
}

TEST(EvalScript, ErrorsDoNotCascade)
{
  DiagnosticBag diags;
  const ScriptValue v = eval_expr("<bool>reinterpret<f32>(nope + 1) == true", &diags);
  EXPECT_TRUE(v.is_error());
  EXPECT_EQ(diags.error_count(), 1U);
  EXPECT_TRUE(diags.has_code(diag_code::k_undefined_name));
}

// ============================================================================
// Statements
// ============================================================================

TEST(EvalScript, RunCountsAssertions)
{
  auto unit = test_support::run(
    "var f1 = <f32>-0.0;\n"
    "assert(<bool>f1 == false);\n"
    "assert(<bool>f1 == true);\n"
    "assert(f1 == <f32>0.0);\n");

  EXPECT_EQ(unit.outcome.passed, 2U);
  EXPECT_EQ(unit.outcome.failed, 1U);
  EXPECT_FALSE(unit.outcome.all_passed());
  ASSERT_EQ(unit.outcome.assertions.size(), 3U);
  EXPECT_TRUE(unit.outcome.assertions[0].passed);
  EXPECT_FALSE(unit.outcome.assertions[1].passed);
  EXPECT_EQ(unit.outcome.assertions[1].text, "assert(<bool>f1 == true)");
}

TEST(EvalScript, FailedAssertionShowsOperands)
{
  auto unit = test_support::run(
    "var f1 = <f32>-0.0;\n"
    "assert(<bool>f1 == true);\n");

  ASSERT_EQ(unit.diags.size(), 1U);
  const Diagnostic & d = unit.diags.all()[0];
  EXPECT_EQ(d.code, diag_code::k_assertion_failed);
  EXPECT_EQ(d.message, "assertion failed");
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_label()->message, "evaluated to `false == true`");
  EXPECT_EQ(unit.full_range(d.primary_range()).start_line, 2U);
}

TEST(EvalScript, AssertRequiresBool)
{
  auto unit = test_support::run("assert(<f32>1);\n");
  EXPECT_TRUE(unit.diags.has_code(diag_code::k_non_boolean_assert));
  EXPECT_EQ(unit.outcome.failed, 1U);
}

TEST(EvalScript, RedefinitionPointsAtFirstDefinition)
{
  auto unit = test_support::run(
    "var x = 1;\n"
    "var x = 2;\n");

  ASSERT_EQ(unit.diags.size(), 1U);
  const Diagnostic & d = unit.diags.all()[0];
  EXPECT_EQ(d.code, diag_code::k_redefinition);
  ASSERT_EQ(d.labels.size(), 2U);
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(unit.full_range(d.labels[1].range).start_line, 1U);
}

TEST(EvalScript, RedefinitionStillEvaluatesInitializer)
{
  auto unit = test_support::run(
    "var x = 1;\n"
    "var x = missing;\n");

  ASSERT_EQ(unit.diags.size(), 2U);
  EXPECT_EQ(unit.diags.all()[0].code, diag_code::k_undefined_name);
  EXPECT_EQ(unit.diags.all()[1].code, diag_code::k_redefinition);
}

TEST(EvalScript, SyntaxErrorsDoNotProduceEvaluationErrors)
{
  auto unit = test_support::run(
    "var a = <f32>;\n"
    "assert(<bool>a == true);\n");

  // Only the parse error: `a` is bound to an error value and stays quiet.
  EXPECT_EQ(unit.diags.error_count(), 1U);
  EXPECT_TRUE(unit.diags.has_code(diag_code::k_expected_expression));
  EXPECT_EQ(unit.outcome.failed, 1U);
}
