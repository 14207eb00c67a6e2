// tests/unit/value/test_typed_numeric.cpp - TypedNumeric construction and negation
//
#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>

#include "numcast/value/bit_reinterpret.hpp"
#include "numcast/value/typed_numeric.hpp"

using numcast::NumericKind;
using numcast::TypedNumeric;

TEST(ValueTypedNumeric, KindFollowsFactory)
{
  EXPECT_EQ(TypedNumeric::make_i32(1).kind(), NumericKind::I32);
  EXPECT_EQ(TypedNumeric::make_i64(1).kind(), NumericKind::I64);
  EXPECT_EQ(TypedNumeric::make_u8(1).kind(), NumericKind::U8);
  EXPECT_EQ(TypedNumeric::make_u32(1).kind(), NumericKind::U32);
  EXPECT_EQ(TypedNumeric::make_u64(1).kind(), NumericKind::U64);
  EXPECT_EQ(TypedNumeric::make_f32(1).kind(), NumericKind::F32);
  EXPECT_EQ(TypedNumeric::make_f64(1).kind(), NumericKind::F64);

  EXPECT_TRUE(TypedNumeric::make_f32(1).is_float());
  EXPECT_TRUE(TypedNumeric::make_u8(1).is_integer());
}

TEST(ValueTypedNumeric, FromIntegerTruncatesToWidth)
{
  EXPECT_EQ(TypedNumeric::from_integer(NumericKind::U8, 0x1FF).as<uint8_t>(), 0xFF);
  EXPECT_EQ(TypedNumeric::from_integer(NumericKind::I32, 0xFFFFFFFF).as<int32_t>(), -1);
  EXPECT_EQ(TypedNumeric::from_integer(NumericKind::U32, -1).as<uint32_t>(), 0xFFFFFFFFU);
  EXPECT_EQ(
    TypedNumeric::from_integer(NumericKind::U64, -1).as<uint64_t>(),
    std::numeric_limits<uint64_t>::max());
  EXPECT_EQ(TypedNumeric::from_integer(NumericKind::F32, -3).as<float>(), -3.0F);
  EXPECT_EQ(TypedNumeric::from_integer(NumericKind::F64, 2).as<double>(), 2.0);
}

TEST(ValueTypedNumeric, FromUnsignedKeepsMagnitudeForFloats)
{
  const uint64_t all_ones = std::numeric_limits<uint64_t>::max();
  EXPECT_EQ(TypedNumeric::from_unsigned(NumericKind::F64, all_ones).as<double>(), 0x1p64);
  EXPECT_EQ(TypedNumeric::from_unsigned(NumericKind::F32, 1ULL << 63).as<float>(), 0x1p63F);
  EXPECT_EQ(TypedNumeric::from_unsigned(NumericKind::U64, all_ones).as<uint64_t>(), all_ones);
  EXPECT_EQ(TypedNumeric::from_unsigned(NumericKind::I32, all_ones).as<int32_t>(), -1);
}

TEST(ValueTypedNumeric, TypeConstants)
{
  EXPECT_EQ(
    TypedNumeric::max_value(NumericKind::F32).as<float>(), std::numeric_limits<float>::max());
  EXPECT_EQ(
    TypedNumeric::min_value(NumericKind::F32).as<float>(),
    std::numeric_limits<float>::denorm_min());
  EXPECT_EQ(
    TypedNumeric::min_value(NumericKind::F64).as<double>(),
    std::numeric_limits<double>::denorm_min());
  EXPECT_EQ(
    TypedNumeric::min_normal_value(NumericKind::F64).as<double>(),
    std::numeric_limits<double>::min());
  EXPECT_EQ(
    TypedNumeric::min_value(NumericKind::I32).as<int32_t>(), std::numeric_limits<int32_t>::min());
  EXPECT_EQ(TypedNumeric::min_value(NumericKind::U8).as<uint8_t>(), 0);
  EXPECT_EQ(TypedNumeric::max_value(NumericKind::U8).as<uint8_t>(), 255);
}

TEST(ValueTypedNumeric, FloatNegationFlipsOnlyTheSign)
{
  for (const NumericKind kind : {NumericKind::F32, NumericKind::F64}) {
    for (const auto & v : {TypedNumeric::max_value(kind), TypedNumeric::min_value(kind)}) {
      const auto n = v.negate();
      EXPECT_EQ(n.kind(), kind);
      if (kind == NumericKind::F32) {
        EXPECT_EQ(n.as<float>(), -v.as<float>());
        EXPECT_TRUE(std::signbit(n.as<float>()));
        EXPECT_NE(n.as<float>(), 0.0F);
      } else {
        EXPECT_EQ(n.as<double>(), -v.as<double>());
        EXPECT_TRUE(std::signbit(n.as<double>()));
        EXPECT_NE(n.as<double>(), 0.0);
      }
    }
  }
}

TEST(ValueTypedNumeric, NegatingZeroAndNaNKeepsClass)
{
  const auto neg_zero = TypedNumeric::make_f32(0.0F).negate();
  EXPECT_EQ(numcast::bits_of(neg_zero.as<float>()), 0x80000000U);

  const auto nan = TypedNumeric::make_f64(numcast::reinterpret64(0x7FF8000000000123ULL));
  EXPECT_EQ(numcast::bits_of(nan.negate().as<double>()), 0xFFF8000000000123ULL);
}

TEST(ValueTypedNumeric, IntegerNegationWraps)
{
  EXPECT_EQ(TypedNumeric::make_i32(5).negate().as<int32_t>(), -5);
  EXPECT_EQ(
    TypedNumeric::make_i32(std::numeric_limits<int32_t>::min()).negate().as<int32_t>(),
    std::numeric_limits<int32_t>::min());
  EXPECT_EQ(TypedNumeric::make_u8(1).negate().as<uint8_t>(), 255);
  EXPECT_EQ(TypedNumeric::make_u32(1).negate().as<uint32_t>(), 0xFFFFFFFFU);
}

TEST(ValueTypedNumeric, EqualsUsesIeeeComparison)
{
  EXPECT_TRUE(TypedNumeric::make_f32(0.0F).equals(TypedNumeric::make_f32(-0.0F)));

  const auto nan = TypedNumeric::make_f64(std::numeric_limits<double>::quiet_NaN());
  EXPECT_FALSE(nan.equals(nan));

  // Different kinds never compare equal
  EXPECT_FALSE(TypedNumeric::make_i32(1).equals(TypedNumeric::make_i64(1)));
  EXPECT_FALSE(TypedNumeric::make_f32(1).equals(TypedNumeric::make_f64(1)));
}
