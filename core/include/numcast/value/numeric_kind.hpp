// numcast/value/numeric_kind.hpp - Numeric type tags
//
// The closed set of numeric types a TypedNumeric can carry, with the
// width/signedness queries shared by the value layer and the evaluator.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace numcast
{

// ============================================================================
// Numeric Kind
// ============================================================================

/**
 * Kind of numeric value.
 *
 * The order matches the alternative order of TypedNumeric's storage variant.
 */
enum class NumericKind : uint8_t {
  I32,  ///< 32-bit two's complement
  I64,  ///< 64-bit two's complement
  U8,   ///< 8-bit unsigned
  U32,  ///< 32-bit unsigned
  U64,  ///< 64-bit unsigned
  F32,  ///< IEEE-754 binary32
  F64,  ///< IEEE-754 binary64
};

inline constexpr NumericKind k_all_numeric_kinds[] = {
  NumericKind::I32, NumericKind::I64, NumericKind::U8,  NumericKind::U32,
  NumericKind::U64, NumericKind::F32, NumericKind::F64,
};

// ============================================================================
// Kind Queries
// ============================================================================

[[nodiscard]] constexpr bool is_float_kind(NumericKind k) noexcept
{
  return k == NumericKind::F32 || k == NumericKind::F64;
}

[[nodiscard]] constexpr bool is_integer_kind(NumericKind k) noexcept { return !is_float_kind(k); }

/// Signed integers and floats are signed; u8/u32/u64 are not
[[nodiscard]] constexpr bool is_signed_kind(NumericKind k) noexcept
{
  return k == NumericKind::I32 || k == NumericKind::I64 || is_float_kind(k);
}

/// Storage width in bits
[[nodiscard]] constexpr uint32_t bit_width(NumericKind k) noexcept
{
  switch (k) {
    case NumericKind::U8:
      return 8;
    case NumericKind::I32:
    case NumericKind::U32:
    case NumericKind::F32:
      return 32;
    case NumericKind::I64:
    case NumericKind::U64:
    case NumericKind::F64:
      return 64;
  }
  return 0;
}

[[nodiscard]] constexpr std::string_view to_string(NumericKind k) noexcept
{
  switch (k) {
    case NumericKind::I32:
      return "i32";
    case NumericKind::I64:
      return "i64";
    case NumericKind::U8:
      return "u8";
    case NumericKind::U32:
      return "u32";
    case NumericKind::U64:
      return "u64";
    case NumericKind::F32:
      return "f32";
    case NumericKind::F64:
      return "f64";
  }
  return "";
}

/**
 * Look up a numeric kind by its surface name ("i32", "f64", ...).
 *
 * @return The kind, or nullopt if the name is not a numeric type
 */
[[nodiscard]] std::optional<NumericKind> lookup_numeric_kind(std::string_view name) noexcept;

}  // namespace numcast
