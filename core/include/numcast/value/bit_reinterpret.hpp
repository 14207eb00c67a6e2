// numcast/value/bit_reinterpret.hpp - IEEE-754 bit pattern reinterpretation
//
// Converts between raw unsigned bit patterns and floats of the same width
// by copying bytes. No numeric conversion takes place: 0x7F800000 becomes
// +Infinity, not 2139095040.0f.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace numcast
{

static_assert(sizeof(float) == sizeof(uint32_t), "float must be IEEE-754 binary32");
static_assert(sizeof(double) == sizeof(uint64_t), "double must be IEEE-754 binary64");

// ============================================================================
// Reinterpretation
// ============================================================================

/// Reinterpret a 32-bit pattern as binary32
[[nodiscard]] float reinterpret32(uint32_t bits) noexcept;

/// Reinterpret a 64-bit pattern as binary64
[[nodiscard]] double reinterpret64(uint64_t bits) noexcept;

/// Raw bit pattern of a binary32 value
[[nodiscard]] uint32_t bits_of(float value) noexcept;

/// Raw bit pattern of a binary64 value
[[nodiscard]] uint64_t bits_of(double value) noexcept;

// ============================================================================
// Field Layout
// ============================================================================

/**
 * Field layout of an IEEE-754 binary format.
 */
struct FloatFormat
{
  uint32_t exponent_bits;
  uint32_t mantissa_bits;
  int32_t exponent_bias;

  [[nodiscard]] constexpr uint64_t exponent_mask() const noexcept
  {
    return (uint64_t{1} << exponent_bits) - 1;
  }

  [[nodiscard]] constexpr uint64_t mantissa_mask() const noexcept
  {
    return (uint64_t{1} << mantissa_bits) - 1;
  }
};

inline constexpr FloatFormat k_binary32_format{8, 23, 127};
inline constexpr FloatFormat k_binary64_format{11, 52, 1023};

/**
 * Class of a float value derived from its exponent and mantissa fields.
 */
enum class FloatClass : uint8_t {
  Zero,       ///< exponent 0, mantissa 0
  Subnormal,  ///< exponent 0, mantissa != 0
  Normal,     ///< exponent in [1, max - 1]
  Infinite,   ///< exponent all-ones, mantissa 0
  NaN,        ///< exponent all-ones, mantissa != 0
};

[[nodiscard]] constexpr std::string_view to_string(FloatClass c) noexcept
{
  switch (c) {
    case FloatClass::Zero:
      return "zero";
    case FloatClass::Subnormal:
      return "subnormal";
    case FloatClass::Normal:
      return "normal";
    case FloatClass::Infinite:
      return "infinite";
    case FloatClass::NaN:
      return "nan";
  }
  return "";
}

/**
 * Decomposed sign/exponent/mantissa fields of a bit pattern.
 */
struct FloatFields
{
  bool negative = false;
  uint32_t exponent = 0;  ///< biased exponent field
  uint64_t mantissa = 0;  ///< trailing significand field
  FloatClass klass = FloatClass::Zero;

  /// Unbiased exponent (meaningless for Infinite/NaN)
  int32_t unbiased_exponent = 0;
};

/**
 * Split a bit pattern into fields according to `format`.
 *
 * Only the low (1 + exponent_bits + mantissa_bits) bits of `bits` are read.
 */
[[nodiscard]] FloatFields decompose(uint64_t bits, const FloatFormat & format) noexcept;

[[nodiscard]] inline FloatFields decompose32(uint32_t bits) noexcept
{
  return decompose(bits, k_binary32_format);
}

[[nodiscard]] inline FloatFields decompose64(uint64_t bits) noexcept
{
  return decompose(bits, k_binary64_format);
}

}  // namespace numcast
