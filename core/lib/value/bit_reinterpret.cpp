// numcast/value/bit_reinterpret.cpp - Bit pattern reinterpretation
//
// Bytes are copied with memcpy. No value conversion takes place.
//
#include "numcast/value/bit_reinterpret.hpp"

#include <cstring>

namespace numcast
{

float reinterpret32(uint32_t bits) noexcept
{
  float out = 0.0F;
  std::memcpy(&out, &bits, sizeof(out));
  return out;
}

double reinterpret64(uint64_t bits) noexcept
{
  double out = 0.0;
  std::memcpy(&out, &bits, sizeof(out));
  return out;
}

uint32_t bits_of(float value) noexcept
{
  uint32_t out = 0;
  std::memcpy(&out, &value, sizeof(out));
  return out;
}

uint64_t bits_of(double value) noexcept
{
  uint64_t out = 0;
  std::memcpy(&out, &value, sizeof(out));
  return out;
}

FloatFields decompose(uint64_t bits, const FloatFormat & format) noexcept
{
  FloatFields f;
  const uint32_t sign_shift = format.exponent_bits + format.mantissa_bits;
  f.negative = ((bits >> sign_shift) & 1U) != 0;
  f.exponent = static_cast<uint32_t>((bits >> format.mantissa_bits) & format.exponent_mask());
  f.mantissa = bits & format.mantissa_mask();

  if (f.exponent == format.exponent_mask()) {
    f.klass = (f.mantissa == 0) ? FloatClass::Infinite : FloatClass::NaN;
    return f;
  }

  if (f.exponent == 0) {
    f.klass = (f.mantissa == 0) ? FloatClass::Zero : FloatClass::Subnormal;
    // Subnormals share the exponent of the smallest normal.
    f.unbiased_exponent = 1 - format.exponent_bias;
    return f;
  }

  f.klass = FloatClass::Normal;
  f.unbiased_exponent = static_cast<int32_t>(f.exponent) - format.exponent_bias;
  return f;
}

}  // namespace numcast
