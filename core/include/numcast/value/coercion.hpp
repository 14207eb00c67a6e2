// numcast/value/coercion.hpp - Boolean coercion of typed numeric values
#pragma once

#include "numcast/value/typed_numeric.hpp"

namespace numcast
{

/**
 * Truth value of a numeric value, as produced by a `<bool>` cast.
 *
 * - Integers: `v != 0`. The sign does not matter, so INT32_MIN is true.
 * - Floats: `!(v == 0.0 || isnan(v))`. Both zeros and every NaN are false;
 *   every other value, including both infinities and subnormals, is true.
 *
 * Float checks use IEEE comparison rather than bit equality so that -0.0
 * collapses to zero.
 */
[[nodiscard]] bool to_bool(const TypedNumeric & value) noexcept;

/// Float rule on its own, for callers holding a bare float
[[nodiscard]] bool float_to_bool(double value) noexcept;

/// binary32 overload; no widening before the test
[[nodiscard]] bool float_to_bool(float value) noexcept;

}  // namespace numcast
