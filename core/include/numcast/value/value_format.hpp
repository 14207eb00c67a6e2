// numcast/value/value_format.hpp - Human-readable rendering of numeric values
//
// Used by diagnostics, the CLI and JSON reports.
//
#pragma once

#include <string>

#include "numcast/value/typed_numeric.hpp"

namespace numcast
{

/**
 * Render the payload of a value without its type.
 *
 * Floats print as "NaN", "-NaN", "Infinity", "-Infinity", "-0.0" or the
 * shortest round-tripping decimal; integers print in decimal.
 */
[[nodiscard]] std::string format_payload(const TypedNumeric & value);

/// "<kind> <payload>", e.g. "f32 -Infinity"
[[nodiscard]] std::string format_typed(const TypedNumeric & value);

/**
 * Hex bit pattern of the payload, zero-padded to the kind's width.
 *
 * Integers print their two's complement bits, e.g. "0xffffffff" for i32 -1.
 */
[[nodiscard]] std::string format_bits(const TypedNumeric & value);

}  // namespace numcast
