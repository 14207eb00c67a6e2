// numcast/value/value_format.cpp - Value rendering
//
#include "numcast/value/value_format.hpp"

#include <fmt/format.h>

#include <cmath>
#include <type_traits>

#include "numcast/value/bit_reinterpret.hpp"

namespace numcast
{

namespace
{

template <typename T>
std::string format_float(T v)
{
  if (std::isnan(v)) {
    return std::signbit(v) ? "-NaN" : "NaN";
  }
  if (std::isinf(v)) {
    return std::signbit(v) ? "-Infinity" : "Infinity";
  }

  std::string out = fmt::format("{}", v);
  // Keep floats visually distinct from integers ("2.0", "-0.0").
  if (out.find_first_of(".e") == std::string::npos) {
    out += ".0";
  }
  return out;
}

}  // namespace

std::string format_payload(const TypedNumeric & value)
{
  return std::visit(
    [](auto v) -> std::string {
      using T = decltype(v);
      if constexpr (std::is_floating_point_v<T>) {
        return format_float(v);
      } else if constexpr (std::is_same_v<T, uint8_t>) {
        // uint8_t would otherwise print as a character
        return fmt::format("{}", static_cast<unsigned>(v));
      } else {
        return fmt::format("{}", v);
      }
    },
    value.storage());
}

std::string format_typed(const TypedNumeric & value)
{
  return fmt::format("{} {}", to_string(value.kind()), format_payload(value));
}

std::string format_bits(const TypedNumeric & value)
{
  const int width = 2 + static_cast<int>(bit_width(value.kind()) / 4);
  return std::visit(
    [width](auto v) -> std::string {
      using T = decltype(v);
      if constexpr (std::is_floating_point_v<T>) {
        return fmt::format("{:#0{}x}", bits_of(v), width);
      } else {
        using U = std::make_unsigned_t<T>;
        return fmt::format("{:#0{}x}", static_cast<uint64_t>(static_cast<U>(v)), width);
      }
    },
    value.storage());
}

}  // namespace numcast
