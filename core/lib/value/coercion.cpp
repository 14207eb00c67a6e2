// numcast/value/coercion.cpp - Boolean coercion
//
#include "numcast/value/coercion.hpp"

#include <cmath>
#include <type_traits>

namespace numcast
{

bool float_to_bool(double value) noexcept { return !(value == 0.0 || std::isnan(value)); }

bool float_to_bool(float value) noexcept { return !(value == 0.0F || std::isnan(value)); }

bool to_bool(const TypedNumeric & value) noexcept
{
  return std::visit(
    [](auto v) {
      using T = decltype(v);
      if constexpr (std::is_floating_point_v<T>) {
        return float_to_bool(v);
      } else {
        return v != T{0};
      }
    },
    value.storage());
}

}  // namespace numcast
