// numcast/value/numeric_kind.cpp - Numeric kind lookup
//
#include "numcast/value/numeric_kind.hpp"

namespace numcast
{

std::optional<NumericKind> lookup_numeric_kind(std::string_view name) noexcept
{
  for (const NumericKind k : k_all_numeric_kinds) {
    if (to_string(k) == name) {
      return k;
    }
  }
  return std::nullopt;
}

}  // namespace numcast
