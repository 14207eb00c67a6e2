// numcast/eval/script_value.cpp - ScriptValue rendering
#include "numcast/eval/script_value.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <limits>

#include "numcast/value/coercion.hpp"
#include "numcast/value/value_format.hpp"

namespace numcast
{

std::string ScriptValue::describe() const
{
  switch (kind_) {
    case ScriptValueKind::UntypedInt:
      if (unsigned_magnitude_) {
        return fmt::format("{}", static_cast<uint64_t>(int_value_));
      }
      return fmt::format("{}", int_value_);
    case ScriptValueKind::UntypedFloat:
      return format_payload(TypedNumeric::make_f64(float_value_));
    case ScriptValueKind::Bool:
      return bool_value_ ? "true" : "false";
    case ScriptValueKind::Typed:
      return format_typed(*typed_value_);
    case ScriptValueKind::Error:
      break;
  }
  return "<error>";
}

std::optional<bool> ScriptValue::truthiness() const noexcept
{
  switch (kind_) {
    case ScriptValueKind::UntypedInt: {
      constexpr int64_t lo = std::numeric_limits<int32_t>::min();
      constexpr int64_t hi = std::numeric_limits<int32_t>::max();
      if (int_value_ >= lo && int_value_ <= hi) {
        return to_bool(TypedNumeric::make_i32(static_cast<int32_t>(int_value_)));
      }
      return to_bool(TypedNumeric::make_i64(int_value_));
    }
    case ScriptValueKind::UntypedFloat:
      return to_bool(TypedNumeric::make_f64(float_value_));
    case ScriptValueKind::Bool:
      return bool_value_;
    case ScriptValueKind::Typed:
      return to_bool(*typed_value_);
    case ScriptValueKind::Error:
      break;
  }
  return std::nullopt;
}

}  // namespace numcast
