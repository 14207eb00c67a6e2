// numcast/eval/script_value.hpp - Value of a script expression
//
// Literals stay untyped until a cast or a coercion gives them a NumericKind.
//
#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include "numcast/value/typed_numeric.hpp"

namespace numcast
{

enum class ScriptValueKind : uint8_t {
  UntypedInt,    ///< 64-bit two's complement, wraps on overflow
  UntypedFloat,  ///< binary64
  Bool,
  Typed,  ///< TypedNumeric
  Error,  ///< Evaluation error (recovery placeholder)
};

class ScriptValue
{
public:
  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static ScriptValue make_untyped_int(int64_t value)
  {
    ScriptValue v;
    v.kind_ = ScriptValueKind::UntypedInt;
    v.int_value_ = value;
    return v;
  }

  /// Integer constant read as unsigned; values above INT64_MAX keep their magnitude
  static ScriptValue make_untyped_uint(uint64_t value)
  {
    ScriptValue v = make_untyped_int(static_cast<int64_t>(value));
    v.unsigned_magnitude_ = value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    return v;
  }

  static ScriptValue make_untyped_float(double value)
  {
    ScriptValue v;
    v.kind_ = ScriptValueKind::UntypedFloat;
    v.float_value_ = value;
    return v;
  }

  static ScriptValue make_bool(bool value)
  {
    ScriptValue v;
    v.kind_ = ScriptValueKind::Bool;
    v.bool_value_ = value;
    return v;
  }

  static ScriptValue make_typed(TypedNumeric value)
  {
    ScriptValue v;
    v.kind_ = ScriptValueKind::Typed;
    v.typed_value_ = value;
    return v;
  }

  static ScriptValue make_error() { return ScriptValue{}; }

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ScriptValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_error() const noexcept { return kind_ == ScriptValueKind::Error; }
  [[nodiscard]] bool is_untyped_int() const noexcept
  {
    return kind_ == ScriptValueKind::UntypedInt;
  }
  [[nodiscard]] bool is_untyped_float() const noexcept
  {
    return kind_ == ScriptValueKind::UntypedFloat;
  }
  [[nodiscard]] bool is_bool() const noexcept { return kind_ == ScriptValueKind::Bool; }
  [[nodiscard]] bool is_typed() const noexcept { return kind_ == ScriptValueKind::Typed; }

  // ===========================================================================
  // Value Access
  // ===========================================================================

  [[nodiscard]] int64_t as_untyped_int() const noexcept { return int_value_; }

  /// Untyped integer whose value is the unsigned reading of its bits (above INT64_MAX)
  [[nodiscard]] bool is_unsigned_magnitude() const noexcept { return unsigned_magnitude_; }

  [[nodiscard]] double as_untyped_float() const noexcept { return float_value_; }
  [[nodiscard]] bool as_bool() const noexcept { return bool_value_; }

  /// @pre is_typed()
  [[nodiscard]] const TypedNumeric & as_typed() const { return *typed_value_; }

  /**
   * Short rendering for diagnostics and `numcast eval`.
   *
   * Untyped constants print bare ("2139095040", "NaN"); typed values carry
   * their kind ("f32 -0.0").
   */
  [[nodiscard]] std::string describe() const;

  /**
   * Result of `<bool>` applied to this value.
   *
   * Untyped integers coerce as i32 when they fit and as i64 otherwise;
   * untyped floats coerce as f64. nullopt for Error.
   */
  [[nodiscard]] std::optional<bool> truthiness() const noexcept;

private:
  ScriptValue() = default;

  ScriptValueKind kind_ = ScriptValueKind::Error;
  int64_t int_value_ = 0;
  bool unsigned_magnitude_ = false;
  double float_value_ = 0.0;
  bool bool_value_ = false;
  std::optional<TypedNumeric> typed_value_;
};

}  // namespace numcast
