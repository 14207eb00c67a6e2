// numcast/value/typed_numeric.hpp - Width-tagged numeric value
//
// A TypedNumeric pairs a NumericKind with a payload in that kind's native
// representation. There is no implicit widening: an f32 stays a float and a
// u8 stays a uint8_t for the lifetime of the value.
//
#pragma once

#include <cstdint>
#include <variant>

#include "numcast/value/numeric_kind.hpp"

namespace numcast
{

/**
 * Immutable numeric value tagged with its concrete type.
 *
 * Storage is a closed std::variant whose alternative index is the
 * NumericKind, so every operation over the payload is an exhaustive
 * std::visit.
 *
 * @code
 *   const auto v = TypedNumeric::make_f32(std::numeric_limits<float>::max());
 *   const auto n = v.negate();   // f32, sign bit flipped
 * @endcode
 */
class TypedNumeric
{
public:
  using Storage = std::variant<int32_t, int64_t, uint8_t, uint32_t, uint64_t, float, double>;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static TypedNumeric make_i32(int32_t v)
  {
    return TypedNumeric(Storage(std::in_place_index<0>, v));
  }

  static TypedNumeric make_i64(int64_t v)
  {
    return TypedNumeric(Storage(std::in_place_index<1>, v));
  }

  static TypedNumeric make_u8(uint8_t v)
  {
    return TypedNumeric(Storage(std::in_place_index<2>, v));
  }

  static TypedNumeric make_u32(uint32_t v)
  {
    return TypedNumeric(Storage(std::in_place_index<3>, v));
  }

  static TypedNumeric make_u64(uint64_t v)
  {
    return TypedNumeric(Storage(std::in_place_index<4>, v));
  }

  static TypedNumeric make_f32(float v)
  {
    return TypedNumeric(Storage(std::in_place_index<5>, v));
  }

  static TypedNumeric make_f64(double v)
  {
    return TypedNumeric(Storage(std::in_place_index<6>, v));
  }

  /**
   * Build a value of `kind` from a 64-bit two's complement integer.
   *
   * Integer kinds keep the low bit_width(kind) bits (wrapping, like a
   * truncating cast); float kinds convert the signed value numerically.
   */
  static TypedNumeric from_integer(NumericKind kind, int64_t value) noexcept;

  /// As from_integer, but float kinds convert the unsigned value of `value`
  static TypedNumeric from_unsigned(NumericKind kind, uint64_t value) noexcept;

  /**
   * Build a float value of `kind` from a double.
   *
   * @pre is_float_kind(kind)
   */
  static TypedNumeric from_double(NumericKind kind, double value) noexcept;

  /// Largest finite value of `kind`
  static TypedNumeric max_value(NumericKind kind) noexcept;

  /**
   * MIN_VALUE of `kind`.
   *
   * For integers this is the lowest representable value. For floats it is
   * the smallest positive subnormal (denorm_min), which is nonzero.
   */
  static TypedNumeric min_value(NumericKind kind) noexcept;

  /// Smallest positive normal value (floats only)
  static TypedNumeric min_normal_value(NumericKind kind) noexcept;

  /// Machine epsilon (floats only)
  static TypedNumeric epsilon(NumericKind kind) noexcept;

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] NumericKind kind() const noexcept
  {
    return static_cast<NumericKind>(storage_.index());
  }

  [[nodiscard]] bool is_float() const noexcept { return is_float_kind(kind()); }
  [[nodiscard]] bool is_integer() const noexcept { return is_integer_kind(kind()); }

  [[nodiscard]] const Storage & storage() const noexcept { return storage_; }

  /// Typed payload access; T must match kind()
  template <typename T>
  [[nodiscard]] T as() const
  {
    return std::get<T>(storage_);
  }

  // ===========================================================================
  // Unary Operations
  // ===========================================================================

  /**
   * Unary minus in this value's own type.
   *
   * Floats flip the sign bit only (magnitude and NaN-ness are kept, so
   * -MAX_VALUE and -MIN_VALUE stay finite and nonzero). Integers use
   * two's complement wrapping in their own width.
   */
  [[nodiscard]] TypedNumeric negate() const noexcept;

  /// Unary plus (identity)
  [[nodiscard]] TypedNumeric plus() const noexcept { return *this; }

  /**
   * IEEE/integer equality between two values of the same kind.
   *
   * Values of different kinds never compare equal. +0.0 == -0.0 and
   * NaN != NaN follow the float comparison rules.
   */
  [[nodiscard]] bool equals(const TypedNumeric & other) const noexcept;

private:
  explicit TypedNumeric(Storage s) : storage_(s) {}

  Storage storage_;
};

}  // namespace numcast
