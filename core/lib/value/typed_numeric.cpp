// numcast/value/typed_numeric.cpp - TypedNumeric implementation
//
#include "numcast/value/typed_numeric.hpp"

#include <limits>
#include <type_traits>

#include "numcast/value/bit_reinterpret.hpp"

namespace numcast
{

namespace
{

template <typename T>
TypedNumeric make_typed(T v)
{
  if constexpr (std::is_same_v<T, int32_t>) {
    return TypedNumeric::make_i32(v);
  } else if constexpr (std::is_same_v<T, int64_t>) {
    return TypedNumeric::make_i64(v);
  } else if constexpr (std::is_same_v<T, uint8_t>) {
    return TypedNumeric::make_u8(v);
  } else if constexpr (std::is_same_v<T, uint32_t>) {
    return TypedNumeric::make_u32(v);
  } else if constexpr (std::is_same_v<T, uint64_t>) {
    return TypedNumeric::make_u64(v);
  } else if constexpr (std::is_same_v<T, float>) {
    return TypedNumeric::make_f32(v);
  } else {
    static_assert(std::is_same_v<T, double>, "unsupported payload type");
    return TypedNumeric::make_f64(v);
  }
}

/// Invoke `fn(T{})` with the payload type that corresponds to `kind`.
template <typename Fn>
TypedNumeric with_payload_type(NumericKind kind, Fn && fn)
{
  switch (kind) {
    case NumericKind::I32:
      return fn(int32_t{});
    case NumericKind::I64:
      return fn(int64_t{});
    case NumericKind::U8:
      return fn(uint8_t{});
    case NumericKind::U32:
      return fn(uint32_t{});
    case NumericKind::U64:
      return fn(uint64_t{});
    case NumericKind::F32:
      return fn(float{});
    case NumericKind::F64:
      return fn(double{});
  }
  return fn(int32_t{});
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

TypedNumeric TypedNumeric::from_integer(NumericKind kind, int64_t value) noexcept
{
  // Go through uint64_t so narrowing keeps the low bits without signed overflow.
  const auto bits = static_cast<uint64_t>(value);
  switch (kind) {
    case NumericKind::I32:
      return make_i32(static_cast<int32_t>(static_cast<uint32_t>(bits)));
    case NumericKind::I64:
      return make_i64(value);
    case NumericKind::U8:
      return make_u8(static_cast<uint8_t>(bits));
    case NumericKind::U32:
      return make_u32(static_cast<uint32_t>(bits));
    case NumericKind::U64:
      return make_u64(bits);
    case NumericKind::F32:
      return make_f32(static_cast<float>(value));
    case NumericKind::F64:
      return make_f64(static_cast<double>(value));
  }
  return make_i64(value);
}

TypedNumeric TypedNumeric::from_unsigned(NumericKind kind, uint64_t value) noexcept
{
  switch (kind) {
    case NumericKind::F32:
      return make_f32(static_cast<float>(value));
    case NumericKind::F64:
      return make_f64(static_cast<double>(value));
    default:
      break;
  }
  return from_integer(kind, static_cast<int64_t>(value));
}

TypedNumeric TypedNumeric::from_double(NumericKind kind, double value) noexcept
{
  if (kind == NumericKind::F32) {
    return make_f32(static_cast<float>(value));
  }
  return make_f64(value);
}

TypedNumeric TypedNumeric::max_value(NumericKind kind) noexcept
{
  return with_payload_type(kind, [](auto tag) {
    using T = decltype(tag);
    return make_typed<T>(std::numeric_limits<T>::max());
  });
}

TypedNumeric TypedNumeric::min_value(NumericKind kind) noexcept
{
  return with_payload_type(kind, [](auto tag) {
    using T = decltype(tag);
    if constexpr (std::is_floating_point_v<T>) {
      return make_typed<T>(std::numeric_limits<T>::denorm_min());
    } else {
      return make_typed<T>(std::numeric_limits<T>::lowest());
    }
  });
}

TypedNumeric TypedNumeric::min_normal_value(NumericKind kind) noexcept
{
  return with_payload_type(kind, [](auto tag) {
    using T = decltype(tag);
    if constexpr (std::is_floating_point_v<T>) {
      return make_typed<T>(std::numeric_limits<T>::min());
    } else {
      return make_typed<T>(T{1});
    }
  });
}

TypedNumeric TypedNumeric::epsilon(NumericKind kind) noexcept
{
  return with_payload_type(kind, [](auto tag) {
    using T = decltype(tag);
    return make_typed<T>(std::numeric_limits<T>::epsilon());
  });
}

// ============================================================================
// Unary Operations
// ============================================================================

TypedNumeric TypedNumeric::negate() const noexcept
{
  return std::visit(
    [](auto v) -> TypedNumeric {
      using T = decltype(v);
      if constexpr (std::is_same_v<T, float>) {
        return make_f32(reinterpret32(bits_of(v) ^ 0x80000000U));
      } else if constexpr (std::is_same_v<T, double>) {
        return make_f64(reinterpret64(bits_of(v) ^ 0x8000000000000000ULL));
      } else {
        using U = std::make_unsigned_t<T>;
        // Unsigned subtraction wraps; the cast back keeps the low bits.
        return make_typed<T>(static_cast<T>(static_cast<U>(U{0} - static_cast<U>(v))));
      }
    },
    storage_);
}

bool TypedNumeric::equals(const TypedNumeric & other) const noexcept
{
  if (kind() != other.kind()) {
    return false;
  }
  return std::visit(
    [&other](auto lhs) {
      using T = decltype(lhs);
      return lhs == std::get<T>(other.storage_);
    },
    storage_);
}

}  // namespace numcast
