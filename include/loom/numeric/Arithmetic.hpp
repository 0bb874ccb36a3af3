#pragma once
#include <cassert>
#include <cstdint>
#include <limits>
#include <type_traits>

// Fixed-width integer primitives with two's-complement wrapping on overflow.
// Division and modulo round toward negative infinity; modulo takes the sign of the divisor.
namespace LM::Numeric {

namespace detail {

template <typename T>
using Unsigned = std::make_unsigned_t<T>;

template <typename T>
constexpr auto check_signed() -> void {
    static_assert(std::is_integral_v<T> && std::is_signed_v<T>, "wrapping arithmetic requires a signed integral type");
}

} // namespace detail

template <typename T>
[[nodiscard]] constexpr auto add(T lhs, T rhs) -> T {
    detail::check_signed<T>();
    return static_cast<T>(static_cast<detail::Unsigned<T>>(lhs) + static_cast<detail::Unsigned<T>>(rhs));
}

template <typename T>
[[nodiscard]] constexpr auto sub(T lhs, T rhs) -> T {
    detail::check_signed<T>();
    return static_cast<T>(static_cast<detail::Unsigned<T>>(lhs) - static_cast<detail::Unsigned<T>>(rhs));
}

template <typename T>
[[nodiscard]] constexpr auto mul(T lhs, T rhs) -> T {
    detail::check_signed<T>();
    return static_cast<T>(static_cast<detail::Unsigned<T>>(lhs) * static_cast<detail::Unsigned<T>>(rhs));
}

template <typename T>
[[nodiscard]] constexpr auto neg(T value) -> T {
    detail::check_signed<T>();
    return static_cast<T>(detail::Unsigned<T>{0} - static_cast<detail::Unsigned<T>>(value));
}

template <typename T>
[[nodiscard]] constexpr auto abs(T value) -> T {
    return value < 0 ? neg(value) : value;
}

template <typename T>
[[nodiscard]] constexpr auto div(T lhs, T rhs) -> T {
    detail::check_signed<T>();
    assert(rhs != 0 && "integer division by zero");
    if (rhs == -1) {
        return neg(lhs);
    }
    T quotient = static_cast<T>(lhs / rhs);
    if ((lhs % rhs != 0) && ((lhs < 0) != (rhs < 0))) {
        --quotient;
    }
    return quotient;
}

template <typename T>
[[nodiscard]] constexpr auto mod(T lhs, T rhs) -> T {
    detail::check_signed<T>();
    assert(rhs != 0 && "integer modulo by zero");
    if (rhs == -1) {
        return 0;
    }
    T remainder = static_cast<T>(lhs % rhs);
    if (remainder != 0 && ((remainder < 0) != (rhs < 0))) {
        remainder = static_cast<T>(remainder + rhs);
    }
    return remainder;
}

template <typename T>
[[nodiscard]] constexpr auto min(T lhs, T rhs) -> T {
    return lhs < rhs ? lhs : rhs;
}

template <typename T>
[[nodiscard]] constexpr auto max(T lhs, T rhs) -> T {
    return lhs > rhs ? lhs : rhs;
}

template <typename T>
[[nodiscard]] constexpr auto clamp(T value, T low, T high) -> T {
    return min(max(value, low), high);
}

template <typename T>
[[nodiscard]] constexpr auto identity(T value) -> T {
    return value;
}

template <typename T>
[[nodiscard]] constexpr auto bit_and(T lhs, T rhs) -> T {
    return static_cast<T>(lhs & rhs);
}

template <typename T>
[[nodiscard]] constexpr auto bit_or(T lhs, T rhs) -> T {
    return static_cast<T>(lhs | rhs);
}

template <typename T>
[[nodiscard]] constexpr auto bit_xor(T lhs, T rhs) -> T {
    return static_cast<T>(lhs ^ rhs);
}

template <typename T>
[[nodiscard]] constexpr auto bit_not(T value) -> T {
    return static_cast<T>(~value);
}

// Shift counts are masked to the operand width.
template <typename T>
[[nodiscard]] constexpr auto shl(T value, T count) -> T {
    detail::check_signed<T>();
    constexpr auto mask = static_cast<detail::Unsigned<T>>(std::numeric_limits<detail::Unsigned<T>>::digits - 1);
    auto const     bits = static_cast<detail::Unsigned<T>>(count) & mask;
    return static_cast<T>(static_cast<detail::Unsigned<T>>(value) << bits);
}

// Arithmetic (sign-propagating) right shift.
template <typename T>
[[nodiscard]] constexpr auto shr(T value, T count) -> T {
    detail::check_signed<T>();
    constexpr auto mask = static_cast<detail::Unsigned<T>>(std::numeric_limits<detail::Unsigned<T>>::digits - 1);
    auto const     bits = static_cast<detail::Unsigned<T>>(count) & mask;
    return static_cast<T>(value >> bits);
}

// Exponentiation by squaring with wrapping multiplication.
// Negative exponents truncate toward zero: 0 unless the base is 1 or -1.
template <typename T>
[[nodiscard]] constexpr auto pow(T base, T exponent) -> T {
    detail::check_signed<T>();
    if (exponent < 0) {
        if (base == 1) {
            return 1;
        }
        if (base == -1) {
            return (exponent & 1) ? T{-1} : T{1};
        }
        return 0;
    }
    T    result = 1;
    auto e      = static_cast<detail::Unsigned<T>>(exponent);
    while (e != 0) {
        if (e & 1u) {
            result = mul(result, base);
        }
        e >>= 1;
        if (e != 0) {
            base = mul(base, base);
        }
    }
    return result;
}

template <typename T>
[[nodiscard]] constexpr auto eq(T lhs, T rhs) -> bool { return lhs == rhs; }
template <typename T>
[[nodiscard]] constexpr auto ne(T lhs, T rhs) -> bool { return lhs != rhs; }
template <typename T>
[[nodiscard]] constexpr auto lt(T lhs, T rhs) -> bool { return lhs < rhs; }
template <typename T>
[[nodiscard]] constexpr auto le(T lhs, T rhs) -> bool { return lhs <= rhs; }
template <typename T>
[[nodiscard]] constexpr auto gt(T lhs, T rhs) -> bool { return lhs > rhs; }
template <typename T>
[[nodiscard]] constexpr auto ge(T lhs, T rhs) -> bool { return lhs >= rhs; }

[[nodiscard]] constexpr auto bool_and(bool lhs, bool rhs) -> bool { return lhs && rhs; }
[[nodiscard]] constexpr auto bool_or(bool lhs, bool rhs) -> bool { return lhs || rhs; }
[[nodiscard]] constexpr auto bool_not(bool value) -> bool { return !value; }

} // namespace LM::Numeric
