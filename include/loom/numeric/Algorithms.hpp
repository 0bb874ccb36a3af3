#pragma once
#include <cstdint>

namespace LM::Numeric {

// Iterative Fibonacci; wraps on overflow (fib(47) does not fit in 32 bits).
[[nodiscard]] auto fib(std::int32_t n) -> std::int32_t;
[[nodiscard]] auto fib(std::int64_t n) -> std::int64_t;

// n! with wrapping multiplication. Non-positive n yields 1.
[[nodiscard]] auto factorial(std::int32_t n) -> std::int32_t;
[[nodiscard]] auto factorial(std::int64_t n) -> std::int64_t;

// Greatest common divisor of |a| and |b|; gcd(0, 0) == 0.
[[nodiscard]] auto gcd(std::int32_t a, std::int32_t b) -> std::int32_t;
[[nodiscard]] auto gcd(std::int64_t a, std::int64_t b) -> std::int64_t;

// value raised to itself.
[[nodiscard]] auto self_pow(std::int32_t value) -> std::int32_t;
[[nodiscard]] auto self_pow(std::int64_t value) -> std::int64_t;
[[nodiscard]] auto self_pow(float value) -> float;
[[nodiscard]] auto self_pow(double value) -> double;

} // namespace LM::Numeric
