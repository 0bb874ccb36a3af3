#pragma once
#include <loom/numeric/Arithmetic.hpp>

#include <cmath>

// IEEE-754 overloads of the numeric primitives. NaN propagates and signed zero is preserved.
// min/max/clamp come from Arithmetic.hpp: they are comparison based, so min(NaN, 5) == 5 but min(5, NaN) is NaN.
namespace LM::Numeric {

[[nodiscard]] inline auto add(float lhs, float rhs) -> float { return lhs + rhs; }
[[nodiscard]] inline auto add(double lhs, double rhs) -> double { return lhs + rhs; }
[[nodiscard]] inline auto sub(float lhs, float rhs) -> float { return lhs - rhs; }
[[nodiscard]] inline auto sub(double lhs, double rhs) -> double { return lhs - rhs; }
[[nodiscard]] inline auto mul(float lhs, float rhs) -> float { return lhs * rhs; }
[[nodiscard]] inline auto mul(double lhs, double rhs) -> double { return lhs * rhs; }
[[nodiscard]] inline auto div(float lhs, float rhs) -> float { return lhs / rhs; }
[[nodiscard]] inline auto div(double lhs, double rhs) -> double { return lhs / rhs; }
[[nodiscard]] inline auto neg(float value) -> float { return -value; }
[[nodiscard]] inline auto neg(double value) -> double { return -value; }
[[nodiscard]] inline auto abs(float value) -> float { return std::fabs(value); }
[[nodiscard]] inline auto abs(double value) -> double { return std::fabs(value); }
[[nodiscard]] inline auto pow(float base, float exponent) -> float { return std::pow(base, exponent); }
[[nodiscard]] inline auto pow(double base, double exponent) -> double { return std::pow(base, exponent); }

} // namespace LM::Numeric
