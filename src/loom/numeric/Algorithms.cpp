#include <loom/numeric/Algorithms.hpp>
#include <loom/numeric/Float.hpp>

#include <type_traits>

namespace LM::Numeric {

namespace {

template <typename T>
auto fib_impl(T n) -> T {
    T previous = 0;
    T current  = 1;
    for (T i = 0; i < n; ++i) {
        T next   = add(previous, current);
        previous = current;
        current  = next;
    }
    return previous;
}

template <typename T>
auto factorial_impl(T n) -> T {
    T result = 1;
    for (T i = 2; i <= n; ++i) {
        result = mul(result, i);
    }
    return result;
}

template <typename T>
auto gcd_impl(T a, T b) -> T {
    using U = std::make_unsigned_t<T>;
    auto magnitude = [](T value) -> U {
        return value < 0 ? static_cast<U>(U{0} - static_cast<U>(value)) : static_cast<U>(value);
    };
    U x = magnitude(a);
    U y = magnitude(b);
    while (y != 0) {
        U r = x % y;
        x   = y;
        y   = r;
    }
    return static_cast<T>(x);
}

} // namespace

auto fib(std::int32_t n) -> std::int32_t {
    return fib_impl(n);
}

auto fib(std::int64_t n) -> std::int64_t {
    return fib_impl(n);
}

auto factorial(std::int32_t n) -> std::int32_t {
    return factorial_impl(n);
}

auto factorial(std::int64_t n) -> std::int64_t {
    return factorial_impl(n);
}

auto gcd(std::int32_t a, std::int32_t b) -> std::int32_t {
    return gcd_impl(a, b);
}

auto gcd(std::int64_t a, std::int64_t b) -> std::int64_t {
    return gcd_impl(a, b);
}

auto self_pow(std::int32_t value) -> std::int32_t {
    return pow(value, value);
}

auto self_pow(std::int64_t value) -> std::int64_t {
    return pow(value, value);
}

auto self_pow(float value) -> float {
    return pow(value, value);
}

auto self_pow(double value) -> double {
    return pow(value, value);
}

} // namespace LM::Numeric
