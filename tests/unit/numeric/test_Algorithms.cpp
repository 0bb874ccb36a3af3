#include <loom/numeric/Algorithms.hpp>

#include <doctest/doctest.h>

#include <cstdint>

using namespace LM::Numeric;

TEST_SUITE("numeric.algorithms") {
    TEST_CASE("Fibonacci") {
        CHECK(fib(std::int32_t{0}) == 0);
        CHECK(fib(std::int32_t{1}) == 1);
        CHECK(fib(std::int32_t{2}) == 1);
        CHECK(fib(std::int32_t{7}) == 13);
        CHECK(fib(std::int32_t{20}) == 6765);
        CHECK(fib(std::int32_t{46}) == 1836311903);
        // fib(47) = 2971215073 does not fit and wraps.
        CHECK(fib(std::int32_t{47}) == -1323752223);

        CHECK(fib(std::int64_t{50}) == std::int64_t{12586269025});
        CHECK(fib(std::int64_t{90}) == std::int64_t{2880067194370816120});
    }

    TEST_CASE("Factorial wraps on overflow") {
        CHECK(factorial(std::int32_t{0}) == 1);
        CHECK(factorial(std::int32_t{5}) == 120);
        CHECK(factorial(std::int32_t{12}) == 479001600);
        CHECK(factorial(std::int32_t{13}) == 1932053504);

        CHECK(factorial(std::int64_t{20}) == std::int64_t{2432902008176640000});
        CHECK(factorial(std::int64_t{21}) == std::int64_t{-4249290049419214848});
    }

    TEST_CASE("Greatest common divisor is non-negative") {
        CHECK(gcd(std::int32_t{12}, std::int32_t{8}) == 4);
        CHECK(gcd(std::int32_t{8}, std::int32_t{12}) == 4);
        CHECK(gcd(std::int32_t{7}, std::int32_t{13}) == 1);
        CHECK(gcd(std::int32_t{0}, std::int32_t{5}) == 5);
        CHECK(gcd(std::int32_t{5}, std::int32_t{0}) == 5);
        CHECK(gcd(std::int32_t{-12}, std::int32_t{8}) == 4);
        CHECK(gcd(std::int32_t{12}, std::int32_t{-8}) == 4);
        CHECK(gcd(std::int32_t{-12}, std::int32_t{-8}) == 4);
        CHECK(gcd(std::int32_t{1071}, std::int32_t{462}) == 21);
        CHECK(gcd(std::int64_t{0}, std::int64_t{0}) == 0);
    }

    TEST_CASE("Self power") {
        CHECK(self_pow(std::int32_t{1}) == 1);
        CHECK(self_pow(std::int32_t{2}) == 4);
        CHECK(self_pow(std::int32_t{3}) == 27);
        CHECK(self_pow(std::int64_t{3}) == 27);
        CHECK(self_pow(3.3) == doctest::Approx(51.4157294));
        CHECK(self_pow(1.0) == doctest::Approx(1.0));
        CHECK(self_pow(2.0f) == doctest::Approx(4.0f));
    }
}
