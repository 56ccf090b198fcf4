#include <doctest/doctest.h>

#include <limits>
#include <stdexcept>

#include "uncertain/core/decimal.hpp"

using uncertain::core::decompose;
using uncertain::core::round_to_power;

TEST_CASE("decompose extracts leading digit exponent and shortest digits") {
  const auto mass = decompose(0.51099895);
  CHECK_FALSE(mass.negative);
  CHECK(mass.exponent == -1);
  CHECK(mass.count == 8);
  CHECK(mass.digits_between(-1, -8) == "51099895");

  const auto negative = decompose(-1500.0);
  CHECK(negative.negative);
  CHECK(negative.exponent == 3);
  CHECK(negative.count == 2);
  CHECK(negative.digits_between(3, 0) == "1500");

  const auto tiny = decompose(1.5e-10);
  CHECK(tiny.exponent == -10);
  CHECK(tiny.digits_between(-10, -11) == "15");
}

TEST_CASE("decompose handles signed zero and rejects non-finite values") {
  CHECK(decompose(0.0).is_zero());
  CHECK_FALSE(decompose(0.0).negative);
  CHECK(decompose(-0.0).is_zero());
  CHECK(decompose(-0.0).negative);

  CHECK_THROWS_AS(decompose(std::numeric_limits<double>::infinity()), std::domain_error);
  CHECK_THROWS_AS(decompose(std::numeric_limits<double>::quiet_NaN()), std::domain_error);
}

TEST_CASE("digit_at pads outside the stored digits") {
  const auto value = decompose(1.5);
  CHECK(value.digit_at(1) == '0');
  CHECK(value.digit_at(0) == '1');
  CHECK(value.digit_at(-1) == '5');
  CHECK(value.digit_at(-3) == '0');
}

TEST_CASE("round_to_power carries past the leading digit") {
  const auto rounded = round_to_power(decompose(9.9996), -2);
  CHECK(rounded.exponent == 1);
  CHECK(rounded.count == 1);
  CHECK(rounded.digits_between(1, -1) == "100");
}

TEST_CASE("round_to_power breaks exact ties to even") {
  CHECK(round_to_power(decompose(0.125), -2).digits_between(-1, -2) == "12");
  CHECK(round_to_power(decompose(0.135), -2).digits_between(-1, -2) == "14");
  CHECK(round_to_power(decompose(2.5), 0).digits_between(0, 0) == "2");
  CHECK(round_to_power(decompose(0.1251), -2).digits_between(-1, -2) == "13");
}

TEST_CASE("round_to_power handles values around a single grid unit") {
  const auto above_half = round_to_power(decompose(0.0006), -3);
  CHECK(above_half.exponent == -3);
  CHECK(above_half.digits_between(-3, -3) == "1");

  CHECK(round_to_power(decompose(0.0005), -3).is_zero());
  CHECK_FALSE(round_to_power(decompose(0.00051), -3).is_zero());
  CHECK(round_to_power(decompose(0.00009), -3).is_zero());
}

TEST_CASE("round_to_power leaves short values untouched") {
  const auto value = round_to_power(decompose(1.5), -5);
  CHECK(value.exponent == 0);
  CHECK(value.count == 2);
  CHECK(round_to_power(decompose(0.0), 3).is_zero());
}

TEST_CASE("shortest and fixed representations") {
  CHECK(uncertain::core::shortest_repr(1.0) == "1");
  CHECK(uncertain::core::shortest_repr(10.0) == "10");
  CHECK(uncertain::core::shortest_repr(0.1) == "0.1");
  CHECK(uncertain::core::shortest_repr(1e-20) == "1e-20");
  CHECK(uncertain::core::shortest_repr(-2.5) == "-2.5");

  CHECK(uncertain::core::fixed_repr(2.5, 2) == "2.50");
  CHECK(uncertain::core::fixed_repr(-1.0, 0) == "-1");
  CHECK_THROWS_AS(uncertain::core::fixed_repr(1.0, -1), std::invalid_argument);
}
