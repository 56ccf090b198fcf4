#include <doctest/doctest.h>

#include <string>
#include <variant>

#include "uncertain/api/errors.hpp"
#include "uncertain/api/options.hpp"
#include "uncertain/format/formatter.hpp"

TEST_CASE("default options resolve to two uncertainty digits with a forced sign") {
  const auto resolved = uncertain::resolve_options(uncertain::FormatOptions{});

  REQUIRE(std::holds_alternative<uncertain::SignificantUncertainty>(resolved.mode));
  CHECK(std::get<uncertain::SignificantUncertainty>(resolved.mode).digits == 2);
  CHECK(resolved.exponent_style == uncertain::ExponentStyle::CaretTen);
  CHECK(resolved.force_sign);
}

TEST_CASE("any explicit option drops the implicit sign") {
  CHECK_FALSE(uncertain::resolve_options({.uncertainty_digits = 1u}).force_sign);
  CHECK_FALSE(uncertain::resolve_options({.precision = 3u}).force_sign);
  CHECK_FALSE(uncertain::resolve_options({.exponent_style = uncertain::ExponentStyle::ENotation}).force_sign);
  CHECK(uncertain::resolve_options({.uncertainty_digits = 3u, .force_sign = true}).force_sign);
  CHECK_FALSE(uncertain::resolve_options({.force_sign = false}).force_sign);
}

TEST_CASE("precision selects the fixed-precision display mode") {
  const auto resolved = uncertain::resolve_options({.precision = 0u});
  REQUIRE(std::holds_alternative<uncertain::FixedPrecision>(resolved.mode));
  CHECK(std::get<uncertain::FixedPrecision>(resolved.mode).digits == 0);
}

TEST_CASE("validation collects fatal and advisory issues") {
  const auto conflicting = uncertain::validate_options({.precision = 3u, .uncertainty_digits = 2u});
  REQUIRE(conflicting.size() == 1);
  CHECK(conflicting[0].fatal);
  CHECK(conflicting[0].message.find("mutually exclusive") != std::string::npos);

  const auto zero_digits = uncertain::validate_options({.uncertainty_digits = 0u});
  REQUIRE(zero_digits.size() == 1);
  CHECK(zero_digits[0].fatal);

  const auto wide = uncertain::validate_options({.uncertainty_digits = 30u});
  REQUIRE(wide.size() == 1);
  CHECK_FALSE(wide[0].fatal);
  CHECK_NOTHROW(uncertain::throw_if_invalid({.uncertainty_digits = 30u}));

  CHECK(uncertain::validate_options(uncertain::FormatOptions{}).empty());
}

TEST_CASE("digit counts are capped past the subnormal range") {
  CHECK(uncertain::validate_options({.precision = uncertain::kMaxDisplayDigits}).empty());

  const auto wide_precision = uncertain::validate_options({.precision = uncertain::kMaxDisplayDigits + 1});
  REQUIRE(wide_precision.size() == 1);
  CHECK(wide_precision[0].fatal);

  const auto wide_digits = uncertain::validate_options({.uncertainty_digits = uncertain::kMaxDisplayDigits + 1});
  REQUIRE(wide_digits.size() == 1);
  CHECK(wide_digits[0].fatal);

  CHECK_THROWS_AS(uncertain::format(1e-5, 1e-7, {.precision = 2147483647u}), uncertain::ConfigurationError);
  CHECK_THROWS_AS(uncertain::format(1e-5, 1e-7, {.uncertainty_digits = 4294967295u}), uncertain::ConfigurationError);
  CHECK_THROWS_AS(uncertain::format(1e-5, 1e-7, uncertain::parse_format_spec("u2000")),
                  uncertain::ConfigurationError);

  const std::string padded = uncertain::format(1.0, 0.0, {.precision = uncertain::kMaxDisplayDigits});
  CHECK(padded.size() == 2 + uncertain::kMaxDisplayDigits);
  CHECK(padded.starts_with("1.000"));
}

TEST_CASE("conflicting options are reported, never resolved by precedence") {
  CHECK_THROWS_AS(uncertain::throw_if_invalid({.precision = 1u, .uncertainty_digits = 1u}),
                  uncertain::ConfigurationError);
  CHECK_THROWS_AS(uncertain::resolve_options({.precision = 1u, .uncertainty_digits = 1u}),
                  uncertain::ConfigurationError);
  CHECK_THROWS_AS(uncertain::resolve_options({.uncertainty_digits = 0u}), uncertain::ConfigurationError);
}

TEST_CASE("format spec mini-language") {
  const auto empty = uncertain::parse_format_spec("");
  CHECK_FALSE(empty.precision.has_value());
  CHECK_FALSE(empty.uncertainty_digits.has_value());
  CHECK_FALSE(empty.force_sign.has_value());

  const auto signed_e = uncertain::parse_format_spec("+eu3");
  CHECK(signed_e.force_sign == true);
  CHECK(signed_e.exponent_style == uncertain::ExponentStyle::ENotation);
  CHECK(signed_e.uncertainty_digits == 3u);
  CHECK_FALSE(signed_e.precision.has_value());

  const auto fixed = uncertain::parse_format_spec(".3");
  CHECK(fixed.precision == 3u);
  CHECK(fixed.force_sign == false);

  const auto both = uncertain::parse_format_spec(".3u2");
  CHECK(both.precision == 3u);
  CHECK(both.uncertainty_digits == 2u);
  CHECK_THROWS_AS(uncertain::throw_if_invalid(both), uncertain::ConfigurationError);
}

TEST_CASE("format spec mini-language rejects malformed specs") {
  CHECK_THROWS_AS(uncertain::parse_format_spec("u"), uncertain::ConfigurationError);
  CHECK_THROWS_AS(uncertain::parse_format_spec("."), uncertain::ConfigurationError);
  CHECK_THROWS_AS(uncertain::parse_format_spec("f"), uncertain::ConfigurationError);
  CHECK_THROWS_AS(uncertain::parse_format_spec("u99999999999999999999"), uncertain::ConfigurationError);
}
