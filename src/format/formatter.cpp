#include "uncertain/format/formatter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <variant>

#include "uncertain/core/decimal.hpp"
#include "uncertain/core/threading.hpp"

namespace uncertain {
namespace {

std::string sign_prefix(bool negative, bool force_sign) {
  if (negative) {
    return "-";
  }
  return force_sign ? "+" : "";
}

std::string exponent_suffix(int exponent, ExponentStyle style) {
  if (exponent == 0) {
    return "";
  }
  const std::string signed_exponent = (exponent > 0 ? "+" : "-") + std::to_string(std::abs(exponent));
  if (style == ExponentStyle::ENotation) {
    return "e" + signed_exponent;
  }
  return " × 10^" + signed_exponent;
}

// Leading digit, then `fraction_digits` digits after the point (all of them when negative).
std::string mantissa_text(const core::DecimalDigits& digits, int fraction_digits) {
  if (digits.is_zero()) {
    return fraction_digits > 0 ? "0." + std::string(static_cast<std::size_t>(fraction_digits), '0') : "0";
  }

  const int high = digits.exponent;
  const int low = fraction_digits >= 0 ? high - fraction_digits : high - static_cast<int>(digits.count) + 1;
  std::string out(1, digits.digit_at(high));
  if (low < high) {
    out += '.';
    out += digits.digits_between(high - 1, low);
  }
  return out;
}

std::string format_exact(double mean, const ResolvedOptions& options) {
  const auto digits = core::decompose(mean);
  const std::string sign = sign_prefix(digits.negative, options.force_sign);

  if (const auto* fixed = std::get_if<FixedPrecision>(&options.mode)) {
    const int k = static_cast<int>(fixed->digits);
    const auto rounded = core::round_to_power(digits, digits.exponent - k);
    return sign + mantissa_text(rounded, k) + exponent_suffix(rounded.exponent, options.exponent_style);
  }

  return sign + mantissa_text(digits, -1) + exponent_suffix(digits.exponent, options.exponent_style);
}

std::string format_explicit(double mean, double uncertainty, const ResolvedOptions& options) {
  const std::string sign = std::signbit(mean) ? "" : (options.force_sign ? "+" : "");
  if (const auto* fixed = std::get_if<FixedPrecision>(&options.mode)) {
    const int precision = static_cast<int>(fixed->digits);
    return "(" + sign + core::fixed_repr(mean, precision) + " ± " + core::fixed_repr(uncertainty, precision) + ")";
  }
  return "(" + sign + core::shortest_repr(mean) + " ± " + core::shortest_repr(uncertainty) + ")";
}

int fraction_digits_for(const ResolvedOptions& options, int mean_exponent, const core::DecimalDigits& uncertainty) {
  if (const auto* fixed = std::get_if<FixedPrecision>(&options.mode)) {
    return static_cast<int>(fixed->digits);
  }
  const auto& significant = std::get<SignificantUncertainty>(options.mode);
  const int k = (mean_exponent - uncertainty.exponent) + (static_cast<int>(significant.digits) - 1);
  return std::max(0, k);
}

std::string format_shorthand(double mean, double uncertainty, const ResolvedOptions& options) {
  const auto mean_digits = core::decompose(mean);
  const auto uncertainty_digits = core::decompose(uncertainty);

  const int k = fraction_digits_for(options, mean_digits.exponent, uncertainty_digits);

  // May carry into a new leading digit, bumping the exponent.
  const auto rounded_mean = core::round_to_power(mean_digits, mean_digits.exponent - k);

  // A fixed precision counts digits after the (new) leading digit; requested uncertainty digits
  // stay on the pre-carry grid, so the mantissa gains one digit after a carry.
  const int grid = std::holds_alternative<FixedPrecision>(options.mode) ? rounded_mean.exponent - k
                                                                        : mean_digits.exponent - k;
  const int fraction_digits = rounded_mean.exponent - grid;

  const auto rounded_uncertainty = core::round_to_power(uncertainty_digits, grid);
  const std::string parenthetical =
      rounded_uncertainty.is_zero() ? "0" : rounded_uncertainty.digits_between(rounded_uncertainty.exponent, grid);

  return sign_prefix(mean_digits.negative, options.force_sign) + mantissa_text(rounded_mean, fraction_digits) +
         "(" + parenthetical + ")" + exponent_suffix(rounded_mean.exponent, options.exponent_style);
}

}  // namespace

std::string format_resolved(double mean, double uncertainty, const ResolvedOptions& options) {
  if (!std::isfinite(mean) || !std::isfinite(uncertainty)) {
    throw std::domain_error("mean and uncertainty must be finite to format");
  }

  const double magnitude = std::fabs(uncertainty);
  if (magnitude == 0.0) {
    return format_exact(mean, options);
  }
  if (magnitude >= std::fabs(mean)) {
    return format_explicit(mean, magnitude, options);
  }
  return format_shorthand(mean, magnitude, options);
}

std::string format(double mean, double uncertainty, const FormatOptions& options) {
  return format_resolved(mean, uncertainty, resolve_options(options));
}

std::vector<std::string> format_many(
    std::span<const Uncertain> values,
    const FormatOptions& options,
    std::size_t threads) {
  const ResolvedOptions resolved = resolve_options(options);

  std::vector<std::string> out(values.size());
  core::parallel_blocks(values.size(), threads, [&](std::size_t begin, std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) {
      out[i] = format_resolved(values[i].mean(), values[i].uncertainty(), resolved);
    }
  });
  return out;
}

}  // namespace uncertain
