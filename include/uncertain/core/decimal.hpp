#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace uncertain::core {

// Longest shortest-round-trip decimal representation of a binary64 value.
inline constexpr std::size_t kMaxSignificantDigits = 17;

struct DecimalDigits {
  bool negative = false;
  std::array<char, kMaxSignificantDigits> digits{};
  std::size_t count = 0;
  // Power of ten carried by digits[0].
  int exponent = 0;

  bool is_zero() const;
  char digit_at(int power) const;
  std::string digits_between(int high, int low) const;
};

DecimalDigits decompose(double value);
DecimalDigits round_to_power(const DecimalDigits& value, int lowest_power);

std::string shortest_repr(double value);
std::string fixed_repr(double value, int precision);

}  // namespace uncertain::core
