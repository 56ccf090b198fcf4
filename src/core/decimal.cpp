#include "uncertain/core/decimal.hpp"

#include <charconv>
#include <cmath>
#include <stdexcept>
#include <string>
#include <system_error>

namespace uncertain::core {
namespace {

void trim_trailing_zeros(DecimalDigits& value) {
  while (value.count > 0 && value.digits[value.count - 1] == '0') {
    --value.count;
  }
  if (value.count == 0) {
    value.exponent = 0;
  }
}

bool round_up_needed(const DecimalDigits& value, std::size_t keep) {
  const char first_dropped = value.digits[keep];
  if (first_dropped != '5') {
    return first_dropped > '5';
  }
  for (std::size_t i = keep + 1; i < value.count; ++i) {
    if (value.digits[i] != '0') {
      return true;
    }
  }
  // Exact tie: round half to even. An empty kept prefix counts as 0.
  const char last_kept = keep == 0 ? '0' : value.digits[keep - 1];
  return ((last_kept - '0') % 2) != 0;
}

}  // namespace

bool DecimalDigits::is_zero() const {
  return count == 0;
}

char DecimalDigits::digit_at(int power) const {
  const int index = exponent - power;
  if (index < 0 || static_cast<std::size_t>(index) >= count) {
    return '0';
  }
  return digits[static_cast<std::size_t>(index)];
}

std::string DecimalDigits::digits_between(int high, int low) const {
  std::string out;
  if (high < low) {
    return out;
  }
  out.reserve(static_cast<std::size_t>(high - low + 1));
  for (int power = high; power >= low; --power) {
    out.push_back(digit_at(power));
  }
  return out;
}

DecimalDigits decompose(double value) {
  if (!std::isfinite(value)) {
    throw std::domain_error("cannot decompose a non-finite value");
  }

  DecimalDigits out;
  out.negative = std::signbit(value);
  if (value == 0.0) {
    return out;
  }

  // Shortest round-trip scientific form: d[.ddd]e[+-]xx
  char buffer[64];
  const auto result = std::to_chars(buffer, buffer + sizeof(buffer), std::fabs(value), std::chars_format::scientific);
  if (result.ec != std::errc{}) {
    throw std::runtime_error("to_chars failed while decomposing a value");
  }

  const char* cursor = buffer;
  const char* const end = result.ptr;
  while (cursor < end && *cursor != 'e') {
    if (*cursor != '.') {
      out.digits[out.count++] = *cursor;
    }
    ++cursor;
  }
  if (cursor == end) {
    throw std::runtime_error("to_chars produced no exponent");
  }
  ++cursor;

  bool negative_exponent = false;
  if (cursor < end && (*cursor == '+' || *cursor == '-')) {
    negative_exponent = *cursor == '-';
    ++cursor;
  }
  int exponent = 0;
  const auto parsed = std::from_chars(cursor, end, exponent);
  if (parsed.ec != std::errc{}) {
    throw std::runtime_error("to_chars produced a malformed exponent");
  }
  out.exponent = negative_exponent ? -exponent : exponent;

  trim_trailing_zeros(out);
  return out;
}

DecimalDigits round_to_power(const DecimalDigits& value, int lowest_power) {
  if (value.is_zero()) {
    return value;
  }

  const int keep_signed = value.exponent - lowest_power + 1;
  if (keep_signed >= static_cast<int>(value.count)) {
    return value;
  }

  DecimalDigits out;
  out.negative = value.negative;

  // The whole value sits below 10^(lowest_power - 1), less than half a unit.
  if (keep_signed < 0) {
    return out;
  }

  const auto keep = static_cast<std::size_t>(keep_signed);
  const bool round_up = round_up_needed(value, keep);

  if (keep == 0) {
    if (round_up) {
      out.digits[0] = '1';
      out.count = 1;
      out.exponent = lowest_power;
    }
    return out;
  }

  out.exponent = value.exponent;
  out.count = keep;
  for (std::size_t i = 0; i < keep; ++i) {
    out.digits[i] = value.digits[i];
  }

  if (round_up) {
    std::size_t i = keep;
    bool carry = true;
    while (carry && i > 0) {
      --i;
      if (out.digits[i] == '9') {
        out.digits[i] = '0';
      } else {
        ++out.digits[i];
        carry = false;
      }
    }
    if (carry) {
      // Every kept digit was 9: the leading digit moves up one power.
      out.digits[0] = '1';
      out.count = 1;
      ++out.exponent;
    }
  }

  trim_trailing_zeros(out);
  return out;
}

std::string shortest_repr(double value) {
  char buffer[64];
  const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (result.ec != std::errc{}) {
    throw std::runtime_error("to_chars failed for shortest representation");
  }
  return std::string(buffer, result.ptr);
}

std::string fixed_repr(double value, int precision) {
  if (precision < 0) {
    throw std::invalid_argument("fixed precision must be non-negative");
  }

  // Integer part of a binary64 never exceeds 309 digits.
  std::string buffer(static_cast<std::size_t>(precision) + 320, '\0');
  const auto result =
      std::to_chars(buffer.data(), buffer.data() + buffer.size(), value, std::chars_format::fixed, precision);
  if (result.ec != std::errc{}) {
    throw std::runtime_error("to_chars failed for fixed representation");
  }
  buffer.resize(static_cast<std::size_t>(result.ptr - buffer.data()));
  return buffer;
}

}  // namespace uncertain::core
