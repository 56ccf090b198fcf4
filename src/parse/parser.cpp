#include "uncertain/parse/parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "uncertain/api/errors.hpp"

namespace uncertain {
namespace {

constexpr std::string_view kPlusMinus = "±";
constexpr std::string_view kAsciiPlusMinus = "+/-";
constexpr std::string_view kShortPlusMinus = "+-";
constexpr std::string_view kUnicodeMinus = "−";
constexpr std::string_view kTimes = "×";

// Far beyond the binary64 range, small enough that exponent sums cannot overflow int.
constexpr int kMaxExponentMagnitude = 100000;
constexpr std::size_t kMaxFractionDigits = 100000;

struct NumberToken {
  bool negative = false;
  bool explicit_sign = false;
  std::string integer_digits;
  std::string fraction_digits;
};

bool is_digit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

class Scanner {
 public:
  explicit Scanner(std::string_view text) : text_(text) {}

  bool at_end() const { return pos_ >= text_.size(); }

  void skip_space() {
    while (!at_end() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
  }

  bool consume(std::string_view token) {
    if (text_.substr(pos_).starts_with(token)) {
      pos_ += token.size();
      return true;
    }
    return false;
  }

  bool consume_plus_minus() {
    return consume(kPlusMinus) || consume(kAsciiPlusMinus) || consume(kShortPlusMinus);
  }

  std::string digits() {
    const std::size_t begin = pos_;
    while (!at_end() && is_digit(text_[pos_])) {
      ++pos_;
    }
    return std::string(text_.substr(begin, pos_ - begin));
  }

  // Returns nullopt, without consuming input, when no number starts here.
  std::optional<NumberToken> number() {
    const std::size_t begin = pos_;
    NumberToken token;
    if (consume("+")) {
      token.explicit_sign = true;
    } else if (consume("-") || consume(kUnicodeMinus)) {
      token.explicit_sign = true;
      token.negative = true;
    }

    token.integer_digits = digits();
    const bool has_point = consume(".");
    if (has_point) {
      token.fraction_digits = digits();
    }

    if (token.integer_digits.empty() && token.fraction_digits.empty()) {
      if (token.explicit_sign || has_point) {
        fail("sign or decimal point without digits");
      }
      pos_ = begin;
      return std::nullopt;
    }
    return token;
  }

  // Returns nullopt, without consuming input, when no exponent suffix starts here.
  std::optional<int> exponent() {
    const std::size_t begin = pos_;
    skip_space();

    if (consume("e") || consume("E")) {
      return signed_integer("exponent after 'e'");
    }

    if (consume(kTimes) || consume("x") || consume("*")) {
      skip_space();
      if (!consume("10")) {
        fail("expected '10' after the multiplication sign");
      }
      skip_space();
      if (!consume("^")) {
        fail("expected '^' after 'x 10'");
      }
      skip_space();
      return signed_integer("power of ten");
    }

    pos_ = begin;
    return std::nullopt;
  }

  [[noreturn]] void fail(const std::string& reason) const {
    throw ParseError(text_, reason + " at offset " + std::to_string(pos_));
  }

 private:
  int signed_integer(const std::string& what) {
    bool negative = false;
    if (consume("+")) {
      negative = false;
    } else if (consume("-") || consume(kUnicodeMinus)) {
      negative = true;
    }

    const std::string magnitude = digits();
    if (magnitude.empty()) {
      fail("malformed " + what);
    }

    int value = 0;
    const auto result = std::from_chars(magnitude.data(), magnitude.data() + magnitude.size(), value);
    if (result.ec != std::errc{} || value > kMaxExponentMagnitude) {
      fail(what + " is out of range");
    }
    return negative ? -value : value;
  }

  std::string_view text_;
  std::size_t pos_ = 0;
};

double to_double(std::string_view text, const std::string& literal) {
  double value = 0.0;
  const auto result = std::from_chars(literal.data(), literal.data() + literal.size(), value);
  if (result.ec == std::errc::result_out_of_range) {
    throw ParseError(text, "value " + literal + " is outside the binary64 range");
  }
  if (result.ec != std::errc{} || result.ptr != literal.data() + literal.size()) {
    throw ParseError(text, "malformed number " + literal);
  }
  return value;
}

std::string decimal_literal(const NumberToken& token, int exponent) {
  std::string out = token.negative ? "-" : "";
  out += token.integer_digits.empty() ? "0" : token.integer_digits;
  if (!token.fraction_digits.empty()) {
    out += '.';
    out += token.fraction_digits;
  }
  out += 'e';
  out += std::to_string(exponent);
  return out;
}

bool contains_plus_minus(std::string_view text) {
  return text.find(kPlusMinus) != std::string_view::npos || text.find(kAsciiPlusMinus) != std::string_view::npos ||
         text.find(kShortPlusMinus) != std::string_view::npos;
}

std::optional<Uncertain> match_explicit(std::string_view text) {
  if (!contains_plus_minus(text)) {
    return std::nullopt;
  }

  const bool enclosed = text.front() == '(';
  const auto opening = std::count(text.begin(), text.end(), '(');
  if (opening > (enclosed ? 1 : 0)) {
    throw ParseError(text, "both a ± uncertainty and a parenthetical uncertainty are present");
  }

  Scanner scanner(text);
  if (enclosed) {
    scanner.consume("(");
    scanner.skip_space();
  }

  const auto mean = scanner.number();
  if (!mean) {
    scanner.fail("expected a mean before ±");
  }
  const auto mean_exponent = scanner.exponent();

  scanner.skip_space();
  if (!scanner.consume_plus_minus()) {
    scanner.fail("expected ± after the mean");
  }
  scanner.skip_space();

  const auto spread = scanner.number();
  if (!spread) {
    scanner.fail("expected an uncertainty after ±");
  }
  if (spread->explicit_sign) {
    scanner.fail("uncertainty must be unsigned");
  }
  const auto spread_exponent = scanner.exponent();

  int shared_exponent = 0;
  int own_mean_exponent = mean_exponent.value_or(0);
  int own_spread_exponent = spread_exponent.value_or(0);
  if (enclosed) {
    scanner.skip_space();
    if (!scanner.consume(")")) {
      scanner.fail("missing closing parenthesis");
    }
    shared_exponent = scanner.exponent().value_or(0);
  } else if (!mean_exponent) {
    // Without parentheses a trailing exponent scales both numbers.
    shared_exponent = own_spread_exponent;
    own_spread_exponent = 0;
  }

  scanner.skip_space();
  if (!scanner.at_end()) {
    scanner.fail("unexpected trailing text");
  }

  return Uncertain(to_double(text, decimal_literal(*mean, own_mean_exponent + shared_exponent)),
                   to_double(text, decimal_literal(*spread, own_spread_exponent + shared_exponent)));
}

std::optional<Uncertain> match_parenthetical(std::string_view text) {
  if (text.find('(') == std::string_view::npos) {
    return std::nullopt;
  }

  Scanner scanner(text);
  const auto mantissa = scanner.number();
  if (!mantissa) {
    scanner.fail("expected a mantissa before the parenthetical uncertainty");
  }

  scanner.skip_space();
  if (!scanner.consume("(")) {
    scanner.fail("expected '(' after the mantissa");
  }
  const std::string spread_digits = scanner.digits();
  if (spread_digits.empty()) {
    scanner.fail("empty parenthetical uncertainty");
  }
  if (!scanner.consume(")")) {
    scanner.fail("unterminated parenthetical uncertainty");
  }

  const int exponent = scanner.exponent().value_or(0);
  scanner.skip_space();
  if (!scanner.at_end()) {
    scanner.fail("unexpected trailing text");
  }

  if (mantissa->fraction_digits.size() > kMaxFractionDigits) {
    throw ParseError(text, "too many fractional digits");
  }

  // The parenthetical counts units of the last displayed mantissa digit.
  const int spread_exponent = exponent - static_cast<int>(mantissa->fraction_digits.size());
  const NumberToken spread{false, false, spread_digits, {}};
  return Uncertain(to_double(text, decimal_literal(*mantissa, exponent)),
                   to_double(text, decimal_literal(spread, spread_exponent)));
}

Uncertain match_plain(std::string_view text) {
  Scanner scanner(text);
  const auto value = scanner.number();
  if (!value) {
    scanner.fail("not a number, a shorthand or a ± expression");
  }

  const int exponent = scanner.exponent().value_or(0);
  scanner.skip_space();
  if (!scanner.at_end()) {
    scanner.fail("unexpected trailing text");
  }
  return Uncertain(to_double(text, decimal_literal(*value, exponent)), 0.0);
}

}  // namespace

Uncertain parse(std::string_view text) {
  const std::string_view trimmed = trim(text);
  if (trimmed.empty()) {
    throw ParseError(text, "empty input");
  }

  if (auto explicit_form = match_explicit(trimmed)) {
    return *explicit_form;
  }
  if (auto shorthand = match_parenthetical(trimmed)) {
    return *shorthand;
  }
  return match_plain(trimmed);
}

}  // namespace uncertain
