#include "uncertain/api/options.hpp"

#include <cctype>
#include <charconv>
#include <sstream>
#include <system_error>

#include "uncertain/api/errors.hpp"
#include "uncertain/core/decimal.hpp"

namespace uncertain {
namespace {

unsigned parse_spec_count(std::string_view spec, std::size_t& cursor, char marker) {
  const std::size_t begin = cursor;
  while (cursor < spec.size() && std::isdigit(static_cast<unsigned char>(spec[cursor])) != 0) {
    ++cursor;
  }
  if (cursor == begin) {
    throw ConfigurationError(std::string("Format spec '") + std::string(spec) + "': '" + marker +
                             "' must be followed by digits");
  }

  unsigned value = 0;
  const auto result = std::from_chars(spec.data() + begin, spec.data() + cursor, value);
  if (result.ec != std::errc{}) {
    throw ConfigurationError(std::string("Format spec '") + std::string(spec) + "': count after '" + marker +
                             "' is out of range");
  }
  return value;
}

}  // namespace

std::vector<OptionIssue> validate_options(const FormatOptions& options) {
  std::vector<OptionIssue> issues;

  if (options.precision && options.uncertainty_digits) {
    issues.push_back({"precision and uncertainty_digits are mutually exclusive (got precision " +
                          std::to_string(*options.precision) + " and uncertainty_digits " +
                          std::to_string(*options.uncertainty_digits) + ")",
                      true});
  }

  if (options.uncertainty_digits && *options.uncertainty_digits == 0) {
    issues.push_back({"uncertainty_digits must be >= 1", true});
  }

  if (options.uncertainty_digits && *options.uncertainty_digits > kMaxDisplayDigits) {
    issues.push_back({"uncertainty_digits must be <= " + std::to_string(kMaxDisplayDigits), true});
  } else if (options.uncertainty_digits && *options.uncertainty_digits > core::kMaxSignificantDigits) {
    issues.push_back({"uncertainty_digits beyond binary64 resolution only pads zeros", false});
  }

  if (options.precision && *options.precision > kMaxDisplayDigits) {
    issues.push_back({"precision must be <= " + std::to_string(kMaxDisplayDigits), true});
  }

  return issues;
}

void throw_if_invalid(const FormatOptions& options) {
  const auto issues = validate_options(options);

  std::ostringstream out;
  out << "Invalid uncertain format options:";
  bool any_fatal = false;
  for (const auto& issue : issues) {
    if (issue.fatal) {
      out << "\n - " << issue.message;
      any_fatal = true;
    }
  }
  if (any_fatal) {
    throw ConfigurationError(out.str());
  }
}

ResolvedOptions resolve_options(const FormatOptions& options) {
  throw_if_invalid(options);

  ResolvedOptions resolved;
  if (options.precision) {
    resolved.mode = FixedPrecision{*options.precision};
  } else {
    resolved.mode = SignificantUncertainty{options.uncertainty_digits.value_or(kDefaultUncertaintyDigits)};
  }
  resolved.exponent_style = options.exponent_style;

  const bool all_defaults =
      !options.precision && !options.uncertainty_digits && options.exponent_style == ExponentStyle::CaretTen;
  resolved.force_sign = options.force_sign.value_or(all_defaults);
  return resolved;
}

FormatOptions parse_format_spec(std::string_view spec) {
  FormatOptions options;
  if (spec.empty()) {
    return options;
  }

  options.force_sign = false;
  std::size_t cursor = 0;
  while (cursor < spec.size()) {
    const char c = spec[cursor++];
    switch (c) {
      case '+':
        options.force_sign = true;
        break;
      case 'e':
        options.exponent_style = ExponentStyle::ENotation;
        break;
      case '.':
        options.precision = parse_spec_count(spec, cursor, c);
        break;
      case 'u':
        options.uncertainty_digits = parse_spec_count(spec, cursor, c);
        break;
      default:
        throw ConfigurationError(std::string("Format spec '") + std::string(spec) + "': unsupported character '" + c +
                                 "'");
    }
  }
  return options;
}

}  // namespace uncertain
