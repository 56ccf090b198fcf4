#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace uncertain {

inline constexpr unsigned kDefaultUncertaintyDigits = 2;
// Past the smallest subnormal (10^-1074 needs 1074 fraction digits) every extra digit is a padded zero.
inline constexpr unsigned kMaxDisplayDigits = 1100;

enum class ExponentStyle {
  CaretTen,
  ENotation,
};

struct FormatOptions {
  std::optional<unsigned> precision;
  std::optional<unsigned> uncertainty_digits;
  ExponentStyle exponent_style = ExponentStyle::CaretTen;
  // Unset means "+" only when every other option is left at its default.
  std::optional<bool> force_sign;
};

struct FixedPrecision {
  unsigned digits = 0;
};

struct SignificantUncertainty {
  unsigned digits = kDefaultUncertaintyDigits;
};

using DisplayMode = std::variant<FixedPrecision, SignificantUncertainty>;

struct ResolvedOptions {
  DisplayMode mode = SignificantUncertainty{};
  ExponentStyle exponent_style = ExponentStyle::CaretTen;
  bool force_sign = false;
};

struct OptionIssue {
  std::string message;
  bool fatal = true;
};

std::vector<OptionIssue> validate_options(const FormatOptions& options);
void throw_if_invalid(const FormatOptions& options);

ResolvedOptions resolve_options(const FormatOptions& options);

// Mini-language of the form "[+][e][.N|uN]" in any order, e.g. "+eu3" or ".3".
FormatOptions parse_format_spec(std::string_view spec);

}  // namespace uncertain
