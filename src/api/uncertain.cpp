#include "uncertain/api/uncertain.hpp"

#include <cmath>

#include "uncertain/format/formatter.hpp"
#include "uncertain/parse/parser.hpp"

namespace uncertain {

Uncertain::Uncertain(double mean, double uncertainty) : mean_(mean), uncertainty_(std::fabs(uncertainty)) {}

std::string Uncertain::str() const {
  FormatOptions options;
  options.uncertainty_digits = kDefaultUncertaintyDigits;
  options.force_sign = true;
  return uncertain::format(mean_, uncertainty_, options);
}

std::string Uncertain::format(const FormatOptions& options) const {
  return uncertain::format(mean_, uncertainty_, options);
}

std::string Uncertain::format(std::string_view spec) const {
  return uncertain::format(mean_, uncertainty_, parse_format_spec(spec));
}

Uncertain Uncertain::from_string(std::string_view text) {
  return parse(text);
}

std::ostream& operator<<(std::ostream& out, const Uncertain& value) {
  return out << value.str();
}

}  // namespace uncertain
