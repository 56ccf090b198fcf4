#pragma once

#include <string_view>

#include "uncertain/api/uncertain.hpp"

namespace uncertain {

// Accepts, in order of precedence:
//   "(mean ± uncertainty)[exp]"   explicit form, also "+/-" and "+-"
//   "mean(digits)[exp]"           shorthand, digits in units of the last mantissa digit
//   "mean[exp]"                   plain number, zero uncertainty
// where [exp] is "e-3", "E+2", " × 10^-3" or "x10^3". Throws ParseError otherwise.
Uncertain parse(std::string_view text);

}  // namespace uncertain
