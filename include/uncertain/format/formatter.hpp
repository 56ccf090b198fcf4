#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "uncertain/api/options.hpp"
#include "uncertain/api/uncertain.hpp"

namespace uncertain {

// Renders mean and uncertainty as parenthetical shorthand, e.g. "+5.1099895000(15) × 10^-1".
// Falls back to "(mean ± uncertainty)" when the uncertainty is not smaller than |mean|
// and to the bare mean when the uncertainty is zero.
std::string format(double mean, double uncertainty, const FormatOptions& options = {});

std::string format_resolved(double mean, double uncertainty, const ResolvedOptions& options);

// Output order follows input order for any thread count.
std::vector<std::string> format_many(
    std::span<const Uncertain> values,
    const FormatOptions& options = {},
    std::size_t threads = 1);

}  // namespace uncertain
