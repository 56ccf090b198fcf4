#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include "uncertain/api/options.hpp"

namespace uncertain {

// A mean with a symmetric uncertainty. The uncertainty is stored as a magnitude.
class Uncertain {
 public:
  Uncertain() = default;
  Uncertain(double mean, double uncertainty);

  double mean() const { return mean_; }
  double uncertainty() const { return uncertainty_; }

  // Shorthand with a forced sign and two uncertainty digits.
  std::string str() const;
  std::string format(const FormatOptions& options) const;
  std::string format(std::string_view spec) const;

  static Uncertain from_string(std::string_view text);

  friend bool operator==(const Uncertain& lhs, const Uncertain& rhs) = default;

 private:
  double mean_ = 0.0;
  double uncertainty_ = 0.0;
};

std::ostream& operator<<(std::ostream& out, const Uncertain& value);

}  // namespace uncertain
