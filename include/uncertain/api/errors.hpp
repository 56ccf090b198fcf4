#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace uncertain {

class ConfigurationError : public std::invalid_argument {
 public:
  explicit ConfigurationError(const std::string& message);
};

class ParseError : public std::invalid_argument {
 public:
  ParseError(std::string_view text, const std::string& reason);

  const std::string& text() const noexcept;

 private:
  std::string text_;
};

}  // namespace uncertain
