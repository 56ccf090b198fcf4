#include "uncertain/api/errors.hpp"

namespace uncertain {

ConfigurationError::ConfigurationError(const std::string& message) : std::invalid_argument(message) {}

ParseError::ParseError(std::string_view text, const std::string& reason)
    : std::invalid_argument("Cannot parse uncertain quantity '" + std::string(text) + "': " + reason),
      text_(text) {}

const std::string& ParseError::text() const noexcept {
  return text_;
}

}  // namespace uncertain
