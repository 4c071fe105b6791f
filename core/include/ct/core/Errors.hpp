#pragma once
#include <stdexcept>
#include <string>

namespace ct {

// More than one tick mode supplied, or a tick mode with an invalid value.
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Format string matched none of the known grammars.
class FormatParseError : public std::runtime_error {
public:
  explicit FormatParseError(const std::string& what) : std::runtime_error(what) {}
};

// Angle spacing given without an angular unit.
class SpacingTypeError : public std::runtime_error {
public:
  explicit SpacingTypeError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace ct
