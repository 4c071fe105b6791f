#pragma once
#include "ct/locator/FormatterLocator.hpp"

#include <memory>
#include <string>

#include <rapidjson/document.h>

namespace ct {

struct ConfigError {
  std::string code;     // e.g. "INVALID_FORMAT"
  std::string message;  // human text
};

struct ConfigResult {
  bool ok{true};
  ConfigError err{};
  std::unique_ptr<FormatterLocator> locator;
};

// Build a formatter/locator from a JSON object:
//
//   {"kind":"angle", "format":"dd:mm", "spacing":{"value":30,"unit":"arcmin"}}
//   {"kind":"scalar", "format":"x.xx", "spacing":0.1}
//   {"kind":"angle", "values":[10, 20, 30]}
//   {"kind":"scalar", "number":8}
//
// "kind" defaults to "angle"; at most one of values/number/spacing.
// `handler` is installed before the configuration is applied, so it also
// sees spacing corrections made while building.
ConfigResult buildFormatterLocator(const rapidjson::Value& obj,
                                   DiagnosticHandler handler = {});

// Convenience: parse string then build.
ConfigResult buildFormatterLocatorJson(const std::string& jsonText,
                                       DiagnosticHandler handler = {});

// Inverse of buildFormatterLocator. Angle spacing is written in degrees.
std::string serializeFormatterLocator(const FormatterLocator& fl);

} // namespace ct
