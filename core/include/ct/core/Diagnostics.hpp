#pragma once
#include <functional>
#include <string>

namespace ct {

// Recoverable, warning-level message. The configuration has already been
// corrected when one of these is emitted.
struct Diagnostic {
  std::string code;       // e.g. "SPACING_TOO_SMALL"
  std::string message;    // human text
  std::string component;  // e.g. "AngleFormatterLocator"
};

using DiagnosticHandler = std::function<void(const Diagnostic&)>;

// Prints "[component] warning: message" to stderr.
void logDiagnostic(const Diagnostic& d);

} // namespace ct
