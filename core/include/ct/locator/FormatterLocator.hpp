#pragma once
#include "ct/core/Diagnostics.hpp"
#include "ct/format/FormatDescriptor.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ct {

// Tick modes. Exactly one is active on a FormatterLocator.
struct TickValues {
  std::vector<double> values;   // used verbatim, never clipped to the range
};

struct TickCount {
  int count{5};
};

struct TickSpacing {
  double spacing{0.0};          // degrees for angle axes, raw units for scalar
};

using TickMode = std::variant<TickValues, TickCount, TickSpacing>;

struct TickSet {
  double spacing{0.0};          // spacing the values were generated with
  std::vector<double> values;
};

// Absolute tolerance for "spacing is a multiple of the base spacing".
inline constexpr double kSpacingTolerance = 1e-10;

// Joint tick locator + label formatter. The label format and the tick
// spacing are kept consistent: an explicit spacing is always a multiple of
// the format's base spacing, and counted spacing never goes below it.
class FormatterLocator {
public:
  virtual ~FormatterLocator() = default;

  // "angle" or "scalar"
  virtual const char* kind() const = 0;

  void setValues(std::vector<double> values);
  void setNumber(int number);   // throws ConfigurationError if number < 1

  const TickMode& mode() const { return mode_; }
  const std::vector<double>* values() const;
  int number() const;           // 0 unless in TickCount mode
  bool hasSpacing() const { return std::holds_alternative<TickSpacing>(mode_); }

  // Parse and apply a format string; re-validates an explicit spacing.
  // Throws FormatParseError, leaving the previous format in place.
  void setFormat(const std::string& format);
  void clearFormat();
  bool hasFormat() const { return hasFormat_; }
  const FormatDescriptor& formatDescriptor() const { return format_; }
  std::string formatString() const { return hasFormat_ ? format_.source : std::string(); }

  // Base spacing of the current format (degrees / raw units), 0 if none.
  double baseSpacing() const { return hasFormat_ ? format_.baseSpacing() : 0.0; }

  // Spacing the locator will use for [valueMin, valueMax].
  double resolveSpacing(double valueMin, double valueMax) const;

  TickSet locate(double valueMin, double valueMax) const;

  virtual std::vector<std::string> format(const std::vector<double>& values,
                                          double spacing) const = 0;

  // Receives spacing corrections. Defaults to logDiagnostic (stderr).
  void setDiagnosticHandler(DiagnosticHandler handler) { onDiagnostic_ = std::move(handler); }

protected:
  explicit FormatterLocator(const char* component) : component_(component) {}

  virtual FormatDescriptor parseFormat(const std::string& format) const = 0;

  // Spacing reported for explicit values; only used to pick label precision.
  virtual double sentinelSpacing() const = 0;

  // Round a raw spacing to a human-friendly one.
  virtual double selectStep(double dv) const = 0;

  void setSpacingValue(double spacing);
  std::optional<double> spacingValue() const;

private:
  void validateSpacing();
  void warn(const char* code, const char* message) const;

  const char* component_;
  TickMode mode_{TickCount{5}};
  bool hasFormat_{false};
  FormatDescriptor format_;
  DiagnosticHandler onDiagnostic_;
};

} // namespace ct
