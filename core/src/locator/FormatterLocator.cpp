#include "ct/locator/FormatterLocator.hpp"
#include "ct/core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace ct {

// Multiplier indices beyond this are no longer exact in a double.
static constexpr double kMaxTickIndex = 9.0e15;
// Ticks per locate call; beyond this the spacing is unusable for the range.
static constexpr long long kMaxTicks = 1000000;

void FormatterLocator::setValues(std::vector<double> values) {
  mode_ = TickValues{std::move(values)};
}

void FormatterLocator::setNumber(int number) {
  if (number < 1) {
    throw ConfigurationError("number of ticks must be positive, got " + std::to_string(number));
  }
  mode_ = TickCount{number};
}

const std::vector<double>* FormatterLocator::values() const {
  const auto* v = std::get_if<TickValues>(&mode_);
  return v ? &v->values : nullptr;
}

int FormatterLocator::number() const {
  const auto* n = std::get_if<TickCount>(&mode_);
  return n ? n->count : 0;
}

void FormatterLocator::setFormat(const std::string& format) {
  format_ = parseFormat(format);
  hasFormat_ = true;
  validateSpacing();
}

void FormatterLocator::clearFormat() {
  hasFormat_ = false;
  format_ = FormatDescriptor{};
}

void FormatterLocator::setSpacingValue(double spacing) {
  if (!(spacing > 0.0) || !std::isfinite(spacing)) {
    throw ConfigurationError("spacing must be positive and finite");
  }
  mode_ = TickSpacing{spacing};
  validateSpacing();
}

std::optional<double> FormatterLocator::spacingValue() const {
  const auto* s = std::get_if<TickSpacing>(&mode_);
  if (!s) return std::nullopt;
  return s->spacing;
}

void FormatterLocator::validateSpacing() {
  auto* s = std::get_if<TickSpacing>(&mode_);
  if (!hasFormat_ || !s) return;

  double base = format_.baseSpacing();

  if (s->spacing < base) {
    warn("SPACING_TOO_SMALL", "Spacing is too small - resetting spacing to match format");
    s->spacing = base;
  }

  double rem = std::fmod(s->spacing, base);
  if (std::min(rem, base - rem) > kSpacingTolerance) {
    warn("SPACING_NOT_MULTIPLE",
         "Spacing is not a multiple of base spacing - resetting spacing to match format");
    s->spacing = base * std::round(s->spacing / base);
  }
}

void FormatterLocator::warn(const char* code, const char* message) const {
  Diagnostic d{code, message, component_};
  if (onDiagnostic_) {
    onDiagnostic_(d);
  } else {
    logDiagnostic(d);
  }
}

double FormatterLocator::resolveSpacing(double valueMin, double valueMax) const {
  if (std::holds_alternative<TickValues>(mode_)) return sentinelSpacing();

  if (const auto* s = std::get_if<TickSpacing>(&mode_)) return s->spacing;

  int count = std::get<TickCount>(mode_).count;
  double dv = std::fabs(valueMax - valueMin) / static_cast<double>(count);

  // The format cannot resolve anything finer than its base spacing.
  if (hasFormat_ && !(dv >= format_.baseSpacing())) return format_.baseSpacing();

  // Degenerate range: one unit.
  if (!(dv > 0.0) || !std::isfinite(dv)) return 1.0;

  return selectStep(dv);
}

TickSet FormatterLocator::locate(double valueMin, double valueMax) const {
  TickSet result;

  if (const auto* v = std::get_if<TickValues>(&mode_)) {
    result.spacing = sentinelSpacing();
    result.values = v->values;
    return result;
  }

  double spacing = resolveSpacing(valueMin, valueMax);
  result.spacing = spacing;
  if (!std::isfinite(valueMin) || !std::isfinite(valueMax)) return result;

  double imin = std::ceil(valueMin / spacing);
  double imax = std::floor(valueMax / spacing);
  if (imin > imax) return result;
  if (std::fabs(imin) > kMaxTickIndex || std::fabs(imax) > kMaxTickIndex) return result;

  auto lo = static_cast<long long>(imin);
  auto hi = static_cast<long long>(imax);
  if (hi - lo + 1 > kMaxTicks) {
    warn("TOO_MANY_TICKS", "Spacing is too small for the range - no ticks located");
    return result;
  }
  result.values.reserve(static_cast<std::size_t>(hi - lo + 1));
  for (long long i = lo; i <= hi; i++) {
    result.values.push_back(static_cast<double>(i) * spacing);
  }
  return result;
}

} // namespace ct
