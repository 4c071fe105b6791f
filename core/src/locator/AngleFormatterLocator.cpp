#include "ct/locator/AngleFormatterLocator.hpp"
#include "ct/format/Sexagesimal.hpp"
#include "ct/math/NiceSteps.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace ct {

static constexpr const char* kComponent = "AngleFormatterLocator";

AngleFormatterLocator::AngleFormatterLocator()
  : FormatterLocator(kComponent) {}

AngleFormatterLocator::AngleFormatterLocator(TickValues values, const std::string& format)
  : FormatterLocator(kComponent) {
  setValues(std::move(values.values));
  if (!format.empty()) setFormat(format);
}

AngleFormatterLocator::AngleFormatterLocator(TickCount number, const std::string& format)
  : FormatterLocator(kComponent) {
  setNumber(number.count);
  if (!format.empty()) setFormat(format);
}

AngleFormatterLocator::AngleFormatterLocator(const Angle& spacing, const std::string& format)
  : FormatterLocator(kComponent) {
  setSpacing(spacing);
  if (!format.empty()) setFormat(format);
}

void AngleFormatterLocator::setSpacing(const Angle& spacing) {
  setSpacingValue(spacing.inDegrees());
}

std::optional<Angle> AngleFormatterLocator::spacing() const {
  auto deg = spacingValue();
  if (!deg) return std::nullopt;
  return Angle::degrees(*deg);
}

FormatDescriptor AngleFormatterLocator::parseFormat(const std::string& format) const {
  return parseAngleFormat(format);
}

double AngleFormatterLocator::sentinelSpacing() const {
  return 1.1 / 3600.0;
}

double AngleFormatterLocator::selectStep(double dv) const {
  if (hasFormat()) {
    const FormatDescriptor& f = formatDescriptor();
    // Decimal labels step in {1,2,5} x 10^n of the display unit, always a
    // whole number of base spacings.
    if (f.decimal) {
      double base = f.baseSpacing();
      double step = toDegrees(selectStepScalar(fromDegrees(dv, f.unit)), f.unit);
      return base * std::max(1.0, std::round(step / base));
    }
    if (f.unit == UnitKind::HourAngle) return selectStepHour(dv);
  }
  return selectStepDegree(dv);
}

std::vector<std::string> AngleFormatterLocator::format(const std::vector<double>& values,
                                                       double spacing) const {
  std::vector<std::string> labels;
  if (values.empty()) return labels;

  LabelStyle style;
  if (hasFormat()) {
    const FormatDescriptor& f = formatDescriptor();
    style.decimal = f.decimal;
    style.unit = f.unit;
    style.fields = f.fields;
    style.precision = f.precision;
  } else {
    style = chooseAngleStyle(spacing);
  }

  labels.reserve(values.size());
  for (double v : values) {
    labels.push_back(formatAngle(v, style));
  }
  return labels;
}

} // namespace ct
