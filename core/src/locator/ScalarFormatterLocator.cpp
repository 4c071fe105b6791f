#include "ct/locator/ScalarFormatterLocator.hpp"
#include "ct/format/Sexagesimal.hpp"
#include "ct/math/NiceSteps.hpp"

#include <cmath>
#include <utility>

namespace ct {

static constexpr const char* kComponent = "ScalarFormatterLocator";

ScalarFormatterLocator::ScalarFormatterLocator()
  : FormatterLocator(kComponent) {}

ScalarFormatterLocator::ScalarFormatterLocator(TickValues values, const std::string& format)
  : FormatterLocator(kComponent) {
  setValues(std::move(values.values));
  if (!format.empty()) setFormat(format);
}

ScalarFormatterLocator::ScalarFormatterLocator(TickCount number, const std::string& format)
  : FormatterLocator(kComponent) {
  setNumber(number.count);
  if (!format.empty()) setFormat(format);
}

ScalarFormatterLocator::ScalarFormatterLocator(TickSpacing spacing, const std::string& format)
  : FormatterLocator(kComponent) {
  setSpacing(spacing.spacing);
  if (!format.empty()) setFormat(format);
}

void ScalarFormatterLocator::setSpacing(double spacing) {
  setSpacingValue(spacing);
}

FormatDescriptor ScalarFormatterLocator::parseFormat(const std::string& format) const {
  return parseScalarFormat(format);
}

double ScalarFormatterLocator::selectStep(double dv) const {
  return selectStepScalar(dv);
}

std::vector<std::string> ScalarFormatterLocator::format(const std::vector<double>& values,
                                                        double spacing) const {
  std::vector<std::string> labels;
  if (values.empty()) return labels;

  int precision = 0;
  if (hasFormat()) {
    precision = formatDescriptor().precision;
  } else if (spacing > 0.0 && spacing < 1.0) {
    precision = -static_cast<int>(std::floor(std::log10(spacing)));
  }

  labels.reserve(values.size());
  for (double v : values) {
    labels.push_back(formatDecimal(v, precision));
  }
  return labels;
}

} // namespace ct
