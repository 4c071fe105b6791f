#pragma once
#include "ct/units/Units.hpp"
#include <string>

namespace ct {

// Label layout chosen either from a FormatDescriptor or from the tick spacing.
struct LabelStyle {
  bool decimal{false};
  UnitKind unit{UnitKind::Degree};
  int fields{3};
  int precision{0};
};

// Choose a sexagesimal degree style that distinguishes ticks `spacingDeg`
// apart: >1 deg -> "dd", >1' -> "dd:mm", >1" -> "dd:mm:ss", else fractional
// seconds with -floor(log10(arcsec)) digits.
LabelStyle chooseAngleStyle(double spacingDeg);

// Field separators appended after each field: degree symbols for Degree,
// "h", "m", "s" for HourAngle. `index` is 0..2.
const char* sexagesimalSeparator(UnitKind unit, int index);

// Render `value` (already in the display unit) with `fields` base-60 fields.
// The last field is rounded to `precision` digits with carries propagated;
// fields after the first are zero-padded to two digits.
std::string formatSexagesimal(double value, int fields, int precision, UnitKind unit);

// Fixed-point rendering with exactly `precision` fractional digits.
std::string formatDecimal(double value, int precision);

// Render an angle given in degrees according to `style`.
std::string formatAngle(double degrees, const LabelStyle& style);

} // namespace ct
