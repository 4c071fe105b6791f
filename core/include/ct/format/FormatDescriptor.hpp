#pragma once
#include "ct/units/Units.hpp"
#include <string>

namespace ct {

// Structural description of a tick label format string.
//
//   "dd:mm:ss.ss"  -> sexagesimal, Degree,    3 fields, precision 2
//   "hh:mm"        -> sexagesimal, HourAngle, 2 fields, precision 0
//   "d.ddd"        -> decimal,     Degree,    1 field,  precision 3
//   "m" / "s.s"    -> decimal,     ArcMinute / ArcSecond
//   "x.xx"         -> decimal,     Dimensionless (scalar axes only)
struct FormatDescriptor {
  std::string source;
  bool decimal{true};
  UnitKind unit{UnitKind::Degree};
  int fields{1};
  int precision{0};

  // Finest spacing the format can represent exactly, in degrees for angular
  // units and in raw units for Dimensionless.
  double baseSpacing() const;
};

// Angle grammars, tried in order: dd[:mm[:ss[.s+]]], hh[:mm[:ss[.s+]]],
// d[.d+], m[.m+], s[.s+]. Throws FormatParseError if none matches.
FormatDescriptor parseAngleFormat(const std::string& format);

// Scalar grammar: x[.x+]. Throws FormatParseError otherwise.
FormatDescriptor parseScalarFormat(const std::string& format);

} // namespace ct
