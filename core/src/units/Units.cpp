#include "ct/units/Units.hpp"
#include "ct/core/Errors.hpp"

namespace ct {

const char* unitName(UnitKind u) {
  switch (u) {
    case UnitKind::Degree:        return "deg";
    case UnitKind::HourAngle:     return "hourangle";
    case UnitKind::ArcMinute:     return "arcmin";
    case UnitKind::ArcSecond:     return "arcsec";
    case UnitKind::Dimensionless: return "";
  }
  return "";
}

bool parseUnitName(const std::string& name, UnitKind& out) {
  if (name == "deg" || name == "degree" || name == "degrees") {
    out = UnitKind::Degree;
  } else if (name == "hourangle" || name == "hour" || name == "h") {
    out = UnitKind::HourAngle;
  } else if (name == "arcmin" || name == "arcminute") {
    out = UnitKind::ArcMinute;
  } else if (name == "arcsec" || name == "arcsecond") {
    out = UnitKind::ArcSecond;
  } else if (name.empty()) {
    out = UnitKind::Dimensionless;
  } else {
    return false;
  }
  return true;
}

Angle::Angle(double value, UnitKind unit)
  : value_(value), unit_(unit) {
  if (!isAngular(unit)) {
    throw SpacingTypeError("spacing should be an angle quantity with units of angle");
  }
}

} // namespace ct
