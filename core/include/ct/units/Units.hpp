#pragma once
#include <cstdint>
#include <string>

namespace ct {

enum class UnitKind : std::uint8_t {
  Degree        = 0,
  HourAngle     = 1,
  ArcMinute     = 2,
  ArcSecond     = 3,
  Dimensionless = 4
};

inline bool isAngular(UnitKind u) {
  return u != UnitKind::Dimensionless;
}

// Size of one unit in degrees. Dimensionless has no angular size (returns 1).
inline double degreesPerUnit(UnitKind u) {
  switch (u) {
    case UnitKind::Degree:        return 1.0;
    case UnitKind::HourAngle:     return 15.0;
    case UnitKind::ArcMinute:     return 1.0 / 60.0;
    case UnitKind::ArcSecond:     return 1.0 / 3600.0;
    case UnitKind::Dimensionless: return 1.0;
  }
  return 1.0;
}

inline double toDegrees(double value, UnitKind from) {
  return value * degreesPerUnit(from);
}

inline double fromDegrees(double degrees, UnitKind to) {
  return degrees / degreesPerUnit(to);
}

// Short names used in JSON configuration: "deg", "hourangle", "arcmin",
// "arcsec", "" (dimensionless).
const char* unitName(UnitKind u);

// Accepts the short names plus a few common aliases. Returns false if unknown.
bool parseUnitName(const std::string& name, UnitKind& out);

// An angular quantity. Constructing one from Dimensionless throws
// SpacingTypeError.
class Angle {
public:
  Angle(double value, UnitKind unit);

  static Angle degrees(double v)  { return Angle(v, UnitKind::Degree); }
  static Angle hours(double v)    { return Angle(v, UnitKind::HourAngle); }
  static Angle arcmin(double v)   { return Angle(v, UnitKind::ArcMinute); }
  static Angle arcsec(double v)   { return Angle(v, UnitKind::ArcSecond); }

  double value() const { return value_; }
  UnitKind unit() const { return unit_; }

  double to(UnitKind u) const { return fromDegrees(inDegrees(), u); }
  double inDegrees() const { return toDegrees(value_, unit_); }

  bool operator<(const Angle& o) const { return inDegrees() < o.inDegrees(); }
  bool operator==(const Angle& o) const { return inDegrees() == o.inDegrees(); }

private:
  double value_;
  UnitKind unit_;
};

} // namespace ct
