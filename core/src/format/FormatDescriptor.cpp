#include "ct/format/FormatDescriptor.hpp"
#include "ct/core/Errors.hpp"
#include <cmath>
#include <cstddef>

namespace ct {

double FormatDescriptor::baseSpacing() const {
  double spacing;
  if (decimal) {
    spacing = degreesPerUnit(unit) / std::pow(10.0, precision);
  } else {
    if (fields == 1)      spacing = 1.0;
    else if (fields == 2) spacing = 1.0 / 60.0;
    else                  spacing = (1.0 / 3600.0) / std::pow(10.0, precision);

    if (unit == UnitKind::HourAngle) spacing *= 15.0;
  }
  return spacing;
}

// Count of `c` repeated from position `pos`.
static std::size_t runLength(const std::string& s, std::size_t pos, char c) {
  std::size_t n = 0;
  while (pos + n < s.size() && s[pos + n] == c) n++;
  return n;
}

// Matches "<lead>" then optional ":mm", ":ss", ".s+" groups, in that order.
static bool matchSexagesimal(const std::string& s, const char* lead, UnitKind unit,
                             FormatDescriptor& out) {
  static const char* kGroups[] = {":mm", ":ss"};

  std::size_t pos = 0;
  for (const char* p = lead; *p; p++, pos++) {
    if (pos >= s.size() || s[pos] != *p) return false;
  }

  int fields = 1;
  int precision = 0;
  for (const char* group : kGroups) {
    if (pos == s.size()) break;
    if (s.compare(pos, 3, group) != 0) return false;
    pos += 3;
    fields++;
  }

  if (pos < s.size()) {
    // Fractional seconds are only allowed after the seconds field.
    if (fields != 3 || s[pos] != '.') return false;
    std::size_t n = runLength(s, pos + 1, 's');
    if (n == 0 || pos + 1 + n != s.size()) return false;
    precision = static_cast<int>(n);
  }

  out.decimal = false;
  out.unit = unit;
  out.fields = fields;
  out.precision = precision;
  return true;
}

// Matches "<c>" or "<c>.<c>+".
static bool matchDecimal(const std::string& s, char c, UnitKind unit,
                         FormatDescriptor& out) {
  if (s.empty() || s[0] != c) return false;

  int precision = 0;
  if (s.size() > 1) {
    if (s[1] != '.') return false;
    std::size_t n = runLength(s, 2, c);
    if (n == 0 || 2 + n != s.size()) return false;
    precision = static_cast<int>(n);
  }

  out.decimal = true;
  out.unit = unit;
  out.fields = 1;
  out.precision = precision;
  return true;
}

using FormatRule = bool (*)(const std::string&, FormatDescriptor&);

static const FormatRule kAngleRules[] = {
  [](const std::string& s, FormatDescriptor& d) {
    return matchSexagesimal(s, "dd", UnitKind::Degree, d);
  },
  [](const std::string& s, FormatDescriptor& d) {
    return matchSexagesimal(s, "hh", UnitKind::HourAngle, d);
  },
  [](const std::string& s, FormatDescriptor& d) {
    return matchDecimal(s, 'd', UnitKind::Degree, d);
  },
  [](const std::string& s, FormatDescriptor& d) {
    return matchDecimal(s, 'm', UnitKind::ArcMinute, d);
  },
  [](const std::string& s, FormatDescriptor& d) {
    return matchDecimal(s, 's', UnitKind::ArcSecond, d);
  },
};

FormatDescriptor parseAngleFormat(const std::string& format) {
  FormatDescriptor desc;
  for (FormatRule rule : kAngleRules) {
    if (rule(format, desc)) {
      desc.source = format;
      return desc;
    }
  }
  throw FormatParseError("Invalid format: " + format);
}

FormatDescriptor parseScalarFormat(const std::string& format) {
  FormatDescriptor desc;
  if (!matchDecimal(format, 'x', UnitKind::Dimensionless, desc)) {
    throw FormatParseError("Invalid format: " + format);
  }
  desc.source = format;
  return desc;
}

} // namespace ct
