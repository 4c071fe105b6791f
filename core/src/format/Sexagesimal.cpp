#include "ct/format/Sexagesimal.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace ct {

// Largest last-field count (in units of 10^-precision) that llround handles.
static constexpr double kMaxScaled = 9.0e18;
// 10^18 is the largest power of ten an int64 holds.
static constexpr int kMaxDigits = 18;

LabelStyle chooseAngleStyle(double spacingDeg) {
  LabelStyle style;
  style.decimal = false;
  style.unit = UnitKind::Degree;

  if (spacingDeg > 1.0) {
    style.fields = 1;
    style.precision = 0;
  } else if (spacingDeg > 1.0 / 60.0) {
    style.fields = 2;
    style.precision = 0;
  } else if (spacingDeg > 1.0 / 3600.0) {
    style.fields = 3;
    style.precision = 0;
  } else {
    style.fields = 3;
    double arcsec = spacingDeg * 3600.0;
    if (arcsec > 0.0 && std::isfinite(arcsec)) {
      style.precision = -static_cast<int>(std::floor(std::log10(arcsec)));
      if (style.precision < 0) style.precision = 0;
    } else {
      style.precision = 0;
    }
  }
  return style;
}

const char* sexagesimalSeparator(UnitKind unit, int index) {
  static const char* kDegreeSeps[] = {"\xC2\xB0", "\xE2\x80\xB2", "\xE2\x80\xB3"};  // ° ′ ″
  static const char* kHourSeps[] = {"h", "m", "s"};
  if (index < 0 || index > 2) return "";
  return unit == UnitKind::HourAngle ? kHourSeps[index] : kDegreeSeps[index];
}

std::string formatDecimal(double value, int precision) {
  if (precision < 0) precision = 0;

  int n = std::snprintf(nullptr, 0, "%.*f", precision, value);
  if (n <= 0) return {};
  std::vector<char> buf(static_cast<std::size_t>(n) + 1);
  std::snprintf(buf.data(), buf.size(), "%.*f", precision, value);
  std::string out(buf.data(), static_cast<std::size_t>(n));

  // "-0.00" -> "0.00"
  if (!out.empty() && out[0] == '-' &&
      out.find_first_of("123456789", 1) == std::string::npos &&
      out.find_first_of("ni", 1) == std::string::npos) {
    out.erase(0, 1);
  }
  return out;
}

std::string formatSexagesimal(double value, int fields, int precision, UnitKind unit) {
  if (!std::isfinite(value)) return formatDecimal(value, precision);
  if (fields < 1) fields = 1;
  if (fields > 3) fields = 3;
  if (precision < 0) precision = 0;

  bool negative = value < 0.0;
  double scaled = std::fabs(value) * std::pow(60.0, fields - 1);

  // Rounded count of 10^-digits last-field units. Digits beyond what fits in
  // an int64 are emitted as zeros.
  int digits = std::min(precision, kMaxDigits);
  while (digits > 0 && scaled * std::pow(10.0, digits) >= kMaxScaled) digits--;
  double scaledTotal = std::round(scaled * std::pow(10.0, digits));
  if (scaledTotal >= kMaxScaled) return formatDecimal(value, precision);
  auto total = static_cast<std::int64_t>(scaledTotal);
  if (total == 0) negative = false;

  std::int64_t p10 = 1;
  for (int i = 0; i < digits; i++) p10 *= 10;
  std::int64_t frac = total % p10;
  std::int64_t whole = total / p10;

  std::int64_t parts[3] = {0, 0, 0};
  for (int i = fields - 1; i > 0; i--) {
    parts[i] = whole % 60;
    whole /= 60;
  }
  parts[0] = whole;

  std::string out;
  if (negative) out += '-';

  char buf[32];
  for (int i = 0; i < fields; i++) {
    if (i == 0) {
      std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(parts[i]));
    } else {
      std::snprintf(buf, sizeof(buf), "%02lld", static_cast<long long>(parts[i]));
    }
    out += buf;

    if (i == fields - 1 && precision > 0) {
      out += '.';
      if (digits > 0) {
        std::snprintf(buf, sizeof(buf), "%0*lld", digits, static_cast<long long>(frac));
        out += buf;
      }
      out.append(static_cast<std::size_t>(precision - digits), '0');
    }
    out += sexagesimalSeparator(unit, i);
  }
  return out;
}

std::string formatAngle(double degrees, const LabelStyle& style) {
  double v = fromDegrees(degrees, style.unit);
  if (style.decimal) return formatDecimal(v, style.precision);
  return formatSexagesimal(v, style.fields, style.precision, style.unit);
}

} // namespace ct
