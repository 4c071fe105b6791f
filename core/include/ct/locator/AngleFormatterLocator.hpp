#pragma once
#include "ct/locator/FormatterLocator.hpp"
#include "ct/units/Units.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ct {

// Formatter/locator for angular axes. Tick positions are in degrees; labels
// are sexagesimal (dd:mm:ss, hh:mm:ss) or decimal (d, m, s) depending on the
// format. Without a format, labels are sexagesimal degrees with as many
// fields as the tick spacing needs.
class AngleFormatterLocator : public FormatterLocator {
public:
  AngleFormatterLocator();
  explicit AngleFormatterLocator(TickValues values, const std::string& format = "");
  explicit AngleFormatterLocator(TickCount number, const std::string& format = "");
  explicit AngleFormatterLocator(const Angle& spacing, const std::string& format = "");

  const char* kind() const override { return "angle"; }

  void setSpacing(const Angle& spacing);
  std::optional<Angle> spacing() const;

  // `spacing` is in degrees, as returned by locate().
  std::vector<std::string> format(const std::vector<double>& values,
                                  double spacing) const override;

protected:
  FormatDescriptor parseFormat(const std::string& format) const override;
  double sentinelSpacing() const override;
  double selectStep(double dv) const override;
};

} // namespace ct
