#pragma once
#include "ct/locator/FormatterLocator.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ct {

// Formatter/locator for plain numeric axes. Format is "x" or "x.xx..."; with
// no format, the label precision follows the tick spacing.
class ScalarFormatterLocator : public FormatterLocator {
public:
  ScalarFormatterLocator();
  explicit ScalarFormatterLocator(TickValues values, const std::string& format = "");
  explicit ScalarFormatterLocator(TickCount number, const std::string& format = "");
  explicit ScalarFormatterLocator(TickSpacing spacing, const std::string& format = "");

  const char* kind() const override { return "scalar"; }

  void setSpacing(double spacing);
  std::optional<double> spacing() const { return spacingValue(); }

  std::vector<std::string> format(const std::vector<double>& values,
                                  double spacing) const override;

protected:
  FormatDescriptor parseFormat(const std::string& format) const override;
  double sentinelSpacing() const override { return 1.1; }
  double selectStep(double dv) const override;
};

} // namespace ct
