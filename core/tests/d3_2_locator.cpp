// D3.2 - Locator test (pure C++)
// Tests: integer-multiple tick generation, empty ranges, explicit values,
// idempotence, and the formatter applied to located ticks.

#include "ct/locator/AngleFormatterLocator.hpp"
#include "ct/locator/ScalarFormatterLocator.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static int tests = 0;
static int passed = 0;

static void check(bool cond, const char* msg) {
  tests++;
  if (!cond) {
    std::fprintf(stderr, "FAIL: %s\n", msg);
    std::exit(1);
  }
  passed++;
  std::printf("  OK: %s\n", msg);
}

static bool near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

static bool startsWith(const std::string& s, const std::string& p) {
  return s.compare(0, p.size(), p) == 0;
}

static bool endsWith(const std::string& s, const std::string& p) {
  return s.size() >= p.size() && s.compare(s.size() - p.size(), p.size(), p) == 0;
}

int main() {
  // dd:mm:ss over [10, 10.05] deg with five requested ticks
  {
    ct::AngleFormatterLocator fl(ct::TickCount{5}, "dd:mm:ss");
    auto ticks = fl.locate(10.0, 10.05);
    check(near(ticks.spacing, 30.0 / 3600.0, 1e-15), "spacing = 30\"");
    check(ticks.values.size() == 7, "7 ticks (10d00'00\" .. 10d03'00\")");

    bool onArcsec = true, inRange = true, ascending = true;
    for (std::size_t i = 0; i < ticks.values.size(); i++) {
      double v = ticks.values[i];
      double sec = v * 3600.0;
      if (!near(sec, std::round(sec), 1e-6)) onArcsec = false;
      if (v < 10.0 - 1e-12 || v > 10.05 + 1e-12) inRange = false;
      if (i > 0 && !(ticks.values[i] > ticks.values[i - 1])) ascending = false;
    }
    check(onArcsec, "ticks on whole arcseconds");
    check(inRange, "ticks within range");
    check(ascending, "ticks ascending");

    auto labels = fl.format(ticks.values, ticks.spacing);
    check(labels.size() == ticks.values.size(), "one label per tick");
    bool pattern = true;
    for (const auto& l : labels) {
      // DD°MM′SS″
      if (!startsWith(l, "10\xC2\xB0" "0") || !endsWith(l, "\xE2\x80\xB3") ||
          l.find("\xE2\x80\xB2") == std::string::npos) {
        pattern = false;
      }
    }
    check(pattern, "labels match DD\xC2\xB0MM\xE2\x80\xB2SS\xE2\x80\xB3");
    check(labels.front() == "10\xC2\xB0" "00\xE2\x80\xB2" "00\xE2\x80\xB3", "first label 10d00'00\"");
    check(labels.back() == "10\xC2\xB0" "03\xE2\x80\xB2" "00\xE2\x80\xB3", "last label 10d03'00\"");
  }

  // x.xx with explicit spacing 0.1 over [0, 0.35]
  {
    ct::ScalarFormatterLocator fl(ct::TickSpacing{0.1}, "x.xx");
    auto ticks = fl.locate(0.0, 0.35);
    check(ticks.values.size() == 4, "4 scalar ticks");
    check(near(ticks.values[0], 0.0) && near(ticks.values[1], 0.1) &&
          near(ticks.values[2], 0.2) && near(ticks.values[3], 0.3), "positions 0, 0.1, 0.2, 0.3");
    auto labels = fl.format(ticks.values, ticks.spacing);
    check(labels.size() == 4 && labels[0] == "0.00" && labels[1] == "0.10" &&
          labels[2] == "0.20" && labels[3] == "0.30", "labels 0.00 0.10 0.20 0.30");
  }

  // Empty range: no multiple of the spacing inside
  {
    ct::ScalarFormatterLocator fl(ct::TickSpacing{1.0});
    auto ticks = fl.locate(5.2, 5.8);
    check(ticks.values.empty(), "[5.2, 5.8] spacing 1 -> no ticks");
    check(near(ticks.spacing, 1.0), "spacing still reported");
    check(fl.format(ticks.values, ticks.spacing).empty(), "format(empty) -> empty");

    auto single = fl.locate(5.0, 5.0);
    check(single.values.size() == 1 && near(single.values[0], 5.0), "[5, 5] -> single tick at 5");

    auto reversed = fl.locate(8.0, 2.0);
    check(reversed.values.empty(), "min > max -> no ticks");

    auto nan = fl.locate(std::nan(""), 3.0);
    check(nan.values.empty(), "NaN bound -> no ticks");
  }

  // Negative ranges
  {
    ct::AngleFormatterLocator fl(ct::Angle::arcmin(30.0), "dd:mm");
    auto ticks = fl.locate(-1.2, 0.7);
    check(ticks.values.size() == 4, "[-1.2, 0.7] every 30' -> 4 ticks");
    auto labels = fl.format(ticks.values, ticks.spacing);
    check(labels[0] == "-1\xC2\xB0" "00\xE2\x80\xB2", "-1d00'");
    check(labels[1] == "-0\xC2\xB0" "30\xE2\x80\xB2", "-0d30'");
    check(labels[2] == "0\xC2\xB0" "00\xE2\x80\xB2", "0d00'");
    check(labels[3] == "0\xC2\xB0" "30\xE2\x80\xB2", "0d30'");
  }

  // Multiples come from the integer index, so no drift over many ticks
  {
    ct::ScalarFormatterLocator fl(ct::TickSpacing{0.1}, "x.x");
    auto ticks = fl.locate(0.0, 1000.0);
    check(ticks.values.size() == 10001, "10001 ticks over [0, 1000]");
    auto labels = fl.format(ticks.values, ticks.spacing);
    check(labels[9999] == "999.9", "tick 9999 -> 999.9");
    check(labels.back() == "1000.0", "last tick -> 1000.0");
  }

  // Explicit values are returned verbatim with the sentinel spacing
  {
    ct::AngleFormatterLocator fl(ct::TickValues{{1.0, 50.0, 100.0}});
    auto ticks = fl.locate(0.0, 10.0);
    check(ticks.values.size() == 3 && near(ticks.values[2], 100.0), "values not clipped");
    check(near(ticks.spacing, 1.1 / 3600.0, 1e-15), "sentinel spacing 1.1\"");

    ct::ScalarFormatterLocator sfl(ct::TickValues{{0.5, -3.0}});
    auto sticks = sfl.locate(100.0, 200.0);
    check(sticks.values.size() == 2 && near(sticks.values[1], -3.0), "scalar values kept in order");
    check(near(sticks.spacing, 1.1), "scalar sentinel 1.1");
  }

  // Hour-angle axis with counted ticks
  {
    ct::AngleFormatterLocator fl(ct::TickCount{5}, "hh:mm");
    auto ticks = fl.locate(0.0, 90.0);
    check(near(ticks.spacing, 15.0), "1h spacing");
    auto labels = fl.format(ticks.values, ticks.spacing);
    check(labels.size() == 7 && labels[0] == "0h00m" && labels[6] == "6h00m", "0h00m .. 6h00m");
  }

  // Counted ticks under decimal angle formats land on the format's own grid
  {
    struct Case { const char* format; double lo, hi; };
    const Case cases[] = {
      {"d.d", 0.0, 0.6},
      {"m", 0.0, 0.2},
      {"s.s", 0.0, 0.001},
      {"d.dd", -1.3, 2.9},
      {"m.m", 10.0, 10.7},
    };
    for (const Case& c : cases) {
      ct::AngleFormatterLocator fl(ct::TickCount{5}, c.format);
      auto ticks = fl.locate(c.lo, c.hi);
      double base = fl.baseSpacing();
      double rem = std::fmod(ticks.spacing, base);
      check(std::fmin(rem, base - rem) <= ct::kSpacingTolerance, c.format);

      auto labels = fl.format(ticks.values, ticks.spacing);
      bool distinct = labels.size() >= 3;
      for (std::size_t i = 1; i < labels.size(); i++) {
        if (labels[i] == labels[i - 1]) distinct = false;
      }
      check(distinct, "counted decimal labels are distinct");
    }

    ct::AngleFormatterLocator fl(ct::TickCount{5}, "d.d");
    auto ticks = fl.locate(0.0, 0.6);
    check(near(ticks.spacing, 0.1), "d.d over [0, 0.6] -> 0.1 deg");
    auto labels = fl.format(ticks.values, ticks.spacing);
    check(labels.size() >= 6 && labels[2] == "0.2" && labels[3] == "0.3", "0.2 once, then 0.3");
  }

  // A spacing far too fine for the range gives no ticks and a warning
  {
    std::vector<ct::Diagnostic> diags;
    ct::ScalarFormatterLocator fl(ct::TickSpacing{1e-9});
    fl.setDiagnosticHandler([&](const ct::Diagnostic& d) { diags.push_back(d); });
    auto ticks = fl.locate(0.0, 1.0);
    check(ticks.values.empty(), "1e9 ticks refused");
    check(near(ticks.spacing, 1e-9, 1e-20), "spacing still reported");
    check(diags.size() == 1 && diags[0].code == "TOO_MANY_TICKS", "TOO_MANY_TICKS diagnostic");

    auto ok = fl.locate(0.0, 1e-4);
    check(ok.values.size() == 100001 && diags.size() == 1, "1e5 ticks still located");
  }

  // Idempotence
  {
    ct::AngleFormatterLocator fl(ct::TickCount{6});
    auto a = fl.locate(-33.3, 71.9);
    auto b = fl.locate(-33.3, 71.9);
    check(a.spacing == b.spacing && a.values == b.values, "locate is idempotent");
    check(fl.format(a.values, a.spacing) == fl.format(b.values, b.spacing), "format is idempotent");
  }

  std::printf("D3.2 locator: %d/%d PASS\n", passed, tests);
  return 0;
}
