#include "ct/math/NiceSteps.hpp"
#include <cmath>
#include <cstddef>

namespace ct {

// Shared minute/second table: pick steps[i] for the first limit >= dv.
static const double kMinSecLimits[] = {1.5, 2.5, 3.5, 8, 11, 18, 25, 45};
static const double kMinSecSteps[]  = {1,   2,   3,   5, 10, 15, 20, 30};
static constexpr int kMinSecCount = 8;

static const double kDegreeLimits[] = {1.5, 3, 7, 13, 20, 40, 70, 120, 270, 520};
static const double kDegreeSteps[]  = {1,   2, 5, 10, 15, 30, 45,  90, 180, 360};
static constexpr int kDegreeCount = 10;

static const double kHourMinSecLimits[] = {1.5, 2.5, 3.5, 4.5, 5.5, 8, 11, 14, 18, 25, 45};
static const double kHourMinSecSteps[]  = {1,   2,   3,   4,   5,   6, 10, 12, 15, 20, 30};
static constexpr int kHourMinSecCount = 11;

static const double kHourLimits[] = {1.5, 2.5, 3.5, 5, 7, 10, 15, 21, 36};
static const double kHourSteps[]  = {1,   2,   3,   4, 6,  8, 12, 18, 24};
static constexpr int kHourCount = 9;

// One row of a flattened (seconds, minutes, whole units) table.
struct StepRow {
  const double* limits;
  const double* steps;
  int count;
  double limitScale;  // divides the limits into the lookup unit
  double stepDeg;     // degrees per step unit
};

// Find the smallest limit >= dv across the rows in order; clamp to the last
// entry of the last row when dv exceeds every limit.
static double searchRows(const StepRow* rows, int rowCount, double dv) {
  for (int r = 0; r < rowCount; r++) {
    const StepRow& row = rows[r];
    for (int i = 0; i < row.count; i++) {
      if (row.limits[i] / row.limitScale >= dv) {
        return row.steps[i] * row.stepDeg;
      }
    }
  }
  const StepRow& last = rows[rowCount - 1];
  return last.steps[last.count - 1] * last.stepDeg;
}

double selectStepScalar(double dv) {
  static const double kSteps[] = {1.0, 2.0, 5.0, 10.0};

  double logDv = std::log10(dv);
  double base = std::floor(logDv);
  double frac = logDv - base;

  std::size_t best = 0;
  double bestDist = std::fabs(frac - std::log10(kSteps[0]));
  for (std::size_t i = 1; i < 4; i++) {
    double d = std::fabs(frac - std::log10(kSteps[i]));
    if (d < bestDist) {
      bestDist = d;
      best = i;
    }
  }
  return kSteps[best] * std::pow(10.0, base);
}

double selectStepDegree(double dvDeg) {
  const double arcsecDeg = 1.0 / 3600.0;
  if (dvDeg > arcsecDeg) {
    const StepRow rows[] = {
      {kMinSecLimits, kMinSecSteps, kMinSecCount, 3600.0, 1.0 / 3600.0},
      {kMinSecLimits, kMinSecSteps, kMinSecCount, 60.0,   1.0 / 60.0},
      {kDegreeLimits, kDegreeSteps, kDegreeCount, 1.0,    1.0},
    };
    return searchRows(rows, 3, dvDeg);
  }
  return selectStepScalar(dvDeg * 3600.0) * arcsecDeg;
}

double selectStepHour(double dvDeg) {
  const double arcsecDeg = 1.0 / 3600.0;
  if (dvDeg > 15.0 * arcsecDeg) {
    // Limits are in hours; minute/second rows step in 15 arcmin / 15 arcsec.
    const StepRow rows[] = {
      {kHourMinSecLimits, kHourMinSecSteps, kHourMinSecCount, 3600.0, 15.0 / 3600.0},
      {kHourMinSecLimits, kHourMinSecSteps, kHourMinSecCount, 60.0,   15.0 / 60.0},
      {kHourLimits,       kHourSteps,       kHourCount,       1.0,    15.0},
    };
    return searchRows(rows, 3, dvDeg / 15.0);
  }
  return selectStepScalar(dvDeg * 3600.0) * arcsecDeg;
}

} // namespace ct
