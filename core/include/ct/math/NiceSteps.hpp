#pragma once

namespace ct {

// Snap a raw spacing to the nearest of {1, 2, 5, 10} × 10^n (compared in
// log space). Input must be positive and finite.
double selectStepScalar(double dv);

// Snap a raw spacing in degrees to a sexagesimal-friendly step
// (1/2/3/5/10/15/20/30 arcsec or arcmin, 1/2/5/10/15/30/45/90/180/360 deg).
// Below 1 arcsec falls back to selectStepScalar in arcseconds. Returns degrees.
double selectStepDegree(double dvDeg);

// Same for hour-angle axes: steps are whole hours (1..24), or 15 × the
// minute/second table. Below 15 arcsec falls back to selectStepScalar in
// arcseconds. Takes and returns degrees.
double selectStepHour(double dvDeg);

} // namespace ct
