#pragma once
#include "Curve.hpp"
#include "Observer.hpp"

namespace saxsred {

struct GuinierResult {
    double i0       = 0.0;
    double rg       = 0.0;   // NaN if ln(I) does not decrease with q²
    double qs       = 0.0;   // final fit window
    double qe       = 0.0;
    int    n_points = 0;
};

/**
 * Estimate I0 and Rg from ln I = ln I0 - (Rg²/3) q².
 *
 * qs is raised to the first q with positive intensity.  The fit is
 * repeated 10 times; unless fix_qe, each pass shrinks qe to 1/Rg of the
 * previous pass (as long as that stays above qs + 0.004) so the window
 * converges to the region where q·Rg < 1.
 */
GuinierResult guinier_fit(const Curve& c,
                          double qs     = 0.0,
                          double qe     = 10.0,
                          double rg     = 15.0,
                          bool   fix_qe = false,
                          CurveObserver* observer = nullptr);

// I0 exp(-(q Rg)²/3)
Vector guinier_model(const Vector& q, double i0, double rg);

} // namespace saxsred
