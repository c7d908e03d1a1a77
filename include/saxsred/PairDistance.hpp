#pragma once
#include "Curve.hpp"
#include "Observer.hpp"

namespace saxsred {

struct PairDistribution {
    Vector r;        // Å, 0, 1, 2, …
    Vector pr;       // normalised to sum 1
};

/**
 * Pair-distance distribution P(r) of `c`.
 *
 * The curve is interpolated onto a uniform grid over [0, qmax) with the
 * same number of points, the low-q part (q·Rg < 1) is replaced by the
 * Guinier curve from i0/rg, a Hanning taper is applied and
 *
 *     P(r) = Σ_q  r² sinc(q r) I(q) q²
 *
 * is evaluated for r = 0 … dmax-1.
 */
PairDistribution pair_distance(const Curve& c,
                               double i0,
                               double rg,
                               double qmax = 5.0,
                               double dmax = 200.0,
                               CurveObserver* observer = nullptr);

} // namespace saxsred
