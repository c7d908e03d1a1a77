#pragma once
#include "Config.hpp"
#include "Curve.hpp"
#include "Observer.hpp"
#include <optional>

namespace saxsred {

struct MergeOptions {
    double qmin = -1.0;                  // < 0 : determined from the data
    double qmax = -1.0;
    std::optional<double> fix_scale;     // fixed detector intensity ratio
};

struct MergeResult {
    double scale     = 1.0;              // `other` was divided by this
    double qmin      = 0.0;              // window actually used
    double qmax      = 0.0;
    int    n_overlap = 0;                // points inside (qmin, qmax)
};

/*  Combine `self` with `other` (same q grid), e.g. SAXS with WAXS.
 *  `other` is scaled to match `self` in the overlap window, the two are
 *  averaged inside it and `other` replaces `self` from qmax upwards.
 *  `other` itself is not modified.                                        */
MergeResult merge(Curve& self,
                  const Curve& other,
                  const MergeOptions& opts,
                  const ProcessingConfig& cfg,
                  CurveObserver* observer = nullptr);

/*  Least-squares scale `sc` for  a·sc ≈ b  (no offset term).             */
double fit_scale(const Vector& a, const Vector& b);

} // namespace saxsred
