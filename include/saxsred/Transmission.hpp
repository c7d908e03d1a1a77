#pragma once
#include "Config.hpp"
#include "Curve.hpp"

namespace saxsred {

/**
 * Determine the transmitted beam intensity of `c` according to
 * cfg.trans_mode and store it in c.trans.
 *
 *   External        `trans` is used as given, must be > 0
 *   FromBeamCenter  c.roi recorded when the curve was loaded
 *   FromWaxs        summed intensity under the water peak, or near the
 *                   high-q end if the curve does not reach the peak
 *
 * If ref_trans > 0 the intensity, error and any overlap arrays are rescaled
 * by ref_trans / trans and c.trans becomes ref_trans.  This should run after
 * the SAXS/WAXS merge so both detectors share one value.
 *
 * Returns the transmission that was determined (before any rescale).
 */
double set_trans(Curve& c,
                 const ProcessingConfig& cfg,
                 double trans     = -1.0,
                 double ref_trans = -1.0);

// transmission estimate from the WAXS part of the curve only
double waxs_transmission(const Curve& c, const ProcessingConfig& cfg);

} // namespace saxsred
