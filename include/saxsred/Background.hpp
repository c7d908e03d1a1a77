#pragma once
#include "Config.hpp"
#include "Curve.hpp"
#include "Observer.hpp"

namespace saxsred {

/*  self -= bkg · (self.trans / bkg.trans) · sc_factor
 *  The errors are added linearly.  Returns the total factor applied.    */
double subtract_background(Curve& self,
                           const Curve& bkg,
                           double sc_factor,
                           const ProcessingConfig& cfg,
                           CurveObserver* observer = nullptr);

// multiply intensity and error by sc
void scale(Curve& c, double sc, const ProcessingConfig& cfg);

} // namespace saxsred
