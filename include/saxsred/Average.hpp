#pragma once
#include "Config.hpp"
#include "Curve.hpp"
#include "Observer.hpp"
#include <vector>

namespace saxsred {

/*  Average `self` with the replicate curves in `others` (in place).
 *  trans and intensity are divided by n, the error by sqrt(n).          */
void average(Curve& self,
             const std::vector<Curve>& others,
             const ProcessingConfig& cfg,
             CurveObserver* observer = nullptr);

} // namespace saxsred
