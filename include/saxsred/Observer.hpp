#pragma once
#include "Curve.hpp"
#include <vector>

namespace saxsred {

struct MergeResult;
struct GuinierResult;
struct PairDistribution;

/* --------------------------------------------------------------------- */
/*  Side-effect-only hooks for diagnostics (plots, tables).  The numerical */
/*  core calls these at fixed points and never depends on what they do.   */
/*  All callbacks default to no-ops.                                      */
/* --------------------------------------------------------------------- */
class CurveObserver {
public:
    virtual ~CurveObserver() = default;

    // `merged` is the receiver after merging, `other` the scaled partner
    virtual void on_merged(const Curve& /*merged*/,
                           const Curve& /*other*/,
                           const MergeResult& /*result*/) {}

    // `members` are the inputs as they were before averaging
    virtual void on_averaged(const Curve& /*averaged*/,
                             const std::vector<Curve>& /*members*/) {}

    // `factor` is the total scale applied to the background
    virtual void on_background_subtracted(const Curve& /*sample*/,
                                          const Curve& /*background*/,
                                          double /*factor*/) {}

    virtual void on_guinier_fit(const Curve& /*curve*/,
                                const GuinierResult& /*fit*/) {}

    virtual void on_pair_distance(const Curve& /*curve*/,
                                  const PairDistribution& /*pr*/) {}
};

} // namespace saxsred
