#pragma once
#include "Config.hpp"
#include "Curve.hpp"
#include "Detector.hpp"
#include "Guinier.hpp"
#include "Observer.hpp"
#include "PairDistance.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace saxsred {
namespace batch {

// average protein density relative to water (Fischer et al. 2004)
constexpr double PROTEIN_WATER_DENSITY_RATIO = 1.35;

// one detector of the set-up: frames are  <file><extension>
struct Detector {
    std::string                          extension;    // e.g. "_SAXS"
    std::shared_ptr<const DarkReference> dark;         // also provides q, mask, geometry
    std::shared_ptr<const FlatReference> flat;         // may be null
    double                               dezinger = 0.0;
};

struct BatchOptions {
    double                qmin = -1.0;          // merge window, < 0 : from data
    double                qmax = -1.0;
    std::optional<double> fix_scale;            // fixed detector ratio
    double                ref_trans = -1.0;     // normalise to this trans if > 0
    std::vector<double>   trans;                // per file, External mode only
    bool                  save1d = false;       // write .ave / .ddd files
    std::string           output_dir;           // for save1d, "" == cwd
};

struct AnalysisResult {
    GuinierResult    guinier;
    PairDistribution pr;
};

/*  Background scale for a sample of `conc` mg/ml: the protein displaces
 *  a volume fraction 0.001·conc/1.35 of the buffer.                     */
double concentration_factor(double conc);

/**
 * Reduce and average a set of exposures of one sample.
 *
 * For every file the frames of all detectors are reduced, merged in the
 * order of `detectors` and normalised (set_trans); the results are then
 * averaged into the first one.  All detectors must share the same q grid.
 */
Curve average(const std::vector<std::string>& files,
              const std::vector<Detector>&    detectors,
              const FrameReader&              reader,
              const Integrator&               integrator,
              const BatchOptions&             opts,
              const ProcessingConfig&         cfg,
              CurveObserver*                  observer = nullptr);

// average() of samples and buffers, then concentration-corrected subtraction
Curve process(const std::vector<std::string>& sample_files,
              const std::vector<std::string>& buffer_files,
              const std::vector<Detector>&    detectors,
              const FrameReader&              reader,
              const Integrator&               integrator,
              const BatchOptions&             opts,
              double                          conc,
              const ProcessingConfig&         cfg,
              CurveObserver*                  observer = nullptr);

// Guinier fit on (qstart, qend), then P(r) up to qcutoff / dmax
AnalysisResult analyze(const Curve& c,
                       double qstart,
                       double qend,
                       bool   fix_qe,
                       double qcutoff,
                       double dmax,
                       const ProcessingConfig& cfg,
                       CurveObserver* observer = nullptr);

} // namespace batch
} // namespace saxsred
