#include "saxsred/Batch.hpp"
#include "saxsred/Average.hpp"
#include "saxsred/Background.hpp"
#include "saxsred/CurveIO.hpp"
#include "saxsred/Errors.hpp"
#include "saxsred/Merge.hpp"
#include "saxsred/StringUtils.hpp"
#include "saxsred/Transmission.hpp"

#include <filesystem>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;

namespace saxsred {
namespace batch {

namespace {

std::string output_path(const BatchOptions& opts, const std::string& name)
{
    if (opts.output_dir.empty()) return name;
    fs::create_directories(opts.output_dir);
    return (fs::path(opts.output_dir) / fs::path(name).filename()).string();
}

void check_detectors(const std::vector<Detector>& detectors)
{
    if (detectors.empty())
        throw std::invalid_argument("no detectors given");

    for (std::size_t i = 0; i < detectors.size(); ++i) {
        if (!detectors[i].dark)
            throw std::invalid_argument("detector '" + detectors[i].extension +
                                        "' has no dark reference");
        if (i == 0) continue;
        const Vector& a = detectors[i - 1].dark->q;
        const Vector& b = detectors[i].dark->q;
        if (a.size() != b.size() || !(a.array() == b.array()).all())
            throw GridMismatchError("Detectors data should have the same qgrid.");
    }
}

} // unnamed namespace

double concentration_factor(double conc)
{
    return 1.0 - 0.001 * conc / PROTEIN_WATER_DENSITY_RATIO;
}

Curve average(const std::vector<std::string>& files,
              const std::vector<Detector>&    detectors,
              const FrameReader&              reader,
              const Integrator&               integrator,
              const BatchOptions&             opts,
              const ProcessingConfig&         cfg,
              CurveObserver*                  observer)
{
    check_detectors(detectors);
    if (files.empty())
        throw std::invalid_argument("average: no files given");
    if (!opts.trans.empty() && opts.trans.size() != files.size())
        throw std::invalid_argument("average: need one trans value per file");

    MergeOptions mopts;
    mopts.qmin      = opts.qmin;
    mopts.qmax      = opts.qmax;
    mopts.fix_scale = opts.fix_scale;

    std::vector<Curve> curves;
    curves.reserve(files.size());

    for (std::size_t k = 0; k < files.size(); ++k) {
        const std::string& fn = files[k];
        std::optional<Curve> s0;
        for (const auto& d : detectors) {
            Curve d0 = load_from_2d(fn + d.extension, reader, integrator,
                                    *d.dark, d.flat.get(), d.dezinger, cfg);
            if (opts.save1d)
                save_curve(d0, output_path(opts, fn + d.extension + ".ave"));

            if (!s0) s0 = std::move(d0);
            else     merge(*s0, d0, mopts, cfg, observer);
        }
        const double trans = opts.trans.empty() ? -1.0 : opts.trans[k];
        set_trans(*s0, cfg, trans, opts.ref_trans);
        curves.push_back(std::move(*s0));
    }

    Curve result = std::move(curves.front());
    std::vector<Curve> rest(std::make_move_iterator(curves.begin() + 1),
                            std::make_move_iterator(curves.end()));
    saxsred::average(result, rest, cfg, observer);

    if (opts.save1d)
        save_curve(result, output_path(opts, result.label + ".ddd"));

    return result;
}

Curve process(const std::vector<std::string>& sample_files,
              const std::vector<std::string>& buffer_files,
              const std::vector<Detector>&    detectors,
              const FrameReader&              reader,
              const Integrator&               integrator,
              const BatchOptions&             opts,
              double                          conc,
              const ProcessingConfig&         cfg,
              CurveObserver*                  observer)
{
    BatchOptions sopts = opts;
    BatchOptions bopts = opts;
    if (!opts.trans.empty()) {
        // External trans values are listed samples first, then buffers
        if (opts.trans.size() != sample_files.size() + buffer_files.size())
            throw std::invalid_argument("process: need one trans value per file");
        sopts.trans.assign(opts.trans.begin(), opts.trans.begin() + sample_files.size());
        bopts.trans.assign(opts.trans.begin() + sample_files.size(), opts.trans.end());
    }

    Curve ds = average(sample_files, detectors, reader, integrator, sopts, cfg, observer);
    Curve db = average(buffer_files, detectors, reader, integrator, bopts, cfg, observer);

    subtract_background(ds, db, concentration_factor(conc), cfg, observer);
    return ds;
}

AnalysisResult analyze(const Curve& c,
                       double qstart,
                       double qend,
                       bool   fix_qe,
                       double qcutoff,
                       double dmax,
                       const ProcessingConfig& cfg,
                       CurveObserver* observer)
{
    AnalysisResult res;
    res.guinier = guinier_fit(c, qstart, qend, 15.0, fix_qe, observer);
    if (cfg.verbose)
        std::cout << "I0=" << fmt(res.guinier.i0) << ", Rg=" << fmt(res.guinier.rg) << '\n';

    res.pr = pair_distance(c, res.guinier.i0, res.guinier.rg, qcutoff, dmax, observer);
    return res;
}

} // namespace batch
} // namespace saxsred
