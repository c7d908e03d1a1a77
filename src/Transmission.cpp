#include "saxsred/Transmission.hpp"
#include "saxsred/Errors.hpp"
#include "saxsred/StringUtils.hpp"

#include <algorithm>
#include <iostream>
#include <limits>

namespace saxsred {

namespace {

struct WaxsEstimate {
    double trans     = 0.0;
    double qavg      = std::numeric_limits<double>::quiet_NaN();
    bool   near_peak = false;   // false == high-q end fallback
    bool   below_threshold = false;
};

WaxsEstimate estimate_waxs(const Curve& c, const ProcessingConfig& cfg)
{
    WaxsEstimate est;

    /* ---- points under the water peak ------------------------------- */
    std::vector<Eigen::Index> idx;
    for (Eigen::Index i = 0; i < c.size(); ++i)
        if (c.q[i] > cfg.water_peak_qmin && c.q[i] < cfg.water_peak_qmax)
            idx.push_back(i);

    if (idx.size() >= 5) {
        est.near_peak = true;
    } else {
        /* ---- not enough points: use the high-q end instead ---------- *
         *  positive samples [-12:-2], i.e. the last ten but two         */
        const auto pos = positive_indices(c.intensity);
        const std::ptrdiff_t n     = static_cast<std::ptrdiff_t>(pos.size());
        const std::ptrdiff_t first = std::max<std::ptrdiff_t>(n - 12, 0);
        const std::ptrdiff_t last  = std::max<std::ptrdiff_t>(n - 2, 0);

        idx.clear();
        for (std::ptrdiff_t k = first; k < last; ++k) idx.push_back(pos[k]);

        for (auto i : idx)
            if (c.intensity[i] < cfg.waxs_threshold) est.below_threshold = true;
    }

    if (idx.empty()) return est;

    double qsum = 0.0;
    for (auto i : idx) {
        est.trans += c.intensity[i];
        qsum      += c.q[i];
    }
    est.qavg = qsum / static_cast<double>(idx.size());
    return est;
}

} // unnamed namespace

double waxs_transmission(const Curve& c, const ProcessingConfig& cfg)
{
    return estimate_waxs(c, cfg).trans;
}

double set_trans(Curve& c,
                 const ProcessingConfig& cfg,
                 double trans,
                 double ref_trans)
{
    switch (cfg.trans_mode) {
    case TransMode::FromBeamCenter:
        if (c.roi < 0)
            throw InvalidTransmissionError(
                "trans mode is beam_center but no ROI intensity was recorded for " +
                c.label);
        c.trans = c.roi;
        c.comments += "# transmitted beam intensity from beam center, ";
        break;

    case TransMode::FromWaxs: {
        const WaxsEstimate est = estimate_waxs(c, cfg);
        if (est.below_threshold)
            std::cerr << "WARNING: the data points for trans calculation of "
                      << c.label << " are below WAXS threshold "
                      << cfg.waxs_threshold << '\n';
        if (cfg.verbose)
            std::cout << (est.near_peak ? "using data near water peak (q~"
                                        : "using data near the high q end (q~")
                      << fmt(est.qavg) << ") ";
        c.trans = est.trans;
        c.comments += "# transmitted beam intensity from WAXS (q~" +
                      fmt(est.qavg, 2) + ")";
        break;
    }

    case TransMode::External:
        if (trans <= 0)
            throw InvalidTransmissionError(
                "trans mode is external but trans value is not provided for " +
                c.label);
        c.comments += "# transmitted beam intensity is defined externally";
        c.trans = trans;
        break;

    default:
        throw InvalidConfigurationError(
            "invalid trans mode: " +
            std::to_string(static_cast<int>(cfg.trans_mode)));
    }

    c.comments += ": " + fmt(c.trans) + " \n";
    if (cfg.verbose)
        std::cout << "trans for " << c.label << " set to " << fmt(c.trans) << '\n';

    const double determined = c.trans;

    if (ref_trans > 0) {
        if (!(c.trans > 0))
            throw InvalidTransmissionError(
                "cannot normalise " + c.label + " to ref_trans: trans is " +
                fmt(c.trans));

        const double f = ref_trans / c.trans;
        c.comments += "# scattering intensity normalized to ref_trans = " +
                      fmt(ref_trans) + " \n";
        c.intensity *= f;
        c.error     *= f;
        if (c.overlap) {
            c.overlap->raw_self  *= f;
            c.overlap->raw_other *= f;
        }
        c.trans = ref_trans;
        if (cfg.verbose)
            std::cout << "normalized to " << fmt(ref_trans) << '\n';
    }
    return determined;
}

} // namespace saxsred
