#include "saxsred/Merge.hpp"
#include "saxsred/StringUtils.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace saxsred {

namespace {

Vector gather(const Vector& v, const std::vector<Eigen::Index>& idx)
{
    Vector out(static_cast<Eigen::Index>(idx.size()));
    for (std::size_t k = 0; k < idx.size(); ++k)
        out[static_cast<Eigen::Index>(k)] = v[idx[k]];
    return out;
}

} // unnamed namespace

double fit_scale(const Vector& a, const Vector& b)
{
    if (a.size() != b.size() || a.size() == 0)
        throw std::invalid_argument("fit_scale: need two non-empty vectors of equal length");

    /* one-column design matrix, no offset term */
    Matrix A(a.size(), 1);
    A.col(0) = a;
    const Vector sc = A.colPivHouseholderQr().solve(b);
    return sc[0];
}

MergeResult merge(Curve& self,
                  const Curve& other,
                  const MergeOptions& opts,
                  const ProcessingConfig& cfg,
                  CurveObserver* observer)
{
    if (cfg.verbose)
        std::cout << "merging data: " << self.label << " and "
                  << other.label << " ...\n";
    require_same_grid(self, other, "merging");

    MergeResult res;
    double qmin = opts.qmin;
    double qmax = opts.qmax;

    /* ---------------------------------------------------------------- */
    /*  1. overlapping region                                            */
    /* ---------------------------------------------------------------- */
    std::vector<Eigen::Index> idx;
    for (Eigen::Index i = 0; i < self.size(); ++i)
        if (self.intensity[i] > 0 && other.intensity[i] > 0) idx.push_back(i);

    std::optional<OverlapData> overlap;

    if (!idx.empty()) {
        double qmin0 =  std::numeric_limits<double>::infinity();
        double qmax0 = -std::numeric_limits<double>::infinity();
        for (auto i : idx) {
            qmin0 = std::min(qmin0, other.q[i]);
            qmax0 = std::max(qmax0, self.q[i]);
        }
        /* a caller bound < 0 means "unbounded": the data bound wins */
        if (qmax < 0 || qmax0 < qmax) qmax = qmax0;
        if (qmin0 > qmin)             qmin = qmin0;

        idx.clear();
        for (Eigen::Index i = 0; i < self.size(); ++i)
            if (self.q[i] > qmin && self.q[i] < qmax) idx.push_back(i);

        overlap = OverlapData{gather(self.q, idx),
                              gather(self.intensity, idx),
                              gather(other.intensity, idx)};
    } else {
        /* no overlap: stack `other` onto the high-q end of `self` */
        const auto pos = positive_indices(self.intensity);
        qmin = qmax = pos.empty() ? self.q[0] : self.q[pos.back()];
    }

    /* ---------------------------------------------------------------- */
    /*  2. size of the overlap                                           */
    /* ---------------------------------------------------------------- */
    double fix_scale = opts.fix_scale.value_or(-1.0);
    if (opts.fix_scale && !(*opts.fix_scale > 0)) {
        std::cerr << "WARNING: ignoring non-positive fix_scale=" << fmt(*opts.fix_scale)
                  << " for " << self.label << " and " << other.label << ".\n";
        fix_scale = -1.0;
    }
    const std::size_t n_overlap = idx.size();

    if (n_overlap < 2) {
        std::cerr << "WARNING: data sets " << self.label << " and " << other.label
                  << " are not overlapping in the given q range.\n";
        if (fix_scale < 0) {
            fix_scale = 1.0;
            std::cerr << "WARNING: forcing fix_scale=1.\n";
        }
    } else if (n_overlap < 10) {
        std::cerr << "WARNING: too few overlapping points: " << n_overlap << '\n';
    }

    /* ---------------------------------------------------------------- */
    /*  3. scale factor                                                  */
    /* ---------------------------------------------------------------- */
    double sc;
    if (fix_scale > 0) {
        // the SAXS/WAXS ratio is a constant of the instrument geometry,
        // calibrated once on a sample with a strong overlap
        sc = fix_scale;
    } else {
        sc = fit_scale(gather(self.intensity, idx), gather(other.intensity, idx));
    }

    /* ---------------------------------------------------------------- */
    /*  4. apply                                                         */
    /* ---------------------------------------------------------------- */
    Curve scaled = other;
    scaled.intensity /= sc;
    scaled.error     /= sc;
    if (overlap) overlap->raw_other /= sc;

    self.label = common_name(self.label, other.label);
    if (cfg.verbose) {
        std::cout << "set2 scaled by 1/" << fmt(sc) << '\n';
        std::cout << "merged set re-named " << self.label << ".\n";
    }

    for (auto i : idx) {
        self.intensity[i] = (self.intensity[i] + scaled.intensity[i]) / 2;
        self.error[i]     = (self.error[i]     + scaled.error[i])     / 2;
    }
    for (Eigen::Index i = 0; i < self.size(); ++i) {
        if (self.q[i] >= qmax) {
            self.intensity[i] = scaled.intensity[i];
            self.error[i]     = scaled.error[i];
        }
    }
    if (overlap) self.overlap = std::move(overlap);

    self.comments += "# merged with the following set by matching intensity within (" +
                     fmt(qmin, 4) + ", " + fmt(qmax, 4) + "),";
    self.comments += " scaled by " + fmt(sc) + "\n";
    self.comments += nested_comments(other);

    res.scale     = sc;
    res.qmin      = qmin;
    res.qmax      = qmax;
    res.n_overlap = static_cast<int>(n_overlap);

    if (observer) observer->on_merged(self, scaled, res);
    return res;
}

} // namespace saxsred
