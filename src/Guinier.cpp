#include "saxsred/Guinier.hpp"

#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace saxsred {

namespace {
constexpr int    GUINIER_PASSES  = 10;
constexpr double MIN_WINDOW_SPAN = 0.004;   // qe may not shrink closer to qs
}

Vector guinier_model(const Vector& q, double i0, double rg)
{
    return (i0 * (-(q.array() * rg).square() / 3.0).exp()).matrix();
}

GuinierResult guinier_fit(const Curve& c,
                          double qs,
                          double qe,
                          double rg,
                          bool   fix_qe,
                          CurveObserver* observer)
{
    const auto pos = positive_indices(c.intensity);
    if (pos.empty())
        throw std::invalid_argument("guinier_fit: " + c.label +
                                    " has no positive intensity");
    if (qs < c.q[pos.front()]) qs = c.q[pos.front()];

    GuinierResult res;
    for (int pass = 0; pass < GUINIER_PASSES; ++pass) {
        if (!fix_qe && qe > 1.0 / rg && 1.0 / rg > qs + MIN_WINDOW_SPAN)
            qe = 1.0 / rg;

        std::vector<Eigen::Index> idx;
        for (Eigen::Index i = 0; i < c.size(); ++i)
            if (c.q[i] >= qs && c.q[i] <= qe) idx.push_back(i);
        if (idx.size() < 2)
            throw std::invalid_argument("guinier_fit: fewer than two points in (" +
                                        std::to_string(qs) + ", " +
                                        std::to_string(qe) + ")");

        /* ln I = a q² + b, ordinary least squares */
        const Eigen::Index n = static_cast<Eigen::Index>(idx.size());
        Matrix A(n, 2);
        Vector y(n);
        for (Eigen::Index k = 0; k < n; ++k) {
            const double q = c.q[idx[k]];
            A(k, 0) = q * q;
            A(k, 1) = 1.0;
            y[k]    = std::log(c.intensity[idx[k]]);
        }
        const Vector p = A.colPivHouseholderQr().solve(y);

        res.i0       = std::exp(p[1]);
        res.rg       = std::sqrt(-3.0 * p[0]);   // NaN for a rising curve
        res.n_points = static_cast<int>(n);
        rg = res.rg;
    }
    res.qs = qs;
    res.qe = qe;

    if (observer) observer->on_guinier_fit(c, res);
    return res;
}

} // namespace saxsred
