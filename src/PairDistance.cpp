#include "saxsred/PairDistance.hpp"
#include "saxsred/Interpolation.hpp"

#include <boost/math/constants/constants.hpp>
#include <boost/math/special_functions/sinc.hpp>
#include <cmath>
#include <stdexcept>

namespace saxsred {

PairDistribution pair_distance(const Curve& c,
                               double i0,
                               double rg,
                               double qmax,
                               double dmax,
                               CurveObserver* observer)
{
    const Eigen::Index n = c.size();
    if (n < 2)
        throw std::invalid_argument("pair_distance: curve needs at least two points");
    if (dmax <= 0)
        throw std::invalid_argument("pair_distance: dmax must be positive");

    if (c.q[n - 1] < qmax) qmax = c.q[n - 1];

    /* ---- uniform grid over [0, qmax), same number of points --------- */
    const double dq = qmax / static_cast<double>(n);
    Vector tq(n);
    for (Eigen::Index i = 0; i < n; ++i) tq[i] = i * dq;

    Vector tint = interp_linear(c.q, c.intensity, tq);

    /* ---- fill the gap below the beam stop with the Guinier curve ---- */
    for (Eigen::Index i = 0; i < n; ++i)
        if (tq[i] * rg < 1.0)
            tint[i] = i0 * std::exp(-(tq[i] * rg) * (tq[i] * rg) / 3.0);

    /* ---- Hanning taper against truncation ripples -------------------- *
     *  right half of a (2n+1)-point window: 1 at q=0, → 0 at q=qmax      */
    const double pi = boost::math::constants::pi<double>();
    for (Eigen::Index j = 0; j < n; ++j)
        tint[j] *= 0.5 + 0.5 * std::cos(pi * static_cast<double>(j) / n);

    /* ---- P(r) = Σ r² sinc(qr) I(q) q² ------------------------------- */
    const Eigen::Index nr = static_cast<Eigen::Index>(std::ceil(dmax));
    PairDistribution out;
    out.r.resize(nr);
    out.pr.resize(nr);

    const Vector w = (tint.array() * tq.array().square()).matrix();
    for (Eigen::Index k = 0; k < nr; ++k) {
        const double r = static_cast<double>(k);
        double sum = 0.0;
        for (Eigen::Index i = 0; i < n; ++i)
            sum += r * r * boost::math::sinc_pi(tq[i] * r) * w[i];
        out.r[k]  = r;
        out.pr[k] = sum;
    }

    const double total = out.pr.sum();
    if (total == 0.0 || !std::isfinite(total))
        throw std::runtime_error("pair_distance: P(r) of " + c.label +
                                 " cannot be normalised");
    out.pr /= total;

    if (observer) observer->on_pair_distance(c, out);
    return out;
}

} // namespace saxsred
