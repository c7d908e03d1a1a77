#include "saxsred/Interpolation.hpp"
#include <algorithm>
#include <stdexcept>

namespace saxsred {

Vector interp_linear(const Vector& x_in,
                     const Vector& y_in,
                     const Vector& x_out)
{
    const Eigen::Index n = x_in.size();
    if (n != y_in.size() || n < 2)
        throw std::invalid_argument("interp_linear: need at least two (x, y) pairs of equal length");

    const double* xb = x_in.data();
    const double* xe = xb + n;

    Vector out(x_out.size());
    for (Eigen::Index k = 0; k < x_out.size(); ++k) {
        const double x = x_out[k];
        if (x <= xb[0])     { out[k] = y_in[0];     continue; }
        if (x >= xe[-1])    { out[k] = y_in[n - 1]; continue; }

        // x_in[hi-1] < x <= x_in[hi]
        const Eigen::Index hi = std::lower_bound(xb, xe, x) - xb;
        const Eigen::Index lo = hi - 1;
        const double span = x_in[hi] - x_in[lo];
        out[k] = (span > 0) ? y_in[lo] + (y_in[hi] - y_in[lo]) * (x - x_in[lo]) / span
                            : y_in[hi];
    }
    return out;
}

} // namespace saxsred
