#include "saxsred/QGrid.hpp"
#include <stdexcept>

namespace saxsred {

Vector mod_qgrid(const Vector& q)
{
    Vector out = q;
    const Eigen::Index n = out.size();
    if (n < 3) return out;

    double dq = q[1] - q[0];
    for (Eigen::Index i = 1; i < n - 1; ++i) {
        const double dq1 = q[i + 1] - q[i];
        if (dq != dq1) {
            out[i] += (dq + dq1) / 4 - dq / 2;
            dq = dq1;
        }
    }
    return out;
}

Vector bin_widths(const Vector& q)
{
    const Eigen::Index n = q.size();
    if (n < 2)
        throw std::invalid_argument("bin_widths: need at least two grid points");

    Vector w(n);
    w[0] = q[1] - q[0];
    for (Eigen::Index i = 1; i < n; ++i)
        w[i] = 2.0 * (q[i] - q[i - 1]) - w[i - 1];
    return w;
}

Vector uniform_qgrid(double qmin, double dq, int n)
{
    if (n < 0 || dq <= 0)
        throw std::invalid_argument("uniform_qgrid: need n >= 0 and dq > 0");

    Vector q(n);
    for (int i = 0; i < n; ++i) q[i] = qmin + i * dq;
    return q;
}

} // namespace saxsred
