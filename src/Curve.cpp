#include "saxsred/Curve.hpp"
#include "saxsred/Errors.hpp"

namespace saxsred {

bool same_grid(const Curve& a, const Curve& b)
{
    if (a.q.size() != b.q.size()) return false;
    return (a.q.array() == b.q.array()).all();
}

void require_same_grid(const Curve& a, const Curve& b, const std::string& what)
{
    if (!same_grid(a, b))
        throw GridMismatchError(what + " failed: qgrid mismatch between '" +
                                a.label + "' and '" + b.label + "'");
}

std::string nested_comments(const Curve& c)
{
    std::string out = c.comments;
    std::string::size_type pos = 0;
    while ((pos = out.find("# ", pos)) != std::string::npos) {
        out.insert(pos, "#");
        pos += 3;
    }
    return out;
}

std::vector<Eigen::Index> positive_indices(const Vector& intensity)
{
    std::vector<Eigen::Index> idx;
    idx.reserve(intensity.size());
    for (Eigen::Index i = 0; i < intensity.size(); ++i)
        if (intensity[i] > 0) idx.push_back(i);
    return idx;
}

} // namespace saxsred
