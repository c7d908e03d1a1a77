#pragma once
#include "Types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace saxsred {

// Raw intensities inside the merge window, kept for diagnostic plots
struct OverlapData {
    Vector q;
    Vector raw_self;     // receiver before merging
    Vector raw_other;    // partner, scaled by 1/sc
};

/*  One 1D scattering profile.  Curves are created by the 2D reduction or by
 *  combining existing curves, and mutated in place by normalisation,
 *  subtraction and scaling.  Every mutation appends to `comments`.        */
struct Curve {
    Vector               q;            // Å⁻¹, strictly increasing
    Vector               intensity;
    Vector               error;        // same units as intensity

    double               trans = -1.0; // -1 == not yet determined
    double               roi   = -1.0; // beam-centre ROI sum, -1 == unknown

    std::string          label;
    std::string          comments;     // provenance, lines start with '#'

    std::optional<OverlapData> overlap;

    Eigen::Index size() const { return q.size(); }
};

// element-wise identical q grids
bool same_grid(const Curve& a, const Curve& b);

/*  Throws GridMismatchError when the two grids differ.  `what` names the
 *  operation in the message.                                             */
void require_same_grid(const Curve& a, const Curve& b, const std::string& what);

/*  Provenance of `c`, with every "# " turned into "## " so that it can be
 *  embedded one level deeper in another curve's log.                     */
std::string nested_comments(const Curve& c);

// index list of points with intensity > 0
std::vector<Eigen::Index> positive_indices(const Vector& intensity);

} // namespace saxsred
