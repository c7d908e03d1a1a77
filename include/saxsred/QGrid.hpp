#pragma once
#include "Types.hpp"

namespace saxsred {

/**
 * Prepare a q grid for the azimuthal integration step.
 *
 * The integrator reconstructs histogram bin boundaries from the grid as
 *
 *     width[0] = q[1] - q[0]
 *     width[i] = 2 (q[i] - q[i-1]) - width[i-1]
 *
 * so that q[i] is the centre of bin i.  Every time the spacing between
 * nodes changes, the node at the transition is moved by
 * (dq_prev + dq_next)/4 - dq_prev/2 so the recurrence does not oscillate.
 * A uniform grid comes back unchanged.
 */
Vector mod_qgrid(const Vector& q);

// bin widths implied by the recurrence above
Vector bin_widths(const Vector& q);

// uniformly spaced grid  qmin, qmin+dq, …  (n points)
Vector uniform_qgrid(double qmin, double dq, int n);

} // namespace saxsred
