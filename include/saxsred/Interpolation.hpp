#pragma once
#include "Types.hpp"

namespace saxsred {

/**
 * Linear interpolation of the table (x_in, y_in) at x_out, without
 * extrapolation: points outside [x_in.front, x_in.back] get the end values.
 * x_in must be ascending; x_out may come in any order.
 */
Vector interp_linear(const Vector& x_in,
                     const Vector& y_in,
                     const Vector& x_out);

} // namespace saxsred
