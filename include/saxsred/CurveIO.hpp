#pragma once
#include "Curve.hpp"
#include <string>

namespace saxsred {

/*  Plain text:  q  I  err  per row, each "%12.5f", followed by the curve's
 *  provenance block.  Rows with I <= 0 are skipped if nonzero_only.      */
void save_curve(const Curve& c, const std::string& path, bool nonzero_only = true);

/*  Reads a file written by save_curve().  Comment lines ('#') anywhere in
 *  the file are collected back into `comments`; label = file name.       */
Curve load_curve(const std::string& path);

} // namespace saxsred
