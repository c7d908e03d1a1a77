#pragma once
#include <string>
#include <vector>

namespace saxsred {

/*  Name of a curve combined from `a` and `b`: the longest common substring
 *  with separator characters ('_', '-', '.', ' ') stripped from both ends.
 *  Falls back to `a` if the two names have nothing usable in common.     */
std::string common_name(const std::string& a, const std::string& b);

// common_name() folded over all labels, left to right
std::string common_name(const std::vector<std::string>& labels);

// fixed-point text of v, as written into the provenance log
std::string fmt(double v, int prec = 6);

} // namespace saxsred
