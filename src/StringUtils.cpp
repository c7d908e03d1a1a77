#include "saxsred/StringUtils.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace saxsred {

static bool is_separator(char c)
{
    return c == '_' || c == '-' || c == '.' || c == ' ';
}

std::string common_name(const std::string& a, const std::string& b)
{
    if (a == b) return a;

    /* longest common substring, dynamic programming on one row at a time */
    std::vector<std::size_t> prev(b.size() + 1, 0), cur(b.size() + 1, 0);
    std::size_t best_len = 0, best_end = 0;          // end position in a

    for (std::size_t i = 1; i <= a.size(); ++i) {
        for (std::size_t j = 1; j <= b.size(); ++j) {
            cur[j] = (a[i - 1] == b[j - 1]) ? prev[j - 1] + 1 : 0;
            if (cur[j] > best_len) {
                best_len = cur[j];
                best_end = i;
            }
        }
        std::swap(prev, cur);
    }

    std::string s = a.substr(best_end - best_len, best_len);

    auto first = std::find_if_not(s.begin(), s.end(), is_separator);
    auto last  = std::find_if_not(s.rbegin(), s.rend(), is_separator).base();
    s = (first < last) ? std::string(first, last) : std::string();

    return s.empty() ? a : s;
}

std::string common_name(const std::vector<std::string>& labels)
{
    if (labels.empty()) return {};
    std::string name = labels.front();
    for (std::size_t i = 1; i < labels.size(); ++i)
        name = common_name(name, labels[i]);
    return name;
}

std::string fmt(double v, int prec)
{
    std::ostringstream s; s << std::fixed << std::setprecision(prec) << v;
    return s.str();
}

} // namespace saxsred
