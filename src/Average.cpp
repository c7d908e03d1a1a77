#include "saxsred/Average.hpp"
#include "saxsred/StringUtils.hpp"

#include <cmath>
#include <iostream>

namespace saxsred {

void average(Curve& self,
             const std::vector<Curve>& others,
             const ProcessingConfig& cfg,
             CurveObserver* observer)
{
    if (cfg.verbose) std::cout << "averaging data with " << self.label << ":";

    for (const auto& d : others)
        require_same_grid(self, d, "averaging");

    std::vector<Curve> members;
    if (observer) {
        members.reserve(others.size() + 1);
        members.push_back(self);
        members.insert(members.end(), others.begin(), others.end());
    }

    int n = 1;
    for (const auto& d : others) {
        if (cfg.verbose) std::cout << ' ' << d.label;
        self.trans     += d.trans;
        self.intensity += d.intensity;
        self.error     += d.error;
        self.comments  += "# averaged with \n" + nested_comments(d);
        self.label      = common_name(self.label, d.label);
        ++n;
    }

    // replicates are independent: variances add, so σ shrinks with √n
    self.trans     /= n;
    self.intensity /= n;
    self.error     /= std::sqrt(static_cast<double>(n));

    if (cfg.verbose)
        std::cout << "\naveraged set re-named to " << self.label << ".\n";

    if (observer) observer->on_averaged(self, members);
}

} // namespace saxsred
