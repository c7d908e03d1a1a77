#include "saxsred/Background.hpp"
#include "saxsred/StringUtils.hpp"

#include <iostream>

namespace saxsred {

double subtract_background(Curve& self,
                           const Curve& bkg,
                           double sc_factor,
                           const ProcessingConfig& cfg,
                           CurveObserver* observer)
{
    if (cfg.verbose)
        std::cout << "background subtraction: " << self.label << " - "
                  << bkg.label << '\n';
    require_same_grid(self, bkg, "background subtraction");

    double sc = 1.0;
    if (self.trans > 0 && bkg.trans > 0) {
        sc = self.trans / bkg.trans;
    } else {
        std::cerr << "WARNING: trans value not assigned to data or background, "
                     "assuming normalized intensity.\n";
    }
    const double f = sc * sc_factor;

    if (self.overlap && bkg.overlap) {
        const Vector& qs = self.overlap->q;
        const Vector& qb = bkg.overlap->q;
        if (qs.size() == qb.size() && (qs.array() == qb.array()).all()) {
            self.overlap->raw_self  -= bkg.overlap->raw_self  * f;
            self.overlap->raw_other -= bkg.overlap->raw_other * f;
        } else {
            std::cerr << "WARNING: merge windows of " << self.label << " and "
                      << bkg.label << " differ, overlap data left uncorrected.\n";
        }
    }

    if (cfg.verbose) std::cout << "using scaling factor of " << fmt(f) << '\n';

    self.intensity -= bkg.intensity * f;
    self.error     += bkg.error * f;

    self.comments += "# background subtraction using the following set, scaled by " +
                     fmt(sc) + " (trans):\n";
    if (sc_factor != 1.0)
        self.comments += "# with additional scaling factor of " + fmt(sc_factor) + "\n";
    self.comments += nested_comments(bkg);

    if (observer) observer->on_background_subtracted(self, bkg, f);
    return f;
}

void scale(Curve& c, double sc, const ProcessingConfig& cfg)
{
    if (sc <= 0)
        std::cerr << "WARNING: scaling factor is non-positive: " << fmt(sc) << '\n';
    else if (cfg.verbose)
        std::cout << "scaling " << c.label << " by " << fmt(sc) << '\n';

    c.intensity *= sc;
    c.error     *= sc;
    c.comments  += "# data is scaled by " + fmt(sc) + ".\n";
}

} // namespace saxsred
