#pragma once
#include "Config.hpp"
#include "Observer.hpp"
#include <string>

namespace saxsred {

/* --------------------------------------------------------------------- */
/*  Observer that writes the diagnostic views of a run as whitespace       */
/*  separated tables into one directory, ready for any plotting tool.     */
/*                                                                         */
/*    <label>.merge.dat      q, raw self, raw other (scaled)  in overlap    */
/*    <label>.avg.dat        q, members offset by plot_offset^k, average   */
/*    <label>.bkg.dat        q, sample, scaled background                   */
/*    <label>.guinier.dat    q², I, I0 exp(-q²Rg²/3)                        */
/*    <label>.pr.dat         r, P(r)                                        */
/* --------------------------------------------------------------------- */
class ReportWriter : public CurveObserver {
public:
    ReportWriter(std::string out_dir, const ProcessingConfig& cfg);

    void on_merged(const Curve& merged, const Curve& other,
                   const MergeResult& result) override;
    void on_averaged(const Curve& averaged,
                     const std::vector<Curve>& members) override;
    void on_background_subtracted(const Curve& sample, const Curve& background,
                                  double factor) override;
    void on_guinier_fit(const Curve& curve, const GuinierResult& fit) override;
    void on_pair_distance(const Curve& curve, const PairDistribution& pr) override;

    // file that a table of the given kind is written to
    std::string path_for(const std::string& label, const std::string& kind) const;

private:
    std::string out_dir_;
    double      plot_offset_;
};

} // namespace saxsred
