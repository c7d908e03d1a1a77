#include "saxsred/ReportWriter.hpp"
#include "saxsred/Guinier.hpp"
#include "saxsred/Merge.hpp"
#include "saxsred/PairDistance.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace fs = std::filesystem;

namespace saxsred {

/* ===================================================================== */
/*            H e l p e r s   f o r   t a b l e   f o r m a t t i n g     */
/* ===================================================================== */
namespace {

std::string safe_name(const std::string& label)
{
    std::string s = fs::path(label).filename().string();
    for (auto& ch : s)
        if (ch == ' ' || ch == '/' || ch == '\\') ch = '_';
    return s.empty() ? std::string("curve") : s;
}

std::ofstream open_table(const std::string& path, const std::string& header)
{
    std::ofstream out(path);
    if (!out) throw std::runtime_error("Cannot write '" + path + "'");
    out << "# " << header << '\n'
        << std::scientific << std::setprecision(6);
    return out;
}

} // unnamed namespace

/* ===================================================================== */
ReportWriter::ReportWriter(std::string out_dir, const ProcessingConfig& cfg)
    : out_dir_(std::move(out_dir)), plot_offset_(cfg.plot_offset)
{
    fs::create_directories(out_dir_);
}

std::string ReportWriter::path_for(const std::string& label,
                                   const std::string& kind) const
{
    return (fs::path(out_dir_) / (safe_name(label) + "." + kind + ".dat")).string();
}

void ReportWriter::on_merged(const Curve& merged, const Curve& /*other*/,
                             const MergeResult& result)
{
    if (!merged.overlap) return;
    const OverlapData& o = *merged.overlap;

    auto out = open_table(path_for(merged.label, "merge"),
                          "q  raw_self  raw_other/sc   (scale " +
                          std::to_string(result.scale) + ")");
    for (Eigen::Index i = 0; i < o.q.size(); ++i)
        out << o.q[i] << ' ' << o.raw_self[i] << ' ' << o.raw_other[i] << '\n';
}

/* --------------------------------------------------------------------- */
/*  Replicate k is multiplied by plot_offset^k so the curves separate     */
/*  on a log axis; the average is repeated with every offset.            */
void ReportWriter::on_averaged(const Curve& averaged,
                               const std::vector<Curve>& members)
{
    auto out = open_table(path_for(averaged.label, "avg"),
                          "q  (member_k, average)·offset^k  for k = 0.." +
                          std::to_string(members.size() > 0 ? members.size() - 1 : 0));
    for (Eigen::Index i = 0; i < averaged.size(); ++i) {
        out << averaged.q[i];
        for (std::size_t k = 0; k < members.size(); ++k) {
            const double off = std::pow(plot_offset_, static_cast<double>(k));
            out << ' ' << members[k].intensity[i] * off
                << ' ' << averaged.intensity[i] * off;
        }
        out << '\n';
    }
}

void ReportWriter::on_background_subtracted(const Curve& sample,
                                            const Curve& background,
                                            double factor)
{
    auto out = open_table(path_for(sample.label, "bkg"),
                          "q  I_subtracted  err  I_background·" + std::to_string(factor));
    for (Eigen::Index i = 0; i < sample.size(); ++i)
        out << sample.q[i] << ' ' << sample.intensity[i] << ' '
            << sample.error[i] << ' ' << background.intensity[i] * factor << '\n';
}

void ReportWriter::on_guinier_fit(const Curve& curve, const GuinierResult& fit)
{
    auto out = open_table(path_for(curve.label, "guinier"),
                          "q^2  I  I_fit   (I0 " + std::to_string(fit.i0) +
                          ", Rg " + std::to_string(fit.rg) + ")");
    const Vector model = guinier_model(curve.q, fit.i0, fit.rg);
    for (Eigen::Index i = 0; i < curve.size(); ++i) {
        if (!(curve.intensity[i] > 0)) continue;
        out << curve.q[i] * curve.q[i] << ' ' << curve.intensity[i]
            << ' ' << model[i] << '\n';
    }
}

void ReportWriter::on_pair_distance(const Curve& curve, const PairDistribution& pr)
{
    auto out = open_table(path_for(curve.label, "pr"), "r  P(r)");
    for (Eigen::Index i = 0; i < pr.r.size(); ++i)
        out << pr.r[i] << ' ' << pr.pr[i] << '\n';
}

} // namespace saxsred
