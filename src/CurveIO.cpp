#include "saxsred/CurveIO.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace saxsred {

void save_curve(const Curve& c, const std::string& path, bool nonzero_only)
{
    std::ofstream out(path);
    if (!out)
        throw std::runtime_error("Cannot write '" + path + "'");

    out << std::fixed << std::setprecision(5);
    for (Eigen::Index i = 0; i < c.size(); ++i) {
        if (nonzero_only && !(c.intensity[i] > 0)) continue;
        out << std::setw(12) << c.q[i]         << ' '
            << std::setw(12) << c.intensity[i] << ' '
            << std::setw(12) << c.error[i]     << '\n';
    }
    out << c.comments;

    if (!out)
        throw std::runtime_error("Error while writing '" + path + "'");
}

Curve load_curve(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open '" + path + "'");

    std::vector<double> q, i0, err;
    std::string comments;
    std::string line;
    while (std::getline(in, line))
    {
        // trim leading whitespace
        auto it = std::find_if_not(line.begin(), line.end(),
                                   [](unsigned char ch) { return std::isspace(ch); });
        if (it == line.end()) continue;           // blank line
        if (*it == '#') {                         // provenance
            comments += line;
            comments += '\n';
            continue;
        }

        std::istringstream ss(line);
        double a, b, e;
        if (!(ss >> a >> b >> e))
            throw std::runtime_error("Malformed row in '" + path + "': " + line);
        q.push_back(a);
        i0.push_back(b);
        err.push_back(e);
    }
    if (q.empty())
        throw std::runtime_error("File '" + path + "' contains no valid data");

    Curve c;
    c.q         = Eigen::Map<Vector>(q.data(),   q.size());
    c.intensity = Eigen::Map<Vector>(i0.data(),  i0.size());
    c.error     = Eigen::Map<Vector>(err.data(), err.size());
    c.label     = fs::path(path).filename().string();
    c.comments  = std::move(comments);
    return c;
}

} // namespace saxsred
