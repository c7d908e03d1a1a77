#include "saxsred/Detector.hpp"
#include "saxsred/Errors.hpp"
#include "saxsred/StringUtils.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

namespace saxsred {

namespace {

std::string shape_str(const Frame& f)
{
    return "(" + std::to_string(f.rows()) + ", " + std::to_string(f.cols()) + ")";
}

void require_same_shape(const Frame& a, const Frame& b,
                        const std::string& what_a, const std::string& what_b)
{
    if (a.rows() != b.rows() || a.cols() != b.cols())
        throw ShapeMismatchError("shape mismatch between " + what_a + " " +
                                 shape_str(a) + " and " + what_b + " " +
                                 shape_str(b));
}

void require_mask_shape(const MaskMap& mask, const Frame& f)
{
    if (mask.rows() != f.rows() || mask.cols() != f.cols())
        throw ShapeMismatchError("mask shape (" + std::to_string(mask.rows()) +
                                 ", " + std::to_string(mask.cols()) +
                                 ") does not match the frame " + shape_str(f));
}

void check_profile(const Profile& p, const Vector& q)
{
    if (p.intensity.size() != q.size() || p.error.size() != q.size())
        throw std::runtime_error("integrator returned a profile of wrong length");
}

} // unnamed namespace

/* ------------------------------------------------------------------ */
std::pair<double, double> roi_stat(const Frame& frame,
                                   double x, double y,
                                   int hw, int hh)
{
    const Eigen::Index cx = static_cast<Eigen::Index>(std::lround(x));
    const Eigen::Index cy = static_cast<Eigen::Index>(std::lround(y));
    const Eigen::Index c0 = cx - hw + 1, r0 = cy - hh + 1;
    const Eigen::Index nc = 2 * hw - 1,  nr = 2 * hh - 1;

    if (hw < 1 || hh < 1 || c0 < 0 || r0 < 0 ||
        c0 + nc > frame.cols() || r0 + nr > frame.rows())
        throw InvalidConfigurationError(
            "beam centre box at (" + fmt(x, 1) + ", " + fmt(y, 1) +
            ") does not fit into the frame " + shape_str(frame));

    const auto box  = frame.block(r0, c0, nr, nc).array();
    const double mean = box.mean();
    const double sd   = std::sqrt((box - mean).square().mean());
    return {mean, sd};
}

void flat_correct(Frame& frame, const Frame& flat, const MaskMap& mask)
{
    require_same_shape(frame, flat, "frame", "flat field");
    require_mask_shape(mask, frame);

    double sum = 0.0;
    long   cnt = 0;
    for (Eigen::Index r = 0; r < flat.rows(); ++r)
        for (Eigen::Index c = 0; c < flat.cols(); ++c)
            if (mask(r, c) == 0 && flat(r, c) > 0) { sum += flat(r, c); ++cnt; }
    if (cnt == 0)
        throw std::runtime_error("flat field has no usable pixels");

    const double mean = sum / static_cast<double>(cnt);
    for (Eigen::Index r = 0; r < frame.rows(); ++r)
        for (Eigen::Index c = 0; c < frame.cols(); ++c)
            if (mask(r, c) == 0 && flat(r, c) > 0)
                frame(r, c) /= flat(r, c) / mean;
}

/* ------------------------------------------------------------------ */
DarkReference build_dark_reference(const std::vector<std::string>& images,
                                   const FrameReader&        reader,
                                   const Integrator&         integrator,
                                   const Vector&             q,
                                   const MaskMap&            mask,
                                   const ExperimentGeometry& geometry,
                                   double                    dezinger,
                                   const ProcessingConfig&   cfg)
{
    if (images.empty())
        throw std::invalid_argument("build_dark_reference: no dark images given");

    DarkReference dark;
    dark.q        = q;
    dark.mask     = mask;
    dark.geometry = geometry;
    dark.comments = "# loaded from " + images.front();

    if (cfg.verbose) std::cout << "building dark current data from";

    for (std::size_t k = 0; k < images.size(); ++k) {
        if (cfg.verbose) std::cout << ' ' << images[k];
        Frame f = reader.read(images[k]);
        if (k == 0) {
            require_mask_shape(mask, f);
            dark.frame = std::move(f);
        } else {
            require_same_shape(f, dark.frame, images[k], images.front());
            dark.frame += f;
            dark.comments += " , " + images[k];
        }
    }
    if (cfg.verbose) std::cout << '\n';
    dark.comments += "\n";

    const double n = static_cast<double>(images.size());
    dark.frame /= n;

    Profile p = integrator.integrate(dark.frame, q, mask, geometry, dezinger);
    check_profile(p, q);
    dark.intensity = std::move(p.intensity);
    // error bar is reduced because the images are averaged together
    dark.error     = p.error / std::sqrt(n);
    return dark;
}

FlatReference build_flat_reference(const std::vector<std::string>& images,
                                   const FrameReader&   reader,
                                   const DarkReference& dark)
{
    if (images.empty())
        throw std::invalid_argument("build_flat_reference: no flat-field images given");

    FlatReference flat;
    flat.comments = "# flat field from " + images.front();
    for (std::size_t k = 0; k < images.size(); ++k) {
        Frame f = reader.read(images[k]);
        require_same_shape(f, dark.frame, images[k], "dark image");
        if (k == 0) {
            flat.frame = std::move(f);
        } else {
            flat.frame += f;
            flat.comments += " , " + images[k];
        }
    }
    flat.comments += "\n";
    flat.frame /= static_cast<double>(images.size());
    flat.frame -= dark.frame;
    return flat;
}

/* ------------------------------------------------------------------ */
Curve load_from_2d(const std::string&      path,
                   const FrameReader&      reader,
                   const Integrator&       integrator,
                   const DarkReference&    dark,
                   const FlatReference*    flat,
                   double                  dezinger,
                   const ProcessingConfig& cfg)
{
    if (cfg.verbose) std::cout << "loading data from " << path << " ...\n";

    Frame frame = reader.read(path);
    require_same_shape(frame, dark.frame, "the 2D data", "the dark image");

    Curve c;
    c.q        = dark.q;
    c.label    = path;
    c.comments = "# loaded from " + path + "\n";

    // the whole image is dark subtracted so that the ROI counts are right
    frame -= dark.frame;

    const double mean = roi_stat(frame,
                                 dark.geometry.beam_center_x,
                                 dark.geometry.beam_center_y,
                                 cfg.beam_half_width, cfg.beam_half_height).first;
    c.roi = mean * (2 * cfg.beam_half_width - 1) * (2 * cfg.beam_half_height - 1);

    // the flat field also carries the incident-angle correction
    if (flat) {
        flat_correct(frame, flat->frame, dark.mask);
        c.comments += flat->comments;
    }

    Profile p = integrator.integrate(frame, dark.q, dark.mask, dark.geometry, dezinger);
    check_profile(p, dark.q);
    c.intensity = std::move(p.intensity);
    c.error     = p.error + dark.error;
    return c;
}

} // namespace saxsred
