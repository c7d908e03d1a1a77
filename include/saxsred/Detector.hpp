#pragma once
#include "Config.hpp"
#include "Curve.hpp"
#include "Types.hpp"
#include <utility>
#include <string>
#include <vector>

namespace saxsred {

/* --------------------------------------------------------------------- */
/*  Seam to the 2D part of the reduction.  Image formats and azimuthal    */
/*  integration live outside this library; they are reached only through  */
/*  FrameReader and Integrator.                                           */
/* --------------------------------------------------------------------- */

// Geometry of one detector; only the beam centre is used here
struct ExperimentGeometry {
    double beam_center_x   = 0.0;   // pixel column
    double beam_center_y   = 0.0;   // pixel row
    double wavelength      = 1.0;   // Å
    double sample_distance = 0.0;   // mm
    double pixel_size      = 0.0;   // mm
};

struct Profile {
    Vector intensity;
    Vector error;
};

class FrameReader {
public:
    virtual ~FrameReader() = default;
    virtual Frame read(const std::string& path) const = 0;
};

class Integrator {
public:
    virtual ~Integrator() = default;

    /*  I(q) of `frame` on the given grid.  Masked pixels are ignored,
     *  `dezinger` controls outlier rejection inside each q bin.          */
    virtual Profile integrate(const Frame&              frame,
                              const Vector&             q,
                              const MaskMap&            mask,
                              const ExperimentGeometry& geometry,
                              double                    dezinger) const = 0;
};

/*  Averaged dark current of one detector.  It also carries everything
 *  needed to reduce sample frames: the q grid, mask and geometry.       */
struct DarkReference {
    Vector             q;
    Vector             intensity;
    Vector             error;
    Frame              frame;        // averaged 2D dark image
    MaskMap            mask;
    ExperimentGeometry geometry;
    std::string        comments;
};

// Flat field (e.g. isotropic fluorescence), dark subtracted
struct FlatReference {
    Frame       frame;
    std::string comments;
};

DarkReference build_dark_reference(const std::vector<std::string>& images,
                                   const FrameReader&        reader,
                                   const Integrator&         integrator,
                                   const Vector&             q,
                                   const MaskMap&            mask,
                                   const ExperimentGeometry& geometry,
                                   double                    dezinger,
                                   const ProcessingConfig&   cfg);

FlatReference build_flat_reference(const std::vector<std::string>& images,
                                   const FrameReader&   reader,
                                   const DarkReference& dark);

/*  Mean of the (2hw-1)×(2hh-1) box centred on (x, y), and its standard
 *  deviation.                                                            */
std::pair<double, double> roi_stat(const Frame& frame,
                                   double x, double y,
                                   int hw, int hh);

/*  Divide `frame` by the flat field normalised to its mean over the
 *  unmasked, positive pixels.  Masked pixels are left alone.             */
void flat_correct(Frame& frame, const Frame& flat, const MaskMap& mask);

/**
 * Reduce one 2D image to a Curve on dark.q:
 * dark frame subtraction, beam-centre ROI (stored in Curve::roi),
 * optional flat-field correction, azimuthal integration.  The dark
 * current error is added to the integrated error.
 *
 * Throws ShapeMismatchError if the image and dark frame differ in shape.
 */
Curve load_from_2d(const std::string&      path,
                   const FrameReader&      reader,
                   const Integrator&       integrator,
                   const DarkReference&    dark,
                   const FlatReference*    flat,
                   double                  dezinger,
                   const ProcessingConfig& cfg);

} // namespace saxsred
