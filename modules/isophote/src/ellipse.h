#pragma once

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include <efCore/MaskedImage>

#include "ellipsegeometry.h"
#include "integrator.h"
#include "isophote.h"
#include "isophotelist.h"

namespace ef {

// Fits a sequence of elliptical isophotes to an image, growing outwards from
// a starting semi-major axis and then inwards towards the center.
//
// NOTE:
// 1. The image is shared, it must not be modified while fitting.
// 2. Fitting never throws for numerical reasons, failed steps show up as
// stop codes or end the walk in that direction.
class Ellipse
{
public:
    enum class FailurePolicy
    {
        Stop,  // End the walk in that direction
        Record // Keep the invalid isophote and go on
    };

    struct Options
    {
        // Starting semi-major axis, the geometry's when not set
        std::optional<double> sma0;
        // Inwards walk stops here, 0 adds the central pixel
        double minsma = 0.;
        std::optional<double> maxsma;
        // Relative step, or absolute in pixels for linear growth
        double step = 0.1;

        /// Fitter
        double conver = 0.05;
        int minit = 10;
        int maxit = 50;
        double fflag = 0.7;
        double maxgerr = 0.5;
        int maxUnclip = 3;

        /// Sampler
        double sclip = 3.;
        int nclip = 0;
        IntegrationMode integrMode = IntegrationMode::Bilinear;

        // Overrides the geometry's growth mode when set
        std::optional<bool> linear;
        // Beyond this sma isophotes are sampled without iterating
        std::optional<double> maxrit;

        bool fixCenter = false;
        bool fixPa = false;
        bool fixEps = false;

        // Outwards walk stops below this intensity
        std::optional<double> minIntensity;
        FailurePolicy failurePolicy = FailurePolicy::Stop;

        Options() {}
    };

    // Without a geometry the fit starts at the image center with sma = 10,
    // eps = 0.2 and pa = pi/2, moved by the object centerer.
    explicit Ellipse(const MaskedImage& image,
                     const std::optional<EllipseGeometry>& geometry = {},
                     double threshold = 0.1);
    ~Ellipse();

    /// Properties
    const MaskedImage& image() const;
    const EllipseGeometry& geometry() const;

    /// Actions
    IsophoteList fitImage(const Options& options = {});

    // Single isophote at sma with the stored geometry as starting point.
    // sma = 0 gives the central pixel.
    Isophote fitIsophote(double sma, const Options& options = {});

private:
    class Impl;
    const std::unique_ptr<Impl> d;
};

void to_json(nlohmann::json& json, const Ellipse::Options& opts);
void from_json(const nlohmann::json& json, Ellipse::Options& opts);

// Convenience entry point over Ellipse::fitImage(). Sigma clipping at sclip
// runs nclip times, nclip = 0 disables it.
IsophoteList fitImage(const MaskedImage& image,
                      const EllipseGeometry& geometry, int maxit = 50,
                      double step = 0.1, bool linearGrowth = false,
                      std::optional<double> maxsma = {}, double minsma = 0.,
                      double sclip = 3., int nclip = 0);

// Re-samples isophote with the center, ellipticity and position angle of
// reference. The stop code becomes StopGeometryReplaced, or StopSoft when
// too many points were flagged, the validity is kept. Returns isophote
// unchanged when the new sample is unusable.
Isophote replaceGeometry(const MaskedImage& image, const Isophote& isophote,
                         const EllipseGeometry& reference, double fflag);

} // namespace ef
