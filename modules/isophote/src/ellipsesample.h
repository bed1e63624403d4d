#pragma once

#include <optional>
#include <vector>

#include <efCore/MaskedImage>

#include "ellipsegeometry.h"
#include "integrator.h"

namespace ef {

// Fewest usable points for the five coefficient harmonic fit plus the two
// degrees of freedom of the residual
inline constexpr int kMinSamplePoints{7};

// Intensities sampled along one elliptical path.
//
// NOTE:
// 1. Extraction is lazy and happens once, on the first call of extract() or
// update(). Changing the geometry means building a new sample.
// 2. The image is shared with the caller (cv::Mat reference counting).
class EllipseSample
{
public:
    struct Options
    {
        IntegrationMode integrMode = IntegrationMode::Bilinear;

        // Sigma clipping, nclip = 0 disables it
        double sclip = 3.;
        int nclip = 0;

        Options() {}
    };

    // The geometry is copied, its semi-major axis replaced by sma.
    EllipseSample(const MaskedImage& image, double sma,
                  const EllipseGeometry& geometry,
                  const Options& options = {});
    virtual ~EllipseSample() = default;

    /// Properties
    inline const MaskedImage& image() const { return m_image; }
    inline const EllipseGeometry& geometry() const { return m_geometry; }
    inline EllipseGeometry& geometry() { return m_geometry; }
    inline const Options& options() const { return m_options; }

    /// Actions
    // Walks the ellipse and sigma clips the result, only once.
    void extract();

    // Extracts when needed, then computes the mean intensity and the radial
    // gradient. Throws InsufficientData when fewer than kMinSamplePoints
    // usable points are left.
    virtual void update(const EllipseGeometry::FixMask& fix);

    /// Results
    inline const std::vector<double>& angles() const { return m_angles; }
    inline const std::vector<double>& radii() const { return m_radii; }
    inline const std::vector<double>& intensities() const
    {
        return m_intensities;
    }
    // Image coordinates of the sampled points
    inline const std::vector<double>& xs() const { return m_xs; }
    inline const std::vector<double>& ys() const { return m_ys; }

    inline double mean() const { return m_mean; }
    inline double gradient() const { return m_gradient; }
    inline const std::optional<double>& gradientError() const
    {
        return m_gradientError;
    }
    inline const std::optional<double>& gradientRelativeError() const
    {
        return m_gradientRelativeError;
    }
    inline double sectorArea() const { return m_sectorArea; }
    inline int totalPoints() const { return m_totalPoints; }
    inline int actualPoints() const { return m_actualPoints; }

    // Points dropped because of non-finite, unmasked pixels. A warning is
    // logged once per sample when this is not zero, the outer samples used
    // for the gradient stay silent.
    inline int nonFiniteCount() const { return m_nonFiniteCount; }

protected:
    virtual void doExtract();

private:
    void extract(bool warnNonFinite);

    // Gradient and its error from a sample one step further out, at
    // (1 + step) * sma, or at sma + step for linear growth
    std::pair<double, std::optional<double>> measureGradient(
        double step) const;
    void sigmaClip(std::vector<SamplePoint>& points) const;

protected:
    MaskedImage m_image;
    EllipseGeometry m_geometry;
    Options m_options;

    std::vector<double> m_angles;
    std::vector<double> m_radii;
    std::vector<double> m_intensities;
    std::vector<double> m_xs;
    std::vector<double> m_ys;

    double m_mean;
    double m_gradient;
    std::optional<double> m_gradientError;
    std::optional<double> m_gradientRelativeError;
    double m_sectorArea{0.};
    int m_totalPoints{0};
    int m_actualPoints{0};
    int m_nonFiniteCount{0};
    bool m_extracted{false};
};

// Single bilinear sample at the ellipse center, sma = 0
class CentralEllipseSample final : public EllipseSample
{
public:
    CentralEllipseSample(const MaskedImage& image,
                         const EllipseGeometry& geometry);

    void update(const EllipseGeometry::FixMask& fix) override;

protected:
    void doExtract() override;
};

} // namespace ef
