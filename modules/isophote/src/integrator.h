#pragma once

#include <memory>
#include <vector>

#include <efCore/MaskedImage>

#include "ellipsegeometry.h"

namespace ef {

enum class IntegrationMode
{
    NearestNeighbor,
    Bilinear,
    Mean,
    Median
};

// One usable point along the ellipse
struct SamplePoint
{
    double angle;     // Polar angle relative to the major axis
    double radius;    // Polar radius
    double intensity;
    double x;         // Image coordinates
    double y;
};

// Extracts the intensity at one polar position of the ellipse.
//
// NOTE:
// 1. Integrators keep references to the image and geometry, both must
// outlive the integrator.
// 2. Pixels that are masked, non-finite or have a non-finite error are
// skipped, a position that can't be sampled adds no point.
class Integrator
{
public:
    using Ptr = std::unique_ptr<Integrator>;

    static Ptr create(IntegrationMode mode, const MaskedImage& image,
                      const EllipseGeometry& geometry);

    virtual ~Integrator() = default;

    // Samples at the polar vector (radius, phi), appends to points when the
    // position is usable.
    virtual void integrate(double radius, double phi,
                           std::vector<SamplePoint>& points) = 0;

    // Angular step to the next polar position
    virtual double polarAngleStep() const = 0;

    // Area in pixels covered by the last integration
    virtual double sectorArea() const = 0;

    virtual bool isArea() const { return false; }

    // Positions dropped because of non-finite, unmasked pixels
    inline int nonFiniteCount() const { return m_nonFiniteCount; }

protected:
    Integrator(const MaskedImage& image, const EllipseGeometry& geometry);

    // Counts the non-finite, unmasked pixels it rejects.
    bool isUsable(int x, int y);

protected:
    const MaskedImage& m_image;
    const EllipseGeometry& m_geometry;
    int m_nonFiniteCount{0};
};

class NearestNeighborIntegrator final : public Integrator
{
public:
    NearestNeighborIntegrator(const MaskedImage& image,
                              const EllipseGeometry& geometry);

    void integrate(double radius, double phi,
                   std::vector<SamplePoint>& points) override;
    double polarAngleStep() const override;
    double sectorArea() const override { return 1.; }

private:
    double m_radius{1.};
};

class BilinearIntegrator final : public Integrator
{
public:
    BilinearIntegrator(const MaskedImage& image,
                       const EllipseGeometry& geometry);

    void integrate(double radius, double phi,
                   std::vector<SamplePoint>& points) override;
    double polarAngleStep() const override;
    double sectorArea() const override { return 2.; }

    // Interpolated value at image coordinates (x, y). Returns false when any
    // of the four neighbors is outside the image or unusable.
    bool interpolate(double x, double y, double* value);

private:
    double m_radius{1.};
};

// Reduces the pixels of an elliptical annulus sector to one value. Falls back
// to bilinear interpolation when the sector holds too few pixels.
class AreaIntegrator : public Integrator
{
public:
    void integrate(double radius, double phi,
                   std::vector<SamplePoint>& points) override;
    double polarAngleStep() const override { return m_angularWidth; }
    double sectorArea() const override { return m_sectorArea; }
    bool isArea() const override { return true; }

protected:
    AreaIntegrator(const MaskedImage& image, const EllipseGeometry& geometry);

    virtual double reduce(std::vector<double>& values) const = 0;

private:
    BilinearIntegrator m_fallback;
    double m_angularWidth;
    double m_sectorArea{0.};
};

class MeanIntegrator final : public AreaIntegrator
{
public:
    MeanIntegrator(const MaskedImage& image, const EllipseGeometry& geometry);

protected:
    double reduce(std::vector<double>& values) const override;
};

class MedianIntegrator final : public AreaIntegrator
{
public:
    MedianIntegrator(const MaskedImage& image,
                     const EllipseGeometry& geometry);

protected:
    double reduce(std::vector<double>& values) const override;
};

} // namespace ef
