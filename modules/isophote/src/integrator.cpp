#include "integrator.h"

#include <algorithm>
#include <cmath>
#include <numeric>

#include <glog/logging.h>

#include <efCore/ContainerUtils>
#include <efCore/Math>

namespace ef {

namespace {
// Sectors with fewer pixels are sampled by bilinear interpolation instead
constexpr size_t kMinSectorPixels{7};
} // namespace

///------- Integrator starts from here
Integrator::Ptr Integrator::create(IntegrationMode mode,
                                   const MaskedImage& image,
                                   const EllipseGeometry& geometry)
{
    switch (mode) {
        case IntegrationMode::NearestNeighbor:
            return std::make_unique<NearestNeighborIntegrator>(image,
                                                               geometry);
        case IntegrationMode::Bilinear:
            return std::make_unique<BilinearIntegrator>(image, geometry);
        case IntegrationMode::Mean:
            return std::make_unique<MeanIntegrator>(image, geometry);
        case IntegrationMode::Median:
            return std::make_unique<MedianIntegrator>(image, geometry);
        default:
            break;
    }

    LOG(FATAL) << "Unknown integration mode: " << static_cast<int>(mode);
    return nullptr;
}

Integrator::Integrator(const MaskedImage& image,
                       const EllipseGeometry& geometry)
    : m_image(image), m_geometry(geometry)
{
}

bool Integrator::isUsable(int x, int y)
{
    switch (m_image.state(x, y)) {
        case MaskedImage::PixelState::Valid:
            return true;
        case MaskedImage::PixelState::NonFinite:
            ++m_nonFiniteCount;
            return false;
        default:
            return false;
    }
}

///------- NearestNeighborIntegrator starts from here
NearestNeighborIntegrator::NearestNeighborIntegrator(
    const MaskedImage& image, const EllipseGeometry& geometry)
    : Integrator(image, geometry)
{
}

void NearestNeighborIntegrator::integrate(double radius, double phi,
                                          std::vector<SamplePoint>& points)
{
    m_radius = radius;

    const Eigen::Vector2d pos = m_geometry.toImage(radius, phi);
    const int i = static_cast<int>(std::floor(pos.x()));
    const int j = static_cast<int>(std::floor(pos.y()));
    if (!m_image.contains(i, j) || !isUsable(i, j)) {
        return;
    }

    points.push_back({phi, radius, m_image.at(i, j), pos.x(), pos.y()});
}

double NearestNeighborIntegrator::polarAngleStep() const
{
    return 1. / m_radius;
}

///------- BilinearIntegrator starts from here
BilinearIntegrator::BilinearIntegrator(const MaskedImage& image,
                                       const EllipseGeometry& geometry)
    : Integrator(image, geometry)
{
}

void BilinearIntegrator::integrate(double radius, double phi,
                                   std::vector<SamplePoint>& points)
{
    m_radius = radius;

    const Eigen::Vector2d pos = m_geometry.toImage(radius, phi);
    double value;
    if (interpolate(pos.x(), pos.y(), &value)) {
        points.push_back({phi, radius, value, pos.x(), pos.y()});
    }
}

double BilinearIntegrator::polarAngleStep() const { return 1. / m_radius; }

bool BilinearIntegrator::interpolate(double x, double y, double* value)
{
    const int i = static_cast<int>(std::floor(x));
    const int j = static_cast<int>(std::floor(y));
    if (i < 0 || j < 0 || i > m_image.cols() - 2 || j > m_image.rows() - 2) {
        return false;
    }

    // Check all four before giving up so that the non-finite count covers
    // every offending neighbor
    const bool usable = isUsable(i, j) & isUsable(i + 1, j) &
                        isUsable(i, j + 1) & isUsable(i + 1, j + 1);
    if (!usable) {
        return false;
    }

    const double fx = x - i;
    const double fy = y - j;
    const double qx = 1. - fx;
    const double qy = 1. - fy;
    *value = m_image.at(i, j) * qx * qy + m_image.at(i, j + 1) * qx * fy +
             m_image.at(i + 1, j) * fx * qy +
             m_image.at(i + 1, j + 1) * fx * fy;
    return true;
}

///------- AreaIntegrator starts from here
AreaIntegrator::AreaIntegrator(const MaskedImage& image,
                               const EllipseGeometry& geometry)
    : Integrator(image, geometry),
      m_fallback(image, geometry),
      m_angularWidth(geometry.sectorAngularWidth())
{
}

void AreaIntegrator::integrate(double radius, double phi,
                               std::vector<SamplePoint>& points)
{
    const auto sector = m_geometry.sector(phi, m_angularWidth);
    m_sectorArea = sector.area;
    m_angularWidth = sector.nextAngularWidth;

    double xmin{kMaxDouble}, xmax{-kMaxDouble};
    double ymin{kMaxDouble}, ymax{-kMaxDouble};
    for (const auto& vertex : sector.vertices) {
        xmin = std::min(xmin, vertex.x());
        xmax = std::max(xmax, vertex.x());
        ymin = std::min(ymin, vertex.y());
        ymax = std::max(ymax, vertex.y());
    }

    const int i1 = static_cast<int>(std::floor(xmin)) - 1;
    const int j1 = static_cast<int>(std::floor(ymin)) - 1;
    const int i2 = static_cast<int>(std::floor(xmax)) + 1;
    const int j2 = static_cast<int>(std::floor(ymax)) + 1;
    if (i1 <= 0 || j1 <= 0 || i2 >= m_image.cols() - 1 ||
        j2 >= m_image.rows() - 1) {
        return;
    }

    const double halfWidth = (sector.phi2 - sector.phi1) / 2.;
    const double innerScale = sector.sma1 / m_geometry.sma();
    const double outerScale = sector.sma2 / m_geometry.sma();

    std::vector<double> values;
    for (int j{j1}; j < j2; ++j) {
        for (int i{i1}; i < i2; ++i) {
            const auto [r, angle] = m_geometry.toPolar(i, j);
            const double dphi = std::remainder(angle - phi, two_pi);
            if (dphi < -halfWidth || dphi >= halfWidth) {
                continue;
            }

            const double rEllipse = m_geometry.radius(angle);
            if (r < innerScale * rEllipse || r >= outerScale * rEllipse) {
                continue;
            }

            if (isUsable(i, j)) {
                values.push_back(m_image.at(i, j));
            }
        }
    }

    if (values.size() < kMinSectorPixels) {
        const auto before = m_fallback.nonFiniteCount();
        m_fallback.integrate(radius, phi, points);
        m_nonFiniteCount += m_fallback.nonFiniteCount() - before;
        return;
    }

    const Eigen::Vector2d pos = m_geometry.toImage(radius, phi);
    points.push_back({phi, radius, reduce(values), pos.x(), pos.y()});
}

///------- MeanIntegrator starts from here
MeanIntegrator::MeanIntegrator(const MaskedImage& image,
                               const EllipseGeometry& geometry)
    : AreaIntegrator(image, geometry)
{
}

double MeanIntegrator::reduce(std::vector<double>& values) const
{
    return std::accumulate(values.cbegin(), values.cend(), 0.) /
           static_cast<double>(values.size());
}

///------- MedianIntegrator starts from here
MedianIntegrator::MedianIntegrator(const MaskedImage& image,
                                   const EllipseGeometry& geometry)
    : AreaIntegrator(image, geometry)
{
}

double MedianIntegrator::reduce(std::vector<double>& values) const
{
    return con::FindUpperMedian(values);
}

} // namespace ef
