#include "ellipsesample.h"

#include <algorithm>
#include <cmath>
#include <format>

#include <glog/logging.h>

#include <efCore/Exceptions>
#include <efCore/Math>
#include <efMath/Statistics>

namespace ef {

namespace {

// Stand-in for the gradient of the previous sample, good enough for galaxy
// light profiles
constexpr double kDefaultPreviousGradient{-0.05};

// Stop the elliptical walk this far past a full turn
constexpr double kPhiOvershoot{0.05};
constexpr double kMaxPolarAngleStep{0.5};

} // namespace

///------- EllipseSample starts from here
EllipseSample::EllipseSample(const MaskedImage& image, double sma,
                             const EllipseGeometry& geometry,
                             const Options& options)
    : m_image(image),
      m_geometry(geometry),
      m_options(options),
      m_mean(kNaN),
      m_gradient(kNaN)
{
    m_geometry.setSma(sma);
}

void EllipseSample::extract() { extract(true); }

void EllipseSample::extract(bool warnNonFinite)
{
    if (m_extracted) {
        return;
    }

    doExtract();
    m_extracted = true;

    if (warnNonFinite && m_nonFiniteCount > 0) {
        LOG(WARNING) << "Image data contains non-finite values, "
                     << m_nonFiniteCount
                     << " samples skipped at sma = " << m_geometry.sma();
    }
}

void EllipseSample::doExtract()
{
    auto integrator =
        Integrator::create(m_options.integrMode, m_image, m_geometry);

    double phi = m_geometry.initialPolarAngle();
    double radius = m_geometry.initialPolarRadius();

    // Area integrators don't perform with sectors smaller than a pixel
    if (integrator->isArea()) {
        std::vector<SamplePoint> probe;
        integrator->integrate(radius, phi, probe);
        const double area = integrator->sectorArea();
        integrator = Integrator::create(area < 1.
                                            ? IntegrationMode::Bilinear
                                            : m_options.integrMode,
                                        m_image, m_geometry);
    }

    std::vector<SamplePoint> points;
    std::vector<double> sectorAreas;
    m_totalPoints = 0;
    while (phi <= two_pi + kPhiOvershoot) {
        integrator->integrate(radius, phi, points);
        sectorAreas.push_back(integrator->sectorArea());
        ++m_totalPoints;

        phi += std::min(integrator->polarAngleStep(), kMaxPolarAngleStep);
        radius = m_geometry.radius(phi);
    }

    m_sectorArea = stats::mean(sectorAreas);
    m_nonFiniteCount = integrator->nonFiniteCount();

    sigmaClip(points);

    m_actualPoints = static_cast<int>(points.size());
    m_angles.clear();
    m_radii.clear();
    m_intensities.clear();
    m_xs.clear();
    m_ys.clear();
    for (const auto& point : points) {
        m_angles.push_back(point.angle);
        m_radii.push_back(point.radius);
        m_intensities.push_back(point.intensity);
        m_xs.push_back(point.x);
        m_ys.push_back(point.y);
    }
}

void EllipseSample::sigmaClip(std::vector<SamplePoint>& points) const
{
    for (int i{0}; i < m_options.nclip && !points.empty(); ++i) {
        std::vector<double> values;
        values.reserve(points.size());
        for (const auto& point : points) {
            values.push_back(point.intensity);
        }

        const double mean = stats::mean(values);
        const double sigma = stats::stddev(values);
        const double lower = mean - m_options.sclip * sigma;
        const double upper = mean + m_options.sclip * sigma;

        std::erase_if(points, [lower, upper](const SamplePoint& point) {
            return !(point.intensity >= lower && point.intensity < upper);
        });
    }
}

void EllipseSample::update(const EllipseGeometry::FixMask& fix)
{
    m_geometry.setFix(fix);
    extract();

    if (m_actualPoints < kMinSamplePoints) {
        throw InsufficientData(
            std::format("Too small sample to warrant a fit: {} usable "
                        "points at sma = {}, at least {} required.",
                        m_actualPoints, m_geometry.sma(), kMinSamplePoints),
            m_actualPoints, kMinSamplePoints);
    }

    m_mean = stats::mean(m_intensities);

    // Meaningful gradient: negative, and not much shallower than the
    // previous estimate
    const double step = m_geometry.astep();
    const double previous = std::isfinite(m_gradient) && m_gradient != 0.
                                ? m_gradient
                                : kDefaultPreviousGradient;

    auto [gradient, error] = measureGradient(step);
    if (!(gradient < previous / 3.)) {
        std::tie(gradient, error) = measureGradient(2. * step);
    }
    if (!(gradient < previous / 3.)) {
        gradient = previous * 0.8;
        error.reset();
    }

    m_gradient = gradient;
    m_gradientError = error;
    if (error.has_value() && error.value() != 0. && gradient < 0.) {
        m_gradientRelativeError = error.value() / std::abs(gradient);
    }
    else {
        m_gradientRelativeError.reset();
    }
}

std::pair<double, std::optional<double>> EllipseSample::measureGradient(
    double step) const
{
    const double sma = m_geometry.sma();
    // Radial distance to the outer sample
    const double distance = m_geometry.linearGrowth() ? step : sma * step;
    EllipseSample outer{m_image, sma + distance, m_geometry, m_options};
    outer.extract(false);
    if (outer.m_intensities.empty()) {
        return {kNaN, std::nullopt};
    }

    const double gradient =
        (stats::mean(outer.m_intensities) - m_mean) / distance;

    const double sigma = stats::stddev(m_intensities);
    const double sigmaOuter = stats::stddev(outer.m_intensities);
    const double error =
        std::sqrt(sigma * sigma / m_intensities.size() +
                  sigmaOuter * sigmaOuter / outer.m_intensities.size()) /
        distance;

    return {gradient, error};
}

///------- CentralEllipseSample starts from here
CentralEllipseSample::CentralEllipseSample(const MaskedImage& image,
                                           const EllipseGeometry& geometry)
    : EllipseSample(image, 0., geometry)
{
}

void CentralEllipseSample::update(const EllipseGeometry::FixMask& fix)
{
    m_geometry.setFix(fix);
    extract();

    m_mean = m_intensities.empty() ? kNaN : m_intensities.front();
    m_gradient = 0.;
    m_gradientError = 0.;
    m_gradientRelativeError = 0.;
}

void CentralEllipseSample::doExtract()
{
    BilinearIntegrator integrator{m_image, m_geometry};

    double value;
    if (integrator.interpolate(m_geometry.x0(), m_geometry.y0(), &value)) {
        m_angles = {0.};
        m_radii = {0.};
        m_intensities = {value};
        m_xs = {m_geometry.x0()};
        m_ys = {m_geometry.y0()};
    }

    m_totalPoints = 1;
    m_actualPoints = static_cast<int>(m_intensities.size());
    m_nonFiniteCount = integrator.nonFiniteCount();
}

} // namespace ef
