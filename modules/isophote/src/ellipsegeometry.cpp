#include "ellipsegeometry.h"

#include <algorithm>
#include <cmath>

#include <glog/logging.h>

#include <efCore/Exceptions>
#include <efCore/MaskedImage>
#include <efCore/Math>

namespace ef {

namespace {

// Limits of the angular width of area integrator sectors
constexpr double kPhiMin{0.05};
constexpr double kPhiMax{0.2};

// Object centerer windows
constexpr int kCentererScanHalfSize{5};
constexpr int kCentererMaskHalfSize{10};
constexpr double kCentererInnerRadius{4.};
constexpr double kCentererOuterRadius{7.};

// Difference a - b of two position angles, folded into [-pi/2, pi/2)
double positionAngleDifference(double a, double b)
{
    return math::normalizePositionAngle(a - b);
}

} // namespace

EllipseGeometry::EllipseGeometry(double x0, double y0, double sma, double eps,
                                 double pa, double astep, bool linearGrowth,
                                 const FixMask& fix)
    : m_x0(x0),
      m_y0(y0),
      m_sma(sma),
      m_eps(eps),
      m_pa(math::normalizePositionAngle(pa)),
      m_astep(astep),
      m_linearGrowth(linearGrowth),
      m_fix(fix)
{
    if (!(sma > 0.)) {
        throw InvalidGeometry("Semi-major axis must be positive.");
    }
    if (!(eps >= 0. && eps < 1.)) {
        throw InvalidGeometry("Ellipticity must be in the range [0, 1).");
    }

    updateSectorParameters();
}

bool EllipseGeometry::allFixed() const
{
    return std::all_of(m_fix.cbegin(), m_fix.cend(),
                       [](bool fixed) { return fixed; });
}

void EllipseGeometry::setCenter(double x0, double y0)
{
    m_x0 = x0;
    m_y0 = y0;
}

void EllipseGeometry::setSma(double sma)
{
    CHECK_GE(sma, 0.);
    m_sma = sma;
    updateSectorParameters();
}

void EllipseGeometry::setEps(double eps)
{
    m_eps = eps;
    updateSectorParameters();
}

void EllipseGeometry::setPa(double pa)
{
    m_pa = math::normalizePositionAngle(pa);
}

void EllipseGeometry::setAstep(double astep)
{
    m_astep = astep;
    updateSectorParameters();
}

void EllipseGeometry::setLinearGrowth(bool on)
{
    m_linearGrowth = on;
    updateSectorParameters();
}

void EllipseGeometry::setFix(const FixMask& fix) { m_fix = fix; }

double EllipseGeometry::updateSma(double step) const
{
    return m_linearGrowth ? m_sma + step : m_sma * (1. + step);
}

std::pair<double, double> EllipseGeometry::resetSma(double step) const
{
    if (m_linearGrowth) {
        return {m_sma - step, -step};
    }

    const double aux = 1. / (1. + step);
    return {m_sma * aux, aux - 1.};
}

void EllipseGeometry::unclip(const EllipseGeometry& anchor, double fraction)
{
    fraction = std::clamp(fraction, 0., 1.);

    if (!m_fix[X0]) {
        m_x0 += fraction * (anchor.m_x0 - m_x0);
    }
    if (!m_fix[Y0]) {
        m_y0 += fraction * (anchor.m_y0 - m_y0);
    }
    if (!m_fix[Eps]) {
        m_eps += fraction * (anchor.m_eps - m_eps);
    }
    if (!m_fix[Pa]) {
        setPa(m_pa + fraction * positionAngleDifference(anchor.m_pa, m_pa));
    }

    updateSectorParameters();
}

void EllipseGeometry::reflect()
{
    if (m_eps >= 0.) {
        return;
    }

    m_eps = -m_eps;
    m_pa = m_pa < 0. ? m_pa + half_pi : m_pa - half_pi;
    updateSectorParameters();
}

double EllipseGeometry::radius(double angle) const
{
    const double q = 1. - m_eps;
    return m_sma * q /
           std::sqrt(math::square(q * std::cos(angle)) +
                     math::square(std::sin(angle)));
}

Eigen::Vector2d EllipseGeometry::toImage(double radius, double angle) const
{
    return {radius * std::cos(angle + m_pa) + m_x0,
            radius * std::sin(angle + m_pa) + m_y0};
}

std::pair<double, double> EllipseGeometry::toPolar(double x, double y) const
{
    const double dx = x - m_x0;
    const double dy = y - m_y0;
    const double radius = std::hypot(dx, dy);
    const double angle = math::wrap2pi(std::atan2(dy, dx) - m_pa);
    return {radius, angle};
}

std::pair<double, double> EllipseGeometry::boundingEllipses() const
{
    if (m_linearGrowth) {
        return {m_sma - m_astep / 2., m_sma + m_astep / 2.};
    }

    return {m_sma * (1. - m_astep / 2.), m_sma * (1. + m_astep / 2.)};
}

EllipseGeometry::Sector EllipseGeometry::sector(double phi,
                                                double angularWidth) const
{
    const auto [sma1, sma2] = boundingEllipses();
    const double q = 1. - m_eps;
    const auto polarRadius = [q](double sma, double angle) {
        return sma * q /
               std::sqrt(math::square(q * std::cos(angle)) +
                         math::square(std::sin(angle)));
    };

    Sector sector;
    sector.sma1 = sma1;
    sector.sma2 = sma2;

    // Polar vectors on both sides of the sector
    sector.phi1 = phi - angularWidth / 2.;
    sector.phi2 = phi + angularWidth / 2.;
    const double r1 = polarRadius(sma1, sector.phi1);
    const double r2 = polarRadius(sma2, sector.phi1);
    const double r3 = polarRadius(sma2, sector.phi2);
    const double r4 = polarRadius(sma1, sector.phi2);

    const double sa1 = math::ellipseSectorArea(sma1, m_eps, sector.phi1, r1);
    const double sa2 = math::ellipseSectorArea(sma2, m_eps, sector.phi1, r2);
    const double sa3 = math::ellipseSectorArea(sma2, m_eps, sector.phi2, r3);
    const double sa4 = math::ellipseSectorArea(sma1, m_eps, sector.phi2, r4);
    sector.area = std::abs((sa3 - sa2) - (sa4 - sa1));

    // Keeps the sector area roughly constant along the ellipse
    sector.nextAngularWidth =
        std::clamp(m_areaFactor / (r3 - r4) / r4, kPhiMin, kPhiMax);

    sector.vertices[0] = toImage(r1, sector.phi1);
    sector.vertices[1] = toImage(r2, sector.phi1);
    sector.vertices[2] = toImage(r4, sector.phi2);
    sector.vertices[3] = toImage(r3, sector.phi2);

    return sector;
}

bool EllipseGeometry::findCenter(const MaskedImage& image, double threshold)
{
    // Start from the frame center when the current one is off the image
    double x0 = m_x0;
    double y0 = m_y0;
    if (!(x0 >= 0. && x0 < image.cols() && y0 >= 0. && y0 < image.rows())) {
        x0 = image.cols() / 2.;
        y0 = image.rows() / 2.;
    }

    double maxFom{0.};
    int bestX{0};
    int bestY{0};
    for (int i = int(x0) - kCentererScanHalfSize;
         i <= int(x0) + kCentererScanHalfSize; ++i) {
        for (int j = int(y0) - kCentererScanHalfSize;
             j <= int(y0) + kCentererScanHalfSize; ++j) {
            double innerSum{0.}, innerSum2{0.};
            double outerSum{0.}, outerSum2{0.};
            int innerCount{0}, outerCount{0};

            for (int y = std::max(0, j - kCentererMaskHalfSize);
                 y <= std::min(image.rows() - 1, j + kCentererMaskHalfSize);
                 ++y) {
                for (int x = std::max(0, i - kCentererMaskHalfSize);
                     x <= std::min(image.cols() - 1, i + kCentererMaskHalfSize);
                     ++x) {
                    if (image.state(x, y) != MaskedImage::PixelState::Valid) {
                        continue;
                    }

                    const double r = std::hypot(x - i, y - j);
                    const double v = image.at(x, y);
                    if (r <= kCentererInnerRadius) {
                        innerSum += v;
                        innerSum2 += v * v;
                        ++innerCount;
                    }
                    else if (r > kCentererOuterRadius &&
                             r <= kCentererMaskHalfSize) {
                        outerSum += v;
                        outerSum2 += v * v;
                        ++outerCount;
                    }
                }
            }

            if (innerCount == 0 || outerCount == 0) {
                continue;
            }

            const double innerAvg = innerSum / innerCount;
            const double outerAvg = outerSum / outerCount;
            const double innerVar =
                std::max(0., innerSum2 / innerCount - innerAvg * innerAvg);
            const double outerVar =
                std::max(0., outerSum2 / outerCount - outerAvg * outerAvg);
            const double stddev = std::sqrt(innerVar + outerVar);
            if (!(stddev > 0.)) {
                continue;
            }

            const double fom = (innerAvg - outerAvg) / stddev;
            if (fom > maxFom) {
                maxFom = fom;
                bestX = i;
                bestY = j;
            }
        }
    }

    if (maxFom > threshold) {
        m_x0 = bestX;
        m_y0 = bestY;
        LOG(INFO) << "Found center at x0 = " << m_x0 << ", y0 = " << m_y0;
        return true;
    }

    LOG(INFO) << "Result is below the threshold, keeping the original "
                 "coordinates.";
    return false;
}

void EllipseGeometry::updateSectorParameters()
{
    const auto [sma1, sma2] = boundingEllipses();
    const double innerSma = std::min(sma2 - sma1, 3.);
    m_areaFactor = (sma2 - sma1) * innerSma;

    // The central pixel has no sectors
    if (m_sma > 0.) {
        m_sectorAngularWidth =
            std::clamp(innerSma / m_sma, kPhiMin, kPhiMax);
        m_initialPolarAngle = m_sectorAngularWidth / 2.;
        m_initialPolarRadius = radius(m_initialPolarAngle);
    }
    else {
        m_sectorAngularWidth = 0.;
        m_initialPolarAngle = 0.;
        m_initialPolarRadius = 0.;
    }
}

} // namespace ef
