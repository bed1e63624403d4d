#include "isophote.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include <glog/logging.h>

#include <efCore/Exceptions>
#include <efCore/Math>
#include <efMath/Harmonics>
#include <efMath/Statistics>

namespace ef {

namespace {

constexpr std::array<std::string_view, kIsophoteFieldCount> kFieldNames{
    "sma",        "intens",       "int_err",  "eps",        "ellip_err",
    "pa",         "pa_err",       "x0",       "x0_err",     "y0",
    "y0_err",     "grad",         "grad_error", "grad_r_error", "a3",
    "b3",         "a4",           "b4",       "a3_err",     "b3_err",
    "a4_err",     "b4_err",       "rms",      "pix_stddev", "sarea",
    "ndata",      "nflag",        "niter",    "valid",      "stop_code",
    "tflux_e",    "tflux_c",      "npix_e",   "npix_c"};

// Relative gradient error used for the deviations when none was measured
constexpr double kDefaultGradientRelativeError{0.64};

} // namespace

std::string_view fieldName(IsophoteField field)
{
    return kFieldNames.at(static_cast<size_t>(field));
}

std::optional<IsophoteField> fieldFromName(std::string_view name)
{
    const auto found = std::find(kFieldNames.cbegin(), kFieldNames.cend(), name);
    if (found == kFieldNames.cend()) {
        return {};
    }

    return static_cast<IsophoteField>(
        std::distance(kFieldNames.cbegin(), found));
}

bool isAngleField(IsophoteField field)
{
    return field == IsophoteField::Pa || field == IsophoteField::PaErr;
}

Isophote::Isophote(std::shared_ptr<const EllipseSample> sample, int niter,
                   bool valid, int stopCode)
    : m_sample(std::move(sample)),
      m_niter(niter),
      m_valid(valid),
      m_stopCode(stopCode)
{
    CHECK_NOTNULL(m_sample.get());

    const auto& geometry = m_sample->geometry();
    m_sma = geometry.sma();
    m_eps = geometry.eps();
    m_pa = geometry.pa();
    m_x0 = geometry.x0();
    m_y0 = geometry.y0();

    m_intens = m_sample->mean();
    m_grad = m_sample->gradient();
    m_gradError = m_sample->gradientError();
    m_gradRError = m_sample->gradientRelativeError();
    m_sarea = m_sample->sectorArea();
    m_ndata = m_sample->actualPoints();
    m_nflag = m_sample->totalPoints() - m_sample->actualPoints();

    computeFluxes();
    computeErrors();

    const auto third = computeDeviations(3);
    m_a3 = third[0];
    m_b3 = third[1];
    m_a3Err = third[2];
    m_b3Err = third[3];

    const auto fourth = computeDeviations(4);
    m_a4 = fourth[0];
    m_b4 = fourth[1];
    m_a4Err = fourth[2];
    m_b4Err = fourth[3];
}

Isophote Isophote::centralPixel(std::shared_ptr<const EllipseSample> sample)
{
    CHECK_NOTNULL(sample.get());

    Isophote central;
    central.m_sample = std::move(sample);
    central.m_central = true;

    const auto& geometry = central.m_sample->geometry();
    central.m_x0 = geometry.x0();
    central.m_y0 = geometry.y0();
    central.m_intens = central.m_sample->mean();
    central.m_ndata = central.m_sample->actualPoints();
    central.m_nflag =
        central.m_sample->totalPoints() - central.m_sample->actualPoints();
    central.m_gradError = 0.;
    central.m_gradRError = 0.;
    central.m_valid = true;
    central.m_stopCode = StopConverged;

    return central;
}

double Isophote::rms() const
{
    return m_central ? 0. : stats::stddev(m_sample->intensities());
}

double Isophote::intErr() const
{
    if (m_central) {
        return 0.;
    }

    return m_ndata > 0 ? rms() / std::sqrt(m_ndata) : kNaN;
}

double Isophote::pixStddev() const
{
    return m_central ? 0. : rms() * std::sqrt(m_sarea);
}

double Isophote::value(IsophoteField field) const
{
    switch (field) {
        case IsophoteField::Sma:
            return m_sma;
        case IsophoteField::Intens:
            return m_intens;
        case IsophoteField::IntErr:
            return intErr();
        case IsophoteField::Eps:
            return m_eps;
        case IsophoteField::EllipErr:
            return m_ellipErr;
        case IsophoteField::Pa:
            return m_pa;
        case IsophoteField::PaErr:
            return m_paErr;
        case IsophoteField::X0:
            return m_x0;
        case IsophoteField::X0Err:
            return m_x0Err;
        case IsophoteField::Y0:
            return m_y0;
        case IsophoteField::Y0Err:
            return m_y0Err;
        case IsophoteField::Grad:
            return m_grad;
        case IsophoteField::GradError:
            return m_gradError.value_or(kNaN);
        case IsophoteField::GradRError:
            return m_gradRError.value_or(kNaN);
        case IsophoteField::A3:
            return m_a3;
        case IsophoteField::B3:
            return m_b3;
        case IsophoteField::A4:
            return m_a4;
        case IsophoteField::B4:
            return m_b4;
        case IsophoteField::A3Err:
            return m_a3Err;
        case IsophoteField::B3Err:
            return m_b3Err;
        case IsophoteField::A4Err:
            return m_a4Err;
        case IsophoteField::B4Err:
            return m_b4Err;
        case IsophoteField::Rms:
            return rms();
        case IsophoteField::PixStddev:
            return pixStddev();
        case IsophoteField::Sarea:
            return m_sarea;
        case IsophoteField::Ndata:
            return m_ndata;
        case IsophoteField::Nflag:
            return m_nflag;
        case IsophoteField::Niter:
            return m_niter;
        case IsophoteField::Valid:
            return m_valid ? 1. : 0.;
        case IsophoteField::StopCode:
            return m_stopCode;
        case IsophoteField::TfluxE:
            return m_tfluxE;
        case IsophoteField::TfluxC:
            return m_tfluxC;
        case IsophoteField::NpixE:
            return m_npixE;
        case IsophoteField::NpixC:
            return m_npixC;
        default:
            break;
    }

    LOG(FATAL) << "Unknown isophote field: " << static_cast<int>(field);
    return kNaN;
}

int Isophote::compare(const Isophote& other) const
{
    const double tolerance =
        kSmaTolerance * std::max({1., std::abs(m_sma), std::abs(other.m_sma)});
    if (std::abs(m_sma - other.m_sma) <= tolerance) {
        return 0;
    }

    return m_sma < other.m_sma ? -1 : 1;
}

int Isophote::compare(const std::any& other) const
{
    if (const auto* isophote = std::any_cast<Isophote>(&other)) {
        return compare(*isophote);
    }

    throw IncompatibleComparison(
        "Comparison object does not have a \"sma\" attribute.");
}

void Isophote::computeFluxes()
{
    const auto& image = m_sample->image();
    const auto& geometry = m_sample->geometry();

    // Square that encloses the circle
    const int imin = std::max(0, static_cast<int>(m_x0 - m_sma - 0.5) - 1);
    const int jmin = std::max(0, static_cast<int>(m_y0 - m_sma - 0.5) - 1);
    const int imax =
        std::min(image.cols(), static_cast<int>(m_x0 + m_sma + 0.5) + 1);
    const int jmax =
        std::min(image.rows(), static_cast<int>(m_y0 + m_sma + 0.5) + 1);

    if (jmax - jmin <= 1 || imax - imin <= 1) {
        return;
    }

    for (int j{jmin}; j < jmax; ++j) {
        for (int i{imin}; i < imax; ++i) {
            if (image.state(i, j) != MaskedImage::PixelState::Valid) {
                continue;
            }

            const auto [radius, angle] = geometry.toPolar(i, j);
            const double value = image.at(i, j);
            if (radius <= m_sma) {
                m_tfluxC += value;
                ++m_npixC;
            }
            if (radius <= geometry.radius(angle)) {
                m_tfluxE += value;
                ++m_npixE;
            }
        }
    }
}

void Isophote::computeErrors()
{
    m_x0Err = m_y0Err = m_ellipErr = m_paErr = 0.;

    HarmonicFit fit;
    if (!(m_grad != 0. && std::isfinite(m_grad)) ||
        !fitFirstAndSecondHarmonics(m_sample->angles(),
                                    m_sample->intensities(), &fit)) {
        return;
    }

    const double residualRms = stats::stddev(harmonicResiduals(
        m_sample->angles(), m_sample->intensities(), fit.coeffs));
    const Eigen::VectorXd errors = fit.covariance.diagonal() * residualRms;

    // Direct projection of the coefficient errors
    const double q = 1. - m_eps;
    const double ea = std::abs(errors(2) / m_grad);
    const double eb = std::abs(errors(1) * q / m_grad);
    m_x0Err = std::hypot(ea * std::cos(m_pa), eb * std::sin(m_pa));
    m_y0Err = std::hypot(ea * std::sin(m_pa), eb * std::cos(m_pa));
    m_ellipErr = std::abs(2. * errors(4) * q / m_sma / m_grad);
    if (std::abs(m_eps) > std::numeric_limits<double>::epsilon()) {
        m_paErr = std::abs(2. * errors(3) * q / m_sma / m_grad /
                           (1. - math::square(q)));
    }
}

std::array<double, 4> Isophote::computeDeviations(int order) const
{
    std::array<double, 4> deviations;
    deviations.fill(kNaN);

    HarmonicFit fit;
    if (!fitUpperHarmonic(m_sample->angles(), m_sample->intensities(), order,
                          &fit)) {
        return deviations;
    }

    const double scale = m_sma * std::abs(m_grad);
    if (!(scale > 0.) || !std::isfinite(scale)) {
        return deviations;
    }

    const double a = fit.coeffs(1) / scale;
    const double b = fit.coeffs(2) / scale;
    const double gre = m_gradRError.value_or(kDefaultGradientRelativeError);
    const Eigen::VectorXd ce = fit.covariance.diagonal();

    deviations[0] = a;
    deviations[1] = b;
    deviations[2] =
        std::abs(a) * std::hypot(ce(1) / fit.coeffs(1), gre);
    deviations[3] =
        std::abs(b) * std::hypot(ce(2) / fit.coeffs(2), gre);
    return deviations;
}

} // namespace ef
