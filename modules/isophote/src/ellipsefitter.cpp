#include "ellipsefitter.h"

#include <algorithm>
#include <cmath>
#include <format>

#include <glog/logging.h>

#include <efCore/Exceptions>
#include <efCore/Math>
#include <efMath/Harmonics>
#include <efMath/Statistics>

namespace ef {

namespace {

constexpr double kCircleEps{0.05};
constexpr double kMaxEps{0.95};

// Harmonic indices into [a1, b1, a2, b2]
enum Harmonic
{
    A1,
    B1,
    A2,
    B2
};

bool isHarmonicFree(int harmonic, const EllipseGeometry::FixMask& fix)
{
    switch (harmonic) {
        case A1:
        case B1:
            return !(fix[EllipseGeometry::X0] && fix[EllipseGeometry::Y0]);
        case A2:
            return !fix[EllipseGeometry::Pa];
        case B2:
            return !fix[EllipseGeometry::Eps];
        default:
            break;
    }
    return false;
}

} // namespace

int largestFreeHarmonic(const Eigen::VectorXd& coeffs,
                        const EllipseGeometry::FixMask& fix)
{
    CHECK_GE(coeffs.size(), 5);

    int largest{-1};
    double largestAmplitude{-1.};
    for (int i{A1}; i <= B2; ++i) {
        if (!isHarmonicFree(i, fix)) {
            continue;
        }

        // coeffs[0] is the mean intensity
        const double amplitude = std::abs(coeffs(i + 1));
        if (amplitude > largestAmplitude) {
            largestAmplitude = amplitude;
            largest = i;
        }
    }

    return largest;
}

void applyHarmonicCorrection(int harmonicIndex, double amplitude,
                             double gradient, EllipseGeometry& geometry)
{
    const double eps = geometry.eps();
    const double pa = geometry.pa();
    const double sma = geometry.sma();
    const double q = 1. - eps;

    const auto moveCenter = [&geometry](double dx, double dy) {
        const auto& fix = geometry.fix();
        geometry.setCenter(geometry.x0() + (fix[EllipseGeometry::X0] ? 0. : dx),
                           geometry.y0() + (fix[EllipseGeometry::Y0] ? 0. : dy));
    };

    switch (harmonicIndex) {
        case A1: {
            // Shift along the minor axis
            const double aux = -amplitude * q / gradient;
            moveCenter(-aux * std::sin(pa), aux * std::cos(pa));
        } break;
        case B1: {
            // Shift along the major axis
            const double aux = -amplitude / gradient;
            moveCenter(aux * std::cos(pa), aux * std::sin(pa));
        } break;
        case A2: {
            const double correction =
                amplitude * 2. * q / sma / gradient / (q * q - 1.);
            geometry.setPa(pa + correction);
        } break;
        case B2: {
            const double correction = amplitude * 2. * q / sma / gradient;
            geometry.setEps(std::min(eps - correction, kMaxEps));
        } break;
        default:
            break;
    }

    // Crossing eps = 0 flips the axes, and an exact circle makes the
    // ellipticity correction diverge
    if (geometry.eps() < 0.) {
        geometry.reflect();
    }
    if (geometry.eps() == 0.) {
        geometry.setEps(kCircleEps);
    }
}

///------- EllipseFitter starts from here
EllipseFitter::EllipseFitter(std::shared_ptr<EllipseSample> sample)
    : m_sample(std::move(sample))
{
    CHECK_NOTNULL(m_sample.get());
}

Isophote EllipseFitter::fit(const Options& options)
{
    CHECK_GT(options.maxit, 0);

    m_summary = {};

    FitCriteria criteria;
    criteria.conver = options.conver;
    criteria.minit = options.minit;
    criteria.maxit = options.maxit;
    criteria.fflag = options.fflag;
    criteria.maxUnclip = options.maxUnclip;

    ConditionLimits limits;
    limits.maxgerr = options.maxgerr;
    limits.maxEps = kMaxEps;
    limits.goingInwards = options.goingInwards;

    const auto fix = m_sample->geometry().fix();

    auto sample = m_sample;
    try {
        sample->update(fix);
    }
    catch (const InsufficientData& e) {
        m_summary.message = e.what();
        return finish(sample, 1, false, StopFailed, FitState::Failed);
    }

    FitState state{FitState::Iterating};
    FitProgress progress;
    std::shared_ptr<EllipseSample> bestAmplitudeSample = sample;

    for (int i{0}; i < options.maxit; ++i) {
        HarmonicFit harmonics;
        if (!fitFirstAndSecondHarmonics(sample->angles(),
                                        sample->intensities(), &harmonics)) {
            m_summary.message = "Harmonic fit failed.";
            return finish(sample, i + 1, false, StopFailed, FitState::Failed);
        }

        const int largest = largestFreeHarmonic(harmonics.coeffs, fix);
        const double amplitude =
            largest < 0 ? 0. : harmonics.coeffs(largest + 1);

        IterationMetrics metrics;
        metrics.iteration = i;
        metrics.largestAmplitude = amplitude;
        metrics.residualRms = stats::stddev(harmonicResiduals(
            sample->angles(), sample->intensities(), harmonics.coeffs));
        metrics.sectorArea = sample->sectorArea();
        metrics.actualPoints = sample->actualPoints();
        metrics.totalPoints = sample->totalPoints();

        const auto next = transition(state, metrics, progress, criteria);
        state = next.state;
        progress = next.progress;
        if (progress.bestAmplitudeIteration == i) {
            bestAmplitudeSample = sample;
        }
        m_summary.progress = progress;

        VLOG(2) << std::format(
            "sma {:8.3f} iter {:3d} amplitude {:12.5e} rms {:12.5e} "
            "x0 {:8.3f} y0 {:8.3f} eps {:6.4f} pa {:7.4f}",
            sample->geometry().sma(), i, amplitude, metrics.residualRms,
            sample->geometry().x0(), sample->geometry().y0(),
            sample->geometry().eps(), sample->geometry().pa());

        switch (state) {
            case FitState::Converged:
                return finish(sample, i + 1, true, next.stopCode.value(),
                              state);
            case FitState::SoftStop:
                return finish(next.useBestSample ? bestAmplitudeSample : sample,
                              i + 1, true, next.stopCode.value(), state);
            case FitState::HardStop:
                m_summary.message = "Fit diverged, un-clip budget exhausted.";
                return finish(bestAmplitudeSample, i + 1, false,
                              next.stopCode.value(), state);
            default:
                break;
        }

        EllipseGeometry geometry = sample->geometry();
        if (next.unclip) {
            VLOG(2) << "Residual rms increased twice, restarting from "
                       "iteration "
                    << progress.bestAmplitudeIteration << " with step scale "
                    << progress.stepScale;
            geometry.unclip(bestAmplitudeSample->geometry(), 1.);
        }
        else if (largest >= 0) {
            applyHarmonicCorrection(largest, amplitude * progress.stepScale,
                                    sample->gradient(), geometry);
        }

        auto candidate = std::make_shared<EllipseSample>(
            sample->image(), geometry.sma(), geometry, sample->options());
        try {
            candidate->update(fix);
        }
        catch (const InsufficientData& e) {
            m_summary.message = e.what();
            return finish(candidate, i + 1, false, StopFailed,
                          FitState::Failed);
        }
        sample = candidate;

        if (next.unclip) {
            continue;
        }

        ConditionInputs inputs;
        inputs.gradient = sample->gradient();
        inputs.gradientError = sample->gradientError();
        inputs.gradientRelativeError = sample->gradientRelativeError();
        inputs.eps = sample->geometry().eps();
        inputs.x0 = sample->geometry().x0();
        inputs.y0 = sample->geometry().y0();
        inputs.imageWidth = sample->image().cols();
        inputs.imageHeight = sample->image().rows();

        std::string reason;
        if (!checkConditions(inputs, limits, &progress.lexceed, &reason)) {
            m_summary.message = reason;
            m_summary.progress = progress;
            return finish(sample, i + 1, true, StopAbandoned,
                          FitState::SoftStop);
        }
    }

    // Only reached when the last transition asked for more iterations
    return finish(bestAmplitudeSample, options.maxit, true, StopSoft,
                  FitState::SoftStop);
}

Isophote EllipseFitter::finish(std::shared_ptr<EllipseSample> sample,
                               int niter, bool valid, int stopCode,
                               FitState state)
{
    m_summary.state = state;
    m_summary.stopCode = stopCode;
    m_summary.iterations = niter;

    if (!m_summary.message.empty()) {
        VLOG(1) << "Fit at sma = " << sample->geometry().sma()
                << " stopped with code " << stopCode << ": "
                << m_summary.message;
    }

    return {std::move(sample), niter, valid, stopCode};
}

///------- CentralEllipseFitter starts from here
CentralEllipseFitter::CentralEllipseFitter(
    std::shared_ptr<CentralEllipseSample> sample)
    : m_sample(std::move(sample))
{
    CHECK_NOTNULL(m_sample.get());
}

Isophote CentralEllipseFitter::fit()
{
    m_sample->update(m_sample->geometry().fix());
    return Isophote::centralPixel(m_sample);
}

} // namespace ef
