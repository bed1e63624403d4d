#include "fitstatemachine.h"

#include <cmath>

#include <glog/logging.h>

#include <efCore/Math>

namespace ef {

bool isTerminal(FitState state)
{
    switch (state) {
        case FitState::Converged:
        case FitState::SoftStop:
        case FitState::HardStop:
        case FitState::Failed:
            return true;
        default:
            return false;
    }
}

FitProgress::FitProgress() : bestAmplitude(kInfDouble) {}

FitTransition transition(FitState state, const IterationMetrics& metrics,
                         const FitProgress& progress,
                         const FitCriteria& criteria)
{
    FitTransition next{.state = state, .progress = progress};
    if (isTerminal(state)) {
        return next;
    }

    auto& p = next.progress;

    const double amplitude = std::abs(metrics.largestAmplitude);
    const bool belowTolerance =
        criteria.conver * metrics.sectorArea * metrics.residualRms > amplitude;

    // Telemetry
    const bool rmsIncreased =
        !belowTolerance && p.previousRms.has_value() &&
        metrics.residualRms >
            p.previousRms.value() * (1. + criteria.rmsTolerance);
    p.worseningStreak = rmsIncreased ? p.worseningStreak + 1 : 0;
    p.previousRms = metrics.residualRms;

    if (amplitude < p.bestAmplitude) {
        p.bestAmplitude = amplitude;
        p.bestAmplitudeIteration = metrics.iteration;
    }

    // Convergence
    if (belowTolerance && metrics.iteration >= criteria.minit - 1) {
        next.state = FitState::Converged;
        next.stopCode = metrics.iteration == criteria.minit - 1
                            ? StopMinIterations
                            : StopConverged;
        return next;
    }

    // Too many flagged points
    if (metrics.actualPoints < metrics.totalPoints * criteria.fflag) {
        next.state = FitState::SoftStop;
        next.stopCode = StopSoft;
        next.useBestSample = true;
        return next;
    }

    if (p.worseningStreak >= 2) {
        if (p.unclipCount >= criteria.maxUnclip) {
            next.state = FitState::HardStop;
            next.stopCode = StopDiverged;
            return next;
        }

        ++p.unclipCount;
        p.stepScale *= 0.5;
        p.worseningStreak = 0;
        p.previousRms.reset();
        next.unclip = true;
    }

    if (metrics.iteration + 1 >= criteria.maxit) {
        next.state = FitState::SoftStop;
        next.stopCode = StopSoft;
        next.useBestSample = true;
        next.unclip = false;
        return next;
    }

    next.state = FitState::Iterating;
    return next;
}

bool checkConditions(const ConditionInputs& inputs,
                     const ConditionLimits& limits, bool* lexceed,
                     std::string* reason)
{
    CHECK_NOTNULL(lexceed);

    const auto fail = [reason](const char* why) {
        if (reason) {
            *reason = why;
        }
        return false;
    };

    // An acceptable gradient needs a measured error
    const bool hasError = inputs.gradientError.has_value() &&
                          inputs.gradientError.value() != 0. &&
                          inputs.gradientRelativeError.has_value() &&
                          inputs.gradientRelativeError.value() != 0.;
    if (!hasError) {
        return fail("No meaningful gradient could be measured.");
    }

    if (!limits.goingInwards &&
        (inputs.gradientRelativeError.value() > limits.maxgerr ||
         inputs.gradient >= 0.)) {
        if (*lexceed) {
            return fail("Gradient relative error exceeded the limit twice.");
        }
        *lexceed = true;
    }

    if (std::abs(inputs.eps) > limits.maxEps) {
        return fail("Ellipticity diverged.");
    }

    if (inputs.x0 < 1. || inputs.x0 > inputs.imageWidth || inputs.y0 < 1. ||
        inputs.y0 > inputs.imageHeight) {
        return fail("Center left the image.");
    }

    return true;
}

} // namespace ef
