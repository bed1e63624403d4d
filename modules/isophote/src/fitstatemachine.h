#pragma once

#include <optional>
#include <string>

namespace ef {

enum class FitState
{
    Initialized,
    Iterating,
    Converged,
    SoftStop,
    HardStop,
    Failed
};

// Stop codes carried by fitted isophotes
enum StopCode : int
{
    StopAbandoned = -1,       // Abnormal condition detected mid-fit
    StopConverged = 0,
    StopSoft = 1,             // Max iterations or too many flagged points
    StopMinIterations = 2,    // Converged at the minimum iteration count
    StopFailed = 3,           // Insufficient data or singular harmonic fit
    StopNonIterative = 4,
    StopGeometryReplaced = 5, // Geometry borrowed from a neighbor isophote
    StopDiverged = 6          // Un-clip budget exhausted
};

bool isTerminal(FitState state);

// Numbers describing one fitter iteration, everything a transition needs.
struct IterationMetrics
{
    int iteration = 0; // zero based
    double largestAmplitude = 0.; // largest free harmonic, signed
    double residualRms = 0.; // spread of the harmonic fit residuals
    double sectorArea = 0.;
    int actualPoints = 0;
    int totalPoints = 0;
};

// Telemetry accumulated across transitions
struct FitProgress
{
    int worseningStreak = 0; // consecutive RMS increases
    int unclipCount = 0;
    double stepScale = 1.;   // factor applied to the corrections
    std::optional<double> previousRms;
    double bestAmplitude;
    int bestAmplitudeIteration = -1;
    // Gradient error limit exceeded once already
    bool lexceed = false;

    FitProgress();
};

struct FitCriteria
{
    double conver = 0.05;
    int minit = 10;
    int maxit = 50;
    double fflag = 0.7;
    int maxUnclip = 3;
    // Relative RMS increase below which an iteration is not worsening
    double rmsTolerance = 0.05;

    FitCriteria() {}
};

struct FitTransition
{
    FitState state;
    std::optional<int> stopCode;
    // Build the result from the sample with the smallest harmonic amplitude
    bool useBestSample = false;
    // Restart from the smallest amplitude geometry with the reduced step
    // scale
    bool unclip = false;
    FitProgress progress;
};

// Decides what follows an evaluated iteration. Pure, no side effects.
//
// NOTE:
// 1. Convergence needs the largest amplitude below conver * sector area *
// residual rms and at least minit iterations.
// 2. An RMS increase counts as worsening only beyond rmsTolerance, and never
// once the amplitude is below the convergence tolerance. Two consecutive
// worsening iterations un-clip, running out of un-clip budget is a hard stop.
FitTransition transition(FitState state, const IterationMetrics& metrics,
                         const FitProgress& progress,
                         const FitCriteria& criteria);

// Sample and geometry checks made after every correction
struct ConditionInputs
{
    double gradient = 0.;
    std::optional<double> gradientError;
    std::optional<double> gradientRelativeError;
    double eps = 0.;
    double x0 = 0.;
    double y0 = 0.;
    int imageWidth = 0;
    int imageHeight = 0;
};

struct ConditionLimits
{
    double maxgerr = 0.5;
    double maxEps = 0.95;
    bool goingInwards = false;

    ConditionLimits() {}
};

// Returns false when the fit has to be abandoned. Updates lexceed.
bool checkConditions(const ConditionInputs& inputs,
                     const ConditionLimits& limits, bool* lexceed,
                     std::string* reason = nullptr);

} // namespace ef
