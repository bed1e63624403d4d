#pragma once

#include <memory>
#include <string>

#include "ellipsesample.h"
#include "fitstatemachine.h"
#include "isophote.h"

namespace ef {

// Iteratively corrects the geometry of one sample until its first and second
// harmonics vanish.
class EllipseFitter
{
public:
    struct Options
    {
        // Convergence: largest harmonic below conver * sector area * rms
        double conver = 0.05;
        int minit = 10;
        int maxit = 50;
        // Smallest acceptable fraction of usable sample points
        double fflag = 0.7;
        // Largest acceptable relative gradient error
        double maxgerr = 0.5;
        // Number of times the correction step may be halved
        int maxUnclip = 3;
        bool goingInwards = false;

        Options() {}
    };

    struct Summary
    {
        FitState state{FitState::Initialized};
        int stopCode{StopFailed};
        int iterations{0};
        FitProgress progress;
        // Why the fit ended early, if it did
        std::string message;
    };

    explicit EllipseFitter(std::shared_ptr<EllipseSample> sample);

    /// Actions
    Isophote fit(const Options& options = {});

    /// Results
    inline const Summary& summary() const { return m_summary; }

private:
    Isophote finish(std::shared_ptr<EllipseSample> sample, int niter,
                    bool valid, int stopCode, FitState state);

private:
    std::shared_ptr<EllipseSample> m_sample;
    Summary m_summary;
};

// Builds the central pixel isophote from a CentralEllipseSample.
class CentralEllipseFitter
{
public:
    explicit CentralEllipseFitter(std::shared_ptr<CentralEllipseSample> sample);

    Isophote fit();

private:
    std::shared_ptr<CentralEllipseSample> m_sample;
};

// Geometry corrections for the harmonics [a1, b1, a2, b2], using the STSDAS
// sign conventions. Fixed parameters are left untouched.
void applyHarmonicCorrection(int harmonicIndex, double amplitude,
                             double gradient, EllipseGeometry& geometry);

// Index into [a1, b1, a2, b2] of the largest free harmonic, -1 when every
// parameter is fixed.
int largestFreeHarmonic(const Eigen::VectorXd& coeffs,
                        const EllipseGeometry::FixMask& fix);

} // namespace ef
