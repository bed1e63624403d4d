#pragma once

#include <vector>

#include <Eigen/Core>

namespace ef {

// Result of a linear least squares harmonic fit.
struct HarmonicFit
{
    // First and second harmonics: [y0, a1, b1, a2, b2]
    // Upper harmonic of order n:  [y0, an, bn]
    Eigen::VectorXd coeffs;

    // Unscaled covariance (A^T * A)^-1 of the coefficients
    Eigen::MatrixXd covariance;

    inline double mean() const { return coeffs(0); }
};

// y0 + a1*sin(E) + b1*cos(E) + a2*sin(2E) + b2*cos(2E)
double firstAndSecondHarmonicFunction(double phi,
                                      const Eigen::VectorXd& coeffs);

// Fits the model above to intensities sampled at the eccentric anomalies
// phi. Returns false when the normal matrix is singular or there are fewer
// samples than coefficients.
bool fitFirstAndSecondHarmonics(const std::vector<double>& phi,
                                const std::vector<double>& intensities,
                                HarmonicFit* fit);

// y0 + an*sin(order*E) + bn*cos(order*E)
bool fitUpperHarmonic(const std::vector<double>& phi,
                      const std::vector<double>& intensities, int order,
                      HarmonicFit* fit);

// Intensities minus the first and second harmonic model.
std::vector<double> harmonicResiduals(const std::vector<double>& phi,
                                      const std::vector<double>& intensities,
                                      const Eigen::VectorXd& coeffs);

} // namespace ef
