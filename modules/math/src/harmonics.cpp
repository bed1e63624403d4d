#include "harmonics.h"

#include <cmath>

#include <Eigen/LU>
#include <glog/logging.h>

namespace ef {

namespace {

// Each row of the design matrix holds the basis functions evaluated at one
// sample angle, the first column is the constant term.
bool solveLinearLeastSquares(const Eigen::MatrixXd& A,
                             const Eigen::VectorXd& y, HarmonicFit* fit)
{
    if (A.rows() < A.cols()) {
        VLOG(2) << "Harmonic fit needs at least " << A.cols()
                << " samples, got " << A.rows();
        return false;
    }

    const Eigen::MatrixXd N = A.transpose() * A;
    Eigen::FullPivLU<Eigen::MatrixXd> lu{N};
    if (!lu.isInvertible()) {
        LOG(WARNING) << "Singular normal matrix in harmonic fit.";
        return false;
    }

    fit->coeffs = lu.solve(A.transpose() * y);
    fit->covariance = lu.inverse();

    return fit->coeffs.allFinite();
}

} // namespace

double firstAndSecondHarmonicFunction(double phi,
                                      const Eigen::VectorXd& c)
{
    return c(0) + c(1) * std::sin(phi) + c(2) * std::cos(phi) +
           c(3) * std::sin(2. * phi) + c(4) * std::cos(2. * phi);
}

bool fitFirstAndSecondHarmonics(const std::vector<double>& phi,
                                const std::vector<double>& intensities,
                                HarmonicFit* fit)
{
    CHECK_NOTNULL(fit);
    CHECK_EQ(phi.size(), intensities.size());

    const auto n = static_cast<Eigen::Index>(phi.size());
    Eigen::MatrixXd A{n, 5};
    for (Eigen::Index i{0}; i < n; ++i) {
        const double e = phi[i];
        A.row(i) << 1., std::sin(e), std::cos(e), std::sin(2. * e),
            std::cos(2. * e);
    }

    const Eigen::Map<const Eigen::VectorXd> y{intensities.data(), n};
    return solveLinearLeastSquares(A, y, fit);
}

bool fitUpperHarmonic(const std::vector<double>& phi,
                      const std::vector<double>& intensities, int order,
                      HarmonicFit* fit)
{
    CHECK_NOTNULL(fit);
    CHECK_EQ(phi.size(), intensities.size());
    CHECK_GT(order, 0);

    const auto n = static_cast<Eigen::Index>(phi.size());
    Eigen::MatrixXd A{n, 3};
    for (Eigen::Index i{0}; i < n; ++i) {
        const double e = order * phi[i];
        A.row(i) << 1., std::sin(e), std::cos(e);
    }

    const Eigen::Map<const Eigen::VectorXd> y{intensities.data(), n};
    return solveLinearLeastSquares(A, y, fit);
}

std::vector<double> harmonicResiduals(const std::vector<double>& phi,
                                      const std::vector<double>& intensities,
                                      const Eigen::VectorXd& coeffs)
{
    std::vector<double> residuals;
    residuals.reserve(phi.size());
    for (size_t i{0}; i < phi.size(); ++i) {
        residuals.push_back(intensities[i] -
                            firstAndSecondHarmonicFunction(phi[i], coeffs));
    }

    return residuals;
}

} // namespace ef
