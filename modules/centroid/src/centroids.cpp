#include "centroids.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <vector>

#include <ceres/ceres.h>
#include <glog/logging.h>
#include <opencv2/core.hpp>

#include <efCore/Exceptions>
#include <efCore/MaskedImage>
#include <efCore/Math>

namespace ef {

namespace {

constexpr char kNonFiniteWarning[]{
    "Input data contains non-finite values (e.g., NaN or infs), which were "
    "automatically masked."};

// Constant plus 2D Gaussian
constexpr int kGaussian2DParamCount{7};

constexpr double kMinError{1e-30};
constexpr double kMinSigma{1e-3};

// Usable pixel value, or 0 for an excluded one
double filled(const MaskedImage& image, int x, int y)
{
    return image.state(x, y) == MaskedImage::PixelState::Valid ? image.at(x, y)
                                                                : 0.;
}

void warnIfNonFinite(const MaskedImage& image)
{
    if (image.countUnmaskedNonFinite() > 0) {
        LOG(WARNING) << kNonFiniteWarning;
    }
}

// params: constant, amplitude, mean, stddev
struct Gaussian1DResidual
{
    Gaussian1DResidual(double x, double y, double weight)
        : x_(x), y_(y), weight_(weight)
    {
    }

    template <typename T>
    bool operator()(const T* const params, T* residual) const
    {
        const T dx = T(x_) - params[2];
        const T model =
            params[0] +
            params[1] * exp(-dx * dx / (T(2.) * params[3] * params[3]));
        residual[0] = T(weight_) * (model - T(y_));
        return true;
    }

    static ceres::CostFunction* create(double x, double y, double weight)
    {
        return new ceres::AutoDiffCostFunction<Gaussian1DResidual, 1, 4>(
            new Gaussian1DResidual(x, y, weight));
    }

private:
    const double x_;
    const double y_;
    const double weight_;
};

// params: constant, amplitude, x_mean, y_mean, x_stddev, y_stddev, theta
struct Gaussian2DResidual
{
    Gaussian2DResidual(double x, double y, double z, double weight)
        : x_(x), y_(y), z_(z), weight_(weight)
    {
    }

    template <typename T>
    bool operator()(const T* const params, T* residual) const
    {
        const T cost = cos(params[6]);
        const T sint = sin(params[6]);
        const T sin2t = sin(T(2.) * params[6]);
        const T xvar = params[4] * params[4];
        const T yvar = params[5] * params[5];

        const T a = cost * cost / (T(2.) * xvar) + sint * sint / (T(2.) * yvar);
        const T b = sin2t / (T(4.) * yvar) - sin2t / (T(4.) * xvar);
        const T c = sint * sint / (T(2.) * xvar) + cost * cost / (T(2.) * yvar);

        const T dx = T(x_) - params[2];
        const T dy = T(y_) - params[3];
        const T model =
            params[0] +
            params[1] * exp(-(a * dx * dx + T(2.) * b * dx * dy + c * dy * dy));
        residual[0] = T(weight_) * (model - T(z_));
        return true;
    }

    static ceres::CostFunction* create(double x, double y, double z,
                                       double weight)
    {
        return new ceres::AutoDiffCostFunction<Gaussian2DResidual, 1,
                                               kGaussian2DParamCount>(
            new Gaussian2DResidual(x, y, z, weight));
    }

private:
    const double x_;
    const double y_;
    const double z_;
    const double weight_;
};

ceres::Solver::Options gaussianSolverOptions()
{
    ceres::Solver::Options options;
    options.linear_solver_type = ceres::DENSE_QR;
    options.max_num_iterations = 200;
    options.function_tolerance = 1e-12;
    options.gradient_tolerance = 1e-12;
    options.parameter_tolerance = 1e-12;
    options.logging_type = ceres::SILENT;
    return options;
}

void solve(ceres::Problem& problem)
{
    ceres::Solver::Summary summary;
    ceres::Solve(gaussianSolverOptions(), &problem, &summary);
    VLOG(2) << summary.BriefReport();

    if (!summary.IsSolutionUsable()) {
        throw FitFailure(std::format("Gaussian fit failed: {}",
                                     summary.message));
    }

    if (summary.termination_type == ceres::NO_CONVERGENCE) {
        LOG(WARNING) << "Gaussian fit reached the iteration limit, the "
                        "centroid may be inaccurate.";
    }
}

// Moments of already filled 1D data
Eigen::Vector3d moments(const std::vector<double>& data)
{
    double sum{0.}, sumX{0.};
    for (size_t i{0}; i < data.size(); ++i) {
        sum += data[i];
        sumX += i * data[i];
    }
    const double mean = sumX / sum;

    double sumVar{0.};
    for (size_t i{0}; i < data.size(); ++i) {
        sumVar += data[i] * math::square(i - mean);
    }
    const double stddev = std::sqrt(std::abs(sumVar / sum));

    const auto [min, max] = std::minmax_element(data.cbegin(), data.cend());
    return {*max - *min, mean, stddev};
}

// Constant plus 1D Gaussian fit, returns the Gaussian mean
double fitGaussian1D(const std::vector<double>& data,
                     const std::vector<double>& weights, double constantInit)
{
    const Eigen::Vector3d init = moments(data);
    double params[4]{constantInit, init[0], init[1],
                     std::max(init[2], kMinSigma)};

    ceres::Problem problem;
    for (size_t i{0}; i < data.size(); ++i) {
        if (weights[i] <= 0.) {
            continue;
        }
        problem.AddResidualBlock(
            Gaussian1DResidual::create(static_cast<double>(i), data[i],
                                       weights[i]),
            nullptr, params);
    }

    solve(problem);
    return params[2];
}

} // namespace

Eigen::Vector2d centroidCom(const cv::Mat& data, const cv::Mat& mask)
{
    const MaskedImage image{data, mask};
    warnIfNonFinite(image);

    double total{0.}, sumX{0.}, sumY{0.};
    for (int y{0}; y < image.rows(); ++y) {
        for (int x{0}; x < image.cols(); ++x) {
            const double v = filled(image, x, y);
            total += v;
            sumX += x * v;
            sumY += y * v;
        }
    }

    return {sumX / total, sumY / total};
}

Eigen::Vector3d gaussian1dMoments(const cv::Mat& data, const cv::Mat& mask)
{
    checkSameShape(data, mask, "mask");

    const MaskedImage image{data, mask};
    bool nonFinite{false};
    std::vector<double> values;
    values.reserve(image.rows() * image.cols());
    for (int y{0}; y < image.rows(); ++y) {
        for (int x{0}; x < image.cols(); ++x) {
            nonFinite |= !std::isfinite(image.at(x, y));
            values.push_back(filled(image, x, y));
        }
    }

    if (nonFinite) {
        LOG(WARNING) << kNonFiniteWarning;
    }

    return moments(values);
}

Eigen::Vector2d centroid1dg(const cv::Mat& data, const cv::Mat& error,
                            const cv::Mat& mask)
{
    const MaskedImage image{data, mask, error};
    warnIfNonFinite(image);

    const int rows = image.rows();
    const int cols = image.cols();

    // Marginal sums, and the quadrature sums of the errors along them
    std::vector<double> xData(cols, 0.), yData(rows, 0.);
    std::vector<double> xError2(cols, 0.), yError2(rows, 0.);
    std::vector<int> xCount(cols, 0), yCount(rows, 0);
    double constantInit{kMaxDouble};
    for (int y{0}; y < rows; ++y) {
        for (int x{0}; x < cols; ++x) {
            const double v = filled(image, x, y);
            constantInit = std::min(constantInit, v);
            xData[x] += v;
            yData[y] += v;

            if (image.state(x, y) != MaskedImage::PixelState::Valid) {
                continue;
            }
            ++xCount[x];
            ++yCount[y];
            if (image.hasError()) {
                const double e2 = math::square(image.errorAt(x, y));
                xError2[x] += e2;
                yError2[y] += e2;
            }
        }
    }

    // Fully excluded rows or columns get no weight
    const auto makeWeights = [&image](const std::vector<double>& error2,
                                      const std::vector<int>& count) {
        std::vector<double> weights(count.size(), 1.);
        for (size_t i{0}; i < count.size(); ++i) {
            if (count[i] == 0) {
                weights[i] = 0.;
            }
            else if (image.hasError()) {
                weights[i] = 1. / std::max(std::sqrt(error2[i]), kMinError);
            }
        }
        return weights;
    };

    const double xc =
        fitGaussian1D(xData, makeWeights(xError2, xCount), constantInit);
    const double yc =
        fitGaussian1D(yData, makeWeights(yError2, yCount), constantInit);

    return {xc, yc};
}

Eigen::Vector2d centroid2dg(const cv::Mat& data, const cv::Mat& error,
                            const cv::Mat& mask)
{
    const MaskedImage image{data, mask, error};
    warnIfNonFinite(image);

    const int rows = image.rows();
    const int cols = image.cols();

    int usable{0};
    double minValue{kMaxDouble}, maxValue{-kMaxDouble};
    for (int y{0}; y < rows; ++y) {
        for (int x{0}; x < cols; ++x) {
            const double v = filled(image, x, y);
            minValue = std::min(minValue, v);
            maxValue = std::max(maxValue, v);
            if (image.state(x, y) == MaskedImage::PixelState::Valid) {
                ++usable;
            }
        }
    }

    if (usable < kGaussian2DParamCount) {
        throw InsufficientData(
            std::format("Input data must have a least {} unmasked values to "
                        "fit a 2D Gaussian plus a constant.",
                        kGaussian2DParamCount),
            usable, kGaussian2DParamCount);
    }

    // Moments of the data shifted to be positive
    double sum{0.}, sumX{0.}, sumY{0.};
    for (int y{0}; y < rows; ++y) {
        for (int x{0}; x < cols; ++x) {
            if (image.state(x, y) != MaskedImage::PixelState::Valid) {
                continue;
            }
            const double v = image.at(x, y) - minValue;
            sum += v;
            sumX += x * v;
            sumY += y * v;
        }
    }
    const double xc = sumX / sum;
    const double yc = sumY / sum;

    Eigen::Matrix2d cov = Eigen::Matrix2d::Zero();
    for (int y{0}; y < rows; ++y) {
        for (int x{0}; x < cols; ++x) {
            if (image.state(x, y) != MaskedImage::PixelState::Valid) {
                continue;
            }
            const double v = image.at(x, y) - minValue;
            cov(0, 0) += v * math::square(x - xc);
            cov(1, 1) += v * math::square(y - yc);
            cov(0, 1) += v * (x - xc) * (y - yc);
        }
    }
    cov /= sum;
    cov(1, 0) = cov(0, 1);

    const double halfTrace = 0.5 * (cov(0, 0) + cov(1, 1));
    const double root = std::sqrt(math::square(0.5 * (cov(0, 0) - cov(1, 1))) +
                                  math::square(cov(0, 1)));
    const double semimajor = std::sqrt(std::max(halfTrace + root, 0.));
    const double semiminor = std::sqrt(std::max(halfTrace - root, 0.));
    const double orientation =
        0.5 * std::atan2(2. * cov(0, 1), cov(0, 0) - cov(1, 1));

    double params[kGaussian2DParamCount]{
        0., maxValue - minValue, xc, yc, std::max(semimajor, kMinSigma),
        std::max(semiminor, kMinSigma), orientation};

    ceres::Problem problem;
    for (int y{0}; y < rows; ++y) {
        for (int x{0}; x < cols; ++x) {
            if (image.state(x, y) != MaskedImage::PixelState::Valid) {
                continue;
            }

            const double weight =
                image.hasError()
                    ? 1. / std::max(image.errorAt(x, y), kMinError)
                    : 1.;
            problem.AddResidualBlock(
                Gaussian2DResidual::create(x, y, image.at(x, y) - minValue,
                                           weight),
                nullptr, params);
        }
    }

    solve(problem);
    return {params[2], params[3]};
}

} // namespace ef
