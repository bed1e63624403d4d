#include <cmath>
#include <format>

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <efCentroid/Centroids>
#include <efCore/Exceptions>
#include <efCore/Math>

using namespace ef;

namespace {

constexpr double kCentroidTolerance{1e-3};

struct Gaussian2D
{
    double amplitude;
    double xMean;
    double yMean;
    double xStddev;
    double yStddev;
    double theta;

    double operator()(double x, double y) const
    {
        const double cost = std::cos(theta);
        const double sint = std::sin(theta);
        const double sin2t = std::sin(2. * theta);
        const double xvar = xStddev * xStddev;
        const double yvar = yStddev * yStddev;
        const double a = cost * cost / (2. * xvar) + sint * sint / (2. * yvar);
        const double b = sin2t / (4. * yvar) - sin2t / (4. * xvar);
        const double c = sint * sint / (2. * xvar) + cost * cost / (2. * yvar);
        const double dx = x - xMean;
        const double dy = y - yMean;
        return amplitude *
               std::exp(-(a * dx * dx + 2. * b * dx * dy + c * dy * dy));
    }
};

cv::Mat evaluate(const Gaussian2D& model, int rows, int cols)
{
    cv::Mat data{rows, cols, CV_64FC1};
    for (int y{0}; y < rows; ++y) {
        for (int x{0}; x < cols; ++x) {
            data.at<double>(y, x) = model(x, y);
        }
    }
    return data;
}

void expectCentroid(const Eigen::Vector2d& centroid, double xc, double yc)
{
    EXPECT_NEAR(centroid.x(), xc, kCentroidTolerance);
    EXPECT_NEAR(centroid.y(), yc, kCentroidTolerance);
}

} // namespace

TEST(Centroids, GaussianCentroids)
{
    constexpr double xc{25.7};
    constexpr double yc{26.2};

    for (const double xStd : {3.2, 4.0}) {
        for (const double yStd : {5.7, 4.1}) {
            for (const double thetaDeg : {30., 45.}) {
                SCOPED_TRACE(std::format("x_std {}, y_std {}, theta {}", xStd,
                                         yStd, thetaDeg));

                const Gaussian2D model{2.4, xc,   yc,
                                       xStd, yStd, math::degToRad(thetaDeg)};
                cv::Mat data = evaluate(model, 50, 47);

                expectCentroid(centroid1dg(data), xc, yc);
                expectCentroid(centroid2dg(data), xc, yc);

                cv::Mat error;
                cv::sqrt(data, error);
                expectCentroid(centroid1dg(data, error), xc, yc);
                expectCentroid(centroid2dg(data, error), xc, yc);

                cv::Mat mask = cv::Mat::zeros(data.size(), CV_8UC1);
                data.at<double>(10, 10) = 1e5;
                mask.at<uchar>(10, 10) = 1;
                expectCentroid(centroid1dg(data, {}, mask), xc, yc);
                expectCentroid(centroid2dg(data, {}, mask), xc, yc);
            }
        }
    }
}

TEST(Centroids, NonFiniteRow)
{
    constexpr double xc{24.7};
    constexpr double yc{25.2};

    const Gaussian2D model{2.4, xc, yc, 5., 5., 0.};
    cv::Mat data = evaluate(model, 50, 50);
    data.row(20).setTo(kNaN);

    // Excluded with a warning
    expectCentroid(centroid1dg(data), xc, yc);
    expectCentroid(centroid2dg(data), xc, yc);

    // Excluded silently
    cv::Mat mask = cv::Mat::zeros(data.size(), CV_8UC1);
    mask.row(20).setTo(1);
    expectCentroid(centroid1dg(data, {}, mask), xc, yc);
    expectCentroid(centroid2dg(data, {}, mask), xc, yc);
}

TEST(Centroids, InvalidMaskShape)
{
    const cv::Mat data = cv::Mat::zeros(4, 4, CV_64FC1);
    const cv::Mat mask = cv::Mat::zeros(2, 2, CV_8UC1);

    EXPECT_THROW(centroid1dg(data, {}, mask), ShapeMismatch);
    EXPECT_THROW(centroid2dg(data, {}, mask), ShapeMismatch);
    EXPECT_THROW(gaussian1dMoments(data, mask), ShapeMismatch);

    try {
        centroid2dg(data, {}, mask);
    }
    catch (const ShapeMismatch& e) {
        EXPECT_STREQ(e.what(), "data and mask must have the same shape.");
    }
}

TEST(Centroids, InvalidErrorShape)
{
    const cv::Mat data = cv::Mat::zeros(4, 4, CV_64FC1);
    const cv::Mat error = cv::Mat::zeros(2, 2, CV_8UC1);

    EXPECT_THROW(centroid1dg(data, error), ShapeMismatch);
    EXPECT_THROW(centroid2dg(data, error), ShapeMismatch);
}

TEST(Centroids, TooFewValuesFor2DFit)
{
    const cv::Mat data = cv::Mat::ones(2, 2, CV_64FC1);

    try {
        centroid2dg(data);
        FAIL() << "Expected InsufficientData";
    }
    catch (const InsufficientData& e) {
        EXPECT_EQ(e.available(), 4);
        EXPECT_EQ(e.required(), 7);
        EXPECT_NE(std::string{e.what()}.find(
                      "Input data must have a least 7 unmasked values"),
                  std::string::npos);
    }
}

TEST(Centroids, FlatDataHasNo2DGaussian)
{
    // No usable starting moments, the solver cannot evaluate the model
    const cv::Mat data = cv::Mat::ones(9, 9, CV_64FC1);
    EXPECT_THROW(centroid2dg(data), FitFailure);
}

TEST(Centroids, Gaussian1DMoments)
{
    cv::Mat data{1, 100, CV_64FC1};
    for (int x{0}; x < data.cols; ++x) {
        data.at<double>(0, x) =
            75. * std::exp(-math::square(x - 50.) / (2. * 25.));
    }

    const Eigen::Vector3d desired{75., 50., 5.};
    EXPECT_TRUE(gaussian1dMoments(data).isApprox(desired, 1e-6));

    cv::Mat mask = cv::Mat::zeros(data.size(), CV_8UC1);
    mask.at<uchar>(0, 0) = 1;
    data.at<double>(0, 0) = 1e5;
    EXPECT_TRUE(gaussian1dMoments(data, mask).isApprox(desired, 1e-6));

    // Masked non-finite values are still reported, and excluded
    data.at<double>(0, 0) = kNaN;
    EXPECT_TRUE(gaussian1dMoments(data, mask).isApprox(desired, 1e-6));
}

TEST(Centroids, CenterOfMass)
{
    const Gaussian2D model{1., 12.3, 9.6, 2., 2., 0.};
    cv::Mat data = evaluate(model, 24, 26);

    expectCentroid(centroidCom(data), 12.3, 9.6);

    cv::Mat mask = cv::Mat::zeros(data.size(), CV_8UC1);
    data.at<double>(0, 0) = 1e6;
    mask.at<uchar>(0, 0) = 1;
    expectCentroid(centroidCom(data, mask), 12.3, 9.6);
}
