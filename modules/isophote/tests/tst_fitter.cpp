#include <cmath>

#include <gtest/gtest.h>

#include <efCore/Math>
#include <efIsophote/EllipseFitter>

#include "test_utils.h"

using namespace ef;

namespace {

TestImageParams lowNoiseParams()
{
    TestImageParams params;
    params.noise = 1e-10;
    return params;
}

} // namespace

TEST(EllipseFitter, FitsLowNoiseImage)
{
    const MaskedImage image{makeTestImage(lowNoiseParams())};
    const EllipseGeometry geometry{256., 256., 40., 0.2, 0.};

    auto sample = std::make_shared<EllipseSample>(image, 40., geometry);
    EllipseFitter fitter{sample};

    EllipseFitter::Options options;
    options.maxit = 400;
    const Isophote isophote = fitter.fit(options);

    EXPECT_TRUE(isophote.valid());
    EXPECT_TRUE(isophote.stopCode() == StopConverged ||
                isophote.stopCode() == StopMinIterations);
    EXPECT_EQ(fitter.summary().state, FitState::Converged);
    EXPECT_EQ(fitter.summary().iterations, isophote.niter());

    // Geometry
    EXPECT_NEAR(isophote.x0(), 256., 1e-3);
    EXPECT_NEAR(isophote.y0(), 256., 1e-3);
    EXPECT_NEAR(isophote.eps(), 0.2, 1e-3);
    EXPECT_NEAR(isophote.pa(), 0., 1e-3);

    // Photometry
    EXPECT_GE(isophote.intens(), 199.);
    EXPECT_LE(isophote.intens(), 201.);
    EXPECT_GE(isophote.intErr(), 0.0005);
    EXPECT_LE(isophote.intErr(), 0.002);
    EXPECT_GE(isophote.pixStddev(), 0.01);
    EXPECT_LE(isophote.pixStddev(), 0.05);
    EXPECT_GE(std::abs(isophote.grad()), 4.1);
    EXPECT_LE(std::abs(isophote.grad()), 4.35);

    // Integrals
    EXPECT_GE(isophote.tfluxE(), 1.80e6);
    EXPECT_LE(isophote.tfluxE(), 1.87e6);
    EXPECT_GE(isophote.tfluxC(), 2.00e6);
    EXPECT_LE(isophote.tfluxC(), 2.05e6);
    EXPECT_GT(isophote.npixC(), isophote.npixE());

    // Deviations from a perfect ellipse
    EXPECT_LE(std::abs(isophote.a3()), 0.01);
    EXPECT_LE(std::abs(isophote.b3()), 0.01);
    EXPECT_LE(std::abs(isophote.a4()), 0.01);
    EXPECT_LE(std::abs(isophote.b4()), 0.01);
}

TEST(EllipseFitter, RecoversOffsetStart)
{
    TestImageParams params;
    params.nx = 256;
    params.ny = 256;
    params.x0 = 128.;
    params.y0 = 128.;
    params.noise = 1e-10;
    const MaskedImage image{makeTestImage(params)};

    // Center and ellipticity a little off
    const EllipseGeometry geometry{129., 127.5, 40., 0.25, 0.1};
    auto sample = std::make_shared<EllipseSample>(image, 40., geometry);
    EllipseFitter fitter{sample};

    EllipseFitter::Options options;
    options.maxit = 200;
    const Isophote isophote = fitter.fit(options);

    EXPECT_TRUE(isophote.valid());
    EXPECT_TRUE(isophote.stopCode() == StopConverged ||
                isophote.stopCode() == StopMinIterations);
    EXPECT_EQ(fitter.summary().progress.unclipCount, 0);
    EXPECT_NEAR(isophote.x0(), 128., 1e-3);
    EXPECT_NEAR(isophote.y0(), 128., 1e-3);
    EXPECT_NEAR(isophote.eps(), 0.2, 1e-3);
    EXPECT_NEAR(isophote.pa(), 0., 1e-3);
}

TEST(EllipseFitter, ConvergesFromNearbySeeds)
{
    TestImageParams params;
    params.nx = 256;
    params.ny = 256;
    params.x0 = 128.;
    params.y0 = 128.;
    params.noise = 1e-10;
    const MaskedImage image{makeTestImage(params)};

    const EllipseGeometry seeds[]{
        {128., 128., 40., 0.2, 0.},
        {128.3, 127.8, 40., 0.21, 0.02},
        {127.6, 128.4, 40., 0.18, -0.03},
    };
    for (const auto& seed : seeds) {
        SCOPED_TRACE(testing::Message() << "seed x0 " << seed.x0() << " y0 "
                                        << seed.y0() << " eps " << seed.eps());

        auto sample = std::make_shared<EllipseSample>(image, 40., seed);
        EllipseFitter fitter{sample};
        EllipseFitter::Options options;
        options.maxit = 200;
        const Isophote isophote = fitter.fit(options);

        EXPECT_TRUE(isophote.valid());
        EXPECT_TRUE(isophote.stopCode() == StopConverged ||
                    isophote.stopCode() == StopMinIterations);
        EXPECT_NEAR(isophote.x0(), 128., 1e-3);
        EXPECT_NEAR(isophote.y0(), 128., 1e-3);
        EXPECT_NEAR(isophote.eps(), 0.2, 1e-3);
        EXPECT_NEAR(isophote.pa(), 0., 1e-3);
    }
}

TEST(EllipseFitter, FitsNearlyRoundIsophotes)
{
    for (const double eps : {0.02, 0.03, 0.04}) {
        SCOPED_TRACE(testing::Message() << "eps " << eps);

        TestImageParams params;
        params.nx = 256;
        params.ny = 256;
        params.x0 = 128.;
        params.y0 = 128.;
        params.eps = eps;
        params.noise = 1e-10;
        const MaskedImage image{makeTestImage(params)};

        // From the true geometry
        {
            auto sample = std::make_shared<EllipseSample>(
                image, 40., EllipseGeometry{128., 128., 40., eps, 0.});
            EllipseFitter fitter{sample};
            EllipseFitter::Options options;
            options.maxit = 200;
            const Isophote isophote = fitter.fit(options);
            EXPECT_TRUE(isophote.valid());
            EXPECT_TRUE(isophote.stopCode() == StopConverged ||
                        isophote.stopCode() == StopMinIterations);
            EXPECT_NEAR(isophote.eps(), eps, 5e-3);
        }

        // From a rounder guess the ellipticity has to come down below 0.05
        {
            auto sample = std::make_shared<EllipseSample>(
                image, 40., EllipseGeometry{128., 128., 40., 0.1, 0.});
            EllipseFitter fitter{sample};
            EllipseFitter::Options options;
            options.maxit = 400;
            const Isophote isophote = fitter.fit(options);
            EXPECT_TRUE(isophote.valid());
            EXPECT_NEAR(isophote.eps(), eps, 5e-3);
            EXPECT_LT(isophote.eps(), 0.05);
        }
    }
}

TEST(EllipseFitter, InsufficientDataFails)
{
    const MaskedImage image{cv::Mat{20, 20, CV_64FC1, cv::Scalar{1.}}};
    const EllipseGeometry geometry{2., 2., 60., 0.2, 0.};

    auto sample = std::make_shared<EllipseSample>(image, 60., geometry);
    EllipseFitter fitter{sample};
    const Isophote isophote = fitter.fit();

    EXPECT_FALSE(isophote.valid());
    EXPECT_EQ(isophote.stopCode(), StopFailed);
    EXPECT_EQ(fitter.summary().state, FitState::Failed);
    EXPECT_FALSE(fitter.summary().message.empty());
}

TEST(EllipseFitter, FixedParametersStayPut)
{
    TestImageParams params;
    params.nx = 256;
    params.ny = 256;
    params.x0 = 128.;
    params.y0 = 128.;
    const MaskedImage image{makeTestImage(params)};

    EllipseGeometry::FixMask fix{};
    fix[EllipseGeometry::X0] = true;
    fix[EllipseGeometry::Y0] = true;
    const EllipseGeometry geometry{128.5, 128., 30., 0.3, 0., 0.1, false, fix};

    auto sample = std::make_shared<EllipseSample>(image, 30., geometry);
    EllipseFitter fitter{sample};
    const Isophote isophote = fitter.fit();

    EXPECT_DOUBLE_EQ(isophote.x0(), 128.5);
    EXPECT_DOUBLE_EQ(isophote.y0(), 128.);
}

TEST(EllipseFitter, CentralPixel)
{
    const cv::Mat data = makeTestImage();
    const MaskedImage image{data};
    const EllipseGeometry geometry{256., 256., 10., 0.2, 0.};

    CentralEllipseFitter fitter{
        std::make_shared<CentralEllipseSample>(image, geometry)};
    const Isophote isophote = fitter.fit();

    EXPECT_DOUBLE_EQ(isophote.sma(), 0.);
    EXPECT_TRUE(isophote.valid());
    EXPECT_EQ(isophote.stopCode(), StopConverged);
    EXPECT_NEAR(isophote.intens(), data.at<double>(256, 256), 1e-9);
    EXPECT_DOUBLE_EQ(isophote.rms(), 0.);
}

TEST(HarmonicCorrection, LargestFreeHarmonic)
{
    Eigen::VectorXd coeffs{5};
    coeffs << 100., 0.1, -0.4, 0.3, 0.2;

    EXPECT_EQ(largestFreeHarmonic(coeffs, {}), 1);

    // b1 moves the center
    EXPECT_EQ(largestFreeHarmonic(coeffs, {true, true, false, false}), 2);
    EXPECT_EQ(largestFreeHarmonic(coeffs, {true, true, false, true}), 3);
    EXPECT_EQ(largestFreeHarmonic(coeffs, {true, true, true, true}), -1);

    // One free center coordinate keeps the first harmonics in play
    EXPECT_EQ(largestFreeHarmonic(coeffs, {true, false, false, false}), 1);
}

TEST(HarmonicCorrection, CenterShift)
{
    EllipseGeometry geometry{50., 50., 20., 0.2, 0.};

    // b1 shifts along the major axis, here the x axis
    applyHarmonicCorrection(1, 2., -4., geometry);
    EXPECT_NEAR(geometry.x0(), 50.5, 1e-12);
    EXPECT_NEAR(geometry.y0(), 50., 1e-12);

    // a1 along the minor axis
    applyHarmonicCorrection(0, 2., -4., geometry);
    EXPECT_NEAR(geometry.x0(), 50.5, 1e-12);
    EXPECT_NEAR(geometry.y0(), 50.4, 1e-12);
}

TEST(HarmonicCorrection, EllipticityUpperLimit)
{
    EllipseGeometry geometry{50., 50., 20., 0.9, 0.};
    applyHarmonicCorrection(3, 50., -1., geometry);
    EXPECT_DOUBLE_EQ(geometry.eps(), 0.95);
}

TEST(HarmonicCorrection, SmallEllipticityIsKept)
{
    // eps - 2 b2 (1 - eps) / (sma grad) = 0.1 - 0.06
    EllipseGeometry geometry{50., 50., 20., 0.1, 0.3};
    applyHarmonicCorrection(3, -(0.06 * 20. * 2.) / (2. * 0.9), -2., geometry);
    EXPECT_NEAR(geometry.eps(), 0.04, 1e-12);
    EXPECT_DOUBLE_EQ(geometry.pa(), 0.3);
}

TEST(HarmonicCorrection, NegativeEllipticityIsReflected)
{
    // 0.1 - 3 * 2 * 0.9 / 20 / 2 = -0.035
    EllipseGeometry geometry{50., 50., 20., 0.1, 0.3};
    applyHarmonicCorrection(3, -3., -2., geometry);
    EXPECT_NEAR(geometry.eps(), 0.035, 1e-12);
    EXPECT_NEAR(geometry.pa(), 0.3 - half_pi, 1e-12);

    geometry = EllipseGeometry{50., 50., 20., 0.1, -0.3};
    applyHarmonicCorrection(3, -3., -2., geometry);
    EXPECT_NEAR(geometry.eps(), 0.035, 1e-12);
    EXPECT_NEAR(geometry.pa(), -0.3 + half_pi, 1e-12);
}

TEST(HarmonicCorrection, ExactCircleIsAvoided)
{
    // 0.5 - 10 * 2 * 0.5 / 20 / 1 = 0
    EllipseGeometry geometry{50., 50., 20., 0.5, 0.};
    applyHarmonicCorrection(3, -10., -1., geometry);
    EXPECT_DOUBLE_EQ(geometry.eps(), 0.05);
}

TEST(HarmonicCorrection, FixedCenterIgnoresShift)
{
    EllipseGeometry::FixMask fix{};
    fix[EllipseGeometry::X0] = true;
    EllipseGeometry geometry{50., 50., 20., 0.2, 0., 0.1, false, fix};

    applyHarmonicCorrection(1, 2., -4., geometry);
    EXPECT_DOUBLE_EQ(geometry.x0(), 50.);
}
