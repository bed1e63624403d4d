#pragma once

#include <cmath>

#include <opencv2/core.hpp>

#include <efCore/MaskedImage>
#include <efCore/RandomGenerator>
#include <efIsophote/EllipseGeometry>

namespace ef {

// Elliptical de Vaucouleurs profile plus a flat background and a little
// Gaussian noise.
struct TestImageParams
{
    int nx = 512;
    int ny = 512;
    double x0 = 256.;
    double y0 = 256.;
    double background = 100.;
    double noise = 1e-6;
    double i0 = 100.;
    double sma = 40.;
    double eps = 0.2;
    double pa = 0.;
    size_t seed = 0;
};

inline cv::Mat makeTestImage(const TestImageParams& params = {})
{
    const EllipseGeometry geometry{params.x0, params.y0, params.sma,
                                   params.eps, params.pa};

    cv::Mat image{params.ny, params.nx, CV_64FC1};
    for (int y{0}; y < params.ny; ++y) {
        for (int x{0}; x < params.nx; ++x) {
            const auto [r, angle] = geometry.toPolar(x, y);
            const double ratio = r / geometry.radius(angle);
            image.at<double>(y, x) =
                params.i0 * std::exp(-7.669 * (std::pow(ratio, 0.25) - 1.)) +
                params.background;
        }
    }

    // The profile is singular at the center
    const int xc = static_cast<int>(params.x0);
    const int yc = static_cast<int>(params.y0);
    image.at<double>(yc, xc) =
        (image.at<double>(yc - 1, xc) + image.at<double>(yc + 1, xc) +
         image.at<double>(yc, xc - 1) + image.at<double>(yc, xc + 1)) /
        4.;

    RandomNumberGenerator rng{params.seed};
    rng.addGaussianNoise(image, params.noise);

    return image;
}

} // namespace ef
