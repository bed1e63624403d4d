#include "random.h"

#include <chrono>

#include <glog/logging.h>
#include <opencv2/core/mat.hpp>

namespace ef {

RandomNumberGenerator::RandomNumberGenerator()
    : RandomNumberGenerator(static_cast<size_t>(
          std::chrono::system_clock::now().time_since_epoch().count()))
{
}

RandomNumberGenerator::RandomNumberGenerator(size_t seed) : m_rng(seed) {}

void RandomNumberGenerator::addGaussianNoise(cv::Mat& image, double sigma)
{
    CHECK_EQ(image.type(), CV_64FC1);

    std::normal_distribution<double> distribution{0., sigma};
    for (int r{0}; r < image.rows; ++r) {
        auto* row = image.ptr<double>(r);
        for (int c{0}; c < image.cols; ++c) {
            row[c] += distribution(m_rng);
        }
    }
}

} // namespace ef
