#pragma once

#include <random>

namespace cv {
class Mat;
}

namespace ef {

// A wrapper around the std random generator. Default engine mt19937_64
class RandomNumberGenerator
{
public:
    RandomNumberGenerator();
    explicit RandomNumberGenerator(size_t seed);

    // Adds zero-mean Gaussian noise to every pixel of a CV_64FC1 image.
    void addGaussianNoise(cv::Mat& image, double sigma);

private:
    std::mt19937_64 m_rng;
};

} // namespace ef
