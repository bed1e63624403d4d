#pragma once

#include <Eigen/Core>
#include <opencv2/core/mat.hpp>

namespace ef {

// Centroiding of compact sources in small cutouts.
//
// NOTE:
// 1. Data and error are single channel images, mask is non-zero where a pixel
// is excluded. Mask and error, when given, must have the data shape,
// otherwise ShapeMismatch is thrown before any work.
// 2. Unmasked non-finite pixels are excluded and reported by one glog
// warning per call.
// 3. Centroids are returned as (x, y), x along the columns.
// 4. The Gaussian fits throw FitFailure when the solver ends without a usable
// solution.

// Center of mass
Eigen::Vector2d centroidCom(const cv::Mat& data, const cv::Mat& mask = {});

// (amplitude, mean, stddev) of 1D data from its moments, amplitude being the
// peak to peak range. Data of any shape is flattened row by row. Non-finite
// values are excluded and warned about even when masked.
Eigen::Vector3d gaussian1dMoments(const cv::Mat& data,
                                  const cv::Mat& mask = {});

// Fits a constant plus a 1D Gaussian to the marginal sums along x and y.
Eigen::Vector2d centroid1dg(const cv::Mat& data, const cv::Mat& error = {},
                            const cv::Mat& mask = {});

// Fits a constant plus a 2D Gaussian to the data. Throws InsufficientData
// with fewer than 7 usable pixels.
Eigen::Vector2d centroid2dg(const cv::Mat& data, const cv::Mat& error = {},
                            const cv::Mat& mask = {});

} // namespace ef
