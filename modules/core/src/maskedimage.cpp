#include "maskedimage.h"

#include <cmath>
#include <string>

#include <opencv2/core.hpp>

#include "exceptions.h"

namespace ef {

void checkSameShape(const cv::Mat& data, const cv::Mat& other,
                    const char* name)
{
    if (other.empty()) {
        return;
    }

    if (data.size() != other.size()) {
        throw ShapeMismatch(std::string{"data and "} + name +
                            " must have the same shape.");
    }
}

MaskedImage::MaskedImage(const cv::Mat& data, const cv::Mat& mask,
                         const cv::Mat& error)
{
    // Validate everything before touching any pixel
    checkSameShape(data, mask, "mask");
    checkSameShape(data, error, "error");

    if (!data.empty() && data.channels() != 1) {
        throw std::invalid_argument("Only single channel images are supported.");
    }

    if (data.type() == CV_64FC1) {
        m_data = data;
    }
    else {
        data.convertTo(m_data, CV_64F);
    }

    if (!mask.empty()) {
        if (mask.type() == CV_8UC1) {
            m_mask = mask;
        }
        else {
            // Any non-zero value excludes the pixel
            m_mask = mask != 0;
        }
    }

    if (!error.empty()) {
        if (error.type() == CV_64FC1) {
            m_error = error;
        }
        else {
            error.convertTo(m_error, CV_64F);
        }
    }
}

MaskedImage::PixelState MaskedImage::state(int x, int y) const
{
    if (isMasked(x, y)) {
        return PixelState::Masked;
    }

    if (!std::isfinite(at(x, y))) {
        return PixelState::NonFinite;
    }

    if (hasError() && !std::isfinite(errorAt(x, y))) {
        return PixelState::InvalidError;
    }

    return PixelState::Valid;
}

int MaskedImage::countUnmaskedNonFinite() const
{
    int count{0};
    for (int y{0}; y < rows(); ++y) {
        for (int x{0}; x < cols(); ++x) {
            if (!isMasked(x, y) && !std::isfinite(at(x, y))) {
                ++count;
            }
        }
    }

    return count;
}

} // namespace ef
