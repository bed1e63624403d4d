#pragma once

#include <opencv2/core/mat.hpp>

namespace ef {

// Read-only view of an image plus its optional mask and error arrays.
//
// NOTE:
// 1. Data and error are stored as CV_64FC1, the mask as CV_8UC1 where a
// non-zero value excludes the pixel.
// 2. Copies share pixel buffers (cv::Mat reference counting), callers must
// not write into the arrays while a fit is running.
class MaskedImage
{
public:
    enum class PixelState
    {
        Valid,
        Masked,
        NonFinite,   // data is NaN or inf and nothing masks it
        InvalidError // error is NaN or inf
    };

    MaskedImage() = default;
    // Throws ShapeMismatch when mask or error shape differs from data.
    explicit MaskedImage(const cv::Mat& data, const cv::Mat& mask = {},
                         const cv::Mat& error = {});

    /// Properties
    inline int rows() const { return m_data.rows; }
    inline int cols() const { return m_data.cols; }
    inline cv::Size size() const { return m_data.size(); }
    inline bool empty() const { return m_data.empty(); }
    inline bool hasMask() const { return !m_mask.empty(); }
    inline bool hasError() const { return !m_error.empty(); }

    inline const cv::Mat& data() const { return m_data; }
    inline const cv::Mat& mask() const { return m_mask; }
    inline const cv::Mat& error() const { return m_error; }

    /// Pixel access, (x, y) is (column, row)
    inline double at(int x, int y) const { return m_data.at<double>(y, x); }
    inline double errorAt(int x, int y) const
    {
        return m_error.at<double>(y, x);
    }
    inline bool isMasked(int x, int y) const
    {
        return hasMask() && m_mask.at<uchar>(y, x) != 0;
    }
    inline bool contains(int x, int y) const
    {
        return x >= 0 && y >= 0 && x < cols() && y < rows();
    }

    PixelState state(int x, int y) const;

    // Number of pixels whose data is non-finite and not masked.
    int countUnmaskedNonFinite() const;

private:
    cv::Mat m_data;
    cv::Mat m_mask;
    cv::Mat m_error;
};

// Throws ShapeMismatch with the legacy "data and <name> must have the same
// shape." message when the arrays disagree. Empty arrays always pass.
void checkSameShape(const cv::Mat& data, const cv::Mat& other,
                    const char* name);

} // namespace ef
