#include "frame_diff/image/background.hpp"

#include <opencv2/imgproc.hpp>
#include <cstring>

namespace frame_diff::image {

int gaussian_kernel_radius(double sigma, double truncate) {
    return static_cast<int>(truncate * sigma + 0.5);
}

Matrix2Dd gaussian_smooth(const Matrix2Dd& frame, double sigma, double truncate) {
    if (frame.size() == 0) return Matrix2Dd(frame.rows(), frame.cols());

    const int radius = gaussian_kernel_radius(sigma, truncate);
    const int ksize = 2 * radius + 1;

    cv::Mat src(static_cast<int>(frame.rows()), static_cast<int>(frame.cols()), CV_64F,
                const_cast<double*>(frame.data()));
    cv::Mat blurred;
    // BORDER_REFLECT mirrors including the edge pixel (dcba|abcd).
    cv::GaussianBlur(src, blurred, cv::Size(ksize, ksize), sigma, sigma, cv::BORDER_REFLECT);

    Matrix2Dd result(frame.rows(), frame.cols());
    if (blurred.isContinuous()) {
        std::memcpy(result.data(), blurred.ptr<double>(0),
                    static_cast<size_t>(result.size()) * sizeof(double));
    } else {
        for (int y = 0; y < blurred.rows; ++y) {
            std::memcpy(result.row(y).data(), blurred.ptr<double>(y),
                        static_cast<size_t>(blurred.cols) * sizeof(double));
        }
    }
    return result;
}

Matrix2Dd suppress_background(const Matrix2Dd& frame, double sigma, double truncate) {
    return frame - gaussian_smooth(frame, sigma, truncate);
}

} // namespace frame_diff::image
