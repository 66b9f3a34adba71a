#include "viewfinder/analysis/FocusPeakingEngine.hpp"
#include "viewfinder/analysis/Luminance.hpp"

#include <opencv2/imgproc.hpp>

#include <vector>

namespace viewfinder {
namespace analysis {

cv::Mat FocusPeakingEngine::compute(const cv::Mat& frame) const {
    if (frame.empty()) {
        return cv::Mat();
    }

    cv::Mat luminance;
    toLuminance(frame).convertTo(luminance, CV_32F, 1.0 / 255.0);

    // 3x3 Sobel scaled so a unit step edge responds with 1.0
    cv::Mat dx, dy, magnitude;
    cv::Sobel(luminance, dx, CV_32F, 1, 0, 3, 0.25);
    cv::Sobel(luminance, dy, CV_32F, 0, 1, 3, 0.25);
    cv::magnitude(dx, dy, magnitude);

    cv::Mat alpha = magnitude * config_.intensity;
    if (config_.threshold > 0.0f) {
        alpha.setTo(0.0f, alpha < config_.threshold);
    }

    cv::Mat alpha8;
    alpha.convertTo(alpha8, CV_8U, 255.0);
    const cv::Mat visible = alpha8 > 0;

    std::vector<cv::Mat> planes(4);
    for (int c = 0; c < 3; ++c) {
        planes[c] = cv::Mat::zeros(frame.size(), CV_8U);
        planes[c].setTo(config_.highlight[c], visible);
    }
    planes[3] = alpha8;

    cv::Mat overlay;
    cv::merge(planes, overlay);
    return overlay;
}

} // namespace analysis
} // namespace viewfinder
