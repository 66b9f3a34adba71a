#include "viewfinder/analysis/HistogramEngine.hpp"
#include "viewfinder/analysis/Luminance.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace viewfinder {
namespace analysis {

std::vector<float> HistogramEngine::compute(const cv::Mat& frame) const {
    std::vector<float> result(kBins, 0.0f);
    if (frame.empty()) {
        return result;
    }

    cv::Mat gray = toLuminance(frame);

    const int histSize = kBins;
    const float range[] = {0.0f, 256.0f};
    const float* histRange = range;
    cv::Mat hist;
    cv::calcHist(&gray, 1, nullptr, cv::Mat(), hist, 1, &histSize, &histRange);

    double peak = 0.0;
    cv::minMaxLoc(hist, nullptr, &peak);
    const float divisor = std::max(static_cast<float>(peak), kMinPeak);

    for (int i = 0; i < kBins; ++i) {
        result[i] = std::min(1.0f, hist.at<float>(i) / divisor);
    }
    return result;
}

} // namespace analysis
} // namespace viewfinder
