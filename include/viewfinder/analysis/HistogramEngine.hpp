#pragma once

#include <opencv2/core.hpp>

#include <vector>

namespace viewfinder {
namespace analysis {

/**
 * Relative luminance histogram of one frame.
 *
 * The frame is desaturated to luminance and binned into 256 buckets; every
 * bucket is then divided by the tallest one, so the tallest bar is always
 * exactly 1.0 regardless of exposure.
 */
class HistogramEngine {
public:
    static constexpr int kBins = 256;
    static constexpr float kMinPeak = 1e-4f;    ///< Divisor floor

    /**
     * @param frame 8-bit gray, BGR or BGRA image
     * @return kBins values in [0, 1]; all zeros for an empty frame
     * @throws core::Exception (ERROR_INVALID_PARAMETER) for other pixel formats
     */
    std::vector<float> compute(const cv::Mat& frame) const;
};

} // namespace analysis
} // namespace viewfinder
