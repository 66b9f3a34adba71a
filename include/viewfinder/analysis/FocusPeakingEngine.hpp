#pragma once

#include <opencv2/core.hpp>

namespace viewfinder {
namespace analysis {

/**
 * Edge highlight overlay for manual focus.
 *
 * Gradient magnitude of the luminance plane, scaled by the intensity,
 * becomes the alpha channel; every pixel that keeps any alpha is painted in
 * the highlight colour. Non-edges come out fully transparent. Stateless.
 */
class FocusPeakingEngine {
public:
    struct Config {
        float intensity = 5.0f;     ///< Gain applied to the normalized gradient
        float threshold = 0.0f;     ///< Alpha below this fraction is dropped
        cv::Scalar highlight = cv::Scalar(0, 255, 0);   ///< BGR
    };

    FocusPeakingEngine() = default;
    explicit FocusPeakingEngine(const Config& config) : config_(config) {}

    /**
     * @param frame 8-bit gray, BGR or BGRA image
     * @return CV_8UC4 BGRA overlay of the same size; empty for an empty frame
     * @throws core::Exception (ERROR_INVALID_PARAMETER) for other pixel formats
     */
    cv::Mat compute(const cv::Mat& frame) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace analysis
} // namespace viewfinder
