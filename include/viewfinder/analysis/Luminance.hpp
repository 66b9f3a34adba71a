#pragma once

#include <opencv2/core.hpp>

namespace viewfinder {
namespace analysis {

/**
 * Desaturate an 8-bit gray, BGR or BGRA frame to a single 8-bit luminance
 * plane. Gray input is returned without copying.
 * @throws core::Exception (ERROR_INVALID_PARAMETER) for other pixel formats
 */
cv::Mat toLuminance(const cv::Mat& frame);

} // namespace analysis
} // namespace viewfinder
