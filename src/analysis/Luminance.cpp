#include "viewfinder/analysis/Luminance.hpp"
#include "viewfinder/core/exception.h"

#include <opencv2/imgproc.hpp>

namespace viewfinder {
namespace analysis {

cv::Mat toLuminance(const cv::Mat& frame) {
    if (frame.depth() != CV_8U) {
        VIEWFINDER_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                              "Frame must be 8-bit, got depth " + std::to_string(frame.depth()));
    }

    cv::Mat gray;
    switch (frame.channels()) {
        case 1:
            gray = frame;
            break;
        case 3:
            cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY);
            break;
        default:
            VIEWFINDER_THROW_CODE(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                                  "Unsupported channel count " + std::to_string(frame.channels()));
    }
    return gray;
}

} // namespace analysis
} // namespace viewfinder
