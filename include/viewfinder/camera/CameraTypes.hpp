#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace viewfinder {
namespace camera {

/**
 * Physical side of the body a camera faces
 */
enum class DevicePosition {
    Back,
    Front
};

/**
 * Discrete camera module selection on one side of the body
 */
enum class LensClass {
    UltraWide,  ///< 0.5x
    Wide,       ///< 1x, present on every side that has a camera
    Telephoto   ///< 5x
};

enum class ExposureMode {
    Locked,
    AutoExpose,             ///< Single-shot metering, then hold
    ContinuousAutoExposure,
    Custom                  ///< Fixed duration and ISO
};

enum class FocusMode {
    Locked,
    AutoFocus,              ///< Single-shot focus, then hold
    ContinuousAutoFocus
};

enum class WhiteBalanceMode {
    Locked,
    AutoWhiteBalance,
    ContinuousAutoWhiteBalance
};

/**
 * Capability bounds reported by the active physical device.
 *
 * Durations are kept in whole microseconds, the resolution every backend
 * accepts. A bound pair with min == max means the control cannot be varied
 * and requested values pass through unclamped.
 */
struct CaptureDeviceProfile {
    std::string deviceId;
    std::string name;
    DevicePosition position = DevicePosition::Back;
    LensClass lens = LensClass::Wide;

    float minISO = 100.0f;
    float maxISO = 100.0f;
    int64_t minExposureUs = 1000;
    int64_t maxExposureUs = 1000;
    float minExposureBias = -2.0f;
    float maxExposureBias = 2.0f;

    /// Copy with every inverted bound pair swapped so min <= max holds
    CaptureDeviceProfile normalized() const;

    float clampISO(float iso) const;
    int64_t clampDuration(int64_t durationUs) const;
    float clampBias(float bias) const;

    double minExposureSeconds() const { return minExposureUs / 1e6; }
    double maxExposureSeconds() const { return maxExposureUs / 1e6; }
};

/**
 * User-intended control values
 */
struct ManualSettings {
    float iso = 100.0f;
    double shutterSeconds = 1.0 / 60.0;
    float focusPosition = 0.5f;         ///< Normalized 0 (near) .. 1 (far)
    float whiteBalanceKelvin = 5000.0f;
    float exposureBias = 0.0f;
    LensClass lens = LensClass::Wide;
    DevicePosition position = DevicePosition::Back;
};

/**
 * Per-channel white balance multipliers, each >= 1.0 when applied
 */
struct WhiteBalanceGains {
    float red = 1.0f;
    float green = 1.0f;
    float blue = 1.0f;
};

/**
 * One live frame handed from a capture session to the frame pipeline
 */
struct Frame {
    cv::Mat image;              ///< 8-bit BGRA, BGR or gray
    uint64_t sequence = 0;
    uint64_t timestampNs = 0;
};

enum class StillFormat {
    Processed,                  ///< Processed 8-bit image only
    RawWithProcessedPreview     ///< High bit depth sensor data plus a processed preview
};

struct StillCapabilities {
    bool rawSupported = false;
    std::vector<std::string> rawFormats;
    cv::Size maxDimensions;
};

struct StillCaptureSettings {
    StillFormat format = StillFormat::Processed;
    std::string rawFormat;
    cv::Size maxDimensions;
};

/**
 * Result of a still capture. raw is CV_16UC1 and only present for
 * RawWithProcessedPreview requests.
 */
struct StillImage {
    cv::Mat processed;          ///< 8-bit BGR
    cv::Mat raw;
    std::string rawFormat;
};

} // namespace camera
} // namespace viewfinder
