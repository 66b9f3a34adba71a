#pragma once

#include "viewfinder/camera/CameraTypes.hpp"

#include <string>

namespace viewfinder {
namespace camera {

/**
 * Utility functions for camera controls and display
 */
class CameraUtils {
public:
    /**
     * Zoom factor of a lens class (0.5, 1 or 5)
     */
    static float zoomFactor(LensClass lens);

    /**
     * Lens class for a zoom factor; anything other than 0.5 or 5 maps to Wide
     */
    static LensClass lensClassFromZoomFactor(float factor);

    static std::string toString(LensClass lens);
    static std::string toString(DevicePosition position);

    /**
     * Parse "ultra_wide", "wide", "telephoto" or a zoom factor ("0.5", "1", "5")
     * @throws core::ConfigurationException on anything else
     */
    static LensClass parseLensClass(const std::string& text);

    /**
     * Parse "back" or "front"
     * @throws core::ConfigurationException on anything else
     */
    static DevicePosition parseDevicePosition(const std::string& text);

    /**
     * Shutter duration as photographers write it: "1/60" below one second,
     * "1.5s" from one second up
     */
    static std::string formatShutterSpeed(double seconds);

    /**
     * Convert seconds to whole microseconds, rounding to nearest.
     * NaN and non-positive values give 0; huge values saturate at INT64_MAX.
     */
    static int64_t secondsToMicroseconds(double seconds);

    /**
     * Illuminant colour temperature to RGB gains that neutralize it.
     * Uses a black-body approximation; the strongest channel gets 1.0 and
     * the others are >= 1.0. Backends without a native conversion use this.
     */
    static WhiteBalanceGains gainsForTemperature(float kelvin);

    /**
     * Clamp every channel to [1.0, maxGain]
     */
    static WhiteBalanceGains clampGains(const WhiteBalanceGains& gains, float maxGain);
};

} // namespace camera
} // namespace viewfinder
