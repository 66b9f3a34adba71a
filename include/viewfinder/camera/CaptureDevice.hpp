#pragma once

#include "viewfinder/camera/CameraTypes.hpp"

#include <opencv2/core.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace viewfinder {
namespace camera {

/**
 * One physical camera module as exposed by a capture backend.
 *
 * Every setter requires the configuration lock to be held. Setters for a
 * mode the device does not support throw core::CameraException with
 * ERROR_CAPABILITY_UNSUPPORTED; callers are expected to query support first.
 * All methods are called from the control queue only.
 */
class CaptureDevice {
public:
    virtual ~CaptureDevice() = default;

    virtual std::string id() const = 0;

    /**
     * Capability bounds of this device, with inverted pairs already swapped
     */
    virtual CaptureDeviceProfile profile() const = 0;

    /**
     * Acquire exclusive configuration access
     * @throws core::CameraException (ERROR_CAMERA_BUSY) if access is refused
     */
    virtual void lockForConfiguration() = 0;
    virtual void unlockForConfiguration() = 0;

    virtual bool isExposureModeSupported(ExposureMode mode) const = 0;
    virtual bool isFocusModeSupported(FocusMode mode) const = 0;
    virtual bool isWhiteBalanceModeSupported(WhiteBalanceMode mode) const = 0;
    virtual bool isFocusPointOfInterestSupported() const = 0;
    virtual bool isExposurePointOfInterestSupported() const = 0;

    virtual void setExposureMode(ExposureMode mode) = 0;
    virtual void setFocusMode(FocusMode mode) = 0;
    virtual void setWhiteBalanceMode(WhiteBalanceMode mode) = 0;

    /**
     * Switch to ExposureMode::Custom with the given duration and ISO,
     * both already inside the profile bounds
     */
    virtual void setExposureModeCustom(int64_t durationUs, float iso) = 0;

    /**
     * Switch to FocusMode::Locked at a normalized lens position
     */
    virtual void setFocusModeLocked(float lensPosition) = 0;

    /// Normalized point, (0,0) top-left to (1,1) bottom-right
    virtual void setFocusPointOfInterest(const cv::Point2f& point) = 0;
    virtual void setExposurePointOfInterest(const cv::Point2f& point) = 0;

    virtual void setSubjectAreaChangeMonitoring(bool enabled) = 0;

    /**
     * Device specific gains for an illuminant temperature
     */
    virtual WhiteBalanceGains deviceWhiteBalanceGains(float kelvin) const = 0;
    virtual float maxWhiteBalanceGain() const = 0;

    /**
     * Switch to WhiteBalanceMode::Locked with gains already clamped to
     * [1, maxWhiteBalanceGain()]
     */
    virtual void setWhiteBalanceModeLocked(const WhiteBalanceGains& gains) = 0;

    virtual float exposureTargetBias() const = 0;
    virtual void setExposureTargetBias(float bias) = 0;
};

/**
 * Holds a device's configuration lock for the lifetime of the guard
 */
class ConfigurationLock {
public:
    /**
     * @throws core::CameraException if the device refuses the lock
     */
    explicit ConfigurationLock(CaptureDevice& device) : device_(device) {
        device_.lockForConfiguration();
    }

    ~ConfigurationLock() {
        device_.unlockForConfiguration();
    }

    ConfigurationLock(const ConfigurationLock&) = delete;
    ConfigurationLock& operator=(const ConfigurationLock&) = delete;

private:
    CaptureDevice& device_;
};

} // namespace camera
} // namespace viewfinder
