#pragma once

#include "viewfinder/camera/CaptureSession.hpp"
#include "viewfinder/core/Configuration.hpp"

#include <opencv2/core.hpp>

#include <functional>
#include <memory>
#include <optional>

namespace viewfinder {

namespace realtime {
class SerialQueue;
}
namespace state {
class StateStore;
}

namespace camera {

/**
 * Owner of the single active capture device.
 *
 * Public commands return immediately and run on the control queue in
 * submission order. Every value is clamped against the active device's
 * profile before it is applied and the applied value, never the requested
 * one, is published. Without a device every command is logged and skipped.
 *
 * Failure policy:
 * - mode unsupported by the device: hardware call skipped, value still published
 * - configuration lock refused: logged, operation abandoned, nothing published
 */
class DeviceControl {
public:
    DeviceControl(CaptureSession& session,
                  realtime::SerialQueue& queue,
                  state::StateStore& store,
                  const core::ControlsConfig& config);

    DeviceControl(const DeviceControl&) = delete;
    DeviceControl& operator=(const DeviceControl&) = delete;

    /**
     * Swap to the device at position with the given lens class, falling back
     * to that position's wide camera. Manual settings in effect when the swap
     * starts are re-clamped into the new profile and reapplied.
     */
    void selectDevice(DevicePosition position, LensClass lens);

    /**
     * Flip between back and front. The back camera returns to the last lens
     * class selected for it; the front camera always uses the wide class.
     */
    void toggleFrontBack();

    void setExposure(float iso, double shutterSeconds);

    /**
     * @param lensPosition Normalized 0..1, clamped
     */
    void setFocus(float lensPosition);

    /**
     * Single-shot focus and exposure metering at a normalized point
     */
    void focusAndExposeAtPoint(const cv::Point2f& point);

    /**
     * Lock white balance at a temperature clamped to the configured range
     */
    void setWhiteBalance(float kelvin);

    /// Return to continuous auto white balance; the published temperature is kept
    void resetWhiteBalance();

    void setExposureBias(float bias);

    /**
     * Continuous auto focus, exposure and white balance, bias back to 0
     */
    void setAutoMode();

    // Control queue only

    /**
     * Install the first device and publish the startup defaults
     * @return false if no device exists at the requested position
     */
    bool installInitialDevice(DevicePosition position, LensClass lens);

    bool hasDevice() const { return active_.has_value(); }

    std::shared_ptr<CaptureDevice> activeDevice() const {
        return active_ ? active_->device : nullptr;
    }

private:
    struct ActiveDevice {
        std::shared_ptr<CaptureDevice> device;
        CaptureDeviceProfile profile;
    };

    void post(const char* operation, std::function<void()> work);

    bool swapDevice(DevicePosition position, LensClass lens);
    std::shared_ptr<CaptureDevice> resolveDevice(DevicePosition position, LensClass lens);
    void publishProfileAndReclamp();

    void applyExposure(float iso, double shutterSeconds);
    void applyFocus(float lensPosition);
    void applyPointOfInterest(const cv::Point2f& point);
    void applyWhiteBalance(float kelvin);
    void applyWhiteBalanceReset();
    void applyExposureBias(float bias);
    void applyAutoMode();

    /**
     * Run fn with the configuration lock held
     * @return false if the lock or the hardware call failed
     */
    bool withConfigurationLock(const char* operation,
                               const std::function<void(CaptureDevice&)>& fn);

    bool requireDevice(const char* operation) const;
    void reportUnsupported(const char* operation, const char* mode);

    CaptureSession& session_;
    realtime::SerialQueue& queue_;
    state::StateStore& store_;
    core::ControlsConfig config_;

    std::optional<ActiveDevice> active_;
    LensClass backLens_ = LensClass::Wide;
};

} // namespace camera
} // namespace viewfinder
