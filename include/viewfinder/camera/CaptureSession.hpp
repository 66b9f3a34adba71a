#pragma once

#include "viewfinder/camera/CaptureDevice.hpp"

#include <functional>
#include <memory>
#include <string>

namespace viewfinder {
namespace camera {

/**
 * Platform capture session: device discovery, the single active input,
 * live frame delivery and still capture.
 *
 * Configuration methods, start/stop and still capture are called from the
 * control queue only. Frames are delivered on the session's own streaming
 * thread; a frame the handler has not returned from yet is never queued
 * behind, the backend drops late frames instead.
 */
class CaptureSession {
public:
    using FrameHandler = std::function<void(const Frame&)>;

    virtual ~CaptureSession() = default;

    /**
     * Human readable backend name for logs
     */
    virtual std::string backendName() const = 0;

    /**
     * Find the device at a position with an exact lens class match
     * @return nullptr when the body has no such device
     */
    virtual std::shared_ptr<CaptureDevice> findDevice(DevicePosition position,
                                                      LensClass lens) = 0;

    /**
     * Open a configuration transaction. Transactions nest; changes take
     * effect when the outermost one commits.
     */
    virtual void beginConfiguration() = 0;

    /// Apply pending changes; failures are logged by the backend, never thrown
    virtual void commitConfiguration() = 0;

    virtual bool canAddInput(const std::shared_ptr<CaptureDevice>& device) const = 0;

    /**
     * Install the device as the session's input
     * @throws core::CameraException if the device cannot be used
     */
    virtual void addInput(const std::shared_ptr<CaptureDevice>& device) = 0;
    virtual void removeInput() = 0;
    virtual std::shared_ptr<CaptureDevice> currentInput() const = 0;

    /**
     * Start streaming frames; no-op when already running
     * @throws core::CameraException if streaming cannot start
     */
    virtual void startRunning() = 0;

    /// Stop streaming; no-op when already stopped
    virtual void stopRunning() = 0;
    virtual bool isRunning() const = 0;

    virtual void setFrameHandler(FrameHandler handler) = 0;

    /**
     * Still output capabilities of the current input
     */
    virtual StillCapabilities stillCapabilities() const = 0;

    /**
     * Capture one still from the current input
     * @throws core::CameraException on failure or when no input is installed
     */
    virtual StillImage captureStill(const StillCaptureSettings& settings) = 0;
};

/**
 * Scoped configuration transaction: begins on construction, commits on
 * destruction, including when the scope is left by an exception
 */
class SessionConfiguration {
public:
    explicit SessionConfiguration(CaptureSession& session) : session_(session) {
        session_.beginConfiguration();
    }

    ~SessionConfiguration() {
        session_.commitConfiguration();
    }

    SessionConfiguration(const SessionConfiguration&) = delete;
    SessionConfiguration& operator=(const SessionConfiguration&) = delete;

private:
    CaptureSession& session_;
};

} // namespace camera
} // namespace viewfinder
