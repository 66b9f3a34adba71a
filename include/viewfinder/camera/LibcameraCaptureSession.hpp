#pragma once

#include "viewfinder/camera/CaptureSession.hpp"
#include "viewfinder/core/Configuration.hpp"

#include <libcamera/libcamera.h>

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace viewfinder {
namespace camera {

/**
 * One libcamera camera exposed as a CaptureDevice.
 *
 * Control changes are collected in a pending list and attached to the next
 * request the session recycles, so they take effect a few frames later.
 */
class LibcameraCaptureDevice : public CaptureDevice {
public:
    LibcameraCaptureDevice(std::shared_ptr<libcamera::Camera> camera, LensClass lens);

    std::string id() const override { return camera_->id(); }
    CaptureDeviceProfile profile() const override { return profile_; }

    void lockForConfiguration() override;
    void unlockForConfiguration() override;

    bool isExposureModeSupported(ExposureMode mode) const override;
    bool isFocusModeSupported(FocusMode mode) const override;
    bool isWhiteBalanceModeSupported(WhiteBalanceMode mode) const override;
    bool isFocusPointOfInterestSupported() const override;
    bool isExposurePointOfInterestSupported() const override { return false; }

    void setExposureMode(ExposureMode mode) override;
    void setFocusMode(FocusMode mode) override;
    void setWhiteBalanceMode(WhiteBalanceMode mode) override;
    void setExposureModeCustom(int64_t durationUs, float iso) override;
    void setFocusModeLocked(float lensPosition) override;
    void setFocusPointOfInterest(const cv::Point2f& point) override;
    void setExposurePointOfInterest(const cv::Point2f& point) override;
    void setSubjectAreaChangeMonitoring(bool enabled) override;

    WhiteBalanceGains deviceWhiteBalanceGains(float kelvin) const override;
    float maxWhiteBalanceGain() const override;
    void setWhiteBalanceModeLocked(const WhiteBalanceGains& gains) override;

    float exposureTargetBias() const override;
    void setExposureTargetBias(float bias) override;

    std::shared_ptr<libcamera::Camera> camera() const { return camera_; }

    /**
     * Move pending control changes into a request's control list
     */
    void applyPendingControls(libcamera::ControlList& controls);

private:
    bool hasControl(const libcamera::ControlId& id) const;
    void requireSupport(bool supported, const char* what) const;

    template<typename T, typename V>
    void setPending(const libcamera::Control<T>& control, const V& value) {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        pending_.set(control, value);
    }

    std::shared_ptr<libcamera::Camera> camera_;
    CaptureDeviceProfile profile_;

    std::timed_mutex configMutex_;

    mutable std::mutex pendingMutex_;
    libcamera::ControlList pending_;
    float bias_ = 0.0f;
};

/**
 * Capture session backed by libcamera.
 *
 * Streams XRGB8888 viewfinder frames at the configured size; stills are
 * taken from the next completed viewfinder frame.
 */
class LibcameraCaptureSession : public CaptureSession {
public:
    /**
     * @throws core::CameraException if the camera manager cannot start
     */
    LibcameraCaptureSession(const core::LibcameraConfig& config,
                            cv::Size previewSize,
                            double frameRate);
    ~LibcameraCaptureSession() override;

    std::string backendName() const override { return "libcamera"; }

    std::shared_ptr<CaptureDevice> findDevice(DevicePosition position, LensClass lens) override;

    void beginConfiguration() override;
    void commitConfiguration() override;

    bool canAddInput(const std::shared_ptr<CaptureDevice>& device) const override;
    void addInput(const std::shared_ptr<CaptureDevice>& device) override;
    void removeInput() override;
    std::shared_ptr<CaptureDevice> currentInput() const override;

    void startRunning() override;
    void stopRunning() override;
    bool isRunning() const override { return running_; }

    void setFrameHandler(FrameHandler handler) override;

    StillCapabilities stillCapabilities() const override;
    StillImage captureStill(const StillCaptureSettings& settings) override;

private:
    struct MappedBuffer {
        void* map = nullptr;
        size_t mapLength = 0;
        const uint8_t* data = nullptr;
        size_t length = 0;
    };

    static std::shared_ptr<libcamera::CameraManager> sharedCameraManager();

    void configureStream();
    void allocateBuffers();
    void createRequests();
    void releaseStream();
    void startStreaming();
    void stopStreaming();
    void handleRequestComplete(libcamera::Request* request);
    void recycleRequest(libcamera::Request* request);

    core::LibcameraConfig config_;
    cv::Size previewSize_;
    double frameRate_;

    std::shared_ptr<libcamera::CameraManager> manager_;
    std::vector<std::shared_ptr<LibcameraCaptureDevice>> devices_;

    mutable std::mutex mutex_;
    std::shared_ptr<LibcameraCaptureDevice> input_;
    FrameHandler handler_;
    int configDepth_ = 0;
    bool restartAfterCommit_ = false;

    // Stream resources of the current input
    std::unique_ptr<libcamera::CameraConfiguration> cameraConfig_;
    libcamera::Stream* stream_ = nullptr;
    unsigned int stride_ = 0;
    std::unique_ptr<libcamera::FrameBufferAllocator> allocator_;
    std::vector<std::unique_ptr<libcamera::Request>> requests_;
    std::map<const libcamera::FrameBuffer*, MappedBuffer> mapped_;

    std::atomic<bool> running_{false};
    uint64_t sequence_ = 0;

    // Latest frame for still capture
    std::mutex latestMutex_;
    std::condition_variable latestCv_;
    Frame latest_;
};

} // namespace camera
} // namespace viewfinder
