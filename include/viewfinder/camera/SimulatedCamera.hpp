#pragma once

#include "viewfinder/camera/CaptureSession.hpp"
#include "viewfinder/core/Configuration.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace viewfinder {
namespace camera {

/**
 * Software camera module driven by a SimulatedDeviceConfig.
 *
 * Records every applied mode and value so callers can inspect what the
 * hardware would have received. Lock failures can be injected.
 */
class SimulatedCaptureDevice : public CaptureDevice {
public:
    explicit SimulatedCaptureDevice(const core::SimulatedDeviceConfig& config);

    std::string id() const override { return config_.id; }
    CaptureDeviceProfile profile() const override;

    void lockForConfiguration() override;
    void unlockForConfiguration() override;

    bool isExposureModeSupported(ExposureMode mode) const override;
    bool isFocusModeSupported(FocusMode mode) const override;
    bool isWhiteBalanceModeSupported(WhiteBalanceMode mode) const override;
    bool isFocusPointOfInterestSupported() const override { return config_.pointOfInterest; }
    bool isExposurePointOfInterestSupported() const override { return config_.pointOfInterest; }

    void setExposureMode(ExposureMode mode) override;
    void setFocusMode(FocusMode mode) override;
    void setWhiteBalanceMode(WhiteBalanceMode mode) override;
    void setExposureModeCustom(int64_t durationUs, float iso) override;
    void setFocusModeLocked(float lensPosition) override;
    void setFocusPointOfInterest(const cv::Point2f& point) override;
    void setExposurePointOfInterest(const cv::Point2f& point) override;
    void setSubjectAreaChangeMonitoring(bool enabled) override;

    WhiteBalanceGains deviceWhiteBalanceGains(float kelvin) const override;
    float maxWhiteBalanceGain() const override { return config_.maxWhiteBalanceGain; }
    void setWhiteBalanceModeLocked(const WhiteBalanceGains& gains) override;

    float exposureTargetBias() const override;
    void setExposureTargetBias(float bias) override;

    // Inspection and fault injection

    const core::SimulatedDeviceConfig& config() const { return config_; }

    /// Make every following lockForConfiguration() fail as if the device were busy
    void setLockFailure(bool fail) { failLock_ = fail; }

    ExposureMode exposureMode() const;
    FocusMode focusMode() const;
    WhiteBalanceMode whiteBalanceMode() const;
    int64_t exposureDurationUs() const;
    float iso() const;
    float lensPosition() const;
    WhiteBalanceGains whiteBalanceGains() const;
    cv::Point2f focusPointOfInterest() const;
    cv::Point2f exposurePointOfInterest() const;
    bool subjectAreaChangeMonitoring() const;
    bool isLocked() const;

    /// Number of successful lockForConfiguration() calls
    int configurationCount() const;

    /**
     * Scene brightness multiplier implied by the current exposure settings,
     * 1.0 for a metered exposure without bias
     */
    double exposureGain() const;

private:
    void requireLock(const char* operation) const;

    core::SimulatedDeviceConfig config_;
    std::atomic<bool> failLock_{false};

    mutable std::mutex mutex_;
    bool locked_ = false;
    int configurationCount_ = 0;
    ExposureMode exposureMode_ = ExposureMode::ContinuousAutoExposure;
    FocusMode focusMode_ = FocusMode::ContinuousAutoFocus;
    WhiteBalanceMode whiteBalanceMode_ = WhiteBalanceMode::ContinuousAutoWhiteBalance;
    int64_t durationUs_;
    float iso_;
    float lensPosition_ = 0.5f;
    float bias_ = 0.0f;
    WhiteBalanceGains gains_;
    cv::Point2f focusPoint_{0.5f, 0.5f};
    cv::Point2f exposurePoint_{0.5f, 0.5f};
    bool subjectAreaMonitoring_ = false;
};

/**
 * Headless capture session over a catalog of simulated devices.
 *
 * Streams synthetic BGRA frames at the configured rate from its own thread.
 * The scene contains hard edges for focus peaking and a moving bar, and its
 * brightness follows the active device's exposure.
 */
class SimulatedCaptureSession : public CaptureSession {
public:
    SimulatedCaptureSession(const std::vector<core::SimulatedDeviceConfig>& devices,
                            double frameRate,
                            cv::Size previewSize);
    ~SimulatedCaptureSession() override;

    std::string backendName() const override { return "simulated"; }

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

    // Inspection and fault injection

    std::shared_ptr<SimulatedCaptureDevice> device(const std::string& id) const;

    /// Refuse every new input, as a session does when resources are exhausted
    void setRejectInputs(bool reject) { rejectInputs_ = reject; }
    /// Accept inputs in canAddInput() but fail the addInput() call itself
    void setAddInputFailure(bool fail) { failAddInput_ = fail; }
    void setStillCaptureFailure(bool fail) { failStills_ = fail; }

    uint64_t framesDelivered() const { return framesDelivered_; }
    int startCount() const { return startCount_; }
    int configurationDepth() const;

    /**
     * Render one scene image at the given size with the current input's
     * exposure applied
     */
    cv::Mat renderScene(cv::Size size, uint64_t sequence, int channels) const;

private:
    void streamLoop();
    std::shared_ptr<SimulatedCaptureDevice> activeSimulatedDevice() const;

    std::vector<std::shared_ptr<SimulatedCaptureDevice>> devices_;
    double frameRate_;
    cv::Size previewSize_;

    mutable std::mutex mutex_;
    std::shared_ptr<SimulatedCaptureDevice> input_;
    FrameHandler handler_;
    int configDepth_ = 0;

    std::atomic<bool> rejectInputs_{false};
    std::atomic<bool> failAddInput_{false};
    std::atomic<bool> failStills_{false};

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> framesDelivered_{0};
    std::atomic<int> startCount_{0};
    std::mutex streamMutex_;
    std::condition_variable streamCv_;
    std::thread streamThread_;
};

} // namespace camera
} // namespace viewfinder
