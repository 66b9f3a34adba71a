#pragma once

#include "viewfinder/camera/CaptureCoordinator.hpp"
#include "viewfinder/camera/CaptureSession.hpp"
#include "viewfinder/camera/DeviceControl.hpp"
#include "viewfinder/camera/SessionController.hpp"
#include "viewfinder/core/Configuration.hpp"
#include "viewfinder/realtime/FramePipeline.hpp"
#include "viewfinder/realtime/SerialQueue.hpp"
#include "viewfinder/state/StateStore.hpp"
#include "viewfinder/storage/PhotoSink.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace viewfinder {
namespace api {

/**
 * Which group of manual controls the user is working with
 */
enum class ControlMode {
    Auto,
    Manual,
    WhiteBalance,
    ManualFocus
};

std::string toString(ControlMode mode);

/**
 * Main entry point: owns the control queue, published state and every
 * controller of one camera session.
 *
 * All commands return immediately. Device commands, session start/stop and
 * captures run on the control queue in call order; results are observed
 * through state() and subscribe().
 *
 * @code
 * auto session = std::make_shared<camera::SimulatedCaptureSession>(...);
 * auto sink = std::make_shared<storage::FilePhotoSink>("captures");
 * api::Viewfinder viewfinder(config, session, sink);
 * viewfinder.start();
 * viewfinder.setExposure(800.0f, 1.0 / 30.0);
 * viewfinder.capturePhoto();
 * @endcode
 */
class Viewfinder {
public:
    Viewfinder(const core::Configuration& config,
               std::shared_ptr<camera::CaptureSession> session,
               std::shared_ptr<storage::PhotoSink> sink);
    ~Viewfinder();

    Viewfinder(const Viewfinder&) = delete;
    Viewfinder& operator=(const Viewfinder&) = delete;

    /**
     * Consulted once, before the session is configured. Must be installed
     * before start().
     */
    void setAuthorizationGate(camera::SessionController::AuthorizationGate gate);

    /**
     * Configure the session on first use, then start streaming
     */
    void start();
    void stop();

    // Device commands
    void selectDevice(camera::DevicePosition position, camera::LensClass lens);
    void toggleFrontBack();
    void setExposure(float iso, double shutterSeconds);
    void setFocus(float lensPosition);
    void focusAndExposeAtPoint(const cv::Point2f& point);
    void setWhiteBalance(float kelvin);
    void resetWhiteBalance();
    void setExposureBias(float bias);
    void setAutoMode();

    void capturePhoto(camera::CaptureCoordinator::CompletionCallback onComplete = nullptr);

    void setAnalysisEnablement(std::optional<bool> histogram, std::optional<bool> peaking);

    /**
     * Switch the active control group. Entering ManualFocus turns peaking on
     * and leaving it turns peaking off; entering Auto restores continuous
     * automatic exposure, focus and white balance.
     */
    void setControlMode(ControlMode mode);
    ControlMode controlMode() const { return controlMode_; }

    state::CameraState state() const { return store_.snapshot(); }
    state::StateStore& store() { return store_; }

    state::StateStore::SubscriptionId subscribe(state::StateStore::Observer observer);
    void unsubscribe(state::StateStore::SubscriptionId id);
    state::StateStore::SubscriptionId addDiagnosticListener(state::StateStore::DiagnosticListener listener);

    /**
     * Wait for every command issued so far, then for the analysis worker
     * @return false if analysis did not settle within the timeout
     */
    bool waitUntilIdle(std::chrono::milliseconds analysisTimeout = std::chrono::milliseconds(1000));

    realtime::FramePipeline::Stats frameStats() const { return pipeline_.stats(); }
    camera::CaptureCoordinator::Stats captureStats() const { return captureCoordinator_.stats(); }
    bool isConfigured() const { return sessionController_.isConfigured(); }

    /**
     * Stop streaming, drain the control queue and stop analysis. Idempotent.
     */
    void shutdown();

private:
    std::shared_ptr<camera::CaptureSession> session_;
    std::shared_ptr<storage::PhotoSink> sink_;

    realtime::SerialQueue queue_;
    state::StateStore store_;
    camera::DeviceControl deviceControl_;
    realtime::FramePipeline pipeline_;
    camera::SessionController sessionController_;
    camera::CaptureCoordinator captureCoordinator_;

    std::atomic<ControlMode> controlMode_{ControlMode::Auto};
    std::atomic<bool> shutdown_{false};
};

} // namespace api
} // namespace viewfinder
