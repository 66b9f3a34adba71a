#pragma once

#include "viewfinder/camera/CaptureSession.hpp"
#include "viewfinder/core/Configuration.hpp"

#include <atomic>
#include <functional>

namespace viewfinder {

namespace realtime {
class FramePipeline;
class SerialQueue;
}
namespace state {
class StateStore;
}

namespace camera {

class DeviceControl;

/**
 * Start/stop of the capture pipeline.
 *
 * Setup, start and stop are queued on the control queue behind any pending
 * device configuration, so they never race a lens switch. Both start and
 * stop are idempotent.
 */
class SessionController {
public:
    /// Consulted once before setup; returning false leaves the session unconfigured
    using AuthorizationGate = std::function<bool()>;

    SessionController(CaptureSession& session,
                      realtime::SerialQueue& queue,
                      state::StateStore& store,
                      DeviceControl& deviceControl,
                      realtime::FramePipeline& pipeline,
                      const core::SessionConfig& config);

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    void setAuthorizationGate(AuthorizationGate gate);

    /**
     * Install the initial device and wire frame delivery into the pipeline.
     * Runs once; later calls are no-ops.
     */
    void setup();

    void startSession();
    void stopSession();

    bool isConfigured() const { return configured_; }

private:
    void runSetup();
    void runStart();
    void runStop();
    void publishRunning(bool running);

    CaptureSession& session_;
    realtime::SerialQueue& queue_;
    state::StateStore& store_;
    DeviceControl& deviceControl_;
    realtime::FramePipeline& pipeline_;
    core::SessionConfig config_;

    AuthorizationGate gate_;
    bool setupAttempted_ = false;
    std::atomic<bool> configured_{false};
};

} // namespace camera
} // namespace viewfinder
