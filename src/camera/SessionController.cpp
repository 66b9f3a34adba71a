#include "viewfinder/camera/SessionController.hpp"
#include "viewfinder/camera/CameraUtils.hpp"
#include "viewfinder/camera/DeviceControl.hpp"
#include "viewfinder/core/Logger.hpp"
#include "viewfinder/core/exception.h"
#include "viewfinder/realtime/FramePipeline.hpp"
#include "viewfinder/realtime/SerialQueue.hpp"
#include "viewfinder/state/StateStore.hpp"

namespace viewfinder {
namespace camera {

namespace {
constexpr const char* kComponent = "SessionController";
}

SessionController::SessionController(CaptureSession& session,
                                     realtime::SerialQueue& queue,
                                     state::StateStore& store,
                                     DeviceControl& deviceControl,
                                     realtime::FramePipeline& pipeline,
                                     const core::SessionConfig& config)
    : session_(session)
    , queue_(queue)
    , store_(store)
    , deviceControl_(deviceControl)
    , pipeline_(pipeline)
    , config_(config) {}

void SessionController::setAuthorizationGate(AuthorizationGate gate) {
    queue_.post([this, gate = std::move(gate)]() { gate_ = gate; });
}

void SessionController::setup() {
    if (!queue_.post([this]() { runSetup(); })) {
        VIEWFINDER_LOG_WARNING(kComponent) << "setup dropped, control queue stopped";
    }
}

void SessionController::startSession() {
    if (!queue_.post([this]() { runStart(); })) {
        VIEWFINDER_LOG_WARNING(kComponent) << "startSession dropped, control queue stopped";
    }
}

void SessionController::stopSession() {
    if (!queue_.post([this]() { runStop(); })) {
        VIEWFINDER_LOG_WARNING(kComponent) << "stopSession dropped, control queue stopped";
    }
}

void SessionController::runSetup() {
    if (setupAttempted_) {
        return;
    }
    setupAttempted_ = true;

    if (gate_ && !gate_()) {
        VIEWFINDER_LOG_ERROR(kComponent) << "Camera access not authorized, session stays stopped";
        store_.reportDiagnostic(state::DiagnosticKind::SessionFailed, "camera access not authorized");
        return;
    }

    VIEWFINDER_LOG_INFO(kComponent) << "Configuring " << session_.backendName() << " session";

    if (!deviceControl_.installInitialDevice(config_.initialPosition, config_.initialLens)) {
        store_.reportDiagnostic(state::DiagnosticKind::SessionFailed, "no initial device");
        return;
    }

    pipeline_.start();
    realtime::FramePipeline* pipeline = &pipeline_;
    session_.setFrameHandler([pipeline](const Frame& frame) { pipeline->onFrame(frame); });

    const StillCapabilities caps = session_.stillCapabilities();
    VIEWFINDER_LOG_INFO(kComponent) << "Still output " << caps.maxDimensions.width << "x"
                                    << caps.maxDimensions.height
                                    << (caps.rawSupported ? ", raw available" : ", processed only");
    configured_ = true;
}

void SessionController::runStart() {
    if (!configured_) {
        VIEWFINDER_LOG_WARNING(kComponent) << "startSession ignored, session not configured";
        return;
    }
    if (session_.isRunning()) {
        VIEWFINDER_LOG_DEBUG(kComponent) << "Session already running";
        publishRunning(true);
        return;
    }

    try {
        session_.startRunning();
    } catch (const core::Exception& e) {
        VIEWFINDER_LOG_ERROR(kComponent) << "Failed to start session: " << e.what();
        store_.reportDiagnostic(state::DiagnosticKind::SessionFailed, e.getMessage());
        publishRunning(false);
        return;
    }
    VIEWFINDER_LOG_INFO(kComponent) << "Session running";
    publishRunning(true);
}

void SessionController::runStop() {
    if (!session_.isRunning()) {
        publishRunning(false);
        return;
    }
    session_.stopRunning();
    VIEWFINDER_LOG_INFO(kComponent) << "Session stopped";
    publishRunning(false);
}

void SessionController::publishRunning(bool running) {
    if (store_.snapshot().sessionRunning == running) {
        return;
    }
    store_.update(state::StateField::SessionRunning, [running](state::CameraState& s) {
        s.sessionRunning = running;
    });
}

} // namespace camera
} // namespace viewfinder
