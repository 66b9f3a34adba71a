#include "viewfinder/api/Viewfinder.hpp"
#include "viewfinder/core/Logger.hpp"
#include "viewfinder/core/exception.h"

namespace viewfinder {
namespace api {

namespace {

constexpr const char* kComponent = "Viewfinder";

realtime::FramePipeline::Config pipelineConfig(const core::AnalysisConfig& analysis) {
    realtime::FramePipeline::Config config;
    config.histogram_enabled = analysis.histogram;
    config.peaking_enabled = analysis.peaking;
    config.peaking.intensity = analysis.peakingIntensity;
    config.peaking.threshold = analysis.peakingThreshold;
    return config;
}

} // namespace

std::string toString(ControlMode mode) {
    switch (mode) {
        case ControlMode::Auto:         return "auto";
        case ControlMode::Manual:       return "manual";
        case ControlMode::WhiteBalance: return "white_balance";
        case ControlMode::ManualFocus:  return "manual_focus";
    }
    return "unknown";
}

Viewfinder::Viewfinder(const core::Configuration& config,
                       std::shared_ptr<camera::CaptureSession> session,
                       std::shared_ptr<storage::PhotoSink> sink)
    : session_(std::move(session))
    , sink_(std::move(sink))
    , queue_("ControlQueue")
    , deviceControl_(*session_, queue_, store_, config.controls)
    , pipeline_(store_, pipelineConfig(config.analysis))
    , sessionController_(*session_, queue_, store_, deviceControl_, pipeline_, config.session)
    , captureCoordinator_(*session_, queue_, store_, deviceControl_, *sink_, config.capture) {
    VIEWFINDER_LOG_INFO(kComponent) << "Created on " << session_->backendName() << " backend";
}

Viewfinder::~Viewfinder() {
    shutdown();
}

void Viewfinder::setAuthorizationGate(camera::SessionController::AuthorizationGate gate) {
    sessionController_.setAuthorizationGate(std::move(gate));
}

void Viewfinder::start() {
    sessionController_.setup();
    sessionController_.startSession();
}

void Viewfinder::stop() {
    sessionController_.stopSession();
}

void Viewfinder::selectDevice(camera::DevicePosition position, camera::LensClass lens) {
    deviceControl_.selectDevice(position, lens);
}

void Viewfinder::toggleFrontBack() {
    deviceControl_.toggleFrontBack();
}

void Viewfinder::setExposure(float iso, double shutterSeconds) {
    deviceControl_.setExposure(iso, shutterSeconds);
}

void Viewfinder::setFocus(float lensPosition) {
    deviceControl_.setFocus(lensPosition);
}

void Viewfinder::focusAndExposeAtPoint(const cv::Point2f& point) {
    deviceControl_.focusAndExposeAtPoint(point);
}

void Viewfinder::setWhiteBalance(float kelvin) {
    deviceControl_.setWhiteBalance(kelvin);
}

void Viewfinder::resetWhiteBalance() {
    deviceControl_.resetWhiteBalance();
}

void Viewfinder::setExposureBias(float bias) {
    deviceControl_.setExposureBias(bias);
}

void Viewfinder::setAutoMode() {
    deviceControl_.setAutoMode();
}

void Viewfinder::capturePhoto(camera::CaptureCoordinator::CompletionCallback onComplete) {
    captureCoordinator_.capturePhoto(std::move(onComplete));
}

void Viewfinder::setAnalysisEnablement(std::optional<bool> histogram, std::optional<bool> peaking) {
    pipeline_.setAnalysisEnablement(histogram, peaking);
}

void Viewfinder::setControlMode(ControlMode mode) {
    const ControlMode previous = controlMode_.exchange(mode);
    if (previous == mode) {
        return;
    }
    VIEWFINDER_LOG_DEBUG(kComponent) << "Control mode " << toString(previous) << " -> "
                                     << toString(mode);

    if (mode == ControlMode::ManualFocus) {
        pipeline_.setAnalysisEnablement(std::nullopt, true);
    } else if (previous == ControlMode::ManualFocus) {
        pipeline_.setAnalysisEnablement(std::nullopt, false);
    }
    if (mode == ControlMode::Auto) {
        deviceControl_.setAutoMode();
    }
}

state::StateStore::SubscriptionId Viewfinder::subscribe(state::StateStore::Observer observer) {
    return store_.subscribe(std::move(observer));
}

void Viewfinder::unsubscribe(state::StateStore::SubscriptionId id) {
    store_.unsubscribe(id);
}

state::StateStore::SubscriptionId Viewfinder::addDiagnosticListener(
    state::StateStore::DiagnosticListener listener) {
    return store_.addDiagnosticListener(std::move(listener));
}

bool Viewfinder::waitUntilIdle(std::chrono::milliseconds analysisTimeout) {
    queue_.waitUntilIdle();
    return pipeline_.waitUntilIdle(analysisTimeout);
}

void Viewfinder::shutdown() {
    bool expected = false;
    if (!shutdown_.compare_exchange_strong(expected, true)) {
        return;
    }

    sessionController_.stopSession();
    auto session = session_;
    queue_.post([session]() { session->setFrameHandler(nullptr); });
    queue_.stop();
    pipeline_.stop();

    const camera::CaptureCoordinator::Stats captures = captureCoordinator_.stats();
    VIEWFINDER_LOG_INFO(kComponent) << "Shut down, " << captures.saved << " of "
                                    << captures.requested << " photos saved";
}

} // namespace api
} // namespace viewfinder
