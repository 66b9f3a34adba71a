/**
 * @file test_session_controller.cpp
 * @brief Unit tests for session start/stop and setup
 *
 * Validates:
 * - Start and stop are idempotent
 * - Authorization refusal leaves the session unconfigured
 * - Frames flow from the session into the analysis pipeline
 */

#include <gtest/gtest.h>
#include <viewfinder/camera/DeviceControl.hpp>
#include <viewfinder/camera/SessionController.hpp>
#include <viewfinder/camera/SimulatedCamera.hpp>
#include <viewfinder/core/Logger.hpp>
#include <viewfinder/realtime/FramePipeline.hpp>
#include <viewfinder/realtime/SerialQueue.hpp>
#include <viewfinder/state/StateStore.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace viewfinder;
using namespace viewfinder::camera;

namespace {

std::vector<core::SimulatedDeviceConfig> backOnly() {
    core::SimulatedDeviceConfig wide;
    wide.id = "back-wide";
    wide.name = "Back Wide";
    return {wide};
}

} // namespace

class SessionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::CRITICAL);

        session_ = std::make_unique<SimulatedCaptureSession>(backOnly(), 120.0, cv::Size(64, 48));
        queue_ = std::make_unique<realtime::SerialQueue>("TestControlQueue");
        control_ = std::make_unique<DeviceControl>(*session_, *queue_, store_, core::ControlsConfig());
        pipeline_ = std::make_unique<realtime::FramePipeline>(store_, realtime::FramePipeline::Config());

        store_.subscribe([this](state::StateField field, const state::CameraState&) {
            if (field == state::StateField::SessionRunning) {
                ++runningNotifications_;
            }
        });
        store_.addDiagnosticListener([this](const state::DiagnosticEvent& e) {
            if (e.kind == state::DiagnosticKind::SessionFailed) {
                ++sessionFailures_;
            }
        });
    }

    void TearDown() override {
        if (controller_) {
            controller_->stopSession();
        }
        queue_->waitUntilIdle();
        session_->setFrameHandler(nullptr);
        queue_->stop();
        pipeline_->stop();
    }

    void createController(const core::SessionConfig& config = core::SessionConfig()) {
        controller_ = std::make_unique<SessionController>(*session_, *queue_, store_, *control_,
                                                          *pipeline_, config);
    }

    void settle() {
        queue_->waitUntilIdle();
    }

    state::StateStore store_;
    std::unique_ptr<SimulatedCaptureSession> session_;
    std::unique_ptr<realtime::SerialQueue> queue_;
    std::unique_ptr<DeviceControl> control_;
    std::unique_ptr<realtime::FramePipeline> pipeline_;
    std::unique_ptr<SessionController> controller_;

    std::atomic<int> runningNotifications_{0};
    std::atomic<int> sessionFailures_{0};
};

/**
 * Test 1: Repeated starts start the hardware once
 */
TEST_F(SessionControllerTest, StartIsIdempotent) {
    createController();
    controller_->setup();
    controller_->startSession();
    controller_->startSession();
    controller_->startSession();
    settle();

    EXPECT_TRUE(controller_->isConfigured());
    EXPECT_TRUE(session_->isRunning());
    EXPECT_EQ(session_->startCount(), 1);
    EXPECT_TRUE(store_.snapshot().sessionRunning);
    EXPECT_EQ(runningNotifications_.load(), 1);
}

/**
 * Test 2: Repeated stops publish a single transition
 */
TEST_F(SessionControllerTest, StopIsIdempotent) {
    createController();
    controller_->setup();
    controller_->startSession();
    controller_->stopSession();
    controller_->stopSession();
    settle();

    EXPECT_FALSE(session_->isRunning());
    EXPECT_FALSE(store_.snapshot().sessionRunning);
    EXPECT_EQ(runningNotifications_.load(), 2);
}

/**
 * Test 3: A refused gate leaves everything stopped
 */
TEST_F(SessionControllerTest, AuthorizationRefused) {
    createController();
    controller_->setAuthorizationGate([]() { return false; });
    controller_->setup();
    controller_->startSession();
    settle();

    EXPECT_FALSE(controller_->isConfigured());
    EXPECT_FALSE(session_->isRunning());
    EXPECT_FALSE(control_->hasDevice());
    EXPECT_EQ(sessionFailures_.load(), 1);
    EXPECT_EQ(runningNotifications_.load(), 0);
}

/**
 * Test 4: Start before setup does nothing
 */
TEST_F(SessionControllerTest, StartBeforeSetupIgnored) {
    createController();
    controller_->startSession();
    settle();

    EXPECT_FALSE(session_->isRunning());
    EXPECT_EQ(session_->startCount(), 0);

    controller_->setup();
    controller_->startSession();
    settle();
    EXPECT_TRUE(session_->isRunning());
}

/**
 * Test 5: No camera at the requested position fails setup
 */
TEST_F(SessionControllerTest, MissingInitialDevice) {
    core::SessionConfig config;
    config.initialPosition = DevicePosition::Front;
    createController(config);
    controller_->setup();
    controller_->startSession();
    settle();

    EXPECT_FALSE(controller_->isConfigured());
    EXPECT_FALSE(session_->isRunning());
    EXPECT_EQ(sessionFailures_.load(), 1);
}

/**
 * Test 6: Streamed frames reach the histogram
 */
TEST_F(SessionControllerTest, FramesReachPipeline) {
    createController();
    controller_->setup();
    controller_->startSession();
    settle();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (store_.snapshot().histogram.empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    const state::CameraState s = store_.snapshot();
    ASSERT_EQ(s.histogram.size(), 256u);
    EXPECT_GT(session_->framesDelivered(), 0u);
    EXPECT_GT(pipeline_->stats().frames_analyzed, 0u);
}

/**
 * Test 7: Setup runs once
 */
TEST_F(SessionControllerTest, SetupRunsOnce) {
    createController();
    controller_->setup();
    controller_->setup();
    settle();

    EXPECT_TRUE(controller_->isConfigured());
    EXPECT_EQ(session_->currentInput()->id(), "back-wide");
    EXPECT_EQ(session_->configurationDepth(), 0);
}
