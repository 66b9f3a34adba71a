/**
 * @file test_device_control.cpp
 * @brief Unit tests for the device control facade
 *
 * Validates:
 * - Startup defaults published after the initial device is installed
 * - Clamping of ISO, shutter, focus, white balance and bias
 * - Re-clamping of manual settings across a lens swap
 * - Fallback to the wide camera
 * - Lock failure and unsupported mode policies
 * - Front/back toggling and auto mode
 */

#include <gtest/gtest.h>
#include <viewfinder/camera/DeviceControl.hpp>
#include <viewfinder/camera/SimulatedCamera.hpp>
#include <viewfinder/core/Logger.hpp>
#include <viewfinder/realtime/SerialQueue.hpp>
#include <viewfinder/state/StateStore.hpp>

#include <algorithm>
#include <limits>
#include <memory>
#include <mutex>
#include <vector>

using namespace viewfinder;
using namespace viewfinder::camera;

namespace {

std::vector<core::SimulatedDeviceConfig> testDevices() {
    core::SimulatedDeviceConfig wide;
    wide.id = "back-wide";
    wide.name = "Back Wide";
    wide.minISO = 32.0f;
    wide.maxISO = 3200.0f;
    wide.minExposureUs = 14;
    wide.maxExposureUs = 1000000;
    wide.minExposureBias = -2.0f;
    wide.maxExposureBias = 2.0f;
    wide.maxWhiteBalanceGain = 4.0f;

    core::SimulatedDeviceConfig ultraWide = wide;
    ultraWide.id = "back-ultra-wide";
    ultraWide.name = "Back Ultra Wide";
    ultraWide.lens = LensClass::UltraWide;
    ultraWide.minISO = 50.0f;
    ultraWide.maxISO = 400.0f;
    ultraWide.minExposureUs = 100;
    ultraWide.maxExposureUs = 500000;
    ultraWide.minExposureBias = -1.0f;
    ultraWide.maxExposureBias = 1.0f;

    core::SimulatedDeviceConfig front = wide;
    front.id = "front-wide";
    front.name = "Front";
    front.position = DevicePosition::Front;
    front.minISO = 25.0f;
    front.maxISO = 1600.0f;
    front.customExposure = false;
    front.lockedFocus = false;

    return {wide, ultraWide, front};
}

} // namespace

class DeviceControlTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::CRITICAL);

        session_ = std::make_unique<SimulatedCaptureSession>(testDevices(), 30.0, cv::Size(64, 48));
        queue_ = std::make_unique<realtime::SerialQueue>("TestControlQueue");
        control_ = std::make_unique<DeviceControl>(*session_, *queue_, store_, controls_);

        store_.addDiagnosticListener([this](const state::DiagnosticEvent& e) {
            std::lock_guard<std::mutex> lock(diagnosticsMutex_);
            diagnostics_.push_back(e.kind);
        });
    }

    void TearDown() override {
        queue_->stop();
    }

    bool install(DevicePosition position, LensClass lens) {
        bool installed = false;
        queue_->post([&]() { installed = control_->installInitialDevice(position, lens); });
        queue_->waitUntilIdle();
        return installed;
    }

    void settle() {
        queue_->waitUntilIdle();
    }

    std::shared_ptr<SimulatedCaptureDevice> device(const std::string& id) {
        return session_->device(id);
    }

    std::string activeId() {
        auto input = session_->currentInput();
        return input ? input->id() : std::string();
    }

    bool sawDiagnostic(state::DiagnosticKind kind) {
        std::lock_guard<std::mutex> lock(diagnosticsMutex_);
        return std::find(diagnostics_.begin(), diagnostics_.end(), kind) != diagnostics_.end();
    }

    core::ControlsConfig controls_;
    state::StateStore store_;
    std::unique_ptr<SimulatedCaptureSession> session_;
    std::unique_ptr<realtime::SerialQueue> queue_;
    std::unique_ptr<DeviceControl> control_;

    std::mutex diagnosticsMutex_;
    std::vector<state::DiagnosticKind> diagnostics_;
};

/**
 * Test 1: Startup defaults
 */
TEST_F(DeviceControlTest, InitialDevicePublishesDefaults) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::Wide));

    const state::CameraState s = store_.snapshot();
    ASSERT_TRUE(s.profile.has_value());
    EXPECT_EQ(s.profile->deviceId, "back-wide");
    EXPECT_FLOAT_EQ(s.settings.iso, 32.0f);
    EXPECT_NEAR(s.settings.shutterSeconds, 1.0 / 60.0, 1e-6);
    EXPECT_FLOAT_EQ(s.settings.focusPosition, 0.5f);
    EXPECT_FLOAT_EQ(s.settings.whiteBalanceKelvin, 5000.0f);
    EXPECT_FLOAT_EQ(s.settings.exposureBias, 0.0f);
    EXPECT_EQ(s.settings.lens, LensClass::Wide);
    EXPECT_EQ(s.settings.position, DevicePosition::Back);
    EXPECT_EQ(activeId(), "back-wide");
    EXPECT_EQ(session_->configurationDepth(), 0);
}

/**
 * Test 2: Commands before any device are dropped
 */
TEST_F(DeviceControlTest, CommandsWithoutDeviceAreIgnored) {
    control_->setExposure(800.0f, 1.0 / 30.0);
    control_->setFocus(0.2f);
    settle();

    const state::CameraState s = store_.snapshot();
    EXPECT_FALSE(s.profile.has_value());
    EXPECT_FLOAT_EQ(s.settings.iso, camera::ManualSettings().iso);
    EXPECT_FLOAT_EQ(s.settings.focusPosition, camera::ManualSettings().focusPosition);
}

/**
 * Test 3: In-range exposure is applied exactly, out-of-range is clamped
 */
TEST_F(DeviceControlTest, ExposureClampedToProfile) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::Wide));
    auto wide = device("back-wide");

    control_->setExposure(800.0f, 1.0 / 30.0);
    settle();
    EXPECT_FLOAT_EQ(store_.settings().iso, 800.0f);
    EXPECT_NEAR(store_.settings().shutterSeconds, 0.033333, 1e-6);
    EXPECT_EQ(wide->exposureMode(), ExposureMode::Custom);
    EXPECT_FLOAT_EQ(wide->iso(), 800.0f);
    EXPECT_EQ(wide->exposureDurationUs(), 33333);

    control_->setExposure(25600.0f, 1e-7);
    settle();
    EXPECT_FLOAT_EQ(store_.settings().iso, 3200.0f);
    EXPECT_NEAR(store_.settings().shutterSeconds, 14e-6, 1e-9);
    EXPECT_EQ(wide->exposureDurationUs(), 14);
}

/**
 * Test 4: White balance is clamped to the configured range and the gains to
 * the device maximum, regardless of the request
 */
TEST_F(DeviceControlTest, WhiteBalanceClamped) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::Wide));
    auto wide = device("back-wide");

    control_->setWhiteBalance(12000.0f);
    settle();
    EXPECT_FLOAT_EQ(store_.settings().whiteBalanceKelvin, 8000.0f);

    control_->setWhiteBalance(1000.0f);
    settle();
    EXPECT_FLOAT_EQ(store_.settings().whiteBalanceKelvin, 3000.0f);
    EXPECT_EQ(wide->whiteBalanceMode(), WhiteBalanceMode::Locked);

    const WhiteBalanceGains gains = wide->whiteBalanceGains();
    for (float g : {gains.red, gains.green, gains.blue}) {
        EXPECT_GE(g, 1.0f);
        EXPECT_LE(g, 4.0f);
    }

    // Auto white balance keeps the last published temperature
    control_->resetWhiteBalance();
    settle();
    EXPECT_EQ(wide->whiteBalanceMode(), WhiteBalanceMode::ContinuousAutoWhiteBalance);
    EXPECT_FLOAT_EQ(store_.settings().whiteBalanceKelvin, 3000.0f);
}

/**
 * Test 5: Exposure bias is clamped to the device range
 */
TEST_F(DeviceControlTest, ExposureBiasClamped) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::Wide));
    auto wide = device("back-wide");

    control_->setExposureBias(10.0f);
    settle();

    EXPECT_FLOAT_EQ(store_.settings().exposureBias, 2.0f);
    EXPECT_FLOAT_EQ(wide->exposureTargetBias(), 2.0f);
    EXPECT_EQ(wide->exposureMode(), ExposureMode::ContinuousAutoExposure);
}

/**
 * Test 6: Focus is clamped to 0..1 and locks the lens
 */
TEST_F(DeviceControlTest, FocusClampedAndLocked) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::Wide));
    auto wide = device("back-wide");

    control_->setFocus(1.5f);
    settle();

    EXPECT_FLOAT_EQ(store_.settings().focusPosition, 1.0f);
    EXPECT_EQ(wide->focusMode(), FocusMode::Locked);
    EXPECT_FLOAT_EQ(wide->lensPosition(), 1.0f);
}

/**
 * Test 7: Manual exposure survives a swap to a narrower profile
 */
TEST_F(DeviceControlTest, SwapReclampsManualExposure) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::Wide));

    control_->setExposure(800.0f, 1.0 / 30.0);
    control_->selectDevice(DevicePosition::Back, LensClass::UltraWide);
    settle();

    const state::CameraState s = store_.snapshot();
    ASSERT_TRUE(s.profile.has_value());
    EXPECT_EQ(s.profile->deviceId, "back-ultra-wide");
    EXPECT_FLOAT_EQ(s.profile->maxISO, 400.0f);
    EXPECT_EQ(s.settings.lens, LensClass::UltraWide);
    EXPECT_FLOAT_EQ(s.settings.iso, 400.0f);
    EXPECT_NEAR(s.settings.shutterSeconds, 0.033333, 1e-6);

    // Bias is reapplied last, which hands exposure back to metering
    auto ultraWide = device("back-ultra-wide");
    EXPECT_EQ(activeId(), "back-ultra-wide");
    EXPECT_EQ(ultraWide->exposureMode(), ExposureMode::ContinuousAutoExposure);
    EXPECT_FLOAT_EQ(ultraWide->iso(), 400.0f);
    EXPECT_EQ(ultraWide->exposureDurationUs(), 33333);
    EXPECT_EQ(session_->configurationDepth(), 0);
}

/**
 * Test 8: Focus returns to the default after a swap
 */
TEST_F(DeviceControlTest, FocusResetAfterSwap) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::Wide));

    control_->setFocus(0.9f);
    control_->selectDevice(DevicePosition::Back, LensClass::UltraWide);
    settle();

    EXPECT_FLOAT_EQ(store_.settings().focusPosition, 0.5f);
}

/**
 * Test 9: A missing lens falls back to the wide camera
 */
TEST_F(DeviceControlTest, TelephotoFallsBackToWide) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::UltraWide));

    control_->selectDevice(DevicePosition::Back, LensClass::Telephoto);
    settle();

    EXPECT_EQ(activeId(), "back-wide");
    EXPECT_EQ(store_.settings().lens, LensClass::Wide);
    EXPECT_TRUE(sawDiagnostic(state::DiagnosticKind::DeviceFallback));
}

/**
 * Test 10: A refused input leaves the previous device installed
 */
TEST_F(DeviceControlTest, RejectedInputRestoresPrevious) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::Wide));

    session_->setRejectInputs(true);
    control_->selectDevice(DevicePosition::Back, LensClass::UltraWide);
    settle();

    EXPECT_EQ(activeId(), "back-wide");
    EXPECT_EQ(store_.settings().lens, LensClass::Wide);
    EXPECT_TRUE(sawDiagnostic(state::DiagnosticKind::InputRejected));
}

/**
 * Test 11: Lock failure abandons the operation without publishing
 */
TEST_F(DeviceControlTest, LockFailureDoesNotPublish) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::Wide));
    auto wide = device("back-wide");
    wide->setLockFailure(true);

    control_->setExposure(800.0f, 1.0 / 30.0);
    control_->setFocus(0.1f);
    settle();

    EXPECT_FLOAT_EQ(store_.settings().iso, 32.0f);
    EXPECT_FLOAT_EQ(store_.settings().focusPosition, 0.5f);
    EXPECT_EQ(wide->exposureMode(), ExposureMode::ContinuousAutoExposure);
    EXPECT_TRUE(sawDiagnostic(state::DiagnosticKind::ConfigurationLockFailed));
    EXPECT_FALSE(wide->isLocked());
}

/**
 * Test 12: An unsupported mode skips the hardware but still publishes
 */
TEST_F(DeviceControlTest, UnsupportedModeStillPublishes) {
    ASSERT_TRUE(install(DevicePosition::Front, LensClass::Wide));
    auto front = device("front-wide");

    control_->setExposure(400.0f, 1.0 / 100.0);
    control_->setFocus(0.3f);
    settle();

    EXPECT_FLOAT_EQ(store_.settings().iso, 400.0f);
    EXPECT_NEAR(store_.settings().shutterSeconds, 0.01, 1e-6);
    EXPECT_FLOAT_EQ(store_.settings().focusPosition, 0.3f);
    EXPECT_EQ(front->exposureMode(), ExposureMode::ContinuousAutoExposure);
    EXPECT_EQ(front->focusMode(), FocusMode::ContinuousAutoFocus);
    EXPECT_EQ(front->configurationCount(), 0);
    EXPECT_TRUE(sawDiagnostic(state::DiagnosticKind::CapabilityUnsupported));
}

/**
 * Test 13: Front/back toggling remembers the back lens
 */
TEST_F(DeviceControlTest, ToggleFrontBack) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::Wide));

    control_->selectDevice(DevicePosition::Back, LensClass::UltraWide);
    control_->toggleFrontBack();
    settle();
    EXPECT_EQ(activeId(), "front-wide");
    EXPECT_EQ(store_.settings().position, DevicePosition::Front);

    control_->toggleFrontBack();
    settle();
    EXPECT_EQ(activeId(), "back-ultra-wide");
    EXPECT_EQ(store_.settings().position, DevicePosition::Back);
    EXPECT_EQ(store_.settings().lens, LensClass::UltraWide);
}

/**
 * Test 14: Auto mode restores continuous modes and zero bias
 */
TEST_F(DeviceControlTest, AutoModeResetsDevice) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::Wide));
    auto wide = device("back-wide");

    control_->setExposureBias(1.5f);
    control_->setExposure(800.0f, 1.0 / 30.0);
    control_->setFocus(0.2f);
    control_->setWhiteBalance(4000.0f);
    control_->setAutoMode();
    settle();

    EXPECT_FLOAT_EQ(store_.settings().exposureBias, 0.0f);
    EXPECT_FLOAT_EQ(wide->exposureTargetBias(), 0.0f);
    EXPECT_EQ(wide->exposureMode(), ExposureMode::ContinuousAutoExposure);
    EXPECT_EQ(wide->focusMode(), FocusMode::ContinuousAutoFocus);
    EXPECT_EQ(wide->whiteBalanceMode(), WhiteBalanceMode::ContinuousAutoWhiteBalance);
}

/**
 * Test 15: Tap to focus meters at the clamped point
 */
TEST_F(DeviceControlTest, FocusAndExposeAtPoint) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::Wide));
    auto wide = device("back-wide");

    control_->focusAndExposeAtPoint(cv::Point2f(0.25f, 1.4f));
    settle();

    EXPECT_EQ(wide->focusMode(), FocusMode::AutoFocus);
    EXPECT_EQ(wide->exposureMode(), ExposureMode::AutoExpose);
    EXPECT_FLOAT_EQ(wide->focusPointOfInterest().x, 0.25f);
    EXPECT_FLOAT_EQ(wide->focusPointOfInterest().y, 1.0f);
    EXPECT_TRUE(wide->subjectAreaChangeMonitoring());
}

/**
 * Test 16: Commands run in submission order
 */
TEST_F(DeviceControlTest, LastCommandWins) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::Wide));

    for (int i = 1; i <= 20; ++i) {
        control_->setExposure(100.0f * i, 1.0 / 60.0);
    }
    settle();

    EXPECT_FLOAT_EQ(store_.settings().iso, 2000.0f);
}

/**
 * Test 17: Exposure bias follows the user across a swap, clamped to the new device
 */
TEST_F(DeviceControlTest, SwapReappliesExposureBias) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::Wide));

    control_->setExposureBias(1.5f);
    control_->setExposure(800.0f, 1.0 / 30.0);
    control_->selectDevice(DevicePosition::Back, LensClass::UltraWide);
    settle();

    auto ultraWide = device("back-ultra-wide");
    EXPECT_FLOAT_EQ(store_.settings().exposureBias, 1.0f);
    EXPECT_FLOAT_EQ(ultraWide->exposureTargetBias(), 1.0f);
    EXPECT_EQ(ultraWide->exposureMode(), ExposureMode::ContinuousAutoExposure);
    EXPECT_FLOAT_EQ(store_.settings().iso, 400.0f);

    // Back to a wider bias range: the clamped value is what carries over
    control_->selectDevice(DevicePosition::Back, LensClass::Wide);
    settle();
    EXPECT_FLOAT_EQ(store_.settings().exposureBias, 1.0f);
    EXPECT_FLOAT_EQ(device("back-wide")->exposureTargetBias(), 1.0f);
}

/**
 * Test 18: Absurd shutter requests pin to the longest duration
 */
TEST_F(DeviceControlTest, HugeShutterClampsToMaximum) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::Wide));
    auto wide = device("back-wide");

    control_->setExposure(100.0f, 1e13);
    settle();
    EXPECT_NEAR(store_.settings().shutterSeconds, 1.0, 1e-9);
    EXPECT_EQ(wide->exposureDurationUs(), 1000000);

    control_->setExposure(100.0f, std::numeric_limits<double>::infinity());
    settle();
    EXPECT_EQ(wide->exposureDurationUs(), 1000000);

    control_->setExposure(100.0f, -1.0);
    settle();
    EXPECT_EQ(wide->exposureDurationUs(), 14);
}

/**
 * Test 19: Losing both the new and the previous input leaves no device published
 */
TEST_F(DeviceControlTest, FailedRestoreClearsProfile) {
    ASSERT_TRUE(install(DevicePosition::Back, LensClass::Wide));

    session_->setAddInputFailure(true);
    control_->selectDevice(DevicePosition::Back, LensClass::UltraWide);
    settle();

    EXPECT_EQ(activeId(), "");
    EXPECT_FALSE(store_.snapshot().profile.has_value());
    EXPECT_TRUE(sawDiagnostic(state::DiagnosticKind::InputRejected));
    EXPECT_TRUE(sawDiagnostic(state::DiagnosticKind::DeviceUnavailable));
    EXPECT_EQ(session_->configurationDepth(), 0);

    // Commands are dropped until a device is installed again
    control_->setExposure(800.0f, 1.0 / 30.0);
    settle();
    EXPECT_FLOAT_EQ(store_.settings().iso, 32.0f);
}
