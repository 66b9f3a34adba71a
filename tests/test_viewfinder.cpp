/**
 * @file test_viewfinder.cpp
 * @brief End-to-end tests of the Viewfinder facade on the simulated backend
 */

#include <gtest/gtest.h>
#include <viewfinder/viewfinder.h>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace viewfinder;

namespace {

class CountingSink : public storage::PhotoSink {
public:
    storage::SaveResult save(const storage::EncodedPhoto& photo) override {
        std::lock_guard<std::mutex> lock(mutex_);
        formats_.push_back(photo.metadata.format);
        storage::SaveResult result;
        result.ok = true;
        result.path = "memory" + photo.primaryExtension;
        return result;
    }

    std::vector<std::string> formats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return formats_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> formats_;
};

core::Configuration smallConfiguration() {
    core::Configuration config;
    config.session.frameRate = 120.0;
    config.session.previewWidth = 64;
    config.session.previewHeight = 48;
    config.simulatedDevices = core::Configuration::defaultSimulatedDevices();
    for (auto& device : config.simulatedDevices) {
        device.stillWidth = 160;
        device.stillHeight = 120;
    }
    return config;
}

bool waitFor(const std::function<bool()>& predicate) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

} // namespace

class ViewfinderTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::CRITICAL);

        const core::Configuration config = smallConfiguration();
        session_ = std::make_shared<camera::SimulatedCaptureSession>(
            config.simulatedDevices, config.session.frameRate,
            cv::Size(config.session.previewWidth, config.session.previewHeight));
        sink_ = std::make_shared<CountingSink>();
        viewfinder_ = std::make_unique<api::Viewfinder>(config, session_, sink_);
    }

    void TearDown() override {
        viewfinder_.reset();
    }

    std::shared_ptr<camera::SimulatedCaptureSession> session_;
    std::shared_ptr<CountingSink> sink_;
    std::unique_ptr<api::Viewfinder> viewfinder_;
};

/**
 * Test 1: Start streams frames into the histogram
 */
TEST_F(ViewfinderTest, StartPublishesHistogram) {
    viewfinder_->start();
    viewfinder_->waitUntilIdle();

    EXPECT_TRUE(viewfinder_->isConfigured());
    EXPECT_TRUE(viewfinder_->state().sessionRunning);
    ASSERT_TRUE(viewfinder_->state().profile.has_value());

    EXPECT_TRUE(waitFor([this]() { return viewfinder_->state().histogram.size() == 256; }));
    EXPECT_GT(viewfinder_->frameStats().frames_analyzed, 0u);
}

/**
 * Test 2: Manual focus mode drives focus peaking
 */
TEST_F(ViewfinderTest, ManualFocusTogglesPeaking) {
    viewfinder_->start();
    viewfinder_->waitUntilIdle();

    viewfinder_->setControlMode(api::ControlMode::ManualFocus);
    EXPECT_TRUE(viewfinder_->state().peakingEnabled);
    EXPECT_TRUE(waitFor([this]() { return !viewfinder_->state().peakingOverlay.empty(); }));

    viewfinder_->setControlMode(api::ControlMode::Manual);
    EXPECT_FALSE(viewfinder_->state().peakingEnabled);
    viewfinder_->waitUntilIdle();
    EXPECT_TRUE(viewfinder_->state().peakingOverlay.empty());
    EXPECT_EQ(viewfinder_->controlMode(), api::ControlMode::Manual);
}

/**
 * Test 3: Manual exposure through the facade
 */
TEST_F(ViewfinderTest, ExposureCommandApplied) {
    viewfinder_->start();
    viewfinder_->setExposure(400.0f, 1.0 / 125.0);
    viewfinder_->waitUntilIdle();

    const camera::ManualSettings settings = viewfinder_->state().settings;
    EXPECT_FLOAT_EQ(settings.iso, 400.0f);
    EXPECT_NEAR(settings.shutterSeconds, 0.008, 1e-6);
}

/**
 * Test 4: A capture reaches the sink
 */
TEST_F(ViewfinderTest, CapturePhoto) {
    viewfinder_->start();

    std::promise<storage::SaveResult> done;
    viewfinder_->capturePhoto([&done](const storage::SaveResult& r) { done.set_value(r); });
    auto future = done.get_future();
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);

    const storage::SaveResult result = future.get();
    ASSERT_TRUE(result.ok) << result.reason;
    ASSERT_EQ(sink_->formats().size(), 1u);
    EXPECT_EQ(viewfinder_->captureStats().saved, 1u);
}

/**
 * Test 5: Shutdown stops everything and can be repeated
 */
TEST_F(ViewfinderTest, ShutdownIsIdempotent) {
    viewfinder_->start();
    viewfinder_->waitUntilIdle();

    viewfinder_->shutdown();
    EXPECT_FALSE(session_->isRunning());
    EXPECT_FALSE(viewfinder_->state().sessionRunning);

    viewfinder_->shutdown();
    viewfinder_->setExposure(800.0f, 0.01);
    EXPECT_FALSE(session_->isRunning());
}
