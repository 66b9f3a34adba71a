/**
 * @file test_camera_utils.cpp
 * @brief Unit tests for profile clamping and camera helpers
 */

#include <gtest/gtest.h>
#include <viewfinder/camera/CameraUtils.hpp>
#include <viewfinder/core/exception.h>

#include <cmath>
#include <limits>

using namespace viewfinder;
using namespace viewfinder::camera;

namespace {

CaptureDeviceProfile makeProfile() {
    CaptureDeviceProfile p;
    p.minISO = 50.0f;
    p.maxISO = 3200.0f;
    p.minExposureUs = 100;
    p.maxExposureUs = 500000;
    p.minExposureBias = -2.0f;
    p.maxExposureBias = 2.0f;
    return p;
}

} // namespace

TEST(CaptureDeviceProfileTest, ClampsIntoBounds) {
    const CaptureDeviceProfile p = makeProfile();

    EXPECT_FLOAT_EQ(p.clampISO(10.0f), 50.0f);
    EXPECT_FLOAT_EQ(p.clampISO(800.0f), 800.0f);
    EXPECT_FLOAT_EQ(p.clampISO(12800.0f), 3200.0f);
    EXPECT_EQ(p.clampDuration(1), 100);
    EXPECT_EQ(p.clampDuration(1000000), 500000);
    EXPECT_FLOAT_EQ(p.clampBias(10.0f), 2.0f);
    EXPECT_FLOAT_EQ(p.clampBias(-3.0f), -2.0f);
}

TEST(CaptureDeviceProfileTest, InvertedBoundsAreSwapped) {
    CaptureDeviceProfile p = makeProfile();
    std::swap(p.minISO, p.maxISO);
    std::swap(p.minExposureUs, p.maxExposureUs);

    const CaptureDeviceProfile n = p.normalized();
    EXPECT_FLOAT_EQ(n.minISO, 50.0f);
    EXPECT_FLOAT_EQ(n.maxISO, 3200.0f);
    EXPECT_EQ(n.minExposureUs, 100);
    EXPECT_EQ(n.maxExposureUs, 500000);
    EXPECT_FLOAT_EQ(n.clampISO(6400.0f), 3200.0f);
}

TEST(CaptureDeviceProfileTest, FixedControlPassesThrough) {
    CaptureDeviceProfile p = makeProfile();
    p.minISO = 100.0f;
    p.maxISO = 100.0f;
    p.minExposureBias = 0.0f;
    p.maxExposureBias = 0.0f;

    EXPECT_FLOAT_EQ(p.clampISO(400.0f), 400.0f);
    EXPECT_FLOAT_EQ(p.clampBias(1.0f), 1.0f);
}

TEST(CameraUtilsTest, LensClassConversions) {
    EXPECT_FLOAT_EQ(CameraUtils::zoomFactor(LensClass::UltraWide), 0.5f);
    EXPECT_FLOAT_EQ(CameraUtils::zoomFactor(LensClass::Telephoto), 5.0f);
    EXPECT_EQ(CameraUtils::lensClassFromZoomFactor(0.5f), LensClass::UltraWide);
    EXPECT_EQ(CameraUtils::lensClassFromZoomFactor(2.0f), LensClass::Wide);
    EXPECT_EQ(CameraUtils::parseLensClass("5"), LensClass::Telephoto);
    EXPECT_EQ(CameraUtils::parseLensClass("Ultra_Wide"), LensClass::UltraWide);
    EXPECT_EQ(CameraUtils::parseDevicePosition("FRONT"), DevicePosition::Front);
    EXPECT_THROW(CameraUtils::parseLensClass("fisheye"), core::ConfigurationException);
    EXPECT_THROW(CameraUtils::parseDevicePosition("side"), core::ConfigurationException);
}

TEST(CameraUtilsTest, ShutterFormatting) {
    EXPECT_EQ(CameraUtils::formatShutterSpeed(1.0 / 60.0), "1/60");
    EXPECT_EQ(CameraUtils::formatShutterSpeed(1.0 / 8000.0), "1/8000");
    EXPECT_EQ(CameraUtils::formatShutterSpeed(2.5), "2.5s");
    EXPECT_EQ(CameraUtils::secondsToMicroseconds(1.0 / 30.0), 33333);
}

TEST(CameraUtilsTest, ShutterConversionSaturates) {
    EXPECT_EQ(CameraUtils::secondsToMicroseconds(1e13), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(CameraUtils::secondsToMicroseconds(std::numeric_limits<double>::infinity()),
              std::numeric_limits<int64_t>::max());
    EXPECT_EQ(CameraUtils::secondsToMicroseconds(-1.0), 0);
    EXPECT_EQ(CameraUtils::secondsToMicroseconds(std::nan("")), 0);

    CaptureDeviceProfile profile;
    profile.minExposureUs = 14;
    profile.maxExposureUs = 1000000;
    EXPECT_EQ(profile.clampDuration(CameraUtils::secondsToMicroseconds(1e13)), 1000000);
    EXPECT_EQ(profile.clampDuration(CameraUtils::secondsToMicroseconds(30.0)), 1000000);
    EXPECT_EQ(profile.clampDuration(CameraUtils::secondsToMicroseconds(-5.0)), 14);
}

TEST(CameraUtilsTest, WhiteBalanceGains) {
    // Warm light needs more blue, cool light more red
    const WhiteBalanceGains warm = CameraUtils::gainsForTemperature(3000.0f);
    const WhiteBalanceGains cool = CameraUtils::gainsForTemperature(8000.0f);

    EXPECT_FLOAT_EQ(warm.red, 1.0f);
    EXPECT_GT(warm.blue, warm.green);
    EXPECT_GT(cool.red, 1.0f);
    EXPECT_FLOAT_EQ(cool.blue, 1.0f);

    const WhiteBalanceGains clamped = CameraUtils::clampGains({0.5f, 1.2f, 9.0f}, 4.0f);
    EXPECT_FLOAT_EQ(clamped.red, 1.0f);
    EXPECT_FLOAT_EQ(clamped.green, 1.2f);
    EXPECT_FLOAT_EQ(clamped.blue, 4.0f);
}
