#include "viewfinder/camera/CameraUtils.hpp"
#include "viewfinder/core/exception.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>

namespace viewfinder {
namespace camera {

CaptureDeviceProfile CaptureDeviceProfile::normalized() const {
    CaptureDeviceProfile p = *this;
    if (p.minISO > p.maxISO) std::swap(p.minISO, p.maxISO);
    if (p.minExposureUs > p.maxExposureUs) std::swap(p.minExposureUs, p.maxExposureUs);
    if (p.minExposureBias > p.maxExposureBias) std::swap(p.minExposureBias, p.maxExposureBias);
    return p;
}

float CaptureDeviceProfile::clampISO(float iso) const {
    return minISO < maxISO ? std::clamp(iso, minISO, maxISO) : iso;
}

int64_t CaptureDeviceProfile::clampDuration(int64_t durationUs) const {
    return minExposureUs < maxExposureUs
        ? std::clamp(durationUs, minExposureUs, maxExposureUs) : durationUs;
}

float CaptureDeviceProfile::clampBias(float bias) const {
    return minExposureBias < maxExposureBias
        ? std::clamp(bias, minExposureBias, maxExposureBias) : bias;
}

float CameraUtils::zoomFactor(LensClass lens) {
    switch (lens) {
        case LensClass::UltraWide: return 0.5f;
        case LensClass::Telephoto: return 5.0f;
        case LensClass::Wide:
        default:                   return 1.0f;
    }
}

LensClass CameraUtils::lensClassFromZoomFactor(float factor) {
    if (std::fabs(factor - 0.5f) < 1e-3f) return LensClass::UltraWide;
    if (std::fabs(factor - 5.0f) < 1e-3f) return LensClass::Telephoto;
    return LensClass::Wide;
}

std::string CameraUtils::toString(LensClass lens) {
    switch (lens) {
        case LensClass::UltraWide: return "ultra_wide";
        case LensClass::Telephoto: return "telephoto";
        case LensClass::Wide:
        default:                   return "wide";
    }
}

std::string CameraUtils::toString(DevicePosition position) {
    return position == DevicePosition::Front ? "front" : "back";
}

LensClass CameraUtils::parseLensClass(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "ultra_wide" || lower == "ultrawide" || lower == "0.5") return LensClass::UltraWide;
    if (lower == "wide" || lower == "1" || lower == "1.0") return LensClass::Wide;
    if (lower == "telephoto" || lower == "tele" || lower == "5" || lower == "5.0") return LensClass::Telephoto;

    VIEWFINDER_THROW(core::ConfigurationException, "Unknown lens class '" + text + "'");
}

DevicePosition CameraUtils::parseDevicePosition(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "back") return DevicePosition::Back;
    if (lower == "front") return DevicePosition::Front;

    VIEWFINDER_THROW(core::ConfigurationException, "Unknown device position '" + text + "'");
}

std::string CameraUtils::formatShutterSpeed(double seconds) {
    char buffer[32];
    if (seconds >= 1.0) {
        std::snprintf(buffer, sizeof(buffer), "%.1fs", seconds);
    } else if (seconds > 0.0) {
        std::snprintf(buffer, sizeof(buffer), "1/%.0f", 1.0 / seconds);
    } else {
        return "0s";
    }
    return buffer;
}

int64_t CameraUtils::secondsToMicroseconds(double seconds) {
    // Saturate before converting; llround is undefined past the int64 range
    if (std::isnan(seconds) || seconds <= 0.0) {
        return 0;
    }
    const double us = seconds * 1e6;
    if (us >= 9.2e18) {
        return std::numeric_limits<int64_t>::max();
    }
    return static_cast<int64_t>(std::llround(us));
}

WhiteBalanceGains CameraUtils::gainsForTemperature(float kelvin) {
    // Black-body colour of the illuminant, in 0..255 per channel
    const double t = std::clamp(static_cast<double>(kelvin), 1000.0, 40000.0) / 100.0;

    double r, g, b;
    if (t <= 66.0) {
        r = 255.0;
        g = 99.4708025861 * std::log(t) - 161.1195681661;
    } else {
        r = 329.698727446 * std::pow(t - 60.0, -0.1332047592);
        g = 288.1221695283 * std::pow(t - 60.0, -0.0755148492);
    }
    if (t >= 66.0) {
        b = 255.0;
    } else if (t <= 19.0) {
        b = 0.0;
    } else {
        b = 138.5177312231 * std::log(t - 10.0) - 305.0447927307;
    }

    r = std::clamp(r, 1.0, 255.0);
    g = std::clamp(g, 1.0, 255.0);
    b = std::clamp(b, 1.0, 255.0);

    const double peak = std::max({r, g, b});
    WhiteBalanceGains gains;
    gains.red = static_cast<float>(peak / r);
    gains.green = static_cast<float>(peak / g);
    gains.blue = static_cast<float>(peak / b);
    return gains;
}

WhiteBalanceGains CameraUtils::clampGains(const WhiteBalanceGains& gains, float maxGain) {
    const float upper = std::max(1.0f, maxGain);
    WhiteBalanceGains out;
    out.red = std::clamp(gains.red, 1.0f, upper);
    out.green = std::clamp(gains.green, 1.0f, upper);
    out.blue = std::clamp(gains.blue, 1.0f, upper);
    return out;
}

} // namespace camera
} // namespace viewfinder
