#include "viewfinder/camera/DeviceControl.hpp"
#include "viewfinder/camera/CameraUtils.hpp"
#include "viewfinder/core/Logger.hpp"
#include "viewfinder/core/exception.h"
#include "viewfinder/realtime/SerialQueue.hpp"
#include "viewfinder/state/StateStore.hpp"

#include <algorithm>

namespace viewfinder {
namespace camera {

namespace {
constexpr const char* kComponent = "DeviceControl";

state::DiagnosticKind diagnosticFor(core::ResultCode code) {
    switch (code) {
        case core::ResultCode::ERROR_CAMERA_BUSY:
            return state::DiagnosticKind::ConfigurationLockFailed;
        case core::ResultCode::ERROR_CAPABILITY_UNSUPPORTED:
            return state::DiagnosticKind::CapabilityUnsupported;
        default:
            return state::DiagnosticKind::SessionFailed;
    }
}
} // namespace

DeviceControl::DeviceControl(CaptureSession& session,
                             realtime::SerialQueue& queue,
                             state::StateStore& store,
                             const core::ControlsConfig& config)
    : session_(session)
    , queue_(queue)
    , store_(store)
    , config_(config) {}

void DeviceControl::post(const char* operation, std::function<void()> work) {
    if (!queue_.post(std::move(work))) {
        VIEWFINDER_LOG_WARNING(kComponent) << operation << " dropped, control queue stopped";
    }
}

// Commands

void DeviceControl::selectDevice(DevicePosition position, LensClass lens) {
    post("selectDevice", [this, position, lens]() {
        if (position == DevicePosition::Back) {
            backLens_ = lens;
        }
        swapDevice(position, lens);
    });
}

void DeviceControl::toggleFrontBack() {
    post("toggleFrontBack", [this]() {
        const DevicePosition current = store_.settings().position;
        if (current == DevicePosition::Back) {
            swapDevice(DevicePosition::Front, LensClass::Wide);
        } else {
            swapDevice(DevicePosition::Back, backLens_);
        }
    });
}

void DeviceControl::setExposure(float iso, double shutterSeconds) {
    post("setExposure", [this, iso, shutterSeconds]() { applyExposure(iso, shutterSeconds); });
}

void DeviceControl::setFocus(float lensPosition) {
    post("setFocus", [this, lensPosition]() { applyFocus(lensPosition); });
}

void DeviceControl::focusAndExposeAtPoint(const cv::Point2f& point) {
    post("focusAndExposeAtPoint", [this, point]() { applyPointOfInterest(point); });
}

void DeviceControl::setWhiteBalance(float kelvin) {
    post("setWhiteBalance", [this, kelvin]() { applyWhiteBalance(kelvin); });
}

void DeviceControl::resetWhiteBalance() {
    post("resetWhiteBalance", [this]() { applyWhiteBalanceReset(); });
}

void DeviceControl::setExposureBias(float bias) {
    post("setExposureBias", [this, bias]() { applyExposureBias(bias); });
}

void DeviceControl::setAutoMode() {
    post("setAutoMode", [this]() { applyAutoMode(); });
}

// Device selection

bool DeviceControl::installInitialDevice(DevicePosition position, LensClass lens) {
    if (position == DevicePosition::Back) {
        backLens_ = lens;
    }

    auto device = resolveDevice(position, lens);
    if (!device) {
        return false;
    }

    {
        SessionConfiguration transaction(session_);
        if (!session_.canAddInput(device)) {
            VIEWFINDER_LOG_ERROR(kComponent) << "Session refused initial device " << device->id();
            store_.reportDiagnostic(state::DiagnosticKind::InputRejected,
                                    "Session refused device " + device->id());
            return false;
        }
        try {
            session_.addInput(device);
        } catch (const core::Exception& e) {
            VIEWFINDER_LOG_ERROR(kComponent) << "Failed to add initial device: " << e.what();
            store_.reportDiagnostic(state::DiagnosticKind::InputRejected, e.getMessage());
            return false;
        }
    }

    const CaptureDeviceProfile profile = device->profile().normalized();
    active_ = ActiveDevice{device, profile};

    const float wbMin = config_.whiteBalanceMinKelvin;
    const float wbMax = config_.whiteBalanceMaxKelvin;
    const int64_t shutterUs = profile.clampDuration(
        CameraUtils::secondsToMicroseconds(config_.defaultShutterSeconds));
    const float focus = std::clamp(config_.defaultFocus, 0.0f, 1.0f);
    const float kelvin = std::clamp(config_.defaultWhiteBalanceKelvin, wbMin, wbMax);

    store_.update(state::StateField::DeviceProfile, [&profile](state::CameraState& s) {
        s.profile = profile;
        s.settings.lens = profile.lens;
        s.settings.position = profile.position;
    });
    store_.update(state::StateField::Settings, [&](state::CameraState& s) {
        s.settings.iso = profile.minISO;
        s.settings.shutterSeconds = shutterUs / 1e6;
        s.settings.focusPosition = focus;
        s.settings.whiteBalanceKelvin = kelvin;
        s.settings.exposureBias = profile.clampBias(0.0f);
    });

    VIEWFINDER_LOG_INFO(kComponent) << "Initial device " << profile.name << " ("
                                    << CameraUtils::toString(profile.position) << ", "
                                    << CameraUtils::toString(profile.lens) << "), ISO "
                                    << profile.minISO << "-" << profile.maxISO << ", shutter "
                                    << CameraUtils::formatShutterSpeed(profile.minExposureSeconds())
                                    << "-"
                                    << CameraUtils::formatShutterSpeed(profile.maxExposureSeconds());
    return true;
}

std::shared_ptr<CaptureDevice> DeviceControl::resolveDevice(DevicePosition position, LensClass lens) {
    if (auto exact = session_.findDevice(position, lens)) {
        return exact;
    }

    if (lens != LensClass::Wide) {
        if (auto wide = session_.findDevice(position, LensClass::Wide)) {
            VIEWFINDER_LOG_WARNING(kComponent) << "Requested lens " << CameraUtils::toString(lens)
                                               << " not found on " << CameraUtils::toString(position)
                                               << ", falling back to wide";
            store_.reportDiagnostic(state::DiagnosticKind::DeviceFallback,
                                    "Lens " + CameraUtils::toString(lens)
                                        + " unavailable, using wide");
            return wide;
        }
    }

    VIEWFINDER_LOG_ERROR(kComponent) << "No " << CameraUtils::toString(position)
                                     << " camera available";
    store_.reportDiagnostic(state::DiagnosticKind::DeviceUnavailable,
                            "No " + CameraUtils::toString(position) + " camera");
    return nullptr;
}

bool DeviceControl::swapDevice(DevicePosition position, LensClass lens) {
    // Values in effect when the swap starts: every earlier command has already run
    const ManualSettings snapshot = store_.settings();

    auto device = resolveDevice(position, lens);
    if (!device) {
        return false;
    }

    if (active_ && active_->device->id() == device->id()) {
        VIEWFINDER_LOG_DEBUG(kComponent) << "Device " << device->id() << " already active";
        return true;
    }

    {
        SessionConfiguration transaction(session_);
        auto previous = session_.currentInput();
        session_.removeInput();

        bool installed = false;
        if (session_.canAddInput(device)) {
            try {
                session_.addInput(device);
                installed = true;
            } catch (const core::Exception& e) {
                VIEWFINDER_LOG_ERROR(kComponent) << "Failed to add " << device->id() << ": "
                                                 << e.what();
            }
        } else {
            VIEWFINDER_LOG_ERROR(kComponent) << "Session refused device " << device->id();
        }

        if (!installed) {
            store_.reportDiagnostic(state::DiagnosticKind::InputRejected,
                                    "Session refused device " + device->id());
            if (previous) {
                try {
                    session_.addInput(previous);
                } catch (const core::Exception& e) {
                    VIEWFINDER_LOG_ERROR(kComponent) << "Could not restore previous input: "
                                                     << e.what();
                    active_.reset();
                    store_.update(state::StateField::DeviceProfile, [](state::CameraState& s) {
                        s.profile.reset();
                    });
                    store_.reportDiagnostic(state::DiagnosticKind::DeviceUnavailable,
                                            "No active device after failed swap to " + device->id());
                }
            }
            return false;
        }
    }

    active_ = ActiveDevice{device, device->profile().normalized()};
    publishProfileAndReclamp();

    VIEWFINDER_LOG_INFO(kComponent) << "Switched to " << active_->profile.name << " ("
                                    << CameraUtils::toString(active_->profile.position) << ", "
                                    << CameraUtils::toString(active_->profile.lens) << ")";

    // Reapply the user's values through the clamped setters, bias last
    applyExposure(snapshot.iso, snapshot.shutterSeconds);
    applyWhiteBalance(snapshot.whiteBalanceKelvin);
    applyExposureBias(snapshot.exposureBias);
    if (config_.carryFocusAcrossSwap) {
        applyFocus(snapshot.focusPosition);
    } else {
        const float focus = std::clamp(config_.defaultFocus, 0.0f, 1.0f);
        store_.update(state::StateField::Settings, [focus](state::CameraState& s) {
            s.settings.focusPosition = focus;
        });
    }
    return true;
}

void DeviceControl::publishProfileAndReclamp() {
    const CaptureDeviceProfile profile = active_->profile;

    store_.update(state::StateField::DeviceProfile, [&profile](state::CameraState& s) {
        s.profile = profile;
        s.settings.lens = profile.lens;
        s.settings.position = profile.position;
    });
    store_.update(state::StateField::Settings, [&profile](state::CameraState& s) {
        s.settings.iso = profile.clampISO(s.settings.iso);
        s.settings.shutterSeconds = profile.clampDuration(
            CameraUtils::secondsToMicroseconds(s.settings.shutterSeconds)) / 1e6;
        s.settings.exposureBias = profile.clampBias(s.settings.exposureBias);
    });
}

// Individual controls

bool DeviceControl::requireDevice(const char* operation) const {
    if (!active_) {
        VIEWFINDER_LOG_WARNING(kComponent) << operation << " ignored, no active device";
        return false;
    }
    return true;
}

void DeviceControl::reportUnsupported(const char* operation, const char* mode) {
    VIEWFINDER_LOG_DEBUG(kComponent) << operation << ": " << mode << " not supported by "
                                     << active_->device->id() << ", publishing only";
    store_.reportDiagnostic(state::DiagnosticKind::CapabilityUnsupported,
                            std::string(mode) + " unsupported by " + active_->device->id());
}

bool DeviceControl::withConfigurationLock(const char* operation,
                                          const std::function<void(CaptureDevice&)>& fn) {
    CaptureDevice& device = *active_->device;
    try {
        ConfigurationLock lock(device);
        fn(device);
        return true;
    } catch (const core::Exception& e) {
        VIEWFINDER_LOG_WARNING(kComponent) << operation << " abandoned: " << e.what();
        store_.reportDiagnostic(diagnosticFor(e.getResultCode()),
                                std::string(operation) + ": " + e.getMessage());
        return false;
    }
}

void DeviceControl::applyExposure(float iso, double shutterSeconds) {
    if (!requireDevice("setExposure")) {
        return;
    }
    const CaptureDeviceProfile& profile = active_->profile;
    const float clampedISO = profile.clampISO(iso);
    const int64_t durationUs = profile.clampDuration(CameraUtils::secondsToMicroseconds(shutterSeconds));

    if (active_->device->isExposureModeSupported(ExposureMode::Custom)) {
        const bool applied = withConfigurationLock("setExposure", [&](CaptureDevice& device) {
            device.setExposureModeCustom(durationUs, clampedISO);
        });
        if (!applied) {
            return;
        }
    } else {
        reportUnsupported("setExposure", "custom exposure");
    }

    store_.update(state::StateField::Settings, [&](state::CameraState& s) {
        s.settings.iso = clampedISO;
        s.settings.shutterSeconds = durationUs / 1e6;
    });
    VIEWFINDER_LOG_DEBUG(kComponent) << "Exposure ISO " << clampedISO << ", shutter "
                                     << CameraUtils::formatShutterSpeed(durationUs / 1e6);
}

void DeviceControl::applyFocus(float lensPosition) {
    if (!requireDevice("setFocus")) {
        return;
    }
    const float clamped = std::clamp(lensPosition, 0.0f, 1.0f);

    if (active_->device->isFocusModeSupported(FocusMode::Locked)) {
        const bool applied = withConfigurationLock("setFocus", [clamped](CaptureDevice& device) {
            device.setFocusModeLocked(clamped);
        });
        if (!applied) {
            return;
        }
    } else {
        reportUnsupported("setFocus", "locked focus");
    }

    store_.update(state::StateField::Settings, [clamped](state::CameraState& s) {
        s.settings.focusPosition = clamped;
    });
}

void DeviceControl::applyPointOfInterest(const cv::Point2f& point) {
    if (!requireDevice("focusAndExposeAtPoint")) {
        return;
    }
    const cv::Point2f clamped(std::clamp(point.x, 0.0f, 1.0f), std::clamp(point.y, 0.0f, 1.0f));

    CaptureDevice& device = *active_->device;
    const bool focusPoint = device.isFocusPointOfInterestSupported()
                         && device.isFocusModeSupported(FocusMode::AutoFocus);
    const bool exposurePoint = device.isExposurePointOfInterestSupported()
                            && device.isExposureModeSupported(ExposureMode::AutoExpose);

    if (!focusPoint && !exposurePoint) {
        reportUnsupported("focusAndExposeAtPoint", "point of interest");
        return;
    }

    withConfigurationLock("focusAndExposeAtPoint", [&](CaptureDevice& d) {
        if (focusPoint) {
            d.setFocusPointOfInterest(clamped);
            d.setFocusMode(FocusMode::AutoFocus);
        }
        if (exposurePoint) {
            d.setExposurePointOfInterest(clamped);
            d.setExposureMode(ExposureMode::AutoExpose);
        }
        d.setSubjectAreaChangeMonitoring(true);
    });
}

void DeviceControl::applyWhiteBalance(float kelvin) {
    if (!requireDevice("setWhiteBalance")) {
        return;
    }
    const float clamped = std::clamp(kelvin, config_.whiteBalanceMinKelvin,
                                     config_.whiteBalanceMaxKelvin);

    if (active_->device->isWhiteBalanceModeSupported(WhiteBalanceMode::Locked)) {
        const bool applied = withConfigurationLock("setWhiteBalance", [clamped](CaptureDevice& device) {
            const WhiteBalanceGains gains = CameraUtils::clampGains(
                device.deviceWhiteBalanceGains(clamped), device.maxWhiteBalanceGain());
            device.setWhiteBalanceModeLocked(gains);
        });
        if (!applied) {
            return;
        }
    } else {
        reportUnsupported("setWhiteBalance", "locked white balance");
    }

    store_.update(state::StateField::Settings, [clamped](state::CameraState& s) {
        s.settings.whiteBalanceKelvin = clamped;
    });
}

void DeviceControl::applyWhiteBalanceReset() {
    if (!requireDevice("resetWhiteBalance")) {
        return;
    }
    if (!active_->device->isWhiteBalanceModeSupported(WhiteBalanceMode::ContinuousAutoWhiteBalance)) {
        reportUnsupported("resetWhiteBalance", "continuous auto white balance");
        return;
    }
    withConfigurationLock("resetWhiteBalance", [](CaptureDevice& device) {
        device.setWhiteBalanceMode(WhiteBalanceMode::ContinuousAutoWhiteBalance);
    });
}

void DeviceControl::applyExposureBias(float bias) {
    if (!requireDevice("setExposureBias")) {
        return;
    }
    const float clamped = active_->profile.clampBias(bias);

    const bool applied = withConfigurationLock("setExposureBias", [clamped](CaptureDevice& device) {
        // Bias only takes effect while metering drives the exposure
        if (device.isExposureModeSupported(ExposureMode::ContinuousAutoExposure)) {
            device.setExposureMode(ExposureMode::ContinuousAutoExposure);
        }
        device.setExposureTargetBias(clamped);
    });
    if (!applied) {
        return;
    }

    store_.update(state::StateField::Settings, [clamped](state::CameraState& s) {
        s.settings.exposureBias = clamped;
    });
}

void DeviceControl::applyAutoMode() {
    if (!requireDevice("setAutoMode")) {
        return;
    }

    const bool applied = withConfigurationLock("setAutoMode", [](CaptureDevice& device) {
        if (device.isFocusModeSupported(FocusMode::ContinuousAutoFocus)) {
            device.setFocusMode(FocusMode::ContinuousAutoFocus);
        }
        if (device.isExposureModeSupported(ExposureMode::ContinuousAutoExposure)) {
            device.setExposureMode(ExposureMode::ContinuousAutoExposure);
        }
        if (device.isWhiteBalanceModeSupported(WhiteBalanceMode::ContinuousAutoWhiteBalance)) {
            device.setWhiteBalanceMode(WhiteBalanceMode::ContinuousAutoWhiteBalance);
        }
        if (device.exposureTargetBias() != 0.0f) {
            device.setExposureTargetBias(0.0f);
        }
    });
    if (!applied) {
        return;
    }

    store_.update(state::StateField::Settings, [](state::CameraState& s) {
        s.settings.exposureBias = 0.0f;
    });
    VIEWFINDER_LOG_DEBUG(kComponent) << "Auto mode";
}

} // namespace camera
} // namespace viewfinder
