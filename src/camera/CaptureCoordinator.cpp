#include "viewfinder/camera/CaptureCoordinator.hpp"
#include "viewfinder/camera/CameraUtils.hpp"
#include "viewfinder/camera/DeviceControl.hpp"
#include "viewfinder/core/Logger.hpp"
#include "viewfinder/core/exception.h"
#include "viewfinder/realtime/SerialQueue.hpp"

#include <exception>
#include <string>

namespace viewfinder {
namespace camera {

namespace {
constexpr const char* kComponent = "CaptureCoordinator";
}

CaptureCoordinator::CaptureCoordinator(CaptureSession& session,
                                       realtime::SerialQueue& queue,
                                       state::StateStore& store,
                                       DeviceControl& deviceControl,
                                       storage::PhotoSink& sink,
                                       const core::CaptureConfig& config)
    : session_(session)
    , queue_(queue)
    , store_(store)
    , deviceControl_(deviceControl)
    , sink_(sink)
    , encoder_(config.jpegQuality)
    , preferRaw_(config.preferRaw) {}

void CaptureCoordinator::capturePhoto(CompletionCallback onComplete) {
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++stats_.requested;
    }
    const bool queued = queue_.post([this, onComplete]() {
        const storage::SaveResult result = captureNow();
        if (onComplete) {
            onComplete(result);
        }
    });
    if (!queued) {
        VIEWFINDER_LOG_WARNING(kComponent) << "Capture dropped, control queue stopped";
    }
}

StillCaptureSettings CaptureCoordinator::selectSettings() const {
    const StillCapabilities caps = session_.stillCapabilities();

    StillCaptureSettings settings;
    settings.maxDimensions = caps.maxDimensions;
    if (preferRaw_ && caps.rawSupported && !caps.rawFormats.empty()) {
        settings.format = StillFormat::RawWithProcessedPreview;
        settings.rawFormat = caps.rawFormats.front();
    } else {
        settings.format = StillFormat::Processed;
    }
    return settings;
}

CaptureCoordinator::Stats CaptureCoordinator::stats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

storage::SaveResult CaptureCoordinator::fail(state::DiagnosticKind kind, const std::string& reason) {
    VIEWFINDER_LOG_ERROR(kComponent) << "Capture failed: " << reason;
    store_.reportDiagnostic(kind, reason);
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++stats_.failed;
    }
    storage::SaveResult result;
    result.reason = reason;
    return result;
}

storage::SaveResult CaptureCoordinator::captureNow() {
    if (!deviceControl_.hasDevice() || !session_.isRunning()) {
        return fail(state::DiagnosticKind::CaptureFailed, "session not ready");
    }

    const StillCaptureSettings settings = selectSettings();
    VIEWFINDER_LOG_DEBUG(kComponent) << "Capturing "
                                     << (settings.format == StillFormat::RawWithProcessedPreview
                                             ? "raw (" + settings.rawFormat + ") + preview"
                                             : std::string("processed"))
                                     << " at " << settings.maxDimensions.width << "x"
                                     << settings.maxDimensions.height;

    StillImage still;
    try {
        still = session_.captureStill(settings);
    } catch (const core::Exception& e) {
        return fail(state::DiagnosticKind::CaptureFailed, e.getMessage());
    } catch (const std::exception& e) {
        return fail(state::DiagnosticKind::CaptureFailed, std::string("still capture: ") + e.what());
    }

    const state::CameraState snapshot = store_.snapshot();
    storage::CaptureMetadata metadata;
    if (snapshot.profile) {
        metadata.deviceId = snapshot.profile->deviceId;
    }
    metadata.position = CameraUtils::toString(snapshot.settings.position);
    metadata.lens = CameraUtils::toString(snapshot.settings.lens);
    metadata.iso = snapshot.settings.iso;
    metadata.shutterSeconds = snapshot.settings.shutterSeconds;
    metadata.focusPosition = snapshot.settings.focusPosition;
    metadata.whiteBalanceKelvin = snapshot.settings.whiteBalanceKelvin;
    metadata.exposureBias = snapshot.settings.exposureBias;
    metadata.capturedAt = std::chrono::system_clock::now();

    storage::EncodedPhoto photo;
    try {
        photo = encoder_.encode(still, metadata);
    } catch (const core::Exception& e) {
        return fail(state::DiagnosticKind::CaptureFailed, e.getMessage());
    } catch (const std::exception& e) {
        // cv::Exception from imencode
        return fail(state::DiagnosticKind::CaptureFailed, std::string("encoding: ") + e.what());
    }

    storage::SaveResult result = sink_.save(photo);
    if (!result.ok) {
        return fail(state::DiagnosticKind::SaveFailed, "save rejected: " + result.reason);
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++stats_.saved;
    }
    VIEWFINDER_LOG_INFO(kComponent) << "Photo saved to " << result.path << " ("
                                    << photo.metadata.format << ", "
                                    << photo.metadata.width << "x" << photo.metadata.height << ")";
    return result;
}

} // namespace camera
} // namespace viewfinder
