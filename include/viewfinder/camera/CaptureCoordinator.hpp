#pragma once

#include "viewfinder/camera/CaptureSession.hpp"
#include "viewfinder/core/Configuration.hpp"
#include "viewfinder/state/StateStore.hpp"
#include "viewfinder/storage/PhotoEncoder.hpp"
#include "viewfinder/storage/PhotoSink.hpp"

#include <cstdint>
#include <functional>
#include <mutex>

namespace viewfinder {

namespace realtime {
class SerialQueue;
}

namespace camera {

class DeviceControl;

/**
 * One-shot still capture.
 *
 * Picks the richest format the current input offers (raw sensor data with
 * a processed preview, else processed only), asks for the maximum still
 * size and hands the encoded result to the sink. Failures are logged and
 * reported as diagnostics; nothing is retried.
 */
class CaptureCoordinator {
public:
    using CompletionCallback = std::function<void(const storage::SaveResult&)>;

    struct Stats {
        uint64_t requested = 0;
        uint64_t saved = 0;
        uint64_t failed = 0;
    };

    CaptureCoordinator(CaptureSession& session,
                       realtime::SerialQueue& queue,
                       state::StateStore& store,
                       DeviceControl& deviceControl,
                       storage::PhotoSink& sink,
                       const core::CaptureConfig& config);

    /**
     * Queue a capture. The callback, if any, runs on the control queue with
     * the outcome, including failures before the sink was reached.
     */
    void capturePhoto(CompletionCallback onComplete = nullptr);

    /**
     * Settings the next capture would use. Control queue only.
     */
    StillCaptureSettings selectSettings() const;

    Stats stats() const;

private:
    storage::SaveResult captureNow();
    storage::SaveResult fail(state::DiagnosticKind kind, const std::string& reason);

    CaptureSession& session_;
    realtime::SerialQueue& queue_;
    state::StateStore& store_;
    DeviceControl& deviceControl_;
    storage::PhotoSink& sink_;
    storage::PhotoEncoder encoder_;
    bool preferRaw_;

    mutable std::mutex statsMutex_;
    Stats stats_;
};

} // namespace camera
} // namespace viewfinder
