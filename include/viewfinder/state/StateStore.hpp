#pragma once

#include "viewfinder/camera/CameraTypes.hpp"
#include "viewfinder/core/types.hpp"

#include <opencv2/core.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace viewfinder {
namespace state {

/**
 * Everything the presentation layer reads. Each field group has exactly one
 * writer: the device control facade owns settings and profile, the frame
 * pipeline owns histogram and overlay, the session controller owns the
 * running flag.
 */
struct CameraState {
    camera::ManualSettings settings;

    /// Bounds of the active device; empty until a device is installed
    std::optional<camera::CaptureDeviceProfile> profile;

    std::vector<float> histogram;       ///< 256 entries once the first frame is analyzed
    cv::Mat peakingOverlay;             ///< BGRA; empty means no overlay

    bool histogramEnabled = true;
    bool peakingEnabled = false;
    bool sessionRunning = false;
};

enum class StateField {
    Settings,
    DeviceProfile,
    FrameAnalysis,          ///< Histogram and overlay, always from the same frame
    AnalysisEnablement,
    SessionRunning
};

/**
 * Non-fatal events that degraded behaviour. Purely observational.
 */
enum class DiagnosticKind {
    DeviceFallback,
    DeviceUnavailable,
    InputRejected,
    CapabilityUnsupported,
    ConfigurationLockFailed,
    CaptureFailed,
    SaveFailed,
    SessionFailed
};

struct DiagnosticEvent {
    DiagnosticKind kind;
    std::string message;
};

std::string toString(StateField field);
std::string toString(DiagnosticKind kind);

/**
 * Published state with change notification.
 *
 * update() applies a mutation under the store's lock, then hands a snapshot
 * to every observer through the dispatcher. The default dispatcher runs
 * observers inline on the writer's thread; a UI layer installs one that
 * marshals onto its own thread. Observers must not call update() inline.
 */
class StateStore {
public:
    using Observer = std::function<void(StateField, const CameraState&)>;
    using DiagnosticListener = std::function<void(const DiagnosticEvent&)>;
    using SubscriptionId = uint64_t;

    explicit StateStore(core::Dispatcher dispatcher = nullptr);

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    void setDispatcher(core::Dispatcher dispatcher);

    CameraState snapshot() const;
    camera::ManualSettings settings() const;
    std::optional<camera::CaptureDeviceProfile> profile() const;

    void update(StateField field, const std::function<void(CameraState&)>& mutator);

    SubscriptionId subscribe(Observer observer);
    void unsubscribe(SubscriptionId id);

    SubscriptionId addDiagnosticListener(DiagnosticListener listener);
    void removeDiagnosticListener(SubscriptionId id);

    void reportDiagnostic(DiagnosticKind kind, const std::string& message);

private:
    void dispatch(core::Task task);

    mutable std::mutex mutex_;
    CameraState state_;
    core::Dispatcher dispatcher_;
    std::map<SubscriptionId, Observer> observers_;
    std::map<SubscriptionId, DiagnosticListener> diagnosticListeners_;
    SubscriptionId nextId_ = 1;
};

} // namespace state
} // namespace viewfinder
