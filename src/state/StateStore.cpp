#include "viewfinder/state/StateStore.hpp"

#include <utility>

namespace viewfinder {
namespace state {

std::string toString(StateField field) {
    switch (field) {
        case StateField::Settings:           return "settings";
        case StateField::DeviceProfile:      return "device_profile";
        case StateField::FrameAnalysis:      return "frame_analysis";
        case StateField::AnalysisEnablement: return "analysis_enablement";
        case StateField::SessionRunning:     return "session_running";
        default:                             return "unknown";
    }
}

std::string toString(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::DeviceFallback:          return "device_fallback";
        case DiagnosticKind::DeviceUnavailable:       return "device_unavailable";
        case DiagnosticKind::InputRejected:           return "input_rejected";
        case DiagnosticKind::CapabilityUnsupported:   return "capability_unsupported";
        case DiagnosticKind::ConfigurationLockFailed: return "configuration_lock_failed";
        case DiagnosticKind::CaptureFailed:           return "capture_failed";
        case DiagnosticKind::SaveFailed:              return "save_failed";
        case DiagnosticKind::SessionFailed:           return "session_failed";
        default:                                      return "unknown";
    }
}

StateStore::StateStore(core::Dispatcher dispatcher)
    : dispatcher_(std::move(dispatcher)) {}

void StateStore::setDispatcher(core::Dispatcher dispatcher) {
    std::lock_guard<std::mutex> lock(mutex_);
    dispatcher_ = std::move(dispatcher);
}

CameraState StateStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

camera::ManualSettings StateStore::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.settings;
}

std::optional<camera::CaptureDeviceProfile> StateStore::profile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.profile;
}

void StateStore::update(StateField field, const std::function<void(CameraState&)>& mutator) {
    std::vector<Observer> observers;
    CameraState copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        mutator(state_);
        if (observers_.empty()) {
            return;
        }
        copy = state_;
        observers.reserve(observers_.size());
        for (const auto& entry : observers_) {
            observers.push_back(entry.second);
        }
    }

    dispatch([observers = std::move(observers), field, copy = std::move(copy)]() {
        for (const auto& observer : observers) {
            observer(field, copy);
        }
    });
}

StateStore::SubscriptionId StateStore::subscribe(Observer observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SubscriptionId id = nextId_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

void StateStore::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(id);
}

StateStore::SubscriptionId StateStore::addDiagnosticListener(DiagnosticListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SubscriptionId id = nextId_++;
    diagnosticListeners_.emplace(id, std::move(listener));
    return id;
}

void StateStore::removeDiagnosticListener(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    diagnosticListeners_.erase(id);
}

void StateStore::reportDiagnostic(DiagnosticKind kind, const std::string& message) {
    std::vector<DiagnosticListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : diagnosticListeners_) {
            listeners.push_back(entry.second);
        }
    }
    if (listeners.empty()) {
        return;
    }

    DiagnosticEvent event{kind, message};
    dispatch([listeners = std::move(listeners), event]() {
        for (const auto& listener : listeners) {
            listener(event);
        }
    });
}

void StateStore::dispatch(core::Task task) {
    core::Dispatcher dispatcher;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dispatcher = dispatcher_;
    }
    if (dispatcher) {
        dispatcher(std::move(task));
    } else {
        task();
    }
}

} // namespace state
} // namespace viewfinder
