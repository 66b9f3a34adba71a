#include "viewfinder/realtime/FramePipeline.hpp"
#include "viewfinder/core/Logger.hpp"
#include "viewfinder/state/StateStore.hpp"

#include <exception>
#include <vector>

namespace viewfinder {
namespace realtime {

namespace {
constexpr uint64_t kStatsLogInterval = 600;
}

FramePipeline::FramePipeline(state::StateStore& store, const Config& config)
    : store_(store)
    , peaking_(config.peaking)
    , histogram_enabled_(config.histogram_enabled)
    , peaking_enabled_(config.peaking_enabled) {
    store_.update(state::StateField::AnalysisEnablement, [&config](state::CameraState& s) {
        s.histogramEnabled = config.histogram_enabled;
        s.peakingEnabled = config.peaking_enabled;
    });
}

FramePipeline::~FramePipeline() {
    stop();
}

bool FramePipeline::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return true;
    }
    worker_ = std::thread(&FramePipeline::workerLoop, this);
    VIEWFINDER_LOG_DEBUG("FramePipeline") << "Analysis worker started";
    return true;
}

void FramePipeline::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        pending_.reset();
    }
    slot_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    idle_cv_.notify_all();

    const Stats s = stats();
    VIEWFINDER_LOG_INFO("FramePipeline") << "Stopped: " << s.frames_received << " received, "
                                         << s.frames_analyzed << " analyzed, "
                                         << s.frames_dropped << " dropped";
}

void FramePipeline::onFrame(const camera::Frame& frame) {
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        ++stats_.frames_received;
        if (!running_ || (!histogram_enabled_ && !peaking_enabled_)) {
            return;
        }
        if (pending_) {
            ++stats_.frames_dropped;
        }
        pending_ = frame;
    }
    slot_cv_.notify_one();
}

void FramePipeline::setAnalysisEnablement(std::optional<bool> histogram, std::optional<bool> peaking) {
    std::lock_guard<std::mutex> lock(publish_mutex_);

    if (histogram) {
        histogram_enabled_ = *histogram;
    }
    if (peaking) {
        const bool wasEnabled = peaking_enabled_.exchange(*peaking);
        if (wasEnabled && !*peaking) {
            store_.update(state::StateField::FrameAnalysis, [](state::CameraState& s) {
                s.peakingOverlay = cv::Mat();
            });
        }
    }

    const bool h = histogram_enabled_;
    const bool p = peaking_enabled_;
    store_.update(state::StateField::AnalysisEnablement, [h, p](state::CameraState& s) {
        s.histogramEnabled = h;
        s.peakingEnabled = p;
    });
    VIEWFINDER_LOG_DEBUG("FramePipeline") << "Analysis enablement: histogram=" << h
                                          << " peaking=" << p;
}

FramePipeline::Stats FramePipeline::stats() const {
    std::lock_guard<std::mutex> lock(slot_mutex_);
    return stats_;
}

bool FramePipeline::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(slot_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return !pending_ && !busy_; });
}

void FramePipeline::workerLoop() {
    while (true) {
        camera::Frame frame;
        {
            std::unique_lock<std::mutex> lock(slot_mutex_);
            slot_cv_.wait(lock, [this] { return pending_.has_value() || !running_; });
            if (!running_) {
                break;
            }
            frame = std::move(*pending_);
            pending_.reset();
            busy_ = true;
        }

        analyze(frame);

        {
            std::lock_guard<std::mutex> lock(slot_mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}

void FramePipeline::analyze(const camera::Frame& frame) {
    const bool wantHistogram = histogram_enabled_;
    const bool wantPeaking = peaking_enabled_;
    if (!wantHistogram && !wantPeaking) {
        return;
    }

    std::vector<float> histogram;
    cv::Mat overlay;
    try {
        if (wantHistogram) {
            histogram = histogram_.compute(frame.image);
        }
        if (wantPeaking) {
            overlay = peaking_.compute(frame.image);
        }
    } catch (const std::exception& e) {
        VIEWFINDER_LOG_ERROR("FramePipeline") << "Analysis of frame " << frame.sequence
                                              << " failed: " << e.what();
        std::lock_guard<std::mutex> lock(slot_mutex_);
        ++stats_.analysis_failures;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(publish_mutex_);
        // Enablement may have changed while computing; never publish a disabled result
        const bool publishHistogram = wantHistogram && histogram_enabled_;
        const bool publishOverlay = wantPeaking && peaking_enabled_;
        if (publishHistogram || publishOverlay) {
            store_.update(state::StateField::FrameAnalysis,
                          [&](state::CameraState& s) {
                              if (publishHistogram) {
                                  s.histogram = std::move(histogram);
                              }
                              if (publishOverlay) {
                                  s.peakingOverlay = overlay;
                              }
                          });
        }
    }

    uint64_t analyzed;
    uint64_t dropped;
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        analyzed = ++stats_.frames_analyzed;
        dropped = stats_.frames_dropped;
    }
    if (analyzed % kStatsLogInterval == 0) {
        VIEWFINDER_LOG_DEBUG("FramePipeline") << analyzed << " frames analyzed, "
                                              << dropped << " dropped";
    }
}

} // namespace realtime
} // namespace viewfinder
