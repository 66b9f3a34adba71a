#pragma once

#include "viewfinder/analysis/FocusPeakingEngine.hpp"
#include "viewfinder/analysis/HistogramEngine.hpp"
#include "viewfinder/camera/CameraTypes.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

namespace viewfinder {

namespace state {
class StateStore;
}

namespace realtime {

/**
 * Per-frame analysis dispatch.
 *
 * onFrame() runs on the capture session's streaming thread and only drops
 * the frame into a single-slot mailbox; one worker thread runs the enabled
 * analyses on the newest frame and publishes both results together. A frame
 * that arrives while another is still waiting replaces it, so latency never
 * accumulates.
 */
class FramePipeline {
public:
    struct Config {
        bool histogram_enabled = true;
        bool peaking_enabled = false;
        analysis::FocusPeakingEngine::Config peaking;
    };

    struct Stats {
        uint64_t frames_received = 0;
        uint64_t frames_analyzed = 0;
        uint64_t frames_dropped = 0;     ///< Replaced in the mailbox before analysis
        uint64_t analysis_failures = 0;
    };

    FramePipeline(state::StateStore& store, const Config& config);
    ~FramePipeline();

    FramePipeline(const FramePipeline&) = delete;
    FramePipeline& operator=(const FramePipeline&) = delete;

    /**
     * Start the analysis worker; idempotent
     */
    bool start();

    /**
     * Stop the worker and discard any pending frame; idempotent
     */
    void stop();

    bool isRunning() const { return running_; }

    /**
     * Hand over a frame. Never waits for analysis.
     */
    void onFrame(const camera::Frame& frame);

    /**
     * Change only the flags that are given. Turning peaking off publishes a
     * cleared overlay before returning.
     */
    void setAnalysisEnablement(std::optional<bool> histogram, std::optional<bool> peaking);

    bool histogramEnabled() const { return histogram_enabled_; }
    bool peakingEnabled() const { return peaking_enabled_; }

    Stats stats() const;

    /**
     * Wait until no frame is pending or being analyzed
     * @return false on timeout
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout);

private:
    void workerLoop();
    void analyze(const camera::Frame& frame);

    state::StateStore& store_;
    analysis::HistogramEngine histogram_;
    analysis::FocusPeakingEngine peaking_;

    std::atomic<bool> histogram_enabled_;
    std::atomic<bool> peaking_enabled_;
    std::atomic<bool> running_{false};
    std::thread worker_;

    // Mailbox
    mutable std::mutex slot_mutex_;
    std::condition_variable slot_cv_;
    std::condition_variable idle_cv_;
    std::optional<camera::Frame> pending_;
    bool busy_ = false;
    Stats stats_;

    // Serializes the enablement recheck with publication
    std::mutex publish_mutex_;
};

} // namespace realtime
} // namespace viewfinder
