#pragma once

#include "viewfinder/core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace viewfinder {
namespace realtime {

/**
 * Single worker thread executing posted tasks strictly in submission order.
 *
 * Every device configuration change, session start/stop and still capture
 * runs here, so no two of them can interleave. A task that throws is logged
 * and the queue moves on to the next one.
 */
class SerialQueue {
public:
    explicit SerialQueue(std::string name);
    ~SerialQueue();

    SerialQueue(const SerialQueue&) = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;

    /**
     * Append a task
     * @return false if the queue has been stopped; the task is discarded
     */
    bool post(core::Task task);

    /**
     * Block until every task posted before this call has run.
     * Returns immediately when called from the queue's own thread or after
     * stop().
     */
    void waitUntilIdle();

    bool isCurrentThread() const;

    /**
     * Run the tasks already queued, then join the worker. Idempotent.
     */
    void stop();

    bool isStopped() const { return stopped_; }

    const std::string& name() const { return name_; }

private:
    void workerLoop();

    std::string name_;
    std::deque<core::Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    uint64_t posted_ = 0;
    uint64_t completed_ = 0;
    bool finished_ = false;
    std::atomic<bool> stopped_{false};
    std::mutex join_mutex_;
    std::thread worker_;
    std::thread::id worker_id_;
};

} // namespace realtime
} // namespace viewfinder
