#include "viewfinder/realtime/SerialQueue.hpp"
#include "viewfinder/core/Logger.hpp"

#include <exception>

namespace viewfinder {
namespace realtime {

SerialQueue::SerialQueue(std::string name)
    : name_(std::move(name)) {
    worker_ = std::thread(&SerialQueue::workerLoop, this);
    worker_id_ = worker_.get_id();
}

SerialQueue::~SerialQueue() {
    stop();
}

bool SerialQueue::post(core::Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            VIEWFINDER_LOG_DEBUG(name_) << "Task discarded, queue stopped";
            return false;
        }
        tasks_.push_back(std::move(task));
        ++posted_;
    }
    cv_.notify_one();
    return true;
}

void SerialQueue::waitUntilIdle() {
    if (isCurrentThread()) {
        VIEWFINDER_LOG_ERROR(name_) << "waitUntilIdle called from the queue thread, ignored";
        return;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t target = posted_;
    idle_cv_.wait(lock, [this, target] {
        return completed_ >= target || finished_;
    });
}

bool SerialQueue::isCurrentThread() const {
    return std::this_thread::get_id() == worker_id_;
}

void SerialQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();

    // Stopping from one of its own tasks only flags the loop; the owner joins later
    if (isCurrentThread()) {
        return;
    }
    std::lock_guard<std::mutex> joinLock(join_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

void SerialQueue::workerLoop() {
    while (true) {
        core::Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopped_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                finished_ = true;
                break;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            VIEWFINDER_LOG_ERROR(name_) << "Task failed: " << e.what();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++completed_;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

} // namespace realtime
} // namespace viewfinder
