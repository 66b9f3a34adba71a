/**
 * @file test_serial_queue.cpp
 * @brief Unit tests for the control queue
 *
 * Validates:
 * - Strict FIFO execution on one thread
 * - Behaviour after stop()
 * - Exceptions thrown by tasks do not stop the queue
 * - waitUntilIdle() from inside a task does not deadlock
 */

#include <gtest/gtest.h>
#include <viewfinder/core/Logger.hpp>
#include <viewfinder/realtime/SerialQueue.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace viewfinder::realtime;

class SerialQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        viewfinder::core::Logger::getInstance().setLevel(viewfinder::core::LogLevel::CRITICAL);
        queue_ = std::make_unique<SerialQueue>("TestQueue");
    }

    void TearDown() override {
        queue_->stop();
        queue_.reset();
    }

    std::unique_ptr<SerialQueue> queue_;
};

/**
 * Test 1: Tasks run in submission order
 */
TEST_F(SerialQueueTest, TasksRunInSubmissionOrder) {
    std::vector<int> order;
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(queue_->post([&order, i]() { order.push_back(i); }));
    }
    queue_->waitUntilIdle();

    ASSERT_EQ(order.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(order[i], i);
    }
}

/**
 * Test 2: Tasks posted from several threads never overlap
 */
TEST_F(SerialQueueTest, TasksNeverOverlap) {
    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};
    std::atomic<int> executed{0};

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                queue_->post([&]() {
                    const int now = ++active;
                    int seen = maxActive.load();
                    while (now > seen && !maxActive.compare_exchange_weak(seen, now)) {
                    }
                    ++executed;
                    --active;
                });
            }
        });
    }
    for (auto& p : producers) {
        p.join();
    }
    queue_->waitUntilIdle();

    EXPECT_EQ(executed.load(), 200);
    EXPECT_EQ(maxActive.load(), 1);
}

/**
 * Test 3: A throwing task is logged and the next task still runs
 */
TEST_F(SerialQueueTest, ThrowingTaskDoesNotStopQueue) {
    bool ranAfter = false;
    queue_->post([]() { throw std::runtime_error("boom"); });
    queue_->post([&ranAfter]() { ranAfter = true; });
    queue_->waitUntilIdle();

    EXPECT_TRUE(ranAfter);
    EXPECT_FALSE(queue_->isStopped());
}

/**
 * Test 4: stop() runs what is already queued, later posts are refused
 */
TEST_F(SerialQueueTest, StopDrainsThenRefuses) {
    std::atomic<int> count{0};
    for (int i = 0; i < 10; ++i) {
        queue_->post([&count]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ++count;
        });
    }
    queue_->stop();

    EXPECT_EQ(count.load(), 10);
    EXPECT_TRUE(queue_->isStopped());
    EXPECT_FALSE(queue_->post([&count]() { ++count; }));
    EXPECT_EQ(count.load(), 10);

    // Idempotent, and waiting on a stopped queue returns at once
    queue_->stop();
    queue_->waitUntilIdle();
}

/**
 * Test 5: waitUntilIdle() from a task returns instead of deadlocking
 */
TEST_F(SerialQueueTest, WaitFromQueueThreadReturns) {
    bool reached = false;
    queue_->post([this, &reached]() {
        queue_->waitUntilIdle();
        reached = true;
    });
    queue_->waitUntilIdle();

    EXPECT_TRUE(reached);
}

/**
 * Test 6: isCurrentThread() identifies the worker
 */
TEST_F(SerialQueueTest, IsCurrentThread) {
    bool insideTask = false;
    queue_->post([this, &insideTask]() { insideTask = queue_->isCurrentThread(); });
    queue_->waitUntilIdle();

    EXPECT_TRUE(insideTask);
    EXPECT_FALSE(queue_->isCurrentThread());
}

/**
 * Test 7: A task may stop its own queue
 */
TEST_F(SerialQueueTest, StopFromOwnTask) {
    queue_->post([this]() { queue_->stop(); });
    queue_->waitUntilIdle();

    EXPECT_TRUE(queue_->isStopped());
    EXPECT_FALSE(queue_->post([]() {}));
}
