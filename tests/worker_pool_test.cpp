#include <gtest/gtest.h>
#include "stoa/threading/SimpleWorkerPool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace stoa;

TEST(SimpleWorkerPoolTest, RunsEveryPostedTask) {
    std::atomic<int> count{0};
    {
        SimpleWorkerPool pool(4);
        for (int i = 0; i < 100; ++i) {
            ASSERT_TRUE(pool.post([&count]() { count++; }));
        }
        pool.shutdown();
    }
    EXPECT_EQ(count.load(), 100);
}

TEST(SimpleWorkerPoolTest, ZeroThreadsMeansOne) {
    SimpleWorkerPool pool(0);
    EXPECT_EQ(pool.threadCount(), 1u);
}

TEST(SimpleWorkerPoolTest, TasksRunOffTheCallingThread) {
    std::mutex mutex;
    std::set<std::thread::id> ids;
    {
        SimpleWorkerPool pool(2);
        for (int i = 0; i < 20; ++i) {
            pool.post([&]() {
                std::lock_guard<std::mutex> lock(mutex);
                ids.insert(std::this_thread::get_id());
            });
        }
    }
    EXPECT_FALSE(ids.empty());
    EXPECT_EQ(ids.count(std::this_thread::get_id()), 0u);
}

TEST(SimpleWorkerPoolTest, RefusesWhenQueueIsFull) {
    std::mutex gate_mutex;
    std::condition_variable gate;
    bool open = false;
    std::atomic<bool> started{false};

    SimpleWorkerPool pool(1, 2);
    ASSERT_TRUE(pool.post([&]() {
        started = true;
        std::unique_lock<std::mutex> lock(gate_mutex);
        gate.wait(lock, [&] { return open; });
    }));
    while (!started.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    EXPECT_TRUE(pool.post([] {}));
    EXPECT_TRUE(pool.post([] {}));
    EXPECT_FALSE(pool.post([] {}));
    EXPECT_EQ(pool.queued(), 2u);

    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        open = true;
    }
    gate.notify_all();
    pool.shutdown();
    EXPECT_EQ(pool.queued(), 0u);
}

TEST(SimpleWorkerPoolTest, RefusesAfterShutdown) {
    SimpleWorkerPool pool(1);
    pool.shutdown();
    EXPECT_FALSE(pool.post([] {}));
}

TEST(SimpleWorkerPoolTest, ThrowingTaskDoesNotKillWorker) {
    std::atomic<bool> ran_after{false};
    {
        SimpleWorkerPool pool(1);
        pool.post([]() { throw std::runtime_error("task failure"); });
        pool.post([&]() { ran_after = true; });
    }
    EXPECT_TRUE(ran_after.load());
}
