#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

#include "scheduler/errors.hpp"
#include "scheduler/worker_pool.hpp"

using cronkit::scheduler::SchedulingError;
using cronkit::scheduler::WorkerPool;

namespace {

class Gate {
public:
    void Open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        condition_.notify_all();
    }

    void Wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait(lock, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable condition_;
    bool open_ = false;
};

}  // namespace

TEST(WorkerPoolTest, RunsSubmittedTasks) {
    std::atomic<int> counter{0};
    {
        WorkerPool pool(2, 4);
        for (int i = 0; i < 50; ++i) {
            pool.Submit([&counter] { counter.fetch_add(1); });
        }
        pool.Shutdown();
    }
    EXPECT_EQ(counter.load(), 50);
}

TEST(WorkerPoolTest, GrowsWhenEveryWorkerIsBusy) {
    WorkerPool pool(1, 4);
    Gate gate;
    std::mutex mutex;
    std::condition_variable started_cv;
    int started = 0;

    for (int i = 0; i < 3; ++i) {
        pool.Submit([&] {
            {
                std::lock_guard<std::mutex> lock(mutex);
                ++started;
            }
            started_cv.notify_all();
            gate.Wait();
        });
    }

    {
        std::unique_lock<std::mutex> lock(mutex);
        const bool all_started = started_cv.wait_for(lock, std::chrono::seconds(5), [&] { return started == 3; });
        EXPECT_TRUE(all_started);
    }
    EXPECT_GE(pool.ThreadCount(), 3u);
    EXPECT_LE(pool.ThreadCount(), 4u);
    gate.Open();
    pool.Shutdown();
}

TEST(WorkerPoolTest, ShutdownDrainsQueuedTasks) {
    std::atomic<int> counter{0};
    WorkerPool pool(1, 1);
    Gate gate;
    pool.Submit([&gate] { gate.Wait(); });
    for (int i = 0; i < 5; ++i) {
        pool.Submit([&counter] { counter.fetch_add(1); });
    }
    gate.Open();
    pool.Shutdown();
    EXPECT_EQ(counter.load(), 5);
    EXPECT_EQ(pool.QueuedTasks(), 0u);
}

TEST(WorkerPoolTest, SubmitAfterShutdownThrows) {
    WorkerPool pool(1, 2);
    pool.Shutdown();
    EXPECT_FALSE(pool.Accepting());
    EXPECT_THROW(pool.Submit([] {}), SchedulingError);
    // A second shutdown is harmless.
    pool.Shutdown();
}

TEST(WorkerPoolTest, ShutdownFromTaskKeepsPoolAliveUntilTaskEnds) {
    std::atomic<bool> finished{false};
    auto pool = std::make_unique<WorkerPool>(2, 4);
    WorkerPool* raw = pool.get();
    pool->Submit([raw, &finished] {
        raw->Shutdown();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        finished = true;
    });

    while (pool->Accepting()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    pool.reset();
    EXPECT_TRUE(finished.load());
}

TEST(WorkerPoolTest, SecondShutdownWaitsForRunningTasks) {
    std::atomic<bool> finished{false};
    Gate started;
    WorkerPool pool(1, 1);
    pool.Submit([&] {
        started.Open();
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        finished = true;
    });
    started.Wait();

    std::thread first([&pool] { pool.Shutdown(); });
    pool.Shutdown();
    EXPECT_TRUE(finished.load());
    first.join();
}

TEST(WorkerPoolTest, FailedThreadCreationRefusesTask) {
    std::atomic<int> created{0};
    std::atomic<int> ran{0};
    Gate gate;
    Gate started;
    WorkerPool pool(1, 4, WorkerPool::kDefaultIdleKeepAlive, [&created](std::function<void()> body) {
        if (created.fetch_add(1) >= 1) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        return std::thread(std::move(body));
    });
    pool.Submit([&] {
        started.Open();
        gate.Wait();
    });
    started.Wait();

    EXPECT_THROW(pool.Submit([&ran] { ran.fetch_add(1); }), SchedulingError);
    EXPECT_EQ(pool.QueuedTasks(), 0u);
    EXPECT_EQ(pool.ThreadCount(), 1u);
    EXPECT_TRUE(pool.Accepting());

    gate.Open();
    pool.Shutdown();
    EXPECT_EQ(ran.load(), 0);
}

TEST(WorkerPoolTest, SubmitsRightAfterStartUseCoreWorkers) {
    WorkerPool pool(2, 8);
    pool.Submit([] {});
    pool.Submit([] {});
    EXPECT_EQ(pool.ThreadCount(), 2u);
    pool.Shutdown();
}

TEST(WorkerPoolTest, GrownWorkersRetireWhenIdle) {
    Gate gate;
    std::mutex mutex;
    std::condition_variable started_cv;
    int started = 0;
    std::atomic<int> counter{0};
    WorkerPool pool(1, 4, std::chrono::milliseconds(50));

    for (int i = 0; i < 3; ++i) {
        pool.Submit([&] {
            {
                std::lock_guard<std::mutex> lock(mutex);
                ++started;
            }
            started_cv.notify_all();
            gate.Wait();
        });
    }
    {
        std::unique_lock<std::mutex> lock(mutex);
        EXPECT_TRUE(started_cv.wait_for(lock, std::chrono::seconds(5), [&] { return started == 3; }));
    }
    EXPECT_GE(pool.ThreadCount(), 3u);
    gate.Open();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (pool.ThreadCount() > 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(pool.ThreadCount(), 1u);

    pool.Submit([&counter] { counter.fetch_add(1); });
    pool.Shutdown();
    EXPECT_EQ(counter.load(), 1);
}
