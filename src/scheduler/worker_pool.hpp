#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace cronkit::scheduler {

// FIFO thread pool. core_threads workers start eagerly; when every worker is busy
// a new one is spawned, up to max_threads (0 = unbounded), so a hung job does not
// hold back the others. Workers above the core size exit after idling for
// idle_keep_alive.
class WorkerPool {
public:
    using ThreadFactory = std::function<std::thread(std::function<void()>)>;

    static constexpr std::chrono::milliseconds kDefaultIdleKeepAlive{60000};

    // Throws SchedulingError if the core workers can't be started.
    WorkerPool(std::size_t core_threads,
               std::size_t max_threads,
               std::chrono::milliseconds idle_keep_alive = kDefaultIdleKeepAlive,
               ThreadFactory thread_factory = {});
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Throws SchedulingError once the pool is shutting down, or when a needed
    // worker thread can't be created. A refused task is not queued.
    void Submit(std::function<void()> task);

    // Stops accepting work and returns once queued and running tasks are done and
    // every worker has exited. Safe to call repeatedly and from several threads.
    // Called from a task, it waits for all workers but the caller's own, which
    // exits after the task returns; the destructor waits for that one too.
    void Shutdown();

    bool Accepting() const;
    std::size_t ThreadCount() const;
    std::size_t QueuedTasks() const;

private:
    void SpawnWorker();
    void WorkerLoop();
    void DetachSelf();
    void WaitForWorkers(std::unique_lock<std::mutex>& lock, std::size_t remaining);

    const std::size_t core_threads_;
    const std::size_t max_threads_;
    const std::chrono::milliseconds idle_keep_alive_;
    const ThreadFactory thread_factory_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable drained_;
    std::queue<std::function<void()>> tasks_;
    std::vector<std::thread> workers_;
    // Workers not running a task, including ones spawned but not yet waiting.
    std::size_t idle_ = 0;
    // Worker threads that have not yet left WorkerLoop.
    std::size_t live_ = 0;
    bool stopping_ = false;
};

}  // namespace cronkit::scheduler
