#include "scheduler/worker_pool.hpp"

#include <algorithm>
#include <string>
#include <system_error>
#include <utility>

#include "scheduler/errors.hpp"
#include "utils/logging.hpp"

namespace cronkit::scheduler {
namespace {

// Pool whose WorkerLoop runs on this thread, if any.
thread_local const WorkerPool* current_pool = nullptr;

}  // namespace

WorkerPool::WorkerPool(std::size_t core_threads,
                       std::size_t max_threads,
                       std::chrono::milliseconds idle_keep_alive,
                       ThreadFactory thread_factory)
    : core_threads_(core_threads)
    , max_threads_(max_threads == 0 ? 0 : std::max(max_threads, core_threads))
    , idle_keep_alive_(idle_keep_alive)
    , thread_factory_(std::move(thread_factory)) {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        for (std::size_t i = 0; i < core_threads; ++i) {
            SpawnWorker();
        }
    } catch (const std::system_error& ex) {
        Shutdown();
        throw SchedulingError(std::string("cannot start worker thread: ") + ex.what());
    }
}

WorkerPool::~WorkerPool() {
    Shutdown();
}

void WorkerPool::Submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw SchedulingError("worker pool is shut down");
        }
        const bool can_grow = max_threads_ == 0 || live_ < max_threads_;
        if (tasks_.size() >= idle_ && can_grow) {
            try {
                SpawnWorker();
            } catch (const std::system_error& ex) {
                utils::Log(utils::LogLevel::kError, "pool",
                           std::string("worker thread not started: ") + ex.what());
                throw SchedulingError(std::string("cannot start worker thread: ") + ex.what());
            }
        }
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
}

void WorkerPool::Shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        workers.swap(workers_);
    }
    condition_.notify_all();
    for (auto& worker : workers) {
        if (worker.get_id() == std::this_thread::get_id()) {
            // Shutdown requested from inside a task; that worker exits after the task returns.
            worker.detach();
            continue;
        }
        if (worker.joinable()) {
            worker.join();
        }
    }
    std::unique_lock<std::mutex> lock(mutex_);
    WaitForWorkers(lock, current_pool == this ? 1 : 0);
}

bool WorkerPool::Accepting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

std::size_t WorkerPool::ThreadCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_;
}

std::size_t WorkerPool::QueuedTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::SpawnWorker() {
    std::function<void()> body = [this] { WorkerLoop(); };
    workers_.push_back(thread_factory_ ? thread_factory_(std::move(body)) : std::thread(std::move(body)));
    ++idle_;
    ++live_;
    utils::Log(utils::LogLevel::kDebug, "pool", "worker started threads=" + std::to_string(live_));
}

void WorkerPool::WorkerLoop() {
    current_pool = this;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        const bool woken = condition_.wait_for(lock, idle_keep_alive_, [this] {
            return stopping_ || !tasks_.empty();
        });
        if (!woken) {
            if (live_ > core_threads_) {
                --idle_;
                DetachSelf();
                utils::Log(utils::LogLevel::kDebug, "pool", "idle worker retired threads=" + std::to_string(live_ - 1));
                break;
            }
            continue;
        }
        --idle_;
        if (tasks_.empty()) {
            break;
        }
        auto task = std::move(tasks_.front());
        tasks_.pop();
        lock.unlock();
        if (task) {
            task();
        }
        lock.lock();
        ++idle_;
    }
    --live_;
    drained_.notify_all();
}

void WorkerPool::DetachSelf() {
    const auto self = std::this_thread::get_id();
    auto it = std::find_if(workers_.begin(), workers_.end(), [self](const std::thread& worker) {
        return worker.get_id() == self;
    });
    if (it != workers_.end()) {
        it->detach();
        workers_.erase(it);
    }
}

void WorkerPool::WaitForWorkers(std::unique_lock<std::mutex>& lock, std::size_t remaining) {
    drained_.wait(lock, [this, remaining] { return live_ <= remaining; });
}

}  // namespace cronkit::scheduler
