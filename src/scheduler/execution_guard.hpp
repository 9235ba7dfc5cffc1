#pragma once

#include <atomic>

namespace cronkit::scheduler {

// Per-entry gate for overlapping runs. A concurrent entry always passes; a
// non-concurrent one admits a single run and the loop skips fires that find it held.
class ExecutionGuard {
public:
    explicit ExecutionGuard(bool allow_concurrent)
        : allow_concurrent_(allow_concurrent) {}

    ExecutionGuard(const ExecutionGuard&) = delete;
    ExecutionGuard& operator=(const ExecutionGuard&) = delete;

    bool TryAcquire() {
        if (!allow_concurrent_) {
            bool expected = false;
            if (!held_.compare_exchange_strong(expected, true)) {
                return false;
            }
        }
        in_flight_.fetch_add(1);
        return true;
    }

    void Release() {
        in_flight_.fetch_sub(1);
        if (!allow_concurrent_) {
            held_.store(false);
        }
    }

    bool AllowConcurrent() const { return allow_concurrent_; }
    bool Busy() const { return !allow_concurrent_ && held_.load(); }
    int InFlight() const { return in_flight_.load(); }

private:
    const bool allow_concurrent_;
    std::atomic<bool> held_{false};
    std::atomic<int> in_flight_{0};
};

// Releases an acquired guard when the run ends.
class ScopedExecution {
public:
    explicit ScopedExecution(ExecutionGuard& guard) : guard_(guard) {}
    ~ScopedExecution() { guard_.Release(); }

    ScopedExecution(const ScopedExecution&) = delete;
    ScopedExecution& operator=(const ScopedExecution&) = delete;

private:
    ExecutionGuard& guard_;
};

}  // namespace cronkit::scheduler
