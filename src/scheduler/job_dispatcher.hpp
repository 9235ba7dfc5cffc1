#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include "scheduler/errors.hpp"
#include "scheduler/schedule_entry.hpp"
#include "scheduler/worker_pool.hpp"

namespace cronkit::scheduler {

using ExecutionErrorHandler = std::function<void(const ExecutionError&)>;

// Runs fired entries on the worker pool. Whatever a job throws ends here: it is
// logged, handed to the error handler and never reaches the scheduler loop.
class JobDispatcher {
public:
    JobDispatcher(std::size_t core_threads, std::size_t max_threads, ExecutionErrorHandler on_error = {});

    // The caller has acquired entry->guard; it is released when the run ends, or
    // immediately if the pool refuses the run (SchedulingError is rethrown).
    void Dispatch(const std::shared_ptr<ScheduleEntry>& entry,
                  TimePoint scheduled_at,
                  std::uint64_t fire_number);

    void Shutdown();

    std::size_t ThreadCount() const { return pool_.ThreadCount(); }
    std::size_t QueuedRuns() const { return pool_.QueuedTasks(); }

private:
    void Run(const std::shared_ptr<ScheduleEntry>& entry,
             TimePoint scheduled_at,
             std::uint64_t fire_number);
    void Report(const ExecutionError& error);

    ExecutionErrorHandler on_error_;
    WorkerPool pool_;
};

}  // namespace cronkit::scheduler
