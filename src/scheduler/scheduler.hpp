#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "config/config_schema.hpp"
#include "scheduler/job_dispatcher.hpp"
#include "scheduler/job_registry.hpp"

namespace cronkit::scheduler {

// In-memory scheduler for time and cron based jobs.
//
// Named jobs are unique: adding a job under a name that is already scheduled
// cancels the old job and installs the new one in a single step. Jobs without a
// name cannot be removed and disappear once their trigger is exhausted.
//
// Registration is allowed before Start(); after Stop() every registration fails
// with SchedulingError (the boolean forms return false).
class Scheduler {
public:
    explicit Scheduler(config::SchedulerConfig config = {}, ExecutionErrorHandler on_error = {});
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void Start();
    // Cancels all jobs and waits for runs already dispatched to finish. May be
    // called from inside a job; that job's own run is the only one not waited for
    // there, and a later Stop() or the destructor waits for it as well.
    void Stop();
    bool IsRunning() const { return running_.load(); }

    // Cron job. Throws InvalidArgumentError if the expression can't be parsed or
    // the job has an unusable type, SchedulingError if it can't be scheduled.
    void AddJob(const std::string& name,
                JobTask job,
                const JobConfig& config,
                const std::string& scheduling_expression,
                bool can_run_concurrently);

    // Periodic job, first started when the period has passed.
    void AddPeriodicJob(const std::string& name,
                        JobTask job,
                        const JobConfig& config,
                        Duration period,
                        bool can_run_concurrently);

    // Fires an anonymous job immediately and only once.
    void FireJob(JobTask job, const JobConfig& config);

    // Fires an anonymous job immediately, times (> 1) times, period apart.
    // Returns false instead of throwing if the job could not be added.
    bool FireJob(JobTask job, const JobConfig& config, int times, Duration period);

    // Fires a job once at date, or immediately if date has passed.
    void FireJobAt(const std::string& name, JobTask job, const JobConfig& config, TimePoint date);

    // Fires a job at date and then times - 1 more times, period apart.
    // Returns false instead of throwing if the job could not be added.
    bool FireJobAt(const std::string& name,
                   JobTask job,
                   const JobConfig& config,
                   TimePoint date,
                   int times,
                   Duration period);

    // Throws NotFoundError if no job is scheduled under name.
    void RemoveJob(const std::string& name);

    // Registers a job from the scheduler.* keys of its config: an expression makes
    // a cron job, otherwise a period makes a periodic job.
    void AddJobFromConfig(JobTask job, const JobConfig& config);

    // General registration behind all of the above.
    void Schedule(const std::string& name,
                  JobTask job,
                  const JobConfig& config,
                  const Trigger& trigger,
                  bool can_run_concurrently);

    std::vector<JobInfo> ListJobs() const;
    std::optional<JobInfo> GetJob(const std::string& name) const;
    SchedulerStatus GetStatus() const;

private:
    enum class Phase {
        kIdle,
        kRunning,
        kStopped
    };

    void RunLoop();
    void FireDue(TimePoint now);
    void Fire(const JobRegistry::EntryPtr& entry, TimePoint now);
    void Wake();
    static JobInfo Snapshot(const ScheduleEntry& entry);

    config::SchedulerConfig config_;
    JobDispatcher dispatcher_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    JobRegistry registry_;
    Phase phase_ = Phase::kIdle;
    std::uint64_t generation_ = 0;

    std::atomic<bool> running_{false};
    std::thread loop_;
};

}  // namespace cronkit::scheduler
