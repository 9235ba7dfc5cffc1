#include "scheduler/scheduler.hpp"

#include <algorithm>
#include <utility>

#include "scheduler/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace cronkit::scheduler {
namespace {

std::string DisplayName(const std::string& name) {
    return name.empty() ? std::string("(anonymous)") : name;
}

std::optional<std::string> ConfigString(const JobConfig& config, const char* key) {
    auto it = config.find(key);
    if (it == config.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<bool> ConfigBool(const JobConfig& config, const char* key) {
    auto it = config.find(key);
    if (it == config.end() || !it->is_boolean()) {
        return std::nullopt;
    }
    return it->get<bool>();
}

void WarnMismatch(const std::string& name, const char* key, const std::string& given, const std::string& configured) {
    utils::LogMessage message{utils::LogLevel::kWarn, "config value ignored, explicit parameter wins", {}};
    message.fields["name"] = DisplayName(name);
    message.fields["key"] = key;
    message.fields["param"] = given;
    message.fields["config"] = configured;
    utils::Log("scheduler", message);
}

std::string ResolveName(const std::string& name, const JobConfig& config) {
    const auto configured = ConfigString(config, kPropertyName);
    if (name.empty()) {
        return configured.value_or(std::string());
    }
    if (configured.has_value() && *configured != name) {
        WarnMismatch(name, kPropertyName, name, *configured);
    }
    return name;
}

std::string ResolveExpression(const std::string& name, const std::string& expression, const JobConfig& config) {
    const auto configured = ConfigString(config, kPropertyExpression);
    if (expression.empty()) {
        return configured.value_or(std::string());
    }
    if (configured.has_value() && *configured != expression) {
        WarnMismatch(name, kPropertyExpression, expression, *configured);
    }
    return expression;
}

void CheckPeriod(const std::string& name, Duration period, const JobConfig& config) {
    const auto configured = ConfigPeriod(config);
    if (configured.has_value() && *configured != period) {
        WarnMismatch(name, kPropertyPeriod, std::to_string(period.count()) + "ms",
                     std::to_string(configured->count()) + "ms");
    }
}

void CheckConcurrent(const std::string& name, bool concurrent, const JobConfig& config) {
    const auto configured = ConfigBool(config, kPropertyConcurrent);
    if (configured.has_value() && *configured != concurrent) {
        WarnMismatch(name, kPropertyConcurrent, concurrent ? "true" : "false", *configured ? "true" : "false");
    }
}

}  // namespace

Scheduler::Scheduler(config::SchedulerConfig config, ExecutionErrorHandler on_error)
    : config_(std::move(config))
    , dispatcher_(static_cast<std::size_t>(std::max(config_.worker_threads, 1)),
                  static_cast<std::size_t>(std::max(config_.max_worker_threads, 0)),
                  std::move(on_error)) {}

Scheduler::~Scheduler() {
    Stop();
}

void Scheduler::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ == Phase::kStopped) {
        throw SchedulingError("scheduler cannot be restarted after Stop()");
    }
    if (phase_ == Phase::kRunning) {
        return;
    }
    phase_ = Phase::kRunning;
    running_ = true;
    loop_ = std::thread([this]() { RunLoop(); });
    utils::Log(utils::LogLevel::kInfo, "scheduler",
               "started jobs=" + std::to_string(registry_.Size()) +
               " workers=" + std::to_string(config_.worker_threads));
}

void Scheduler::Stop() {
    bool stopping_now = false;
    std::thread loop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ != Phase::kStopped) {
            phase_ = Phase::kStopped;
            running_ = false;
            registry_.Clear();
            ++generation_;
            stopping_now = true;
        }
        loop.swap(loop_);
    }
    wake_.notify_all();
    if (loop.joinable()) {
        loop.join();
    }
    // Every caller waits for the drain, not only the one that stopped the loop.
    dispatcher_.Shutdown();
    if (stopping_now) {
        utils::Log(utils::LogLevel::kInfo, "scheduler", "stopped");
    }
}

void Scheduler::AddJob(const std::string& name,
                       JobTask job,
                       const JobConfig& config,
                       const std::string& scheduling_expression,
                       bool can_run_concurrently) {
    ValidateConfig(config);
    const auto resolved_name = ResolveName(name, config);
    const auto expression = ResolveExpression(resolved_name, scheduling_expression, config);
    if (expression.empty()) {
        throw InvalidArgumentError("no scheduling expression given for job '" + DisplayName(resolved_name) + "'");
    }
    CheckConcurrent(resolved_name, can_run_concurrently, config);
    Schedule(resolved_name, std::move(job), config, Trigger::Cron(expression), can_run_concurrently);
}

void Scheduler::AddPeriodicJob(const std::string& name,
                               JobTask job,
                               const JobConfig& config,
                               Duration period,
                               bool can_run_concurrently) {
    ValidateConfig(config);
    const auto resolved_name = ResolveName(name, config);
    CheckPeriod(resolved_name, period, config);
    CheckConcurrent(resolved_name, can_run_concurrently, config);
    Schedule(resolved_name, std::move(job), config, Trigger::Periodic(period), can_run_concurrently);
}

void Scheduler::FireJob(JobTask job, const JobConfig& config) {
    ValidateConfig(config);
    const bool concurrent = ConfigBool(config, kPropertyConcurrent).value_or(true);
    Schedule(std::string(), std::move(job), config, Trigger::Immediate(), concurrent);
}

bool Scheduler::FireJob(JobTask job, const JobConfig& config, int times, Duration period) {
    try {
        ValidateConfig(config);
        const bool concurrent = ConfigBool(config, kPropertyConcurrent).value_or(true);
        Schedule(std::string(), std::move(job), config, Trigger::ImmediateRepeat(times, period), concurrent);
        return true;
    } catch (const InvalidArgumentError& ex) {
        utils::Log(utils::LogLevel::kWarn, "scheduler", std::string("fire job rejected: ") + ex.what());
    } catch (const SchedulingError& ex) {
        utils::Log(utils::LogLevel::kWarn, "scheduler", std::string("fire job rejected: ") + ex.what());
    }
    return false;
}

void Scheduler::FireJobAt(const std::string& name, JobTask job, const JobConfig& config, TimePoint date) {
    ValidateConfig(config);
    const bool concurrent = ConfigBool(config, kPropertyConcurrent).value_or(true);
    Schedule(ResolveName(name, config), std::move(job), config, Trigger::At(date), concurrent);
}

bool Scheduler::FireJobAt(const std::string& name,
                          JobTask job,
                          const JobConfig& config,
                          TimePoint date,
                          int times,
                          Duration period) {
    try {
        ValidateConfig(config);
        const bool concurrent = ConfigBool(config, kPropertyConcurrent).value_or(true);
        Schedule(ResolveName(name, config), std::move(job), config, Trigger::RepeatAt(date, times, period), concurrent);
        return true;
    } catch (const InvalidArgumentError& ex) {
        utils::Log(utils::LogLevel::kWarn, "scheduler", std::string("fire job at rejected: ") + ex.what());
    } catch (const SchedulingError& ex) {
        utils::Log(utils::LogLevel::kWarn, "scheduler", std::string("fire job at rejected: ") + ex.what());
    }
    return false;
}

void Scheduler::RemoveJob(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        registry_.Remove(name);
        ++generation_;
    }
    wake_.notify_all();
    utils::Log(utils::LogLevel::kInfo, "scheduler", "removed name=" + name);
}

void Scheduler::AddJobFromConfig(JobTask job, const JobConfig& config) {
    ValidateConfig(config);
    const auto name = ConfigString(config, kPropertyName).value_or(std::string());
    const bool concurrent = ConfigBool(config, kPropertyConcurrent).value_or(true);
    const auto expression = ConfigString(config, kPropertyExpression);
    if (expression.has_value() && !expression->empty()) {
        AddJob(name, std::move(job), config, *expression, concurrent);
        return;
    }
    const auto period = ConfigPeriod(config);
    if (period.has_value()) {
        AddPeriodicJob(name, std::move(job), config, *period, concurrent);
        return;
    }
    throw InvalidArgumentError("job config for '" + DisplayName(name) + "' has neither " +
                               kPropertyExpression + " nor " + kPropertyPeriod);
}

void Scheduler::Schedule(const std::string& name,
                         JobTask job,
                         const JobConfig& config,
                         const Trigger& trigger,
                         bool can_run_concurrently) {
    ValidateTask(job);
    ValidateConfig(config);
    auto entry = std::make_shared<ScheduleEntry>(
        name,
        trigger,
        std::move(job),
        config.is_null() ? JobConfig::object() : config,
        can_run_concurrently);

    JobRegistry::EntryPtr replaced;
    std::optional<TimePoint> first_fire;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ == Phase::kStopped) {
            throw SchedulingError("scheduler is stopped, job '" + DisplayName(name) + "' not scheduled");
        }
        entry->fire = InitialState(entry->trigger, Clock::now());
        replaced = registry_.Add(entry);
        first_fire = entry->fire.next_fire;
        ++generation_;
    }
    wake_.notify_all();

    utils::LogMessage message{utils::LogLevel::kInfo, replaced ? "replaced job" : "added job", {}};
    message.fields["name"] = DisplayName(name);
    message.fields["trigger"] = entry->trigger.Describe();
    message.fields["concurrent"] = can_run_concurrently ? "true" : "false";
    message.fields["first"] = utils::FormatIso(*first_fire);
    utils::Log("scheduler", message);
}

std::vector<JobInfo> Scheduler::ListJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobInfo> jobs;
    for (const auto& entry : registry_.Entries()) {
        jobs.push_back(Snapshot(*entry));
    }
    return jobs;
}

std::optional<JobInfo> Scheduler::GetJob(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto entry = registry_.Find(name);
    if (!entry) {
        return std::nullopt;
    }
    return Snapshot(*entry);
}

SchedulerStatus Scheduler::GetStatus() const {
    SchedulerStatus status{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status.running = phase_ == Phase::kRunning;
        status.jobs = registry_.Size();
        status.next_wake = registry_.NextDeadline();
    }
    status.worker_threads = dispatcher_.ThreadCount();
    status.queued_runs = dispatcher_.QueuedRuns();
    return status;
}

void Scheduler::RunLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (phase_ == Phase::kRunning) {
        const auto seen = generation_;
        const auto woken = [this, seen]() {
            return phase_ != Phase::kRunning || generation_ != seen;
        };
        const auto deadline = registry_.NextDeadline();
        if (!deadline.has_value()) {
            wake_.wait(lock, woken);
            continue;
        }
        if (Clock::now() < *deadline && wake_.wait_until(lock, *deadline, woken)) {
            continue;
        }
        FireDue(Clock::now());
    }
}

void Scheduler::FireDue(TimePoint now) {
    for (const auto& entry : registry_.TakeDue(now)) {
        Fire(entry, now);
    }
}

void Scheduler::Fire(const JobRegistry::EntryPtr& entry, TimePoint now) {
    const TimePoint scheduled = *entry->fire.next_fire;
    if (entry->guard.TryAcquire()) {
        try {
            dispatcher_.Dispatch(entry, scheduled, entry->fire_count + 1);
            ++entry->fire_count;
        } catch (const SchedulingError& ex) {
            ++entry->skip_count;
            utils::Log(utils::LogLevel::kError, "scheduler",
                       "dispatch refused name=" + DisplayName(entry->name) + ": " + ex.what());
        }
    } else {
        ++entry->skip_count;
        utils::Log(utils::LogLevel::kInfo, "scheduler",
                   "skipped name=" + DisplayName(entry->name) + ", previous run still in progress");
    }

    Advance(entry->trigger, entry->fire, now);
    if (entry->fire.Exhausted()) {
        if (!entry->trigger.IsBounded()) {
            utils::Log(utils::LogLevel::kWarn, "scheduler",
                       "no further fire time for name=" + DisplayName(entry->name) +
                       " trigger=" + entry->trigger.Describe());
        }
        registry_.Retire(entry);
        return;
    }
    registry_.Rearm(entry);
}

JobInfo Scheduler::Snapshot(const ScheduleEntry& entry) {
    JobInfo info;
    info.name = entry.name;
    info.kind = entry.trigger.Kind();
    info.trigger = entry.trigger.Describe();
    info.next_fire = entry.fire.next_fire;
    info.remaining = entry.fire.remaining;
    info.fire_count = entry.fire_count;
    info.skip_count = entry.skip_count;
    info.in_flight = entry.guard.InFlight();
    info.allow_concurrent = entry.guard.AllowConcurrent();
    info.state = entry.state.load();
    if (info.state == EntryState::Scheduled && entry.guard.Busy()) {
        info.state = EntryState::Blocked;
    }
    return info;
}

}  // namespace cronkit::scheduler
