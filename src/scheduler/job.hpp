#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "scheduler/scheduler_types.hpp"

namespace cronkit::scheduler {

struct JobContext {
    std::string name;
    const JobConfig& config;
    TimePoint scheduled_at;
    TimePoint fired_at;
    std::uint64_t fire_number = 0;
};

// Config-aware unit of work.
class Job {
public:
    virtual ~Job() = default;
    virtual void Execute(const JobContext& context) = 0;
};

// Config-ignorant unit of work.
using Runnable = std::function<void()>;

using JobTask = std::variant<std::shared_ptr<Job>, Runnable>;

std::shared_ptr<Job> MakeJob(std::function<void(const JobContext&)> fn);

// Throws InvalidArgumentError for a null Job or an empty Runnable.
void ValidateTask(const JobTask& task);

// Throws InvalidArgumentError unless config is null or a flat object of scalars.
void ValidateConfig(const JobConfig& config);

// scheduler.period of config, given in seconds and rounded to the nearest
// millisecond; nullopt when absent or not a number.
std::optional<Duration> ConfigPeriod(const JobConfig& config);

void RunTask(const JobTask& task, const JobContext& context);

}  // namespace cronkit::scheduler
