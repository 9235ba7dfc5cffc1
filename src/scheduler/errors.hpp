#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace cronkit::scheduler {

// Malformed expression, out-of-range trigger parameter, unusable task or config.
class InvalidArgumentError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// RemoveJob on a name that is not registered.
class NotFoundError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// The engine refused to admit an entry (stopped scheduler, pool not accepting work).
class SchedulingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A unit of work failed while firing. Built by the dispatcher, never thrown into the loop.
class ExecutionError : public std::runtime_error {
public:
    ExecutionError(std::string job_name,
                   std::string cause,
                   std::chrono::system_clock::time_point scheduled_at)
        : std::runtime_error("job '" + (job_name.empty() ? std::string("(anonymous)") : job_name) +
                             "' failed: " + cause)
        , job_name_(std::move(job_name))
        , cause_(std::move(cause))
        , scheduled_at_(scheduled_at) {}

    const std::string& JobName() const { return job_name_; }
    const std::string& Cause() const { return cause_; }
    std::chrono::system_clock::time_point ScheduledAt() const { return scheduled_at_; }

private:
    std::string job_name_;
    std::string cause_;
    std::chrono::system_clock::time_point scheduled_at_;
};

}  // namespace cronkit::scheduler
