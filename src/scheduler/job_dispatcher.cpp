#include "scheduler/job_dispatcher.hpp"

#include <exception>
#include <string>
#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace cronkit::scheduler {
namespace {

std::string DisplayName(const ScheduleEntry& entry) {
    return entry.Anonymous() ? std::string("(anonymous)") : entry.name;
}

}  // namespace

JobDispatcher::JobDispatcher(std::size_t core_threads, std::size_t max_threads, ExecutionErrorHandler on_error)
    : on_error_(std::move(on_error))
    , pool_(core_threads, max_threads) {}

void JobDispatcher::Dispatch(const std::shared_ptr<ScheduleEntry>& entry,
                             TimePoint scheduled_at,
                             std::uint64_t fire_number) {
    try {
        pool_.Submit([this, entry, scheduled_at, fire_number]() {
            Run(entry, scheduled_at, fire_number);
        });
    } catch (const SchedulingError&) {
        entry->guard.Release();
        throw;
    }
}

void JobDispatcher::Shutdown() {
    pool_.Shutdown();
}

void JobDispatcher::Run(const std::shared_ptr<ScheduleEntry>& entry,
                        TimePoint scheduled_at,
                        std::uint64_t fire_number) {
    ScopedExecution execution(entry->guard);
    const JobContext context{entry->name, entry->config, scheduled_at, Clock::now(), fire_number};
    utils::Log(utils::LogLevel::kDebug, "dispatch",
               "start name=" + DisplayName(*entry) + " fire=" + std::to_string(fire_number) +
               " scheduled=" + utils::FormatIso(scheduled_at));
    try {
        RunTask(entry->task, context);
    } catch (const std::exception& ex) {
        Report(ExecutionError(entry->name, ex.what(), scheduled_at));
        return;
    } catch (...) {
        Report(ExecutionError(entry->name, "unknown error", scheduled_at));
        return;
    }
    utils::Log(utils::LogLevel::kDebug, "dispatch",
               "end name=" + DisplayName(*entry) + " fire=" + std::to_string(fire_number));
}

void JobDispatcher::Report(const ExecutionError& error) {
    utils::LogMessage message{utils::LogLevel::kError, error.what(), {}};
    message.fields["scheduled"] = utils::FormatIso(error.ScheduledAt());
    utils::Log("dispatch", message);
    if (!on_error_) {
        return;
    }
    try {
        on_error_(error);
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "dispatch", std::string("error handler failed: ") + ex.what());
    } catch (...) {
        utils::Log(utils::LogLevel::kError, "dispatch", "error handler failed: unknown error");
    }
}

}  // namespace cronkit::scheduler
