#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

#include "scheduler/execution_guard.hpp"
#include "scheduler/job.hpp"
#include "scheduler/trigger.hpp"

namespace cronkit::scheduler {

// Registry unit of state. trigger, task, config and the concurrency policy are
// fixed at construction; fire state and counters belong to the scheduler loop and
// are only touched under the scheduler mutex.
struct ScheduleEntry {
    ScheduleEntry(std::string entry_name,
                  Trigger entry_trigger,
                  JobTask entry_task,
                  JobConfig entry_config,
                  bool allow_concurrent)
        : name(std::move(entry_name))
        , trigger(std::move(entry_trigger))
        , task(std::move(entry_task))
        , config(std::move(entry_config))
        , guard(allow_concurrent) {}

    const std::string name;
    const Trigger trigger;
    const JobTask task;
    const JobConfig config;
    ExecutionGuard guard;

    std::uint64_t sequence = 0;
    TriggerState fire;
    std::uint64_t fire_count = 0;
    std::uint64_t skip_count = 0;
    std::atomic<EntryState> state{EntryState::Scheduled};

    bool Anonymous() const { return name.empty(); }
    bool Armed() const {
        const auto current = state.load();
        return current != EntryState::Retired && current != EntryState::Cancelled;
    }
};

}  // namespace cronkit::scheduler
