#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace cronkit::scheduler {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

// Opaque per-job payload. Must be null or a flat object of scalar values.
using JobConfig = nlohmann::json;

constexpr const char* kPropertyPeriod = "scheduler.period";
constexpr const char* kPropertyExpression = "scheduler.expression";
constexpr const char* kPropertyConcurrent = "scheduler.concurrent";
constexpr const char* kPropertyName = "scheduler.name";

enum class TriggerKind {
    Cron,
    Periodic,
    OneShotAt,
    RepeatAt,
    Immediate,
    ImmediateRepeat
};

enum class EntryState {
    Scheduled,
    Blocked,
    Retired,
    Cancelled
};

inline const char* ToString(TriggerKind kind) {
    switch (kind) {
        case TriggerKind::Cron: return "cron";
        case TriggerKind::Periodic: return "periodic";
        case TriggerKind::OneShotAt: return "at";
        case TriggerKind::RepeatAt: return "repeat_at";
        case TriggerKind::Immediate: return "immediate";
        case TriggerKind::ImmediateRepeat: return "immediate_repeat";
    }
    return "unknown";
}

inline const char* ToString(EntryState state) {
    switch (state) {
        case EntryState::Scheduled: return "scheduled";
        case EntryState::Blocked: return "blocked";
        case EntryState::Retired: return "retired";
        case EntryState::Cancelled: return "cancelled";
    }
    return "unknown";
}

struct JobInfo {
    std::string name;
    TriggerKind kind = TriggerKind::Immediate;
    std::string trigger;
    std::optional<TimePoint> next_fire;
    std::optional<int> remaining;
    std::uint64_t fire_count = 0;
    std::uint64_t skip_count = 0;
    int in_flight = 0;
    bool allow_concurrent = true;
    EntryState state = EntryState::Scheduled;
};

struct SchedulerStatus {
    bool running = false;
    std::size_t jobs = 0;
    std::optional<TimePoint> next_wake;
    std::size_t worker_threads = 0;
    std::size_t queued_runs = 0;
};

}  // namespace cronkit::scheduler
