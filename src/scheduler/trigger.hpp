#pragma once

#include <memory>
#include <optional>
#include <string>

#include "croncpp.h"

#include "scheduler/scheduler_types.hpp"

namespace cronkit::scheduler {

// Temporal rule of an entry. Immutable; the factories validate eagerly and throw
// InvalidArgumentError, so evaluation never fails later.
class Trigger {
public:
    static Trigger Cron(const std::string& expression);
    static Trigger Periodic(Duration period, bool start_after_first_period = true);
    static Trigger At(TimePoint date);
    static Trigger RepeatAt(TimePoint date, int times, Duration period);
    static Trigger Immediate();
    static Trigger ImmediateRepeat(int times, Duration period);

    TriggerKind Kind() const { return kind_; }
    const std::string& Expression() const { return expression_; }
    Duration Period() const { return period_; }
    std::optional<TimePoint> Date() const { return date_; }
    int Times() const { return times_; }
    bool StartAfterFirstPeriod() const { return start_after_first_period_; }

    // Bounded triggers retire on their own; Cron and Periodic run until cancelled.
    bool IsBounded() const;
    std::string Describe() const;

    // Next cron match strictly after reference; nullopt when the expression has none.
    std::optional<TimePoint> NextCronMatch(TimePoint reference) const;

private:
    explicit Trigger(TriggerKind kind) : kind_(kind) {}

    TriggerKind kind_;
    std::string expression_;
    std::shared_ptr<const ::cron::cronexpr> cron_;
    Duration period_{0};
    std::optional<TimePoint> date_;
    int times_ = 1;
    bool start_after_first_period_ = true;
};

// Runtime fire tracking of one entry. No next_fire means exhausted.
struct TriggerState {
    std::optional<TimePoint> next_fire;
    // Fires left including next_fire; unset for unbounded triggers.
    std::optional<int> remaining;

    bool Exhausted() const { return !next_fire.has_value(); }
};

// State of a trigger registered at now.
TriggerState InitialState(const Trigger& trigger, TimePoint now);

// Consumes the pending slot (fired or skipped) and computes the next one. A slot
// that is already in the past is never replayed: the next fire is the first
// cadence point strictly after now.
void Advance(const Trigger& trigger, TriggerState& state, TimePoint now);

}  // namespace cronkit::scheduler
