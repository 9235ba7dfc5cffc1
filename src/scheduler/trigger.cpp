#include "scheduler/trigger.hpp"

#include <algorithm>
#include <ctime>
#include <sstream>

#include "scheduler/errors.hpp"
#include "utils/common.hpp"

namespace cronkit::scheduler {
namespace {

void RequirePositivePeriod(Duration period) {
    if (period.count() <= 0) {
        throw InvalidArgumentError("period must be greater than zero, got " +
                                   std::to_string(period.count()) + "ms");
    }
}

void RequireRepeatTimes(int times) {
    if (times <= 1) {
        throw InvalidArgumentError("times must be greater than 1, got " + std::to_string(times));
    }
}

// First point of the cadence base + k*period that lies strictly after now.
TimePoint NextCadencePoint(TimePoint base, Duration period, TimePoint now) {
    if (base > now) {
        return base;
    }
    const auto elapsed = std::chrono::duration_cast<Duration>(now - base);
    const auto steps = elapsed.count() / period.count() + 1;
    return base + period * steps;
}

}  // namespace

Trigger Trigger::Cron(const std::string& expression) {
    Trigger trigger(TriggerKind::Cron);
    try {
        trigger.cron_ = std::make_shared<const ::cron::cronexpr>(::cron::make_cron(expression));
    } catch (const ::cron::bad_cronexpr& ex) {
        throw InvalidArgumentError("invalid cron expression '" + expression + "': " + ex.what());
    } catch (const std::exception& ex) {
        throw InvalidArgumentError("invalid cron expression '" + expression + "': " + ex.what());
    }
    trigger.expression_ = expression;
    return trigger;
}

Trigger Trigger::Periodic(Duration period, bool start_after_first_period) {
    RequirePositivePeriod(period);
    Trigger trigger(TriggerKind::Periodic);
    trigger.period_ = period;
    trigger.start_after_first_period_ = start_after_first_period;
    return trigger;
}

Trigger Trigger::At(TimePoint date) {
    Trigger trigger(TriggerKind::OneShotAt);
    trigger.date_ = date;
    return trigger;
}

Trigger Trigger::RepeatAt(TimePoint date, int times, Duration period) {
    RequireRepeatTimes(times);
    RequirePositivePeriod(period);
    Trigger trigger(TriggerKind::RepeatAt);
    trigger.date_ = date;
    trigger.times_ = times;
    trigger.period_ = period;
    return trigger;
}

Trigger Trigger::Immediate() {
    return Trigger(TriggerKind::Immediate);
}

Trigger Trigger::ImmediateRepeat(int times, Duration period) {
    RequireRepeatTimes(times);
    RequirePositivePeriod(period);
    Trigger trigger(TriggerKind::ImmediateRepeat);
    trigger.times_ = times;
    trigger.period_ = period;
    return trigger;
}

bool Trigger::IsBounded() const {
    return kind_ != TriggerKind::Cron && kind_ != TriggerKind::Periodic;
}

std::string Trigger::Describe() const {
    std::ostringstream out;
    out << ToString(kind_);
    switch (kind_) {
        case TriggerKind::Cron:
            out << " '" << expression_ << "'";
            break;
        case TriggerKind::Periodic:
            out << " every " << period_.count() << "ms";
            break;
        case TriggerKind::OneShotAt:
            out << " " << utils::FormatIso(*date_);
            break;
        case TriggerKind::RepeatAt:
            out << " " << utils::FormatIso(*date_) << " x" << times_ << " every " << period_.count() << "ms";
            break;
        case TriggerKind::Immediate:
            break;
        case TriggerKind::ImmediateRepeat:
            out << " x" << times_ << " every " << period_.count() << "ms";
            break;
    }
    return out.str();
}

std::optional<TimePoint> Trigger::NextCronMatch(TimePoint reference) const {
    if (!cron_) {
        return std::nullopt;
    }
    const std::time_t ref = Clock::to_time_t(reference);
    const std::time_t next = ::cron::cron_next(*cron_, ref);
    // croncpp reports "no match within its search horizon" as (time_t)-1.
    if (next == static_cast<std::time_t>(-1) || next <= ref) {
        return std::nullopt;
    }
    return Clock::from_time_t(next);
}

TriggerState InitialState(const Trigger& trigger, TimePoint now) {
    TriggerState state;
    switch (trigger.Kind()) {
        case TriggerKind::Cron:
            state.next_fire = trigger.NextCronMatch(now);
            break;
        case TriggerKind::Periodic:
            state.next_fire = trigger.StartAfterFirstPeriod() ? now + trigger.Period() : now;
            break;
        case TriggerKind::OneShotAt:
            state.next_fire = trigger.Date();
            state.remaining = 1;
            break;
        case TriggerKind::RepeatAt:
            state.next_fire = trigger.Date();
            state.remaining = trigger.Times();
            break;
        case TriggerKind::Immediate:
            state.next_fire = now;
            state.remaining = 1;
            break;
        case TriggerKind::ImmediateRepeat:
            state.next_fire = now;
            state.remaining = trigger.Times();
            break;
    }
    return state;
}

void Advance(const Trigger& trigger, TriggerState& state, TimePoint now) {
    if (state.Exhausted()) {
        return;
    }
    const TimePoint scheduled = *state.next_fire;
    if (state.remaining.has_value()) {
        *state.remaining -= 1;
        if (*state.remaining <= 0) {
            state.remaining = 0;
            state.next_fire.reset();
            return;
        }
    }
    switch (trigger.Kind()) {
        case TriggerKind::Cron:
            state.next_fire = trigger.NextCronMatch(std::max(scheduled, now));
            break;
        case TriggerKind::Periodic:
        case TriggerKind::RepeatAt:
        case TriggerKind::ImmediateRepeat:
            state.next_fire = NextCadencePoint(scheduled + trigger.Period(), trigger.Period(), now);
            break;
        case TriggerKind::OneShotAt:
        case TriggerKind::Immediate:
            state.next_fire.reset();
            break;
    }
}

}  // namespace cronkit::scheduler
