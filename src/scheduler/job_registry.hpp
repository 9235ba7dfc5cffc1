#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "scheduler/schedule_entry.hpp"

namespace cronkit::scheduler {

// Active entries by name and by (next fire time, insertion sequence). Not
// synchronized: the scheduler owns it and calls it under its mutex.
class JobRegistry {
public:
    using EntryPtr = std::shared_ptr<ScheduleEntry>;

    // Assigns the insertion sequence and arms the entry. A named entry replaces
    // the armed entry of the same name, which is returned in Cancelled state.
    EntryPtr Add(EntryPtr entry);

    // Cancels the named entry. Throws NotFoundError when no such entry is armed.
    EntryPtr Remove(const std::string& name);

    // Detaches every entry whose next fire time is <= now, earliest first. The
    // caller must Rearm or Retire each of them.
    std::vector<EntryPtr> TakeDue(TimePoint now);

    void Rearm(const EntryPtr& entry);
    void Retire(const EntryPtr& entry);

    EntryPtr Find(const std::string& name) const;
    std::vector<EntryPtr> Entries() const;
    std::optional<TimePoint> NextDeadline() const;
    std::size_t Size() const;

    // Cancels everything.
    void Clear();

private:
    using QueueKey = std::pair<TimePoint, std::uint64_t>;

    void Enqueue(const EntryPtr& entry);
    void Dequeue(const EntryPtr& entry);

    std::map<QueueKey, EntryPtr> queue_;
    std::unordered_map<std::string, EntryPtr> by_name_;
    std::unordered_map<std::uint64_t, EntryPtr> by_sequence_;
    std::uint64_t next_sequence_ = 1;
};

}  // namespace cronkit::scheduler
