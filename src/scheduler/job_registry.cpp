#include "scheduler/job_registry.hpp"

#include "scheduler/errors.hpp"

namespace cronkit::scheduler {

JobRegistry::EntryPtr JobRegistry::Add(EntryPtr entry) {
    if (!entry) {
        throw InvalidArgumentError("cannot register a null entry");
    }
    if (entry->fire.Exhausted()) {
        throw InvalidArgumentError("trigger " + entry->trigger.Describe() + " never fires");
    }

    EntryPtr replaced;
    if (!entry->Anonymous()) {
        auto it = by_name_.find(entry->name);
        if (it != by_name_.end()) {
            replaced = it->second;
            Dequeue(replaced);
            by_sequence_.erase(replaced->sequence);
            replaced->state = EntryState::Cancelled;
            by_name_.erase(it);
        }
        by_name_[entry->name] = entry;
    }

    entry->sequence = next_sequence_++;
    entry->state = EntryState::Scheduled;
    by_sequence_[entry->sequence] = entry;
    Enqueue(entry);
    return replaced;
}

JobRegistry::EntryPtr JobRegistry::Remove(const std::string& name) {
    auto it = name.empty() ? by_name_.end() : by_name_.find(name);
    if (it == by_name_.end()) {
        throw NotFoundError("no job scheduled under name '" + name + "'");
    }
    EntryPtr entry = it->second;
    by_name_.erase(it);
    Dequeue(entry);
    by_sequence_.erase(entry->sequence);
    entry->state = EntryState::Cancelled;
    return entry;
}

std::vector<JobRegistry::EntryPtr> JobRegistry::TakeDue(TimePoint now) {
    std::vector<EntryPtr> due;
    while (!queue_.empty()) {
        auto it = queue_.begin();
        if (it->first.first > now) {
            break;
        }
        due.push_back(it->second);
        queue_.erase(it);
    }
    return due;
}

void JobRegistry::Rearm(const EntryPtr& entry) {
    if (!entry || !entry->Armed() || entry->fire.Exhausted()) {
        return;
    }
    if (by_sequence_.find(entry->sequence) == by_sequence_.end()) {
        return;
    }
    Enqueue(entry);
}

void JobRegistry::Retire(const EntryPtr& entry) {
    if (!entry) {
        return;
    }
    Dequeue(entry);
    by_sequence_.erase(entry->sequence);
    if (!entry->Anonymous()) {
        auto it = by_name_.find(entry->name);
        if (it != by_name_.end() && it->second == entry) {
            by_name_.erase(it);
        }
    }
    if (entry->Armed()) {
        entry->state = EntryState::Retired;
    }
}

JobRegistry::EntryPtr JobRegistry::Find(const std::string& name) const {
    if (name.empty()) {
        return nullptr;
    }
    auto it = by_name_.find(name);
    return it == by_name_.end() ? nullptr : it->second;
}

std::vector<JobRegistry::EntryPtr> JobRegistry::Entries() const {
    std::vector<EntryPtr> entries;
    entries.reserve(queue_.size());
    for (const auto& [key, entry] : queue_) {
        entries.push_back(entry);
    }
    return entries;
}

std::optional<TimePoint> JobRegistry::NextDeadline() const {
    if (queue_.empty()) {
        return std::nullopt;
    }
    return queue_.begin()->first.first;
}

std::size_t JobRegistry::Size() const {
    return by_sequence_.size();
}

void JobRegistry::Clear() {
    for (auto& [sequence, entry] : by_sequence_) {
        entry->state = EntryState::Cancelled;
    }
    queue_.clear();
    by_name_.clear();
    by_sequence_.clear();
}

void JobRegistry::Enqueue(const EntryPtr& entry) {
    queue_[{*entry->fire.next_fire, entry->sequence}] = entry;
}

void JobRegistry::Dequeue(const EntryPtr& entry) {
    if (entry->fire.Exhausted()) {
        return;
    }
    auto it = queue_.find({*entry->fire.next_fire, entry->sequence});
    if (it != queue_.end() && it->second == entry) {
        queue_.erase(it);
    }
}

}  // namespace cronkit::scheduler
