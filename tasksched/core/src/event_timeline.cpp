#include <tasksched/core/event_timeline.hpp>
#include <tasksched/core/error.hpp>

#include <utility>

namespace tasksched::core {

void EventTimeline::push(TimePoint finish_time, const TaskId& task_id) {
    if (index_.contains(task_id)) {
        throw InvalidStateError("task '" + task_id + "' already has a pending completion");
    }

    TimelineKey key{finish_time, sequence_++};
    queue_.emplace(key, task_id);
    index_.emplace(task_id, key);
}

std::optional<TimelineEntry> EventTimeline::peek_min() const {
    if (queue_.empty()) {
        return std::nullopt;
    }
    const auto& [key, task_id] = *queue_.begin();
    return TimelineEntry{key.finish_time, task_id};
}

std::vector<TimelineEntry> EventTimeline::pop_if_due(TimePoint now) {
    std::vector<TimelineEntry> due;
    while (!queue_.empty()) {
        auto it = queue_.begin();
        if (it->first.finish_time > now) {
            break;
        }
        index_.erase(it->second);
        due.push_back(TimelineEntry{it->first.finish_time, std::move(it->second)});
        queue_.erase(it);
    }
    return due;
}

std::optional<TimePoint> EventTimeline::finish_time_of(const TaskId& task_id) const {
    auto it = index_.find(task_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second.finish_time;
}

} // namespace tasksched::core
