#include <tasksched/algo/deadline_tracker.hpp>

#include <utility>

namespace tasksched::algo {

std::string_view to_string(DeadlineStatus status) noexcept {
    switch (status) {
        case DeadlineStatus::Met:
            return "met";
        case DeadlineStatus::Missed:
            return "missed";
        case DeadlineStatus::NotApplicable:
            return "n/a";
    }
    return "n/a";
}

DeadlineStatus classify_deadline(core::TimePoint finish,
                                 const std::optional<core::TimePoint>& deadline) noexcept {
    if (!deadline) {
        return DeadlineStatus::NotApplicable;
    }
    return finish <= *deadline ? DeadlineStatus::Met : DeadlineStatus::Missed;
}

std::map<core::TaskId, core::TimePoint> finish_times_from_log(const core::ScheduleLog& log) {
    std::map<core::TaskId, core::TimePoint> finish_times;
    for (const auto& record : log) {
        for (const auto& id : record.completed) {
            finish_times.insert_or_assign(id, record.time);
        }
    }
    return finish_times;
}

std::map<core::TaskId, core::TimePoint> start_times_from_log(const core::ScheduleLog& log) {
    std::map<core::TaskId, core::TimePoint> start_times;
    for (const auto& record : log) {
        for (const auto& id : record.started) {
            start_times.insert_or_assign(id, record.time);
        }
    }
    return start_times;
}

std::vector<DeadlineEntry> DeadlineTracker::evaluate(
    const std::map<core::TaskId, core::TimePoint>& finish_times,
    const CompletionDeadlines& deadlines) {
    std::vector<DeadlineEntry> entries;
    entries.reserve(finish_times.size());
    for (const auto& [id, finish] : finish_times) {
        std::optional<core::TimePoint> deadline;
        if (auto iter = deadlines.find(id); iter != deadlines.end()) {
            deadline = iter->second;
        }
        entries.push_back(DeadlineEntry{id, finish, deadline, classify_deadline(finish, deadline)});
    }
    return entries;
}

std::vector<DeadlineEntry> DeadlineTracker::evaluate(const SchedulerEngine& engine) {
    return evaluate(engine.completion_times(), engine.completion_deadlines());
}

std::map<core::TaskId, DeadlineStatus> DeadlineTracker::statuses(const SchedulerEngine& engine) {
    std::map<core::TaskId, DeadlineStatus> result;
    for (auto& entry : evaluate(engine)) {
        result.emplace(std::move(entry.task_id), entry.status);
    }
    return result;
}

std::vector<core::TaskId> DeadlineTracker::missed(const SchedulerEngine& engine) {
    std::vector<core::TaskId> ids;
    for (auto& entry : evaluate(engine)) {
        if (entry.status == DeadlineStatus::Missed) {
            ids.push_back(std::move(entry.task_id));
        }
    }
    return ids;
}

} // namespace tasksched::algo
