#pragma once

#include <tasksched/core/types.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace tasksched::core {

/// @brief Deterministic ordering key for completion events.
///
/// Entries are ordered first by finish time, then by insertion sequence
/// number so that two events due at the same time always drain in the
/// order they were pushed.
///
/// @ingroup core_events
struct TimelineKey {
    TimePoint finish_time;  ///< Primary: time at which the task completes.
    uint64_t sequence;      ///< Secondary: insertion order for determinism.

    /// @cond INTERNAL
    auto operator<=>(const TimelineKey&) const = default;
    /// @endcond
};

/// @brief A pending completion: the task @c task_id finishes at @c finish_time.
/// @ingroup core_events
struct TimelineEntry {
    TimePoint finish_time;
    TaskId task_id;

    bool operator==(const TimelineEntry&) const = default;
};

/// @brief Time-ordered queue of pending completion events.
///
/// Each in-progress task owns exactly one live entry. Pushing a second
/// entry for a task that is already pending is a contract breach and
/// raises InvalidStateError.
///
/// @see SchedulerEngine
/// @ingroup core_events
class EventTimeline {
public:
    /// @brief Schedule the completion of @p task_id at @p finish_time.
    /// @throws InvalidStateError if @p task_id already has a pending entry.
    void push(TimePoint finish_time, const TaskId& task_id);

    /// @brief Return the earliest pending entry, if any.
    [[nodiscard]] std::optional<TimelineEntry> peek_min() const;

    /// @brief Remove and return every entry with finish time <= @p now.
    ///
    /// Entries are returned in (finish_time, insertion) order.
    ///
    /// @param now Current scheduler time.
    /// @return Drained entries, possibly empty.
    std::vector<TimelineEntry> pop_if_due(TimePoint now);

    /// @brief Returns true if @p task_id has a pending entry.
    [[nodiscard]] bool contains(const TaskId& task_id) const {
        return index_.contains(task_id);
    }

    /// @brief Finish time of the pending entry for @p task_id, if any.
    [[nodiscard]] std::optional<TimePoint> finish_time_of(const TaskId& task_id) const;

    [[nodiscard]] std::size_t size() const noexcept { return queue_.size(); }
    [[nodiscard]] bool empty() const noexcept { return queue_.empty(); }

private:
    std::map<TimelineKey, TaskId> queue_;
    std::unordered_map<TaskId, TimelineKey> index_;
    uint64_t sequence_{0};
};

} // namespace tasksched::core
