#pragma once

#include <tasksched/algo/scheduler_engine.hpp>

#include <tasksched/core/schedule_log.hpp>
#include <tasksched/core/types.hpp>

#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace tasksched::algo {

/// @brief Deadline classification of a completed task.
/// @ingroup algo_deadlines
enum class DeadlineStatus {
    Met,           ///< finish <= deadline.
    Missed,        ///< finish > deadline.
    NotApplicable  ///< No deadline set.
};

/// @brief Returns "met", "missed" or "n/a".
[[nodiscard]] std::string_view to_string(DeadlineStatus status) noexcept;

/// @brief Deadline outcome of one completed task.
/// @ingroup algo_deadlines
struct DeadlineEntry {
    core::TaskId task_id;
    core::TimePoint finish;
    std::optional<core::TimePoint> deadline;
    DeadlineStatus status;
};

/// @brief Classify a finish time against an optional deadline.
[[nodiscard]] DeadlineStatus classify_deadline(core::TimePoint finish,
                                               const std::optional<core::TimePoint>& deadline) noexcept;

/// @brief Reconstruct finish times from the completion records of a log.
///
/// If a task completed more than once (it was removed and re-added), the
/// latest completion wins.
[[nodiscard]] std::map<core::TaskId, core::TimePoint> finish_times_from_log(const core::ScheduleLog& log);

/// @brief Reconstruct start times from the start records of a log.
///
/// Latest start wins, as for finish_times_from_log().
[[nodiscard]] std::map<core::TaskId, core::TimePoint> start_times_from_log(const core::ScheduleLog& log);

/// @brief Task id -> deadline in effect when the task completed.
using CompletionDeadlines = std::map<core::TaskId, std::optional<core::TimePoint>>;

/// @brief Derives deadline outcomes from completion records.
/// @ingroup algo_deadlines
///
/// Pure function of the finish times and of the deadlines recorded at
/// completion: evaluating never changes what the scheduler does, and later
/// modification or removal of a task does not change its outcome. Tasks
/// that have not completed (including a completed task that was removed
/// and added again) are not reported.
class DeadlineTracker {
public:
    /// @brief Classify every task in @p finish_times.
    /// @param finish_times Actual finish time per completed task.
    /// @param deadlines    Deadline snapshot per completed task; a missing
    ///                     entry means no deadline.
    /// @return One entry per completed task, ordered by id.
    [[nodiscard]] static std::vector<DeadlineEntry> evaluate(
        const std::map<core::TaskId, core::TimePoint>& finish_times,
        const CompletionDeadlines& deadlines);

    /// @brief Classify every task the engine currently counts as completed.
    [[nodiscard]] static std::vector<DeadlineEntry> evaluate(const SchedulerEngine& engine);

    /// @brief Same as evaluate(), reduced to an id -> status map.
    [[nodiscard]] static std::map<core::TaskId, DeadlineStatus> statuses(const SchedulerEngine& engine);

    /// @brief Ids of the tasks whose deadline was missed.
    [[nodiscard]] static std::vector<core::TaskId> missed(const SchedulerEngine& engine);
};

} // namespace tasksched::algo
