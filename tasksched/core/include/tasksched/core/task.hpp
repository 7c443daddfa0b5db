#pragma once

#include <tasksched/core/types.hpp>

#include <cstddef>
#include <optional>
#include <set>

namespace tasksched::core {

/// @brief Partial set of task attributes used by ModifyTask.
///
/// Only the fields that hold a value are applied; the others keep the
/// task's prior value. A deadline can be removed with @c clear_deadline.
///
/// @see Task::apply
/// @ingroup core
struct TaskPatch {
    std::optional<Duration> duration;            ///< New duration, if provided.
    std::optional<std::set<TaskId>> dependencies; ///< Replacement dependency set.
    std::optional<std::size_t> workers_required; ///< New worker requirement.
    std::optional<double> priority;              ///< New priority.
    std::optional<TimePoint> deadline;           ///< New absolute deadline.
    bool clear_deadline{false};                  ///< Drop the deadline (wins over @c deadline).

    /// @brief Returns true if the patch would change nothing.
    [[nodiscard]] bool empty() const noexcept {
        return !duration && !dependencies && !workers_required && !priority &&
               !deadline && !clear_deadline;
    }
};

/// @brief A unit of work with a duration, worker requirement and dependencies.
/// @ingroup core
///
/// The identifier is fixed for the lifetime of the object; every other
/// attribute may be changed through apply(). Tasks are plain values: the
/// registry keeps its own copy and the engine snapshots what it commits.
///
/// The deadline is observational. It is compared against the completion
/// time after the fact and never influences scheduling decisions.
///
/// @see TaskRegistry, TaskPatch
class Task {
public:
    /// @brief Construct and validate a task.
    /// @param id               Unique identifier (non-empty).
    /// @param duration         Time units to complete once started (> 0).
    /// @param dependencies     Ids that must be completed before the task may start.
    /// @param workers_required Capacity consumed while in progress (> 0).
    /// @param priority         Relative value used by the packer (> 0).
    /// @param deadline         Optional absolute completion bound.
    /// @throws InvalidTaskError if an attribute is out of range.
    Task(TaskId id, Duration duration, std::set<TaskId> dependencies,
         std::size_t workers_required, double priority = 1.0,
         std::optional<TimePoint> deadline = std::nullopt);

    [[nodiscard]] const TaskId& id() const noexcept { return id_; }
    [[nodiscard]] Duration duration() const noexcept { return duration_; }
    [[nodiscard]] const std::set<TaskId>& dependencies() const noexcept { return dependencies_; }
    [[nodiscard]] std::size_t workers_required() const noexcept { return workers_required_; }
    [[nodiscard]] double priority() const noexcept { return priority_; }
    [[nodiscard]] const std::optional<TimePoint>& deadline() const noexcept { return deadline_; }

    /// @brief Returns true if @p id is one of this task's dependencies.
    [[nodiscard]] bool depends_on(const TaskId& id) const {
        return dependencies_.contains(id);
    }

    /// @brief Apply the provided fields of @p patch.
    ///
    /// The patch is validated first; on failure the task is left untouched.
    ///
    /// @param patch Partial attributes to apply.
    /// @throws InvalidTaskError if a provided field is out of range.
    void apply(const TaskPatch& patch);

    bool operator==(const Task&) const = default;

private:
    static void validate(const TaskId& id, Duration duration,
                         std::size_t workers_required, double priority);

    TaskId id_;
    Duration duration_;
    std::set<TaskId> dependencies_;
    std::size_t workers_required_;
    double priority_;
    std::optional<TimePoint> deadline_;
};

} // namespace tasksched::core
