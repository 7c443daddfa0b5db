#pragma once

#include <tasksched/core/task.hpp>
#include <tasksched/core/types.hpp>

#include <cstddef>
#include <map>
#include <vector>

namespace tasksched::core {

/// @brief Mutable mapping from task id to task definition.
///
/// The registry is the single owner of task definitions. All changes go
/// through the explicit insert/update/remove operations; there is no
/// free-form access to mutable tasks. Iteration is ordered by id so every
/// reader sees the same deterministic sequence.
///
/// The registry holds no scheduling state: whether a task is running or
/// completed is tracked by the engine.
///
/// @see Task, SchedulerEngine
/// @ingroup core
class TaskRegistry {
public:
    using Container = std::map<TaskId, Task>;
    using const_iterator = Container::const_iterator;

    TaskRegistry() = default;

    /// @brief Build a registry from an initial task list.
    ///
    /// Later entries overwrite earlier entries that share an id.
    explicit TaskRegistry(std::vector<Task> tasks);

    /// @brief Insert a task, overwriting any existing task with the same id.
    /// @param task Task definition.
    /// @return True if the id was new, false if an existing task was replaced.
    bool insert(Task task);

    /// @brief Apply a partial update to an existing task in place.
    /// @param id    Task to update.
    /// @param patch Fields to change.
    /// @return Reference to the updated task.
    /// @throws UnknownTaskError if @p id is not registered.
    /// @throws InvalidTaskError if the patch holds an out-of-range value.
    const Task& update(const TaskId& id, const TaskPatch& patch);

    /// @brief Remove a task.
    /// @param id Task to remove.
    /// @return The removed definition.
    /// @throws UnknownTaskError if @p id is not registered.
    Task remove(const TaskId& id);

    /// @brief Look up a task, or nullptr if absent.
    [[nodiscard]] const Task* find(const TaskId& id) const;

    /// @brief Look up a task.
    /// @throws UnknownTaskError if @p id is not registered.
    [[nodiscard]] const Task& at(const TaskId& id) const;

    [[nodiscard]] bool contains(const TaskId& id) const { return tasks_.contains(id); }
    [[nodiscard]] std::size_t size() const noexcept { return tasks_.size(); }
    [[nodiscard]] bool empty() const noexcept { return tasks_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return tasks_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return tasks_.end(); }

private:
    Container tasks_;
};

} // namespace tasksched::core
