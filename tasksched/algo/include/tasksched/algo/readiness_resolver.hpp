#pragma once

#include <tasksched/core/task.hpp>
#include <tasksched/core/task_registry.hpp>

#include <algorithm>
#include <vector>

namespace tasksched::algo {

/// @brief Returns true if @p task may start now.
///
/// A task is ready when it is neither completed nor in progress and every
/// dependency is in @p completed. A dependency on an id that is not
/// registered simply keeps the task non-ready.
///
/// @tparam CompletedSet  Any container with `contains(const TaskId&)`.
/// @tparam InProgressSet Any container with `contains(const TaskId&)`.
/// @ingroup algo_schedulers
template<typename CompletedSet, typename InProgressSet>
[[nodiscard]] bool is_ready(const core::Task& task, const CompletedSet& completed,
                            const InProgressSet& in_progress) {
    if (completed.contains(task.id()) || in_progress.contains(task.id())) {
        return false;
    }
    return std::all_of(task.dependencies().begin(), task.dependencies().end(),
                       [&completed](const core::TaskId& dep) { return completed.contains(dep); });
}

/// @brief Compute the tasks eligible to start now.
///
/// The result follows registry order (ascending id), so two calls over the
/// same state return the same sequence and packing is reproducible. The
/// returned pointers refer into @p registry and stay valid until the next
/// registry mutation.
///
/// @param registry    Current task definitions.
/// @param completed   Ids of completed tasks.
/// @param in_progress Ids (or id-keyed map) of tasks currently running.
/// @return Ready tasks in ascending id order.
/// @see is_ready, CapacityPacker::pack
/// @ingroup algo_schedulers
template<typename CompletedSet, typename InProgressSet>
[[nodiscard]] std::vector<const core::Task*> ready_tasks(const core::TaskRegistry& registry,
                                                         const CompletedSet& completed,
                                                         const InProgressSet& in_progress) {
    std::vector<const core::Task*> ready;
    for (const auto& [id, task] : registry) {
        if (is_ready(task, completed, in_progress)) {
            ready.push_back(&task);
        }
    }
    return ready;
}

} // namespace tasksched::algo
