#pragma once

#include <tasksched/core/task_registry.hpp>
#include <tasksched/core/types.hpp>

#include <cstddef>
#include <map>
#include <set>
#include <vector>

namespace tasksched::algo {

/// @brief Tasks waiting on dependencies that can never complete.
///
/// A dependency is missing when it is neither registered nor completed
/// (never added, or removed before it ran). Such tasks are not an error:
/// they simply never become ready. Completed tasks are skipped.
///
/// @param registry  Current task definitions.
/// @param completed Ids of completed tasks.
/// @return Task id -> missing dependency ids (ascending).
/// @ingroup algo_diagnostics
[[nodiscard]] std::map<core::TaskId, std::vector<core::TaskId>> blocked_on_missing_dependencies(
    const core::TaskRegistry& registry, const std::set<core::TaskId>& completed);

/// @brief Tasks whose worker requirement exceeds @p capacity.
///
/// These can never be selected by the packer.
///
/// @ingroup algo_diagnostics
[[nodiscard]] std::vector<core::TaskId> oversized_tasks(const core::TaskRegistry& registry,
                                                       std::size_t capacity);

/// @brief Groups of uncompleted tasks that wait on each other.
///
/// Each group is a strongly connected component of the dependency graph
/// restricted to registered, uncompleted tasks, with more than one member
/// or a task that depends on itself. No task in a group can ever start.
///
/// @param registry  Current task definitions.
/// @param completed Ids of completed tasks.
/// @return Cycles, each sorted by id; groups ordered by their first id.
/// @ingroup algo_diagnostics
[[nodiscard]] std::vector<std::vector<core::TaskId>> dependency_cycles(
    const core::TaskRegistry& registry, const std::set<core::TaskId>& completed);

} // namespace tasksched::algo
