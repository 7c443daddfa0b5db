#pragma once

#include <tasksched/core/task.hpp>
#include <tasksched/core/types.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace tasksched::algo {

/// @brief Insert a task, or overwrite the task with the same id.
/// @ingroup algo_commands
struct AddTask {
    core::Task task;  ///< Full task definition.
};

/// @brief Change the provided attributes of an existing task.
/// @ingroup algo_commands
struct ModifyTask {
    core::TaskId id;         ///< Task to modify.
    core::TaskPatch patch;   ///< Attributes to change.
};

/// @brief Remove a task that has not started (or has already completed).
/// @ingroup algo_commands
struct RemoveTask {
    core::TaskId id;  ///< Task to remove.
};

/// @brief Variant holding every mutation an external driver may submit.
///
/// Commands are applied between two calls to SchedulerEngine::step().
///
/// @see SchedulerEngine::apply, CommandSource
/// @ingroup algo_commands
using Command = std::variant<AddTask, ModifyTask, RemoveTask>;

/// @brief Short operation name of a command ("add", "modify", "remove").
[[nodiscard]] std::string_view command_name(const Command& command) noexcept;

/// @brief Id of the task a command refers to.
[[nodiscard]] const core::TaskId& command_task_id(const Command& command) noexcept;

/// @brief Result of applying a command through SchedulerEngine::apply().
/// @ingroup algo_commands
struct MutationOutcome {
    bool accepted{false};  ///< True if the registry was changed.
    std::string reason;    ///< Rejection message; empty when accepted.

    explicit operator bool() const noexcept { return accepted; }
};

} // namespace tasksched::algo
