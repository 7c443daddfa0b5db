#include <tasksched/algo/command.hpp>

#include <type_traits>

namespace tasksched::algo {

std::string_view command_name(const Command& command) noexcept {
    return std::visit([](const auto& cmd) -> std::string_view {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, AddTask>) {
            return "add";
        } else if constexpr (std::is_same_v<T, ModifyTask>) {
            return "modify";
        } else {
            return "remove";
        }
    }, command);
}

const core::TaskId& command_task_id(const Command& command) noexcept {
    return std::visit([](const auto& cmd) -> const core::TaskId& {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, AddTask>) {
            return cmd.task.id();
        } else {
            return cmd.id;
        }
    }, command);
}

} // namespace tasksched::algo
