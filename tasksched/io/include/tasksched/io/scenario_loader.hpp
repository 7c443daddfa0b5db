#pragma once

/// @file scenario_loader.hpp
/// @brief Functions and data structures for loading and writing JSON scenario files.
/// @ingroup io_loaders

#include <tasksched/algo/command.hpp>
#include <tasksched/algo/command_source.hpp>
#include <tasksched/algo/scheduler_engine.hpp>
#include <tasksched/core/task.hpp>

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string_view>
#include <vector>

namespace tasksched::io {

/// @brief A mutation to apply once @c after_step steps have run.
///
/// @ingroup io_loaders
/// @see algo::CommandQueue
struct ScheduledCommand {
    std::size_t after_step{0};  ///< 0 = before the first step.
    algo::Command command;      ///< Mutation to apply.
};

/// @brief Complete scenario definition: engine settings, tasks, and a command script.
///
/// Loaded from JSON via @ref load_scenario. The JSON layout is:
/// @code
/// {
///   "capacity": 4,
///   "value_function": "priority",        // or "priority_per_unit"
///   "time_advance": "unit",              // or "next_event"
///   "tasks": [
///     {"id": "A", "duration": 2, "workers": 1},
///     {"id": "B", "duration": 3, "workers": 2, "dependencies": ["A"],
///      "priority": 2, "deadline": 6}
///   ],
///   "commands": [
///     {"after_step": 1, "op": "add", "task": {"id": "C", "duration": 1, "workers": 1}},
///     {"after_step": 2, "op": "modify", "id": "B", "priority": 5, "deadline": null},
///     {"after_step": 2, "op": "remove", "id": "C"}
///   ]
/// }
/// @endcode
///
/// In a modify command, `"deadline": null` clears the deadline.
///
/// @ingroup io_loaders
/// @see load_scenario, make_command_queue
struct ScenarioData {
    algo::EngineConfig config;               ///< Capacity and policies.
    std::vector<core::Task> tasks;           ///< Initial task set.
    std::vector<ScheduledCommand> commands;  ///< Mutation script, in file order.
};

/// @brief Load a scenario from a JSON file.
///
/// @param path  Filesystem path to the JSON scenario file.
/// @return Parsed scenario data.
/// @throws LoaderError  If the file cannot be read or contains invalid JSON.
/// @see load_scenario_from_string
ScenarioData load_scenario(const std::filesystem::path& path);

/// @brief Load a scenario from a JSON string.
///
/// @param json  JSON content describing the scenario.
/// @return Parsed scenario data.
/// @throws LoaderError  If the JSON is malformed or fails validation.
ScenarioData load_scenario_from_string(std::string_view json);

/// @brief Write a scenario to a JSON file.
/// @throws LoaderError  If the file cannot be opened for writing.
void write_scenario(const ScenarioData& scenario, const std::filesystem::path& path);

/// @brief Write a scenario to an output stream as JSON.
void write_scenario_to_stream(const ScenarioData& scenario, std::ostream& out);

/// @brief Build a CommandQueue holding the scenario's command script.
[[nodiscard]] algo::CommandQueue make_command_queue(const ScenarioData& scenario);

/// @brief Parse a value function name ("priority" or "priority_per_unit").
/// @throws LoaderError  On an unknown name.
[[nodiscard]] algo::ValueFunction parse_value_function(std::string_view name);

/// @brief Parse a time advance policy name ("unit" or "next_event").
/// @throws LoaderError  On an unknown name.
[[nodiscard]] algo::TimeAdvance parse_time_advance(std::string_view name);

} // namespace tasksched::io
