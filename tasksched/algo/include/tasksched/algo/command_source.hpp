#pragma once

#include <tasksched/algo/command.hpp>
#include <tasksched/algo/scheduler_engine.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <vector>

namespace tasksched::algo {

/// @brief Supplies mutations to apply between scheduler steps.
/// @ingroup algo_commands
///
/// This is the boundary with whatever collects operator decisions
/// (a script, a test, an interactive front end). The Driver polls the
/// source before every step; the engine itself never waits on input.
///
/// @see Driver, CommandQueue, CallbackCommandSource
class CommandSource {
public:
    virtual ~CommandSource() = default;

    /// @brief Commands to apply before the next step.
    /// @param steps_done Number of steps executed so far.
    /// @param last       Result of the previous step, or nullptr before the first.
    /// @return Commands, applied in order.
    virtual std::vector<Command> poll(std::size_t steps_done, const StepResult* last) = 0;

    /// @brief True when the source will never produce another command.
    [[nodiscard]] virtual bool exhausted() const = 0;

protected:
    CommandSource() = default;
    CommandSource(const CommandSource&) = default;
    CommandSource& operator=(const CommandSource&) = default;
    CommandSource(CommandSource&&) = default;
    CommandSource& operator=(CommandSource&&) = default;
};

/// @brief Pre-recorded commands keyed by step count.
/// @ingroup algo_commands
///
/// A command scheduled "after step N" is delivered by the first poll with
/// `steps_done >= N`; N = 0 means before the first step. Commands sharing
/// a step are delivered in the order they were scheduled.
class CommandQueue : public CommandSource {
public:
    /// @brief Schedule @p command to be applied after @p after_step steps.
    void schedule(std::size_t after_step, Command command);

    std::vector<Command> poll(std::size_t steps_done, const StepResult* last) override;

    [[nodiscard]] bool exhausted() const override { return pending_.empty(); }

    /// @brief Number of commands not yet delivered.
    [[nodiscard]] std::size_t pending() const noexcept { return pending_.size(); }

private:
    std::multimap<std::size_t, Command> pending_;
};

/// @brief Adapts a callable into a CommandSource.
/// @ingroup algo_commands
///
/// The callable decides, step by step, what to submit. The source is
/// never exhausted on its own; the driver's step limit or the terminal
/// state ends the run.
class CallbackCommandSource : public CommandSource {
public:
    using Callback = std::function<std::vector<Command>(std::size_t, const StepResult*)>;

    explicit CallbackCommandSource(Callback callback);

    std::vector<Command> poll(std::size_t steps_done, const StepResult* last) override;

    [[nodiscard]] bool exhausted() const override { return false; }

private:
    Callback callback_;
};

} // namespace tasksched::algo
