#pragma once

#include <tasksched/algo/command.hpp>
#include <tasksched/algo/scheduler_engine.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace tasksched::algo {

class CommandSource;

/// @brief Limits for a batch run.
/// @ingroup algo_driver
struct RunOptions {
    std::size_t max_steps{100000};  ///< Abort after this many steps.
    bool stop_when_stalled{true};   ///< Stop once stalled and the source is exhausted.
};

/// @brief Why a batch run ended.
/// @ingroup algo_driver
enum class RunStatus {
    Terminal,  ///< Every registered task completed.
    Stalled,   ///< Nothing can ever start again without new commands.
    StepLimit  ///< RunOptions::max_steps reached.
};

/// @brief Returns "terminal", "stalled" or "step_limit".
[[nodiscard]] std::string_view to_string(RunStatus status) noexcept;

/// @brief Outcome of Driver::run().
/// @ingroup algo_driver
struct RunSummary {
    RunStatus status{RunStatus::Terminal};
    std::size_t steps{0};               ///< Steps executed by this run.
    std::size_t mutations_applied{0};
    std::size_t mutations_rejected{0};
    std::vector<MutationOutcome> outcomes;  ///< One per command, in order.
};

/// @brief Batch driver: polls commands, applies them, steps the engine.
/// @ingroup algo_driver
///
/// Before every step the driver polls its CommandSource and applies the
/// returned commands through SchedulerEngine::apply(), so rejected commands
/// never abort the run. The loop ends when the engine is terminal, when it
/// is stalled with nothing left to submit, or at the step limit.
///
/// @see SchedulerEngine, CommandSource
class Driver {
public:
    /// @param engine Engine to drive (not owned).
    /// @param source Command source, or nullptr for a run without mutations.
    /// @param options Step limit and stall handling.
    Driver(SchedulerEngine& engine, CommandSource* source = nullptr, RunOptions options = {});

    /// @brief Drive the engine until it is terminal, stalled or out of steps.
    RunSummary run();

private:
    void apply_pending(const StepResult* last, RunSummary& summary);

    SchedulerEngine& engine_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    CommandSource* source_;
    RunOptions options_;
};

} // namespace tasksched::algo
