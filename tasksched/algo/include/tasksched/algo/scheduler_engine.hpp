#pragma once

#include <tasksched/algo/capacity_packer.hpp>
#include <tasksched/algo/command.hpp>

#include <tasksched/core/event_timeline.hpp>
#include <tasksched/core/schedule_log.hpp>
#include <tasksched/core/task.hpp>
#include <tasksched/core/task_registry.hpp>
#include <tasksched/core/trace_writer.hpp>
#include <tasksched/core/types.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string_view>
#include <vector>

namespace tasksched::algo {

/// @brief How scheduler time moves forward at the end of a step.
///
/// Chosen once per engine. The policy changes how many steps a driver
/// observes, and therefore how many mutation windows it gets.
///
/// @ingroup algo_schedulers
enum class TimeAdvance {
    Unit,      ///< Advance by exactly one time unit per step (default).
    NextEvent  ///< If nothing started and completions are pending, jump to the next one.
};

/// @brief Returns the configuration name of @p advance ("unit" or "next_event").
[[nodiscard]] std::string_view to_string(TimeAdvance advance) noexcept;

/// @brief Fixed engine parameters.
/// @ingroup algo_schedulers
struct EngineConfig {
    std::size_t capacity{0};                            ///< Total worker budget.
    ValueFunction value_function{ValueFunction::Priority};
    TimeAdvance time_advance{TimeAdvance::Unit};
};

/// @brief Capacity and finish time reserved for a started task.
///
/// Taken from the task definition at start; later modifications of the
/// task do not affect a commitment.
///
/// @ingroup algo_schedulers
struct Commitment {
    core::TimePoint start;
    core::TimePoint finish;
    std::size_t workers;
};

/// @brief What one SchedulerEngine::step() call did.
/// @ingroup algo_schedulers
struct StepResult {
    core::TimePoint time;               ///< Time at which the step ran.
    std::vector<core::TaskId> started;  ///< Tasks started this step.
    std::vector<core::TaskId> completed;///< Tasks completed this step.
    bool terminal{false};               ///< Every registered task is completed.
    bool stalled{false};                ///< Not terminal, yet nothing runs or started.
};

/// @brief Incremental, capacity-constrained task scheduler.
/// @ingroup algo_schedulers
///
/// The engine owns the task registry and all execution state. An external
/// driver calls step() repeatedly and may apply mutations between calls.
/// One step:
///   1. drains completion events due at the current time,
///   2. computes free capacity from the committed (in-progress) tasks,
///   3. computes the ready set from the current registry,
///   4. packs the ready set into the free capacity,
///   5. commits the selection and schedules its completions,
///   6. logs the step and advances time,
///   7. reports whether the run is terminal.
///
/// Once terminal, step() returns immediately with empty lists and does not
/// advance time or log anything, until a mutation adds work again.
///
/// The engine is single-threaded; mutations must not be issued from
/// inside a step (e.g. from a trace writer).
///
/// @code
/// algo::SchedulerEngine engine({.capacity = 3}, tasks);
/// while (!engine.step().terminal) {
///     // apply commands between steps
/// }
/// @endcode
///
/// @see CapacityPacker, ready_tasks, DeadlineTracker
class SchedulerEngine {
public:
    /// @brief Construct an engine over an initial task set.
    ///
    /// Tasks whose worker requirement exceeds the capacity are accepted
    /// but can never start; each one is traced as a `capacity_violation`.
    ///
    /// @param config Capacity and policies, fixed for the engine lifetime.
    /// @param tasks  Initial task definitions (later duplicates overwrite).
    /// @param writer Optional trace writer (not owned).
    explicit SchedulerEngine(EngineConfig config, std::vector<core::Task> tasks = {},
                             core::TraceWriter* writer = nullptr);

    SchedulerEngine(const SchedulerEngine&) = delete;
    SchedulerEngine& operator=(const SchedulerEngine&) = delete;
    SchedulerEngine(SchedulerEngine&&) = delete;
    SchedulerEngine& operator=(SchedulerEngine&&) = delete;

    /// @brief Run one scheduling step.
    /// @return Started/completed ids and the run state after the step.
    StepResult step();

    /// @name Mutations
    /// @brief Must be called between steps. Throwing variants.
    /// @{

    /// @brief Insert or overwrite a task.
    ///
    /// An in-progress task keeps its commitment. Re-adding an id that was
    /// completed and then removed starts a fresh lifecycle for it.
    void add_task(core::Task task);

    /// @brief Apply a partial update to a registered task.
    /// @throws UnknownTaskError if @p id is not registered.
    /// @throws InvalidTaskError if the patch holds an out-of-range value.
    void modify_task(const core::TaskId& id, const core::TaskPatch& patch);

    /// @brief Remove a registered task that is not in progress.
    ///
    /// Removing a completed task keeps its id in the completed set, so
    /// tasks that depend on it remain satisfied.
    ///
    /// @throws UnknownTaskError if @p id is not registered.
    /// @throws TaskInProgressError if @p id is in progress.
    void remove_task(const core::TaskId& id);

    /// @}

    /// @brief Apply a driver command without throwing.
    ///
    /// A rejected command leaves the state unchanged and is traced as
    /// `mutation_rejected`.
    ///
    /// @param command Mutation to apply.
    /// @return Whether it was accepted, and why not.
    MutationOutcome apply(const Command& command);

    /// @name State
    /// @{
    [[nodiscard]] core::TimePoint time() const noexcept { return current_time_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return config_.capacity; }
    [[nodiscard]] std::size_t used_capacity() const noexcept { return used_capacity_; }
    [[nodiscard]] std::size_t free_capacity() const noexcept { return config_.capacity - used_capacity_; }
    [[nodiscard]] std::size_t steps() const noexcept { return log_.size(); }

    [[nodiscard]] const core::TaskRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] const core::ScheduleLog& log() const noexcept { return log_; }
    [[nodiscard]] const core::EventTimeline& timeline() const noexcept { return timeline_; }
    [[nodiscard]] const CapacityPacker& packer() const noexcept { return packer_; }

    [[nodiscard]] const std::set<core::TaskId>& completed() const noexcept { return completed_; }
    [[nodiscard]] const std::map<core::TaskId, Commitment>& in_progress() const noexcept { return in_progress_; }

    /// @brief Actual finish time of every completed task.
    [[nodiscard]] const std::map<core::TaskId, core::TimePoint>& completion_times() const noexcept {
        return completion_times_;
    }

    /// @brief Deadline each completed task had when it completed.
    ///
    /// Later modification or removal of the task does not change it.
    [[nodiscard]] const std::map<core::TaskId, std::optional<core::TimePoint>>& completion_deadlines() const noexcept {
        return completion_deadlines_;
    }

    [[nodiscard]] bool is_completed(const core::TaskId& id) const { return completed_.contains(id); }
    [[nodiscard]] bool is_in_progress(const core::TaskId& id) const { return in_progress_.contains(id); }

    /// @brief True when nothing runs and every registered task is completed.
    [[nodiscard]] bool is_terminal() const;

    /// @brief Tasks that would be candidates if a step ran now.
    [[nodiscard]] std::vector<const core::Task*> ready() const;
    /// @}

    /// @brief Set the trace writer. Not owned; pass nullptr to disable.
    void set_trace_writer(core::TraceWriter* writer) noexcept { trace_writer_ = writer; }

    /// @brief Invoke a tracing callback only if a trace writer is set.
    /// @tparam F Callable with signature void(TraceWriter&).
    template<typename F>
    void trace(F&& func);

private:
    void drain_completions(std::vector<core::TaskId>& completed);
    void commit(const core::Task& task);
    void advance_time(bool started_any);
    void check_capacity(const core::Task& task);

    EngineConfig config_;
    CapacityPacker packer_;
    core::TaskRegistry registry_;
    core::EventTimeline timeline_;
    core::ScheduleLog log_;

    core::TimePoint current_time_{};
    std::size_t used_capacity_{0};
    std::set<core::TaskId> completed_;
    std::map<core::TaskId, Commitment> in_progress_;
    std::map<core::TaskId, core::TimePoint> completion_times_;
    std::map<core::TaskId, std::optional<core::TimePoint>> completion_deadlines_;

    core::TraceWriter* trace_writer_{nullptr};
};

template<typename F>
void SchedulerEngine::trace(F&& func) {
    if (trace_writer_) {
        trace_writer_->begin(current_time_);
        func(*trace_writer_);
        trace_writer_->end();
    }
}

} // namespace tasksched::algo
