#include <tasksched/algo/scheduler_engine.hpp>
#include <tasksched/algo/readiness_resolver.hpp>

#include <tasksched/core/error.hpp>

#include <algorithm>
#include <optional>
#include <type_traits>
#include <utility>

namespace tasksched::algo {

std::string_view to_string(TimeAdvance advance) noexcept {
    switch (advance) {
        case TimeAdvance::Unit:
            return "unit";
        case TimeAdvance::NextEvent:
            return "next_event";
    }
    return "unit";
}

SchedulerEngine::SchedulerEngine(EngineConfig config, std::vector<core::Task> tasks,
                                 core::TraceWriter* writer)
    : config_(config)
    , packer_(config.value_function)
    , registry_(std::move(tasks))
    , trace_writer_(writer) {
    for (const auto& [id, task] : registry_) {
        trace([&](core::TraceWriter& w) {
            w.type("task_added");
            w.field("task_id", std::string_view{id});
            w.field("duration", task.duration().count());
            w.field("workers", static_cast<uint64_t>(task.workers_required()));
            w.field("priority", task.priority());
            w.field("initial", uint64_t{1});
        });
        check_capacity(task);
    }
}

StepResult SchedulerEngine::step() {
    StepResult result;
    result.time = current_time_;

    if (is_terminal()) {
        result.terminal = true;
        return result;
    }

    drain_completions(result.completed);

    // Pointers into registry_; no mutation can happen until step() returns
    auto candidates = ready();
    // A task whose finish time is not representable can never complete
    std::erase_if(candidates, [this](const core::Task* task) {
        return !core::can_advance(current_time_, task->duration());
    });
    std::size_t available = free_capacity();
    auto selection = packer_.pack(candidates, available);

    for (const auto* task : selection) {
        commit(*task);
        result.started.push_back(task->id());
    }

    trace([&](core::TraceWriter& w) {
        w.type("step");
        w.field("ready", static_cast<uint64_t>(candidates.size()));
        w.field("started", static_cast<uint64_t>(result.started.size()));
        w.field("completed", static_cast<uint64_t>(result.completed.size()));
        w.field("free_capacity", static_cast<uint64_t>(available));
        w.field("used_capacity", static_cast<uint64_t>(used_capacity_));
        w.field("capacity", static_cast<uint64_t>(config_.capacity));
    });

    log_.append(core::ScheduleRecord{current_time_, result.started, result.completed});
    advance_time(!result.started.empty());

    result.terminal = is_terminal();
    result.stalled = !result.terminal && in_progress_.empty();
    return result;
}

void SchedulerEngine::drain_completions(std::vector<core::TaskId>& completed) {
    for (auto& entry : timeline_.pop_if_due(current_time_)) {
        auto it = in_progress_.find(entry.task_id);
        if (it == in_progress_.end()) {
            throw core::InvalidStateError("completion for task '" + entry.task_id +
                                          "' which is not in progress");
        }
        used_capacity_ -= it->second.workers;
        in_progress_.erase(it);

        completed_.insert(entry.task_id);
        completion_times_.insert_or_assign(entry.task_id, entry.finish_time);

        // Observational only: the outcome never feeds back into scheduling
        const core::Task* task = registry_.find(entry.task_id);
        std::optional<core::TimePoint> deadline;
        if (task != nullptr) {
            deadline = task->deadline();
        }
        completion_deadlines_.insert_or_assign(entry.task_id, deadline);

        trace([&](core::TraceWriter& w) {
            w.type("task_completion");
            w.field("task_id", std::string_view{entry.task_id});
            w.field("finish", core::time_to_units(entry.finish_time));
        });

        if (deadline) {
            bool met = entry.finish_time <= *deadline;
            trace([&](core::TraceWriter& w) {
                w.type(met ? "deadline_met" : "deadline_missed");
                w.field("task_id", std::string_view{entry.task_id});
                w.field("deadline", core::time_to_units(*deadline));
                w.field("finish", core::time_to_units(entry.finish_time));
            });
        }

        completed.push_back(std::move(entry.task_id));
    }
}

void SchedulerEngine::commit(const core::Task& task) {
    Commitment commitment{current_time_, current_time_ + task.duration(), task.workers_required()};

    timeline_.push(commitment.finish, task.id());
    in_progress_.emplace(task.id(), commitment);
    used_capacity_ += commitment.workers;

    trace([&](core::TraceWriter& w) {
        w.type("task_start");
        w.field("task_id", std::string_view{task.id()});
        w.field("workers", static_cast<uint64_t>(commitment.workers));
        w.field("finish", core::time_to_units(commitment.finish));
        w.field("value", packer_.value(task));
    });
}

void SchedulerEngine::advance_time(bool started_any) {
    if (config_.time_advance == TimeAdvance::NextEvent && !started_any) {
        auto next = timeline_.peek_min();
        if (next && next->finish_time > current_time_) {
            current_time_ = next->finish_time;
            return;
        }
    }
    if (core::can_advance(current_time_, core::Duration{1})) {
        current_time_ += core::Duration{1};
    }
}

bool SchedulerEngine::is_terminal() const {
    if (!in_progress_.empty()) {
        return false;
    }
    return std::all_of(registry_.begin(), registry_.end(), [this](const auto& item) {
        return completed_.contains(item.first);
    });
}

std::vector<const core::Task*> SchedulerEngine::ready() const {
    return ready_tasks(registry_, completed_, in_progress_);
}

void SchedulerEngine::check_capacity(const core::Task& task) {
    if (task.workers_required() <= config_.capacity) {
        return;
    }
    trace([&](core::TraceWriter& w) {
        w.type("capacity_violation");
        w.field("task_id", std::string_view{task.id()});
        w.field("workers", static_cast<uint64_t>(task.workers_required()));
        w.field("capacity", static_cast<uint64_t>(config_.capacity));
    });
}

// =============================================================================
// Mutations
// =============================================================================

void SchedulerEngine::add_task(core::Task task) {
    const core::TaskId id = task.id();

    // Completed, then removed, then added again: run it again
    if (!registry_.contains(id) && completed_.contains(id)) {
        completed_.erase(id);
        completion_times_.erase(id);
        completion_deadlines_.erase(id);
    }

    bool inserted = registry_.insert(std::move(task));
    const core::Task& stored = registry_.at(id);

    trace([&](core::TraceWriter& w) {
        w.type("task_added");
        w.field("task_id", std::string_view{id});
        w.field("duration", stored.duration().count());
        w.field("workers", static_cast<uint64_t>(stored.workers_required()));
        w.field("priority", stored.priority());
        w.field("replaced", static_cast<uint64_t>(inserted ? 0 : 1));
    });
    check_capacity(stored);
}

void SchedulerEngine::modify_task(const core::TaskId& id, const core::TaskPatch& patch) {
    const core::Task& updated = registry_.update(id, patch);

    trace([&](core::TraceWriter& w) {
        w.type("task_modified");
        w.field("task_id", std::string_view{id});
        w.field("duration", updated.duration().count());
        w.field("workers", static_cast<uint64_t>(updated.workers_required()));
        w.field("priority", updated.priority());
    });
    if (patch.workers_required) {
        check_capacity(updated);
    }
}

void SchedulerEngine::remove_task(const core::TaskId& id) {
    if (!registry_.contains(id)) {
        throw core::UnknownTaskError(id);
    }
    if (in_progress_.contains(id)) {
        throw core::TaskInProgressError(id);
    }
    registry_.remove(id);

    trace([&](core::TraceWriter& w) {
        w.type("task_removed");
        w.field("task_id", std::string_view{id});
    });
}

MutationOutcome SchedulerEngine::apply(const Command& command) {
    std::string reason;
    try {
        std::visit([this](const auto& cmd) {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, AddTask>) {
                add_task(cmd.task);
            } else if constexpr (std::is_same_v<T, ModifyTask>) {
                modify_task(cmd.id, cmd.patch);
            } else if constexpr (std::is_same_v<T, RemoveTask>) {
                remove_task(cmd.id);
            }
        }, command);
        return MutationOutcome{true, {}};
    } catch (const core::InvalidMutationError& e) {
        reason = e.what();
    } catch (const core::InvalidTaskError& e) {
        reason = e.what();
    }

    trace([&](core::TraceWriter& w) {
        w.type("mutation_rejected");
        w.field("op", command_name(command));
        w.field("task_id", std::string_view{command_task_id(command)});
        w.field("reason", std::string_view{reason});
    });
    return MutationOutcome{false, std::move(reason)};
}

} // namespace tasksched::algo
