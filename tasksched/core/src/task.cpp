#include <tasksched/core/task.hpp>
#include <tasksched/core/error.hpp>

#include <string>
#include <utility>

namespace tasksched::core {

Task::Task(TaskId id, Duration duration, std::set<TaskId> dependencies,
           std::size_t workers_required, double priority,
           std::optional<TimePoint> deadline)
    : id_(std::move(id))
    , duration_(duration)
    , dependencies_(std::move(dependencies))
    , workers_required_(workers_required)
    , priority_(priority)
    , deadline_(deadline) {
    validate(id_, duration_, workers_required_, priority_);
}

void Task::validate(const TaskId& id, Duration duration,
                    std::size_t workers_required, double priority) {
    if (id.empty()) {
        throw InvalidTaskError("task id must not be empty");
    }
    if (duration <= Duration::zero()) {
        throw InvalidTaskError("task '" + id + "': duration must be positive");
    }
    if (workers_required == 0) {
        throw InvalidTaskError("task '" + id + "': workers_required must be positive");
    }
    // Also rejects NaN
    if (!(priority > 0.0)) {
        throw InvalidTaskError("task '" + id + "': priority must be positive");
    }
}

void Task::apply(const TaskPatch& patch) {
    validate(id_,
             patch.duration.value_or(duration_),
             patch.workers_required.value_or(workers_required_),
             patch.priority.value_or(priority_));

    if (patch.duration) {
        duration_ = *patch.duration;
    }
    if (patch.dependencies) {
        dependencies_ = *patch.dependencies;
    }
    if (patch.workers_required) {
        workers_required_ = *patch.workers_required;
    }
    if (patch.priority) {
        priority_ = *patch.priority;
    }
    if (patch.clear_deadline) {
        deadline_.reset();
    } else if (patch.deadline) {
        deadline_ = patch.deadline;
    }
}

} // namespace tasksched::core
