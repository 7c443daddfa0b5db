#include <tasksched/core/task_registry.hpp>
#include <tasksched/core/error.hpp>

#include <utility>

namespace tasksched::core {

TaskRegistry::TaskRegistry(std::vector<Task> tasks) {
    for (auto& task : tasks) {
        insert(std::move(task));
    }
}

bool TaskRegistry::insert(Task task) {
    TaskId id = task.id();
    auto [it, inserted] = tasks_.insert_or_assign(std::move(id), std::move(task));
    return inserted;
}

const Task& TaskRegistry::update(const TaskId& id, const TaskPatch& patch) {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        throw UnknownTaskError(id);
    }
    it->second.apply(patch);
    return it->second;
}

Task TaskRegistry::remove(const TaskId& id) {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        throw UnknownTaskError(id);
    }
    Task removed = std::move(it->second);
    tasks_.erase(it);
    return removed;
}

const Task* TaskRegistry::find(const TaskId& id) const {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

const Task& TaskRegistry::at(const TaskId& id) const {
    const Task* task = find(id);
    if (task == nullptr) {
        throw UnknownTaskError(id);
    }
    return *task;
}

} // namespace tasksched::core
