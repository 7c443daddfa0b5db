#include <tasksched/algo/command_source.hpp>

#include <utility>

namespace tasksched::algo {

void CommandQueue::schedule(std::size_t after_step, Command command) {
    pending_.emplace(after_step, std::move(command));
}

std::vector<Command> CommandQueue::poll(std::size_t steps_done, const StepResult* /*last*/) {
    std::vector<Command> due;
    auto end = pending_.upper_bound(steps_done);
    for (auto it = pending_.begin(); it != end; ++it) {
        due.push_back(std::move(it->second));
    }
    pending_.erase(pending_.begin(), end);
    return due;
}

CallbackCommandSource::CallbackCommandSource(Callback callback)
    : callback_(std::move(callback)) {}

std::vector<Command> CallbackCommandSource::poll(std::size_t steps_done, const StepResult* last) {
    if (!callback_) {
        return {};
    }
    return callback_(steps_done, last);
}

} // namespace tasksched::algo
