#include <tasksched/algo/driver.hpp>
#include <tasksched/algo/command_source.hpp>

#include <cstdint>
#include <optional>
#include <utility>

namespace tasksched::algo {

std::string_view to_string(RunStatus status) noexcept {
    switch (status) {
        case RunStatus::Terminal:
            return "terminal";
        case RunStatus::Stalled:
            return "stalled";
        case RunStatus::StepLimit:
            return "step_limit";
    }
    return "terminal";
}

Driver::Driver(SchedulerEngine& engine, CommandSource* source, RunOptions options)
    : engine_(engine)
    , source_(source)
    , options_(options) {}

void Driver::apply_pending(const StepResult* last, RunSummary& summary) {
    if (source_ == nullptr) {
        return;
    }
    for (const auto& command : source_->poll(summary.steps, last)) {
        auto outcome = engine_.apply(command);
        if (outcome.accepted) {
            ++summary.mutations_applied;
        } else {
            ++summary.mutations_rejected;
        }
        summary.outcomes.push_back(std::move(outcome));
    }
}

RunSummary Driver::run() {
    RunSummary summary;
    std::optional<StepResult> last;

    while (true) {
        apply_pending(last ? &*last : nullptr, summary);

        if (engine_.is_terminal()) {
            summary.status = RunStatus::Terminal;
            break;
        }
        if (summary.steps >= options_.max_steps) {
            summary.status = RunStatus::StepLimit;
            break;
        }

        last = engine_.step();
        ++summary.steps;

        if (last->terminal) {
            summary.status = RunStatus::Terminal;
            break;
        }
        bool nothing_to_come = source_ == nullptr || source_->exhausted();
        if (last->stalled && options_.stop_when_stalled && nothing_to_come) {
            summary.status = RunStatus::Stalled;
            break;
        }
    }

    engine_.trace([&](core::TraceWriter& w) {
        w.type("run_finished");
        w.field("status", to_string(summary.status));
        w.field("steps", static_cast<uint64_t>(summary.steps));
    });
    return summary;
}

} // namespace tasksched::algo
