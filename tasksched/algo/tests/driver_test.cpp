#include <tasksched/algo/command_source.hpp>
#include <tasksched/algo/driver.hpp>

#include "test_writer.hpp"

#include <gtest/gtest.h>

#include <set>
#include <vector>

using namespace tasksched::core;
using namespace tasksched::algo;
using tasksched::algo::test_support::RecordingWriter;

class DriverTest : public ::testing::Test {
protected:
    static Task make(const TaskId& id, int64_t duration, std::set<TaskId> deps = {},
                     std::size_t workers = 1) {
        return Task(id, Duration{duration}, std::move(deps), workers);
    }
};

// =============================================================================
// CommandQueue
// =============================================================================

TEST_F(DriverTest, QueueDeliversByStepCount) {
    CommandQueue queue;
    queue.schedule(2, RemoveTask{"b"});
    queue.schedule(0, RemoveTask{"a"});
    queue.schedule(2, RemoveTask{"c"});
    EXPECT_EQ(queue.pending(), 3u);

    auto first = queue.poll(0, nullptr);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(command_task_id(first[0]), "a");

    EXPECT_TRUE(queue.poll(1, nullptr).empty());

    auto third = queue.poll(2, nullptr);
    ASSERT_EQ(third.size(), 2u);
    EXPECT_EQ(command_task_id(third[0]), "b");
    EXPECT_EQ(command_task_id(third[1]), "c");
    EXPECT_TRUE(queue.exhausted());
}

TEST_F(DriverTest, QueueDeliversOverdueCommands) {
    CommandQueue queue;
    queue.schedule(1, RemoveTask{"a"});
    EXPECT_EQ(queue.poll(5, nullptr).size(), 1u);
}

TEST_F(DriverTest, CommandNames) {
    EXPECT_EQ(command_name(AddTask{make("A", 1)}), "add");
    EXPECT_EQ(command_name(ModifyTask{"A", {}}), "modify");
    EXPECT_EQ(command_name(RemoveTask{"A"}), "remove");
    EXPECT_EQ(command_task_id(AddTask{make("A", 1)}), "A");
}

// =============================================================================
// Driver
// =============================================================================

TEST_F(DriverTest, RunsToTerminal) {
    SchedulerEngine engine({.capacity = 3}, {make("A", 2), make("B", 3, {"A"}, 2)});
    Driver driver(engine);

    auto summary = driver.run();
    EXPECT_EQ(summary.status, RunStatus::Terminal);
    EXPECT_EQ(summary.steps, 6u);
    EXPECT_TRUE(engine.is_terminal());
}

TEST_F(DriverTest, EmptyEngineNeedsNoSteps) {
    SchedulerEngine engine({.capacity = 3});
    auto summary = Driver(engine).run();
    EXPECT_EQ(summary.status, RunStatus::Terminal);
    EXPECT_EQ(summary.steps, 0u);
}

TEST_F(DriverTest, AppliesQueuedCommandsBetweenSteps) {
    SchedulerEngine engine({.capacity = 2}, {make("A", 2)});
    CommandQueue queue;
    queue.schedule(1, AddTask{make("B", 1, {"A"})});
    queue.schedule(1, RemoveTask{"A"});       // in progress: rejected
    queue.schedule(1, RemoveTask{"missing"}); // unknown: rejected

    Driver driver(engine, &queue);
    auto summary = driver.run();

    EXPECT_EQ(summary.status, RunStatus::Terminal);
    EXPECT_EQ(summary.mutations_applied, 1u);
    EXPECT_EQ(summary.mutations_rejected, 2u);
    ASSERT_EQ(summary.outcomes.size(), 3u);
    EXPECT_TRUE(summary.outcomes[0].accepted);
    EXPECT_FALSE(summary.outcomes[1].accepted);
    EXPECT_TRUE(engine.is_completed("B"));
}

TEST_F(DriverTest, StopsWhenStalledAndSourceExhausted) {
    RecordingWriter writer;
    SchedulerEngine engine({.capacity = 1}, {make("A", 1), make("B", 1, {"ghost"})}, &writer);
    Driver driver(engine);

    auto summary = driver.run();
    EXPECT_EQ(summary.status, RunStatus::Stalled);
    EXPECT_EQ(summary.steps, 2u);

    auto finished = writer.of("run_finished");
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].fields.at("status"), "stalled");
}

TEST_F(DriverTest, StalledRunWaitsForPendingCommands) {
    SchedulerEngine engine({.capacity = 1}, {make("B", 1, {"A"})});
    CommandQueue queue;
    queue.schedule(4, AddTask{make("A", 1)});

    auto summary = Driver(engine, &queue).run();
    EXPECT_EQ(summary.status, RunStatus::Terminal);
    EXPECT_TRUE(engine.is_completed("A"));
    EXPECT_TRUE(engine.is_completed("B"));
    EXPECT_EQ(time_to_units(engine.completion_times().at("A")), 5);
}

TEST_F(DriverTest, StepLimit) {
    SchedulerEngine engine({.capacity = 1}, {make("A", 100)});
    auto summary = Driver(engine, nullptr, RunOptions{10, true}).run();
    EXPECT_EQ(summary.status, RunStatus::StepLimit);
    EXPECT_EQ(summary.steps, 10u);
    EXPECT_EQ(engine.steps(), 10u);
}

TEST_F(DriverTest, StallWithoutStopRunsToLimit) {
    SchedulerEngine engine({.capacity = 1}, {make("B", 1, {"ghost"})});
    auto summary = Driver(engine, nullptr, RunOptions{5, false}).run();
    EXPECT_EQ(summary.status, RunStatus::StepLimit);
}

TEST_F(DriverTest, CallbackSourceSeesEveryStep) {
    SchedulerEngine engine({.capacity = 1}, {make("A", 1)});

    std::vector<std::size_t> seen;
    CallbackCommandSource source([&seen](std::size_t steps_done, const StepResult* last) {
        seen.push_back(steps_done);
        std::vector<Command> commands;
        if (last != nullptr && steps_done == 1) {
            commands.emplace_back(AddTask{Task("B", Duration{1}, {"A"}, 1)});
        }
        return commands;
    });

    auto summary = Driver(engine, &source, RunOptions{50, true}).run();
    EXPECT_EQ(summary.status, RunStatus::Terminal);
    EXPECT_EQ(summary.mutations_applied, 1u);
    EXPECT_EQ(seen.front(), 0u);
    EXPECT_TRUE(engine.is_completed("B"));
}

TEST_F(DriverTest, StatusNames) {
    EXPECT_EQ(to_string(RunStatus::Terminal), "terminal");
    EXPECT_EQ(to_string(RunStatus::Stalled), "stalled");
    EXPECT_EQ(to_string(RunStatus::StepLimit), "step_limit");
}
