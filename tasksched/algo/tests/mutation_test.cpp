#include <tasksched/algo/scheduler_engine.hpp>

#include <tasksched/core/error.hpp>

#include "test_writer.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

using namespace tasksched::core;
using namespace tasksched::algo;
using tasksched::algo::test_support::RecordingWriter;

class MutationTest : public ::testing::Test {
protected:
    static Task make(const TaskId& id, int64_t duration, std::set<TaskId> deps = {},
                     std::size_t workers = 1) {
        return Task(id, Duration{duration}, std::move(deps), workers);
    }

    static std::size_t start_count(const SchedulerEngine& engine, const TaskId& id) {
        std::size_t count = 0;
        for (const auto& record : engine.log()) {
            for (const auto& started : record.started) {
                count += started == id ? 1 : 0;
            }
        }
        return count;
    }

    static void run_to_end(SchedulerEngine& engine) {
        for (int i = 0; i < 1000; ++i) {
            if (engine.step().terminal) {
                return;
            }
        }
        FAIL() << "engine did not terminate";
    }
};

// =============================================================================
// AddTask
// =============================================================================

TEST_F(MutationTest, AddedTaskIsVisibleToNextStep) {
    SchedulerEngine engine({.capacity = 3}, {make("A", 2)});
    (void)engine.step();

    engine.add_task(make("X", 1));
    auto result = engine.step();
    EXPECT_EQ(result.started, (std::vector<TaskId>{"X"}));
}

TEST_F(MutationTest, AddAfterTerminalReopensRun) {
    SchedulerEngine engine({.capacity = 1}, {make("A", 1)});
    run_to_end(engine);
    ASSERT_TRUE(engine.is_terminal());

    engine.add_task(make("B", 1, {"A"}));
    EXPECT_FALSE(engine.is_terminal());

    auto result = engine.step();
    EXPECT_FALSE(result.terminal);
    EXPECT_EQ(result.started, (std::vector<TaskId>{"B"}));
}

TEST_F(MutationTest, OverwritingInProgressTaskKeepsCommitment) {
    RecordingWriter writer;
    SchedulerEngine engine({.capacity = 3}, {make("A", 2)}, &writer);
    (void)engine.step();

    engine.add_task(make("A", 10, {}, 3));
    EXPECT_EQ(engine.registry().at("A").duration(), Duration{10});
    EXPECT_EQ(engine.in_progress().at("A").workers, 1u);
    EXPECT_EQ(time_to_units(engine.in_progress().at("A").finish), 2);
    EXPECT_EQ(engine.used_capacity(), 1u);

    auto added = writer.of("task_added");
    ASSERT_EQ(added.size(), 2u);
    EXPECT_EQ(added[1].fields.at("replaced"), "1");

    run_to_end(engine);
    EXPECT_EQ(time_to_units(engine.completion_times().at("A")), 2);
    EXPECT_EQ(start_count(engine, "A"), 1u);
}

TEST_F(MutationTest, OverwritingCompletedTaskDoesNotRerun) {
    SchedulerEngine engine({.capacity = 1}, {make("A", 1)});
    run_to_end(engine);

    engine.add_task(make("A", 4));
    EXPECT_TRUE(engine.is_completed("A"));
    EXPECT_TRUE(engine.is_terminal());
}

TEST_F(MutationTest, ReaddingRemovedCompletedTaskRunsAgain) {
    SchedulerEngine engine({.capacity = 1}, {make("A", 1)});
    run_to_end(engine);

    engine.remove_task("A");
    EXPECT_TRUE(engine.is_completed("A"));

    engine.add_task(make("A", 2));
    EXPECT_FALSE(engine.is_completed("A"));

    run_to_end(engine);
    EXPECT_EQ(start_count(engine, "A"), 2u);
    EXPECT_TRUE(engine.is_completed("A"));
}

// =============================================================================
// ModifyTask
// =============================================================================

TEST_F(MutationTest, ModifyAfterCommitDoesNotMoveFinish) {
    SchedulerEngine engine({.capacity = 3}, {make("A", 2)});
    (void)engine.step();

    TaskPatch patch;
    patch.duration = Duration{5};
    patch.workers_required = 3;
    engine.modify_task("A", patch);

    EXPECT_EQ(engine.registry().at("A").workers_required(), 3u);
    EXPECT_EQ(engine.used_capacity(), 1u);

    auto result = engine.step();
    EXPECT_TRUE(result.completed.empty());
    result = engine.step();
    EXPECT_EQ(result.completed, (std::vector<TaskId>{"A"}));
    EXPECT_EQ(time_to_units(result.time), 2);
}

TEST_F(MutationTest, ModifyBeforeStartChangesSchedule) {
    SchedulerEngine engine({.capacity = 2}, {make("A", 1), make("B", 1, {"A"}, 1)});

    TaskPatch patch;
    patch.dependencies = std::set<TaskId>{};
    patch.duration = Duration{4};
    engine.modify_task("B", patch);

    auto result = engine.step();
    EXPECT_EQ(result.started, (std::vector<TaskId>{"A", "B"}));
    EXPECT_EQ(time_to_units(engine.in_progress().at("B").finish), 4);
}

TEST_F(MutationTest, ModifyCanClearDeadline) {
    RecordingWriter writer;
    SchedulerEngine engine({.capacity = 1},
                           {Task("A", Duration{3}, {}, 1, 1.0, time_from_units(1))}, &writer);

    TaskPatch patch;
    patch.clear_deadline = true;
    engine.modify_task("A", patch);
    EXPECT_FALSE(engine.registry().at("A").deadline().has_value());

    run_to_end(engine);
    EXPECT_TRUE(writer.of("deadline_missed").empty());
    EXPECT_TRUE(writer.of("deadline_met").empty());
}

TEST_F(MutationTest, ModifyUnknownThrows) {
    SchedulerEngine engine({.capacity = 1});
    TaskPatch patch;
    patch.priority = 2.0;
    EXPECT_THROW(engine.modify_task("ghost", patch), UnknownTaskError);
}

TEST_F(MutationTest, WorkerIncreaseBeyondCapacityIsTraced) {
    RecordingWriter writer;
    SchedulerEngine engine({.capacity = 2}, {make("A", 1)}, &writer);

    TaskPatch patch;
    patch.workers_required = 3;
    engine.modify_task("A", patch);

    auto violations = writer.of("capacity_violation");
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].fields.at("workers"), "3");
}

// =============================================================================
// RemoveTask
// =============================================================================

TEST_F(MutationTest, RemovingPendingTaskBlocksDependentsForever) {
    SchedulerEngine engine({.capacity = 3}, {make("A", 2), make("B", 1, {"A"}), make("C", 1, {"B"})});
    (void)engine.step();

    engine.remove_task("B");

    StepResult result;
    for (int i = 0; i < 20; ++i) {
        result = engine.step();
        EXPECT_EQ(std::count(result.started.begin(), result.started.end(), "C"), 0);
        if (result.stalled) {
            break;
        }
    }
    EXPECT_TRUE(result.stalled);
    EXPECT_FALSE(engine.is_terminal());
    EXPECT_FALSE(engine.is_completed("C"));
}

TEST_F(MutationTest, RemovingInProgressTaskIsRejected) {
    SchedulerEngine engine({.capacity = 1}, {make("A", 3)});
    (void)engine.step();

    EXPECT_THROW(engine.remove_task("A"), TaskInProgressError);
    EXPECT_TRUE(engine.registry().contains("A"));
    EXPECT_TRUE(engine.is_in_progress("A"));
}

TEST_F(MutationTest, RemovingUnknownTaskThrows) {
    SchedulerEngine engine({.capacity = 1});
    EXPECT_THROW(engine.remove_task("ghost"), UnknownTaskError);
}

TEST_F(MutationTest, RemovingCompletedTaskKeepsDependentsSatisfied) {
    SchedulerEngine engine({.capacity = 1}, {make("A", 1)});
    run_to_end(engine);

    engine.remove_task("A");
    engine.add_task(make("B", 1, {"A"}));

    auto result = engine.step();
    EXPECT_EQ(result.started, (std::vector<TaskId>{"B"}));
}

// =============================================================================
// apply()
// =============================================================================

TEST_F(MutationTest, ApplyAcceptsValidCommands) {
    SchedulerEngine engine({.capacity = 2});

    EXPECT_TRUE(engine.apply(AddTask{make("A", 1)}));

    TaskPatch patch;
    patch.priority = 3.0;
    auto outcome = engine.apply(ModifyTask{"A", patch});
    EXPECT_TRUE(outcome.accepted);
    EXPECT_TRUE(outcome.reason.empty());
    EXPECT_DOUBLE_EQ(engine.registry().at("A").priority(), 3.0);

    EXPECT_TRUE(engine.apply(RemoveTask{"A"}));
    EXPECT_TRUE(engine.registry().empty());
}

TEST_F(MutationTest, ApplyRejectsWithoutChangingState) {
    RecordingWriter writer;
    SchedulerEngine engine({.capacity = 1}, {make("A", 3)}, &writer);
    (void)engine.step();

    auto outcome = engine.apply(RemoveTask{"A"});
    EXPECT_FALSE(outcome);
    EXPECT_NE(outcome.reason.find("in progress"), std::string::npos);
    EXPECT_TRUE(engine.is_in_progress("A"));

    outcome = engine.apply(RemoveTask{"ghost"});
    EXPECT_FALSE(outcome);
    EXPECT_NE(outcome.reason.find("unknown task 'ghost'"), std::string::npos);

    auto rejected = writer.of("mutation_rejected");
    ASSERT_EQ(rejected.size(), 2u);
    EXPECT_EQ(rejected[0].fields.at("op"), "remove");
    EXPECT_EQ(rejected[0].fields.at("task_id"), "A");
    EXPECT_EQ(rejected[1].fields.at("task_id"), "ghost");
}

TEST_F(MutationTest, ApplyRejectsInvalidPatch) {
    SchedulerEngine engine({.capacity = 2}, {make("A", 2)});

    TaskPatch patch;
    patch.workers_required = 0;
    auto outcome = engine.apply(ModifyTask{"A", patch});

    EXPECT_FALSE(outcome.accepted);
    EXPECT_EQ(engine.registry().at("A").workers_required(), 1u);
}
