#include <tasksched/algo/deadline_tracker.hpp>
#include <tasksched/algo/scheduler_engine.hpp>

#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <vector>

using namespace tasksched::core;
using namespace tasksched::algo;

class DeadlineTrackerTest : public ::testing::Test {
protected:
    static TimePoint at(int64_t units) { return time_from_units(units); }

    // Log of a task of duration 3 started at time 2
    static ScheduleLog started_at_two() {
        ScheduleLog log;
        log.append(ScheduleRecord{at(0), {"pre"}, {}});
        log.append(ScheduleRecord{at(2), {"T"}, {"pre"}});
        log.append(ScheduleRecord{at(5), {}, {"T"}});
        return log;
    }

    // Finish times of pre (2) and T (5), with T's deadline at completion
    static std::map<TaskId, TimePoint> finish_times() {
        return {{"pre", at(2)}, {"T", at(5)}};
    }

    static CompletionDeadlines deadline_of_t(std::optional<TimePoint> deadline) {
        return {{"pre", std::nullopt}, {"T", deadline}};
    }

    static void run_to_end(SchedulerEngine& engine) {
        for (int i = 0; i < 50 && !engine.step().terminal; ++i) {
        }
    }
};

TEST_F(DeadlineTrackerTest, ClassifyDeadline) {
    EXPECT_EQ(classify_deadline(at(5), at(4)), DeadlineStatus::Missed);
    EXPECT_EQ(classify_deadline(at(5), at(5)), DeadlineStatus::Met);
    EXPECT_EQ(classify_deadline(at(5), at(9)), DeadlineStatus::Met);
    EXPECT_EQ(classify_deadline(at(5), std::nullopt), DeadlineStatus::NotApplicable);
}

TEST_F(DeadlineTrackerTest, FinishTimeIsStartPlusDuration) {
    auto log = started_at_two();
    EXPECT_EQ(finish_times_from_log(log).at("T"), at(5));
    EXPECT_EQ(start_times_from_log(log).at("T"), at(2));
}

TEST_F(DeadlineTrackerTest, DeadlineBeforeFinishIsMissed) {
    auto entries = DeadlineTracker::evaluate(finish_times(), deadline_of_t(at(4)));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].task_id, "T");
    EXPECT_EQ(entries[0].status, DeadlineStatus::Missed);
    EXPECT_EQ(entries[1].status, DeadlineStatus::NotApplicable);
}

TEST_F(DeadlineTrackerTest, DeadlineAtFinishIsMet) {
    auto entries = DeadlineTracker::evaluate(finish_times(), deadline_of_t(at(5)));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].status, DeadlineStatus::Met);
}

TEST_F(DeadlineTrackerTest, NoDeadlineIsNotApplicable) {
    auto entries = DeadlineTracker::evaluate(finish_times(), deadline_of_t(std::nullopt));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].task_id, "pre");
    EXPECT_EQ(entries[0].task_id, "T");
    EXPECT_EQ(entries[0].status, DeadlineStatus::NotApplicable);
    EXPECT_FALSE(entries[0].deadline.has_value());
}

TEST_F(DeadlineTrackerTest, MissingSnapshotIsNotApplicable) {
    auto entries = DeadlineTracker::evaluate(finish_times(), {});
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].status, DeadlineStatus::NotApplicable);
}

TEST_F(DeadlineTrackerTest, IncompleteTasksAreNotReported) {
    EXPECT_TRUE(DeadlineTracker::evaluate({}, deadline_of_t(at(1))).empty());
}

TEST_F(DeadlineTrackerTest, MatchesEngineRun) {
    std::vector<Task> tasks{
        Task("pre", Duration{2}, {}, 1),
        Task("T", Duration{3}, {"pre"}, 1, 1.0, at(4)),
        Task("U", Duration{1}, {}, 1, 1.0, at(1)),
    };
    SchedulerEngine engine({.capacity = 2}, tasks);
    for (int i = 0; i < 50 && !engine.step().terminal; ++i) {
    }

    EXPECT_EQ(time_to_units(engine.completion_times().at("T")), 5);
    EXPECT_EQ(DeadlineTracker::missed(engine), (std::vector<TaskId>{"T"}));
    EXPECT_EQ(DeadlineTracker::statuses(engine).at("U"), DeadlineStatus::Met);
}

TEST_F(DeadlineTrackerTest, ModifiedDeadlineAfterCompletionIsIgnored) {
    SchedulerEngine engine({.capacity = 1}, {Task("X", Duration{3}, {}, 1, 1.0, at(2))});
    run_to_end(engine);

    engine.modify_task("X", TaskPatch{.deadline = at(100)});
    EXPECT_EQ(DeadlineTracker::statuses(engine).at("X"), DeadlineStatus::Missed);
}

TEST_F(DeadlineTrackerTest, RemovedTaskKeepsDeadlineStatus) {
    SchedulerEngine engine({.capacity = 1}, {Task("X", Duration{3}, {}, 1, 1.0, at(2))});
    run_to_end(engine);
    ASSERT_EQ(DeadlineTracker::statuses(engine).at("X"), DeadlineStatus::Missed);

    engine.remove_task("X");
    auto entries = DeadlineTracker::evaluate(engine);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].status, DeadlineStatus::Missed);
    ASSERT_TRUE(entries[0].deadline.has_value());
    EXPECT_EQ(*entries[0].deadline, at(2));
}

TEST_F(DeadlineTrackerTest, ReaddedTaskIsNotReportedUntilItCompletes) {
    SchedulerEngine engine({.capacity = 1}, {Task("X", Duration{3}, {}, 1, 1.0, at(2))});
    run_to_end(engine);
    engine.remove_task("X");

    engine.add_task(Task("X", Duration{3}, {}, 1, 1.0, at(100)));
    EXPECT_FALSE(engine.is_completed("X"));
    EXPECT_TRUE(DeadlineTracker::evaluate(engine).empty());

    // The first run ended with time at 4; the second finishes at 7
    run_to_end(engine);
    auto entries = DeadlineTracker::evaluate(engine);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].finish, at(7));
    EXPECT_EQ(entries[0].status, DeadlineStatus::Met);
}

TEST_F(DeadlineTrackerTest, EvaluationDoesNotChangeSchedule) {
    std::vector<Task> with_deadline{Task("A", Duration{3}, {}, 1, 1.0, at(1))};
    std::vector<Task> without_deadline{Task("A", Duration{3}, {}, 1)};

    SchedulerEngine first({.capacity = 1}, with_deadline);
    SchedulerEngine second({.capacity = 1}, without_deadline);
    for (int i = 0; i < 10; ++i) {
        (void)first.step();
        (void)second.step();
    }
    EXPECT_EQ(first.log().records(), second.log().records());
}

TEST_F(DeadlineTrackerTest, StatusNames) {
    EXPECT_EQ(to_string(DeadlineStatus::Met), "met");
    EXPECT_EQ(to_string(DeadlineStatus::Missed), "missed");
    EXPECT_EQ(to_string(DeadlineStatus::NotApplicable), "n/a");
}
