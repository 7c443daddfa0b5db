#include <tasksched/algo/capacity_packer.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace tasksched::core;
using namespace tasksched::algo;

class CapacityPackerTest : public ::testing::Test {
protected:
    static Task make(const TaskId& id, std::size_t workers, double priority, int64_t duration = 1) {
        return Task(id, Duration{duration}, {}, workers, priority);
    }

    static std::vector<TaskId> ids(const std::vector<const Task*>& selection) {
        std::vector<TaskId> result;
        for (const auto* task : selection) {
            result.push_back(task->id());
        }
        return result;
    }
};

TEST_F(CapacityPackerTest, PrefersHigherValueWhenOnlyOneFits) {
    Task x = make("X", 2, 5.0);
    Task y = make("Y", 2, 3.0);
    CapacityPacker packer;

    auto selection = packer.pack({&x, &y}, 2);
    EXPECT_EQ(ids(selection), (std::vector<TaskId>{"X"}));

    // Candidate order does not matter
    selection = packer.pack({&y, &x}, 2);
    EXPECT_EQ(ids(selection), (std::vector<TaskId>{"X"}));
}

TEST_F(CapacityPackerTest, ZeroCapacitySelectsNothing) {
    Task a = make("A", 1, 1.0);
    CapacityPacker packer;
    EXPECT_TRUE(packer.pack({&a}, 0).empty());
}

TEST_F(CapacityPackerTest, NoCandidates) {
    CapacityPacker packer;
    EXPECT_TRUE(packer.pack({}, 4).empty());
}

TEST_F(CapacityPackerTest, OversizedTaskIsNeverSelected) {
    Task big = make("big", 5, 100.0);
    Task small = make("small", 1, 1.0);
    CapacityPacker packer;

    auto selection = packer.pack({&big, &small}, 4);
    EXPECT_EQ(ids(selection), (std::vector<TaskId>{"small"}));
}

TEST_F(CapacityPackerTest, CombinationBeatsSingleLargeTask) {
    Task large = make("L", 4, 5.0);
    Task a = make("A", 2, 3.0);
    Task b = make("B", 2, 3.0);
    CapacityPacker packer;

    auto selection = packer.pack({&large, &a, &b}, 4);
    EXPECT_EQ(ids(selection), (std::vector<TaskId>{"A", "B"}));
    EXPECT_DOUBLE_EQ(packer.total_value(selection), 6.0);
}

TEST_F(CapacityPackerTest, SelectionNeverExceedsCapacity) {
    std::vector<Task> tasks;
    for (int i = 0; i < 8; ++i) {
        tasks.push_back(make("T" + std::to_string(i), static_cast<std::size_t>(i % 3 + 1), 1.0 + i));
    }
    std::vector<const Task*> candidates;
    for (const auto& task : tasks) {
        candidates.push_back(&task);
    }

    CapacityPacker packer;
    for (std::size_t capacity = 0; capacity <= 10; ++capacity) {
        std::size_t used = 0;
        for (const auto* task : packer.pack(candidates, capacity)) {
            used += task->workers_required();
        }
        EXPECT_LE(used, capacity);
    }
}

TEST_F(CapacityPackerTest, SelectionKeepsCandidateOrder) {
    Task a = make("A", 1, 1.0);
    Task b = make("B", 1, 1.0);
    Task c = make("C", 1, 1.0);
    CapacityPacker packer;

    auto selection = packer.pack({&a, &b, &c}, 3);
    EXPECT_EQ(ids(selection), (std::vector<TaskId>{"A", "B", "C"}));
}

TEST_F(CapacityPackerTest, PriorityPerUnitFavoursShortTasks) {
    Task long_task = make("long", 2, 4.0, 8);   // 0.5 per unit
    Task short_task = make("short", 2, 3.0, 1); // 3.0 per unit

    CapacityPacker raw(ValueFunction::Priority);
    EXPECT_EQ(ids(raw.pack({&long_task, &short_task}, 2)), (std::vector<TaskId>{"long"}));

    CapacityPacker rate(ValueFunction::PriorityPerUnit);
    EXPECT_EQ(ids(rate.pack({&long_task, &short_task}, 2)), (std::vector<TaskId>{"short"}));
    EXPECT_DOUBLE_EQ(rate.value(long_task), 0.5);
}

TEST_F(CapacityPackerTest, ValueFunctionNames) {
    EXPECT_EQ(to_string(ValueFunction::Priority), "priority");
    EXPECT_EQ(to_string(ValueFunction::PriorityPerUnit), "priority_per_unit");
    EXPECT_EQ(CapacityPacker{}.value_function(), ValueFunction::Priority);
}
