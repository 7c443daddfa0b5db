#pragma once

#include <tasksched/core/task.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace tasksched::algo {

/// @brief Value assigned to a task by the CapacityPacker.
///
/// Chosen once per engine; the packer never mixes the two.
///
/// @see CapacityPacker
/// @ingroup algo_schedulers
enum class ValueFunction {
    Priority,        ///< value = priority (default).
    PriorityPerUnit  ///< value = priority / duration; favours short, high-priority tasks.
};

/// @brief Returns the configuration name of @p vf ("priority" or "priority_per_unit").
[[nodiscard]] std::string_view to_string(ValueFunction vf) noexcept;

/// @brief Bounded 0/1 knapsack selection of ready tasks.
/// @ingroup algo_schedulers
///
/// Selects the subset of candidates whose summed worker requirement fits in
/// the available capacity and whose summed value is maximal. The dynamic
/// program runs over integer capacities 0..capacity; candidates are
/// processed once each, in the order given, and each capacity row is
/// updated from high to low so a task is used at most once.
///
/// The selection is optimal for the current step only. It does not look
/// ahead at tasks that will become ready later.
///
/// Among selections of equal value the one using the fewest workers wins;
/// beyond that, ties are resolved by candidate order and are not part of
/// the contract.
///
/// Complexity: O(n * capacity) time and space.
///
/// @see ready_tasks, SchedulerEngine
class CapacityPacker {
public:
    /// @brief Construct a packer using @p value_function.
    explicit CapacityPacker(ValueFunction value_function = ValueFunction::Priority) noexcept
        : value_function_(value_function) {}

    /// @brief The value function this packer maximises.
    [[nodiscard]] ValueFunction value_function() const noexcept { return value_function_; }

    /// @brief Value of a single task under the configured value function.
    [[nodiscard]] double value(const core::Task& task) const noexcept;

    /// @brief Select the value-maximising subset of @p candidates.
    ///
    /// Candidates whose worker requirement exceeds @p capacity are never
    /// selected. With zero capacity the selection is empty.
    ///
    /// @param candidates Ready tasks, in deterministic order.
    /// @param capacity   Free worker capacity.
    /// @return Selected tasks, in candidate order.
    [[nodiscard]] std::vector<const core::Task*> pack(
        const std::vector<const core::Task*>& candidates, std::size_t capacity) const;

    /// @brief Summed value of @p selection under the configured value function.
    [[nodiscard]] double total_value(const std::vector<const core::Task*>& selection) const noexcept;

private:
    ValueFunction value_function_;
};

} // namespace tasksched::algo
