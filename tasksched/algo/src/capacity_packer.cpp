#include <tasksched/algo/capacity_packer.hpp>

#include <algorithm>

namespace tasksched::algo {

std::string_view to_string(ValueFunction vf) noexcept {
    switch (vf) {
        case ValueFunction::Priority:
            return "priority";
        case ValueFunction::PriorityPerUnit:
            return "priority_per_unit";
    }
    return "priority";
}

double CapacityPacker::value(const core::Task& task) const noexcept {
    if (value_function_ == ValueFunction::PriorityPerUnit) {
        return task.priority() / static_cast<double>(task.duration().count());
    }
    return task.priority();
}

std::vector<const core::Task*> CapacityPacker::pack(
    const std::vector<const core::Task*>& candidates, std::size_t capacity) const {
    if (capacity == 0 || candidates.empty()) {
        return {};
    }

    // best[w]: max value using at most w workers; chosen[w]: candidate indices achieving it
    std::vector<double> best(capacity + 1, 0.0);
    std::vector<std::vector<std::size_t>> chosen(capacity + 1);

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        std::size_t weight = candidates[i]->workers_required();
        if (weight > capacity) {
            continue;
        }
        double task_value = value(*candidates[i]);

        // weight >= 1 (Task invariant), so w never wraps
        for (std::size_t w = capacity; w >= weight; --w) {
            double with_task = best[w - weight] + task_value;
            if (with_task > best[w]) {
                best[w] = with_task;
                chosen[w] = chosen[w - weight];
                chosen[w].push_back(i);
            }
        }
    }

    // First maximum: equal value with fewer workers leaves capacity idle
    auto best_it = std::max_element(best.begin(), best.end());
    const auto& indices = chosen[static_cast<std::size_t>(best_it - best.begin())];

    std::vector<const core::Task*> selection;
    selection.reserve(indices.size());
    for (std::size_t idx : indices) {
        selection.push_back(candidates[idx]);
    }
    return selection;
}

double CapacityPacker::total_value(const std::vector<const core::Task*>& selection) const noexcept {
    double total = 0.0;
    for (const auto* task : selection) {
        total += value(*task);
    }
    return total;
}

} // namespace tasksched::algo
