#include <tasksched/algo/diagnostics.hpp>

#include <algorithm>
#include <unordered_map>
#include <utility>

namespace tasksched::algo {

namespace {

// Tarjan's strongly connected components over task -> dependency edges
class CycleFinder {
public:
    CycleFinder(const core::TaskRegistry& registry, const std::set<core::TaskId>& completed)
        : registry_(registry)
        , completed_(completed) {}

    std::vector<std::vector<core::TaskId>> run() {
        for (const auto& [id, task] : registry_) {
            if (!completed_.contains(id) && !index_.contains(id)) {
                visit(id);
            }
        }
        std::sort(cycles_.begin(), cycles_.end());
        return std::move(cycles_);
    }

private:
    struct NodeState {
        std::size_t index;
        std::size_t lowlink;
        bool on_stack;
    };

    bool in_graph(const core::TaskId& id) const {
        return registry_.contains(id) && !completed_.contains(id);
    }

    void visit(const core::TaskId& id) {
        index_.emplace(id, NodeState{next_index_, next_index_, true});
        ++next_index_;
        stack_.push_back(id);

        for (const auto& dep : registry_.at(id).dependencies()) {
            if (!in_graph(dep)) {
                continue;
            }
            auto it = index_.find(dep);
            if (it == index_.end()) {
                visit(dep);
                index_.at(id).lowlink = std::min(index_.at(id).lowlink, index_.at(dep).lowlink);
            } else if (it->second.on_stack) {
                index_.at(id).lowlink = std::min(index_.at(id).lowlink, it->second.index);
            }
        }

        NodeState& state = index_.at(id);
        if (state.lowlink != state.index) {
            return;
        }

        std::vector<core::TaskId> component;
        core::TaskId member;
        do {
            member = stack_.back();
            stack_.pop_back();
            index_.at(member).on_stack = false;
            component.push_back(member);
        } while (member != id);

        bool self_loop = registry_.at(id).depends_on(id);
        if (component.size() > 1 || self_loop) {
            std::sort(component.begin(), component.end());
            cycles_.push_back(std::move(component));
        }
    }

    const core::TaskRegistry& registry_;
    const std::set<core::TaskId>& completed_;
    std::unordered_map<core::TaskId, NodeState> index_;
    std::vector<core::TaskId> stack_;
    std::vector<std::vector<core::TaskId>> cycles_;
    std::size_t next_index_{0};
};

} // anonymous namespace

std::map<core::TaskId, std::vector<core::TaskId>> blocked_on_missing_dependencies(
    const core::TaskRegistry& registry, const std::set<core::TaskId>& completed) {
    std::map<core::TaskId, std::vector<core::TaskId>> blocked;
    for (const auto& [id, task] : registry) {
        if (completed.contains(id)) {
            continue;
        }
        for (const auto& dep : task.dependencies()) {
            if (!registry.contains(dep) && !completed.contains(dep)) {
                blocked[id].push_back(dep);
            }
        }
    }
    return blocked;
}

std::vector<core::TaskId> oversized_tasks(const core::TaskRegistry& registry, std::size_t capacity) {
    std::vector<core::TaskId> ids;
    for (const auto& [id, task] : registry) {
        if (task.workers_required() > capacity) {
            ids.push_back(id);
        }
    }
    return ids;
}

std::vector<std::vector<core::TaskId>> dependency_cycles(const core::TaskRegistry& registry,
                                                         const std::set<core::TaskId>& completed) {
    return CycleFinder(registry, completed).run();
}

} // namespace tasksched::algo
