#include "query/query_deps.hpp"

#include <algorithm>

namespace weave::query {

void DependencyTracker::push_active(const QueryKey& key) {
    std::lock_guard lock(mutex_);
    state_stack_.push_back({key, {}});
}

void DependencyTracker::pop_active() {
    std::lock_guard lock(mutex_);
    if (!state_stack_.empty()) {
        state_stack_.pop_back();
    }
}

void DependencyTracker::record_dependency(const QueryKey& callee) {
    std::lock_guard lock(mutex_);
    if (state_stack_.empty()) {
        return;
    }
    auto& deps = state_stack_.back().dependencies;
    if (std::find(deps.begin(), deps.end(), callee) == deps.end()) {
        deps.push_back(callee);
    }
}

std::vector<QueryKey> DependencyTracker::current_dependencies() const {
    std::lock_guard lock(mutex_);
    if (state_stack_.empty()) {
        return {};
    }
    return state_stack_.back().dependencies;
}

std::optional<std::vector<QueryKey>> DependencyTracker::detect_cycle(const QueryKey& key) const {
    std::lock_guard lock(mutex_);

    for (size_t i = 0; i < state_stack_.size(); ++i) {
        if (state_stack_[i].key == key) {
            // Path from the first occurrence to the top of the stack, closed by `key`
            std::vector<QueryKey> cycle;
            for (size_t j = i; j < state_stack_.size(); ++j) {
                cycle.push_back(state_stack_[j].key);
            }
            cycle.push_back(key);
            return cycle;
        }
    }
    return std::nullopt;
}

size_t DependencyTracker::depth() const {
    std::lock_guard lock(mutex_);
    return state_stack_.size();
}

void DependencyTracker::clear() {
    std::lock_guard lock(mutex_);
    state_stack_.clear();
}

} // namespace weave::query
