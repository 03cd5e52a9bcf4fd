//! # Stable Dependency Ordering Implementation
//!
//! Kahn's algorithm with the ready set kept ordered by insertion index:
//! - pending_[i]: number of unmet predecessors of item i
//! - ready: items with no unmet predecessors, smallest index first

#include "common/ordering.hpp"

namespace polydoc {

DependencyOrder::DependencyOrder(size_t count) : count_(count), successors_(count) {}

void DependencyOrder::add_edge(size_t first, size_t second) {
    if (first == second || first >= count_ || second >= count_) {
        return;
    }
    successors_[first].insert(second);
}

auto DependencyOrder::sort() -> bool {
    order_.clear();
    unresolved_.clear();

    std::vector<size_t> pending(count_, 0);
    for (const auto& next : successors_) {
        for (size_t succ : next) {
            ++pending[succ];
        }
    }

    std::set<size_t> ready;
    for (size_t i = 0; i < count_; ++i) {
        if (pending[i] == 0) {
            ready.insert(i);
        }
    }

    while (!ready.empty()) {
        size_t item = *ready.begin();
        ready.erase(ready.begin());
        order_.push_back(item);

        for (size_t succ : successors_[item]) {
            if (--pending[succ] == 0) {
                ready.insert(succ);
            }
        }
    }

    if (order_.size() == count_) {
        return true;
    }

    for (size_t i = 0; i < count_; ++i) {
        if (pending[i] > 0) {
            unresolved_.push_back(i);
        }
    }
    return false;
}

} // namespace polydoc
