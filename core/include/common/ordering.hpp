//! # Stable Dependency Ordering
//!
//! Orders items given "a runs before b" constraints. Among items whose
//! constraints are satisfied, the one added first is emitted first, so an
//! unconstrained set keeps its insertion order.
//!
//! Used for plugin initialization order and for ordering registrations on a
//! multi extension point.

#ifndef POLYDOC_COMMON_ORDERING_HPP
#define POLYDOC_COMMON_ORDERING_HPP

#include <cstddef>
#include <set>
#include <vector>

namespace polydoc {

class DependencyOrder {
public:
    explicit DependencyOrder(size_t count);

    /// Requires item `first` to be ordered before item `second`.
    void add_edge(size_t first, size_t second);

    /// Computes the order. Returns false when the constraints contain a cycle.
    [[nodiscard]] auto sort() -> bool;

    /// Item indices in their resolved order (valid after a successful sort).
    [[nodiscard]] auto order() const -> const std::vector<size_t>& {
        return order_;
    }

    /// Items that could not be ordered because they sit on or behind a cycle.
    [[nodiscard]] auto unresolved() const -> const std::vector<size_t>& {
        return unresolved_;
    }

private:
    size_t count_;
    std::vector<std::set<size_t>> successors_;
    std::vector<size_t> order_;
    std::vector<size_t> unresolved_;
};

} // namespace polydoc

#endif // POLYDOC_COMMON_ORDERING_HPP
