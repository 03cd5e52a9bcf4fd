//! # Default Documentable Merger
//!
//! Combines the per-platform modules into one module.
//!
//! ## Algorithm
//!
//! Declarations are matched by DRI at every level of the tree:
//!
//! ```text
//! jvm: pkg ─ C(jvm)          js: pkg ─ C(js) ─ f(js)
//!                  ╲               ╱
//!              merged: pkg ─ C(jvm, js) ─ f(js)
//! ```
//!
//! - Nodes are emitted in the order their DRI first appears in the input.
//! - Platform facts are unioned; for a platform seen twice the first value wins.
//! - A declaration present in one input only keeps its single platform.
//!
//! Merging a single module returns it unchanged.

#ifndef POLYDOC_BASE_MERGER_HPP
#define POLYDOC_BASE_MERGER_HPP

#include "plugin/core_extensions.hpp"

#include <vector>

namespace polydoc::base {

/// Merges `modules` without a pipeline context.
///
/// Returns a configuration error when `modules` is empty (no platforms).
[[nodiscard]] auto merge_modules(const std::vector<model::Module>& modules)
    -> pipeline::PipelineResult<model::Module>;

class DefaultDocumentableMerger : public plugin::DocumentableMerger {
public:
    [[nodiscard]] auto merge(const std::vector<model::Module>& modules,
                             const pipeline::DocContext& context) const
        -> pipeline::PipelineResult<model::Module> override;
};

} // namespace polydoc::base

#endif // POLYDOC_BASE_MERGER_HPP
