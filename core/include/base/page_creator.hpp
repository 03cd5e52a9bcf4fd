//! # Default Page Creator
//!
//! Builds the page tree from the final documentation model:
//!
//! ```text
//! root (module)
//! ├── package a.b
//! │   ├── class C
//! │   │   └── class C.Inner
//! │   └── interface I
//! └── package a.c
//! ```
//!
//! Members (functions, properties, enum entries, type aliases) are rows in
//! a table on the owning page. Facts that differ between platforms are shown
//! as `PlatformHinted` content with one variant per distinct rendering;
//! platforms that render identically share one variant.
//!
//! The output depends only on the model, so equal models give equal trees.

#ifndef POLYDOC_BASE_PAGE_CREATOR_HPP
#define POLYDOC_BASE_PAGE_CREATOR_HPP

#include "plugin/core_extensions.hpp"

#include <functional>

namespace polydoc::base {

/// Display name of a package; the root package is shown as `[root]`.
[[nodiscard]] auto package_display_name(const std::string& package_name) -> std::string;

/// Renders `facts` per platform with `render` and collapses equal variants.
///
/// Returns a group tagged with all platforms when every platform renders
/// the same, otherwise a `PlatformHinted` node with one tagged group per
/// distinct variant in first-appearance order.
[[nodiscard]] auto platform_content(
    const model::PlatformFactsMap& facts,
    const std::function<pages::ContentNode(const model::PlatformFacts&)>& render)
    -> pages::ContentNode;

/// Builds pages without a pipeline context.
[[nodiscard]] auto create_page_tree(const model::Module& module) -> pages::RootPageNode;

class DefaultPageCreator : public plugin::PageCreator {
public:
    [[nodiscard]] auto create(const model::Module& module,
                              const pipeline::DocContext& context) const
        -> pipeline::PipelineResult<pages::RootPageNode> override;
};

} // namespace polydoc::base

#endif // POLYDOC_BASE_PAGE_CREATOR_HPP
