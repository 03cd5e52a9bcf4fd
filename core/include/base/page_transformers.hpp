//! # Base Page Transforms
//!
//! | Id              | Adds                                                     |
//! |-----------------|----------------------------------------------------------|
//! | `navigation`    | Grouped page `navigation`: nested list of content pages  |
//! | `index_pages`   | Grouped pages `alltypes` and `alphabetical-index`        |
//! | `search_index`  | Renderer-specific `<module>/search-index.json`           |
//!
//! Each transform appends its pages after the existing children of the root
//! and leaves the existing pages untouched.

#ifndef POLYDOC_BASE_PAGE_TRANSFORMERS_HPP
#define POLYDOC_BASE_PAGE_TRANSFORMERS_HPP

#include "plugin/core_extensions.hpp"

#include <string>

namespace polydoc::base {

inline constexpr const char* NAVIGATION_PAGE = "navigation";
inline constexpr const char* ALL_TYPES_PAGE = "alltypes";
inline constexpr const char* ALPHABETICAL_INDEX_PAGE = "alphabetical-index";
inline constexpr const char* SEARCH_INDEX_FILE = "search-index.json";

/// JSON array of `{"name", "dri", "platforms"}` objects, one per
/// content page, in page tree order.
[[nodiscard]] auto build_search_index(const pages::RootPageNode& root) -> std::string;

class NavigationPageTransformer : public plugin::PageTransformer {
public:
    [[nodiscard]] auto transform(const pages::RootPageNode& root,
                                 const pipeline::DocContext& context) const
        -> pipeline::PipelineResult<pages::RootPageNode> override;
};

class IndexPagesTransformer : public plugin::PageTransformer {
public:
    [[nodiscard]] auto transform(const pages::RootPageNode& root,
                                 const pipeline::DocContext& context) const
        -> pipeline::PipelineResult<pages::RootPageNode> override;
};

class SearchIndexTransformer : public plugin::PageTransformer {
public:
    [[nodiscard]] auto transform(const pages::RootPageNode& root,
                                 const pipeline::DocContext& context) const
        -> pipeline::PipelineResult<pages::RootPageNode> override;
};

} // namespace polydoc::base

#endif // POLYDOC_BASE_PAGE_TRANSFORMERS_HPP
