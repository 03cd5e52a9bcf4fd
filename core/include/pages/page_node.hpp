//! # Page Tree
//!
//! The output-oriented hierarchy handed to renderers. Built once by the
//! page translator, then passed through the page transform chain; each
//! transform returns a new tree.

#ifndef POLYDOC_PAGES_PAGE_NODE_HPP
#define POLYDOC_PAGES_PAGE_NODE_HPP

#include "pages/content.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace polydoc::pages {

enum class PageKind {
    Content,          ///< Documentation of one package or classlike.
    RendererSpecific, ///< Asset or generated file written verbatim (navigation, search index).
    MultiModule,      ///< Landing page listing modules.
    Grouped,          ///< Synthetic grouping page (alphabetical index).
};

[[nodiscard]] auto page_kind_to_string(PageKind kind) -> std::string_view;

/// How a renderer-specific page is materialized.
struct RenderingStrategy {
    enum class Kind {
        Write,     ///< Write `payload` as the file content.
        Copy,      ///< Copy the file at path `payload`.
        DoNothing, ///< Placeholder; no output.
    };

    Kind kind = Kind::DoNothing;
    std::string payload;

    static auto write(std::string text) -> RenderingStrategy {
        return RenderingStrategy{Kind::Write, std::move(text)};
    }
    static auto copy(std::string source_path) -> RenderingStrategy {
        return RenderingStrategy{Kind::Copy, std::move(source_path)};
    }

    [[nodiscard]] auto operator==(const RenderingStrategy& other) const -> bool = default;
};

struct PageNode {
    PageKind kind = PageKind::Content;
    std::string name;                    ///< Display name.
    std::vector<DRI> dris;               ///< Declarations documented on this page.
    std::vector<PlatformData> platforms; ///< Platforms the page covers.
    ContentNode content;
    std::vector<PageNode> children; ///< Owned sub-pages, in creation order.

    std::string target_path;     ///< Renderer-specific pages: output path relative to root.
    RenderingStrategy strategy;  ///< Renderer-specific pages only.

    [[nodiscard]] auto operator==(const PageNode& other) const -> bool = default;
};

/// The single root of a page tree.
struct RootPageNode {
    std::string name; ///< Module name.
    std::vector<PlatformData> platforms;
    ContentNode content;
    std::vector<PageNode> children;

    [[nodiscard]] auto operator==(const RootPageNode& other) const -> bool = default;
};

/// Visits every page below `root` depth-first in child order.
/// The callback receives the page and the names of its ancestors (root excluded).
void walk_pages(const RootPageNode& root,
                const std::function<void(const PageNode&, const std::vector<std::string>&)>& fn);

/// Number of pages below the root (the root itself is not counted).
[[nodiscard]] auto count_pages(const RootPageNode& root) -> size_t;

/// Finds the first page whose `dris` contains `dri`.
[[nodiscard]] auto find_page(const RootPageNode& root, const DRI& dri) -> const PageNode*;

} // namespace polydoc::pages

#endif // POLYDOC_PAGES_PAGE_NODE_HPP
