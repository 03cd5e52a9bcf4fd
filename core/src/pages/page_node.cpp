//! # Page Tree Implementation
//!
//! Content factories and page tree traversal.

#include "pages/page_node.hpp"

#include <algorithm>

namespace polydoc::pages {

auto content_kind_to_string(ContentKind kind) -> std::string_view {
    switch (kind) {
    case ContentKind::Group:
        return "group";
    case ContentKind::Header:
        return "header";
    case ContentKind::Text:
        return "text";
    case ContentKind::Code:
        return "code";
    case ContentKind::Table:
        return "table";
    case ContentKind::Row:
        return "row";
    case ContentKind::Link:
        return "link";
    case ContentKind::PlatformHinted:
        return "platform_hinted";
    case ContentKind::Break:
        return "break";
    }
    return "unknown";
}

auto page_kind_to_string(PageKind kind) -> std::string_view {
    switch (kind) {
    case PageKind::Content:
        return "content";
    case PageKind::RendererSpecific:
        return "renderer_specific";
    case PageKind::MultiModule:
        return "multi_module";
    case PageKind::Grouped:
        return "grouped";
    }
    return "unknown";
}

// ============================================================================
// ContentNode
// ============================================================================

auto ContentNode::group(std::vector<ContentNode> children, std::string style) -> ContentNode {
    ContentNode node;
    node.kind = ContentKind::Group;
    node.children = std::move(children);
    node.style = std::move(style);
    return node;
}

auto ContentNode::header(int level, std::string text) -> ContentNode {
    ContentNode node;
    node.kind = ContentKind::Header;
    node.level = std::clamp(level, 1, 6);
    node.text = std::move(text);
    return node;
}

auto ContentNode::paragraph(std::string text) -> ContentNode {
    ContentNode node;
    node.kind = ContentKind::Text;
    node.text = std::move(text);
    return node;
}

auto ContentNode::code(std::string text) -> ContentNode {
    ContentNode node;
    node.kind = ContentKind::Code;
    node.text = std::move(text);
    return node;
}

auto ContentNode::link(std::string text, DRI target) -> ContentNode {
    ContentNode node;
    node.kind = ContentKind::Link;
    node.text = std::move(text);
    node.target = std::move(target);
    return node;
}

auto ContentNode::url_link(std::string text, std::string url) -> ContentNode {
    ContentNode node;
    node.kind = ContentKind::Link;
    node.text = std::move(text);
    node.url = std::move(url);
    return node;
}

auto ContentNode::separator() -> ContentNode {
    ContentNode node;
    node.kind = ContentKind::Break;
    return node;
}

auto ContentNode::tagged(std::vector<PlatformData> tag) const -> ContentNode {
    ContentNode copy = *this;
    copy.platforms = std::move(tag);
    return copy;
}

auto ContentNode::plain_text() const -> std::string {
    std::string out = text;
    for (const auto& child : children) {
        auto inner = child.plain_text();
        if (inner.empty()) {
            continue;
        }
        if (!out.empty()) {
            out += ' ';
        }
        out += inner;
    }
    return out;
}

// ============================================================================
// Traversal
// ============================================================================

namespace {

void walk(const PageNode& page, std::vector<std::string>& ancestors,
          const std::function<void(const PageNode&, const std::vector<std::string>&)>& fn) {
    fn(page, ancestors);
    ancestors.push_back(page.name);
    for (const auto& child : page.children) {
        walk(child, ancestors, fn);
    }
    ancestors.pop_back();
}

} // namespace

void walk_pages(const RootPageNode& root,
                const std::function<void(const PageNode&, const std::vector<std::string>&)>& fn) {
    std::vector<std::string> ancestors;
    for (const auto& child : root.children) {
        walk(child, ancestors, fn);
    }
}

auto count_pages(const RootPageNode& root) -> size_t {
    size_t total = 0;
    walk_pages(root, [&](const PageNode&, const std::vector<std::string>&) { ++total; });
    return total;
}

auto find_page(const RootPageNode& root, const DRI& dri) -> const PageNode* {
    const PageNode* found = nullptr;
    walk_pages(root, [&](const PageNode& page, const std::vector<std::string>&) {
        if (found) {
            return;
        }
        if (std::find(page.dris.begin(), page.dris.end(), dri) != page.dris.end()) {
            found = &page;
        }
    });
    return found;
}

} // namespace polydoc::pages
