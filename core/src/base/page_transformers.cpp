//! # Base Page Transforms Implementation

#include "base/page_transformers.hpp"

#include "common/json_escape.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace polydoc::base {

using pages::ContentKind;
using pages::ContentNode;
using pages::PageKind;
using pages::PageNode;

namespace {

auto is_documentation_page(const PageNode& page) -> bool {
    return page.kind == PageKind::Content && !page.dris.empty();
}

auto navigation_list(const std::vector<PageNode>& pages) -> ContentNode {
    auto list = ContentNode::group({}, "list");
    for (const auto& page : pages) {
        if (!is_documentation_page(page)) {
            continue;
        }
        auto item = ContentNode::group({ContentNode::link(page.name, page.dris.front())}, "item");
        auto nested = navigation_list(page.children);
        if (!nested.children.empty()) {
            item.children.push_back(std::move(nested));
        }
        list.children.push_back(std::move(item));
    }
    return list;
}

auto grouped_page(std::string name, const pages::RootPageNode& root, ContentNode content)
    -> PageNode {
    PageNode page;
    page.kind = PageKind::Grouped;
    page.name = std::move(name);
    page.platforms = root.platforms;
    page.content = std::move(content);
    return page;
}

struct IndexEntry {
    std::string name;
    std::string location; ///< Package of a type, empty for packages.
    pages::DRI dri;
};

auto lowercase(const std::string& text) -> std::string {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto index_row(const IndexEntry& entry) -> ContentNode {
    ContentNode row;
    row.kind = ContentKind::Row;
    row.children.push_back(ContentNode::link(entry.name, entry.dri));
    row.children.push_back(ContentNode::paragraph(entry.location));
    return row;
}

auto index_table(const std::vector<IndexEntry>& entries, const char* location_column)
    -> ContentNode {
    ContentNode header;
    header.kind = ContentKind::Row;
    header.style = "header";
    header.children.push_back(ContentNode::paragraph("Name"));
    header.children.push_back(ContentNode::paragraph(location_column));

    ContentNode table;
    table.kind = ContentKind::Table;
    table.children.push_back(std::move(header));
    for (const auto& entry : entries) {
        table.children.push_back(index_row(entry));
    }
    return table;
}

auto by_name(const IndexEntry& a, const IndexEntry& b) -> bool {
    auto left = lowercase(a.name);
    auto right = lowercase(b.name);
    if (left != right) {
        return left < right;
    }
    if (a.name != b.name) {
        return a.name < b.name;
    }
    return a.dri < b.dri;
}

} // namespace

auto build_search_index(const pages::RootPageNode& root) -> std::string {
    std::ostringstream out;
    out << "[";
    bool first = true;
    pages::walk_pages(root, [&](const PageNode& page, const std::vector<std::string>&) {
        if (!is_documentation_page(page)) {
            return;
        }
        if (!first) {
            out << ",";
        }
        first = false;
        out << "\n  {\"name\": \"" << json_escape(page.name) << "\", \"dri\": \""
            << json_escape(page.dris.front().to_string()) << "\", \"platforms\": [";
        for (size_t i = 0; i < page.platforms.size(); ++i) {
            if (i > 0) {
                out << ", ";
            }
            out << "\"" << json_escape(page.platforms[i].display_name()) << "\"";
        }
        out << "]}";
    });
    out << (first ? "]\n" : "\n]\n");
    return out.str();
}

// ============================================================================
// Navigation
// ============================================================================

auto NavigationPageTransformer::transform(const pages::RootPageNode& root,
                                          const pipeline::DocContext& /*context*/) const
    -> pipeline::PipelineResult<pages::RootPageNode> {
    pages::RootPageNode out = root;
    auto content = ContentNode::group();
    content.children.push_back(ContentNode::header(1, root.name));
    content.children.push_back(navigation_list(root.children));
    out.children.push_back(grouped_page(NAVIGATION_PAGE, root, std::move(content)));
    return out;
}

// ============================================================================
// Index Pages
// ============================================================================

auto IndexPagesTransformer::transform(const pages::RootPageNode& root,
                                      const pipeline::DocContext& /*context*/) const
    -> pipeline::PipelineResult<pages::RootPageNode> {
    std::vector<IndexEntry> types;
    std::vector<IndexEntry> everything;

    pages::walk_pages(root, [&](const PageNode& page, const std::vector<std::string>& ancestors) {
        if (!is_documentation_page(page)) {
            return;
        }
        if (ancestors.empty()) {
            everything.push_back(IndexEntry{page.name, "", page.dris.front()});
            return;
        }
        std::string qualified;
        for (size_t i = 1; i < ancestors.size(); ++i) {
            qualified += ancestors[i] + ".";
        }
        qualified += page.name;
        types.push_back(IndexEntry{qualified, ancestors.front(), page.dris.front()});
        everything.push_back(IndexEntry{page.name, ancestors.front(), page.dris.front()});
    });

    std::stable_sort(types.begin(), types.end(), by_name);
    std::stable_sort(everything.begin(), everything.end(), by_name);

    pages::RootPageNode out = root;

    auto all_types = ContentNode::group();
    all_types.children.push_back(ContentNode::header(1, "All Types"));
    if (!types.empty()) {
        all_types.children.push_back(index_table(types, "Package"));
    }
    out.children.push_back(grouped_page(ALL_TYPES_PAGE, root, std::move(all_types)));

    auto index = ContentNode::group();
    index.children.push_back(ContentNode::header(1, "Index"));
    size_t i = 0;
    while (i < everything.size()) {
        auto letter = static_cast<char>(
            std::toupper(static_cast<unsigned char>(everything[i].name.empty()
                                                        ? '#'
                                                        : everything[i].name.front())));
        std::vector<IndexEntry> bucket;
        while (i < everything.size()) {
            const auto& name = everything[i].name;
            auto current = static_cast<char>(
                std::toupper(static_cast<unsigned char>(name.empty() ? '#' : name.front())));
            if (current != letter) {
                break;
            }
            bucket.push_back(everything[i]);
            ++i;
        }
        index.children.push_back(ContentNode::header(2, std::string(1, letter)));
        index.children.push_back(index_table(bucket, "Location"));
    }
    out.children.push_back(grouped_page(ALPHABETICAL_INDEX_PAGE, root, std::move(index)));

    POLYDOC_LOG_DEBUG("pages", "index pages list " << types.size() << " type(s) and "
                                                   << everything.size() << " entr"
                                                   << (everything.size() == 1 ? "y" : "ies"));
    return out;
}

// ============================================================================
// Search Index
// ============================================================================

auto SearchIndexTransformer::transform(const pages::RootPageNode& root,
                                       const pipeline::DocContext& /*context*/) const
    -> pipeline::PipelineResult<pages::RootPageNode> {
    pages::RootPageNode out = root;

    PageNode page;
    page.kind = PageKind::RendererSpecific;
    page.name = SEARCH_INDEX_FILE;
    page.platforms = root.platforms;
    page.target_path = root.name + "/" + SEARCH_INDEX_FILE;
    page.strategy = pages::RenderingStrategy::write(build_search_index(root));
    out.children.push_back(std::move(page));
    return out;
}

} // namespace polydoc::base
