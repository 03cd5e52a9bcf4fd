//! # Default Page Creator Implementation

#include "base/page_creator.hpp"

#include "log/log.hpp"

namespace polydoc::base {

using model::Documentable;
using model::DocumentableKind;
using model::PlatformFacts;
using pages::ContentKind;
using pages::ContentNode;
using pages::PageNode;

namespace {

// ============================================================================
// Content Builders
// ============================================================================

auto table(std::vector<std::string> columns, std::vector<ContentNode> rows) -> ContentNode {
    ContentNode header;
    header.kind = ContentKind::Row;
    header.style = "header";
    for (auto& column : columns) {
        header.children.push_back(ContentNode::paragraph(std::move(column)));
    }

    ContentNode node;
    node.kind = ContentKind::Table;
    node.children.push_back(std::move(header));
    for (auto& row : rows) {
        node.children.push_back(std::move(row));
    }
    return node;
}

auto row(std::vector<ContentNode> cells, std::vector<model::PlatformData> platforms)
    -> ContentNode {
    ContentNode node;
    node.kind = ContentKind::Row;
    node.children = std::move(cells);
    node.platforms = std::move(platforms);
    return node;
}

auto join(const std::vector<std::string>& items, const std::string& separator) -> std::string {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += separator;
        }
        out += item;
    }
    return out;
}

/// Full documentation block of one declaration on one platform.
auto details(const PlatformFacts& facts) -> ContentNode {
    auto block = ContentNode::group();
    if (!facts.signature.empty()) {
        block.children.push_back(ContentNode::code(facts.signature));
    }
    if (facts.deprecation) {
        std::string text = "**Deprecated**";
        if (!facts.deprecation->message.empty()) {
            text += ": " + facts.deprecation->message;
        }
        if (!facts.deprecation->since.empty()) {
            text += " (since " + facts.deprecation->since + ")";
        }
        auto note = ContentNode::paragraph(std::move(text));
        note.style = "deprecated";
        block.children.push_back(std::move(note));
    }
    if (!facts.documentation.empty()) {
        block.children.push_back(ContentNode::paragraph(facts.documentation));
    }
    if (!facts.params.empty()) {
        std::vector<ContentNode> rows;
        for (const auto& param : facts.params) {
            rows.push_back(row({ContentNode::code(param.name),
                                ContentNode::paragraph(param.description)},
                               {}));
        }
        block.children.push_back(ContentNode::header(4, "Parameters"));
        block.children.push_back(table({"Name", "Description"}, std::move(rows)));
    }
    if (!facts.since.empty()) {
        block.children.push_back(ContentNode::paragraph("Since: " + facts.since));
    }
    if (!facts.see_also.empty()) {
        block.children.push_back(ContentNode::paragraph("See also: " + join(facts.see_also, ", ")));
    }
    if (!facts.source_url.empty()) {
        block.children.push_back(ContentNode::url_link("Source", facts.source_url));
    }
    return block;
}

/// Documentation text only (module and package pages).
auto description(const PlatformFacts& facts) -> ContentNode {
    auto block = ContentNode::group();
    if (!facts.documentation.empty()) {
        block.children.push_back(ContentNode::paragraph(facts.documentation));
    }
    return block;
}

/// Signature and summary shown in member tables.
auto brief(const PlatformFacts& facts) -> ContentNode {
    auto block = ContentNode::group();
    if (!facts.signature.empty()) {
        block.children.push_back(ContentNode::code(facts.signature));
    }
    if (facts.deprecation) {
        auto note = ContentNode::paragraph("**Deprecated**");
        note.style = "deprecated";
        block.children.push_back(std::move(note));
    }
    if (!facts.summary.empty()) {
        block.children.push_back(ContentNode::paragraph(facts.summary));
    }
    return block;
}

// ============================================================================
// Sections
// ============================================================================

struct Section {
    const char* title;
    bool (*matches)(DocumentableKind);
};

auto is_type(DocumentableKind kind) -> bool {
    return model::is_classlike(kind) || kind == DocumentableKind::TypeAlias;
}

auto is_entry(DocumentableKind kind) -> bool {
    return kind == DocumentableKind::EnumEntry;
}

auto is_function(DocumentableKind kind) -> bool {
    return kind == DocumentableKind::Function;
}

auto is_property(DocumentableKind kind) -> bool {
    return kind == DocumentableKind::Property;
}

constexpr Section SECTIONS[] = {
    {"Types", is_type},
    {"Entries", is_entry},
    {"Functions", is_function},
    {"Properties", is_property},
};

void append_member_sections(ContentNode& content, const Documentable& owner) {
    for (const auto& section : SECTIONS) {
        std::vector<ContentNode> rows;
        for (const auto& child : owner.children) {
            if (!section.matches(child.kind)) {
                continue;
            }
            rows.push_back(row({ContentNode::link(child.name, child.dri),
                                platform_content(child.facts, brief)},
                               child.platforms()));
        }
        if (rows.empty()) {
            continue;
        }
        content.children.push_back(ContentNode::header(2, section.title));
        content.children.push_back(table({"Name", "Summary"}, std::move(rows)));
    }
}

// ============================================================================
// Pages
// ============================================================================

auto classlike_page(const Documentable& node) -> PageNode {
    PageNode page;
    page.kind = pages::PageKind::Content;
    page.name = node.name;
    page.dris = {node.dri};
    page.platforms = node.platforms();

    auto content = ContentNode::group();
    content.children.push_back(ContentNode::header(
        1, std::string(model::kind_to_string(node.kind)) + " " + node.name));
    content.children.push_back(platform_content(node.facts, details));
    append_member_sections(content, node);
    page.content = std::move(content);

    for (const auto& child : node.children) {
        if (model::is_classlike(child.kind)) {
            page.children.push_back(classlike_page(child));
        }
    }
    return page;
}

auto package_page(const Documentable& package) -> PageNode {
    PageNode page;
    page.kind = pages::PageKind::Content;
    page.name = package_display_name(package.name);
    page.dris = {package.dri};
    page.platforms = package.platforms();

    auto content = ContentNode::group();
    content.children.push_back(ContentNode::header(1, "Package " + page.name));
    content.children.push_back(platform_content(package.facts, description));
    append_member_sections(content, package);
    page.content = std::move(content);

    for (const auto& child : package.children) {
        if (model::is_classlike(child.kind)) {
            page.children.push_back(classlike_page(child));
        }
    }
    return page;
}

} // namespace

auto package_display_name(const std::string& package_name) -> std::string {
    return package_name.empty() ? "[root]" : package_name;
}

auto platform_content(const model::PlatformFactsMap& facts,
                      const std::function<ContentNode(const PlatformFacts&)>& render)
    -> ContentNode {
    std::vector<std::pair<ContentNode, std::vector<model::PlatformData>>> variants;
    for (const auto& [platform, value] : facts.entries()) {
        auto rendered = render(value);
        bool shared = false;
        for (auto& [variant, platforms] : variants) {
            if (variant == rendered) {
                platforms.push_back(platform);
                shared = true;
                break;
            }
        }
        if (!shared) {
            variants.emplace_back(std::move(rendered), std::vector<model::PlatformData>{platform});
        }
    }

    if (variants.empty()) {
        return ContentNode::group();
    }
    if (variants.size() == 1) {
        auto& [variant, platforms] = variants.front();
        if (variant.children.empty() && variant.text.empty()) {
            return ContentNode::group();
        }
        return variant.tagged(platforms);
    }

    ContentNode hinted;
    hinted.kind = ContentKind::PlatformHinted;
    for (auto& [variant, platforms] : variants) {
        hinted.platforms.insert(hinted.platforms.end(), platforms.begin(), platforms.end());
        hinted.children.push_back(variant.tagged(std::move(platforms)));
    }
    return hinted;
}

auto create_page_tree(const model::Module& module) -> pages::RootPageNode {
    pages::RootPageNode root;
    root.name = module.name;
    root.platforms = module.platforms();

    auto content = ContentNode::group();
    content.children.push_back(ContentNode::header(1, module.name));
    content.children.push_back(platform_content(module.facts, description));

    std::vector<ContentNode> rows;
    for (const auto& package : module.packages) {
        rows.push_back(row({ContentNode::link(package_display_name(package.name), package.dri),
                            platform_content(package.facts,
                                             [](const PlatformFacts& facts) {
                                                 auto block = ContentNode::group();
                                                 if (!facts.summary.empty()) {
                                                     block.children.push_back(
                                                         ContentNode::paragraph(facts.summary));
                                                 }
                                                 return block;
                                             })},
                           package.platforms()));
        root.children.push_back(package_page(package));
    }
    if (!rows.empty()) {
        content.children.push_back(ContentNode::header(2, "Packages"));
        content.children.push_back(table({"Name", "Summary"}, std::move(rows)));
    }
    root.content = std::move(content);
    return root;
}

auto DefaultPageCreator::create(const model::Module& module,
                                const pipeline::DocContext& /*context*/) const
    -> pipeline::PipelineResult<pages::RootPageNode> {
    auto root = create_page_tree(module);
    POLYDOC_LOG_DEBUG("pages", "created " << pages::count_pages(root) << " page(s) for module '"
                                          << module.name << "'");
    return root;
}

} // namespace polydoc::base
