//! # Markdown Renderer Implementation

#include "render/markdown_renderer.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <sstream>

namespace polydoc::render {

using pages::ContentKind;
using pages::ContentNode;
using pages::PageKind;
using pages::PageNode;

namespace {

/// File-name safe form of a page or package name.
auto slug(const std::string& name) -> std::string {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '.' || c == '-' || c == '_') {
            out += c;
        } else {
            out += '_';
        }
    }
    return out.empty() ? "_" : out;
}

auto platform_labels(const std::vector<model::PlatformData>& platforms) -> std::string {
    std::string out;
    for (const auto& platform : platforms) {
        if (!out.empty()) {
            out += ", ";
        }
        out += platform.display_name();
    }
    return out;
}

auto single_line(const std::string& text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\n') {
            out += ' ';
        } else if (c == '|') {
            out += "\\|";
        } else if (c != '\r') {
            out += c;
        }
    }
    return out;
}

class MarkdownWriter {
public:
    MarkdownWriter(const PageLocations& locations, std::string path)
        : locations_(locations), path_(std::move(path)) {}

    void block(const ContentNode& node) {
        switch (node.kind) {
        case ContentKind::Group:
            if (node.style == "list") {
                list(node, 0);
                out_ << "\n";
                return;
            }
            for (const auto& child : node.children) {
                block(child);
            }
            return;
        case ContentKind::Header:
            out_ << std::string(static_cast<size_t>(node.level), '#') << " " << node.text
                 << "\n\n";
            return;
        case ContentKind::Text:
            if (!node.text.empty()) {
                out_ << node.text << "\n\n";
            }
            return;
        case ContentKind::Code:
            out_ << "```\n" << node.text << "\n```\n\n";
            return;
        case ContentKind::Table:
            table(node);
            return;
        case ContentKind::Row:
        case ContentKind::Link:
            out_ << inline_text(node) << "\n\n";
            return;
        case ContentKind::PlatformHinted:
            for (const auto& variant : node.children) {
                out_ << "**" << platform_labels(variant.platforms) << "**\n\n";
                block(variant);
            }
            return;
        case ContentKind::Break:
            out_ << "---\n\n";
            return;
        }
    }

    [[nodiscard]] auto str() const -> std::string {
        return out_.str();
    }

private:
    auto inline_text(const ContentNode& node) -> std::string {
        switch (node.kind) {
        case ContentKind::Header:
        case ContentKind::Text:
            return single_line(node.text);
        case ContentKind::Code:
            return node.text.empty() ? std::string() : "`" + single_line(node.text) + "`";
        case ContentKind::Link:
            return link(node);
        case ContentKind::PlatformHinted: {
            std::string out;
            for (const auto& variant : node.children) {
                auto text = inline_text(variant);
                if (text.empty()) {
                    continue;
                }
                if (!out.empty()) {
                    out += "<br>";
                }
                out += "**" + platform_labels(variant.platforms) + "**: " + text;
            }
            return out;
        }
        case ContentKind::Break:
            return "";
        case ContentKind::Group:
        case ContentKind::Table:
        case ContentKind::Row:
            break;
        }

        std::string out;
        for (const auto& child : node.children) {
            auto text = inline_text(child);
            if (text.empty()) {
                continue;
            }
            if (!out.empty()) {
                out += ' ';
            }
            out += text;
        }
        return out;
    }

    auto link(const ContentNode& node) -> std::string {
        std::string text = single_line(node.text);
        if (!node.url.empty()) {
            return "[" + text + "](" + node.url + ")";
        }
        if (node.target) {
            if (const auto* target = locations_.resolve(*node.target)) {
                return "[" + text + "](" + relative_link(path_, *target) + ")";
            }
        }
        return text;
    }

    void table(const ContentNode& node) {
        if (node.children.empty()) {
            return;
        }

        size_t start = 0;
        std::vector<std::string> header;
        if (node.children.front().style == "header") {
            for (const auto& cell : node.children.front().children) {
                header.push_back(inline_text(cell));
            }
            start = 1;
        } else {
            header.assign(node.children.front().children.size(), "");
        }
        if (header.empty()) {
            header.push_back("");
        }

        out_ << "|";
        for (const auto& column : header) {
            out_ << " " << column << " |";
        }
        out_ << "\n|";
        for (size_t i = 0; i < header.size(); ++i) {
            out_ << "---|";
        }
        out_ << "\n";

        for (size_t i = start; i < node.children.size(); ++i) {
            out_ << "|";
            for (const auto& cell : node.children[i].children) {
                out_ << " " << inline_text(cell) << " |";
            }
            out_ << "\n";
        }
        out_ << "\n";
    }

    void list(const ContentNode& node, size_t depth) {
        for (const auto& item : node.children) {
            std::string line;
            const ContentNode* nested = nullptr;
            for (const auto& part : item.children) {
                if (part.kind == ContentKind::Group && part.style == "list") {
                    nested = &part;
                    continue;
                }
                auto text = inline_text(part);
                if (!text.empty()) {
                    if (!line.empty()) {
                        line += ' ';
                    }
                    line += text;
                }
            }
            out_ << std::string(depth * 2, ' ') << "- " << line << "\n";
            if (nested) {
                list(*nested, depth + 1);
            }
        }
    }

    const PageLocations& locations_;
    std::string path_;
    std::ostringstream out_;
};

} // namespace

// ============================================================================
// PageLocations
// ============================================================================

PageLocations::PageLocations(const pages::RootPageNode& root) {
    std::string module_dir = slug(root.name);
    root_path_ = module_dir + "/index.md";

    pages::walk_pages(root, [&](const PageNode& page, const std::vector<std::string>& ancestors) {
        std::string path;
        if (page.kind == PageKind::RendererSpecific) {
            path = page.target_path;
        } else if (page.kind == PageKind::Content && !page.dris.empty()) {
            if (ancestors.empty()) {
                path = module_dir + "/" + slug(page.name) + "/index.md";
            } else {
                std::string file;
                for (size_t i = 1; i < ancestors.size(); ++i) {
                    file += ancestors[i] + ".";
                }
                file += page.name;
                path = module_dir + "/" + slug(ancestors.front()) + "/" + slug(file) + ".md";
            }
        } else {
            std::string file;
            for (const auto& ancestor : ancestors) {
                file += ancestor + ".";
            }
            file += page.name;
            path = module_dir + "/" + slug(file) + ".md";
        }

        by_page_.emplace(&page, path);
        for (const auto& dri : page.dris) {
            by_dri_.emplace(dri, path);
        }
    });
}

auto PageLocations::resolve(const model::DRI& dri) const -> const std::string* {
    std::optional<model::DRI> current = dri;
    while (current) {
        auto it = by_dri_.find(*current);
        if (it != by_dri_.end()) {
            return &it->second;
        }
        current = current->parent();
    }
    return nullptr;
}

auto PageLocations::path_of(const PageNode& page) const -> const std::string* {
    auto it = by_page_.find(&page);
    return it != by_page_.end() ? &it->second : nullptr;
}

auto relative_link(const std::string& from, const std::string& to) -> std::string {
    std::filesystem::path base = std::filesystem::path(from).parent_path();
    auto relative = std::filesystem::path(to).lexically_relative(base);
    if (relative.empty()) {
        return to;
    }
    return relative.generic_string();
}

// ============================================================================
// MarkdownRenderer
// ============================================================================

auto MarkdownRenderer::render_content(const ContentNode& content, const PageLocations& locations,
                                      const std::string& path) -> std::string {
    MarkdownWriter writer(locations, path);
    writer.block(content);
    return writer.str();
}

auto MarkdownRenderer::render_tree(const pages::RootPageNode& root) const
    -> pipeline::PipelineResult<size_t> {
    PageLocations locations(root);
    size_t files = 0;

    auto write = [&](const std::string& path, const std::string& text) -> std::optional<std::string> {
        auto written = writer_->write(path, text);
        if (is_err(written)) {
            return unwrap_err(written);
        }
        POLYDOC_LOG_TRACE("render", "wrote " << path);
        ++files;
        return std::nullopt;
    };

    if (auto failure = write(locations.root_path(),
                             render_content(root.content, locations, locations.root_path()))) {
        return pipeline::PipelineError::stage_failure("", *failure);
    }

    std::optional<std::string> failure;
    pages::walk_pages(root, [&](const PageNode& page, const std::vector<std::string>&) {
        if (failure) {
            return;
        }
        const auto* path = locations.path_of(page);
        if (!path) {
            failure = "no output path for page '" + page.name + "'";
            return;
        }

        if (page.kind != PageKind::RendererSpecific) {
            failure = write(*path, render_content(page.content, locations, *path));
            return;
        }

        switch (page.strategy.kind) {
        case pages::RenderingStrategy::Kind::Write:
            failure = write(*path, page.strategy.payload);
            break;
        case pages::RenderingStrategy::Kind::Copy: {
            auto copied = writer_->copy(page.strategy.payload, *path);
            if (is_err(copied)) {
                failure = unwrap_err(copied);
            } else {
                ++files;
            }
            break;
        }
        case pages::RenderingStrategy::Kind::DoNothing:
            break;
        }
    });
    if (failure) {
        return pipeline::PipelineError::stage_failure("", *failure);
    }
    return files;
}

auto MarkdownRenderer::render(const pages::RootPageNode& root,
                              const pipeline::DocContext& context) const
    -> pipeline::PipelineResult<Unit> {
    auto rendered = render_tree(root);
    if (is_err(rendered)) {
        return unwrap_err(rendered);
    }
    context.logger().info("Rendered " + std::to_string(unwrap(rendered)) + " file(s) to " +
                          context.configuration().output_dir);
    return Unit{};
}

// ============================================================================
// MarkdownPlugin
// ============================================================================

void MarkdownPlugin::install(plugin::ExtensionRegistrar& registrar,
                             const config::DocConfiguration& configuration) const {
    std::string format = configuration.format;
    std::transform(format.begin(), format.end(), format.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (format != "markdown" && format != "md") {
        POLYDOC_LOG_DEBUG("plugin", "format '" << configuration.format
                                               << "' is not handled by the markdown renderer");
        return;
    }
    registrar.extend(plugin::RENDERER, "renderer",
                     make_rc<const MarkdownRenderer>(
                         make_rc<FileOutputWriter>(configuration.output_dir)));
}

} // namespace polydoc::render
