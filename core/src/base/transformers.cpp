//! # Base Model Transforms Implementation

#include "base/transformers.hpp"

#include "log/log.hpp"
#include "model/doc_comment.hpp"

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>

namespace polydoc::base {

using model::Documentable;
using model::DocumentableKind;
using model::PlatformData;
using model::PlatformFacts;

// ============================================================================
// Helpers
// ============================================================================

namespace {

auto filter_node(const Documentable& node, const std::vector<PlatformData>& removed_above,
                 const KeepPredicate& keep) -> std::optional<Documentable> {
    Documentable out;
    out.kind = node.kind;
    out.name = node.name;
    out.dri = node.dri;
    out.parent = node.parent;
    out.facts = node.facts;

    std::vector<PlatformData> removed = removed_above;
    out.facts.erase_if([&](const PlatformData& platform, const PlatformFacts& facts) {
        bool drop = std::find(removed_above.begin(), removed_above.end(), platform) !=
                        removed_above.end() ||
                    !keep(node, platform, facts);
        if (drop) {
            removed.push_back(platform);
        }
        return drop;
    });
    if (out.facts.empty()) {
        return std::nullopt;
    }

    for (const auto& child : node.children) {
        if (auto kept = filter_node(child, removed, keep)) {
            out.children.push_back(std::move(*kept));
        }
    }
    return out;
}

void map_node(Documentable& node, const FactsMapper& fn) {
    const Documentable& view = node;
    node.facts.for_each_mut(
        [&](const PlatformData& platform, PlatformFacts& facts) { fn(view, platform, facts); });
    for (auto& child : node.children) {
        map_node(child, fn);
    }
}

auto starts_with_path(const std::string& file, const std::string& prefix) -> bool {
    if (prefix.empty()) {
        return false;
    }
    if (file == prefix) {
        return true;
    }
    std::string dir = prefix;
    if (dir.back() != '/') {
        dir += '/';
    }
    return file.compare(0, dir.size(), dir) == 0;
}

auto trim(const std::string& text) -> std::string {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto options_for(const pipeline::DocContext& context, const Documentable& node,
                 const PlatformData& platform) -> std::optional<config::PackageOptions> {
    const auto* pass = context.pass_for(platform);
    if (!pass) {
        return std::nullopt;
    }
    return pass->options_for_package(node.dri.package_name);
}

} // namespace

auto filter_documentables(const model::Module& module, const KeepPredicate& keep)
    -> model::Module {
    model::Module out;
    out.name = module.name;
    out.facts = module.facts;
    for (const auto& package : module.packages) {
        if (auto kept = filter_node(package, {}, keep)) {
            out.packages.push_back(std::move(*kept));
        }
    }
    return out;
}

auto map_documentable_facts(const model::Module& module, const FactsMapper& fn) -> model::Module {
    model::Module out = module;
    for (auto& package : out.packages) {
        map_node(package, fn);
    }
    return out;
}

auto parse_include_sections(const std::string& content) -> std::vector<IncludeSection> {
    std::vector<IncludeSection> sections;
    std::istringstream stream(content);
    std::string line;
    std::string text;
    bool in_section = false;

    auto finish = [&]() {
        if (in_section) {
            sections.back().text = trim(text);
        }
        text.clear();
    };

    while (std::getline(stream, line)) {
        std::optional<IncludeSection::Kind> kind;
        std::string rest;
        if (line.rfind("# Module", 0) == 0) {
            kind = IncludeSection::Kind::Module;
            rest = line.substr(8);
        } else if (line.rfind("# Package", 0) == 0) {
            kind = IncludeSection::Kind::Package;
            rest = line.substr(9);
        }
        if (kind && (rest.empty() || rest.front() == ' ' || rest.front() == '\t')) {
            finish();
            sections.push_back(IncludeSection{*kind, trim(rest), ""});
            in_section = true;
            continue;
        }
        text += line;
        text += '\n';
    }
    finish();
    return sections;
}

auto is_suppressed_file(const std::string& file, const std::vector<std::string>& suppressed)
    -> bool {
    return std::any_of(suppressed.begin(), suppressed.end(),
                       [&](const std::string& entry) { return starts_with_path(file, entry); });
}

auto resolve_source_link(const model::SourceLocation& location,
                         const std::vector<config::SourceLinkDefinition>& links) -> std::string {
    const config::SourceLinkDefinition* best = nullptr;
    size_t best_length = 0;
    for (const auto& link : links) {
        std::string path = link.path;
        while (path.size() > 1 && path.back() == '/') {
            path.pop_back();
        }
        if (starts_with_path(location.file, path) && (!best || path.size() > best_length)) {
            best = &link;
            best_length = path.size();
        }
    }
    if (!best) {
        return "";
    }

    std::string url = best->url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    std::string rest = location.file.substr(std::min(best_length, location.file.size()));
    if (!rest.empty() && rest.front() != '/') {
        rest.insert(rest.begin(), '/');
    }
    url += rest;
    if (!best->line_suffix.empty() && location.line > 0) {
        url += best->line_suffix;
        url += std::to_string(location.line);
    }
    return url;
}

// ============================================================================
// Module Documentation
// ============================================================================

auto ModuleDocumentationTransformer::transform(const model::Module& module,
                                               const pipeline::DocContext& context) const
    -> pipeline::PipelineResult<model::Module> {
    model::Module out = module;

    for (const auto& platform : context.platforms()) {
        for (const auto& path : platform.pass.includes) {
            std::ifstream file(path);
            if (!file) {
                return pipeline::PipelineError::stage_failure(
                    "", "cannot read include file '" + path + "' of " +
                            platform.platform.display_name());
            }
            std::stringstream buffer;
            buffer << file.rdbuf();

            for (const auto& section : parse_include_sections(buffer.str())) {
                if (section.kind == IncludeSection::Kind::Module) {
                    if (!section.name.empty() && section.name != out.name) {
                        POLYDOC_LOG_DEBUG("transform", path << ": module section '" << section.name
                                                            << "' does not match module '"
                                                            << out.name << "'");
                        continue;
                    }
                    PlatformFacts facts;
                    if (const auto* existing = out.facts.find(platform.platform)) {
                        facts = *existing;
                    }
                    model::apply_doc_comment(facts, section.text);
                    out.facts.set(platform.platform, std::move(facts));
                    continue;
                }

                bool found = false;
                for (auto& package : out.packages) {
                    if (package.name != section.name) {
                        continue;
                    }
                    found = true;
                    package.facts.for_each_mut([&](const PlatformData& key, PlatformFacts& facts) {
                        if (key == platform.platform) {
                            model::apply_doc_comment(facts, section.text);
                        }
                    });
                }
                if (!found) {
                    POLYDOC_LOG_DEBUG("transform", path << ": package '" << section.name
                                                        << "' is not documented");
                }
            }
        }
    }
    return out;
}

// ============================================================================
// Filters
// ============================================================================

auto SuppressionFilter::transform(const model::Module& module,
                                  const pipeline::DocContext& context) const
    -> pipeline::PipelineResult<model::Module> {
    return filter_documentables(
        module, [&](const Documentable& node, const PlatformData& platform,
                    const PlatformFacts& facts) {
            const auto* pass = context.pass_for(platform);
            if (!pass) {
                return true;
            }
            if (pass->options_for_package(node.dri.package_name).suppress) {
                return false;
            }
            return !(facts.source && is_suppressed_file(facts.source->file, pass->suppressed_files));
        });
}

auto VisibilityFilter::transform(const model::Module& module,
                                 const pipeline::DocContext& context) const
    -> pipeline::PipelineResult<model::Module> {
    return filter_documentables(
        module, [&](const Documentable& node, const PlatformData& platform,
                    const PlatformFacts& facts) {
            if (facts.visibility == model::Visibility::Public ||
                facts.visibility == model::Visibility::Protected) {
                return true;
            }
            auto options = options_for(context, node, platform);
            return !options || options->include_non_public;
        });
}

auto DeprecationFilter::transform(const model::Module& module,
                                  const pipeline::DocContext& context) const
    -> pipeline::PipelineResult<model::Module> {
    return filter_documentables(
        module, [&](const Documentable& node, const PlatformData& platform,
                    const PlatformFacts& facts) {
            if (!facts.deprecation) {
                return true;
            }
            auto options = options_for(context, node, platform);
            return !options || !options->skip_deprecated;
        });
}

auto EmptyPackageFilter::transform(const model::Module& module,
                                   const pipeline::DocContext& context) const
    -> pipeline::PipelineResult<model::Module> {
    return filter_documentables(
        module, [&](const Documentable& node, const PlatformData& platform, const PlatformFacts&) {
            if (node.kind != DocumentableKind::Package) {
                return true;
            }
            const auto* pass = context.pass_for(platform);
            if (!pass || !pass->skip_empty_packages) {
                return true;
            }
            return std::any_of(node.children.begin(), node.children.end(),
                               [&](const Documentable& child) {
                                   return child.facts.find(platform) != nullptr;
                               });
        });
}

// ============================================================================
// Source Links and Reporting
// ============================================================================

auto SourceLinksTransformer::transform(const model::Module& module,
                                       const pipeline::DocContext& context) const
    -> pipeline::PipelineResult<model::Module> {
    return map_documentable_facts(
        module, [&](const Documentable&, const PlatformData& platform, PlatformFacts& facts) {
            const auto* pass = context.pass_for(platform);
            if (!pass || pass->source_links.empty() || !facts.source) {
                return;
            }
            auto url = resolve_source_link(*facts.source, pass->source_links);
            if (!url.empty()) {
                facts.source_url = std::move(url);
            }
        });
}

auto UndocumentedReporter::transform(const model::Module& module,
                                     const pipeline::DocContext& context) const
    -> pipeline::PipelineResult<model::Module> {
    std::function<void(const Documentable&)> visit = [&](const Documentable& node) {
        if (node.kind != DocumentableKind::Package) {
            for (const auto& [platform, facts] : node.facts.entries()) {
                if (facts.has_documentation()) {
                    continue;
                }
                if (facts.visibility != model::Visibility::Public &&
                    facts.visibility != model::Visibility::Protected) {
                    continue;
                }
                auto options = options_for(context, node, platform);
                if (options && options->report_undocumented) {
                    context.logger().warn("Undocumented: " + node.dri.to_string() + " (" +
                                          platform.display_name() + ")");
                }
            }
        }
        for (const auto& child : node.children) {
            visit(child);
        }
    };

    for (const auto& package : module.packages) {
        visit(package);
    }
    return module;
}

} // namespace polydoc::base
