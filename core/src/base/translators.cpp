//! # Listing Translators Implementation

#include "base/translators.hpp"

#include "log/log.hpp"
#include "model/doc_comment.hpp"

namespace polydoc::base {

using analysis::Symbol;
using model::DocumentableKind;
using model::Documentable;
using model::DRI;

namespace {

void report_duplicate(analysis::MessageCollector& messages, const DRI& dri,
                      const model::SourceLocation& location) {
    messages.report(analysis::Severity::Warning,
                    "duplicate declaration " + dri.to_string() + " ignored", location);
}

/// Collects packages for one module, keeping first-appearance order.
class ModuleBuilder {
public:
    ModuleBuilder(const pipeline::PlatformContext& platform, const pipeline::DocContext& context)
        : platform_(platform), context_(context) {
        module_.name = platform.pass.module_name;
        module_.facts.insert(platform.platform, model::PlatformFacts{});
    }

    void add(const std::string& package_name, const std::vector<Symbol>& symbols) {
        if (package_name.empty() && !platform_.pass.include_root_package) {
            if (!symbols.empty()) {
                POLYDOC_LOG_DEBUG("analysis", platform_.platform.display_name()
                                                  << ": skipping " << symbols.size()
                                                  << " declaration(s) in the root package");
            }
            return;
        }

        Documentable& package = package_for(package_name);
        for (const auto& symbol : symbols) {
            add_unique(package,
                       translate_symbol(symbol, package.dri, platform_.platform,
                                        context_.messages()),
                       symbol.location);
        }
    }

    auto take() -> model::Module {
        return std::move(module_);
    }

private:
    auto package_for(const std::string& package_name) -> Documentable& {
        for (auto& package : module_.packages) {
            if (package.dri.package_name == package_name) {
                return package;
            }
        }
        Documentable package;
        package.kind = DocumentableKind::Package;
        package.name = package_name;
        package.dri = DRI::for_package(package_name);
        package.facts.insert(platform_.platform, model::PlatformFacts{});
        module_.packages.push_back(std::move(package));
        return module_.packages.back();
    }

    /// Sibling DRIs must stay unique; a repeated declaration is reported and dropped.
    void add_unique(Documentable& owner, Documentable node,
                    const model::SourceLocation& location) {
        if (owner.find_child(node.dri)) {
            report_duplicate(context_.messages(), node.dri, location);
            return;
        }
        owner.children.push_back(std::move(node));
    }

    const pipeline::PlatformContext& platform_;
    const pipeline::DocContext& context_;
    model::Module module_;
};

auto missing_environment(const pipeline::PlatformContext& platform)
    -> pipeline::PipelineError {
    return pipeline::PipelineError::stage_failure(
        "", "no analysis environment for " + platform.platform.display_name());
}

} // namespace

auto symbol_dri(const DRI& owner, const Symbol& symbol) -> DRI {
    if (model::is_classlike(symbol.kind) || symbol.kind == DocumentableKind::TypeAlias ||
        symbol.kind == DocumentableKind::EnumEntry) {
        return owner.with_class(symbol.name);
    }
    if (symbol.kind == DocumentableKind::Function) {
        return owner.with_callable(symbol.name, symbol.discriminator());
    }
    return owner.with_callable(symbol.name, "");
}

auto translate_symbol(const Symbol& symbol, const DRI& owner, const model::PlatformData& platform,
                      analysis::MessageCollector& messages) -> Documentable {
    Documentable node;
    node.kind = symbol.kind;
    node.name = symbol.name;
    node.dri = symbol_dri(owner, symbol);
    node.parent = owner;

    model::PlatformFacts facts;
    facts.signature = symbol.signature();
    facts.visibility = symbol.visibility;
    facts.source = symbol.location;
    facts.annotations = symbol.annotations;
    if (symbol.deprecation) {
        facts.deprecation = model::Deprecation{*symbol.deprecation, ""};
    }
    model::apply_doc_comment(facts, symbol.doc);
    node.facts.insert(platform, std::move(facts));

    for (const auto& member : symbol.members) {
        auto child = translate_symbol(member, node.dri, platform, messages);
        if (node.find_child(child.dri)) {
            report_duplicate(messages, child.dri, member.location);
            continue;
        }
        node.children.push_back(std::move(child));
    }
    return node;
}

auto ListingSymbolTranslator::translate(const pipeline::PlatformContext& platform,
                                        const pipeline::DocContext& context) const
    -> pipeline::PipelineResult<model::Module> {
    if (!platform.environment) {
        return missing_environment(platform);
    }

    ModuleBuilder builder(platform, context);
    for (const auto& group : platform.environment->symbol_groups()) {
        builder.add(group.package_name, group.symbols);
    }
    return builder.take();
}

auto ListingFileTranslator::translate(const pipeline::PlatformContext& platform,
                                      const pipeline::DocContext& context) const
    -> pipeline::PipelineResult<model::Module> {
    if (!platform.environment) {
        return missing_environment(platform);
    }

    ModuleBuilder builder(platform, context);
    for (const auto& file : platform.environment->source_files()) {
        POLYDOC_LOG_TRACE("analysis", "translating " << file.path);
        builder.add(file.package_name, file.symbols);
    }
    return builder.take();
}

} // namespace polydoc::base
