//! # Base Model Transforms
//!
//! The documentable transforms installed by the base plugin, in chain order:
//!
//! | Id                       | Transform                        | Pass option                  |
//! |--------------------------|----------------------------------|------------------------------|
//! | `module_documentation`   | `ModuleDocumentationTransformer` | `includes`                   |
//! | `suppression`            | `SuppressionFilter`              | `suppress`, `suppressed_files` |
//! | `visibility`             | `VisibilityFilter`               | `include_non_public`         |
//! | `deprecation`            | `DeprecationFilter`              | `skip_deprecated`            |
//! | `empty_packages`         | `EmptyPackageFilter`             | `skip_empty_packages`        |
//! | `source_links`           | `SourceLinksTransformer`         | `source_links`               |
//! | `undocumented`           | `UndocumentedReporter`           | `report_undocumented`        |
//!
//! Filters work per platform: a declaration filtered out for one platform
//! loses that platform's facts together with its whole subtree, and a node
//! left without platforms is removed.

#ifndef POLYDOC_BASE_TRANSFORMERS_HPP
#define POLYDOC_BASE_TRANSFORMERS_HPP

#include "plugin/core_extensions.hpp"

#include <functional>
#include <string>
#include <vector>

namespace polydoc::base {

// ============================================================================
// Helpers
// ============================================================================

/// Decides whether `node` stays documented on `platform`.
using KeepPredicate = std::function<bool(const model::Documentable& node,
                                         const model::PlatformData& platform,
                                         const model::PlatformFacts& facts)>;

/// Returns a copy of `module` with every platform `keep` rejects removed.
[[nodiscard]] auto filter_documentables(const model::Module& module, const KeepPredicate& keep)
    -> model::Module;

/// Rewrites the facts of every documentable in place on a copy of `module`.
using FactsMapper = std::function<void(const model::Documentable& node,
                                       const model::PlatformData& platform,
                                       model::PlatformFacts& facts)>;

[[nodiscard]] auto map_documentable_facts(const model::Module& module, const FactsMapper& fn)
    -> model::Module;

/// One `# Module <name>` or `# Package <name>` section of an include file.
struct IncludeSection {
    enum class Kind { Module, Package };

    Kind kind = Kind::Module;
    std::string name;
    std::string text;
};

/// Splits include file contents into sections. Text before the first
/// section header is ignored.
[[nodiscard]] auto parse_include_sections(const std::string& content)
    -> std::vector<IncludeSection>;

/// True when `file` is one of `suppressed` or lies below one of them.
[[nodiscard]] auto is_suppressed_file(const std::string& file,
                                      const std::vector<std::string>& suppressed) -> bool;

/// Browsable URL for `location` according to `links`, or "" when no link
/// path is a prefix of the file. The longest matching path wins.
[[nodiscard]] auto resolve_source_link(const model::SourceLocation& location,
                                       const std::vector<config::SourceLinkDefinition>& links)
    -> std::string;

// ============================================================================
// Transforms
// ============================================================================

/// Attaches module and package documentation read from the pass `includes`.
/// A missing or unreadable include file fails the stage.
class ModuleDocumentationTransformer : public plugin::DocumentableTransformer {
public:
    [[nodiscard]] auto transform(const model::Module& module,
                                 const pipeline::DocContext& context) const
        -> pipeline::PipelineResult<model::Module> override;
};

class SuppressionFilter : public plugin::DocumentableTransformer {
public:
    [[nodiscard]] auto transform(const model::Module& module,
                                 const pipeline::DocContext& context) const
        -> pipeline::PipelineResult<model::Module> override;
};

/// Drops internal and private declarations unless non-public ones are included.
class VisibilityFilter : public plugin::DocumentableTransformer {
public:
    [[nodiscard]] auto transform(const model::Module& module,
                                 const pipeline::DocContext& context) const
        -> pipeline::PipelineResult<model::Module> override;
};

class DeprecationFilter : public plugin::DocumentableTransformer {
public:
    [[nodiscard]] auto transform(const model::Module& module,
                                 const pipeline::DocContext& context) const
        -> pipeline::PipelineResult<model::Module> override;
};

/// Removes a package from a platform on which it has no declarations left.
class EmptyPackageFilter : public plugin::DocumentableTransformer {
public:
    [[nodiscard]] auto transform(const model::Module& module,
                                 const pipeline::DocContext& context) const
        -> pipeline::PipelineResult<model::Module> override;
};

class SourceLinksTransformer : public plugin::DocumentableTransformer {
public:
    [[nodiscard]] auto transform(const model::Module& module,
                                 const pipeline::DocContext& context) const
        -> pipeline::PipelineResult<model::Module> override;
};

/// Warns about public and protected declarations without documentation.
/// Returns the model unchanged.
class UndocumentedReporter : public plugin::DocumentableTransformer {
public:
    [[nodiscard]] auto transform(const model::Module& module,
                                 const pipeline::DocContext& context) const
        -> pipeline::PipelineResult<model::Module> override;
};

} // namespace polydoc::base

#endif // POLYDOC_BASE_TRANSFORMERS_HPP
