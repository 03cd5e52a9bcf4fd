//! # Core Extension Points
//!
//! The interfaces the pipeline drives and the points they are registered on.
//!
//! | Point                      | Cardinality | Interface                 | Stage |
//! |----------------------------|-------------|---------------------------|-------|
//! | `symbol_translator`        | Single      | `SymbolTranslator`        | 3     |
//! | `file_translator`          | Single      | `FileTranslator`          | 3     |
//! | `documentable_merger`      | Single      | `DocumentableMerger`      | 4     |
//! | `documentable_transformer` | Multi       | `DocumentableTransformer` | 5     |
//! | `page_creator`             | Single      | `PageCreator`             | 6     |
//! | `page_transformer`         | Multi       | `PageTransformer`         | 7     |
//! | `renderer`                 | Single      | `Renderer`                | 8     |
//!
//! Every operation receives its input by const reference and returns a new
//! value. Errors are returned as `PipelineError`; the driver tags them with
//! the running stage.

#ifndef POLYDOC_PLUGIN_CORE_EXTENSIONS_HPP
#define POLYDOC_PLUGIN_CORE_EXTENSIONS_HPP

#include "model/documentable.hpp"
#include "pages/page_node.hpp"
#include "pipeline/context.hpp"
#include "pipeline/error.hpp"
#include "plugin/registry.hpp"

#include <string>
#include <vector>

namespace polydoc::plugin {

using pipeline::DocContext;
using pipeline::PlatformContext;

/// Translates the analyzed symbol groups of one platform into a module.
class SymbolTranslator {
public:
    virtual ~SymbolTranslator() = default;
    [[nodiscard]] virtual auto translate(const PlatformContext& platform,
                                         const DocContext& context) const
        -> PipelineResult<model::Module> = 0;
};

/// Translates the analyzed source files of one platform into a module.
class FileTranslator {
public:
    virtual ~FileTranslator() = default;
    [[nodiscard]] virtual auto translate(const PlatformContext& platform,
                                         const DocContext& context) const
        -> PipelineResult<model::Module> = 0;
};

/// Combines per-platform modules into one.
class DocumentableMerger {
public:
    virtual ~DocumentableMerger() = default;
    [[nodiscard]] virtual auto merge(const std::vector<model::Module>& modules,
                                     const DocContext& context) const
        -> PipelineResult<model::Module> = 0;
};

class DocumentableTransformer {
public:
    virtual ~DocumentableTransformer() = default;
    [[nodiscard]] virtual auto transform(const model::Module& module,
                                         const DocContext& context) const
        -> PipelineResult<model::Module> = 0;
};

class PageCreator {
public:
    virtual ~PageCreator() = default;
    [[nodiscard]] virtual auto create(const model::Module& module, const DocContext& context) const
        -> PipelineResult<pages::RootPageNode> = 0;
};

class PageTransformer {
public:
    virtual ~PageTransformer() = default;
    [[nodiscard]] virtual auto transform(const pages::RootPageNode& root,
                                         const DocContext& context) const
        -> PipelineResult<pages::RootPageNode> = 0;
};

/// Produces the externally visible output. The pipeline only looks at
/// whether rendering failed.
class Renderer {
public:
    virtual ~Renderer() = default;
    [[nodiscard]] virtual auto render(const pages::RootPageNode& root,
                                      const DocContext& context) const -> PipelineResult<Unit> = 0;
};

inline const ExtensionPoint<SymbolTranslator> SYMBOL_TRANSLATOR{"symbol_translator",
                                                                Cardinality::Single};
inline const ExtensionPoint<FileTranslator> FILE_TRANSLATOR{"file_translator",
                                                            Cardinality::Single};
inline const ExtensionPoint<DocumentableMerger> DOCUMENTABLE_MERGER{"documentable_merger",
                                                                    Cardinality::Single};
inline const ExtensionPoint<DocumentableTransformer> DOCUMENTABLE_TRANSFORMER{
    "documentable_transformer", Cardinality::Multi};
inline const ExtensionPoint<PageCreator> PAGE_CREATOR{"page_creator", Cardinality::Single};
inline const ExtensionPoint<PageTransformer> PAGE_TRANSFORMER{"page_transformer",
                                                              Cardinality::Multi};
inline const ExtensionPoint<Renderer> RENDERER{"renderer", Cardinality::Single};

} // namespace polydoc::plugin

#endif // POLYDOC_PLUGIN_CORE_EXTENSIONS_HPP
