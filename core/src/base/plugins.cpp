//! # Built-in Plugins Implementation

#include "base/plugins.hpp"

#include "base/merger.hpp"
#include "base/page_creator.hpp"
#include "base/page_transformers.hpp"
#include "base/transformers.hpp"
#include "base/translators.hpp"
#include "plugin/core_extensions.hpp"

namespace polydoc::base {

void CorePlugin::install(plugin::ExtensionRegistrar& registrar,
                         const config::DocConfiguration& /*configuration*/) const {
    registrar.extend(plugin::SYMBOL_TRANSLATOR, "listing_symbols",
                     make_rc<const ListingSymbolTranslator>());
    registrar.extend(plugin::FILE_TRANSLATOR, "listing_files",
                     make_rc<const ListingFileTranslator>());
    registrar.extend(plugin::DOCUMENTABLE_MERGER, "merger",
                     make_rc<const DefaultDocumentableMerger>());
    registrar.extend(plugin::PAGE_CREATOR, "page_creator", make_rc<const DefaultPageCreator>());
}

void BasePlugin::install(plugin::ExtensionRegistrar& registrar,
                         const config::DocConfiguration& configuration) const {
    // Registration order is chain order.
    registrar.extend(plugin::DOCUMENTABLE_TRANSFORMER, "module_documentation",
                     make_rc<const ModuleDocumentationTransformer>());
    registrar.extend(plugin::DOCUMENTABLE_TRANSFORMER, "suppression",
                     make_rc<const SuppressionFilter>());
    registrar.extend(plugin::DOCUMENTABLE_TRANSFORMER, "visibility",
                     make_rc<const VisibilityFilter>());
    registrar.extend(plugin::DOCUMENTABLE_TRANSFORMER, "deprecation",
                     make_rc<const DeprecationFilter>());
    registrar.extend(plugin::DOCUMENTABLE_TRANSFORMER, "empty_packages",
                     make_rc<const EmptyPackageFilter>());
    registrar.extend(plugin::DOCUMENTABLE_TRANSFORMER, "source_links",
                     make_rc<const SourceLinksTransformer>());
    registrar.extend(plugin::DOCUMENTABLE_TRANSFORMER, "undocumented",
                     make_rc<const UndocumentedReporter>());

    registrar.extend(plugin::PAGE_TRANSFORMER, "navigation",
                     make_rc<const NavigationPageTransformer>());
    if (configuration.generate_index_pages) {
        registrar.extend(plugin::PAGE_TRANSFORMER, "index_pages",
                         make_rc<const IndexPagesTransformer>());
    }
    registrar.extend(plugin::PAGE_TRANSFORMER, "search_index",
                     make_rc<const SearchIndexTransformer>());
}

} // namespace polydoc::base
