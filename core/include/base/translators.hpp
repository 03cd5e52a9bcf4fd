//! # Listing Translators
//!
//! Turn the analysis environment of one platform into a `Module`.
//!
//! | Translator              | Input                               |
//! |-------------------------|-------------------------------------|
//! | `ListingSymbolTranslator` | `AnalysisEnvironment::symbol_groups()` |
//! | `ListingFileTranslator`   | `AnalysisEnvironment::source_files()`  |
//!
//! Every produced node carries facts for the translated platform only.
//! Declarations in the root package are dropped unless the pass sets
//! `include_root_package`.

#ifndef POLYDOC_BASE_TRANSLATORS_HPP
#define POLYDOC_BASE_TRANSLATORS_HPP

#include "analysis/analysis.hpp"
#include "plugin/core_extensions.hpp"

#include <string>
#include <vector>

namespace polydoc::base {

/// Builds the DRI of `symbol` declared inside `owner`.
[[nodiscard]] auto symbol_dri(const model::DRI& owner, const analysis::Symbol& symbol)
    -> model::DRI;

/// Translates one symbol (and its members) for `platform`. A member repeating
/// a sibling's DRI is reported to `messages` as a warning and dropped.
[[nodiscard]] auto translate_symbol(const analysis::Symbol& symbol, const model::DRI& owner,
                                    const model::PlatformData& platform,
                                    analysis::MessageCollector& messages) -> model::Documentable;

class ListingSymbolTranslator : public plugin::SymbolTranslator {
public:
    [[nodiscard]] auto translate(const pipeline::PlatformContext& platform,
                                 const pipeline::DocContext& context) const
        -> pipeline::PipelineResult<model::Module> override;
};

class ListingFileTranslator : public plugin::FileTranslator {
public:
    [[nodiscard]] auto translate(const pipeline::PlatformContext& platform,
                                 const pipeline::DocContext& context) const
        -> pipeline::PipelineResult<model::Module> override;
};

} // namespace polydoc::base

#endif // POLYDOC_BASE_TRANSLATORS_HPP
