//! # Listing Front End
//!
//! A built-in analysis front end reading declaration listings, so the tool
//! runs without an external compiler.
//!
//! ## Listing Syntax
//!
//! ```text
//! package com.example
//!
//! /// A greeter.
//! /// @since 1.2
//! class Greeter(name: String)
//!     fun greet(times: Int): String
//!     private val cache: Map<String, String>
//!
//! @Deprecated("use Greeter")
//! fun hello(): Unit
//! deprecated typealias Name = String
//! ```
//!
//! Declarations are `[visibility] [deprecated] kind name[tail]` with kinds
//! `class interface object enum entry fun val var typealias`. Members are
//! nested by indentation. `///` lines document the next declaration, `@Name`
//! lines annotate it, `//` lines are comments.
//!
//! `.api` files feed `symbol_groups()`, `.japi` files feed `source_files()`.

#ifndef POLYDOC_ANALYSIS_LISTING_ANALYZER_HPP
#define POLYDOC_ANALYSIS_LISTING_ANALYZER_HPP

#include "analysis/analysis.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace polydoc::analysis {

/// Extension of listings feeding the symbol-level translator.
constexpr std::string_view SYMBOL_LISTING_EXTENSION = ".api";

/// Extension of listings feeding the file-based translator.
constexpr std::string_view FILE_LISTING_EXTENSION = ".japi";

/// Parses one listing. Malformed lines are reported as errors and skipped.
[[nodiscard]] auto parse_listing(const std::string& text, const std::string& file_name,
                                 MessageCollector& messages) -> SourceFile;

class ListingAnalyzer : public AnalysisEnvironment {
public:
    /// Walks the source roots of `settings` and parses every listing.
    ///
    /// Fails when a source root or a classpath entry does not exist.
    static auto create(const AnalysisSettings& settings, MessageCollector& messages)
        -> Result<Rc<const AnalysisEnvironment>, std::string>;

    [[nodiscard]] auto settings() const -> const AnalysisSettings& override {
        return settings_;
    }
    [[nodiscard]] auto symbol_groups() const -> const std::vector<SymbolGroup>& override {
        return groups_;
    }
    [[nodiscard]] auto source_files() const -> const std::vector<SourceFile>& override {
        return files_;
    }

private:
    explicit ListingAnalyzer(AnalysisSettings settings) : settings_(std::move(settings)) {}

    void add_symbol_listing(SourceFile listing);

    AnalysisSettings settings_;
    std::vector<SymbolGroup> groups_;
    std::vector<SourceFile> files_;
};

/// The `AnalysisFactory` backed by `ListingAnalyzer`.
[[nodiscard]] auto listing_analysis_factory() -> AnalysisFactory;

} // namespace polydoc::analysis

#endif // POLYDOC_ANALYSIS_LISTING_ANALYZER_HPP
