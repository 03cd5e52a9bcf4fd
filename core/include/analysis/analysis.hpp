//! # Analysis Collaborator Interface
//!
//! The front end that turns sources into analyzed symbols. The pipeline only
//! sees this interface:
//!
//! ```text
//! PassConfiguration ──make_analysis_settings──▶ AnalysisSettings
//!                   ──AnalysisFactory──────────▶ AnalysisEnvironment
//!                                                 ├─ symbol_groups()
//!                                                 └─ source_files()
//! ```
//!
//! Diagnostics raised while analyzing go through a `MessageCollector`; they
//! never abort the run.

#ifndef POLYDOC_ANALYSIS_ANALYSIS_HPP
#define POLYDOC_ANALYSIS_ANALYSIS_HPP

#include "common.hpp"
#include "config/configuration.hpp"
#include "model/documentable.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polydoc::pipeline {
class DocLogger;
}

namespace polydoc::analysis {

// ============================================================================
// Analyzed Symbols
// ============================================================================

/// One analyzed declaration.
struct Symbol {
    model::DocumentableKind kind = model::DocumentableKind::Class;
    std::string keyword; ///< Listing keyword ("fun", "val", "var", ...).
    std::string name;
    std::string signature_tail; ///< Everything after the name, e.g. "(x: Int): String".
    model::Visibility visibility = model::Visibility::Public;
    std::optional<std::string> deprecation; ///< Deprecation message when deprecated.
    std::vector<std::string> annotations;
    std::string doc; ///< Raw doc comment text.
    model::SourceLocation location;
    std::vector<Symbol> members;

    /// Declaration as written, e.g. "private fun greet(name: String): String".
    [[nodiscard]] auto signature() const -> std::string;

    /// Overload discriminator: parameter types of a function, "(Int,String)".
    [[nodiscard]] auto discriminator() const -> std::string;
};

/// Symbols of one package gathered from declaration listings.
struct SymbolGroup {
    std::string package_name;
    std::vector<Symbol> symbols;
};

/// Symbols of one analyzed source file.
struct SourceFile {
    std::string path;
    std::string package_name;
    std::vector<Symbol> symbols;
};

// ============================================================================
// Settings and Diagnostics
// ============================================================================

/// Classpath entry standing for the JDK runtime classes.
constexpr std::string_view JDK_CLASSPATH_PREFIX = "jdk:";

struct AnalysisSettings {
    model::Platform platform = model::Platform::Jvm;
    std::vector<std::string> classpath;
    std::vector<std::string> source_roots;
    std::string language_version;
    std::string api_version;
    int jdk_version = 6;
};

/// Builds analysis settings for a pass. JVM passes get the JDK classpath
/// entry appended unless `no_jdk_link` is set.
[[nodiscard]] auto make_analysis_settings(const config::PassConfiguration& pass)
    -> AnalysisSettings;

enum class Severity {
    Info,
    Warning,
    Error,
};

[[nodiscard]] auto severity_to_string(Severity severity) -> std::string_view;

/// Receives diagnostics from an analysis front end.
class MessageCollector {
public:
    virtual ~MessageCollector() = default;

    virtual void report(Severity severity, const std::string& message,
                        const std::optional<model::SourceLocation>& location) = 0;

    /// True once any Error severity diagnostic was reported.
    [[nodiscard]] virtual auto has_errors() const -> bool = 0;

    virtual void clear() = 0;
};

/// Forwards every diagnostic to `DocLogger::info` as
/// "<severity>: <location>: <message>" and remembers whether an error was seen.
class LoggingMessageCollector : public MessageCollector {
public:
    explicit LoggingMessageCollector(pipeline::DocLogger& logger) : logger_(logger) {}

    void report(Severity severity, const std::string& message,
                const std::optional<model::SourceLocation>& location) override;

    [[nodiscard]] auto has_errors() const -> bool override {
        return seen_errors_.load();
    }

    void clear() override {
        seen_errors_ = false;
    }

private:
    pipeline::DocLogger& logger_;
    std::atomic<bool> seen_errors_{false};
};

// ============================================================================
// Environment
// ============================================================================

/// An analyzed platform pass.
class AnalysisEnvironment {
public:
    virtual ~AnalysisEnvironment() = default;

    [[nodiscard]] virtual auto settings() const -> const AnalysisSettings& = 0;
    [[nodiscard]] virtual auto symbol_groups() const -> const std::vector<SymbolGroup>& = 0;
    [[nodiscard]] virtual auto source_files() const -> const std::vector<SourceFile>& = 0;
};

/// Creates the environment for one pass. An error is fatal for the run.
using AnalysisFactory = std::function<Result<Rc<const AnalysisEnvironment>, std::string>(
    const config::PassConfiguration&, const AnalysisSettings&, MessageCollector&)>;

} // namespace polydoc::analysis

#endif // POLYDOC_ANALYSIS_ANALYSIS_HPP
