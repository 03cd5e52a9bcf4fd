//! # Documentation Configuration
//!
//! Run-wide options and per-platform pass settings.
//!
//! ## Sections
//!
//! | Type                        | Description                                 |
//! |-----------------------------|---------------------------------------------|
//! | `DocConfiguration`          | Output, format and global switches          |
//! | `PassConfiguration`         | One platform pass (sources, classpath, ...) |
//! | `PackageOptions`            | Per-package overrides, longest prefix wins  |
//! | `SourceLinkDefinition`      | Local path prefix to browsable URL mapping  |
//! | `ExternalDocumentationLink` | Foreign documentation with a package list   |
//!
//! The pipeline assumes a configuration that passed `validate()`.

#ifndef POLYDOC_CONFIG_CONFIGURATION_HPP
#define POLYDOC_CONFIG_CONFIGURATION_HPP

#include "common.hpp"
#include "model/platform.hpp"

#include <optional>
#include <string>
#include <vector>

namespace polydoc::config {

struct ConfigError {
    std::string message;
    int line = 0; ///< 1-based line in the configuration file; 0 when not file-related.

    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

struct SourceLinkDefinition {
    std::string path;        ///< Local directory prefix, '/' separated.
    std::string url;         ///< URL prefix replacing `path`.
    std::string line_suffix; ///< Appended with the line number, e.g. "#L".
};

struct PackageOptions {
    std::string prefix;
    bool include_non_public = false;
    bool report_undocumented = true;
    bool skip_deprecated = false;
    bool suppress = false;
};

struct ExternalDocumentationLink {
    std::string url;
    std::string package_list_url; ///< Empty means `<url>/package-list`.

    [[nodiscard]] auto resolved_package_list() const -> std::string;
};

struct PassConfiguration {
    std::string module_name;
    std::vector<std::string> source_roots;
    std::vector<std::string> classpath;
    std::vector<std::string> samples;
    std::vector<std::string> includes;
    std::vector<SourceLinkDefinition> source_links;
    int jdk_version = 6;
    bool skip_deprecated = false;
    bool skip_empty_packages = true;
    bool report_undocumented = true;
    bool include_non_public = false;
    bool include_root_package = false;
    std::vector<PackageOptions> per_package_options;
    std::vector<ExternalDocumentationLink> external_documentation_links;
    bool no_stdlib_link = false;
    bool no_jdk_link = false;
    std::string language_version;
    std::string api_version;
    std::vector<std::string> suppressed_files;
    std::string since_version = "1.0";
    model::Platform analysis_platform = model::Platform::Jvm;
    std::vector<std::string> targets;

    /// Identity of this pass in the documentation model.
    [[nodiscard]] auto platform_data() const -> model::PlatformData;

    /// Effective options for `package_name`: the per-package entry with the
    /// longest matching prefix, or the pass-level values when none matches.
    [[nodiscard]] auto options_for_package(const std::string& package_name) const
        -> PackageOptions;
};

struct DocConfiguration {
    std::string output_dir = "docs";
    std::string format = "markdown";
    std::optional<std::string> cache_root;
    std::vector<std::string> implied_platforms;
    bool generate_index_pages = false;
    bool skip = false;
    bool fail_on_error = false;
    std::vector<PassConfiguration> passes;
    std::vector<std::string> disabled_plugins;

    [[nodiscard]] auto is_plugin_disabled(const std::string& name) const -> bool;
};

/// Structural checks the caller runs before handing the configuration to
/// the pipeline. Returns the first problem found.
[[nodiscard]] auto validate(const DocConfiguration& config) -> Result<Unit, ConfigError>;

} // namespace polydoc::config

#endif // POLYDOC_CONFIG_CONFIGURATION_HPP
