//! # Configuration Validation
//!
//! Package option lookup and structural validation of a loaded configuration.

#include "config/configuration.hpp"

#include <algorithm>
#include <unordered_set>

namespace polydoc::config {

auto ExternalDocumentationLink::resolved_package_list() const -> std::string {
    if (!package_list_url.empty()) {
        return package_list_url;
    }
    if (!url.empty() && url.back() == '/') {
        return url + "package-list";
    }
    return url + "/package-list";
}

auto PassConfiguration::platform_data() const -> model::PlatformData {
    // Targets form a set: order and repeats do not change the identity.
    auto sorted = targets;
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
    return model::PlatformData{module_name, analysis_platform, std::move(sorted)};
}

auto PassConfiguration::options_for_package(const std::string& package_name) const
    -> PackageOptions {
    const PackageOptions* best = nullptr;
    for (const auto& options : per_package_options) {
        if (!package_name.starts_with(options.prefix)) {
            continue;
        }
        // "com.foo" must not match "com.foobar"
        if (package_name.size() > options.prefix.size() && !options.prefix.empty() &&
            package_name[options.prefix.size()] != '.') {
            continue;
        }
        if (!best || options.prefix.size() > best->prefix.size()) {
            best = &options;
        }
    }
    if (best) {
        return *best;
    }

    PackageOptions defaults;
    defaults.prefix = "";
    defaults.include_non_public = include_non_public;
    defaults.report_undocumented = report_undocumented;
    defaults.skip_deprecated = skip_deprecated;
    defaults.suppress = false;
    return defaults;
}

auto DocConfiguration::is_plugin_disabled(const std::string& name) const -> bool {
    return std::find(disabled_plugins.begin(), disabled_plugins.end(), name) !=
           disabled_plugins.end();
}

auto validate(const DocConfiguration& config) -> Result<Unit, ConfigError> {
    if (config.format.empty()) {
        return ConfigError{"output format must not be empty"};
    }

    std::unordered_set<model::PlatformData> seen;
    for (size_t i = 0; i < config.passes.size(); ++i) {
        const auto& pass = config.passes[i];
        auto where = "pass " + std::to_string(i + 1);

        if (pass.module_name.empty()) {
            return ConfigError{where + ": module name is required"};
        }
        if (!seen.insert(pass.platform_data()).second) {
            return ConfigError{where + ": duplicate platform '" +
                               pass.platform_data().display_name() + "'"};
        }
        for (const auto& link : pass.source_links) {
            if (link.path.find('\\') != std::string::npos) {
                return ConfigError{where + ": source link path '" + link.path +
                                   "' must use '/' as separator"};
            }
            if (link.url.empty()) {
                return ConfigError{where + ": source link for '" + link.path +
                                   "' has no url"};
            }
        }
        for (const auto& link : pass.external_documentation_links) {
            if (link.url.empty()) {
                return ConfigError{where + ": external documentation link has no url"};
            }
        }
        for (const auto& options : pass.per_package_options) {
            if (options.prefix.empty()) {
                return ConfigError{where + ": package options need a prefix"};
            }
        }
    }

    return Unit{};
}

} // namespace polydoc::config
