//! # Built-in Plugins
//!
//! `CorePlugin` fills the single points every run needs; `BasePlugin` adds
//! the default model and page transforms on top of it.
//!
//! | Plugin | Point                      | Id                     |
//! |--------|----------------------------|------------------------|
//! | core   | `symbol_translator`        | `listing_symbols`      |
//! | core   | `file_translator`          | `listing_files`        |
//! | core   | `documentable_merger`      | `merger`               |
//! | core   | `page_creator`             | `page_creator`         |
//! | base   | `documentable_transformer` | see `transformers.hpp` |
//! | base   | `page_transformer`         | see `page_transformers.hpp` |

#ifndef POLYDOC_BASE_PLUGINS_HPP
#define POLYDOC_BASE_PLUGINS_HPP

#include "plugin/plugin.hpp"

namespace polydoc::base {

inline constexpr const char* CORE_PLUGIN = "core";
inline constexpr const char* BASE_PLUGIN = "base";

class CorePlugin : public plugin::Plugin {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return CORE_PLUGIN;
    }

    void install(plugin::ExtensionRegistrar& registrar,
                 const config::DocConfiguration& configuration) const override;
};

class BasePlugin : public plugin::Plugin {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return BASE_PLUGIN;
    }

    [[nodiscard]] auto after() const -> std::vector<std::string> override {
        return {CORE_PLUGIN};
    }

    /// Index pages are only registered when `generate_index_pages` is set.
    void install(plugin::ExtensionRegistrar& registrar,
                 const config::DocConfiguration& configuration) const override;
};

} // namespace polydoc::base

#endif // POLYDOC_BASE_PLUGINS_HPP
