//! # Plugins
//!
//! A plugin contributes implementations to extension points. Plugins are
//! installed one after another in a stable topological order of their
//! declared `after()`/`before()` relations; the registration order on multi
//! points follows from that order.

#ifndef POLYDOC_PLUGIN_PLUGIN_HPP
#define POLYDOC_PLUGIN_PLUGIN_HPP

#include "config/configuration.hpp"
#include "plugin/registry.hpp"

#include <string>
#include <vector>

namespace polydoc::plugin {

class Plugin {
public:
    virtual ~Plugin() = default;

    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /// Plugins that must be installed before this one.
    [[nodiscard]] virtual auto after() const -> std::vector<std::string> {
        return {};
    }

    /// Plugins that must be installed after this one.
    [[nodiscard]] virtual auto before() const -> std::vector<std::string> {
        return {};
    }

    virtual void install(ExtensionRegistrar& registrar,
                         const config::DocConfiguration& configuration) const = 0;
};

/// Orders `plugins` by their relations, keeping the given order where
/// unconstrained. Unknown plugin names are ignored with a warning; duplicate
/// names and cycles are configuration errors.
[[nodiscard]] auto order_plugins(const std::vector<Rc<const Plugin>>& plugins)
    -> PipelineResult<std::vector<Rc<const Plugin>>>;

/// Orders and installs `plugins`, then freezes the registry. A `std::exception`
/// thrown by `install()` becomes a configuration error naming the plugin.
[[nodiscard]] auto initialize_plugins(const std::vector<Rc<const Plugin>>& plugins,
                                      const config::DocConfiguration& configuration)
    -> PipelineResult<ExtensionRegistry>;

} // namespace polydoc::plugin

#endif // POLYDOC_PLUGIN_PLUGIN_HPP
