//! # Plugin Initialization

#include "plugin/plugin.hpp"

#include "common/ordering.hpp"
#include "log/log.hpp"

#include <exception>
#include <unordered_map>

namespace polydoc::plugin {

auto order_plugins(const std::vector<Rc<const Plugin>>& plugins)
    -> PipelineResult<std::vector<Rc<const Plugin>>> {
    std::unordered_map<std::string, size_t> index;
    std::vector<std::string> names;
    names.reserve(plugins.size());

    for (size_t i = 0; i < plugins.size(); ++i) {
        auto name = plugins[i]->name();
        if (!index.emplace(name, i).second) {
            return PipelineError::configuration("plugin '" + name + "' is installed twice");
        }
        names.push_back(std::move(name));
    }

    DependencyOrder order(plugins.size());
    for (size_t i = 0; i < plugins.size(); ++i) {
        for (const auto& dep : plugins[i]->after()) {
            auto it = index.find(dep);
            if (it == index.end()) {
                POLYDOC_LOG_WARN("plugin", "plugin '" << names[i] << "' wants to run after '"
                                                      << dep << "', which is not installed");
                continue;
            }
            order.add_edge(it->second, i);
        }
        for (const auto& dep : plugins[i]->before()) {
            auto it = index.find(dep);
            if (it == index.end()) {
                POLYDOC_LOG_WARN("plugin", "plugin '" << names[i] << "' wants to run before '"
                                                      << dep << "', which is not installed");
                continue;
            }
            order.add_edge(i, it->second);
        }
    }

    if (!order.sort()) {
        std::string cycle;
        for (size_t i : order.unresolved()) {
            if (!cycle.empty()) {
                cycle += ", ";
            }
            cycle += names[i];
        }
        return PipelineError::configuration("plugin dependency cycle between " + cycle);
    }

    std::vector<Rc<const Plugin>> ordered;
    ordered.reserve(plugins.size());
    for (size_t i : order.order()) {
        ordered.push_back(plugins[i]);
    }
    return ordered;
}

auto initialize_plugins(const std::vector<Rc<const Plugin>>& plugins,
                        const config::DocConfiguration& configuration)
    -> PipelineResult<ExtensionRegistry> {
    auto ordered = order_plugins(plugins);
    if (is_err(ordered)) {
        return unwrap_err(ordered);
    }

    ExtensionRegistryBuilder builder;
    for (const auto& plugin : unwrap(ordered)) {
        ExtensionRegistrar registrar(builder, plugin->name());
        auto before = builder.size();
        try {
            plugin->install(registrar, configuration);
        } catch (const std::exception& e) {
            return PipelineError::configuration("plugin '" + plugin->name() +
                                                "' failed to install: " + e.what());
        }
        POLYDOC_LOG_DEBUG("plugin", "installed " << plugin->name() << " ("
                                                 << builder.size() - before << " extension(s))");
    }

    return builder.build();
}

} // namespace polydoc::plugin
