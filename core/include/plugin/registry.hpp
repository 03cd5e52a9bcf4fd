//! # Extension Registry
//!
//! Typed extension points and the registry mapping them to implementations.
//!
//! ## Lifecycle
//!
//! ```text
//! plugins ──install()──▶ ExtensionRegistrar ──▶ ExtensionRegistryBuilder
//!                                                      │ build(): overrides, ordering
//!                                                      ▼
//!                                               ExtensionRegistry (frozen)
//! ```
//!
//! The builder is only touched during plugin initialization. The registry it
//! produces has no mutating members, so the parallel translation stage may
//! read it from several threads.
//!
//! ## Cardinality
//!
//! | Point kind | `resolve_single`                       | `resolve_all`        |
//! |------------|----------------------------------------|----------------------|
//! | `Single`   | the one implementation, else an error  | 0..n implementations |
//! | `Multi`    | error                                  | ordered list         |

#ifndef POLYDOC_PLUGIN_REGISTRY_HPP
#define POLYDOC_PLUGIN_REGISTRY_HPP

#include "common.hpp"
#include "pipeline/error.hpp"

#include <any>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace polydoc::plugin {

using pipeline::PipelineError;
using pipeline::PipelineResult;

enum class Cardinality {
    Single, ///< Exactly one implementation must be registered.
    Multi,  ///< Any number, applied in registry order.
};

[[nodiscard]] auto cardinality_to_string(Cardinality cardinality) -> std::string_view;

/// A typed slot identified by a stable name.
template <typename T> struct ExtensionPoint {
    std::string name;
    Cardinality cardinality;
};

/// Ordering of one registration relative to others on the same point.
///
/// Entries name either a registration id (`plugin/id`) or a plugin name,
/// which stands for every registration of that plugin on the point.
struct ExtensionOrder {
    std::vector<std::string> after;
    std::vector<std::string> before;
};

/// The frozen registry. Created by `ExtensionRegistryBuilder::build()`.
class ExtensionRegistry {
public:
    /// Returns the only implementation of `point`.
    ///
    /// Fails with a configuration error when zero or several implementations
    /// are registered, or when the point is not a single point.
    template <typename T>
    [[nodiscard]] auto resolve_single(const ExtensionPoint<T>& point) const
        -> PipelineResult<Rc<const T>> {
        if (point.cardinality != Cardinality::Single) {
            return PipelineError::configuration("extension point '" + point.name +
                                                "' is not a single point");
        }
        const auto* entries = find(point.name);
        size_t count = entries ? entries->size() : 0;
        if (count != 1) {
            return PipelineError::configuration(
                "extension point '" + point.name + "' requires exactly one implementation, found " +
                std::to_string(count) + describe(entries));
        }
        return std::any_cast<Rc<const T>>(entries->front().impl);
    }

    /// Returns every implementation of `point` in resolved order.
    template <typename T>
    [[nodiscard]] auto resolve_all(const ExtensionPoint<T>& point) const
        -> std::vector<Rc<const T>> {
        std::vector<Rc<const T>> result;
        if (const auto* entries = find(point.name)) {
            result.reserve(entries->size());
            for (const auto& entry : *entries) {
                result.push_back(std::any_cast<Rc<const T>>(entry.impl));
            }
        }
        return result;
    }

    /// Registration ids on `point_name` in resolved order.
    [[nodiscard]] auto registration_ids(const std::string& point_name) const
        -> std::vector<std::string>;

    /// Names of every point with at least one registration.
    [[nodiscard]] auto point_names() const -> std::vector<std::string>;

private:
    friend class ExtensionRegistryBuilder;

    struct Entry {
        std::string id;     ///< "plugin/id"
        std::string plugin; ///< Registering plugin.
        std::any impl;      ///< Rc<const T>
    };

    [[nodiscard]] auto find(const std::string& point_name) const -> const std::vector<Entry>*;
    [[nodiscard]] static auto describe(const std::vector<Entry>* entries) -> std::string;

    std::unordered_map<std::string, std::vector<Entry>> points_;
};

/// Collects registrations during plugin initialization.
class ExtensionRegistryBuilder {
public:
    template <typename T>
    void add(const ExtensionPoint<T>& point, std::string plugin, std::string id,
             std::type_identity_t<Rc<const T>> impl, ExtensionOrder order,
             std::vector<std::string> overrides) {
        Registration reg;
        reg.point = point.name;
        reg.cardinality = point.cardinality;
        reg.type = std::type_index(typeid(T));
        reg.id = plugin + "/" + id;
        reg.plugin = std::move(plugin);
        reg.impl = std::move(impl);
        reg.order = std::move(order);
        reg.overrides = std::move(overrides);
        registrations_.push_back(std::move(reg));
    }

    /// Applies overrides and ordering constraints and freezes the result.
    ///
    /// Fails with a configuration error on inconsistent point declarations,
    /// duplicate registration ids, or ordering cycles.
    [[nodiscard]] auto build() const -> PipelineResult<ExtensionRegistry>;

    [[nodiscard]] auto size() const -> size_t {
        return registrations_.size();
    }

private:
    struct Registration {
        std::string point;
        Cardinality cardinality = Cardinality::Single;
        std::type_index type = std::type_index(typeid(void));
        std::string id;
        std::string plugin;
        std::any impl;
        ExtensionOrder order;
        std::vector<std::string> overrides;
    };

    std::vector<Registration> registrations_;
};

/// The view of the builder handed to one plugin's `install()`.
class ExtensionRegistrar {
public:
    ExtensionRegistrar(ExtensionRegistryBuilder& builder, std::string plugin_name)
        : builder_(builder), plugin_name_(std::move(plugin_name)) {}

    /// Registers `impl` on `point` under the id `<plugin>/<id>`.
    ///
    /// `overrides` names plugins (or registration ids) whose registrations on
    /// the same point are dropped in favour of this one.
    template <typename T>
    void extend(const ExtensionPoint<T>& point, std::string id,
                std::type_identity_t<Rc<const T>> impl, ExtensionOrder order = {},
                std::vector<std::string> overrides = {}) {
        builder_.add(point, plugin_name_, std::move(id), std::move(impl), std::move(order),
                     std::move(overrides));
    }

    [[nodiscard]] auto plugin_name() const -> const std::string& {
        return plugin_name_;
    }

private:
    ExtensionRegistryBuilder& builder_;
    std::string plugin_name_;
};

} // namespace polydoc::plugin

#endif // POLYDOC_PLUGIN_REGISTRY_HPP
