//! # Extension Registry Implementation
//!
//! ## Build Steps
//!
//! 1. Group registrations by point, checking that every registration of a
//!    point agrees on cardinality and type and that ids are unique
//! 2. Drop registrations named by another registration's `overrides`
//! 3. Order the survivors: registration order, adjusted by `ExtensionOrder`
//!    constraints (a cycle is a configuration error)

#include "plugin/registry.hpp"

#include "common/ordering.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace polydoc::plugin {

auto cardinality_to_string(Cardinality cardinality) -> std::string_view {
    switch (cardinality) {
    case Cardinality::Single:
        return "single";
    case Cardinality::Multi:
        return "multi";
    }
    return "unknown";
}

// ============================================================================
// ExtensionRegistry
// ============================================================================

auto ExtensionRegistry::find(const std::string& point_name) const -> const std::vector<Entry>* {
    auto it = points_.find(point_name);
    return it == points_.end() ? nullptr : &it->second;
}

auto ExtensionRegistry::describe(const std::vector<Entry>* entries) -> std::string {
    if (!entries || entries->empty()) {
        return "";
    }
    std::string out = " (";
    for (size_t i = 0; i < entries->size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += (*entries)[i].id;
    }
    out += ")";
    return out;
}

auto ExtensionRegistry::registration_ids(const std::string& point_name) const
    -> std::vector<std::string> {
    std::vector<std::string> ids;
    if (const auto* entries = find(point_name)) {
        for (const auto& entry : *entries) {
            ids.push_back(entry.id);
        }
    }
    return ids;
}

auto ExtensionRegistry::point_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(points_.size());
    for (const auto& [name, _] : points_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

// ============================================================================
// ExtensionRegistryBuilder
// ============================================================================

namespace {

/// True if `reference` names registration `id` of `plugin`.
auto refers_to(const std::string& reference, const std::string& id, const std::string& plugin)
    -> bool {
    return reference == id || reference == plugin;
}

} // namespace

auto ExtensionRegistryBuilder::build() const -> PipelineResult<ExtensionRegistry> {
    // point name -> indices into registrations_, in registration order
    std::map<std::string, std::vector<size_t>> by_point;
    std::vector<std::string> point_order;

    for (size_t i = 0; i < registrations_.size(); ++i) {
        const auto& reg = registrations_[i];
        auto& group = by_point[reg.point];
        if (group.empty()) {
            point_order.push_back(reg.point);
        } else {
            const auto& first = registrations_[group.front()];
            if (first.cardinality != reg.cardinality) {
                return PipelineError::configuration(
                    "extension point '" + reg.point + "' is declared both " +
                    std::string(cardinality_to_string(first.cardinality)) + " and " +
                    std::string(cardinality_to_string(reg.cardinality)));
            }
            if (first.type != reg.type) {
                return PipelineError::configuration("extension point '" + reg.point +
                                                    "' is declared with two different types (" +
                                                    first.id + ", " + reg.id + ")");
            }
            for (size_t other : group) {
                if (registrations_[other].id == reg.id) {
                    return PipelineError::configuration("duplicate registration '" + reg.id +
                                                        "' on extension point '" + reg.point +
                                                        "'");
                }
            }
        }
        group.push_back(i);
    }

    ExtensionRegistry registry;

    for (const auto& point : point_order) {
        const auto& group = by_point[point];

        std::set<size_t> dropped;
        for (size_t i : group) {
            for (const auto& target : registrations_[i].overrides) {
                for (size_t j : group) {
                    if (i != j &&
                        refers_to(target, registrations_[j].id, registrations_[j].plugin)) {
                        POLYDOC_LOG_DEBUG("plugin", registrations_[i].id << " overrides "
                                                                         << registrations_[j].id);
                        dropped.insert(j);
                    }
                }
            }
        }

        std::vector<size_t> kept;
        for (size_t i : group) {
            if (!dropped.contains(i)) {
                kept.push_back(i);
            }
        }

        DependencyOrder order(kept.size());
        for (size_t a = 0; a < kept.size(); ++a) {
            const auto& reg = registrations_[kept[a]];

            auto link = [&](const std::string& target, bool target_first) {
                bool matched = false;
                for (size_t b = 0; b < kept.size(); ++b) {
                    const auto& other = registrations_[kept[b]];
                    if (a == b || !refers_to(target, other.id, other.plugin)) {
                        continue;
                    }
                    matched = true;
                    if (target_first) {
                        order.add_edge(b, a);
                    } else {
                        order.add_edge(a, b);
                    }
                }
                if (!matched) {
                    POLYDOC_LOG_DEBUG("plugin", reg.id << ": ordering reference '" << target
                                                       << "' matches nothing on '" << point
                                                       << "'");
                }
            };

            for (const auto& target : reg.order.after) {
                link(target, true);
            }
            for (const auto& target : reg.order.before) {
                link(target, false);
            }
        }

        if (!order.sort()) {
            std::string ids;
            for (size_t idx : order.unresolved()) {
                if (!ids.empty()) {
                    ids += ", ";
                }
                ids += registrations_[kept[idx]].id;
            }
            return PipelineError::configuration("ordering cycle on extension point '" + point +
                                                "' between " + ids);
        }

        auto& entries = registry.points_[point];
        for (size_t idx : order.order()) {
            const auto& reg = registrations_[kept[idx]];
            entries.push_back(ExtensionRegistry::Entry{reg.id, reg.plugin, reg.impl});
        }
    }

    return registry;
}

} // namespace polydoc::plugin
