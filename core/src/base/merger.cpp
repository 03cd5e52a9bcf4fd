//! # Default Documentable Merger Implementation

#include "base/merger.hpp"

#include "log/log.hpp"

#include <unordered_map>

namespace polydoc::base {

using model::DRI;
using model::Documentable;

namespace {

/// Merges sibling lists. `lists` holds one sibling list per input module,
/// in input order.
auto merge_children(const std::vector<const std::vector<Documentable>*>& lists)
    -> std::vector<Documentable> {
    std::vector<DRI> order;
    std::unordered_map<DRI, std::vector<const Documentable*>> groups;

    for (const auto* list : lists) {
        for (const auto& node : *list) {
            auto [it, inserted] = groups.try_emplace(node.dri);
            if (inserted) {
                order.push_back(node.dri);
            }
            it->second.push_back(&node);
        }
    }

    std::vector<Documentable> merged;
    merged.reserve(order.size());
    for (const auto& dri : order) {
        const auto& group = groups.at(dri);
        if (group.size() == 1) {
            merged.push_back(*group.front());
            continue;
        }

        const Documentable& first = *group.front();
        Documentable node;
        node.kind = first.kind;
        node.name = first.name;
        node.dri = first.dri;
        node.parent = first.parent;

        std::vector<const std::vector<Documentable>*> child_lists;
        child_lists.reserve(group.size());
        for (const auto* part : group) {
            if (part->kind != first.kind) {
                POLYDOC_LOG_DEBUG("merge", dri.to_string()
                                               << " is a " << model::kind_to_string(part->kind)
                                               << " on one platform and a "
                                               << model::kind_to_string(first.kind)
                                               << " on another; keeping "
                                               << model::kind_to_string(first.kind)
                                               << " from the first platform");
            }
            node.facts.merge(part->facts);
            child_lists.push_back(&part->children);
        }
        node.children = merge_children(child_lists);
        merged.push_back(std::move(node));
    }
    return merged;
}

} // namespace

auto merge_modules(const std::vector<model::Module>& modules)
    -> pipeline::PipelineResult<model::Module> {
    if (modules.empty()) {
        return pipeline::PipelineError::configuration(
            "no platforms to merge: at least one pass must be configured");
    }
    if (modules.size() == 1) {
        return modules.front();
    }

    model::Module result;
    std::vector<const std::vector<Documentable>*> package_lists;
    package_lists.reserve(modules.size());
    for (const auto& module : modules) {
        if (result.name.empty()) {
            result.name = module.name;
        }
        result.facts.merge(module.facts);
        package_lists.push_back(&module.packages);
    }
    result.packages = merge_children(package_lists);

    POLYDOC_LOG_DEBUG("merge", "merged " << modules.size() << " module(s) into "
                                         << model::count_documentables(result)
                                         << " documentable(s) on " << result.facts.size()
                                         << " platform(s)");
    return result;
}

auto DefaultDocumentableMerger::merge(const std::vector<model::Module>& modules,
                                      const pipeline::DocContext& /*context*/) const
    -> pipeline::PipelineResult<model::Module> {
    return merge_modules(modules);
}

} // namespace polydoc::base
