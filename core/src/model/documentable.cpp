//! # Documentation Model Implementation
//!
//! Kind/visibility conversions and the DRI index.

#include "model/documentable.hpp"

#include <functional>

namespace polydoc::model {

auto kind_to_string(DocumentableKind kind) -> std::string_view {
    switch (kind) {
    case DocumentableKind::Package:
        return "package";
    case DocumentableKind::Class:
        return "class";
    case DocumentableKind::Interface:
        return "interface";
    case DocumentableKind::Object:
        return "object";
    case DocumentableKind::Enum:
        return "enum";
    case DocumentableKind::EnumEntry:
        return "entry";
    case DocumentableKind::Function:
        return "fun";
    case DocumentableKind::Property:
        return "val";
    case DocumentableKind::TypeAlias:
        return "typealias";
    }
    return "unknown";
}

auto kind_from_keyword(std::string_view keyword) -> std::optional<DocumentableKind> {
    if (keyword == "package")
        return DocumentableKind::Package;
    if (keyword == "class")
        return DocumentableKind::Class;
    if (keyword == "interface")
        return DocumentableKind::Interface;
    if (keyword == "object")
        return DocumentableKind::Object;
    if (keyword == "enum")
        return DocumentableKind::Enum;
    if (keyword == "entry")
        return DocumentableKind::EnumEntry;
    if (keyword == "fun")
        return DocumentableKind::Function;
    if (keyword == "val" || keyword == "var")
        return DocumentableKind::Property;
    if (keyword == "typealias")
        return DocumentableKind::TypeAlias;
    return std::nullopt;
}

auto is_classlike(DocumentableKind kind) -> bool {
    switch (kind) {
    case DocumentableKind::Class:
    case DocumentableKind::Interface:
    case DocumentableKind::Object:
    case DocumentableKind::Enum:
        return true;
    default:
        return false;
    }
}

auto visibility_to_string(Visibility vis) -> std::string_view {
    switch (vis) {
    case Visibility::Public:
        return "public";
    case Visibility::Protected:
        return "protected";
    case Visibility::Internal:
        return "internal";
    case Visibility::Private:
        return "private";
    }
    return "unknown";
}

auto visibility_from_string(std::string_view text) -> std::optional<Visibility> {
    if (text == "public")
        return Visibility::Public;
    if (text == "protected")
        return Visibility::Protected;
    if (text == "internal")
        return Visibility::Internal;
    if (text == "private")
        return Visibility::Private;
    return std::nullopt;
}

auto Documentable::find_child(const DRI& key) const -> const Documentable* {
    for (const auto& child : children) {
        if (child.dri == key) {
            return &child;
        }
    }
    return nullptr;
}

auto Module::find_package(const std::string& package_name) const -> const Documentable* {
    for (const auto& package : packages) {
        if (package.dri.package_name == package_name) {
            return &package;
        }
    }
    return nullptr;
}

auto count_documentables(const Module& module) -> size_t {
    std::function<size_t(const Documentable&)> count = [&](const Documentable& node) -> size_t {
        size_t total = 1;
        for (const auto& child : node.children) {
            total += count(child);
        }
        return total;
    };

    size_t total = 0;
    for (const auto& package : module.packages) {
        total += count(package);
    }
    return total;
}

DocumentableIndex::DocumentableIndex(const Module& module) {
    std::function<void(const Documentable&)> index = [&](const Documentable& node) {
        by_dri_.emplace(node.dri, &node);
        for (const auto& child : node.children) {
            index(child);
        }
    };

    for (const auto& package : module.packages) {
        index(package);
    }
}

auto DocumentableIndex::find(const DRI& dri) const -> const Documentable* {
    auto it = by_dri_.find(dri);
    return it != by_dri_.end() ? it->second : nullptr;
}

auto DocumentableIndex::parent_of(const Documentable& node) const -> const Documentable* {
    if (!node.parent) {
        return nullptr;
    }
    return find(*node.parent);
}

} // namespace polydoc::model
