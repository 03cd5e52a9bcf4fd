//! # Declaration Identity Implementation

#include "model/dri.hpp"

namespace polydoc::model {

auto DRI::to_string() const -> std::string {
    std::string out = package_name;
    out += '/';
    for (size_t i = 0; i < class_names.size(); ++i) {
        if (i > 0) {
            out += '.';
        }
        out += class_names[i];
    }
    out += '/';
    out += callable_name;
    out += '/';
    out += signature;
    return out;
}

auto DRI::parent() const -> std::optional<DRI> {
    if (!callable_name.empty()) {
        DRI up = *this;
        up.callable_name.clear();
        up.signature.clear();
        return up;
    }
    if (!class_names.empty()) {
        DRI up = *this;
        up.class_names.pop_back();
        return up;
    }
    return std::nullopt;
}

auto DRI::for_package(std::string package_name) -> DRI {
    DRI dri;
    dri.package_name = std::move(package_name);
    return dri;
}

auto DRI::with_class(const std::string& name) const -> DRI {
    DRI dri = *this;
    dri.callable_name.clear();
    dri.signature.clear();
    dri.class_names.push_back(name);
    return dri;
}

auto DRI::with_callable(const std::string& name, const std::string& sig) const -> DRI {
    DRI dri = *this;
    dri.callable_name = name;
    dri.signature = sig;
    return dri;
}

} // namespace polydoc::model
