//! # Platform Identity Implementation

#include "model/platform.hpp"

#include <algorithm>
#include <cctype>

namespace polydoc::model {

auto platform_to_string(Platform platform) -> std::string_view {
    switch (platform) {
    case Platform::Jvm:
        return "jvm";
    case Platform::Js:
        return "js";
    case Platform::Native:
        return "native";
    case Platform::Common:
        return "common";
    }
    return "unknown";
}

auto platform_from_string(std::string_view name) -> Result<Platform, std::string> {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.empty() || lower == "jvm" || lower == "androidjvm") {
        return Platform::Jvm;
    }
    if (lower == "js") {
        return Platform::Js;
    }
    if (lower == "native" || lower == "kotlin-native" || lower == "kn") {
        return Platform::Native;
    }
    if (lower == "common" || lower == "metadata") {
        return Platform::Common;
    }
    return "unrecognized platform: '" + std::string(name) + "'";
}

auto PlatformData::display_name() const -> std::string {
    std::string out = name + "/" + std::string(platform_to_string(platform));
    if (targets.empty()) {
        return out;
    }
    out += " (";
    for (size_t i = 0; i < targets.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += targets[i];
    }
    out += ")";
    return out;
}

} // namespace polydoc::model
