//! # Platform Identity
//!
//! `PlatformData` identifies one analysis target (one platform pass). It is a
//! plain value type with structural equality, ordering and hashing so it can be
//! used directly as a map key throughout the model.

#ifndef POLYDOC_MODEL_PLATFORM_HPP
#define POLYDOC_MODEL_PLATFORM_HPP

#include "common.hpp"

#include <compare>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polydoc::model {

/// Runtime family a pass is analyzed for.
enum class Platform {
    Jvm,    ///< JVM bytecode targets.
    Js,     ///< JavaScript targets.
    Native, ///< Native (LLVM) targets.
    Common, ///< Platform-independent common code.
};

/// Converts Platform to its configuration key ("jvm", "js", "native", "common").
[[nodiscard]] auto platform_to_string(Platform platform) -> std::string_view;

/// Parses a platform name.
///
/// Accepts the configuration keys case-insensitively plus the aliases
/// `kotlin-native`/`kn` (native) and `metadata` (common). The empty string
/// yields the default platform (jvm). Unknown names yield an error message.
[[nodiscard]] auto platform_from_string(std::string_view name) -> Result<Platform, std::string>;

/// Identity of one analysis target.
struct PlatformData {
    std::string name;                 ///< Pass name (usually the module name).
    Platform platform;                ///< Runtime family.
    std::vector<std::string> targets; ///< Logical sub-targets (e.g. "linuxX64"), sorted and unique.

    [[nodiscard]] auto operator==(const PlatformData& other) const -> bool = default;
    [[nodiscard]] auto operator<=>(const PlatformData& other) const = default;

    /// Short display label: "name/platform", followed by " (target, target)"
    /// when the pass has targets.
    [[nodiscard]] auto display_name() const -> std::string;
};

/// An insertion-ordered mapping from platform to a value.
///
/// Insertion keeps the first value seen for a platform, so the entry order
/// reflects the order in which platforms contributed.
template <typename T> class PlatformDependent {
public:
    using Entry = std::pair<PlatformData, T>;

    PlatformDependent() = default;
    PlatformDependent(const PlatformData& platform, T value) {
        entries_.emplace_back(platform, std::move(value));
    }

    /// Adds `value` for `platform` unless the platform already has one.
    /// Returns true if the value was stored.
    bool insert(const PlatformData& platform, T value) {
        if (find(platform)) {
            return false;
        }
        entries_.emplace_back(platform, std::move(value));
        return true;
    }

    /// Replaces (or adds) the value for `platform`, keeping its position.
    void set(const PlatformData& platform, T value) {
        if (T* existing = find_mut(platform)) {
            *existing = std::move(value);
            return;
        }
        entries_.emplace_back(platform, std::move(value));
    }

    /// Unions `other` into this map; existing platforms keep their value.
    void merge(const PlatformDependent& other) {
        for (const auto& [platform, value] : other.entries_) {
            insert(platform, value);
        }
    }

    /// Removes the entry for `platform`, if any.
    void erase(const PlatformData& platform) {
        std::erase_if(entries_, [&](const Entry& e) { return e.first == platform; });
    }

    [[nodiscard]] auto find(const PlatformData& platform) const -> const T* {
        for (const auto& [key, value] : entries_) {
            if (key == platform) {
                return &value;
            }
        }
        return nullptr;
    }

    /// Value of the first contributing platform.
    [[nodiscard]] auto primary() const -> const T* {
        return entries_.empty() ? nullptr : &entries_.front().second;
    }

    [[nodiscard]] auto platforms() const -> std::vector<PlatformData> {
        std::vector<PlatformData> result;
        result.reserve(entries_.size());
        for (const auto& [key, _] : entries_) {
            result.push_back(key);
        }
        return result;
    }

    [[nodiscard]] auto entries() const -> const std::vector<Entry>& {
        return entries_;
    }

    /// Applies `fn(platform, value&)` to every entry in order.
    template <typename Fn> void for_each_mut(Fn&& fn) {
        for (auto& [key, value] : entries_) {
            fn(key, value);
        }
    }

    /// Removes entries for which `pred(platform, value)` is true.
    template <typename Pred> void erase_if(Pred&& pred) {
        std::erase_if(entries_, [&](const Entry& e) { return pred(e.first, e.second); });
    }

    [[nodiscard]] auto empty() const -> bool {
        return entries_.empty();
    }
    [[nodiscard]] auto size() const -> size_t {
        return entries_.size();
    }

    [[nodiscard]] auto operator==(const PlatformDependent& other) const -> bool = default;

private:
    T* find_mut(const PlatformData& platform) {
        for (auto& [key, value] : entries_) {
            if (key == platform) {
                return &value;
            }
        }
        return nullptr;
    }

    std::vector<Entry> entries_;
};

} // namespace polydoc::model

template <> struct std::hash<polydoc::model::PlatformData> {
    auto operator()(const polydoc::model::PlatformData& data) const noexcept -> size_t {
        size_t seed = std::hash<std::string>{}(data.name);
        seed ^= std::hash<int>{}(static_cast<int>(data.platform)) + 0x9e3779b9 + (seed << 6) +
                (seed >> 2);
        for (const auto& target : data.targets) {
            seed ^= std::hash<std::string>{}(target) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

#endif // POLYDOC_MODEL_PLATFORM_HPP
