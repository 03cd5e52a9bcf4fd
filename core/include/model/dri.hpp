//! # Declaration Identity
//!
//! A `DRI` (declaration reference identifier) is the stable identity key of a
//! documentable: the fully-qualified path plus a signature discriminator that
//! separates overloads. Two platform passes producing the same declaration
//! produce equal DRIs, which is what the merger keys on.

#ifndef POLYDOC_MODEL_DRI_HPP
#define POLYDOC_MODEL_DRI_HPP

#include <compare>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace polydoc::model {

struct DRI {
    std::string package_name;             ///< "com.example" (empty for the root package).
    std::vector<std::string> class_names; ///< Enclosing classlikes, outermost first.
    std::string callable_name;            ///< Function/property name, empty for classlikes.
    std::string signature;                ///< Overload discriminator, e.g. "(Int,String)".

    [[nodiscard]] auto operator==(const DRI& other) const -> bool = default;
    [[nodiscard]] auto operator<=>(const DRI& other) const = default;

    /// Renders "package/Outer.Inner/callable/signature".
    [[nodiscard]] auto to_string() const -> std::string;

    /// DRI of the enclosing declaration (package for top-level declarations).
    /// Returns nullopt for a package DRI.
    [[nodiscard]] auto parent() const -> std::optional<DRI>;

    [[nodiscard]] auto is_package() const -> bool {
        return class_names.empty() && callable_name.empty();
    }

    static auto for_package(std::string package_name) -> DRI;

    /// Appends a classlike name to this DRI.
    [[nodiscard]] auto with_class(const std::string& name) const -> DRI;

    /// Appends a callable to this DRI.
    [[nodiscard]] auto with_callable(const std::string& name, const std::string& sig) const
        -> DRI;
};

} // namespace polydoc::model

template <> struct std::hash<polydoc::model::DRI> {
    auto operator()(const polydoc::model::DRI& dri) const noexcept -> size_t {
        return std::hash<std::string>{}(dri.to_string());
    }
};

#endif // POLYDOC_MODEL_DRI_HPP
