//! # Documentation Model
//!
//! The data structures produced by translators, combined by the merger and
//! rewritten by model transforms.
//!
//! ## Architecture
//!
//! - `Module`: the root of one documentation tree; owns its packages
//! - `Documentable`: a package, classlike or member; owns its children
//! - `PlatformFacts`: everything that may differ between platforms
//!   (documentation, signature, visibility, location, deprecation)
//!
//! Platform-specific data is never stored in subclasses: each node carries a
//! `PlatformDependent<PlatformFacts>` map, so merging two platforms' views of
//! one declaration is a map union.
//!
//! Trees are values. A stage that changes a tree returns a new one; inputs
//! handed to a stage are never modified in place.

#ifndef POLYDOC_MODEL_DOCUMENTABLE_HPP
#define POLYDOC_MODEL_DOCUMENTABLE_HPP

#include "model/dri.hpp"
#include "model/platform.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace polydoc::model {

// ============================================================================
// Kinds and Visibility
// ============================================================================

/// The closed set of documentable variants below the module level.
enum class DocumentableKind {
    Package,   ///< A package.
    Class,     ///< A class.
    Interface, ///< An interface.
    Object,    ///< A singleton object.
    Enum,      ///< An enum class.
    EnumEntry, ///< An entry of an enum class.
    Function,  ///< A function or method.
    Property,  ///< A property or field.
    TypeAlias, ///< A type alias.
};

[[nodiscard]] auto kind_to_string(DocumentableKind kind) -> std::string_view;

/// Parses a listing keyword ("class", "fun", "val", ...) into a kind.
[[nodiscard]] auto kind_from_keyword(std::string_view keyword)
    -> std::optional<DocumentableKind>;

/// True for kinds that get their own page (class, interface, object, enum).
[[nodiscard]] auto is_classlike(DocumentableKind kind) -> bool;

enum class Visibility {
    Public,
    Protected,
    Internal,
    Private,
};

[[nodiscard]] auto visibility_to_string(Visibility vis) -> std::string_view;

[[nodiscard]] auto visibility_from_string(std::string_view text) -> std::optional<Visibility>;

// ============================================================================
// Platform Facts
// ============================================================================

struct SourceLocation {
    std::string file;
    uint32_t line = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

struct Deprecation {
    std::string message;
    std::string since;

    [[nodiscard]] auto operator==(const Deprecation& other) const -> bool = default;
};

/// A documented parameter (from `@param name description`).
struct ParamDoc {
    std::string name;
    std::string description;

    [[nodiscard]] auto operator==(const ParamDoc& other) const -> bool = default;
};

/// Facts one platform knows about a declaration.
struct PlatformFacts {
    std::string documentation;              ///< Body text (markdown), tags removed.
    std::string summary;                    ///< First paragraph of the documentation.
    std::string signature;                  ///< Rendered declaration signature.
    Visibility visibility = Visibility::Public;
    std::optional<SourceLocation> source;   ///< Where the declaration lives.
    std::string source_url;                 ///< Browsable link, filled by source links.
    std::vector<std::string> annotations;   ///< Annotation names without '@'.
    std::optional<Deprecation> deprecation; ///< Set when deprecated.
    std::string since;                      ///< `@since` value.
    std::vector<ParamDoc> params;           ///< `@param` tags.
    std::vector<std::string> see_also;      ///< `@see` references.
    std::vector<std::string> extra;         ///< Free-form markers attached by transforms.

    [[nodiscard]] auto has_documentation() const -> bool {
        return !documentation.empty() || !summary.empty();
    }

    [[nodiscard]] auto operator==(const PlatformFacts& other) const -> bool = default;
};

using PlatformFactsMap = PlatformDependent<PlatformFacts>;

// ============================================================================
// Documentable
// ============================================================================

/// One documented program element below the module level.
///
/// Invariant: `dri` is unique among siblings.
struct Documentable {
    DocumentableKind kind = DocumentableKind::Package;
    std::string name;
    DRI dri;
    std::optional<DRI> parent; ///< Lookup-only reference to the enclosing node.
    PlatformFactsMap facts;
    std::vector<Documentable> children; ///< Translation order.

    /// Platforms this declaration is available on, in contribution order.
    [[nodiscard]] auto platforms() const -> std::vector<PlatformData> {
        return facts.platforms();
    }

    [[nodiscard]] auto find_child(const DRI& key) const -> const Documentable*;

    [[nodiscard]] auto operator==(const Documentable& other) const -> bool = default;
};

/// The root of a documentation tree. Owns its packages exclusively.
struct Module {
    std::string name;
    PlatformFactsMap facts; ///< Module-level documentation per platform.
    std::vector<Documentable> packages;

    [[nodiscard]] auto platforms() const -> std::vector<PlatformData> {
        return facts.platforms();
    }

    [[nodiscard]] auto find_package(const std::string& package_name) const
        -> const Documentable*;

    [[nodiscard]] auto operator==(const Module& other) const -> bool = default;
};

/// Total number of documentables below `module` (packages included).
[[nodiscard]] auto count_documentables(const Module& module) -> size_t;

// ============================================================================
// DocumentableIndex
// ============================================================================

/// DRI lookup over one module.
///
/// Holds pointers into the module; the module must outlive the index and
/// must not change while the index is used.
class DocumentableIndex {
public:
    explicit DocumentableIndex(const Module& module);

    [[nodiscard]] auto find(const DRI& dri) const -> const Documentable*;

    /// Resolves the lookup-only parent reference of `node`.
    [[nodiscard]] auto parent_of(const Documentable& node) const -> const Documentable*;

    [[nodiscard]] auto size() const -> size_t {
        return by_dri_.size();
    }

private:
    std::unordered_map<DRI, const Documentable*> by_dri_;
};

} // namespace polydoc::model

#endif // POLYDOC_MODEL_DOCUMENTABLE_HPP
