//! # Page Content
//!
//! Renderer-neutral content blocks. Each block may be tagged with the
//! platforms it applies to; an empty tag list means "all platforms of the
//! enclosing page". `PlatformHinted` blocks hold one child per platform
//! variant so a renderer can show platform tabs.

#ifndef POLYDOC_PAGES_CONTENT_HPP
#define POLYDOC_PAGES_CONTENT_HPP

#include "model/dri.hpp"
#include "model/platform.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polydoc::pages {

using model::DRI;
using model::PlatformData;

enum class ContentKind {
    Group,          ///< Sequence of children.
    Header,         ///< Heading; `level` 1..6.
    Text,           ///< Paragraph text (markdown allowed).
    Code,           ///< Code block (signatures).
    Table,          ///< Table; children are rows.
    Row,            ///< Table row; children are cells.
    Link,           ///< Link to another declaration (`target`) or URL (`url`).
    PlatformHinted, ///< Per-platform variants; children are tagged groups.
    Break,          ///< Horizontal separator.
};

[[nodiscard]] auto content_kind_to_string(ContentKind kind) -> std::string_view;

struct ContentNode {
    ContentKind kind = ContentKind::Group;
    std::string text;
    int level = 0;
    std::optional<DRI> target;
    std::string url;
    std::string style;                    ///< Free-form hint ("members", "deprecated", ...).
    std::vector<PlatformData> platforms;  ///< Platforms this block applies to.
    std::vector<ContentNode> children;

    [[nodiscard]] auto operator==(const ContentNode& other) const -> bool = default;

    static auto group(std::vector<ContentNode> children = {}, std::string style = "")
        -> ContentNode;
    static auto header(int level, std::string text) -> ContentNode;
    static auto paragraph(std::string text) -> ContentNode;
    static auto code(std::string text) -> ContentNode;
    static auto link(std::string text, DRI target) -> ContentNode;
    static auto url_link(std::string text, std::string url) -> ContentNode;
    static auto separator() -> ContentNode;

    /// Returns a copy of this node tagged with `tag`.
    [[nodiscard]] auto tagged(std::vector<PlatformData> tag) const -> ContentNode;

    /// Concatenated text of this node and its descendants (for search and tests).
    [[nodiscard]] auto plain_text() const -> std::string;
};

} // namespace polydoc::pages

#endif // POLYDOC_PAGES_CONTENT_HPP
