//! # Markdown Renderer
//!
//! Writes one Markdown file per content page:
//!
//! ```text
//! <module>/index.md                      root page
//! <module>/<package>/index.md            package page
//! <module>/<package>/<Class>.md          classlike page
//! <module>/<package>/<Outer>.<Inner>.md  nested classlike page
//! <module>/<name>.md                     grouped pages (navigation, indexes)
//! ```
//!
//! Renderer-specific pages are written or copied verbatim to their target
//! path. Links to declarations become relative links to the page that
//! documents them, or to the closest enclosing declaration that has a page.

#ifndef POLYDOC_RENDER_MARKDOWN_RENDERER_HPP
#define POLYDOC_RENDER_MARKDOWN_RENDERER_HPP

#include "plugin/core_extensions.hpp"
#include "plugin/plugin.hpp"
#include "render/output_writer.hpp"

#include <map>
#include <string>

namespace polydoc::render {

inline constexpr const char* MARKDOWN_PLUGIN = "markdown";

/// Output path of every page keyed by the DRIs it documents.
class PageLocations {
public:
    explicit PageLocations(const pages::RootPageNode& root);

    /// Path of the page documenting `dri` or its closest documented parent.
    [[nodiscard]] auto resolve(const model::DRI& dri) const -> const std::string*;

    [[nodiscard]] auto root_path() const -> const std::string& {
        return root_path_;
    }

    /// Path of `page`, keyed by its address in the tree passed to the constructor.
    [[nodiscard]] auto path_of(const pages::PageNode& page) const -> const std::string*;

private:
    std::string root_path_;
    std::map<model::DRI, std::string> by_dri_;
    std::map<const pages::PageNode*, std::string> by_page_;
};

/// Relative link from the file `from` to the file `to`.
[[nodiscard]] auto relative_link(const std::string& from, const std::string& to) -> std::string;

class MarkdownRenderer : public plugin::Renderer {
public:
    explicit MarkdownRenderer(Rc<OutputWriter> writer) : writer_(std::move(writer)) {}

    [[nodiscard]] auto render(const pages::RootPageNode& root,
                              const pipeline::DocContext& context) const
        -> pipeline::PipelineResult<Unit> override;

    /// Renders the whole tree. Returns the number of files produced.
    [[nodiscard]] auto render_tree(const pages::RootPageNode& root) const
        -> pipeline::PipelineResult<size_t>;

    /// Markdown text of one content block as it would appear in the file `path`.
    [[nodiscard]] static auto render_content(const pages::ContentNode& content,
                                             const PageLocations& locations,
                                             const std::string& path) -> std::string;

private:
    Rc<OutputWriter> writer_;
};

/// Registers the Markdown renderer when the configured format is
/// `markdown` or `md`. Files go to `output_dir`.
class MarkdownPlugin : public plugin::Plugin {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return MARKDOWN_PLUGIN;
    }

    [[nodiscard]] auto after() const -> std::vector<std::string> override {
        return {"base"};
    }

    void install(plugin::ExtensionRegistrar& registrar,
                 const config::DocConfiguration& configuration) const override;
};

} // namespace polydoc::render

#endif // POLYDOC_RENDER_MARKDOWN_RENDERER_HPP
