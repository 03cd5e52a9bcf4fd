//! # Documentation Generator
//!
//! The top-level driver. A run executes eight stages strictly in order and
//! announces each through `DocLogger::progress()`:
//!
//! ```text
//! 1 setup platforms ─▶ 2 init plugins ─▶ 3 translate (parallel per platform)
//!   ─▶ 4 merge ─▶ 5 transform model ─▶ 6 create pages ─▶ 7 transform pages
//!   ─▶ 8 render
//! ```
//!
//! A fatal error stops the run at the stage that raised it; later stages
//! never execute. Analysis diagnostics do not stop the run and only show up
//! in the `GenerationReport`.

#ifndef POLYDOC_PIPELINE_GENERATOR_HPP
#define POLYDOC_PIPELINE_GENERATOR_HPP

#include "analysis/analysis.hpp"
#include "config/configuration.hpp"
#include "pages/page_node.hpp"
#include "pipeline/context.hpp"
#include "pipeline/doc_logger.hpp"
#include "pipeline/error.hpp"
#include "plugin/plugin.hpp"

#include <array>
#include <string>
#include <vector>

namespace polydoc::pipeline {

namespace stage {
inline constexpr const char* SETUP = "Setting up analysis environments";
inline constexpr const char* PLUGINS = "Initializing plugins";
inline constexpr const char* TRANSLATE = "Creating documentation models";
inline constexpr const char* MERGE = "Merging documentation models";
inline constexpr const char* TRANSFORM_MODEL = "Transforming documentation model";
inline constexpr const char* CREATE_PAGES = "Creating pages";
inline constexpr const char* TRANSFORM_PAGES = "Transforming pages";
inline constexpr const char* RENDER = "Rendering";

/// All stage names in execution order.
inline constexpr std::array<const char*, 8> ALL = {
    SETUP, PLUGINS, TRANSLATE, MERGE, TRANSFORM_MODEL, CREATE_PAGES, TRANSFORM_PAGES, RENDER};
} // namespace stage

/// Summary of a completed run.
struct GenerationReport {
    size_t platforms = 0;     ///< Configured passes.
    size_t modules = 0;       ///< Modules handed to the merger.
    size_t documentables = 0; ///< Declarations in the final model.
    size_t pages = 0;         ///< Pages in the final page tree.
    bool analysis_errors = false;
    size_t warnings = 0;
    size_t errors = 0;
};

/// The plugins every run starts with: core, base and markdown.
[[nodiscard]] auto builtin_plugins() -> std::vector<Rc<const plugin::Plugin>>;

class DocGenerator {
public:
    /// `plugin_overrides` are installed in addition to the built-in plugins;
    /// plugins named in `disabled_plugins` are left out.
    DocGenerator(config::DocConfiguration configuration, DocLogger& logger,
                 analysis::AnalysisFactory factory,
                 std::vector<Rc<const plugin::Plugin>> plugin_overrides = {});

    /// Runs all stages.
    [[nodiscard]] auto generate() -> PipelineResult<GenerationReport>;

    [[nodiscard]] auto configuration() const -> const config::DocConfiguration& {
        return configuration_;
    }

    /// Plugins taking part in the run, before ordering.
    [[nodiscard]] auto plugins() const -> const std::vector<Rc<const plugin::Plugin>>& {
        return plugins_;
    }

    // ------------------------------------------------------------------------
    // Stages
    // ------------------------------------------------------------------------

    [[nodiscard]] auto setup_platforms(analysis::MessageCollector& messages)
        -> PipelineResult<std::vector<PlatformContext>>;

    /// Installs the plugins and checks that every single point is filled.
    [[nodiscard]] auto initialize_plugins() -> PipelineResult<plugin::ExtensionRegistry>;

    /// Translates all platforms. Symbol modules of every platform come first,
    /// then file modules, each group in pass order.
    [[nodiscard]] auto create_documentation_models(const DocContext& context)
        -> PipelineResult<std::vector<model::Module>>;

    [[nodiscard]] auto merge_documentation_models(const std::vector<model::Module>& modules,
                                                  const DocContext& context)
        -> PipelineResult<model::Module>;

    [[nodiscard]] auto transform_documentation_model(const model::Module& module,
                                                     const DocContext& context)
        -> PipelineResult<model::Module>;

    [[nodiscard]] auto create_pages(const model::Module& module, const DocContext& context)
        -> PipelineResult<pages::RootPageNode>;

    [[nodiscard]] auto transform_pages(const pages::RootPageNode& root, const DocContext& context)
        -> PipelineResult<pages::RootPageNode>;

    [[nodiscard]] auto render(const pages::RootPageNode& root, const DocContext& context)
        -> PipelineResult<Unit>;

private:
    auto fail(PipelineError error) -> PipelineError;

    config::DocConfiguration configuration_;
    DocLogger& logger_;
    analysis::AnalysisFactory factory_;
    std::vector<Rc<const plugin::Plugin>> plugins_;
};

} // namespace polydoc::pipeline

#endif // POLYDOC_PIPELINE_GENERATOR_HPP
