//! # Pipeline Context
//!
//! `PlatformContext` pairs one configured pass with its analysis environment.
//! `DocContext` bundles everything an extension may consult during a run:
//! configuration, logger, diagnostics collector, the frozen registry and the
//! platform contexts. It is created after plugin initialization and is
//! read-only from then on.

#ifndef POLYDOC_PIPELINE_CONTEXT_HPP
#define POLYDOC_PIPELINE_CONTEXT_HPP

#include "analysis/analysis.hpp"
#include "config/configuration.hpp"
#include "pipeline/doc_logger.hpp"
#include "plugin/registry.hpp"

#include <vector>

namespace polydoc::pipeline {

/// One platform pass and its analysis handle.
struct PlatformContext {
    model::PlatformData platform;
    config::PassConfiguration pass;
    Rc<const analysis::AnalysisEnvironment> environment;
};

class DocContext {
public:
    DocContext(const config::DocConfiguration& configuration, DocLogger& logger,
               analysis::MessageCollector& messages, const plugin::ExtensionRegistry& registry,
               std::vector<PlatformContext> platforms)
        : configuration_(configuration), logger_(logger), messages_(messages),
          registry_(registry), platforms_(std::move(platforms)) {}

    [[nodiscard]] auto configuration() const -> const config::DocConfiguration& {
        return configuration_;
    }
    [[nodiscard]] auto logger() const -> DocLogger& {
        return logger_;
    }
    [[nodiscard]] auto messages() const -> analysis::MessageCollector& {
        return messages_;
    }
    [[nodiscard]] auto registry() const -> const plugin::ExtensionRegistry& {
        return registry_;
    }
    [[nodiscard]] auto platforms() const -> const std::vector<PlatformContext>& {
        return platforms_;
    }

    [[nodiscard]] auto find_platform(const model::PlatformData& platform) const
        -> const PlatformContext* {
        for (const auto& context : platforms_) {
            if (context.platform == platform) {
                return &context;
            }
        }
        return nullptr;
    }

    /// The pass that produced `platform`, or nullptr for foreign platforms.
    [[nodiscard]] auto pass_for(const model::PlatformData& platform) const
        -> const config::PassConfiguration* {
        const auto* context = find_platform(platform);
        return context ? &context->pass : nullptr;
    }

private:
    const config::DocConfiguration& configuration_;
    DocLogger& logger_;
    analysis::MessageCollector& messages_;
    const plugin::ExtensionRegistry& registry_;
    std::vector<PlatformContext> platforms_;
};

} // namespace polydoc::pipeline

#endif // POLYDOC_PIPELINE_CONTEXT_HPP
