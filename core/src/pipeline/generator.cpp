//! # Documentation Generator Implementation
//!
//! Every extension call goes through `guarded()`, which turns a returned
//! error or an escaping `std::exception` into a failure tagged with the
//! current stage.

#include "pipeline/generator.hpp"

#include "base/plugins.hpp"
#include "log/log.hpp"
#include "pipeline/translation_pool.hpp"
#include "plugin/core_extensions.hpp"
#include "render/markdown_renderer.hpp"

namespace polydoc::pipeline {

namespace {

template <typename T, typename Fn>
auto guarded(const char* stage_name, Fn&& fn) -> PipelineResult<T> {
    try {
        PipelineResult<T> result = fn();
        if (is_err(result)) {
            auto& err = unwrap_err(result);
            if (err.kind == ErrorKind::StageFailure && err.stage.empty()) {
                err.stage = stage_name;
            }
        }
        return result;
    } catch (const std::exception& e) {
        return PipelineError::stage_failure(stage_name, e.what());
    }
}

/// Resolves a single point that `initialize_plugins()` already checked.
template <typename T>
auto single(const DocContext& context, const plugin::ExtensionPoint<T>& point)
    -> PipelineResult<Rc<const T>> {
    return context.registry().resolve_single(point);
}

} // namespace

auto builtin_plugins() -> std::vector<Rc<const plugin::Plugin>> {
    return {make_rc<const base::CorePlugin>(), make_rc<const base::BasePlugin>(),
            make_rc<const render::MarkdownPlugin>()};
}

DocGenerator::DocGenerator(config::DocConfiguration configuration, DocLogger& logger,
                           analysis::AnalysisFactory factory,
                           std::vector<Rc<const plugin::Plugin>> plugin_overrides)
    : configuration_(std::move(configuration)), logger_(logger), factory_(std::move(factory)) {
    for (auto& plugin : builtin_plugins()) {
        plugins_.push_back(std::move(plugin));
    }
    for (auto& plugin : plugin_overrides) {
        plugins_.push_back(std::move(plugin));
    }
    std::erase_if(plugins_, [this](const Rc<const plugin::Plugin>& plugin) {
        if (configuration_.is_plugin_disabled(plugin->name())) {
            POLYDOC_LOG_DEBUG("plugin", "plugin '" << plugin->name() << "' is disabled");
            return true;
        }
        return false;
    });
}

auto DocGenerator::fail(PipelineError error) -> PipelineError {
    logger_.error(error.to_string());
    return error;
}

// ============================================================================
// Driver
// ============================================================================

auto DocGenerator::generate() -> PipelineResult<GenerationReport> {
    GenerationReport report;
    report.platforms = configuration_.passes.size();

    logger_.progress(stage::SETUP);
    analysis::LoggingMessageCollector messages(logger_);
    auto platforms = setup_platforms(messages);
    if (is_err(platforms)) {
        return fail(unwrap_err(platforms));
    }

    logger_.progress(stage::PLUGINS);
    auto registry = initialize_plugins();
    if (is_err(registry)) {
        return fail(unwrap_err(registry));
    }

    if (configuration_.passes.empty()) {
        return fail(PipelineError::configuration(
            "no platforms to document: at least one pass must be configured"));
    }

    DocContext context(configuration_, logger_, messages, unwrap(registry),
                       std::move(unwrap(platforms)));

    logger_.progress(stage::TRANSLATE);
    auto modules = create_documentation_models(context);
    if (is_err(modules)) {
        return fail(unwrap_err(modules));
    }
    report.modules = unwrap(modules).size();

    logger_.progress(stage::MERGE);
    auto merged = merge_documentation_models(unwrap(modules), context);
    if (is_err(merged)) {
        return fail(unwrap_err(merged));
    }

    logger_.progress(stage::TRANSFORM_MODEL);
    auto transformed = transform_documentation_model(unwrap(merged), context);
    if (is_err(transformed)) {
        return fail(unwrap_err(transformed));
    }
    report.documentables = model::count_documentables(unwrap(transformed));

    logger_.progress(stage::CREATE_PAGES);
    auto page_tree = create_pages(unwrap(transformed), context);
    if (is_err(page_tree)) {
        return fail(unwrap_err(page_tree));
    }

    logger_.progress(stage::TRANSFORM_PAGES);
    auto final_pages = transform_pages(unwrap(page_tree), context);
    if (is_err(final_pages)) {
        return fail(unwrap_err(final_pages));
    }
    report.pages = pages::count_pages(unwrap(final_pages));

    logger_.progress(stage::RENDER);
    auto rendered = render(unwrap(final_pages), context);
    if (is_err(rendered)) {
        return fail(unwrap_err(rendered));
    }

    report.analysis_errors = messages.has_errors();
    logger_.report();
    report.warnings = logger_.warnings_count();
    report.errors = logger_.errors_count();
    return report;
}

// ============================================================================
// Stages
// ============================================================================

auto DocGenerator::setup_platforms(analysis::MessageCollector& messages)
    -> PipelineResult<std::vector<PlatformContext>> {
    if (configuration_.cache_root) {
        logger_.debug("Cache root: " + *configuration_.cache_root);
    }

    std::vector<PlatformContext> contexts;
    contexts.reserve(configuration_.passes.size());

    for (const auto& pass : configuration_.passes) {
        auto platform = pass.platform_data();
        auto settings = analysis::make_analysis_settings(pass);

        POLYDOC_LOG_DEBUG("analysis", "setting up " << platform.display_name() << ", "
                                                    << settings.source_roots.size()
                                                    << " source root(s), "
                                                    << settings.classpath.size()
                                                    << " classpath entr"
                                                    << (settings.classpath.size() == 1 ? "y" : "ies"));
        for (const auto& sample : pass.samples) {
            logger_.debug("Samples: " + sample);
        }
        for (const auto& link : pass.external_documentation_links) {
            logger_.debug("External documentation: " + link.url + " (package list " +
                          link.resolved_package_list() + ")");
        }

        auto environment =
            guarded<Rc<const analysis::AnalysisEnvironment>>(stage::SETUP, [&]() {
                auto created = factory_(pass, settings, messages);
                if (is_err(created)) {
                    return PipelineResult<Rc<const analysis::AnalysisEnvironment>>(
                        PipelineError::stage_failure(
                            stage::SETUP, "cannot analyze " + platform.display_name() + ": " +
                                              unwrap_err(created)));
                }
                return PipelineResult<Rc<const analysis::AnalysisEnvironment>>(
                    std::move(unwrap(created)));
            });
        if (is_err(environment)) {
            return unwrap_err(environment);
        }

        contexts.push_back(PlatformContext{platform, pass, std::move(unwrap(environment))});
    }
    return contexts;
}

auto DocGenerator::initialize_plugins() -> PipelineResult<plugin::ExtensionRegistry> {
    auto registry = plugin::initialize_plugins(plugins_, configuration_);
    if (is_err(registry)) {
        return registry;
    }

    const auto& reg = unwrap(registry);
    for (const auto& point : reg.point_names()) {
        POLYDOC_LOG_DEBUG("plugin", point << ": " << reg.registration_ids(point).size()
                                          << " extension(s)");
    }

    // Fail before any translation when a single point is not filled exactly once.
    std::vector<PipelineError> problems;
    auto check = [&](auto result) {
        if (is_err(result)) {
            problems.push_back(unwrap_err(result));
        }
    };
    check(reg.resolve_single(plugin::SYMBOL_TRANSLATOR));
    check(reg.resolve_single(plugin::FILE_TRANSLATOR));
    check(reg.resolve_single(plugin::DOCUMENTABLE_MERGER));
    check(reg.resolve_single(plugin::PAGE_CREATOR));
    check(reg.resolve_single(plugin::RENDERER));
    if (!problems.empty()) {
        return problems.front();
    }
    return registry;
}

auto DocGenerator::create_documentation_models(const DocContext& context)
    -> PipelineResult<std::vector<model::Module>> {
    auto symbols = single(context, plugin::SYMBOL_TRANSLATOR);
    if (is_err(symbols)) {
        return unwrap_err(symbols);
    }
    auto files = single(context, plugin::FILE_TRANSLATOR);
    if (is_err(files)) {
        return unwrap_err(files);
    }
    auto symbol_translator = unwrap(symbols);
    auto file_translator = unwrap(files);

    std::vector<TranslationTask> tasks;
    for (const auto& platform : context.platforms()) {
        tasks.push_back([&platform, &context, symbol_translator,
                         file_translator]() -> PipelineResult<PlatformTranslation> {
            POLYDOC_LOG_DEBUG("analysis", "translating " << platform.platform.display_name());
            auto symbol_module = symbol_translator->translate(platform, context);
            if (is_err(symbol_module)) {
                return unwrap_err(symbol_module);
            }
            auto file_module = file_translator->translate(platform, context);
            if (is_err(file_module)) {
                return unwrap_err(file_module);
            }
            return PlatformTranslation{platform.platform, std::move(unwrap(symbol_module)),
                                       std::move(unwrap(file_module))};
        });
    }

    TranslationPool pool;
    auto translated = pool.run(std::move(tasks), stage::TRANSLATE);
    if (is_err(translated)) {
        return unwrap_err(translated);
    }

    std::vector<model::Module> modules;
    for (auto& translation : unwrap(translated)) {
        modules.push_back(std::move(translation.symbol_module));
    }
    for (auto& translation : unwrap(translated)) {
        modules.push_back(std::move(translation.file_module));
    }
    return modules;
}

auto DocGenerator::merge_documentation_models(const std::vector<model::Module>& modules,
                                              const DocContext& context)
    -> PipelineResult<model::Module> {
    auto merger = single(context, plugin::DOCUMENTABLE_MERGER);
    if (is_err(merger)) {
        return unwrap_err(merger);
    }
    return guarded<model::Module>(stage::MERGE,
                                  [&]() { return unwrap(merger)->merge(modules, context); });
}

auto DocGenerator::transform_documentation_model(const model::Module& module,
                                                 const DocContext& context)
    -> PipelineResult<model::Module> {
    auto transformers = context.registry().resolve_all(plugin::DOCUMENTABLE_TRANSFORMER);
    auto ids = context.registry().registration_ids(plugin::DOCUMENTABLE_TRANSFORMER.name);

    model::Module current = module;
    for (size_t i = 0; i < transformers.size(); ++i) {
        POLYDOC_LOG_DEBUG("transform", "applying " << ids[i]);
        auto next = guarded<model::Module>(
            stage::TRANSFORM_MODEL, [&]() { return transformers[i]->transform(current, context); });
        if (is_err(next)) {
            return next;
        }
        current = std::move(unwrap(next));
    }
    return current;
}

auto DocGenerator::create_pages(const model::Module& module, const DocContext& context)
    -> PipelineResult<pages::RootPageNode> {
    auto creator = single(context, plugin::PAGE_CREATOR);
    if (is_err(creator)) {
        return unwrap_err(creator);
    }
    return guarded<pages::RootPageNode>(
        stage::CREATE_PAGES, [&]() { return unwrap(creator)->create(module, context); });
}

auto DocGenerator::transform_pages(const pages::RootPageNode& root, const DocContext& context)
    -> PipelineResult<pages::RootPageNode> {
    auto transformers = context.registry().resolve_all(plugin::PAGE_TRANSFORMER);
    auto ids = context.registry().registration_ids(plugin::PAGE_TRANSFORMER.name);

    pages::RootPageNode current = root;
    for (size_t i = 0; i < transformers.size(); ++i) {
        POLYDOC_LOG_DEBUG("pages", "applying " << ids[i]);
        auto next = guarded<pages::RootPageNode>(
            stage::TRANSFORM_PAGES, [&]() { return transformers[i]->transform(current, context); });
        if (is_err(next)) {
            return next;
        }
        current = std::move(unwrap(next));
    }
    return current;
}

auto DocGenerator::render(const pages::RootPageNode& root, const DocContext& context)
    -> PipelineResult<Unit> {
    auto renderer = single(context, plugin::RENDERER);
    if (is_err(renderer)) {
        return unwrap_err(renderer);
    }
    return guarded<Unit>(stage::RENDER, [&]() { return unwrap(renderer)->render(root, context); });
}

} // namespace polydoc::pipeline
