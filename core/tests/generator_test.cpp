//! # Generator Tests
//!
//! End-to-end runs of the documentation generator over fake analysis
//! environments, with the markdown output kept in memory.

#include "base/plugins.hpp"
#include "base/transformers.hpp"
#include "pipeline/generator.hpp"
#include "plugin/core_extensions.hpp"
#include "render/markdown_renderer.hpp"
#include "render/output_writer.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace polydoc;
using namespace polydoc::pipeline;
using namespace polydoc::test_support;
using model::DocumentableKind;
using model::DRI;
using model::Platform;

namespace {

/// Renders into memory instead of the output directory.
class MemoryMarkdownPlugin : public plugin::Plugin {
public:
    explicit MemoryMarkdownPlugin(Rc<render::MemoryOutputWriter> writer)
        : writer_(std::move(writer)) {}

    [[nodiscard]] auto name() const -> std::string override {
        return "memory_markdown";
    }

    void install(plugin::ExtensionRegistrar& registrar,
                 const config::DocConfiguration& /*configuration*/) const override {
        registrar.extend(plugin::RENDERER, "renderer",
                         make_rc<const render::MarkdownRenderer>(writer_));
    }

private:
    Rc<render::MemoryOutputWriter> writer_;
};

/// Keeps a copy of the model after the base transforms ran.
class CaptureTransformer : public plugin::DocumentableTransformer {
public:
    explicit CaptureTransformer(std::optional<model::Module>* seen) : seen_(seen) {}

    [[nodiscard]] auto transform(const model::Module& module, const DocContext& /*context*/) const
        -> PipelineResult<model::Module> override {
        *seen_ = module;
        return module;
    }

private:
    std::optional<model::Module>* seen_;
};

class CapturePlugin : public plugin::Plugin {
public:
    explicit CapturePlugin(std::optional<model::Module>* seen) : seen_(seen) {}

    [[nodiscard]] auto name() const -> std::string override {
        return "capture";
    }

    [[nodiscard]] auto after() const -> std::vector<std::string> override {
        return {"base"};
    }

    void install(plugin::ExtensionRegistrar& registrar,
                 const config::DocConfiguration& /*configuration*/) const override {
        registrar.extend(plugin::DOCUMENTABLE_TRANSFORMER, "model",
                         make_rc<const CaptureTransformer>(seen_));
    }

private:
    std::optional<model::Module>* seen_;
};

/// Appends `label` to the markers of every declaration.
class MarkerTransformer : public plugin::DocumentableTransformer {
public:
    explicit MarkerTransformer(std::string label) : label_(std::move(label)) {}

    [[nodiscard]] auto transform(const model::Module& module, const DocContext& /*context*/) const
        -> PipelineResult<model::Module> override {
        return base::map_documentable_facts(
            module, [this](const model::Documentable&, const model::PlatformData&,
                           model::PlatformFacts& facts) { facts.extra.push_back(label_); });
    }

private:
    std::string label_;
};

class MarkerPlugin : public plugin::Plugin {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "markers";
    }

    void install(plugin::ExtensionRegistrar& registrar,
                 const config::DocConfiguration& /*configuration*/) const override {
        registrar.extend(plugin::DOCUMENTABLE_TRANSFORMER, "one",
                         make_rc<const MarkerTransformer>("one"));
        registrar.extend(plugin::DOCUMENTABLE_TRANSFORMER, "two",
                         make_rc<const MarkerTransformer>("two"));
        registrar.extend(plugin::DOCUMENTABLE_TRANSFORMER, "three",
                         make_rc<const MarkerTransformer>("three"));
    }
};

/// Fails on the jvm platform only.
class BrokenTranslator : public plugin::SymbolTranslator {
public:
    [[nodiscard]] auto translate(const PlatformContext& platform, const DocContext& /*context*/) const
        -> PipelineResult<model::Module> override {
        if (platform.platform.platform != Platform::Jvm) {
            model::Module module;
            module.name = platform.pass.module_name;
            module.facts.insert(platform.platform, model::PlatformFacts{});
            return module;
        }
        return PipelineError::stage_failure("", "cannot translate " +
                                                    platform.platform.display_name());
    }
};

/// Replaces the listing symbol translator with a failing one.
class BrokenTranslatorPlugin : public plugin::Plugin {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "broken";
    }

    void install(plugin::ExtensionRegistrar& registrar,
                 const config::DocConfiguration& /*configuration*/) const override {
        registrar.extend(plugin::SYMBOL_TRANSLATOR, "translator",
                         make_rc<const BrokenTranslator>(), {}, {"core/listing_symbols"});
    }
};

/// Throws from `install()`.
class ThrowingPlugin : public plugin::Plugin {
public:
    [[nodiscard]] auto name() const -> std::string override {
        return "throwing";
    }

    void install(plugin::ExtensionRegistrar& /*registrar*/,
                 const config::DocConfiguration& /*configuration*/) const override {
        throw std::runtime_error("template directory is missing");
    }
};

auto documented(DocumentableKind kind, const std::string& name, const std::string& doc)
    -> analysis::Symbol {
    auto s = symbol(kind, name);
    s.doc = doc;
    return s;
}

} // namespace

// ============================================================================
// Fixture
// ============================================================================

/// Module `core` analyzed for jvm and js. Both define class `a.C`; only the
/// jvm pass has `a.J`.
class GeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        configuration.passes = {pass("core", Platform::Jvm), pass("core", Platform::Js)};
        configuration.disabled_plugins = {"markdown"};
        writer = make_rc<render::MemoryOutputWriter>();

        auto jvm = make_rc<FakeEnvironment>();
        jvm->groups.push_back(analysis::SymbolGroup{
            "a",
            {documented(DocumentableKind::Class, "C", "Shared class."),
             documented(DocumentableKind::Class, "J", "JVM only.")}});
        environments["jvm"] = jvm;

        auto js = make_rc<FakeEnvironment>();
        js->groups.push_back(
            analysis::SymbolGroup{"a", {documented(DocumentableKind::Class, "C", "Shared class.")}});
        environments["js"] = js;
    }

    auto factory() -> analysis::AnalysisFactory {
        return [this](const config::PassConfiguration& p, const analysis::AnalysisSettings&,
                      analysis::MessageCollector& messages)
                   -> Result<Rc<const analysis::AnalysisEnvironment>, std::string> {
            std::string key(model::platform_to_string(p.analysis_platform));
            if (failing_platform == key) {
                return std::string("source root vanished");
            }
            if (report_error_on == key) {
                messages.report(analysis::Severity::Error, "unresolved reference: Foo",
                                std::nullopt);
            }
            auto found = environments.find(key);
            if (found == environments.end()) {
                return std::string("no environment for " + key);
            }
            return Rc<const analysis::AnalysisEnvironment>(found->second);
        };
    }

    auto generator(std::vector<Rc<const plugin::Plugin>> extra = {}) -> DocGenerator {
        extra.insert(extra.begin(), make_rc<const MemoryMarkdownPlugin>(writer));
        return DocGenerator(configuration, logger, factory(), std::move(extra));
    }

    config::DocConfiguration configuration;
    RecordingDocLogger logger;
    Rc<render::MemoryOutputWriter> writer;
    std::map<std::string, Rc<FakeEnvironment>> environments;
    std::string failing_platform;
    std::string report_error_on;
};

// ============================================================================
// Successful Runs
// ============================================================================

TEST_F(GeneratorTest, RunsEveryStageInOrder) {
    auto gen = generator();
    auto result = gen.generate();

    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_EQ(logger.stages, std::vector<std::string>(stage::ALL.begin(), stage::ALL.end()));
    EXPECT_TRUE(logger.errors.empty());
    EXPECT_EQ(logger.reports, 1u);
}

TEST_F(GeneratorTest, MergesPlatformsIntoOneModel) {
    std::optional<model::Module> seen;
    auto gen = generator({make_rc<const CapturePlugin>(&seen)});
    ASSERT_TRUE(is_ok(gen.generate()));
    ASSERT_TRUE(seen.has_value());

    auto jvm = configuration.passes[0].platform_data();
    auto js = configuration.passes[1].platform_data();

    EXPECT_EQ(seen->name, "core");
    EXPECT_EQ(seen->platforms(), (std::vector<model::PlatformData>{jvm, js}));
    ASSERT_EQ(seen->packages.size(), 1u);

    const auto* c = seen->packages[0].find_child(DRI::for_package("a").with_class("C"));
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->platforms(), (std::vector<model::PlatformData>{jvm, js}));

    const auto* j = seen->packages[0].find_child(DRI::for_package("a").with_class("J"));
    ASSERT_NE(j, nullptr);
    EXPECT_EQ(j->platforms(), std::vector<model::PlatformData>{jvm});
}

TEST_F(GeneratorTest, TransformsRunInRegistrationOrder) {
    std::optional<model::Module> seen;
    auto gen = generator({make_rc<const MarkerPlugin>(), make_rc<const CapturePlugin>(&seen)});
    ASSERT_TRUE(is_ok(gen.generate()));
    ASSERT_TRUE(seen.has_value());

    const auto* c = seen->packages[0].find_child(DRI::for_package("a").with_class("C"));
    ASSERT_NE(c, nullptr);
    for (const auto& [platform, facts] : c->facts.entries()) {
        EXPECT_EQ(facts.extra, (std::vector<std::string>{"one", "two", "three"}))
            << platform.display_name();
    }
}

TEST_F(GeneratorTest, ReportCountsTheRun) {
    auto gen = generator();
    auto result = gen.generate();
    ASSERT_TRUE(is_ok(result));

    const auto& report = unwrap(result);
    EXPECT_EQ(report.platforms, 2u);
    EXPECT_EQ(report.modules, 4u);       // symbol and file module per platform
    EXPECT_EQ(report.documentables, 3u); // a, a.C, a.J
    EXPECT_EQ(report.pages, 5u);         // a, C, J, navigation, search index
    EXPECT_FALSE(report.analysis_errors);
    EXPECT_EQ(report.warnings, 0u);
    EXPECT_EQ(report.errors, 0u);
}

TEST_F(GeneratorTest, WritesMarkdownFiles) {
    auto gen = generator();
    ASSERT_TRUE(is_ok(gen.generate()));

    std::vector<std::string> paths;
    for (const auto& [path, _] : writer->files()) {
        paths.push_back(path);
    }
    EXPECT_EQ(paths, (std::vector<std::string>{"core/a/C.md", "core/a/J.md", "core/a/index.md",
                                               "core/index.md", "core/navigation.md",
                                               "core/search-index.json"}));

    const auto* c = writer->find("core/a/C.md");
    ASSERT_NE(c, nullptr);
    EXPECT_NE(c->find("Shared class."), std::string::npos);
    ASSERT_FALSE(logger.infos.empty());
    EXPECT_EQ(logger.infos.back(), "Rendered 6 file(s) to docs");
}

TEST_F(GeneratorTest, UndocumentedDeclarationsAreCounted) {
    environments["js"]->groups[0].symbols.push_back(symbol(DocumentableKind::Class, "S"));

    auto gen = generator();
    auto result = gen.generate();
    ASSERT_TRUE(is_ok(result));

    EXPECT_EQ(unwrap(result).warnings, 1u);
    EXPECT_TRUE(logger.warned("Undocumented: a/S// (core/js)"));
}

TEST_F(GeneratorTest, AnalysisErrorsDoNotStopTheRun) {
    report_error_on = "js";

    auto gen = generator();
    auto result = gen.generate();

    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).analysis_errors);
    EXPECT_EQ(logger.stages.size(), stage::ALL.size());
}

TEST_F(GeneratorTest, DisabledPluginIsLeftOut) {
    auto gen = generator();
    for (const auto& plugin : gen.plugins()) {
        EXPECT_NE(plugin->name(), "markdown");
    }
    EXPECT_EQ(gen.plugins().size(), 3u); // core, base, memory_markdown
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(GeneratorTest, SetupFailureStopsBeforePlugins) {
    failing_platform = "js";

    auto gen = generator();
    auto result = gen.generate();

    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.stage, stage::SETUP);
    EXPECT_EQ(err.message, "cannot analyze core/js: source root vanished");
    EXPECT_EQ(logger.stages, std::vector<std::string>{stage::SETUP});
    ASSERT_EQ(logger.errors.size(), 1u);
    EXPECT_EQ(logger.errors[0], err.to_string());
}

TEST_F(GeneratorTest, NoPassesFailBeforeTranslation) {
    configuration.passes.clear();

    auto gen = generator();
    auto result = gen.generate();

    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_TRUE(err.is_configuration());
    EXPECT_EQ(err.message, "no platforms to document: at least one pass must be configured");
    EXPECT_EQ(logger.stages, (std::vector<std::string>{stage::SETUP, stage::PLUGINS}));
    EXPECT_TRUE(writer->files().empty());
}

TEST_F(GeneratorTest, ThrowingPluginInstallIsReturnedAsError) {
    auto gen = generator({make_rc<const ThrowingPlugin>()});
    auto result = gen.generate();

    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_TRUE(err.is_configuration());
    EXPECT_EQ(err.message, "plugin 'throwing' failed to install: template directory is missing");
    EXPECT_EQ(logger.stages, (std::vector<std::string>{stage::SETUP, stage::PLUGINS}));
    ASSERT_EQ(logger.errors.size(), 1u);
    EXPECT_EQ(logger.errors[0], err.to_string());
}

TEST_F(GeneratorTest, UnsupportedFormatFailsBeforeTranslation) {
    configuration.format = "html";
    configuration.disabled_plugins.clear();

    DocGenerator gen(configuration, logger, factory());
    auto result = gen.generate();

    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_TRUE(err.is_configuration());
    EXPECT_NE(err.message.find("'renderer' requires exactly one implementation, found 0"),
              std::string::npos)
        << err.message;
    EXPECT_EQ(logger.stages, (std::vector<std::string>{stage::SETUP, stage::PLUGINS}));
}

TEST_F(GeneratorTest, TwoRenderersAreAmbiguous) {
    configuration.disabled_plugins.clear();

    auto gen = generator();
    auto result = gen.generate();

    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("found 2"), std::string::npos);
    EXPECT_TRUE(writer->files().empty());
}

TEST_F(GeneratorTest, TranslationFailureSkipsLaterStages) {
    std::optional<model::Module> seen;
    auto gen = generator({make_rc<const BrokenTranslatorPlugin>(),
                          make_rc<const CapturePlugin>(&seen)});
    auto result = gen.generate();

    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.stage, stage::TRANSLATE);
    EXPECT_EQ(err.message, "cannot translate core/jvm");
    EXPECT_EQ(logger.stages,
              (std::vector<std::string>{stage::SETUP, stage::PLUGINS, stage::TRANSLATE}));
    EXPECT_FALSE(seen.has_value());
    EXPECT_TRUE(writer->files().empty());
}

TEST(BuiltinPluginsTest, CoreBaseMarkdown) {
    std::vector<std::string> names;
    for (const auto& plugin : builtin_plugins()) {
        names.push_back(plugin->name());
    }
    EXPECT_EQ(names, (std::vector<std::string>{"core", "base", "markdown"}));
}
