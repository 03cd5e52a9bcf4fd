//! # Model Transform and Translator Tests
//!
//! Tests for the base plugin's documentable transforms, their helpers, and
//! the listing translators that feed them.

#include "base/transformers.hpp"
#include "base/translators.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace polydoc;
using namespace polydoc::base;
using namespace polydoc::model;
using namespace polydoc::test_support;
namespace fs = std::filesystem;

// ============================================================================
// Helpers
// ============================================================================

class FilterHelperTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto c = declaration(DocumentableKind::Class, cls, jvm);
        c.facts.insert(js, facts());
        auto f = declaration(DocumentableKind::Function, cls.with_callable("f", "()"), jvm);
        f.facts.insert(js, facts());
        c.children.push_back(f);

        auto only_js = declaration(DocumentableKind::Class, pkg.with_class("S"), js);

        auto package = make_package("a", jvm, {c, only_js});
        package.facts.insert(js, facts());
        module = make_module("core", jvm, {package});
    }

    PlatformData jvm = platform("core", Platform::Jvm);
    PlatformData js = platform("core", Platform::Js);
    DRI pkg = DRI::for_package("a");
    DRI cls = pkg.with_class("C");
    Module module;
};

TEST_F(FilterHelperTest, RemovedPlatformTakesSubtreeAlong) {
    auto filtered = filter_documentables(
        module, [&](const Documentable& node, const PlatformData& platform, const PlatformFacts&) {
            return !(node.dri == cls && platform == js);
        });

    ASSERT_EQ(filtered.packages.size(), 1u);
    const auto& package = filtered.packages[0];
    ASSERT_EQ(package.children.size(), 2u);

    const auto& c = package.children[0];
    EXPECT_EQ(c.platforms(), std::vector<PlatformData>{jvm});
    ASSERT_EQ(c.children.size(), 1u);
    EXPECT_EQ(c.children[0].platforms(), std::vector<PlatformData>{jvm});
    EXPECT_EQ(package.children[1].platforms(), std::vector<PlatformData>{js});
}

TEST_F(FilterHelperTest, NodeWithoutPlatformsIsRemoved) {
    auto filtered = filter_documentables(
        module, [&](const Documentable&, const PlatformData& platform, const PlatformFacts&) {
            return platform == jvm;
        });

    const auto& package = filtered.packages[0];
    ASSERT_EQ(package.children.size(), 1u);
    EXPECT_EQ(package.children[0].name, "C");
    EXPECT_EQ(count_documentables(filtered), 3u);
}

TEST_F(FilterHelperTest, InputIsNotModified) {
    auto before = module;
    auto filtered = filter_documentables(
        module, [](const Documentable&, const PlatformData&, const PlatformFacts&) {
            return false;
        });

    EXPECT_TRUE(filtered.packages.empty());
    EXPECT_EQ(module, before);
}

TEST_F(FilterHelperTest, MapFactsVisitsEveryPlatform) {
    auto mapped = map_documentable_facts(
        module, [](const Documentable& node, const PlatformData& platform, PlatformFacts& f) {
            f.extra.push_back(node.name + "@" + std::string(platform_to_string(platform.platform)));
        });

    const auto& f = mapped.packages[0].children[0].children[0];
    EXPECT_EQ(f.facts.find(jvm)->extra, std::vector<std::string>{"f@jvm"});
    EXPECT_EQ(f.facts.find(js)->extra, std::vector<std::string>{"f@js"});
    EXPECT_TRUE(module.packages[0].children[0].children[0].facts.find(jvm)->extra.empty());
}

TEST(IncludeSectionsTest, SplitsModuleAndPackageSections) {
    auto sections = parse_include_sections("ignored preamble\n"
                                           "# Module core\n"
                                           "The core module.\n"
                                           "\n"
                                           "# Modules are not headers\n"
                                           "# Package a.b\n"
                                           "  Package docs.  \n");

    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0].kind, IncludeSection::Kind::Module);
    EXPECT_EQ(sections[0].name, "core");
    EXPECT_EQ(sections[0].text, "The core module.\n\n# Modules are not headers");
    EXPECT_EQ(sections[1].kind, IncludeSection::Kind::Package);
    EXPECT_EQ(sections[1].name, "a.b");
    EXPECT_EQ(sections[1].text, "Package docs.");
}

TEST(SuppressedFileTest, MatchesWholePathSegments) {
    std::vector<std::string> suppressed{"src/gen"};

    EXPECT_TRUE(is_suppressed_file("src/gen", suppressed));
    EXPECT_TRUE(is_suppressed_file("src/gen/a.api", suppressed));
    EXPECT_FALSE(is_suppressed_file("src/generated/a.api", suppressed));
    EXPECT_FALSE(is_suppressed_file("src/gen/a.api", {}));
}

TEST(SourceLinkTest, LongestPathWins) {
    std::vector<config::SourceLinkDefinition> links{
        {"src", "https://example.org/blob/main/src/", ""},
        {"src/jvm/", "https://jvm.example.org/tree", "#L"},
    };

    EXPECT_EQ(resolve_source_link(SourceLocation{"src/jvm/a/B.api", 12}, links),
              "https://jvm.example.org/tree/a/B.api#L12");
    EXPECT_EQ(resolve_source_link(SourceLocation{"src/common/x.api", 3}, links),
              "https://example.org/blob/main/src/common/x.api");
    EXPECT_EQ(resolve_source_link(SourceLocation{"other/z.api", 1}, links), "");
}

TEST(SourceLinkTest, NoLineSuffixWithoutLine) {
    std::vector<config::SourceLinkDefinition> links{{"src", "https://example.org", "#L"}};
    EXPECT_EQ(resolve_source_link(SourceLocation{"src/a.api", 0}, links),
              "https://example.org/a.api");
}

// ============================================================================
// Transforms
// ============================================================================

class TransformTest : public ::testing::Test {
protected:
    auto run(const plugin::DocumentableTransformer& transformer, const Module& input) -> Module {
        auto context = harness.context();
        auto result = transformer.transform(input, context);
        if (is_err(result)) {
            ADD_FAILURE() << unwrap_err(result).to_string();
            return {};
        }
        return unwrap(result);
    }

    /// A module with public class `a.C` holding `members`, all on jvm.
    auto class_module(std::vector<Documentable> members, PlatformFacts class_facts = facts())
        -> Module {
        auto c = declaration(DocumentableKind::Class, cls, jvm, std::move(class_facts));
        c.children = std::move(members);
        return make_module("core", jvm, {make_package("a", jvm, {c})});
    }

    auto member(const std::string& name, PlatformFacts f = facts()) -> Documentable {
        return declaration(DocumentableKind::Function, cls.with_callable(name, "()"), jvm,
                           std::move(f));
    }

    ContextHarness harness;
    config::PassConfiguration jvm_pass = pass("core", Platform::Jvm);
    PlatformData jvm = platform("core", Platform::Jvm);
    DRI cls = DRI::for_package("a").with_class("C");
};

TEST_F(TransformTest, VisibilityFilterDropsNonPublic) {
    harness.add_pass(jvm_pass);
    auto input = class_module({member("open"), member("hidden", facts("", Visibility::Private)),
                               member("guarded", facts("", Visibility::Protected))});

    auto output = run(VisibilityFilter{}, input);

    const auto& c = output.packages[0].children[0];
    ASSERT_EQ(c.children.size(), 2u);
    EXPECT_EQ(c.children[0].name, "open");
    EXPECT_EQ(c.children[1].name, "guarded");
}

TEST_F(TransformTest, VisibilityFilterDropsSubtreeOfInternalClass) {
    harness.add_pass(jvm_pass);
    auto input = class_module({member("f")}, facts("", Visibility::Internal));

    auto output = run(VisibilityFilter{}, input);
    EXPECT_TRUE(output.packages[0].children.empty());
}

TEST_F(TransformTest, VisibilityFilterHonorsIncludeNonPublic) {
    jvm_pass.include_non_public = true;
    harness.add_pass(jvm_pass);
    auto input = class_module({member("hidden", facts("", Visibility::Private))});

    EXPECT_EQ(run(VisibilityFilter{}, input), input);
}

TEST_F(TransformTest, VisibilityFilterUsesPackageOptions) {
    config::PackageOptions internal;
    internal.prefix = "a";
    internal.include_non_public = true;
    jvm_pass.per_package_options.push_back(internal);
    harness.add_pass(jvm_pass);
    auto input = class_module({member("hidden", facts("", Visibility::Internal))});

    EXPECT_EQ(run(VisibilityFilter{}, input), input);
}

TEST_F(TransformTest, ForeignPlatformIsLeftAlone) {
    // No pass registered for jvm: nothing to decide with.
    auto input = class_module({member("hidden", facts("", Visibility::Private))});
    EXPECT_EQ(run(VisibilityFilter{}, input), input);
}

TEST_F(TransformTest, DeprecatedKeptByDefault) {
    auto deprecated = facts();
    deprecated.deprecation = Deprecation{"use g", ""};
    harness.add_pass(jvm_pass);

    auto output = run(DeprecationFilter{}, class_module({member("f", deprecated), member("g")}));
    EXPECT_EQ(output.packages[0].children[0].children.size(), 2u);
}

TEST_F(TransformTest, SkipDeprecated) {
    auto deprecated = facts();
    deprecated.deprecation = Deprecation{"use g", ""};
    jvm_pass.skip_deprecated = true;
    harness.add_pass(jvm_pass);

    auto output = run(DeprecationFilter{}, class_module({member("f", deprecated), member("g")}));
    ASSERT_EQ(output.packages[0].children[0].children.size(), 1u);
    EXPECT_EQ(output.packages[0].children[0].children[0].name, "g");
}

TEST_F(TransformTest, SuppressionByPackageAndFile) {
    config::PackageOptions hidden;
    hidden.prefix = "a.internal";
    hidden.suppress = true;
    jvm_pass.per_package_options.push_back(hidden);
    jvm_pass.suppressed_files = {"src/gen"};
    harness.add_pass(jvm_pass);

    auto generated = facts();
    generated.source = SourceLocation{"src/gen/C.api", 4};
    auto handwritten = facts();
    handwritten.source = SourceLocation{"src/main/D.api", 1};

    auto a = DRI::for_package("a");
    auto module = make_module(
        "core", jvm,
        {make_package("a", jvm,
                      {declaration(DocumentableKind::Class, a.with_class("C"), jvm, generated),
                       declaration(DocumentableKind::Class, a.with_class("D"), jvm,
                                   handwritten)}),
         make_package("a.internal", jvm,
                      {declaration(DocumentableKind::Class,
                                   DRI::for_package("a.internal").with_class("Impl"), jvm)})});

    auto output = run(SuppressionFilter{}, module);

    ASSERT_EQ(output.packages.size(), 1u);
    ASSERT_EQ(output.packages[0].children.size(), 1u);
    EXPECT_EQ(output.packages[0].children[0].name, "D");
}

TEST_F(TransformTest, EmptyPackagesAreRemoved) {
    harness.add_pass(jvm_pass);
    auto module = make_module("core", jvm,
                              {make_package("empty", jvm), make_package("a", jvm, {member("f")})});

    auto output = run(EmptyPackageFilter{}, module);
    ASSERT_EQ(output.packages.size(), 1u);
    EXPECT_EQ(output.packages[0].name, "a");
}

TEST_F(TransformTest, EmptyPackagesCanBeKept) {
    jvm_pass.skip_empty_packages = false;
    harness.add_pass(jvm_pass);
    auto module = make_module("core", jvm, {make_package("empty", jvm)});

    EXPECT_EQ(run(EmptyPackageFilter{}, module).packages.size(), 1u);
}

TEST_F(TransformTest, SourceLinksFillUrl) {
    jvm_pass.source_links = {{"src", "https://example.org/blob/main/src", "#L"}};
    harness.add_pass(jvm_pass);

    auto located = facts();
    located.source = SourceLocation{"src/a/C.api", 7};
    auto output = run(SourceLinksTransformer{}, class_module({}, located));

    EXPECT_EQ(output.packages[0].children[0].facts.find(jvm)->source_url,
              "https://example.org/blob/main/src/a/C.api#L7");
}

TEST_F(TransformTest, UndocumentedReporterWarnsOncePerPlatform) {
    harness.add_pass(jvm_pass);
    auto input = class_module({member("documented", facts("Does things.")), member("bare"),
                               member("secret", facts("", Visibility::Private))},
                              facts("A class."));

    auto output = run(UndocumentedReporter{}, input);

    EXPECT_EQ(output, input);
    ASSERT_EQ(harness.logger.warnings.size(), 1u);
    EXPECT_EQ(harness.logger.warnings[0], "Undocumented: a/C/bare/() (core/jvm)");
}

TEST_F(TransformTest, UndocumentedReporterCanBeSilenced) {
    jvm_pass.report_undocumented = false;
    harness.add_pass(jvm_pass);

    EXPECT_EQ(count_documentables(run(UndocumentedReporter{}, class_module({member("bare")}))), 3u);
    EXPECT_TRUE(harness.logger.warnings.empty());
}

// ============================================================================
// Module Documentation
// ============================================================================

class ModuleDocumentationTest : public TransformTest {
protected:
    void SetUp() override {
        include = fs::temp_directory_path() / "polydoc_module_documentation_test.md";
        std::ofstream out(include);
        out << "# Module core\n"
               "The core module.\n"
               "\n"
               "# Module other\n"
               "Not ours.\n"
               "\n"
               "# Package a\n"
               "Package a holds C.\n"
               "\n"
               "# Package missing\n"
               "Nothing to attach to.\n";
    }

    void TearDown() override {
        fs::remove(include);
    }

    fs::path include;
};

TEST_F(ModuleDocumentationTest, AttachesModuleAndPackageDocs) {
    jvm_pass.includes = {include.string()};
    harness.add_pass(jvm_pass);

    auto output = run(ModuleDocumentationTransformer{}, class_module({}));

    ASSERT_NE(output.facts.find(jvm), nullptr);
    EXPECT_EQ(output.facts.find(jvm)->documentation, "The core module.");
    EXPECT_EQ(output.packages[0].facts.find(jvm)->summary, "Package a holds C.");
}

TEST_F(ModuleDocumentationTest, MissingIncludeFailsStage) {
    jvm_pass.includes = {"/nonexistent/module.md"};
    harness.add_pass(jvm_pass);
    auto context = harness.context();

    auto result = ModuleDocumentationTransformer{}.transform(class_module({}), context);
    ASSERT_TRUE(is_err(result));
    EXPECT_FALSE(unwrap_err(result).is_configuration());
    EXPECT_EQ(unwrap_err(result).message,
              "cannot read include file '/nonexistent/module.md' of core/jvm");
}

// ============================================================================
// Translators
// ============================================================================

class TranslatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        environment = make_rc<FakeEnvironment>();

        auto c = symbol(DocumentableKind::Class, "C");
        c.doc = "A class.";
        c.location = SourceLocation{"src/p.api", 2};
        c.members.push_back(symbol(DocumentableKind::Function, "f", "(x: Int): Int"));
        c.members.push_back(symbol(DocumentableKind::Property, "size", ": Int"));

        environment->groups.push_back(analysis::SymbolGroup{"p", {c, c}});
        environment->groups.push_back(
            analysis::SymbolGroup{"", {symbol(DocumentableKind::Function, "main", "()")}});
    }

    auto translate(const plugin::SymbolTranslator& translator) -> pipeline::PipelineResult<Module> {
        auto data = harness.add_pass(jvm_pass, environment);
        auto context = harness.context();
        return translator.translate(*context.find_platform(data), context);
    }

    ContextHarness harness;
    config::PassConfiguration jvm_pass = pass("core", Platform::Jvm);
    Rc<FakeEnvironment> environment;
};

TEST_F(TranslatorTest, SymbolGroupsBecomePackages) {
    auto result = translate(ListingSymbolTranslator{});
    ASSERT_TRUE(is_ok(result));
    const auto& module = unwrap(result);
    auto jvm = platform("core", Platform::Jvm);

    EXPECT_EQ(module.name, "core");
    EXPECT_EQ(module.platforms(), std::vector<PlatformData>{jvm});
    ASSERT_EQ(module.packages.size(), 1u);

    const auto& package = module.packages[0];
    EXPECT_EQ(package.name, "p");
    ASSERT_EQ(package.children.size(), 1u);

    const auto& c = package.children[0];
    EXPECT_EQ(c.dri.to_string(), "p/C//");
    EXPECT_EQ(c.facts.find(jvm)->signature, "class C");
    EXPECT_EQ(c.facts.find(jvm)->summary, "A class.");
    ASSERT_EQ(c.children.size(), 2u);
    EXPECT_EQ(c.children[0].dri.to_string(), "p/C/f/(Int)");
    EXPECT_EQ(c.children[1].dri.to_string(), "p/C/size/");
    ASSERT_TRUE(c.children[0].parent.has_value());
    EXPECT_EQ(*c.children[0].parent, c.dri);
}

TEST_F(TranslatorTest, DuplicateDeclarationIsReported) {
    auto result = translate(ListingSymbolTranslator{});
    ASSERT_TRUE(is_ok(result));

    ASSERT_EQ(harness.messages.diagnostics.size(), 1u);
    const auto& diagnostic = harness.messages.diagnostics[0];
    EXPECT_EQ(diagnostic.severity, analysis::Severity::Warning);
    EXPECT_EQ(diagnostic.message, "duplicate declaration p/C// ignored");
    ASSERT_TRUE(diagnostic.location.has_value());
    EXPECT_EQ(diagnostic.location->line, 2u);
}

TEST_F(TranslatorTest, DuplicateMemberIsReported) {
    auto d = symbol(DocumentableKind::Class, "D");
    auto g = symbol(DocumentableKind::Function, "g", "(s: String)");
    g.location = SourceLocation{"src/q.api", 4};
    d.members.push_back(g);
    g.location = SourceLocation{"src/q.api", 5};
    d.members.push_back(g);
    environment->groups = {analysis::SymbolGroup{"q", {d}}};

    auto result = translate(ListingSymbolTranslator{});
    ASSERT_TRUE(is_ok(result));
    ASSERT_EQ(unwrap(result).packages[0].children[0].children.size(), 1u);

    ASSERT_EQ(harness.messages.diagnostics.size(), 1u);
    const auto& diagnostic = harness.messages.diagnostics[0];
    EXPECT_EQ(diagnostic.severity, analysis::Severity::Warning);
    EXPECT_EQ(diagnostic.message, "duplicate declaration q/D/g/(String) ignored");
    ASSERT_TRUE(diagnostic.location.has_value());
    EXPECT_EQ(diagnostic.location->line, 5u);
}

TEST_F(TranslatorTest, RootPackageOnRequest) {
    jvm_pass.include_root_package = true;
    auto result = translate(ListingSymbolTranslator{});
    ASSERT_TRUE(is_ok(result));

    ASSERT_EQ(unwrap(result).packages.size(), 2u);
    EXPECT_EQ(unwrap(result).packages[1].dri.to_string(), "///");
    EXPECT_EQ(unwrap(result).packages[1].children[0].name, "main");
}

TEST_F(TranslatorTest, MissingEnvironmentFails) {
    environment = nullptr;
    auto result = translate(ListingSymbolTranslator{});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "no analysis environment for core/jvm");
}

TEST_F(TranslatorTest, FileTranslatorReadsSourceFiles) {
    environment->groups.clear();
    environment->files.push_back(
        analysis::SourceFile{"src/q.japi", "q", {symbol(DocumentableKind::Object, "Registry")}});

    auto data = harness.add_pass(jvm_pass, environment);
    auto context = harness.context();
    auto result = ListingFileTranslator{}.translate(*context.find_platform(data), context);

    ASSERT_TRUE(is_ok(result));
    ASSERT_EQ(unwrap(result).packages.size(), 1u);
    EXPECT_EQ(unwrap(result).packages[0].children[0].dri.to_string(), "q/Registry//");
}
