//! # Configuration Tests
//!
//! Tests for the configuration loader (TOML subset), package option lookup
//! and structural validation.

#include "config/config_loader.hpp"
#include "config/configuration.hpp"
#include "log/log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace polydoc;
using namespace polydoc::config;
namespace fs = std::filesystem;

// ============================================================================
// Loader
// ============================================================================

class ConfigLoaderTest : public ::testing::Test {
protected:
    auto parse_ok(const std::string& text) -> DocConfiguration {
        auto parsed = parse_configuration(text);
        if (is_err(parsed)) {
            ADD_FAILURE() << unwrap_err(parsed).to_string();
            return {};
        }
        return unwrap(parsed);
    }

    auto parse_error(const std::string& text) -> ConfigError {
        auto parsed = parse_configuration(text);
        if (!is_err(parsed)) {
            ADD_FAILURE() << "expected a configuration error";
            return {};
        }
        return unwrap_err(parsed);
    }
};

TEST_F(ConfigLoaderTest, FullDocument) {
    auto config = parse_ok(R"(
# Documentation for the core module
[docgen]
output_dir = "build/docs"
format = "md"
generate_index_pages = true
disabled_plugins = ["search"]

[[pass]]
module = "core"
platform = "jvm"
source_roots = [
    "src/jvm",   # main sources
    "src/common",
]
jdk_version = 11
include_non_public = true

[[pass.package]]
prefix = "core.internal"
suppress = true

[[pass.source_link]]
path = "src/jvm"
url = "https://example.org/blob/main/src/jvm"
line_suffix = "#L"

[[pass.external_link]]
url = "https://docs.example.org/api/"

[[pass]]
module = "core"
platform = "js"
targets = "browser"
)");

    EXPECT_EQ(config.output_dir, "build/docs");
    EXPECT_EQ(config.format, "md");
    EXPECT_TRUE(config.generate_index_pages);
    EXPECT_TRUE(config.is_plugin_disabled("search"));
    EXPECT_FALSE(config.is_plugin_disabled("base"));

    ASSERT_EQ(config.passes.size(), 2u);
    const auto& jvm = config.passes[0];
    EXPECT_EQ(jvm.module_name, "core");
    EXPECT_EQ(jvm.analysis_platform, model::Platform::Jvm);
    ASSERT_EQ(jvm.source_roots.size(), 2u);
    EXPECT_EQ(jvm.source_roots[1], "src/common");
    EXPECT_EQ(jvm.jdk_version, 11);
    EXPECT_TRUE(jvm.include_non_public);
    ASSERT_EQ(jvm.per_package_options.size(), 1u);
    EXPECT_TRUE(jvm.per_package_options[0].suppress);
    ASSERT_EQ(jvm.source_links.size(), 1u);
    EXPECT_EQ(jvm.source_links[0].line_suffix, "#L");
    ASSERT_EQ(jvm.external_documentation_links.size(), 1u);
    EXPECT_EQ(jvm.external_documentation_links[0].resolved_package_list(),
              "https://docs.example.org/api/package-list");

    const auto& js = config.passes[1];
    EXPECT_EQ(js.analysis_platform, model::Platform::Js);
    ASSERT_EQ(js.targets.size(), 1u);
    EXPECT_EQ(js.targets[0], "browser");
    EXPECT_TRUE(js.source_links.empty());
}

TEST_F(ConfigLoaderTest, DefaultsWithoutTables) {
    auto config = parse_ok("# nothing configured\n");

    EXPECT_EQ(config.output_dir, "docs");
    EXPECT_EQ(config.format, "markdown");
    EXPECT_FALSE(config.skip);
    EXPECT_TRUE(config.passes.empty());
}

TEST_F(ConfigLoaderTest, StringEscapes) {
    auto config = parse_ok("[docgen]\noutput_dir = \"a\\\\b \\\"quoted\\\"\"\n");
    EXPECT_EQ(config.output_dir, "a\\b \"quoted\"");
}

TEST_F(ConfigLoaderTest, UnknownKeyIsIgnoredWithWarning) {
    auto& logger = log::Logger::instance();
    logger.clear_sinks();
    auto sink = std::make_unique<log::CaptureSink>();
    auto* capture = sink.get();
    logger.add_sink(std::move(sink));
    logger.set_level(log::LogLevel::Warn);

    auto config = parse_ok("[docgen]\ncolour = \"blue\"\nformat = \"markdown\"\n");

    EXPECT_EQ(config.format, "markdown");
    EXPECT_TRUE(capture->contains("config", "ignoring unknown key 'colour'"));
    log::Logger::init(log::LogConfig{});
}

TEST_F(ConfigLoaderTest, UnknownTable) {
    auto err = parse_error("[output]\n");
    EXPECT_EQ(err.message, "unknown table 'output'");
    EXPECT_EQ(err.line, 1);
}

TEST_F(ConfigLoaderTest, SubTableBeforePass) {
    auto err = parse_error("[[pass.package]]\nprefix = \"a\"\n");
    EXPECT_EQ(err.message, "[[pass.package]] must follow a [[pass]] table");
}

TEST_F(ConfigLoaderTest, KeyOutsideTable) {
    auto err = parse_error("format = \"markdown\"\n");
    EXPECT_EQ(err.message, "key 'format' outside of any table");
    EXPECT_EQ(err.line, 1);
}

TEST_F(ConfigLoaderTest, TypeErrorCarriesEntryLine) {
    auto err = parse_error("[docgen]\n\nskip = \"yes\"\n");
    EXPECT_EQ(err.message, "'skip' must be true or false");
    EXPECT_EQ(err.line, 3);
    EXPECT_EQ(err.to_string(), "line 3: 'skip' must be true or false");
}

TEST_F(ConfigLoaderTest, BadPlatform) {
    auto err = parse_error("[[pass]]\nmodule = \"core\"\nplatform = \"wasm\"\n");
    EXPECT_EQ(err.message, "unrecognized platform: 'wasm'");
    EXPECT_EQ(err.line, 3);
}

TEST_F(ConfigLoaderTest, MalformedValues) {
    EXPECT_EQ(parse_error("[docgen]\nformat = \"open\n").message, "unterminated string");
    EXPECT_EQ(parse_error("[docgen]\nimplied_platforms = [1]\n").message,
              "arrays may only contain strings");
    EXPECT_EQ(parse_error("[docgen]\nskip = maybe\n").message, "invalid value 'maybe'");
    EXPECT_EQ(parse_error("[docgen]\nskip = true false\n").message, "unexpected character 'f'");
}

TEST_F(ConfigLoaderTest, LoadMissingFile) {
    auto loaded = load_configuration("/nonexistent/polydoc.toml");
    ASSERT_TRUE(is_err(loaded));
    EXPECT_NE(unwrap_err(loaded).message.find("cannot open configuration file"),
              std::string::npos);
}

TEST_F(ConfigLoaderTest, LoadFilePrefixesErrorsWithPath) {
    auto path = fs::temp_directory_path() / "polydoc_config_test.toml";
    {
        std::ofstream out(path);
        out << "[docgen]\nskip = 1\n";
    }

    auto loaded = load_configuration(path);
    fs::remove(path);

    ASSERT_TRUE(is_err(loaded));
    EXPECT_EQ(unwrap_err(loaded).message, path.string() + ": 'skip' must be true or false");
}

// ============================================================================
// Package Options
// ============================================================================

class PackageOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        pass.report_undocumented = false;
        pass.skip_deprecated = true;

        PackageOptions internal;
        internal.prefix = "com.foo";
        internal.include_non_public = true;
        pass.per_package_options.push_back(internal);

        PackageOptions deeper;
        deeper.prefix = "com.foo.impl";
        deeper.suppress = true;
        pass.per_package_options.push_back(deeper);
    }

    PassConfiguration pass;
};

TEST_F(PackageOptionsTest, LongestPrefixWins) {
    EXPECT_TRUE(pass.options_for_package("com.foo.impl.io").suppress);
    EXPECT_FALSE(pass.options_for_package("com.foo.api").suppress);
    EXPECT_TRUE(pass.options_for_package("com.foo.api").include_non_public);
}

TEST_F(PackageOptionsTest, PrefixMatchesWholeSegments) {
    auto options = pass.options_for_package("com.foobar");
    EXPECT_EQ(options.prefix, "");
    EXPECT_FALSE(options.include_non_public);
}

TEST_F(PackageOptionsTest, FallsBackToPassValues) {
    auto options = pass.options_for_package("org.other");
    EXPECT_FALSE(options.report_undocumented);
    EXPECT_TRUE(options.skip_deprecated);
    EXPECT_FALSE(options.suppress);
}

// ============================================================================
// Validation
// ============================================================================

class ValidateTest : public ::testing::Test {
protected:
    void SetUp() override {
        PassConfiguration jvm;
        jvm.module_name = "core";
        config.passes.push_back(jvm);
    }

    DocConfiguration config;
};

TEST_F(ValidateTest, AcceptsMinimalConfiguration) {
    EXPECT_TRUE(is_ok(validate(config)));
    EXPECT_TRUE(is_ok(validate(DocConfiguration{})));
}

TEST_F(ValidateTest, RequiresModuleName) {
    config.passes[0].module_name.clear();
    auto result = validate(config);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "pass 1: module name is required");
}

TEST_F(ValidateTest, RejectsDuplicatePlatform) {
    config.passes.push_back(config.passes[0]);
    auto result = validate(config);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "pass 2: duplicate platform 'core/jvm'");
}

TEST_F(ValidateTest, TargetOrderDoesNotMakePlatformsDistinct) {
    config.passes[0].targets = {"linuxX64", "macosArm64"};
    auto reordered = config.passes[0];
    reordered.targets = {"macosArm64", "linuxX64", "macosArm64"};
    config.passes.push_back(reordered);

    EXPECT_EQ(config.passes[0].platform_data(), config.passes[1].platform_data());
    EXPECT_EQ(config.passes[1].platform_data().targets,
              (std::vector<std::string>{"linuxX64", "macosArm64"}));

    auto result = validate(config);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message.rfind("pass 2: duplicate platform", 0), 0u);
}

TEST_F(ValidateTest, SameModuleOnTwoPlatformsIsFine) {
    auto js = config.passes[0];
    js.analysis_platform = model::Platform::Js;
    config.passes.push_back(js);
    EXPECT_TRUE(is_ok(validate(config)));
}

TEST_F(ValidateTest, RejectsBackslashSourceLink) {
    config.passes[0].source_links.push_back(
        SourceLinkDefinition{"src\\jvm", "https://example.org", ""});
    auto result = validate(config);
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("must use '/' as separator"), std::string::npos);
}

TEST_F(ValidateTest, RejectsEmptyFormat) {
    config.format.clear();
    EXPECT_TRUE(is_err(validate(config)));
}
