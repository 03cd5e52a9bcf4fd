//! # Command-Line Tests
//!
//! Tests for argument parsing, configuration building and complete runs of
//! the doc command against listings in a temporary directory.

#include "cli/cmd_doc.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace polydoc;
using namespace polydoc::cli;
using polydoc::test_support::Argv;
namespace fs = std::filesystem;

// ============================================================================
// Argument Parsing
// ============================================================================

TEST(ParseDocArgsTest, AllFlags) {
    Argv args{"polydoc",
              "--config=polydoc.toml",
              "--output=out",
              "--format=md",
              "--skip",
              "--fail-on-error",
              "--generate-index-pages",
              "--include-non-public",
              "--module=core",
              "--source=src/jvm",
              "--classpath=lib/a.jar",
              "--platform=js",
              "src/common"};
    auto options = parse_doc_args(args.argc(), args.argv());

    EXPECT_TRUE(options.errors.empty());
    EXPECT_EQ(options.config_file, "polydoc.toml");
    EXPECT_EQ(options.output_dir.value_or(""), "out");
    EXPECT_EQ(options.format.value_or(""), "md");
    EXPECT_TRUE(options.skip);
    EXPECT_TRUE(options.fail_on_error);
    EXPECT_TRUE(options.generate_index_pages);
    EXPECT_TRUE(options.include_non_public);
    EXPECT_EQ(options.module_name, "core");
    EXPECT_EQ(options.sources, (std::vector<std::string>{"src/jvm", "src/common"}));
    EXPECT_EQ(options.classpath, std::vector<std::string>{"lib/a.jar"});
    EXPECT_EQ(options.platform, "js");
    EXPECT_FALSE(options.show_help);
}

TEST(ParseDocArgsTest, DefaultsLeaveOverridesUnset) {
    Argv args{"polydoc"};
    auto options = parse_doc_args(args.argc(), args.argv());

    EXPECT_TRUE(options.config_file.empty());
    EXPECT_FALSE(options.output_dir.has_value());
    EXPECT_FALSE(options.format.has_value());
    EXPECT_TRUE(options.sources.empty());
}

TEST(ParseDocArgsTest, ShortOutputAliasAndHelp) {
    Argv args{"polydoc", "-o=site", "-h"};
    auto options = parse_doc_args(args.argc(), args.argv());

    EXPECT_EQ(options.output_dir.value_or(""), "site");
    EXPECT_TRUE(options.show_help);
}

TEST(ParseDocArgsTest, LogOptionsAreSkipped) {
    Argv args{"polydoc", "--log-level=debug", "--log-filter=merge=trace", "-vv", "-q",
              "--log-format=json"};
    auto options = parse_doc_args(args.argc(), args.argv());

    EXPECT_TRUE(options.errors.empty());
    EXPECT_TRUE(options.sources.empty());
}

TEST(ParseDocArgsTest, UnknownOptionIsAnError) {
    Argv args{"polydoc", "--bogus", "--module=core"};
    auto options = parse_doc_args(args.argc(), args.argv());

    EXPECT_EQ(options.errors, std::vector<std::string>{"unknown option '--bogus'"});
    EXPECT_EQ(options.module_name, "core");
}

// ============================================================================
// Configuration Building
// ============================================================================

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / "polydoc_cli_test";
        fs::remove_all(dir);
        fs::create_directories(dir / "src");
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    void write(const fs::path& path, const std::string& text) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        out << text;
    }

    static auto read(const fs::path& path) -> std::string {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    /// Options for a single jvm pass over `dir/src`, writing to `dir/out`.
    auto single_pass() -> DocOptions {
        DocOptions options;
        options.module_name = "core";
        options.sources = {(dir / "src").string()};
        options.output_dir = (dir / "out").string();
        return options;
    }

    fs::path dir;
};

TEST_F(CliTest, NoOptionsGiveDefaults) {
    auto built = build_configuration(DocOptions{});
    ASSERT_TRUE(is_ok(built));

    const auto& configuration = unwrap(built);
    EXPECT_EQ(configuration.output_dir, "docs");
    EXPECT_EQ(configuration.format, "markdown");
    EXPECT_TRUE(configuration.passes.empty());
}

TEST_F(CliTest, SinglePassFromFlags) {
    auto options = single_pass();
    options.platform = "js";
    options.classpath = {"lib/a.jar"};
    options.include_non_public = true;

    auto built = build_configuration(options);
    ASSERT_TRUE(is_ok(built)) << unwrap_err(built).to_string();

    const auto& configuration = unwrap(built);
    ASSERT_EQ(configuration.passes.size(), 1u);
    const auto& pass = configuration.passes[0];
    EXPECT_EQ(pass.module_name, "core");
    EXPECT_EQ(pass.analysis_platform, model::Platform::Js);
    EXPECT_EQ(pass.source_roots, options.sources);
    EXPECT_EQ(pass.classpath, std::vector<std::string>{"lib/a.jar"});
    EXPECT_TRUE(pass.include_non_public);
    EXPECT_EQ(configuration.output_dir, (dir / "out").string());
}

TEST_F(CliTest, PlatformDefaultsToJvm) {
    auto built = build_configuration(single_pass());
    ASSERT_TRUE(is_ok(built));
    EXPECT_EQ(unwrap(built).passes[0].analysis_platform, model::Platform::Jvm);
}

TEST_F(CliTest, UnknownPlatformIsRejected) {
    auto options = single_pass();
    options.platform = "wasm";

    auto built = build_configuration(options);
    ASSERT_TRUE(is_err(built));
    EXPECT_EQ(unwrap_err(built).message, "unrecognized platform: 'wasm'");
}

TEST_F(CliTest, FlagsOverrideConfigurationFile) {
    write(dir / "polydoc.toml", "[docgen]\n"
                                "output_dir = \"from-file\"\n"
                                "format = \"md\"\n"
                                "\n"
                                "[[pass]]\n"
                                "module = \"core\"\n"
                                "platform = \"jvm\"\n"
                                "\n"
                                "[[pass]]\n"
                                "module = \"core\"\n"
                                "platform = \"js\"\n");
    DocOptions options;
    options.config_file = (dir / "polydoc.toml").string();
    options.output_dir = "from-flag";
    options.generate_index_pages = true;
    options.include_non_public = true;

    auto built = build_configuration(options);
    ASSERT_TRUE(is_ok(built)) << unwrap_err(built).to_string();

    const auto& configuration = unwrap(built);
    EXPECT_EQ(configuration.output_dir, "from-flag");
    EXPECT_EQ(configuration.format, "md");
    EXPECT_TRUE(configuration.generate_index_pages);
    ASSERT_EQ(configuration.passes.size(), 2u);
    EXPECT_TRUE(configuration.passes[0].include_non_public);
    EXPECT_TRUE(configuration.passes[1].include_non_public);
}

TEST_F(CliTest, PassFlagsConflictWithFilePasses) {
    write(dir / "polydoc.toml", "[[pass]]\nmodule = \"core\"\n");
    DocOptions options;
    options.config_file = (dir / "polydoc.toml").string();
    options.module_name = "other";

    auto built = build_configuration(options);
    ASSERT_TRUE(is_err(built));
    EXPECT_NE(unwrap_err(built).message.find("cannot be combined"), std::string::npos);
}

TEST_F(CliTest, MissingConfigurationFile) {
    DocOptions options;
    options.config_file = (dir / "absent.toml").string();
    EXPECT_TRUE(is_err(build_configuration(options)));
}

// ============================================================================
// Runs
// ============================================================================

TEST_F(CliTest, MalformedArgumentsFail) {
    DocOptions options;
    options.errors = {"unknown option '--bogus'"};
    EXPECT_EQ(run_doc(options), EXIT_FAILURE_FATAL);
}

TEST_F(CliTest, InvalidConfigurationFails) {
    auto options = single_pass();
    options.module_name.clear();
    EXPECT_EQ(run_doc(options), EXIT_FAILURE_FATAL);
}

TEST_F(CliTest, SkipProducesNothing) {
    auto options = single_pass();
    options.skip = true;

    EXPECT_EQ(run_doc(options), EXIT_OK);
    EXPECT_FALSE(fs::exists(dir / "out"));
}

TEST_F(CliTest, DocumentsListings) {
    write(dir / "src" / "greeter.api", "package com.example\n"
                                       "\n"
                                       "/// A greeter.\n"
                                       "class Greeter(name: String)\n"
                                       "    /// Greets a few times.\n"
                                       "    fun greet(times: Int): String\n");

    EXPECT_EQ(run_doc(single_pass()), EXIT_OK);

    auto out = dir / "out" / "core";
    EXPECT_TRUE(fs::exists(out / "index.md"));
    EXPECT_TRUE(fs::exists(out / "navigation.md"));
    EXPECT_TRUE(fs::exists(out / "search-index.json"));

    auto greeter = read(out / "com.example" / "Greeter.md");
    EXPECT_NE(greeter.find("A greeter."), std::string::npos);
    EXPECT_NE(greeter.find("greet"), std::string::npos);
}

TEST_F(CliTest, MissingSourceRootFailsTheRun) {
    auto options = single_pass();
    options.sources = {(dir / "nowhere").string()};
    EXPECT_EQ(run_doc(options), EXIT_FAILURE_FATAL);
}

TEST_F(CliTest, AnalysisErrorsWithFailOnError) {
    write(dir / "src" / "broken.api", "package com.example\n"
                                      "widget Foo\n"
                                      "class Bar\n");

    auto options = single_pass();
    EXPECT_EQ(run_doc(options), EXIT_OK);

    options.fail_on_error = true;
    EXPECT_EQ(run_doc(options), EXIT_ANALYSIS_ERRORS);
}
