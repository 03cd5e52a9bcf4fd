//! # Documentation Command Implementation

#include "cmd_doc.hpp"

#include "analysis/listing_analyzer.hpp"
#include "config/config_loader.hpp"
#include "log/log.hpp"
#include "pipeline/doc_logger.hpp"
#include "pipeline/generator.hpp"

#include <iostream>

namespace polydoc::cli {

namespace {

auto value_of(const std::string& arg) -> std::string {
    return arg.substr(arg.find('=') + 1);
}

} // namespace

DocOptions parse_doc_args(int argc, char* argv[]) {
    DocOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg.starts_with("--config=")) {
            options.config_file = value_of(arg);
        } else if (arg.starts_with("--output=") || arg.starts_with("-o=")) {
            options.output_dir = value_of(arg);
        } else if (arg.starts_with("--format=")) {
            options.format = value_of(arg);
        } else if (arg == "--skip") {
            options.skip = true;
        } else if (arg == "--fail-on-error") {
            options.fail_on_error = true;
        } else if (arg == "--generate-index-pages") {
            options.generate_index_pages = true;
        } else if (arg == "--include-non-public") {
            options.include_non_public = true;
        } else if (arg.starts_with("--module=")) {
            options.module_name = value_of(arg);
        } else if (arg.starts_with("--source=")) {
            options.sources.push_back(value_of(arg));
        } else if (arg.starts_with("--classpath=")) {
            options.classpath.push_back(value_of(arg));
        } else if (arg.starts_with("--platform=")) {
            options.platform = value_of(arg);
        } else if (!arg.empty() && arg[0] != '-') {
            // Positional arguments are source roots
            options.sources.push_back(arg);
        } else {
            options.errors.push_back("unknown option '" + arg + "'");
        }
    }

    return options;
}

auto build_configuration(const DocOptions& options)
    -> Result<config::DocConfiguration, config::ConfigError> {
    config::DocConfiguration configuration;
    if (!options.config_file.empty()) {
        auto loaded = config::load_configuration(options.config_file);
        if (is_err(loaded)) {
            return unwrap_err(loaded);
        }
        configuration = std::move(unwrap(loaded));
    }

    if (options.output_dir) {
        configuration.output_dir = *options.output_dir;
    }
    if (options.format) {
        configuration.format = *options.format;
    }
    configuration.skip = configuration.skip || options.skip;
    configuration.fail_on_error = configuration.fail_on_error || options.fail_on_error;
    configuration.generate_index_pages =
        configuration.generate_index_pages || options.generate_index_pages;

    bool describes_pass = !options.module_name.empty() || !options.sources.empty() ||
                          !options.classpath.empty() || !options.platform.empty();
    if (describes_pass) {
        if (!configuration.passes.empty()) {
            return config::ConfigError{
                "--module/--source/--classpath/--platform cannot be combined with passes "
                "from a configuration file"};
        }
        auto platform = model::platform_from_string(options.platform);
        if (is_err(platform)) {
            return config::ConfigError{unwrap_err(platform)};
        }

        config::PassConfiguration pass;
        pass.module_name = options.module_name;
        pass.source_roots = options.sources;
        pass.classpath = options.classpath;
        pass.analysis_platform = unwrap(platform);
        pass.include_non_public = options.include_non_public;
        configuration.passes.push_back(std::move(pass));
    } else if (options.include_non_public) {
        for (auto& pass : configuration.passes) {
            pass.include_non_public = true;
        }
    }

    return configuration;
}

int run_doc(const DocOptions& options) {
    for (const auto& error : options.errors) {
        POLYDOC_LOG_ERROR("cli", error);
    }
    if (!options.errors.empty()) {
        return EXIT_FAILURE_FATAL;
    }

    auto built = build_configuration(options);
    if (is_err(built)) {
        POLYDOC_LOG_ERROR("cli", "configuration error: " << unwrap_err(built).to_string());
        return EXIT_FAILURE_FATAL;
    }
    auto& configuration = unwrap(built);

    auto valid = config::validate(configuration);
    if (is_err(valid)) {
        POLYDOC_LOG_ERROR("cli", "configuration error: " << unwrap_err(valid).to_string());
        return EXIT_FAILURE_FATAL;
    }

    if (configuration.skip) {
        POLYDOC_LOG_INFO("cli", "skip parameter is true so no output will be produced");
        return EXIT_OK;
    }

    pipeline::DefaultDocLogger logger;
    pipeline::DocGenerator generator(configuration, logger, analysis::listing_analysis_factory());
    auto result = generator.generate();
    if (is_err(result)) {
        // The generator already logged the failure
        return EXIT_FAILURE_FATAL;
    }

    const auto& report = unwrap(result);
    POLYDOC_LOG_INFO("cli", "Documented " << report.documentables << " declaration(s) on "
                                          << report.platforms << " platform(s), "
                                          << report.pages << " page(s) written to "
                                          << configuration.output_dir);

    if (report.analysis_errors && configuration.fail_on_error) {
        POLYDOC_LOG_ERROR("cli", "analysis reported errors and fail-on-error is set");
        return EXIT_ANALYSIS_ERRORS;
    }
    return EXIT_OK;
}

void print_doc_help() {
    std::cerr << R"(
polydoc - multi-platform documentation generator

Usage: polydoc --config=<file> [options]
       polydoc --module=<name> --source=<dir>... [--platform=<name>] [options]

Options:
  --config=<file>         Configuration file
  --output=<dir>          Output directory (default: docs)
  -o=<dir>                Alias for --output
  --format=<fmt>          Output format (default: markdown)
  --module=<name>         Module name of a single pass
  --source=<dir>          Source root of a single pass (repeatable)
  --classpath=<path>      Classpath entry of a single pass (repeatable)
  --platform=<name>       Platform of a single pass: jvm, js, native, common
  --include-non-public    Document internal and private declarations
  --generate-index-pages  Add "all types" and alphabetical index pages
  --fail-on-error         Exit with code 2 when analysis reports errors
  --skip                  Do nothing
  --help, -h              Show this help

Logging:
  --log-level=<level>     trace, debug, info, warn, error, fatal, off
  --log-filter=<spec>     Per-module levels, e.g. "merge=debug,*=warn"
  --log-file=<path>       Also write log records to a file
  --log-format=<fmt>      text or json
  -v, -vv, -vvv           More output
  -q, --quiet             Warnings and errors only

Exit codes:
  0  success
  1  configuration error or failed stage
  2  analysis errors with --fail-on-error

)";
}

} // namespace polydoc::cli
