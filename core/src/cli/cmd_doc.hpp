//! # Documentation Command
//!
//! Command-line front end of the documentation pipeline.
//!
//! ## Usage
//!
//! ```bash
//! polydoc --config=polydoc.toml [options]
//! polydoc --module=core --source=src/jvm --platform=jvm [options]
//! ```
//!
//! ## Options
//!
//! - `--config=<file>`: Configuration file (TOML subset)
//! - `--output=<dir>`: Output directory. Default: docs
//! - `--format=<fmt>`: Output format. Default: markdown
//! - `--module=<name>`, `--source=<dir>`, `--classpath=<path>`, `--platform=<name>`:
//!   Describe a single pass when no configuration file defines passes
//! - `--skip`, `--fail-on-error`, `--generate-index-pages`, `--include-non-public`
//!
//! ## Exit Codes
//!
//! | Code | Meaning                                           |
//! |------|---------------------------------------------------|
//! | 0    | Success (or skipped)                              |
//! | 1    | Configuration problem or failed pipeline stage    |
//! | 2    | Analysis reported errors and `--fail-on-error`    |

#ifndef POLYDOC_CLI_CMD_DOC_HPP
#define POLYDOC_CLI_CMD_DOC_HPP

#include "config/configuration.hpp"

#include <optional>
#include <string>
#include <vector>

namespace polydoc::cli {

inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_FAILURE_FATAL = 1;
inline constexpr int EXIT_ANALYSIS_ERRORS = 2;

/// Options for the doc command.
struct DocOptions {
    std::string config_file;                ///< Empty when no configuration file is given.
    std::optional<std::string> output_dir;  ///< Overrides the configured output directory.
    std::optional<std::string> format;      ///< Overrides the configured format.
    bool skip = false;
    bool fail_on_error = false;
    bool generate_index_pages = false;
    bool include_non_public = false;
    std::string module_name;                ///< Single-pass module name.
    std::vector<std::string> sources;       ///< Single-pass source roots.
    std::vector<std::string> classpath;     ///< Single-pass classpath.
    std::string platform;                   ///< Single-pass platform name.
    bool show_help = false;
    std::vector<std::string> errors;        ///< Malformed arguments.
};

/// Parses command-line arguments. Logging options are left to
/// `log::parse_log_options()` and skipped here.
DocOptions parse_doc_args(int argc, char* argv[]);

/// Builds the run configuration: the configuration file (if any) with the
/// command-line overrides applied.
[[nodiscard]] auto build_configuration(const DocOptions& options)
    -> Result<config::DocConfiguration, config::ConfigError>;

/// Runs the doc command with the given options.
///
/// @returns One of the exit codes above.
int run_doc(const DocOptions& options);

/// Prints help for the doc command.
void print_doc_help();

} // namespace polydoc::cli

#endif // POLYDOC_CLI_CMD_DOC_HPP
