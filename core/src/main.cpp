//! # polydoc Entry Point
//!
//! Sets up logging from the command line and hands the remaining arguments
//! to the doc command.
//!
//! ```bash
//! polydoc --config=polydoc.toml --log-level=debug
//! ```

#include "cli/cmd_doc.hpp"
#include "log/log.hpp"

int main(int argc, char* argv[]) {
    polydoc::log::Logger::init(polydoc::log::parse_log_options(argc, argv));

    auto options = polydoc::cli::parse_doc_args(argc, argv);
    if (options.show_help) {
        polydoc::cli::print_doc_help();
        return polydoc::cli::EXIT_OK;
    }

    int code = polydoc::cli::run_doc(options);
    polydoc::log::Logger::instance().flush();
    return code;
}
