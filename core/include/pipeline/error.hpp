//! # Pipeline Error Types
//!
//! Fatal errors that abort a documentation run.
//!
//! | Kind            | When                                                     |
//! |-----------------|----------------------------------------------------------|
//! | `Configuration` | Bad extension cardinality, no platforms, ordering cycles |
//! | `StageFailure`  | A translator, merger, transform or renderer failed       |
//!
//! Diagnostics emitted by the analysis front end are not errors; they go
//! through `analysis::MessageCollector` and only surface in the final report.

#ifndef POLYDOC_PIPELINE_ERROR_HPP
#define POLYDOC_PIPELINE_ERROR_HPP

#include "common.hpp"

#include <string>
#include <string_view>

namespace polydoc::pipeline {

enum class ErrorKind {
    Configuration, ///< Detected before any translation runs.
    StageFailure,  ///< Raised while a stage was executing.
};

struct PipelineError {
    ErrorKind kind = ErrorKind::StageFailure;
    std::string stage;   ///< Stage that was running (empty for configuration errors).
    std::string message; ///< Human-readable description.

    static auto configuration(std::string msg) -> PipelineError {
        return PipelineError{ErrorKind::Configuration, "", std::move(msg)};
    }

    static auto stage_failure(std::string stage_name, std::string msg) -> PipelineError {
        return PipelineError{ErrorKind::StageFailure, std::move(stage_name), std::move(msg)};
    }

    [[nodiscard]] auto is_configuration() const -> bool {
        return kind == ErrorKind::Configuration;
    }

    /// Formats as "configuration error: ..." or "stage '...' failed: ...".
    [[nodiscard]] auto to_string() const -> std::string {
        if (kind == ErrorKind::Configuration) {
            return "configuration error: " + message;
        }
        return "stage '" + stage + "' failed: " + message;
    }
};

/// Result alias used by every extension interface.
template <typename T> using PipelineResult = Result<T, PipelineError>;

} // namespace polydoc::pipeline

#endif // POLYDOC_PIPELINE_ERROR_HPP
