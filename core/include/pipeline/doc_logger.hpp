//! # Documentation Logger
//!
//! The pipeline-facing logger. The driver calls `progress()` once per stage,
//! extensions report through `info`/`warn`/`error`, and `report()` closes the
//! run with the aggregate warning and error counts.
//!
//! `DefaultDocLogger` forwards everything to the structured logger
//! (`log/log.hpp`) under the `docgen` module tag.

#ifndef POLYDOC_PIPELINE_DOC_LOGGER_HPP
#define POLYDOC_PIPELINE_DOC_LOGGER_HPP

#include <atomic>
#include <string>

namespace polydoc::pipeline {

/// Abstract pipeline logger. Implementations must be safe to call from the
/// parallel translation stage.
class DocLogger {
public:
    virtual ~DocLogger() = default;

    /// Announces the start of a pipeline stage.
    virtual void progress(const std::string& stage) = 0;
    virtual void debug(const std::string& message) = 0;
    virtual void info(const std::string& message) = 0;

    /// Logs a warning and increments the warning count.
    virtual void warn(const std::string& message) = 0;

    /// Logs an error and increments the error count.
    virtual void error(const std::string& message) = 0;

    /// Surfaces the aggregate diagnostics of the run.
    virtual void report() = 0;

    [[nodiscard]] auto warnings_count() const -> size_t {
        return warnings_.load();
    }
    [[nodiscard]] auto errors_count() const -> size_t {
        return errors_.load();
    }

protected:
    std::atomic<size_t> warnings_{0};
    std::atomic<size_t> errors_{0};
};

/// Forwards to `log::Logger` with module `docgen`.
class DefaultDocLogger : public DocLogger {
public:
    void progress(const std::string& stage) override;
    void debug(const std::string& message) override;
    void info(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;
    void report() override;
};

} // namespace polydoc::pipeline

#endif // POLYDOC_PIPELINE_DOC_LOGGER_HPP
