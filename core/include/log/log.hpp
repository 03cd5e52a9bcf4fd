//! # polydoc Logging
//!
//! Structured, module-tagged logging used by every pipeline stage:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module tags (`docgen`, `analysis`, `merge`, `render`, ...) for per-component filtering
//! - Pluggable sinks (Console, File, Capture, Null, Multi)
//! - Thread-safe dispatch; per-platform translation logs from worker threads
//! - Compile-time level elision via POLYDOC_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! POLYDOC_LOG_INFO("docgen", "Rendering " << pages << " pages to " << output_dir);
//! POLYDOC_LOG_DEBUG("merge", "Merging " << key.to_string() << " from " << n << " platforms");
//! ```

#ifndef POLYDOC_LOG_HPP
#define POLYDOC_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace polydoc::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< Stage progress and general messages
    Warn = 3,  ///< Potential documentation problems
    Error = 4, ///< Errors reported by a stage or the analysis front end
    Fatal = 5, ///< Run-aborting failures
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name of a level ("TRACE", "DEBUG", ...).
inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a level name. Unrecognized names map to LogLevel::Info.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN" || s == "warning")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;       ///< Severity level
    std::string module;   ///< Module tag (e.g., "docgen", "merge")
    std::string message;  ///< Formatted message text
    const char* file;     ///< Source file (__FILE__)
    int line;             ///< Source line (__LINE__)
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

/// Returns current local time formatted as "HH:MM:SS.mmm".
std::string get_timestamp();

/// Returns milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// Renders a record as a single line (without trailing newline).
std::string format_record(const LogRecord& record, LogFormat format);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, coloured when stderr is a capable terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends to a file. Flushes on Error and Fatal.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Keeps every record in memory.
class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override {}

    /// Copies the records captured so far.
    std::vector<LogRecord> records() const;

    /// Returns true if any captured message from `module` contains `needle`.
    bool contains(std::string_view module, std::string_view needle) const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

/// Discards all messages.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Fans out records to several child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter parsed from "merge=trace,render=debug,*=warn".
class LogFilter {
public:
    /// Parses a filter spec. A bare module name enables Trace for that module.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }
    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level accepted by any module or the default.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Info;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable stderr output
    bool colors = true;                 ///< Enable ANSI colors on stderr
};

/// Thread-safe global logger.
///
/// Auto-initializes with a console sink at Info level on first use.
class Logger {
public:
    /// Replaces sinks, level and filter from `config`.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink (the logger then drops messages until a sink is added).
    void clear_sinks();

    void set_level(LogLevel level);
    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Parses logging options from argv.
/// Recognized: --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv, --verbose, -q.
/// Falls back to the POLYDOC_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns true if `arg` is one of the options consumed by parse_log_options.
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef POLYDOC_MIN_LOG_LEVEL
#define POLYDOC_MIN_LOG_LEVEL 0
#endif

#define POLYDOC_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= POLYDOC_MIN_LOG_LEVEL) {                                    \
            auto& polydoc_logger_ = ::polydoc::log::Logger::instance();                            \
            if (polydoc_logger_.should_log(level, module_str)) {                                   \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                polydoc_logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);            \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define POLYDOC_LOG_TRACE(module, msg) POLYDOC_LOG_IMPL(::polydoc::log::LogLevel::Trace, module, msg)
#define POLYDOC_LOG_DEBUG(module, msg) POLYDOC_LOG_IMPL(::polydoc::log::LogLevel::Debug, module, msg)
#define POLYDOC_LOG_INFO(module, msg) POLYDOC_LOG_IMPL(::polydoc::log::LogLevel::Info, module, msg)
#define POLYDOC_LOG_WARN(module, msg) POLYDOC_LOG_IMPL(::polydoc::log::LogLevel::Warn, module, msg)
#define POLYDOC_LOG_ERROR(module, msg) POLYDOC_LOG_IMPL(::polydoc::log::LogLevel::Error, module, msg)
#define POLYDOC_LOG_FATAL(module, msg) POLYDOC_LOG_IMPL(::polydoc::log::LogLevel::Fatal, module, msg)

} // namespace polydoc::log

#endif // POLYDOC_LOG_HPP
