//! # Logging
//!
//! A small structured logging library shared by the todo engine and CLI:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Console, file and null sinks
//! - Thread-safe dispatch with mutex protection
//! - Compile-time level elision via TODO_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! TODO_LOG_DEBUG("parser", "Parsed " << file.headings.size() << " headings");
//! TODO_LOG_WARN("config", "Ignoring unknown section [" << name << "]");
//! ```
//!
//! Module tags in use: `lexer`, `parser`, `printer`, `config`, `links`, `cli`.

#ifndef TODO_LOG_LOG_HPP
#define TODO_LOG_LOG_HPP

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace todo::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Failed operations
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name for a log level (e.g., "TRACE").
auto level_name(LogLevel level) -> const char*;

/// Parses a log level name (lower or upper case). Unknown names map to Info.
auto parse_level(std::string_view s) -> LogLevel;

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;
    std::string_view module; ///< Module tag (e.g., "parser")
    std::string message;
    const char* file; ///< Source file (__FILE__)
    int line;         ///< Source line (__LINE__)
    int64_t timestamp_ms;
};

/// Output format for log lines.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

/// Renders a record as one line (including the trailing newline).
auto format_record(const LogRecord& record, LogFormat format) -> std::string;

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

/// Writes to a stream (stderr by default), coloring the level when enabled.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true, std::ostream& out = std::cerr);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

    [[nodiscard]] auto colors_enabled() const -> bool {
        return colors_enabled_;
    }

private:
    std::ostream& out_;
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

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Discards all messages.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter parsed from specs like "parser=trace,*=warn".
class LogFilter {
public:
    /// Parses "module=level" pairs separated by commas. `*` sets the default;
    /// a bare module name enables Trace for that module.
    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// The lowest level any module would accept.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Module filter string
    std::string log_file;    ///< Path to log file (empty = no file)
    bool console = true;     ///< Enable stderr output
    bool colors = true;      ///< Enable ANSI colors on stderr
};

/// Thread-safe global logger. Without `init()` it has no sinks.
class Logger {
public:
    /// Replaces all sinks and levels according to `config`.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Fast-path check used by the macros before building the message.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message,
             const char* file, int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink.
    void clear_sinks();

    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Returns current local time formatted as "HH:MM:SS.mmm".
auto get_timestamp() -> std::string;

/// Returns milliseconds since epoch.
auto epoch_ms() -> int64_t;

/// Parses logging options from argv: --log-level=, --log-filter=, --log-file=,
/// --log-format=, -q, -v/-vv/-vvv. Falls back to the TODO_LOG environment
/// variable when no level or filter was given.
auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// Returns true if `arg` is one of the options handled by `parse_log_options`.
auto is_log_option(std::string_view arg) -> bool;

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef TODO_MIN_LOG_LEVEL
#define TODO_MIN_LOG_LEVEL 0
#endif

#define TODO_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= TODO_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::todo::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: TODO_LOG_TRACE("module", "message " << value);
#define TODO_LOG_TRACE(module, msg) TODO_LOG_IMPL(::todo::log::LogLevel::Trace, module, msg)
#define TODO_LOG_DEBUG(module, msg) TODO_LOG_IMPL(::todo::log::LogLevel::Debug, module, msg)
#define TODO_LOG_INFO(module, msg) TODO_LOG_IMPL(::todo::log::LogLevel::Info, module, msg)
#define TODO_LOG_WARN(module, msg) TODO_LOG_IMPL(::todo::log::LogLevel::Warn, module, msg)
#define TODO_LOG_ERROR(module, msg) TODO_LOG_IMPL(::todo::log::LogLevel::Error, module, msg)
#define TODO_LOG_FATAL(module, msg) TODO_LOG_IMPL(::todo::log::LogLevel::Fatal, module, msg)

} // namespace todo::log

#endif // TODO_LOG_LOG_HPP
