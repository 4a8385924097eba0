//! # Logger Implementation
//!
//! Implements the Logger singleton, the sinks and LogFilter.

#include "log/log.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace todo::log {

namespace {

/// Detects if stderr supports ANSI color codes.
auto detect_terminal_colors() -> bool {
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
}

auto level_color(LogLevel level) -> const char* {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m"; // Dark gray
    case LogLevel::Debug:
        return "\033[36m"; // Cyan
    case LogLevel::Info:
        return "\033[32m"; // Green
    case LogLevel::Warn:
        return "\033[33m"; // Yellow
    case LogLevel::Error:
        return "\033[31m"; // Red
    case LogLevel::Fatal:
        return "\033[1;31m"; // Bold red
    case LogLevel::Off:
        return "";
    }
    return "";
}

void append_json_escaped(std::ostringstream& oss, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            oss << c;
        }
    }
}

} // namespace

// ============================================================================
// Levels and Formatting
// ============================================================================

auto level_name(LogLevel level) -> const char* {
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

auto parse_level(std::string_view s) -> LogLevel {
    static const std::unordered_map<std::string_view, LogLevel> LEVELS = {
        {"trace", LogLevel::Trace}, {"TRACE", LogLevel::Trace}, {"debug", LogLevel::Debug},
        {"DEBUG", LogLevel::Debug}, {"info", LogLevel::Info},   {"INFO", LogLevel::Info},
        {"warn", LogLevel::Warn},   {"WARN", LogLevel::Warn},   {"error", LogLevel::Error},
        {"ERROR", LogLevel::Error}, {"fatal", LogLevel::Fatal}, {"FATAL", LogLevel::Fatal},
        {"off", LogLevel::Off},     {"OFF", LogLevel::Off},
    };

    auto it = LEVELS.find(s);
    return it != LEVELS.end() ? it->second : LogLevel::Info;
}

auto format_record(const LogRecord& record, LogFormat format) -> std::string {
    std::ostringstream oss;
    if (format == LogFormat::JSON) {
        oss << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
            << "\",\"module\":\"" << record.module << "\",\"msg\":\"";
        append_json_escaped(oss, record.message);
        oss << "\"}\n";
    } else {
        oss << get_timestamp() << " " << std::left << std::setw(5) << level_name(record.level)
            << " [" << record.module << "] " << record.message << "\n";
    }
    return oss.str();
}

auto get_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&now_c, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

auto epoch_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors, std::ostream& out)
    : out_(out), colors_enabled_(use_colors && &out == &std::cerr && detect_terminal_colors()) {}

void ConsoleSink::write(const LogRecord& record) {
    auto line = format_record(record, format_);

    // Color only the level name, which follows the "HH:MM:SS.mmm " prefix
    if (colors_enabled_ && format_ == LogFormat::Text) {
        auto level_at = line.find(' ') + 1;
        auto level_end = line.find(" [", level_at);
        line.insert(level_end, "\033[0m");
        line.insert(level_at, level_color(record.level));
    }

    out_ << line;
}

void ConsoleSink::flush() {
    out_.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    file_ << format_record(record, format_);
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }

        auto token = spec.substr(pos, comma - pos);
        size_t eq = token.find('=');

        if (eq != std::string_view::npos) {
            auto mod = token.substr(0, eq);
            auto lvl = parse_level(token.substr(eq + 1));
            if (mod == "*") {
                default_level_ = lvl;
            } else {
                module_levels_[std::string(mod)] = lvl;
            }
        } else if (!token.empty()) {
            module_levels_[std::string(token)] = LogLevel::Trace;
        }

        pos = comma + 1;
    }
}

auto LogFilter::should_log(LogLevel level, std::string_view module) const -> bool {
    auto it = module_levels_.find(std::string(module));
    if (it != module_levels_.end()) {
        return level >= it->second;
    }
    return level >= default_level_;
}

auto LogFilter::min_level() const -> LogLevel {
    LogLevel min = default_level_;
    for (const auto& [_, level] : module_levels_) {
        if (level < min)
            min = level;
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);

    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        // Per-module overrides may accept levels below the global one
        logger.level_ = logger.filter_.min_level();
    } else {
        logger.level_ = config.level;
    }

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    if (level < level_ || level == LogLevel::Off)
        return false;

    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{.level = level,
                  .module = module,
                  .message = message,
                  .file = file,
                  .line = line,
                  .timestamp_ms = epoch_ms()});
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace todo::log
