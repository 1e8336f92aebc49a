//! # shapebuf Logging
//!
//! A small structured logging library used by every shapebuf component:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal) plus Off
//! - Module-tagged messages for per-component filtering
//! - Output sinks (Console, File, Null, Multi)
//! - Thread-safe output with mutex protection
//! - Compile-time level elision via SHAPEBUF_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! SHAPEBUF_LOG_DEBUG("capture", "Captured " << tokens << " tokens");
//! SHAPEBUF_LOG_WARN("replay", "Skipping " << n << " unconsumed elements");
//! ```
//!
//! ## Modules
//!
//! | Tag | Component |
//! |-----|-----------|
//! | `capture` | Recorder (capture path) |
//! | `replay` | Replayer and Cursor |
//! | `payload` | Payload store |
//! | `builder` | BufferBuilder |
//! | `config` | Capture options |

#ifndef SHAPEBUF_LOG_HPP
#define SHAPEBUF_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace shapebuf::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name for a log level (e.g., "TRACE", "DEBUG").
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

/// Parses a log level from a string (lower or upper case).
/// Returns LogLevel::Info if the string is not recognized.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN")
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
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "capture", "replay")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    /// Write a log record to the sink.
    virtual void write(const LogRecord& record) = 0;

    /// Flush any buffered output.
    virtual void flush() = 0;
};

/// Console sink that writes to stderr with optional ANSI colors.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_color_enabled(bool enabled) {
        colors_enabled_ = enabled;
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// File sink that appends log messages to a file.
/// Flushes immediately on Error and Fatal messages.
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

/// Sink that discards all messages.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Fans out log records to several child sinks.
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

/// Formats a record as one line of text: "HH:MM:SS.mmm LEVEL [module] message".
std::string format_text(const LogRecord& record);

/// Formats a record as one JSON object: {"ts":..,"level":..,"module":..,"msg":..}.
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses specifications like "capture=trace,replay=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification. A module name without "=level" enables
    /// everything from that module.
    void parse(std::string_view spec);

    /// Check if a message at `level` from `module` passes the filter.
    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level accepted by any module or by the default.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Auto-initializes with a Warn-level console sink on first use.
class Logger {
public:
    /// Replace the global logger configuration.
    static void init(const LogConfig& config);

    /// Get the global logger instance.
    static Logger& instance();

    /// Fast-path check used by the macros before formatting a message.
    bool should_log(LogLevel level, std::string_view module) const;

    /// Dispatch a record to all sinks.
    void log(const LogRecord& record);

    /// Log a message at the given level from the given module.
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Remove every sink (used by tests that install their own sink).
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Time Helpers
// ============================================================================

/// Returns current local time formatted as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

/// Returns milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI / Environment Parsing
// ============================================================================

/// Parse logging options from argv.
/// Recognizes --log-level=, --log-filter=, --log-file=, --log-format=,
/// -v/-vv/-vvv and -q. Falls back to the SHAPEBUF_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time floor: calls below this level compile to nothing.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef SHAPEBUF_MIN_LOG_LEVEL
#define SHAPEBUF_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones below.
#define SHAPEBUF_LOG_IMPL(level, module_str, msg)                                                  \
    do {                                                                                           \
        if (static_cast<int>(level) >= SHAPEBUF_MIN_LOG_LEVEL) {                                   \
            auto& logger_ = ::shapebuf::log::Logger::instance();                                   \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define SHAPEBUF_LOG_TRACE(module, msg) SHAPEBUF_LOG_IMPL(::shapebuf::log::LogLevel::Trace, module, msg)
#define SHAPEBUF_LOG_DEBUG(module, msg) SHAPEBUF_LOG_IMPL(::shapebuf::log::LogLevel::Debug, module, msg)
#define SHAPEBUF_LOG_INFO(module, msg) SHAPEBUF_LOG_IMPL(::shapebuf::log::LogLevel::Info, module, msg)
#define SHAPEBUF_LOG_WARN(module, msg) SHAPEBUF_LOG_IMPL(::shapebuf::log::LogLevel::Warn, module, msg)
#define SHAPEBUF_LOG_ERROR(module, msg) SHAPEBUF_LOG_IMPL(::shapebuf::log::LogLevel::Error, module, msg)
#define SHAPEBUF_LOG_FATAL(module, msg) SHAPEBUF_LOG_IMPL(::shapebuf::log::LogLevel::Fatal, module, msg)

} // namespace shapebuf::log

#endif // SHAPEBUF_LOG_HPP
