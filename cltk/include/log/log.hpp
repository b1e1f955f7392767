//! # cltk Logging
//!
//! Structured developer logging shared by the lifecycle, the argument parser
//! and every tool built on cltk.
//!
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Console, file, null and fan-out sinks
//! - Compile-time level elision via CLTK_MIN_LOG_LEVEL
//!
//! Logging is not the diagnostics channel. Diagnostics are results shown to
//! the user of a tool; log records trace what cltk itself is doing.
//!
//! ## Usage
//!
//! ```cpp
//! CLTK_LOG_DEBUG("lifecycle", "captured working directory " << cwd);
//! CLTK_LOG_INFO("cli", "dispatching tool " << name);
//! ```

#ifndef CLTK_LOG_HPP
#define CLTK_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cltk::log {

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

/// Parses a log level name. Accepts lower and upper case and "warning".
/// Returns LogLevel::Info if the string is not recognized.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN" || s == "warning" || s == "WARNING")
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
    std::string_view module; ///< Module tag (e.g., "lifecycle", "args")
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

/// Console sink. Writes to stderr unless another stream is given.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true, std::ostream& out = std::cerr);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_color_enabled(bool enabled) {
        colors_enabled_ = enabled;
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ostream& out_;
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;

    const char* level_color(LogLevel level) const;
};

/// File sink. Auto-flushes on Error and Fatal messages.
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

/// Null sink that discards all messages.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Fans out log records to multiple child sinks.
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

/// Renders a record as one text line ("12:00:00.000 INFO  [module] message").
std::string format_text(const LogRecord& record);

/// Renders a record as one JSON object line.
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "args=trace,lifecycle=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string.
    /// Format: "module1=level,module2=level,*=default_level"
    /// Module names without "=level" are set to Trace.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured for any module or the default.
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

/// Process-wide logger.
///
/// Auto-initializes with a Warn-level console sink on first use. Tools built
/// on cltk reconfigure it from the global logging options during lifecycle
/// construction.
class Logger {
public:
    /// Replace sinks, level and filter with the given configuration.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Drop every sink. Records logged afterwards go nowhere.
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
// Timestamp Helpers
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
// CLI Parsing
// ============================================================================

/// Extract the global logging options from a tool's argument list.
///
/// Recognized: --log-level=<lvl>, --log-filter=<spec>, --log-file=<path>,
/// --log-format=text|json, -v/-vv/-vvv, --verbose, -q, --quiet.
/// Recognized arguments are removed from `args`; scanning stops at "--".
/// When no level or filter is given, the CLTK_LOG environment variable is
/// used as a fallback.
///
/// Arguments for which `is_tool_argument` returns true are left in place
/// even if they look like logging options, so a tool may declare its own
/// `--verbose` or `-q`.
LogConfig parse_log_options(std::vector<std::string>& args,
                            const std::function<bool(std::string_view)>& is_tool_argument = {});

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef CLTK_MIN_LOG_LEVEL
#define CLTK_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific macros below.
#define CLTK_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= CLTK_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::cltk::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: CLTK_LOG_TRACE("module", "message " << value);
#define CLTK_LOG_TRACE(module, msg) CLTK_LOG_IMPL(::cltk::log::LogLevel::Trace, module, msg)
#define CLTK_LOG_DEBUG(module, msg) CLTK_LOG_IMPL(::cltk::log::LogLevel::Debug, module, msg)
#define CLTK_LOG_INFO(module, msg) CLTK_LOG_IMPL(::cltk::log::LogLevel::Info, module, msg)
#define CLTK_LOG_WARN(module, msg) CLTK_LOG_IMPL(::cltk::log::LogLevel::Warn, module, msg)
#define CLTK_LOG_ERROR(module, msg) CLTK_LOG_IMPL(::cltk::log::LogLevel::Error, module, msg)
#define CLTK_LOG_FATAL(module, msg) CLTK_LOG_IMPL(::cltk::log::LogLevel::Fatal, module, msg)

} // namespace cltk::log

#endif // CLTK_LOG_HPP
