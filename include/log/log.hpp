//! # domainfix Logging
//!
//! A structured logging library for domainfix with:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Multiple output sinks (Console, File, Null, Multi)
//! - Thread-safe output with mutex protection
//! - Compile-time level elision via DOMAINFIX_MIN_LOG_LEVEL
//! - ANSI colored console output with terminal detection
//!
//! ## Usage
//!
//! ```cpp
//! DOMAINFIX_LOG_INFO("lint", "Checking " << path);
//! DOMAINFIX_LOG_DEBUG("rules", "Call to " << name << " has " << n << " literal args");
//! DOMAINFIX_LOG_WARN("lexer", path << ": unterminated string literal");
//! ```
//!
//! ## Modules
//!
//! | Module   | Component                                |
//! |----------|------------------------------------------|
//! | `lexer`  | PHP tokenizer                            |
//! | `rules`  | Text domain rule                         |
//! | `fixer`  | Fix application loop                     |
//! | `lint`   | File discovery, reporting, CLI driver    |

#ifndef DOMAINFIX_LOG_HPP
#define DOMAINFIX_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
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

namespace domainfix::log {

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

/// Parses a log level name, lower or upper case.
/// Returns LogLevel::Info if the string is not recognized.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< "HH:MM:SS.mmm LEVEL [module] message"
    JSON  ///< One JSON object per line
};

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

/// Console sink. Writes to stderr unless another stream is given.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    ConsoleSink(std::ostream& out, bool use_colors);

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

/// Writes a record as "HH:MM:SS.mmm LEVEL [module] message\n".
/// `color` wraps the level name when non-null.
void write_text_record(std::ostream& out, const LogRecord& record, const char* color = nullptr);

/// Writes a record as a single-line JSON object.
void write_json_record(std::ostream& out, const LogRecord& record);

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "rules=trace,lexer=debug,*=warn". A bare module
/// name without "=level" enables Trace for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Minimum configured level across all modules and the default.
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
    LogLevel level = LogLevel::Info;    ///< Global minimum log level
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
/// Logs to a colored console sink at Info level until `init()` is called.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes all sinks (used by tests to install capture sinks).
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

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Returns current time formatted as "HH:MM:SS.mmm".
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

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Parse logging-related CLI options from argv.
/// Extracts: --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv,
/// -q and --no-color. Falls back to the DOMAINFIX_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns true if `arg` is one of the options consumed by parse_log_options().
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef DOMAINFIX_MIN_LOG_LEVEL
#define DOMAINFIX_MIN_LOG_LEVEL 0
#endif

/// Internal macro, do not use directly.
#define DOMAINFIX_LOG_IMPL(level, module_str, msg)                                                 \
    do {                                                                                           \
        if (static_cast<int>(level) >= DOMAINFIX_MIN_LOG_LEVEL) {                                  \
            auto& logger_ = ::domainfix::log::Logger::instance();                                  \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: DOMAINFIX_LOG_TRACE("module", "message " << value);
#define DOMAINFIX_LOG_TRACE(module, msg)                                                           \
    DOMAINFIX_LOG_IMPL(::domainfix::log::LogLevel::Trace, module, msg)
#define DOMAINFIX_LOG_DEBUG(module, msg)                                                           \
    DOMAINFIX_LOG_IMPL(::domainfix::log::LogLevel::Debug, module, msg)
#define DOMAINFIX_LOG_INFO(module, msg)                                                            \
    DOMAINFIX_LOG_IMPL(::domainfix::log::LogLevel::Info, module, msg)
#define DOMAINFIX_LOG_WARN(module, msg)                                                            \
    DOMAINFIX_LOG_IMPL(::domainfix::log::LogLevel::Warn, module, msg)
#define DOMAINFIX_LOG_ERROR(module, msg)                                                           \
    DOMAINFIX_LOG_IMPL(::domainfix::log::LogLevel::Error, module, msg)
#define DOMAINFIX_LOG_FATAL(module, msg)                                                           \
    DOMAINFIX_LOG_IMPL(::domainfix::log::LogLevel::Fatal, module, msg)

} // namespace domainfix::log

#endif // DOMAINFIX_LOG_HPP
