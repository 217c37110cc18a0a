//! # json5ast Logging
//!
//! Module-tagged logging for the lexer, parser and stringifier.
//!
//! | Piece | Role |
//! |-------|------|
//! | `LogLevel` | Trace, Debug, Info, Warn, Error, Fatal, Off |
//! | `LogRecord` | One message with level, module, source position and time |
//! | `LogSink` | Output destination (`ConsoleSink`, `FileSink`, `NullSink`) |
//! | `LogFilter` | Per-module levels parsed from `"parser=trace,*=warn"` |
//! | `Logger` | Global dispatcher, mutex-protected |
//!
//! The library logs under the modules `lexer`, `parser` and `stringify`:
//! failures at Debug level, successful operations at Trace level. No sink is
//! installed until `Logger::init()` or `Logger::add_sink()` is called, so the
//! library is silent by default.
//!
//! ## Usage
//!
//! ```cpp
//! json5ast::log::Logger::init(json5ast::log::config_from_env());
//! JSON5AST_LOG_DEBUG("parser", "parse failed: " << error.to_string());
//! ```
//!
//! Messages are stream expressions and are only built when the level and
//! module pass the filter. Defining `JSON5AST_MIN_LOG_LEVEL` removes calls
//! below that level at compile time.

#ifndef JSON5AST_LOG_HPP
#define JSON5AST_LOG_HPP

#include <atomic>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace json5ast::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Failures and decisions worth inspecting
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name of a level (`"TRACE"` ... `"OFF"`).
const char* level_name(LogLevel level);

/// Parses a level name in any letter case; `"warning"` is accepted for Warn.
/// Unrecognized names yield `LogLevel::Info`.
LogLevel parse_level(std::string_view name);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string_view module; ///< Module tag, e.g. "lexer" or "parser"
    std::string message;
    const char* file = nullptr; ///< Source file (__FILE__)
    int line = 0;               ///< Source line (__LINE__)
    int64_t timestamp_ms = 0;   ///< Milliseconds since the Unix epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

/// Formats `timestamp_ms` as local time `HH:MM:SS.mmm`.
std::string format_timestamp(int64_t timestamp_ms);

/// Returns the current local time as `HH:MM:SS.mmm`.
std::string get_timestamp();

/// Returns milliseconds since the Unix epoch.
int64_t epoch_ms();

/// Formats a record as text without a trailing newline. The level name is
/// padded to five characters so messages line up.
std::string format_text(const LogRecord& record);

/// Formats a record as a JSON object with keys `ts`, `level`, `module` and
/// `msg`, without a trailing newline.
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Sinks
// ============================================================================

/// Output destination for log records.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr. Colors are used only when requested and stderr is a
/// terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_;
    LogFormat format_ = LogFormat::Text;
};

/// Writes to a file, flushing after every Error or Fatal record.
class FileSink : public LogSink {
public:
    /// Opens `path`, appending or truncating. Check `is_open()` afterwards;
    /// writes to a sink that failed to open are dropped.
    explicit FileSink(const std::string& path, bool append = true);

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

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module minimum levels with a default for unlisted modules.
///
/// A spec is a comma-separated list of `module=level` entries. `*=level` sets
/// the default, and a bare module name enables Trace for that module.
/// Surrounding spaces are ignored: `"parser = debug, *=warn"`.
class LogFilter {
public:
    /// Replaces the module levels with those in `spec`.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level any module or the default lets through.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::vector<std::pair<std::string, LogLevel>> module_levels_;

    void set_module_level(std::string_view module, LogLevel level);
};

// ============================================================================
// Logger
// ============================================================================

/// Settings applied by `Logger::init()`.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;  ///< Module filter; overrides `level` per module
    std::string log_file;     ///< Appended to when non-empty
    bool console = true;      ///< Log to stderr
    bool colors = true;       ///< Color console output on terminals
};

/// Builds a LogConfig from the environment.
///
/// - `JSON5AST_LOG`: a level name (`debug`) or a filter spec (`parser=trace,*=warn`)
/// - `JSON5AST_LOG_FILE`: path of a log file to append to
/// - `JSON5AST_LOG_FORMAT`: `json` for JSON lines, anything else for text
LogConfig config_from_env();

/// Process-wide logger.
///
/// Records pass a lock-free level check, then the module filter, then go to
/// every sink under a mutex. Starts at Warn with no sinks.
class Logger {
public:
    /// Replaces the sinks, level and filter of the global logger.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Cheap check used by the macros before a message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, std::string message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    /// Sets the global level and the filter default together.
    void set_level(LogLevel level);

    LogLevel level() const {
        return level_.load(std::memory_order_relaxed);
    }

    /// Installs a module filter; the global level drops to the lowest level
    /// the filter allows.
    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    std::atomic<LogLevel> level_{LogLevel::Warn};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef JSON5AST_MIN_LOG_LEVEL
#define JSON5AST_MIN_LOG_LEVEL 0
#endif

/// Logs `msg` (a stream expression) at `level` under `module`.
#define JSON5AST_LOG(level, module, msg)                                                           \
    do {                                                                                           \
        if constexpr (static_cast<int>(level) >= JSON5AST_MIN_LOG_LEVEL) {                         \
            auto& json5ast_logger_ = ::json5ast::log::Logger::instance();                          \
            if (json5ast_logger_.should_log(level, module)) {                                      \
                std::ostringstream json5ast_msg_;                                                  \
                json5ast_msg_ << msg;                                                              \
                json5ast_logger_.log(level, module, json5ast_msg_.str(), __FILE__, __LINE__);      \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define JSON5AST_LOG_TRACE(module, msg) JSON5AST_LOG(::json5ast::log::LogLevel::Trace, module, msg)
#define JSON5AST_LOG_DEBUG(module, msg) JSON5AST_LOG(::json5ast::log::LogLevel::Debug, module, msg)
#define JSON5AST_LOG_INFO(module, msg) JSON5AST_LOG(::json5ast::log::LogLevel::Info, module, msg)
#define JSON5AST_LOG_WARN(module, msg) JSON5AST_LOG(::json5ast::log::LogLevel::Warn, module, msg)
#define JSON5AST_LOG_ERROR(module, msg) JSON5AST_LOG(::json5ast::log::LogLevel::Error, module, msg)
#define JSON5AST_LOG_FATAL(module, msg) JSON5AST_LOG(::json5ast::log::LogLevel::Fatal, module, msg)

} // namespace json5ast::log

#endif // JSON5AST_LOG_HPP
