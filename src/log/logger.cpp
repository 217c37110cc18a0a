//! # Logger Implementation
//!
//! Level names, record formatting, the console and file sinks, module
//! filtering and the global Logger.

#include "json5ast/log/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <unistd.h>

namespace json5ast::log {

namespace {

constexpr const char* LEVEL_NAMES[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"};

constexpr const char* LEVEL_COLORS[] = {
    "\033[90m",   // Trace: dark gray
    "\033[36m",   // Debug: cyan
    "\033[32m",   // Info: green
    "\033[33m",   // Warn: yellow
    "\033[31m",   // Error: red
    "\033[1;31m", // Fatal: bold red
    "",           // Off
};

constexpr const char* RESET = "\033[0m";

auto level_index(LogLevel level) -> size_t {
    auto index = static_cast<size_t>(level);
    return std::min(index, std::size(LEVEL_NAMES) - 1);
}

/// True when stderr is a terminal that understands ANSI escapes.
bool stderr_supports_colors() {
    if (!isatty(fileno(stderr))) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && s.front() == ' ') {
        s.remove_prefix(1);
    }
    while (!s.empty() && s.back() == ' ') {
        s.remove_suffix(1);
    }
    return s;
}

void write_json_string(std::ostringstream& out, std::string_view text) {
    out << '"';
    for (char c : text) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buffer[8];
                std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(c));
                out << buffer;
            } else {
                out << c;
            }
        }
    }
    out << '"';
}

/// Text layout shared by the plain and colored console output.
std::string text_line(const LogRecord& record, const char* color, const char* reset) {
    std::ostringstream out;
    out << format_timestamp(record.timestamp_ms) << ' ' << color << std::left << std::setw(5)
        << level_name(record.level) << reset << " [" << record.module << "] " << record.message;
    return out.str();
}

} // namespace

// ============================================================================
// Levels and Time
// ============================================================================

const char* level_name(LogLevel level) {
    return LEVEL_NAMES[level_index(level)];
}

LogLevel parse_level(std::string_view name) {
    if (equals_ignore_case(name, "warning")) {
        return LogLevel::Warn;
    }
    for (size_t i = 0; i < std::size(LEVEL_NAMES); ++i) {
        if (equals_ignore_case(name, LEVEL_NAMES[i])) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

std::string format_timestamp(int64_t timestamp_ms) {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << timestamp_ms % 1000;
    return out.str();
}

std::string get_timestamp() {
    return format_timestamp(epoch_ms());
}

int64_t epoch_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// Record Formatting
// ============================================================================

std::string format_text(const LogRecord& record) {
    return text_line(record, "", "");
}

std::string format_json(const LogRecord& record) {
    std::ostringstream out;
    out << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
        << "\",\"module\":";
    write_json_string(out, record.module);
    out << ",\"msg\":";
    write_json_string(out, record.message);
    out << '}';
    return out.str();
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) : colors_(use_colors && stderr_supports_colors()) {}

void ConsoleSink::write(const LogRecord& record) {
    std::string line;
    if (format_ == LogFormat::JSON) {
        line = format_json(record);
    } else if (colors_) {
        line = text_line(record, LEVEL_COLORS[level_index(record.level)], RESET);
    } else {
        line = format_text(record);
    }
    line += '\n';
    std::cerr << line;
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? std::ios::out | std::ios::app : std::ios::out | std::ios::trunc) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << (format_ == LogFormat::JSON ? format_json(record) : format_text(record)) << '\n';
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

    while (!spec.empty()) {
        size_t comma = spec.find(',');
        std::string_view entry = trim(spec.substr(0, comma));
        spec = comma == std::string_view::npos ? std::string_view() : spec.substr(comma + 1);

        if (entry.empty()) {
            continue;
        }
        size_t eq = entry.find('=');
        if (eq == std::string_view::npos) {
            set_module_level(entry, LogLevel::Trace);
            continue;
        }

        std::string_view module = trim(entry.substr(0, eq));
        LogLevel level = parse_level(trim(entry.substr(eq + 1)));
        if (module == "*") {
            default_level_ = level;
        } else {
            set_module_level(module, level);
        }
    }
}

void LogFilter::set_module_level(std::string_view module, LogLevel level) {
    for (auto& [name, existing] : module_levels_) {
        if (name == module) {
            existing = level;
            return;
        }
    }
    module_levels_.emplace_back(std::string(module), level);
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    for (const auto& [name, min] : module_levels_) {
        if (name == module) {
            return level >= min;
        }
    }
    return level >= default_level_;
}

LogLevel LogFilter::min_level() const {
    LogLevel min = default_level_;
    for (const auto& entry : module_levels_) {
        min = std::min(min, entry.second);
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);
    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
    }
    logger.level_.store(logger.filter_.min_level(), std::memory_order_relaxed);

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        if (!file->is_open()) {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
            return;
        }
        file->set_format(config.format);
        logger.sinks_.push_back(std::move(file));
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    if (level < level_.load(std::memory_order_relaxed)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, std::string message, const char* file,
                 int line) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = file;
    record.line = line;
    record.timestamp_ms = epoch_ms();
    log(record);
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
    filter_.set_default_level(level);
    level_.store(level, std::memory_order_relaxed);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_.store(filter_.min_level(), std::memory_order_relaxed);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace json5ast::log
