//! # Log Initialization from the Environment
//!
//! Reads the JSON5AST_LOG, JSON5AST_LOG_FILE and JSON5AST_LOG_FORMAT
//! environment variables to produce a LogConfig.

#include "json5ast/log/log.hpp"

#include <cstdlib>
#include <string>

namespace json5ast::log {

namespace {

/// Returns the value of `name`, or an empty string when unset.
std::string env_value(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

} // namespace

LogConfig config_from_env() {
    LogConfig config;

    std::string env_log = env_value("JSON5AST_LOG");
    if (!env_log.empty()) {
        // If it contains '=' or ',' it's a filter spec, otherwise it's a level
        if (env_log.find('=') != std::string::npos || env_log.find(',') != std::string::npos) {
            config.filter_spec = env_log;
        } else {
            config.level = parse_level(env_log);
        }
    }

    config.log_file = env_value("JSON5AST_LOG_FILE");

    std::string fmt = env_value("JSON5AST_LOG_FORMAT");
    if (fmt == "json" || fmt == "JSON") {
        config.format = LogFormat::JSON;
    }

    return config;
}

} // namespace json5ast::log
