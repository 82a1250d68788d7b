#pragma once
#ifndef LOGGER_H
#define LOGGER_H

#include <string>

/**
 * Minimal process-wide logger writing timestamped lines to stderr:
 *   [2024-05-01 12:00:00.042] WARN cache: resolver #0 failed: timeout
 */
enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Lines below this level are dropped. Defaults to Info.
void set_log_level(LogLevel level);
LogLevel log_level();

/**
 * Parse "debug" / "info" / "warn" / "error" (case-insensitive).
 * @throws CacheConfigError on anything else
 */
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

/**
 * Write one line if @p level passes the current threshold.
 * @param component Short subsystem tag ("cache", "api", "origin", ...)
 */
void log_line(LogLevel level, const std::string& component, const std::string& message);

inline void log_debug(const std::string& component, const std::string& message) {
    log_line(LogLevel::Debug, component, message);
}
inline void log_info(const std::string& component, const std::string& message) {
    log_line(LogLevel::Info, component, message);
}
inline void log_warn(const std::string& component, const std::string& message) {
    log_line(LogLevel::Warn, component, message);
}
inline void log_error(const std::string& component, const std::string& message) {
    log_line(LogLevel::Error, component, message);
}

#endif // LOGGER_H
