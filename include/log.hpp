#pragma once
#include <string>

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3, off = 4 };

void set_log_level(LogLevel level);
LogLevel log_level();

// "debug" | "info" | "warn" | "error" | "off"; throws InvalidArgument otherwise.
LogLevel parse_log_level(const std::string& name);

// Writes "[mvstore] LEVEL component: message" to stderr when level passes the threshold.
void log_line(LogLevel level, const std::string& component, const std::string& message);

inline void log_debug(const std::string& component, const std::string& message) {
  log_line(LogLevel::debug, component, message);
}
inline void log_info(const std::string& component, const std::string& message) {
  log_line(LogLevel::info, component, message);
}
inline void log_warn(const std::string& component, const std::string& message) {
  log_line(LogLevel::warn, component, message);
}
inline void log_error(const std::string& component, const std::string& message) {
  log_line(LogLevel::error, component, message);
}
