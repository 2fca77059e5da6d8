#include "log.hpp"
#include "errors.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

static std::atomic<int> g_level{(int)LogLevel::info};
static std::mutex g_out;

static const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info:  return "INFO";
    case LogLevel::warn:  return "WARN";
    case LogLevel::error: return "ERROR";
    default:              return "OFF";
  }
}

void set_log_level(LogLevel level) { g_level.store((int)level); }

LogLevel log_level() { return (LogLevel)g_level.load(); }

LogLevel parse_log_level(const std::string& name) {
  if (name == "debug") return LogLevel::debug;
  if (name == "info")  return LogLevel::info;
  if (name == "warn")  return LogLevel::warn;
  if (name == "error") return LogLevel::error;
  if (name == "off")   return LogLevel::off;
  throw InvalidArgument("log: unknown level '" + name + "'");
}

void log_line(LogLevel level, const std::string& component, const std::string& message) {
  if (level == LogLevel::off || (int)level < g_level.load()) return;
  std::lock_guard<std::mutex> lk(g_out);
  std::cerr << "[mvstore] " << level_name(level) << " " << component << ": " << message << "\n";
}
