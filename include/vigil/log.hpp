#pragma once

// vigil/log.hpp — Structured NDJSON logging.
//
// Each record is one line: {"ts":..., "level":..., "component":..., "event":..., <fields>}.
// Sink: file named by VIGIL_LOG (opened in append mode), otherwise stderr.
// Minimum level: VIGIL_LOG_LEVEL (debug|info|warn|error, default info).
// A failed write increments write_failures() and never propagates.

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>

#include "vigil/jsonlite.hpp"

namespace vigil {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3 };

std::string to_string(LogLevel level);
LogLevel parse_log_level(std::string_view text, LogLevel def = LogLevel::info);

class Logger {
 public:
  static constexpr size_t kMaxValueLength = 2048;

  Logger();
  ~Logger();
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void log(LogLevel level, std::string_view component, std::string_view event,
           const jsonlite::Object& fields = {});

  void set_level(LogLevel level) { level_.store(static_cast<int>(level), std::memory_order_relaxed); }
  LogLevel level() const { return static_cast<LogLevel>(level_.load(std::memory_order_relaxed)); }
  bool enabled(LogLevel level) const { return static_cast<int>(level) >= level_.load(std::memory_order_relaxed); }

  // Redirect output. Empty path restores stderr.
  void set_path(const std::string& path);

  std::uint64_t write_failures() const { return write_failures_.load(std::memory_order_relaxed); }

 private:
  std::mutex mu_;
  std::FILE* file_{nullptr};
  std::atomic<int> level_{static_cast<int>(LogLevel::info)};
  std::atomic<std::uint64_t> write_failures_{0};
};

Logger& global_logger();

// "2026-01-02T03:04:05.678Z"
std::string iso8601_utc_now();

// Truncates long string values recursively, appending "...(truncated)".
jsonlite::Value truncate_log_value(const jsonlite::Value& v, size_t max_len = Logger::kMaxValueLength);

inline void log_debug(std::string_view component, std::string_view event, const jsonlite::Object& fields = {}) {
  global_logger().log(LogLevel::debug, component, event, fields);
}
inline void log_info(std::string_view component, std::string_view event, const jsonlite::Object& fields = {}) {
  global_logger().log(LogLevel::info, component, event, fields);
}
inline void log_warn(std::string_view component, std::string_view event, const jsonlite::Object& fields = {}) {
  global_logger().log(LogLevel::warn, component, event, fields);
}
inline void log_error(std::string_view component, std::string_view event, const jsonlite::Object& fields = {}) {
  global_logger().log(LogLevel::error, component, event, fields);
}

}  // namespace vigil
