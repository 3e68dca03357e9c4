#include "vigil/log.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace vigil {

std::string iso8601_utc_now() {
  using SC = std::chrono::system_clock;
  const auto now = SC::now();
  const std::time_t t = SC::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm_utc{};
  gmtime_r(&t, &tm_utc);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec, static_cast<int>(ms));
  return buf;
}

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
  }
  return "info";
}

LogLevel parse_log_level(std::string_view text, LogLevel def) {
  if (text == "debug") return LogLevel::debug;
  if (text == "info") return LogLevel::info;
  if (text == "warn" || text == "warning") return LogLevel::warn;
  if (text == "error") return LogLevel::error;
  return def;
}

jsonlite::Value truncate_log_value(const jsonlite::Value& v, size_t max_len) {
  if (v.is_string()) {
    const auto& s = v.as_string();
    if (s.size() <= max_len) return v;
    return s.substr(0, max_len) + "...(truncated)";
  }
  if (v.is_object()) {
    jsonlite::Object out;
    for (const auto& [k, item] : v.as_object()) out[k] = truncate_log_value(item, max_len);
    return out;
  }
  if (v.is_array()) {
    jsonlite::Array out;
    out.reserve(v.as_array().size());
    for (const auto& item : v.as_array()) out.push_back(truncate_log_value(item, max_len));
    return out;
  }
  return v;
}

Logger::Logger() {
  if (const char* lvl = std::getenv("VIGIL_LOG_LEVEL"); lvl && lvl[0]) {
    set_level(parse_log_level(lvl));
  }
  if (const char* path = std::getenv("VIGIL_LOG"); path && path[0]) {
    file_ = std::fopen(path, "a");
  }
}

Logger::~Logger() {
  std::lock_guard<std::mutex> lk(mu_);
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

void Logger::set_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(mu_);
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
  if (!path.empty()) {
    file_ = std::fopen(path.c_str(), "a");
    if (!file_) write_failures_.fetch_add(1, std::memory_order_relaxed);
  }
}

void Logger::log(LogLevel level, std::string_view component, std::string_view event,
                 const jsonlite::Object& fields) {
  if (!enabled(level)) return;

  jsonlite::Object rec;
  for (const auto& [k, v] : fields) rec[k] = truncate_log_value(v);
  rec["ts"] = iso8601_utc_now();
  rec["level"] = to_string(level);
  rec["component"] = std::string(component);
  rec["event"] = std::string(event);

  const std::string line = jsonlite::to_json(rec) + "\n";

  std::lock_guard<std::mutex> lk(mu_);
  std::FILE* out = file_ ? file_ : stderr;
  if (std::fwrite(line.data(), 1, line.size(), out) != line.size()) {
    write_failures_.fetch_add(1, std::memory_order_relaxed);
  }
  std::fflush(out);
}

Logger& global_logger() {
  static Logger inst;
  return inst;
}

}  // namespace vigil
