#include "vigil/progress.hpp"

#include <cstdio>

#include "vigil/log.hpp"
#include "vigil/observability.hpp"

namespace vigil {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

namespace {

constexpr const char* kTruncatedSuffix = "... (truncated)";
constexpr const char* kTruncatedMarker = "__truncated__";

std::string clip(const std::string& s, size_t max_len) {
  if (s.size() <= max_len) return s;
  size_t cut = max_len;
  while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
  return s.substr(0, cut) + kTruncatedSuffix;
}

size_t encoded_size(const ProgressEvent& ev) {
  return jsonlite::to_json(ev.to_json()).size();
}

}  // namespace

std::string to_string(ProgressEventType type) {
  switch (type) {
    case ProgressEventType::started: return "started";
    case ProgressEventType::step_progress: return "step_progress";
    case ProgressEventType::blocked: return "blocked";
    case ProgressEventType::retrying: return "retrying";
    case ProgressEventType::assertion_result: return "assertion_result";
    case ProgressEventType::finished: return "finished";
  }
  return "unknown";
}

Object ProgressEvent::to_json() const {
  Object o;
  o["type"] = to_string(type);
  o["report_id"] = report_id;
  o["timestamp"] = timestamp;
  if (step_alias) o["step_alias"] = *step_alias;
  if (payload) o["payload"] = *payload;
  if (truncated) o["truncated"] = true;
  return o;
}

std::string progress_channel(const std::string& report_id) {
  return "report_progress:" + report_id;
}

Value sanitize_progress_payload(const Value& v, const SanitizeLimits& limits, size_t depth) {
  if (v.is_string()) return clip(v.as_string(), limits.max_string_length);
  if (v.is_array()) {
    if (depth >= limits.max_depth) return Array{Value{kTruncatedMarker}};
    const auto& items = v.as_array();
    Array out;
    for (size_t i = 0; i < items.size(); ++i) {
      if (i >= limits.max_items) {
        out.push_back(Object{{kTruncatedMarker, true}, {"count", items.size()}});
        break;
      }
      out.push_back(sanitize_progress_payload(items[i], limits, depth + 1));
    }
    return out;
  }
  if (v.is_object()) {
    if (depth >= limits.max_depth) return Object{{kTruncatedMarker, true}};
    Object out;
    size_t i = 0;
    for (const auto& [k, item] : v.as_object()) {
      if (i++ >= limits.max_items) {
        out[kTruncatedMarker] = true;
        break;
      }
      out[k] = sanitize_progress_payload(item, limits, depth + 1);
    }
    return out;
  }
  return v;
}

ProgressEvent make_progress_event(ProgressEventType type, const std::string& report_id,
                                  std::optional<Value> payload, std::optional<std::string> step_alias,
                                  std::uint64_t max_event_bytes) {
  ProgressEvent ev;
  ev.type = type;
  ev.report_id = report_id;
  ev.timestamp = iso8601_utc_now();
  if (step_alias && !step_alias->empty()) ev.step_alias = std::move(step_alias);
  if (payload) ev.payload = sanitize_progress_payload(*payload);

  if (encoded_size(ev) <= max_event_bytes) return ev;

  global_engine_stats().progress_events_truncated.fetch_add(1, std::memory_order_relaxed);
  ev.truncated = true;
  if (payload) {
    ev.payload = sanitize_progress_payload(*payload, SanitizeLimits{2, 5, 512});
  } else {
    ev.payload = Value{Object{{"message", "payload omitted"}}};
  }
  if (encoded_size(ev) <= max_event_bytes) return ev;

  ev.payload = Value{Object{{"message", "payload truncated due to size limits"}}};
  return ev;
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------

void JsonlProgressSink::publish(const std::string& channel, const ProgressEvent& event) {
  Object line_obj;
  line_obj["channel"] = channel;
  line_obj["event"] = event.to_json();
  const std::string line = jsonlite::to_json(line_obj) + "\n";

  std::lock_guard<std::mutex> lk(mu_);
  std::FILE* f = std::fopen(path_.c_str(), "a");
  if (!f) {
    ++write_failures_;
    return;
  }
  if (std::fwrite(line.data(), 1, line.size(), f) != line.size()) ++write_failures_;
  std::fclose(f);
}

std::uint64_t JsonlProgressSink::write_failures() const {
  std::lock_guard<std::mutex> lk(mu_);
  return write_failures_;
}

void MemoryProgressSink::publish(const std::string& channel, const ProgressEvent& event) {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.push_back(Entry{channel, event});
}

std::vector<MemoryProgressSink::Entry> MemoryProgressSink::entries() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_;
}

std::vector<ProgressEvent> MemoryProgressSink::events_for(const std::string& report_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<ProgressEvent> out;
  for (const auto& e : entries_) {
    if (e.event.report_id == report_id) out.push_back(e.event);
  }
  return out;
}

void MemoryProgressSink::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.clear();
}

void FanoutProgressSink::publish(const std::string& channel, const ProgressEvent& event) {
  for (const auto& sink : sinks_) {
    if (!sink) continue;
    try {
      sink->publish(channel, event);
    } catch (const std::exception& e) {
      log_warn("progress", "fanout_sink_failed", {{"channel", channel}, {"error", e.what()}});
    }
  }
}

// ---------------------------------------------------------------------------
// ProgressPublisher
// ---------------------------------------------------------------------------

ProgressPublisher::ProgressPublisher(std::shared_ptr<IProgressSink> sink, std::uint64_t max_event_bytes)
    : sink_(sink ? std::move(sink) : std::make_shared<NullProgressSink>()),
      max_event_bytes_(max_event_bytes == 0 ? 32768 : max_event_bytes) {}

ProgressEvent ProgressPublisher::publish(ProgressEventType type, const std::string& report_id,
                                         std::optional<Value> payload, std::optional<std::string> step_alias) {
  ProgressEvent ev = make_progress_event(type, report_id, std::move(payload), std::move(step_alias),
                                         max_event_bytes_);
  global_engine_stats().progress_events.fetch_add(1, std::memory_order_relaxed);
  try {
    sink_->publish(progress_channel(report_id), ev);
  } catch (const std::exception& e) {
    log_warn("progress", "publish_failed",
             {{"report_id", report_id}, {"type", to_string(type)}, {"error", e.what()}});
  }
  return ev;
}

}  // namespace vigil
