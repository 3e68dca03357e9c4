#pragma once

// vigil/progress.hpp — Ordered lifecycle notifications for a run.
//
// Per report, events are published in causal order from the run's own
// thread:  started -> (step_progress | blocked | retrying)* -> assertion_result
// -> finished. Delivery is the sink's business; this layer only builds,
// sanitizes and hands over one event at a time.
//
// Size control:
//   - Payloads are sanitized to depth 4, 20 items per collection and 2048
//     characters per string.
//   - An event still larger than max_event_bytes is re-sanitized to depth 2,
//     5 items and 512 characters and flagged truncated. If that is still too
//     large the payload is replaced by a short message.

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "vigil/jsonlite.hpp"

namespace vigil {

enum class ProgressEventType {
  started,
  step_progress,
  blocked,
  retrying,
  assertion_result,
  finished,
};

std::string to_string(ProgressEventType type);

struct ProgressEvent {
  ProgressEventType type{ProgressEventType::started};
  std::string report_id;
  std::optional<std::string> step_alias;
  std::optional<jsonlite::Value> payload;
  std::string timestamp;  // ISO-8601 UTC
  bool truncated{false};

  jsonlite::Object to_json() const;
};

// "report_progress:<report_id>"
std::string progress_channel(const std::string& report_id);

struct SanitizeLimits {
  size_t max_depth{4};
  size_t max_items{20};
  size_t max_string_length{2048};
};

jsonlite::Value sanitize_progress_payload(const jsonlite::Value& v, const SanitizeLimits& limits = {},
                                          size_t depth = 0);

// Builds a sanitized event that fits in max_event_bytes of compact JSON.
ProgressEvent make_progress_event(ProgressEventType type, const std::string& report_id,
                                  std::optional<jsonlite::Value> payload,
                                  std::optional<std::string> step_alias,
                                  std::uint64_t max_event_bytes);

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------
class IProgressSink {
 public:
  virtual ~IProgressSink() = default;
  virtual void publish(const std::string& channel, const ProgressEvent& event) = 0;
};

// Appends {"channel":..., "event":{...}} lines to a file.
class JsonlProgressSink final : public IProgressSink {
 public:
  explicit JsonlProgressSink(std::string path) : path_(std::move(path)) {}
  void publish(const std::string& channel, const ProgressEvent& event) override;
  std::uint64_t write_failures() const;

 private:
  std::string path_;
  mutable std::mutex mu_;
  std::uint64_t write_failures_{0};
};

class MemoryProgressSink final : public IProgressSink {
 public:
  struct Entry {
    std::string channel;
    ProgressEvent event;
  };

  void publish(const std::string& channel, const ProgressEvent& event) override;
  std::vector<Entry> entries() const;
  std::vector<ProgressEvent> events_for(const std::string& report_id) const;
  void clear();

 private:
  mutable std::mutex mu_;
  std::vector<Entry> entries_;
};

class NullProgressSink final : public IProgressSink {
 public:
  void publish(const std::string&, const ProgressEvent&) override {}
};

class FanoutProgressSink final : public IProgressSink {
 public:
  explicit FanoutProgressSink(std::vector<std::shared_ptr<IProgressSink>> sinks) : sinks_(std::move(sinks)) {}
  void publish(const std::string& channel, const ProgressEvent& event) override;

 private:
  std::vector<std::shared_ptr<IProgressSink>> sinks_;
};

// ---------------------------------------------------------------------------
// ProgressPublisher — the publish-one-event primitive used by the orchestrator
// ---------------------------------------------------------------------------
// A sink that throws is logged and counted; the run continues.
class ProgressPublisher {
 public:
  ProgressPublisher(std::shared_ptr<IProgressSink> sink, std::uint64_t max_event_bytes = 32768);

  ProgressEvent publish(ProgressEventType type, const std::string& report_id,
                        std::optional<jsonlite::Value> payload = std::nullopt,
                        std::optional<std::string> step_alias = std::nullopt);

 private:
  std::shared_ptr<IProgressSink> sink_;
  std::uint64_t max_event_bytes_;
};

}  // namespace vigil
