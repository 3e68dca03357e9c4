#pragma once

// vigil/observability.hpp — Engine statistics and run event emission.
//
// RunEvent is the observable unit: one per finished case or suite run. It is
//   - folded into the process-wide EngineStats,
//   - handed to an installed RunEventHook, or otherwise
//   - appended as one JSON line to the file named by VIGIL_EVENT_LOG.
// Emission never blocks the attempt loop beyond a short mutex hold.

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace vigil {

struct RunEvent {
  std::string report_id;
  std::string kind;           // "case" | "suite"
  std::string status;         // terminal report status
  std::string policy_key;
  std::string worker_id;
  std::uint32_t attempts{0};
  std::uint64_t duration_ns{0};
  std::string error_code;
};

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 40;  // covers up to ~6 days

  void record(std::uint64_t duration_ns);

  // p in [0.0, 1.0]. Returns microseconds, 0.0 with no samples.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  std::uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<std::uint64_t> count_{0};
  alignas(64) std::atomic<std::uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats — process-wide counters
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; the recent-runs ring uses a mutex.
class EngineStats {
 public:
  void record_run(const RunEvent& ev);
  std::string to_json() const;
  void reset();

  alignas(64) std::atomic<std::uint64_t> runs_total{0};
  alignas(64) std::atomic<std::uint64_t> runs_passed{0};
  alignas(64) std::atomic<std::uint64_t> runs_failed{0};
  alignas(64) std::atomic<std::uint64_t> runs_error{0};

  alignas(64) std::atomic<std::uint64_t> attempts{0};
  alignas(64) std::atomic<std::uint64_t> retries{0};
  alignas(64) std::atomic<std::uint64_t> transport_errors{0};
  alignas(64) std::atomic<std::uint64_t> transport_retries{0};

  alignas(64) std::atomic<std::uint64_t> circuit_opens{0};
  alignas(64) std::atomic<std::uint64_t> circuit_blocks{0};
  alignas(64) std::atomic<std::uint64_t> rate_limit_waits{0};
  alignas(64) std::atomic<std::uint64_t> slot_waits{0};

  alignas(64) std::atomic<std::uint64_t> assertions_evaluated{0};
  alignas(64) std::atomic<std::uint64_t> assertions_failed{0};

  alignas(64) std::atomic<std::uint64_t> progress_events{0};
  alignas(64) std::atomic<std::uint64_t> progress_events_truncated{0};

  LatencyHistogram run_latency;

  static constexpr size_t kMaxRecentRuns = 256;
  std::vector<RunEvent> recent_runs_snapshot() const;

 private:
  mutable std::mutex ring_mu_;
  std::vector<RunEvent> ring_buffer_;
  size_t ring_head_{0};
};

EngineStats& global_engine_stats();

// Non-blocking, fire-and-forget.
void emit_run_event(const RunEvent& ev);

using RunEventHook = void (*)(const RunEvent&);
void set_run_event_hook(RunEventHook hook);

}  // namespace vigil
