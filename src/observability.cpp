#include "vigil/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "vigil/jsonlite.hpp"

namespace vigil {

namespace {

// bit_width(x) == floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::string fixed(double d, const char* fmt) {
  char buf[40];
  std::snprintf(buf, sizeof(buf), fmt, d);
  return buf;
}

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  std::uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  std::uint64_t target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  if (target == 0) target = 1;
  std::uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      // Midpoint of [2^(i-1), 2^i) us; bucket 0 reports 0.5us.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(256);
  const double p50 = percentile(0.50);
  const double p95 = percentile(0.95);
  const double p99 = percentile(0.99);
  out += "{\"count\":" + std::to_string(count_.load(std::memory_order_relaxed));
  out += ",\"mean_us\":" + fixed(mean_us(), "%.2f");
  out += ",\"p50_ms\":" + fixed(p50 / 1000.0, "%.3f");
  out += ",\"p95_ms\":" + fixed(p95 / 1000.0, "%.3f");
  out += ",\"p99_ms\":" + fixed(p99 / 1000.0, "%.3f");
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_run(const RunEvent& ev) {
  runs_total.fetch_add(1, std::memory_order_relaxed);
  if (ev.status == "PASSED") {
    runs_passed.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.status == "FAILED") {
    runs_failed.fetch_add(1, std::memory_order_relaxed);
  } else {
    runs_error.fetch_add(1, std::memory_order_relaxed);
  }
  run_latency.record(ev.duration_ns);

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentRuns) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
  }
  ring_head_ = (ring_head_ + 1) % kMaxRecentRuns;
}

std::vector<RunEvent> EngineStats::recent_runs_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentRuns) return ring_buffer_;
  // Oldest first.
  std::vector<RunEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % kMaxRecentRuns]);
  }
  return out;
}

void EngineStats::reset() {
  for (auto* c : {&runs_total, &runs_passed, &runs_failed, &runs_error, &attempts, &retries,
                  &transport_errors, &transport_retries, &circuit_opens, &circuit_blocks,
                  &rate_limit_waits, &slot_waits, &assertions_evaluated, &assertions_failed,
                  &progress_events, &progress_events_truncated}) {
    c->store(0, std::memory_order_relaxed);
  }
  std::lock_guard<std::mutex> lk(ring_mu_);
  ring_buffer_.clear();
  ring_head_ = 0;
}

std::string EngineStats::to_json() const {
  auto ld = [](const std::atomic<std::uint64_t>& a) {
    return std::to_string(a.load(std::memory_order_relaxed));
  };
  std::string out;
  out.reserve(1024);
  out += "{\"runs\":{\"total\":" + ld(runs_total);
  out += ",\"passed\":" + ld(runs_passed);
  out += ",\"failed\":" + ld(runs_failed);
  out += ",\"error\":" + ld(runs_error) + "}";

  out += ",\"attempts\":{\"total\":" + ld(attempts);
  out += ",\"retries\":" + ld(retries) + "}";

  out += ",\"transport\":{\"errors\":" + ld(transport_errors);
  out += ",\"internal_retries\":" + ld(transport_retries) + "}";

  out += ",\"policy\":{\"circuit_opens\":" + ld(circuit_opens);
  out += ",\"circuit_blocks\":" + ld(circuit_blocks);
  out += ",\"rate_limit_waits\":" + ld(rate_limit_waits);
  out += ",\"slot_waits\":" + ld(slot_waits) + "}";

  const std::uint64_t evaluated = assertions_evaluated.load(std::memory_order_relaxed);
  const std::uint64_t failed = assertions_failed.load(std::memory_order_relaxed);
  const double fail_rate = evaluated > 0 ? static_cast<double>(failed) / static_cast<double>(evaluated) : 0.0;
  out += ",\"assertions\":{\"evaluated\":" + std::to_string(evaluated);
  out += ",\"failed\":" + std::to_string(failed);
  out += ",\"failure_rate\":" + fixed(fail_rate, "%.6f") + "}";

  out += ",\"progress\":{\"events\":" + ld(progress_events);
  out += ",\"truncated\":" + ld(progress_events_truncated) + "}";

  out += ",\"latency\":" + run_latency.to_json();
  out += "}";
  return out;
}

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

namespace {
std::atomic<RunEventHook> g_event_hook{nullptr};
std::mutex g_event_log_mu;
}

void set_run_event_hook(RunEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_run_event(const RunEvent& ev) {
  global_engine_stats().record_run(ev);

  RunEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("VIGIL_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  jsonlite::Object o;
  o["report_id"] = ev.report_id;
  o["kind"] = ev.kind;
  o["status"] = ev.status;
  o["policy_key"] = ev.policy_key;
  o["worker_id"] = ev.worker_id;
  o["attempts"] = ev.attempts;
  o["duration_ns"] = ev.duration_ns;
  o["error_code"] = ev.error_code;
  const std::string line = jsonlite::to_json(o) + "\n";

  std::lock_guard<std::mutex> lk(g_event_log_mu);
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace vigil
