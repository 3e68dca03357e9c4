#pragma once

// vigil/policy_runtime.hpp — Resource governor for policy-driven execution.
//
// CONCURRENCY:
//   - All state shared between runs lives in PolicySharedState, one instance
//     per policy key, owned by a PolicyStateRegistry.
//   - Host lookup takes a shared (reader) lock on the host map; the map is only
//     write-locked when a host is seen for the first time.
//   - Each host has its own mutex guarding its token bucket and circuit state,
//     so contention on one host never serializes another.
//
// SCOPE:
//   Enforcement is per process. Runs in other processes using the same policy
//   key keep their own state. PolicyStateRegistry is the seam where a shared
//   store backend would plug in.

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "vigil/policy.hpp"

namespace vigil {

// Monotonic time source in seconds. Injectable for tests.
using MonotonicClock = std::function<double()>;
double steady_seconds();

// Blocking wait in seconds. Injectable so retry tests never touch real clocks.
using Sleeper = std::function<void(double)>;
void sleep_seconds(double seconds);

// ---------------------------------------------------------------------------
// TokenBucket — per-host rate limiter state
// ---------------------------------------------------------------------------
// Capacity is max(rate, 1) tokens. consume() always reserves a token, letting
// the balance go negative, so concurrent callers receive staggered waits.
class TokenBucket {
 public:
  TokenBucket(double rate, double now);

  // Seconds the caller must wait before dispatching.
  double consume(double now);
  double rate() const { return rate_; }
  void set_rate(double rate);

 private:
  double rate_;
  double capacity_;
  double tokens_;
  double updated_at_;
};

// ---------------------------------------------------------------------------
// CircuitState — per-host breaker
// ---------------------------------------------------------------------------
struct CircuitState {
  std::uint32_t consecutive_failures{0};
  double window_start{0.0};
  std::optional<double> opened_until;
};

struct FailureOutcome {
  double cooldown_remaining{0.0};
  bool opened{false};
};

struct HostState {
  std::mutex mu;
  std::optional<TokenBucket> bucket;
  std::optional<CircuitState> circuit;  // created lazily on first failure
};

// ---------------------------------------------------------------------------
// ConcurrencyGate — counting semaphore bounding in-flight attempts
// ---------------------------------------------------------------------------
class ConcurrencyGate {
 public:
  explicit ConcurrencyGate(std::uint32_t limit) : limit_(limit) {}

  void acquire();
  void release();
  void set_limit(std::uint32_t limit);
  std::uint32_t in_use() const;
  std::uint32_t limit() const;

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::uint32_t limit_;
  std::uint32_t in_use_{0};
};

// Scoped concurrency permit. Releases on destruction, including unwinding.
class SlotPermit {
 public:
  SlotPermit() = default;
  explicit SlotPermit(std::shared_ptr<ConcurrencyGate> gate);
  ~SlotPermit();
  SlotPermit(SlotPermit&& other) noexcept;
  SlotPermit& operator=(SlotPermit&& other) noexcept;
  SlotPermit(const SlotPermit&) = delete;
  SlotPermit& operator=(const SlotPermit&) = delete;

  bool holds_slot() const { return static_cast<bool>(gate_); }
  void release();

 private:
  std::shared_ptr<ConcurrencyGate> gate_;
};

// ---------------------------------------------------------------------------
// PolicySharedState — everything shared by runs using one policy key
// ---------------------------------------------------------------------------
class PolicySharedState {
 public:
  std::shared_ptr<HostState> host(const std::string& host_key);
  std::shared_ptr<ConcurrencyGate> gate(std::uint32_t limit);
  size_t host_count() const;

 private:
  mutable std::shared_mutex hosts_mu_;
  std::unordered_map<std::string, std::shared_ptr<HostState>> hosts_;
  std::mutex gate_mu_;
  std::shared_ptr<ConcurrencyGate> gate_;
};

class PolicyStateRegistry {
 public:
  std::shared_ptr<PolicySharedState> state_for(const std::string& policy_key);
  void clear();
  size_t size() const;

 private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<PolicySharedState>> states_;
};

PolicyStateRegistry& global_policy_registry();

// Lowercased, trimmed host; empty becomes "default".
std::string normalize_host(const std::string& host);

// Pure backoff computation. attempt <= 0 yields 0.
//   exponential:        min(base * 2^(attempt-1), max)
//   exponential_jitter: that value scaled by a factor in [1-ratio, 1+ratio], clamped to [0, max]
//   full_jitter:        uniform in [0, that value]
double compute_backoff(const RetryBackoff& b, int attempt, std::mt19937_64& rng);

// ---------------------------------------------------------------------------
// PolicyRuntime — per-run view over the shared state of one policy
// ---------------------------------------------------------------------------
class PolicyRuntime {
 public:
  explicit PolicyRuntime(PolicySnapshot snapshot,
                         PolicyStateRegistry& registry = global_policy_registry(),
                         MonotonicClock clock = steady_seconds);

  const PolicySnapshot& snapshot() const { return snapshot_; }

  // Blocks until a slot is free. No-op permit when max_concurrency is unset.
  SlotPermit acquire_slot();

  // Non-blocking. Seconds to wait before dispatching to host; 0 when
  // per_host_qps is unset.
  double rate_limit_delay(const std::string& host);

  // 0 when the breaker for host is closed or its cooldown has elapsed.
  double circuit_remaining(const std::string& host);

  FailureOutcome record_failure(const std::string& host);
  void record_success(const std::string& host);

  double backoff_delay(int attempt);

 private:
  PolicySnapshot snapshot_;
  std::shared_ptr<PolicySharedState> state_;
  MonotonicClock clock_;
  std::mt19937_64 rng_;
};

}  // namespace vigil
