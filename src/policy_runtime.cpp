#include "vigil/policy_runtime.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <thread>

#include "vigil/observability.hpp"

namespace vigil {

double steady_seconds() {
  using namespace std::chrono;
  return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

void sleep_seconds(double seconds) {
  if (seconds <= 0.0) return;
  std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

std::string normalize_host(const std::string& host) {
  const auto b = host.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "default";
  const auto e = host.find_last_not_of(" \t\r\n");
  std::string out = host.substr(b, e - b + 1);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

// ---------------------------------------------------------------------------
// TokenBucket
// ---------------------------------------------------------------------------

TokenBucket::TokenBucket(double rate, double now)
    : rate_(std::max(rate, 1e-6)),
      capacity_(std::max(rate_, 1.0)),
      tokens_(capacity_),
      updated_at_(now) {}

void TokenBucket::set_rate(double rate) {
  rate_ = std::max(rate, 1e-6);
  capacity_ = std::max(rate_, 1.0);
  tokens_ = std::min(tokens_, capacity_);
}

double TokenBucket::consume(double now) {
  const double elapsed = now - updated_at_;
  if (elapsed > 0) {
    tokens_ = std::min(capacity_, tokens_ + elapsed * rate_);
    updated_at_ = now;
  }
  tokens_ -= 1.0;
  if (tokens_ >= 0.0) return 0.0;
  return -tokens_ / rate_;
}

// ---------------------------------------------------------------------------
// ConcurrencyGate / SlotPermit
// ---------------------------------------------------------------------------

void ConcurrencyGate::acquire() {
  std::unique_lock<std::mutex> lk(mu_);
  if (in_use_ >= limit_) global_engine_stats().slot_waits.fetch_add(1, std::memory_order_relaxed);
  cv_.wait(lk, [&] { return in_use_ < limit_; });
  ++in_use_;
}

void ConcurrencyGate::release() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (in_use_ > 0) --in_use_;
  }
  cv_.notify_one();
}

void ConcurrencyGate::set_limit(std::uint32_t limit) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    limit_ = std::max<std::uint32_t>(1, limit);
  }
  cv_.notify_all();
}

std::uint32_t ConcurrencyGate::in_use() const {
  std::lock_guard<std::mutex> lk(mu_);
  return in_use_;
}

std::uint32_t ConcurrencyGate::limit() const {
  std::lock_guard<std::mutex> lk(mu_);
  return limit_;
}

SlotPermit::SlotPermit(std::shared_ptr<ConcurrencyGate> gate) : gate_(std::move(gate)) {
  if (gate_) gate_->acquire();
}

SlotPermit::~SlotPermit() { release(); }

SlotPermit::SlotPermit(SlotPermit&& other) noexcept : gate_(std::move(other.gate_)) {}

SlotPermit& SlotPermit::operator=(SlotPermit&& other) noexcept {
  if (this != &other) {
    release();
    gate_ = std::move(other.gate_);
  }
  return *this;
}

void SlotPermit::release() {
  if (gate_) {
    gate_->release();
    gate_.reset();
  }
}

// ---------------------------------------------------------------------------
// PolicySharedState / PolicyStateRegistry
// ---------------------------------------------------------------------------

std::shared_ptr<HostState> PolicySharedState::host(const std::string& host_key) {
  {
    std::shared_lock<std::shared_mutex> lk(hosts_mu_);
    auto it = hosts_.find(host_key);
    if (it != hosts_.end()) return it->second;
  }
  std::unique_lock<std::shared_mutex> lk(hosts_mu_);
  auto& slot = hosts_[host_key];
  if (!slot) slot = std::make_shared<HostState>();
  return slot;
}

std::shared_ptr<ConcurrencyGate> PolicySharedState::gate(std::uint32_t limit) {
  std::lock_guard<std::mutex> lk(gate_mu_);
  if (!gate_) {
    gate_ = std::make_shared<ConcurrencyGate>(std::max<std::uint32_t>(1, limit));
  } else if (gate_->limit() != limit) {
    gate_->set_limit(limit);
  }
  return gate_;
}

size_t PolicySharedState::host_count() const {
  std::shared_lock<std::shared_mutex> lk(hosts_mu_);
  return hosts_.size();
}

std::shared_ptr<PolicySharedState> PolicyStateRegistry::state_for(const std::string& policy_key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto& slot = states_[policy_key];
  if (!slot) slot = std::make_shared<PolicySharedState>();
  return slot;
}

void PolicyStateRegistry::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  states_.clear();
}

size_t PolicyStateRegistry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return states_.size();
}

PolicyStateRegistry& global_policy_registry() {
  static PolicyStateRegistry inst;
  return inst;
}

// ---------------------------------------------------------------------------
// Backoff
// ---------------------------------------------------------------------------

double compute_backoff(const RetryBackoff& b, int attempt, std::mt19937_64& rng) {
  if (attempt <= 0) return 0.0;
  const int exp = std::min(attempt - 1, 62);
  const double computed = std::min(b.base_seconds * std::ldexp(1.0, exp), b.max_seconds);
  switch (b.strategy) {
    case BackoffStrategy::exponential:
      return computed;
    case BackoffStrategy::exponential_jitter: {
      if (b.jitter_ratio <= 0.0) return computed;
      std::uniform_real_distribution<double> dist(-b.jitter_ratio, b.jitter_ratio);
      return std::clamp(computed * (1.0 + dist(rng)), 0.0, b.max_seconds);
    }
    case BackoffStrategy::full_jitter: {
      if (computed <= 0.0) return 0.0;
      std::uniform_real_distribution<double> dist(0.0, computed);
      return dist(rng);
    }
  }
  return computed;
}

// ---------------------------------------------------------------------------
// PolicyRuntime
// ---------------------------------------------------------------------------

PolicyRuntime::PolicyRuntime(PolicySnapshot snapshot, PolicyStateRegistry& registry,
                             MonotonicClock clock)
    : snapshot_(std::move(snapshot)),
      state_(registry.state_for(snapshot_.key())),
      clock_(std::move(clock)),
      rng_(std::random_device{}()) {}

SlotPermit PolicyRuntime::acquire_slot() {
  if (!snapshot_.max_concurrency) return SlotPermit{};
  return SlotPermit{state_->gate(*snapshot_.max_concurrency)};
}

double PolicyRuntime::rate_limit_delay(const std::string& host) {
  if (!snapshot_.per_host_qps) return 0.0;
  auto hs = state_->host(normalize_host(host));
  std::lock_guard<std::mutex> lk(hs->mu);
  const double now = clock_();
  if (!hs->bucket) {
    hs->bucket.emplace(*snapshot_.per_host_qps, now);
  } else if (std::fabs(hs->bucket->rate() - *snapshot_.per_host_qps) > 1e-9) {
    hs->bucket->set_rate(*snapshot_.per_host_qps);
  }
  return hs->bucket->consume(now);
}

double PolicyRuntime::circuit_remaining(const std::string& host) {
  auto hs = state_->host(normalize_host(host));
  std::lock_guard<std::mutex> lk(hs->mu);
  if (!hs->circuit || !hs->circuit->opened_until) return 0.0;
  const double remaining = *hs->circuit->opened_until - clock_();
  if (remaining <= 0.0) {
    hs->circuit->opened_until.reset();
    return 0.0;
  }
  return remaining;
}

FailureOutcome PolicyRuntime::record_failure(const std::string& host) {
  auto hs = state_->host(normalize_host(host));
  std::lock_guard<std::mutex> lk(hs->mu);
  const double now = clock_();
  if (!hs->circuit) hs->circuit.emplace(CircuitState{0, now, std::nullopt});
  auto& c = *hs->circuit;

  if (now - c.window_start > static_cast<double>(snapshot_.circuit_breaker_window_seconds)) {
    c.consecutive_failures = 0;
    c.window_start = now;
  }
  if (c.consecutive_failures == 0) c.window_start = now;
  ++c.consecutive_failures;

  FailureOutcome out;
  if (c.consecutive_failures >= snapshot_.circuit_breaker_threshold) {
    c.consecutive_failures = 0;
    c.window_start = now;
    c.opened_until = now + snapshot_.retry_backoff.cooldown_seconds;
    out.opened = true;
  }
  if (c.opened_until && *c.opened_until > now) out.cooldown_remaining = *c.opened_until - now;
  return out;
}

void PolicyRuntime::record_success(const std::string& host) {
  auto hs = state_->host(normalize_host(host));
  std::lock_guard<std::mutex> lk(hs->mu);
  if (!hs->circuit) return;
  hs->circuit->consecutive_failures = 0;
  hs->circuit->opened_until.reset();
  hs->circuit->window_start = clock_();
}

double PolicyRuntime::backoff_delay(int attempt) {
  return compute_backoff(snapshot_.retry_backoff, attempt, rng_);
}

}  // namespace vigil
