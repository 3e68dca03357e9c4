#pragma once

// vigil/policy.hpp — Immutable execution policy resolved once per run.
//
// A PolicySnapshot is plain data: it is serialized verbatim onto the report
// (to_json) and digested with BLAKE3 (digest) for audit. All shared mutable
// state keyed by a policy lives in PolicyRuntime (policy_runtime.hpp), keyed by
// PolicySnapshot::key().

#include <cstdint>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "vigil/jsonlite.hpp"

namespace vigil {

enum class BackoffStrategy {
  exponential,
  exponential_jitter,
  full_jitter,
};

std::string to_string(BackoffStrategy s);
std::optional<BackoffStrategy> parse_backoff_strategy(const std::string& s);

struct RetryBackoff {
  BackoffStrategy strategy{BackoffStrategy::exponential_jitter};
  double base_seconds{1.5};
  double max_seconds{30.0};
  double jitter_ratio{0.5};        // clamped to [0, 1]
  bool retry_on_assertions{false};
  double cooldown_seconds{30.0};   // circuit-breaker open duration
};

struct PolicySnapshot {
  static constexpr std::uint32_t kMaxAttempts = 10;
  static constexpr std::uint32_t kMaxPriority = 9;

  std::optional<std::string> id;
  std::string name{"default"};
  std::optional<std::uint32_t> max_concurrency;
  std::optional<double> per_host_qps;
  std::uint32_t priority{5};
  std::uint32_t retry_max_attempts{3};
  RetryBackoff retry_backoff;
  double timeout_seconds{30.0};
  std::uint32_t circuit_breaker_threshold{5};
  std::uint32_t circuit_breaker_window_seconds{60};
  std::set<std::string> tags_include;
  std::set<std::string> tags_exclude;
  bool enabled{true};

  // id when present, otherwise "default:<lowercased name>".
  std::string key() const;

  jsonlite::Object to_json() const;

  // BLAKE3 "pol:" digest of the canonical to_json() form.
  std::string digest() const;

  // Tag selection: excluded tags win; a non-empty include set requires overlap.
  bool selects(const std::vector<std::string>& tags) const;

  // Lenient: clamps every field into range and drops invalid optionals.
  // Overlapping include/exclude tags are resolved in favor of exclusion.
  static PolicySnapshot from_json(const jsonlite::Object& doc);

  // Strict: throws PolicyError listing every violation found by validate_policy().
  static PolicySnapshot from_json_strict(const jsonlite::Object& doc);
};

PolicySnapshot default_policy_snapshot(double timeout_seconds = 30.0);

struct PolicyValidation {
  bool ok{true};
  std::vector<std::string> errors;
};

// Reports every range/type violation without clamping.
PolicyValidation validate_policy(const jsonlite::Object& doc);

class PolicyError : public std::runtime_error {
 public:
  PolicyError(const std::string& what, std::vector<std::string> errors)
      : std::runtime_error(what), errors_(std::move(errors)) {}
  const std::vector<std::string>& errors() const { return errors_; }

 private:
  std::vector<std::string> errors_;
};

}  // namespace vigil
