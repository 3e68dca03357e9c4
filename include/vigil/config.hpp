#pragma once

// vigil/config.hpp — Engine-wide configuration.
//
// Sources, lowest to highest precedence:
//   1. Compiled defaults (the member initializers below).
//   2. A JSON document (EngineConfig::from_json), typically --config <file>.
//   3. VIGIL_* environment variables (EngineConfig::from_env).
// Configuration is read once per process and passed by value into executors.

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "vigil/jsonlite.hpp"

namespace vigil {

constexpr uint32_t CONFIG_VERSION = 1;

struct EngineConfig {
  double request_timeout_seconds{30.0};
  std::uint64_t max_response_size_bytes{1024 * 1024};
  std::uint32_t transport_retry_attempts{3};
  double transport_backoff_factor{0.5};
  double transport_max_backoff_seconds{30.0};
  std::set<int> retry_statuses{429, 500, 502, 503, 504};
  std::set<std::string> retry_methods{"GET", "HEAD", "OPTIONS", "PUT", "DELETE", "POST", "PATCH"};
  std::vector<std::string> redact_fields{
      "authorization", "cookie", "set-cookie", "password", "token", "access_token",
      "refresh_token", "api_key", "x-api-key", "secret", "client_secret"};
  std::string redaction_placeholder{"***"};
  std::string progress_log;
  std::uint64_t max_event_bytes{32768};
  bool follow_redirects{true};
  bool verify_tls{true};

  static EngineConfig defaults() { return EngineConfig{}; }

  // Overlay recognized keys of `doc` on top of `base`. Unknown or mistyped
  // keys are ignored here; validate_config() reports them.
  static EngineConfig from_json(const jsonlite::Object& doc, EngineConfig base = defaults());

  // Overlay VIGIL_* environment variables on top of `base`.
  static EngineConfig from_env(EngineConfig base = defaults());

  jsonlite::Object to_json() const;
};

struct ConfigValidationResult {
  bool ok{true};
  uint32_t config_version{CONFIG_VERSION};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Never throws. Parse errors, type errors and out-of-range values are errors;
// unknown keys are warnings.
ConfigValidationResult validate_config(const std::string& json_text);
std::string config_validation_to_json(const ConfigValidationResult& r);

}  // namespace vigil
