#pragma once

// vigil/http_executor.hpp — Executes one rendered HTTP step.
//
// CONTRACT:
//   - Any HTTP status, 4xx/5xx included, is a successful execution. Only the
//     assertion engine judges status codes.
//   - Request and response payloads leaving this component are redacted:
//     configured field names (case-insensitive, any depth, headers included)
//     become the redaction placeholder, secret values are masked inside
//     strings, and strings still carrying a {{secret.*}} template are
//     replaced whole.
//   - Bodies over max_response_size_bytes are truncated in the recorded
//     payload with truncated:true and a note. Truncation is never an error.
//   - Socket-level failures that survive the internal transport retries
//     throw TransportError, which carries the partial request payload and
//     metrics captured so far.
//
// The transport is an interface so tests can script responses and failures.
// CurlTransport is the production implementation (libcurl easy API).

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "vigil/config.hpp"
#include "vigil/context.hpp"
#include "vigil/jsonlite.hpp"
#include "vigil/policy_runtime.hpp"
#include "vigil/types.hpp"

namespace vigil {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// ---------------------------------------------------------------------------
// RequestSpec — a rendered request
// ---------------------------------------------------------------------------
struct RequestSpec {
  std::string method{"GET"};
  std::string url;
  HeaderList headers;
  HeaderList params;
  std::optional<jsonlite::Value> json;   // sent as application/json
  std::optional<std::string> body_text;  // sent raw

  // From {method?, url, headers?, params?, json?, body?}. An object or array
  // `body` is treated as `json`. Throws std::invalid_argument when the url is
  // missing or empty.
  static RequestSpec from_inputs(const jsonlite::Object& inputs);

  // url with params URL-encoded and appended.
  std::string full_url() const;
};

std::string url_encode(const std::string& s);

// "scheme://user@Host:port/path" -> "host:port". Falls back to the whole
// url, normalized, when there is no authority.
std::string host_key(const std::string& url);

// ---------------------------------------------------------------------------
// Transport seam
// ---------------------------------------------------------------------------
struct TransportRequest {
  std::string method;
  std::string url;
  HeaderList headers;
  std::string body;
  bool has_body{false};
  double timeout_seconds{30.0};
  bool follow_redirects{true};
  bool verify_tls{true};
};

struct TransportResponse {
  int status_code{0};
  HeaderList headers;
  std::string body;
};

struct TransportResult {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::string error;
  TransportResponse response;
};

class ITransport {
 public:
  virtual ~ITransport() = default;
  virtual TransportResult perform(const TransportRequest& request) = 0;
};

class CurlTransport final : public ITransport {
 public:
  CurlTransport();
  TransportResult perform(const TransportRequest& request) override;
};

// ---------------------------------------------------------------------------
// Step results
// ---------------------------------------------------------------------------
struct StepResult {
  jsonlite::Object request_payload;
  jsonlite::Object response_payload;
  jsonlite::Object metrics;
  jsonlite::Object context_data;  // {status_code, headers, body, json}
};

class TransportError : public std::runtime_error {
 public:
  TransportError(const std::string& what, ErrorCode code, jsonlite::Object request_payload,
                 jsonlite::Object metrics, jsonlite::Object response_payload = {})
      : std::runtime_error(what),
        code_(code),
        request_payload_(std::move(request_payload)),
        response_payload_(std::move(response_payload)),
        metrics_(std::move(metrics)) {}

  ErrorCode code() const { return code_; }
  const jsonlite::Object& request_payload() const { return request_payload_; }
  const jsonlite::Object& response_payload() const { return response_payload_; }
  const jsonlite::Object& metrics() const { return metrics_; }

 private:
  ErrorCode code_;
  jsonlite::Object request_payload_;
  jsonlite::Object response_payload_;
  jsonlite::Object metrics_;
};

class IStepExecutor {
 public:
  virtual ~IStepExecutor() = default;

  // `inputs` are already rendered. Sets context.current_response on success.
  virtual StepResult execute(const jsonlite::Object& inputs, ExecutionContext& context,
                             double timeout_seconds) = 0;
};

// ---------------------------------------------------------------------------
// Redaction
// ---------------------------------------------------------------------------
struct Redactor {
  std::vector<std::string> fields;  // lowercased
  std::string placeholder{"***"};
  std::vector<std::string> secret_values;  // textual forms; scalar leaves equal to one are masked

  Redactor(const EngineConfig& config, std::vector<std::string> secrets);

  jsonlite::Value apply(const jsonlite::Value& v) const;
  jsonlite::Object apply(const jsonlite::Object& o) const;
  std::string apply_string(const std::string& s) const;
  // Query parameters named in `fields` get the placeholder as their value.
  std::string apply_url(const std::string& url) const;
};

struct TruncatedText {
  std::string text;
  bool truncated{false};
  std::string note;
};

// Cuts at a UTF-8 boundary at or below limit bytes.
TruncatedText truncate_body(const std::string& text, std::uint64_t limit);

// ---------------------------------------------------------------------------
// HttpStepExecutor
// ---------------------------------------------------------------------------
class HttpStepExecutor final : public IStepExecutor {
 public:
  HttpStepExecutor(EngineConfig config, std::shared_ptr<ITransport> transport,
                   Sleeper sleeper = sleep_seconds);

  StepResult execute(const jsonlite::Object& inputs, ExecutionContext& context,
                     double timeout_seconds) override;

  // min(factor * 2^(attempt-1), transport_max_backoff_seconds)
  double transport_backoff(std::uint32_t attempt) const;
  bool should_retry_status(const std::string& method, int status_code) const;

 private:
  EngineConfig config_;
  std::shared_ptr<ITransport> transport_;
  Sleeper sleeper_;
};

}  // namespace vigil
