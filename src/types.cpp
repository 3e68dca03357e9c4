#include "vigil/types.hpp"

#include <chrono>

namespace vigil {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::policy_invalid: return "policy_invalid";
    case ErrorCode::transport_timeout: return "transport_timeout";
    case ErrorCode::transport_connect: return "transport_connect";
    case ErrorCode::transport_dns: return "transport_dns";
    case ErrorCode::transport_other: return "transport_other";
    case ErrorCode::circuit_open: return "circuit_open";
    case ErrorCode::missing_case: return "missing_case";
    case ErrorCode::unexpected: return "unexpected";
  }
  return "";
}

std::string to_string(ReportStatus status) {
  switch (status) {
    case ReportStatus::pending: return "PENDING";
    case ReportStatus::running: return "RUNNING";
    case ReportStatus::passed: return "PASSED";
    case ReportStatus::failed: return "FAILED";
    case ReportStatus::error: return "ERROR";
  }
  return "";
}

bool is_terminal(ReportStatus status) {
  return status == ReportStatus::passed || status == ReportStatus::failed ||
         status == ReportStatus::error;
}

std::string to_string(ReportKind kind) {
  return kind == ReportKind::test_suite ? "suite" : "case";
}

jsonlite::Value report_to_value(const Report& r) {
  jsonlite::Object o;
  o["id"] = r.id;
  o["entity_type"] = to_string(r.kind);
  o["entity_id"] = r.entity_id;
  o["status"] = to_string(r.status);
  o["policy_snapshot"] = r.policy_snapshot;
  o["policy_digest"] = r.policy_digest;
  o["retry_attempt"] = r.retry_attempt;
  o["attempts_used"] = r.attempts_used;
  o["duration_ms"] = r.duration_ms ? jsonlite::Value{*r.duration_ms} : jsonlite::Value{};
  o["request_payload"] = r.request_payload;
  o["response_payload"] = r.response_payload;
  o["assertions_result"] = r.assertions_result;
  o["metrics"] = r.metrics;
  o["started_at_unix_ms"] = r.started_at_unix_ms;
  o["finished_at_unix_ms"] = r.finished_at_unix_ms;
  return o;
}

std::string report_to_json(const Report& r) {
  return jsonlite::to_json(report_to_value(r));
}

std::uint64_t unix_time_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());
}

}  // namespace vigil
