#pragma once

// vigil/types.hpp — Core data structures shared by the execution engine.
//
// OWNERSHIP:
//   - Report and its payloads are value types. A run owns its Report for the
//     whole attempt loop; the IReportStore collaborator receives copies.
//   - No raw pointer members in any public API type.

#include <cstdint>
#include <optional>
#include <string>

#include "vigil/jsonlite.hpp"

namespace vigil {

enum class ErrorCode {
  none,
  json_parse_error,
  json_duplicate_key,
  config_invalid,
  policy_invalid,
  transport_timeout,
  transport_connect,
  transport_dns,
  transport_other,
  circuit_open,
  missing_case,
  unexpected,
};

std::string to_string(ErrorCode code);

// Report lifecycle: PENDING -> RUNNING -> {PASSED, FAILED, ERROR}.
enum class ReportStatus {
  pending,
  running,
  passed,
  failed,
  error,
};

std::string to_string(ReportStatus status);
bool is_terminal(ReportStatus status);

enum class ReportKind {
  test_case,
  test_suite,
};

std::string to_string(ReportKind kind);

// The report entity mutated by the orchestrator. Storage is external; this
// struct is what an IReportStore persists.
struct Report {
  std::string id;
  ReportKind kind{ReportKind::test_case};
  std::string entity_id;              // case or suite identifier
  ReportStatus status{ReportStatus::pending};
  jsonlite::Object policy_snapshot;   // verbatim PolicySnapshot::to_json()
  std::string policy_digest;
  std::uint32_t retry_attempt{0};     // retries performed (attempts_used - 1)
  std::uint32_t attempts_used{0};
  std::optional<double> duration_ms;
  jsonlite::Value request_payload;
  jsonlite::Value response_payload;
  jsonlite::Object assertions_result; // {passed, results[], error?}
  jsonlite::Object metrics;
  std::uint64_t started_at_unix_ms{0};
  std::uint64_t finished_at_unix_ms{0};
};

jsonlite::Value report_to_value(const Report& r);
std::string report_to_json(const Report& r);

std::uint64_t unix_time_ms();

}  // namespace vigil
