#pragma once

// vigil/version.hpp — Version manifest for every persisted or streamed format.
//
// Any change to the shape of a report, a progress event, an audit line or
// the digest algorithm bumps the matching constant. Consumers compare these
// before reading data written by another build.

#include <cstdint>
#include <string>

#ifndef VIGIL_VERSION_STRING
#define VIGIL_VERSION_STRING "0.1.0"
#endif

namespace vigil {
namespace version {

constexpr const char* ENGINE_SEMVER = VIGIL_VERSION_STRING;

// Report JSON written by report_to_json() and persisted through IReportStore.
// Version 1: {id, entity_type, entity_id, status, policy_snapshot, policy_digest,
// retry_attempt, attempts_used, duration_ms, request_payload, response_payload,
// assertions_result, metrics, started_at_unix_ms, finished_at_unix_ms}.
constexpr uint32_t REPORT_FORMAT_VERSION = 1;

// Progress event framing: {type, report_id, timestamp, step_alias?, payload?,
// truncated?} on channel "report_progress:<id>".
constexpr uint32_t PROGRESS_FRAMING_VERSION = 1;

// Audit ledger lines (RunRecord).
constexpr uint32_t AUDIT_LOG_VERSION = 1;

// 1 = BLAKE3, 32-byte output, lowercase hex.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  std::string engine_semver{ENGINE_SEMVER};
  uint32_t report_format{REPORT_FORMAT_VERSION};
  uint32_t progress_framing{PROGRESS_FRAMING_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace vigil
