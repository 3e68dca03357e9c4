#pragma once

// vigil/audit.hpp — Append-only ledger of finished runs.
//
// INVARIANTS:
//   1. APPEND-ONLY: lines are never rewritten; the file is opened in "a" mode.
//   2. SEQUENTIAL: seq increases by one per successful append in a process.
//   3. CHAINED: prev is the "aud:" BLAKE3 digest of the previous line, or 64
//      zeros for the first line written by this process.
//   4. FAIL-SAFE: a failed write is counted and reported by append(); the run
//      outcome is never affected.

#include <cstdint>
#include <memory>
#include <string>

namespace vigil {

struct RunRecord {
  std::uint64_t sequence{0};
  std::string previous_digest;
  std::string report_id;
  std::string kind;          // "case" | "suite"
  std::string status;        // PASSED | FAILED | ERROR
  std::string policy_key;
  std::string policy_digest;
  std::uint32_t attempts_used{0};
  double duration_ms{0.0};
  std::string error_code;
  std::string worker_id;
  std::string node_id;
  std::uint64_t timestamp_unix_ms{0};
};

std::string run_record_to_json(const RunRecord& r);

class ImmutableAuditLog {
 public:
  // Empty path disables the log; append() then succeeds without writing.
  explicit ImmutableAuditLog(const std::string& path = "");
  ~ImmutableAuditLog();
  ImmutableAuditLog(const ImmutableAuditLog&) = delete;
  ImmutableAuditLog& operator=(const ImmutableAuditLog&) = delete;

  // Assigns sequence, previous_digest and timestamp in place.
  bool append(RunRecord& record);

  bool enabled() const;
  std::uint64_t entry_count() const;
  std::uint64_t failure_count() const;
  const std::string& path() const { return path_; }

 private:
  struct Impl;
  std::string path_;
  std::unique_ptr<Impl> impl_;
};

// Path from set_audit_log_path(), else VIGIL_AUDIT_LOG, else disabled.
ImmutableAuditLog& global_audit_log();

// Takes effect only before the first global_audit_log() call.
void set_audit_log_path(const std::string& path);

}  // namespace vigil
