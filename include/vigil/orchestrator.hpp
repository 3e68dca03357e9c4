#pragma once

// vigil/orchestrator.hpp — Drives a case or suite run to a terminal report.
//
// ATTEMPT LOOP (per case, and per suite step), up to retry_max_attempts:
//   1. circuit check: blocked attempts sleep out the cooldown, or end the run
//      as ERROR when no attempt is left
//   2. concurrency slot (scoped, released before any backoff sleep)
//   3. per-host rate-limit delay
//   4. dispatch; a TransportError is retried with policy backoff, then ends
//      the run as ERROR with the partial payloads it carried
//   5. assertions; a failure is retried only with retry_on_assertions
//
// REPORT:
//   The last attempt's payloads are persisted. metrics.attempt_history keeps
//   one compact record per attempt. The store sees the report when it turns
//   RUNNING and when it reaches a terminal state.
//
// EVENT ORDER (one report, one thread):
//   started -> (step_progress | blocked | retrying)* -> assertion_result -> finished
//   assertion_result is published once, for the outcome that is persisted.
//   A run that never evaluated assertions goes straight to finished.
//
// Expected failures never escape. Any other std::exception marks the report
// ERROR, publishes finished and is rethrown to the caller.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "vigil/assertions.hpp"
#include "vigil/audit.hpp"
#include "vigil/config.hpp"
#include "vigil/context.hpp"
#include "vigil/http_executor.hpp"
#include "vigil/jsonlite.hpp"
#include "vigil/policy.hpp"
#include "vigil/policy_runtime.hpp"
#include "vigil/progress.hpp"
#include "vigil/types.hpp"

namespace vigil {

// ---------------------------------------------------------------------------
// Definitions
// ---------------------------------------------------------------------------
struct CaseDefinition {
  std::string id;
  jsonlite::Object inputs;      // {method, url, headers, params, json|body}
  jsonlite::Value assertions;   // any shape accepted by normalize_assertions()
  jsonlite::Object variables;
  std::vector<std::string> tags;

  static CaseDefinition from_json(const jsonlite::Object& doc);
};

struct SuiteDefinition {
  std::string id;
  jsonlite::Object variables;
  // Each step: {alias?, case_id?, inputs?, variables?, assertions?, tags?}.
  // Non-object entries are ignored.
  jsonlite::Array steps;

  static SuiteDefinition from_json(const jsonlite::Object& doc);
};

using CaseCatalog = std::map<std::string, CaseDefinition>;

// A list of case documents, {"cases":[...]}, or an object keyed by case id.
CaseCatalog case_catalog_from_json(const jsonlite::Value& doc);

// ---------------------------------------------------------------------------
// Persistence hook
// ---------------------------------------------------------------------------
class IReportStore {
 public:
  virtual ~IReportStore() = default;
  virtual void save(const Report& report) = 0;
};

// Keeps every saved version, in order.
class MemoryReportStore final : public IReportStore {
 public:
  void save(const Report& report) override;
  std::optional<Report> latest(const std::string& report_id) const;
  std::vector<Report> history(const std::string& report_id) const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, std::vector<Report>> saved_;
};

// ---------------------------------------------------------------------------
// ExecutionOrchestrator
// ---------------------------------------------------------------------------
struct OrchestratorOptions {
  EngineConfig config;
  Sleeper sleeper{sleep_seconds};
  MonotonicClock clock{steady_seconds};
  PolicyStateRegistry* registry{nullptr};  // nullptr: global_policy_registry()
  ImmutableAuditLog* audit_log{nullptr};   // nullptr: global_audit_log()
  std::string worker_id;                   // empty: global_worker_identity()
  std::string node_id;
};

class ExecutionOrchestrator {
 public:
  ExecutionOrchestrator(std::shared_ptr<IStepExecutor> executor, std::shared_ptr<IReportStore> store,
                        std::shared_ptr<IProgressSink> sink, OrchestratorOptions options = {});

  // Thread-safe: runs share nothing but the policy registry, the store and
  // the sink, each of which synchronizes itself.
  Report run_case(const std::string& report_id, const CaseDefinition& test_case,
                  const PolicySnapshot& policy, const ExecutionContext& seed = {});

  // Throws (after marking the report ERROR) when a step references a case
  // missing from `catalog`.
  Report run_suite(const std::string& report_id, const SuiteDefinition& suite, const CaseCatalog& catalog,
                   const PolicySnapshot& policy, const ExecutionContext& seed = {});

 private:
  enum class Outcome { passed, assertions_failed, transport_error, circuit_open };

  struct AttemptsResult {
    Outcome outcome{Outcome::passed};
    std::uint32_t attempts_used{0};
    std::optional<StepResult> step;
    std::optional<AssertionOutcome> assertions;
    std::string error;
    ErrorCode error_code{ErrorCode::none};
    jsonlite::Object request_payload;   // set for failed outcomes
    jsonlite::Object response_payload;
    jsonlite::Object metrics;
    jsonlite::Array history;
  };

  AttemptsResult run_attempts(const std::string& report_id, const std::optional<std::string>& alias,
                              const jsonlite::Object& inputs, const jsonlite::Value& assertions,
                              PolicyRuntime& runtime, ExecutionContext& context);

  Report begin(const std::string& report_id, ReportKind kind, const std::string& entity_id,
               const PolicySnapshot& policy);
  void finish(Report& report, ReportKind kind, const std::string& policy_key, ErrorCode code);
  void fail_unexpected(Report& report, ReportKind kind, const std::string& policy_key, const std::string& what);

  std::shared_ptr<IStepExecutor> executor_;
  std::shared_ptr<IReportStore> store_;
  ProgressPublisher progress_;
  OrchestratorOptions options_;
  AssertionEngine assertions_;
};

// A disabled policy resolves to the default snapshot.
PolicySnapshot effective_policy(const PolicySnapshot& policy, double default_timeout_seconds);

}  // namespace vigil
