#include "vigil/orchestrator.hpp"

#include <stdexcept>
#include <utility>

#include "vigil/log.hpp"
#include "vigil/observability.hpp"
#include "vigil/worker.hpp"

namespace vigil {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

namespace {

std::vector<std::string> string_list(const Value* v) {
  std::vector<std::string> out;
  if (!v || !v->is_array()) return out;
  for (const auto& item : v->as_array()) {
    if (item.is_string()) out.push_back(item.as_string());
  }
  return out;
}

const char* outcome_name(bool passed) { return passed ? "passed" : "assertions_failed"; }

Value assertion_list(const Value& a, const Value& b) {
  Array out;
  for (auto& def : normalize_assertions(a)) out.emplace_back(std::move(def));
  for (auto& def : normalize_assertions(b)) out.emplace_back(std::move(def));
  return out;
}

Value optional_number(const Object& metrics, const char* key) {
  auto it = metrics.find(key);
  if (it == metrics.end() || !it->second.is_number()) return Value{};
  return it->second;
}

double number_or_zero(const Object& metrics, const char* key) {
  auto it = metrics.find(key);
  return (it != metrics.end() && it->second.is_number()) ? it->second.as_number() : 0.0;
}

}  // namespace

// ---------------------------------------------------------------------------
// Definitions
// ---------------------------------------------------------------------------

CaseDefinition CaseDefinition::from_json(const Object& doc) {
  CaseDefinition c;
  c.id = jsonlite::get_string(doc, "id");
  c.inputs = jsonlite::get_object(doc, "inputs");
  if (const Value* a = doc.count("assertions") ? &doc.at("assertions") : nullptr) c.assertions = *a;
  c.variables = jsonlite::get_object(doc, "variables");
  c.tags = jsonlite::get_string_array(doc, "tags");
  return c;
}

SuiteDefinition SuiteDefinition::from_json(const Object& doc) {
  SuiteDefinition s;
  s.id = jsonlite::get_string(doc, "id");
  s.variables = jsonlite::get_object(doc, "variables");
  s.steps = jsonlite::get_array(doc, "steps");
  return s;
}

CaseCatalog case_catalog_from_json(const Value& doc) {
  CaseCatalog catalog;
  auto add = [&catalog](const Value& item, const std::string& fallback_id) {
    if (!item.is_object()) return;
    CaseDefinition c = CaseDefinition::from_json(item.as_object());
    if (c.id.empty()) c.id = fallback_id;
    if (!c.id.empty()) catalog[c.id] = std::move(c);
  };

  if (doc.is_array()) {
    for (const auto& item : doc.as_array()) add(item, "");
  } else if (doc.is_object()) {
    if (const Value* cases = doc.find("cases"); cases && cases->is_array()) {
      for (const auto& item : cases->as_array()) add(item, "");
    } else {
      for (const auto& [id, item] : doc.as_object()) add(item, id);
    }
  }
  return catalog;
}

void MemoryReportStore::save(const Report& report) {
  std::lock_guard<std::mutex> lk(mu_);
  saved_[report.id].push_back(report);
}

std::optional<Report> MemoryReportStore::latest(const std::string& report_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = saved_.find(report_id);
  if (it == saved_.end() || it->second.empty()) return std::nullopt;
  return it->second.back();
}

std::vector<Report> MemoryReportStore::history(const std::string& report_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = saved_.find(report_id);
  return it == saved_.end() ? std::vector<Report>{} : it->second;
}

PolicySnapshot effective_policy(const PolicySnapshot& policy, double default_timeout_seconds) {
  if (policy.enabled) return policy;
  return default_policy_snapshot(default_timeout_seconds);
}

// ---------------------------------------------------------------------------
// ExecutionOrchestrator
// ---------------------------------------------------------------------------

ExecutionOrchestrator::ExecutionOrchestrator(std::shared_ptr<IStepExecutor> executor,
                                             std::shared_ptr<IReportStore> store,
                                             std::shared_ptr<IProgressSink> sink, OrchestratorOptions options)
    : executor_(std::move(executor)),
      store_(store ? std::move(store) : std::make_shared<MemoryReportStore>()),
      progress_(std::move(sink), options.config.max_event_bytes),
      options_(std::move(options)) {
  if (!executor_) throw std::invalid_argument("orchestrator requires a step executor");
  if (!options_.sleeper) options_.sleeper = sleep_seconds;
  if (!options_.clock) options_.clock = steady_seconds;
  if (options_.worker_id.empty()) options_.worker_id = global_worker_identity().worker_id;
  if (options_.node_id.empty()) options_.node_id = global_worker_identity().node_id;
}

Report ExecutionOrchestrator::begin(const std::string& report_id, ReportKind kind, const std::string& entity_id,
                                    const PolicySnapshot& policy) {
  Report report;
  report.id = report_id;
  report.kind = kind;
  report.entity_id = entity_id;
  report.status = ReportStatus::running;
  report.policy_snapshot = policy.to_json();
  report.policy_digest = policy.digest();
  report.started_at_unix_ms = unix_time_ms();
  report.metrics["worker_id"] = options_.worker_id;
  report.metrics["policy_key"] = policy.key();
  report.metrics["policy_digest"] = report.policy_digest;
  store_->save(report);

  progress_.publish(ProgressEventType::started, report_id,
                    Value{Object{{"kind", to_string(kind)},
                                 {"entity_id", entity_id},
                                 {"policy_key", policy.key()},
                                 {"max_attempts", policy.retry_max_attempts}}});
  log_info("orchestrator", "run_started",
           {{"report_id", report_id}, {"kind", to_string(kind)}, {"policy_key", policy.key()}});
  return report;
}

void ExecutionOrchestrator::finish(Report& report, ReportKind kind, const std::string& policy_key,
                                   ErrorCode code) {
  report.finished_at_unix_ms = unix_time_ms();
  report.metrics["attempts_used"] = report.attempts_used;
  store_->save(report);

  Object payload{{"status", to_string(report.status)}, {"attempts_used", report.attempts_used}};
  if (report.duration_ms) payload["duration_ms"] = *report.duration_ms;
  if (code != ErrorCode::none) payload["error_code"] = to_string(code);
  progress_.publish(ProgressEventType::finished, report.id, Value{std::move(payload)});

  RunEvent ev;
  ev.report_id = report.id;
  ev.kind = to_string(kind);
  ev.status = to_string(report.status);
  ev.policy_key = policy_key;
  ev.worker_id = options_.worker_id;
  ev.attempts = report.attempts_used;
  ev.duration_ns = static_cast<std::uint64_t>(report.duration_ms.value_or(0.0) * 1e6);
  ev.error_code = to_string(code);
  emit_run_event(ev);

  RunRecord rec;
  rec.report_id = report.id;
  rec.kind = ev.kind;
  rec.status = ev.status;
  rec.policy_key = policy_key;
  rec.policy_digest = report.policy_digest;
  rec.attempts_used = report.attempts_used;
  rec.duration_ms = report.duration_ms.value_or(0.0);
  rec.error_code = ev.error_code;
  rec.worker_id = options_.worker_id;
  rec.node_id = options_.node_id;
  ImmutableAuditLog& audit = options_.audit_log ? *options_.audit_log : global_audit_log();
  if (!audit.append(rec)) {
    log_warn("orchestrator", "audit_append_failed", {{"report_id", report.id}, {"path", audit.path()}});
  }

  log_info("orchestrator", "run_finished",
           {{"report_id", report.id},
            {"status", ev.status},
            {"attempts_used", report.attempts_used},
            {"error_code", ev.error_code}});
}

void ExecutionOrchestrator::fail_unexpected(Report& report, ReportKind kind, const std::string& policy_key,
                                            const std::string& what) {
  log_error("orchestrator", "run_unexpected_error", {{"report_id", report.id}, {"error", what}});
  report.status = ReportStatus::error;
  report.assertions_result = Object{{"passed", false}, {"results", Array{}}, {"error", what}};
  report.metrics["status"] = "error";
  report.metrics["error"] = what;
  report.metrics["error_code"] = to_string(ErrorCode::unexpected);
  finish(report, kind, policy_key, ErrorCode::unexpected);
}

ExecutionOrchestrator::AttemptsResult ExecutionOrchestrator::run_attempts(
    const std::string& report_id, const std::optional<std::string>& alias, const Object& inputs,
    const Value& assertions, PolicyRuntime& runtime, ExecutionContext& context) {
  const PolicySnapshot& policy = runtime.snapshot();
  const std::uint32_t max_attempts = policy.retry_max_attempts == 0 ? 1 : policy.retry_max_attempts;
  const std::string host = host_key(jsonlite::get_string(inputs, "url"));
  auto& stats = global_engine_stats();

  AttemptsResult out;
  for (std::uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    out.attempts_used = attempt;
    stats.attempts.fetch_add(1, std::memory_order_relaxed);
    if (attempt > 1) stats.retries.fetch_add(1, std::memory_order_relaxed);
    const bool last = attempt == max_attempts;

    const double cooldown = runtime.circuit_remaining(host);
    if (cooldown > 0.0) {
      stats.circuit_blocks.fetch_add(1, std::memory_order_relaxed);
      out.history.push_back(Object{{"attempt", attempt},
                                   {"outcome", "blocked"},
                                   {"duration_ms", 0},
                                   {"error", "circuit open"}});
      progress_.publish(ProgressEventType::blocked, report_id,
                        Value{Object{{"attempt", attempt},
                                     {"host", host},
                                     {"cooldown_seconds", cooldown},
                                     {"attempts_remaining", max_attempts - attempt}}},
                        alias);
      log_warn("orchestrator", "circuit_blocked",
               {{"report_id", report_id}, {"host", host}, {"attempt", attempt}, {"cooldown_seconds", cooldown}});
      if (!last) {
        options_.sleeper(cooldown);
        continue;
      }
      out.outcome = Outcome::circuit_open;
      out.error = "Circuit breaker open for host " + host;
      out.error_code = ErrorCode::circuit_open;
      out.response_payload = Object{{"error", out.error}};
      out.metrics = Object{{"duration_ms", 0},
                           {"status", "error"},
                           {"response_size", 0},
                           {"error", out.error},
                           {"error_code", to_string(ErrorCode::circuit_open)}};
      return out;
    }

    SlotPermit permit = runtime.acquire_slot();
    const double wait = runtime.rate_limit_delay(host);
    if (wait > 0.0) {
      stats.rate_limit_waits.fetch_add(1, std::memory_order_relaxed);
      options_.sleeper(wait);
    }

    std::optional<StepResult> step;
    try {
      step = executor_->execute(inputs, context, policy.timeout_seconds);
    } catch (const TransportError& e) {
      permit.release();
      const FailureOutcome failure = runtime.record_failure(host);
      if (failure.opened) {
        stats.circuit_opens.fetch_add(1, std::memory_order_relaxed);
        log_warn("orchestrator", "circuit_opened",
                 {{"report_id", report_id}, {"host", host}, {"cooldown_seconds", failure.cooldown_remaining}});
      }
      out.history.push_back(Object{{"attempt", attempt},
                                   {"outcome", "transport_error"},
                                   {"duration_ms", optional_number(e.metrics(), "duration_ms")},
                                   {"error", e.what()}});
      if (!last) {
        const double delay = runtime.backoff_delay(static_cast<int>(attempt));
        progress_.publish(ProgressEventType::retrying, report_id,
                          Value{Object{{"attempt", attempt},
                                       {"reason", "transport_error"},
                                       {"error", e.what()},
                                       {"error_code", to_string(e.code())},
                                       {"delay_seconds", delay}}},
                          alias);
        log_warn("orchestrator", "attempt_retry",
                 {{"report_id", report_id}, {"attempt", attempt}, {"delay_seconds", delay}, {"error", e.what()}});
        options_.sleeper(delay);
        continue;
      }
      out.outcome = Outcome::transport_error;
      out.error = e.what();
      out.error_code = e.code();
      out.request_payload = e.request_payload();
      out.response_payload = e.response_payload().empty() ? Object{{"error", out.error}} : e.response_payload();
      out.metrics = e.metrics();
      return out;
    }
    permit.release();
    runtime.record_success(host);

    AssertionOutcome outcome = assertions_.evaluate(assertions, Value{step->context_data}, context);
    Object record{{"attempt", attempt},
                  {"outcome", outcome_name(outcome.passed)},
                  {"duration_ms", optional_number(step->metrics, "duration_ms")}};
    if (const Value* sc = step->context_data.count("status_code") ? &step->context_data.at("status_code") : nullptr) {
      record["status_code"] = *sc;
    }
    out.history.push_back(std::move(record));

    if (!outcome.passed && policy.retry_backoff.retry_on_assertions && !last) {
      const double delay = runtime.backoff_delay(static_cast<int>(attempt));
      progress_.publish(ProgressEventType::retrying, report_id,
                        Value{Object{{"attempt", attempt}, {"reason", "assertions_failed"}, {"delay_seconds", delay}}},
                        alias);
      options_.sleeper(delay);
      continue;
    }

    out.outcome = outcome.passed ? Outcome::passed : Outcome::assertions_failed;
    out.step = std::move(step);
    out.assertions = std::move(outcome);
    return out;
  }
  // max_attempts >= 1 and every path through the last attempt returns.
  throw std::logic_error("attempt loop exited without an outcome");
}

// ---------------------------------------------------------------------------
// run_case
// ---------------------------------------------------------------------------

Report ExecutionOrchestrator::run_case(const std::string& report_id, const CaseDefinition& test_case,
                                       const PolicySnapshot& requested, const ExecutionContext& seed) {
  const PolicySnapshot policy = effective_policy(requested, options_.config.request_timeout_seconds);
  const std::string policy_key = policy.key();
  Report report = begin(report_id, ReportKind::test_case, test_case.id, policy);
  bool finished = false;

  try {
    if (!policy.selects(test_case.tags)) {
      const std::string msg = "case excluded by policy tags";
      report.status = ReportStatus::error;
      report.assertions_result = Object{{"passed", false}, {"results", Array{}}, {"error", msg}};
      report.metrics["status"] = "error";
      report.metrics["error"] = msg;
      finished = true;
      finish(report, ReportKind::test_case, policy_key, ErrorCode::none);
      return report;
    }

    ExecutionContext context = seed;
    for (const auto& [k, v] : test_case.variables) context.variables.emplace(k, v);

    const Value rendered = context.render(Value{test_case.inputs});
    const Object inputs = rendered.is_object() ? rendered.as_object() : Object{};

    PolicyRuntime runtime(policy,
                          options_.registry ? *options_.registry : global_policy_registry(),
                          options_.clock);
    AttemptsResult r = run_attempts(report_id, std::nullopt, inputs, test_case.assertions, runtime, context);

    report.attempts_used = r.attempts_used;
    report.retry_attempt = r.attempts_used > 0 ? r.attempts_used - 1 : 0;

    Object metrics;
    ErrorCode code = ErrorCode::none;
    if (r.outcome == Outcome::transport_error || r.outcome == Outcome::circuit_open) {
      report.status = ReportStatus::error;
      report.request_payload = r.request_payload;
      report.response_payload = r.response_payload;
      report.assertions_result = Object{{"passed", false}, {"results", Array{}}, {"error", r.error}};
      metrics = r.metrics;
      if (!metrics.count("status")) metrics["status"] = "error";
      code = r.error_code;
    } else {
      report.status = r.outcome == Outcome::passed ? ReportStatus::passed : ReportStatus::failed;
      report.request_payload = r.step->request_payload;
      report.response_payload = r.step->response_payload;
      report.assertions_result = r.assertions->to_json();
      metrics = r.step->metrics;
      progress_.publish(ProgressEventType::assertion_result, report_id, Value{r.assertions->to_json()});
    }
    report.duration_ms = number_or_zero(metrics, "duration_ms");

    for (const auto& [k, v] : metrics) report.metrics[k] = v;
    report.metrics["attempt_history"] = std::move(r.history);

    finished = true;
    finish(report, ReportKind::test_case, policy_key, code);
    return report;
  } catch (const std::exception& e) {
    if (!finished) fail_unexpected(report, ReportKind::test_case, policy_key, e.what());
    throw;
  }
}

// ---------------------------------------------------------------------------
// run_suite
// ---------------------------------------------------------------------------

Report ExecutionOrchestrator::run_suite(const std::string& report_id, const SuiteDefinition& suite,
                                        const CaseCatalog& catalog, const PolicySnapshot& requested,
                                        const ExecutionContext& seed) {
  const PolicySnapshot policy = effective_policy(requested, options_.config.request_timeout_seconds);
  const std::string policy_key = policy.key();
  Report report = begin(report_id, ReportKind::test_suite, suite.id, policy);
  bool finished = false;

  try {
    ExecutionContext context = seed;
    for (const auto& [k, v] : suite.variables) context.variables.emplace(k, v);

    PolicyRuntime runtime(policy,
                          options_.registry ? *options_.registry : global_policy_registry(),
                          options_.clock);

    Array request_steps;
    Array response_steps;
    Array assertion_steps;
    Array metric_steps;
    Array history;
    double total_duration = 0.0;
    double total_response_size = 0.0;
    std::uint32_t attempts_total = 0;
    std::uint32_t steps_run = 0;
    bool overall_passed = true;
    bool any_evaluated = false;
    std::optional<std::string> overall_error;
    ErrorCode code = ErrorCode::none;

    for (size_t index = 0; index < suite.steps.size(); ++index) {
      const Value& raw = suite.steps[index];
      if (!raw.is_object()) continue;
      const Object& step = raw.as_object();

      std::string alias = jsonlite::get_string(step, "alias");
      if (alias.empty()) alias = "step_" + std::to_string(index + 1);

      Object base_inputs;
      Value base_assertions;
      Value case_id;
      std::vector<std::string> tags = string_list(step.count("tags") ? &step.at("tags") : nullptr);
      const std::string case_ref = jsonlite::get_string(step, "case_id");
      if (!case_ref.empty()) {
        auto it = catalog.find(case_ref);
        if (it == catalog.end()) {
          throw std::runtime_error("Referenced test case not found for suite execution: " + case_ref);
        }
        base_inputs = it->second.inputs;
        base_assertions = it->second.assertions;
        case_id = it->second.id;
        tags.insert(tags.end(), it->second.tags.begin(), it->second.tags.end());
      }

      if (!policy.selects(tags)) {
        progress_.publish(ProgressEventType::step_progress, report_id,
                          Value{Object{{"state", "skipped"}, {"case_id", case_id}, {"reason", "excluded by policy tags"}}},
                          alias);
        continue;
      }

      const Object merged = merge_inputs(base_inputs, jsonlite::get_object(step, "inputs"));

      if (const Value* vars = step.count("variables") ? &step.at("variables") : nullptr; vars && vars->is_object()) {
        const Value rendered_vars = context.render(*vars);
        for (const auto& [k, v] : rendered_vars.as_object()) context.variables[k] = v;
      }

      const Value step_assertions = assertion_list(
          base_assertions, step.count("assertions") ? step.at("assertions") : Value{});

      progress_.publish(ProgressEventType::step_progress, report_id,
                        Value{Object{{"state", "running"}, {"case_id", case_id}, {"index", index}}}, alias);

      const Value rendered = context.render(Value{merged});
      const Object inputs = rendered.is_object() ? rendered.as_object() : Object{};
      AttemptsResult r = run_attempts(report_id, alias, inputs, step_assertions, runtime, context);
      attempts_total += r.attempts_used;
      ++steps_run;
      for (auto& h : r.history) {
        h.as_object()["alias"] = alias;
        history.push_back(std::move(h));
      }

      if (r.outcome == Outcome::transport_error || r.outcome == Outcome::circuit_open) {
        log_error("orchestrator", "suite_step_failed",
                  {{"report_id", report_id}, {"alias", alias}, {"error", r.error}});
        request_steps.push_back(Object{{"alias", alias}, {"case_id", case_id}, {"request", r.request_payload}});
        response_steps.push_back(Object{{"alias", alias}, {"case_id", case_id}, {"response", r.response_payload}});
        assertion_steps.push_back(Object{{"alias", alias},
                                         {"case_id", case_id},
                                         {"passed", false},
                                         {"error", r.error},
                                         {"assertions", Array{}}});
        metric_steps.push_back(Object{{"alias", alias},
                                      {"case_id", case_id},
                                      {"duration_ms", optional_number(r.metrics, "duration_ms")},
                                      {"status", "error"},
                                      {"response_size", number_or_zero(r.metrics, "response_size")},
                                      {"attempts", r.attempts_used}});
        total_duration += number_or_zero(r.metrics, "duration_ms");
        total_response_size += number_or_zero(r.metrics, "response_size");
        progress_.publish(ProgressEventType::step_progress, report_id,
                          Value{Object{{"state", "error"}, {"case_id", case_id}, {"error", r.error}}}, alias);
        overall_passed = false;
        overall_error = r.error;
        code = r.error_code;
        break;
      }

      const StepResult& result = *r.step;
      const AssertionOutcome& outcome = *r.assertions;
      any_evaluated = true;
      request_steps.push_back(Object{{"alias", alias}, {"case_id", case_id}, {"request", result.request_payload}});
      response_steps.push_back(Object{{"alias", alias}, {"case_id", case_id}, {"response", result.response_payload}});
      Array results;
      for (const auto& item : outcome.results) results.emplace_back(item.to_json());
      assertion_steps.push_back(Object{{"alias", alias},
                                       {"case_id", case_id},
                                       {"passed", outcome.passed},
                                       {"assertions", std::move(results)}});
      metric_steps.push_back(Object{{"alias", alias},
                                    {"case_id", case_id},
                                    {"duration_ms", optional_number(result.metrics, "duration_ms")},
                                    {"status", jsonlite::get_string(result.metrics, "status")},
                                    {"response_size", optional_number(result.metrics, "response_size")},
                                    {"attempts", r.attempts_used}});
      total_duration += number_or_zero(result.metrics, "duration_ms");
      total_response_size += number_or_zero(result.metrics, "response_size");
      if (!outcome.passed) overall_passed = false;

      progress_.publish(ProgressEventType::step_progress, report_id,
                        Value{Object{{"state", "completed"},
                                     {"case_id", case_id},
                                     {"passed", outcome.passed},
                                     {"status_code", result.context_data.count("status_code")
                                                         ? result.context_data.at("status_code")
                                                         : Value{}}}},
                        alias);
      context.remember_step(alias, Value{result.context_data});
    }

    if (overall_error) {
      report.status = ReportStatus::error;
    } else {
      report.status = overall_passed ? ReportStatus::passed : ReportStatus::failed;
    }
    report.attempts_used = attempts_total;
    report.retry_attempt = attempts_total > steps_run ? attempts_total - steps_run : 0;
    report.duration_ms = total_duration;
    report.request_payload = Object{{"steps", std::move(request_steps)}};
    report.response_payload = Object{{"steps", std::move(response_steps)}};

    Object assertions_payload{{"passed", report.status == ReportStatus::passed},
                              {"steps", std::move(assertion_steps)}};
    if (overall_error) assertions_payload["error"] = *overall_error;
    report.assertions_result = assertions_payload;
    if (any_evaluated) {
      progress_.publish(ProgressEventType::assertion_result, report_id, Value{assertions_payload});
    }

    report.metrics["duration_ms"] = total_duration;
    report.metrics["response_size"] = total_response_size;
    report.metrics["status"] = report.status == ReportStatus::error ? "error" : "completed";
    report.metrics["steps"] = std::move(metric_steps);
    report.metrics["attempt_history"] = std::move(history);
    if (code != ErrorCode::none) report.metrics["error_code"] = to_string(code);

    finished = true;
    finish(report, ReportKind::test_suite, policy_key, code);
    return report;
  } catch (const std::exception& e) {
    if (!finished) fail_unexpected(report, ReportKind::test_suite, policy_key, e.what());
    throw;
  }
}

}  // namespace vigil
