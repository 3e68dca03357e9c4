#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "vigil/assertions.hpp"
#include "vigil/audit.hpp"
#include "vigil/config.hpp"
#include "vigil/context.hpp"
#include "vigil/diff.hpp"
#include "vigil/hash.hpp"
#include "vigil/http_executor.hpp"
#include "vigil/jsonlite.hpp"
#include "vigil/jsonpath.hpp"
#include "vigil/log.hpp"
#include "vigil/observability.hpp"
#include "vigil/orchestrator.hpp"
#include "vigil/policy.hpp"
#include "vigil/policy_runtime.hpp"
#include "vigil/progress.hpp"
#include "vigil/version.hpp"
#include "vigil/worker.hpp"

namespace fs = std::filesystem;

using vigil::jsonlite::Array;
using vigil::jsonlite::Object;
using vigil::jsonlite::Value;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ============================================================================
// Fakes
// ============================================================================

// Manual clock; the sleeper advances it instead of blocking.
struct FakeTime {
  double now{1000.0};
  std::vector<double> sleeps;

  vigil::MonotonicClock clock() {
    return [this] { return now; };
  }
  vigil::Sleeper sleeper() {
    return [this](double s) {
      sleeps.push_back(s);
      now += s + 0.001;
    };
  }
};

struct ScriptStep {
  bool transport_error{false};
  int status{200};
  Value json;
};

ScriptStep respond(int status, Value json = Value{}) { return ScriptStep{false, status, std::move(json)}; }
ScriptStep network_failure() { return ScriptStep{true, 0, Value{}}; }

// Plays back a fixed script of responses and transport failures.
class ScriptedExecutor final : public vigil::IStepExecutor {
 public:
  explicit ScriptedExecutor(std::deque<ScriptStep> script) : script_(std::move(script)) {}

  vigil::StepResult execute(const Object& inputs, vigil::ExecutionContext& context, double) override {
    seen_inputs.push_back(inputs);
    ScriptStep step = respond(200);
    if (!script_.empty()) {
      step = script_.front();
      script_.pop_front();
    }
    const std::string url = vigil::jsonlite::get_string(inputs, "url");
    if (step.transport_error) {
      throw vigil::TransportError("connection refused", vigil::ErrorCode::transport_connect,
                                  Object{{"method", "GET"}, {"url", url}},
                                  Object{{"duration_ms", 3}, {"status", "network_error"}, {"response_size", 0}});
    }
    vigil::StepResult r;
    r.request_payload = Object{{"method", vigil::jsonlite::get_string(inputs, "method", "GET")}, {"url", url}};
    r.response_payload = Object{{"status_code", step.status}, {"json", step.json}};
    r.metrics = Object{{"duration_ms", 5}, {"status", "completed"}, {"response_size", 2}, {"status_code", step.status}};
    r.context_data = Object{{"status_code", step.status},
                            {"headers", Object{}},
                            {"body", vigil::jsonlite::to_json(step.json)},
                            {"json", step.json}};
    context.set_current_response(Value{r.context_data});
    return r;
  }

  std::vector<Object> seen_inputs;

 private:
  std::deque<ScriptStep> script_;
};

class ScriptedTransport final : public vigil::ITransport {
 public:
  explicit ScriptedTransport(std::deque<vigil::TransportResult> script) : script_(std::move(script)) {}

  vigil::TransportResult perform(const vigil::TransportRequest& request) override {
    requests.push_back(request);
    if (script_.empty()) return ok(200, "");
    auto r = script_.front();
    script_.pop_front();
    return r;
  }

  static vigil::TransportResult ok(int status, std::string body, vigil::HeaderList headers = {}) {
    vigil::TransportResult r;
    r.ok = true;
    r.response.status_code = status;
    r.response.body = std::move(body);
    r.response.headers = std::move(headers);
    return r;
  }

  static vigil::TransportResult failed(vigil::ErrorCode code, std::string error) {
    vigil::TransportResult r;
    r.error_code = code;
    r.error = std::move(error);
    return r;
  }

  std::vector<vigil::TransportRequest> requests;

 private:
  std::deque<vigil::TransportResult> script_;
};

class ThrowingSink final : public vigil::IProgressSink {
 public:
  void publish(const std::string&, const vigil::ProgressEvent&) override { throw std::runtime_error("sink down"); }
};

vigil::ImmutableAuditLog& no_audit() {
  static vigil::ImmutableAuditLog log("");
  return log;
}

// Deterministic policy: exponential backoff, small base.
vigil::PolicySnapshot test_policy(int attempts, Object extra = {}) {
  Object doc{{"name", "test"},
             {"retry_max_attempts", attempts},
             {"retry_backoff", Object{{"strategy", "exponential"}, {"base_seconds", 0.1}, {"max_seconds", 1.0}}}};
  for (auto& [k, v] : extra) doc[k] = v;
  return vigil::PolicySnapshot::from_json(doc);
}

struct Harness {
  FakeTime time;
  vigil::PolicyStateRegistry registry;
  std::shared_ptr<ScriptedExecutor> executor;
  std::shared_ptr<vigil::MemoryReportStore> store = std::make_shared<vigil::MemoryReportStore>();
  std::shared_ptr<vigil::MemoryProgressSink> sink = std::make_shared<vigil::MemoryProgressSink>();
  std::unique_ptr<vigil::ExecutionOrchestrator> orchestrator;

  explicit Harness(std::deque<ScriptStep> script)
      : executor(std::make_shared<ScriptedExecutor>(std::move(script))) {
    vigil::OrchestratorOptions opts;
    opts.sleeper = time.sleeper();
    opts.clock = time.clock();
    opts.registry = &registry;
    opts.audit_log = &no_audit();
    opts.worker_id = "w-test";
    opts.node_id = "n-test";
    orchestrator = std::make_unique<vigil::ExecutionOrchestrator>(executor, store, sink, opts);
  }

  std::vector<std::string> event_types(const std::string& report_id) const {
    std::vector<std::string> out;
    for (const auto& ev : sink->events_for(report_id)) out.push_back(vigil::to_string(ev.type));
    return out;
  }
};

vigil::CaseDefinition status_case(int expected_status) {
  vigil::CaseDefinition c;
  c.id = "case-1";
  c.inputs = Object{{"method", "GET"}, {"url", "http://api.test/health"}};
  c.assertions = Array{Object{{"operator", "status_code"}, {"expected", expected_status}}};
  return c;
}

Value response_ctx(int status, Value json) {
  return Object{{"status_code", status}, {"headers", Object{}}, {"body", ""}, {"json", std::move(json)}};
}

// ============================================================================
// Phase 1: JSON model & hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(vigil::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(vigil::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string data = "{\"a\":1}";
  expect(vigil::policy_digest(data) != vigil::audit_chain_digest(data), "pol and aud domains must differ");
  expect(vigil::policy_digest(data) == vigil::hash_domain("pol:", data), "policy digest uses pol: domain");
}

void test_json_strict_parse() {
  std::optional<vigil::jsonlite::JsonError> err;
  vigil::jsonlite::parse_value("{\"a\":1,\"a\":2}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key rejected");
  err.reset();
  vigil::jsonlite::parse_value("{\"a\":1} x", &err);
  expect(err && err->code == "json_parse_error", "trailing data rejected");
  err.reset();
  const Value v = vigil::jsonlite::parse_value("{\"n\":-7,\"d\":1.5}", &err);
  expect(!err, "valid document parses");
  expect(v.find("n")->is_int() && v.find("n")->as_int() == -7, "negative integers stay integral");
  expect(v.find("d")->is_double(), "fractions become doubles");
}

void test_values_equal_numeric() {
  using vigil::jsonlite::values_equal;
  expect(values_equal(Value{1}, Value{1.0}), "int and double compare numerically");
  expect(!values_equal(Value{true}, Value{1}), "bool never equals a number");
  expect(values_equal(Object{{"a", Array{1, 2}}}, Object{{"a", Array{1, 2.0}}}), "structural equality");
  expect(!values_equal(Array{1, 2}, Array{2, 1}), "arrays are ordered");
}

// ============================================================================
// Phase 2: Policy snapshot
// ============================================================================

void test_policy_defaults() {
  const auto p = vigil::PolicySnapshot::from_json(Object{});
  expect(p.name == "default", "default name");
  expect(p.priority == 5 && p.retry_max_attempts == 3, "default priority and attempts");
  expect(p.retry_backoff.strategy == vigil::BackoffStrategy::exponential_jitter, "default strategy");
  expect(p.retry_backoff.base_seconds == 1.5 && p.retry_backoff.max_seconds == 30.0, "default backoff bounds");
  expect(p.circuit_breaker_threshold == 5 && p.circuit_breaker_window_seconds == 60, "default breaker");
  expect(!p.max_concurrency && !p.per_host_qps, "no concurrency or qps limit by default");
  expect(p.key() == "default:default", "default key");
}

void test_policy_lenient_clamping() {
  const auto p = vigil::PolicySnapshot::from_json(Object{
      {"id", "pol-1"},
      {"retry_max_attempts", 50},
      {"priority", -3},
      {"max_concurrency", -1},
      {"per_host_qps", 0},
      {"timeout_seconds", 0.2},
      {"retry_backoff", Object{{"base_seconds", 5}, {"max_seconds", 2}, {"jitter_ratio", 3}}},
      {"tags_include", Array{"smoke", "slow"}},
      {"tags_exclude", Array{"slow"}}});
  expect(p.retry_max_attempts == 10, "attempts clamped to 10");
  expect(p.priority == 0, "priority clamped to 0");
  expect(!p.max_concurrency, "negative concurrency dropped");
  expect(!p.per_host_qps, "non-positive qps dropped");
  expect(p.timeout_seconds == 1.0, "timeout at least 1s");
  expect(p.retry_backoff.max_seconds == 5.0, "max_seconds raised to base");
  expect(p.retry_backoff.jitter_ratio == 1.0, "jitter clamped to 1");
  expect(p.tags_include.size() == 1 && p.tags_include.contains("smoke"), "overlap resolved toward exclusion");
  expect(p.key() == "pol-1", "id is the key");
}

void test_policy_strict_validation() {
  const Object doc{{"retry_max_attempts", 0},
                   {"retry_backoff", Object{{"strategy", "linear"}}},
                   {"tags_include", Array{"a"}},
                   {"tags_exclude", Array{"a"}}};
  const auto v = vigil::validate_policy(doc);
  expect(!v.ok, "invalid policy reported");
  expect(v.errors.size() == 3, "every violation reported");
  bool threw = false;
  try {
    vigil::PolicySnapshot::from_json_strict(doc);
  } catch (const vigil::PolicyError& e) {
    threw = true;
    expect(e.errors().size() == 3, "PolicyError carries all errors");
  }
  expect(threw, "strict parse throws PolicyError");
  expect(vigil::validate_policy(Object{{"name", "ok"}, {"retry_max_attempts", 4}}).ok, "valid policy passes");
}

void test_policy_digest_and_tags() {
  const auto a = vigil::PolicySnapshot::from_json(Object{{"name", "A"}});
  const auto b = vigil::PolicySnapshot::from_json(Object{{"name", "A"}, {"retry_max_attempts", 4}});
  expect(a.digest().size() == 64, "digest is 64 hex chars");
  expect(a.digest() == vigil::PolicySnapshot::from_json(a.to_json()).digest(), "to_json round-trips digest");
  expect(a.digest() != b.digest(), "field change changes digest");

  const auto p = vigil::PolicySnapshot::from_json(
      Object{{"tags_include", Array{"smoke"}}, {"tags_exclude", Array{"flaky"}}});
  expect(p.selects({"smoke"}), "included tag selected");
  expect(!p.selects({"smoke", "flaky"}), "excluded tag wins");
  expect(!p.selects({"other"}), "include set requires overlap");
  expect(!p.selects({}), "untagged case not selected with include set");
}

// ============================================================================
// Phase 3: Policy runtime
// ============================================================================

void test_backoff_monotonic_and_capped() {
  vigil::RetryBackoff b;
  b.strategy = vigil::BackoffStrategy::exponential;
  b.base_seconds = 1.5;
  b.max_seconds = 30.0;
  std::mt19937_64 rng(7);
  double prev = 0.0;
  for (int attempt = 1; attempt <= 10; ++attempt) {
    const double d = vigil::compute_backoff(b, attempt, rng);
    expect(d >= prev, "exponential backoff is non-decreasing");
    expect(d <= b.max_seconds, "backoff never exceeds max_seconds");
    prev = d;
  }
  expect(vigil::compute_backoff(b, 1, rng) == 1.5, "first backoff is base");
  expect(vigil::compute_backoff(b, 0, rng) == 0.0, "attempt 0 yields 0");
}

void test_backoff_jitter_bounds() {
  vigil::RetryBackoff b;
  b.base_seconds = 2.0;
  b.max_seconds = 10.0;
  b.jitter_ratio = 0.5;
  std::mt19937_64 rng(42);
  for (int i = 0; i < 200; ++i) {
    b.strategy = vigil::BackoffStrategy::exponential_jitter;
    const double j = vigil::compute_backoff(b, 2, rng);
    expect(j >= 2.0 && j <= 6.0, "exponential_jitter within +/- ratio");
    b.strategy = vigil::BackoffStrategy::full_jitter;
    const double f = vigil::compute_backoff(b, 4, rng);
    expect(f >= 0.0 && f <= 10.0, "full_jitter within [0, capped]");
  }
}

void test_circuit_breaker_per_host() {
  FakeTime time;
  vigil::PolicyStateRegistry registry;
  auto policy = test_policy(3, Object{{"circuit_breaker_threshold", 3},
                                      {"retry_backoff", Object{{"cooldown_seconds", 10}}}});
  vigil::PolicyRuntime rt(policy, registry, time.clock());

  expect(!rt.record_failure("a.test").opened, "first failure keeps breaker closed");
  expect(!rt.record_failure("a.test").opened, "second failure keeps breaker closed");
  const auto third = rt.record_failure("a.test");
  expect(third.opened, "threshold reached opens breaker");
  expect(third.cooldown_remaining == 10.0, "cooldown starts at cooldown_seconds");
  expect(rt.circuit_remaining("a.test") > 0.0, "host A blocked");
  expect(rt.circuit_remaining("b.test") == 0.0, "host B unaffected");

  time.now += 10.5;
  expect(rt.circuit_remaining("a.test") == 0.0, "breaker eligible after cooldown");
}

void test_circuit_success_resets() {
  FakeTime time;
  vigil::PolicyStateRegistry registry;
  auto policy = test_policy(3, Object{{"circuit_breaker_threshold", 2}});
  vigil::PolicyRuntime rt(policy, registry, time.clock());
  rt.record_failure("h");
  rt.record_success("h");
  expect(!rt.record_failure("h").opened, "success resets the failure count");
  expect(rt.record_failure("h").opened, "two consecutive failures open");
  rt.record_success("h");
  expect(rt.circuit_remaining("h") == 0.0, "success closes an open breaker");
}

void test_circuit_window_expiry() {
  FakeTime time;
  vigil::PolicyStateRegistry registry;
  auto policy = test_policy(3, Object{{"circuit_breaker_threshold", 2}, {"circuit_breaker_window_seconds", 5}});
  vigil::PolicyRuntime rt(policy, registry, time.clock());
  rt.record_failure("h");
  time.now += 6.0;
  expect(!rt.record_failure("h").opened, "failures outside the window do not accumulate");
}

void test_state_shared_by_policy_key() {
  FakeTime time;
  vigil::PolicyStateRegistry registry;
  auto policy = test_policy(3, Object{{"id", "shared"}, {"circuit_breaker_threshold", 1}});
  vigil::PolicyRuntime first(policy, registry, time.clock());
  vigil::PolicyRuntime second(policy, registry, time.clock());
  first.record_failure("h");
  expect(second.circuit_remaining("h") > 0.0, "runs with one policy key share breaker state");

  auto other = test_policy(3, Object{{"id", "other"}});
  vigil::PolicyRuntime third(other, registry, time.clock());
  expect(third.circuit_remaining("h") == 0.0, "other policy keys are independent");
  expect(registry.size() == 2, "one shared state per policy key");
  registry.clear();
  expect(registry.size() == 0, "registry cleared");
}

void test_rate_limit_delay() {
  FakeTime time;
  vigil::PolicyStateRegistry registry;
  auto policy = test_policy(1, Object{{"per_host_qps", 2}});
  vigil::PolicyRuntime rt(policy, registry, time.clock());
  expect(rt.rate_limit_delay("h") == 0.0, "first token free");
  expect(rt.rate_limit_delay("h") == 0.0, "burst up to capacity");
  const double wait = rt.rate_limit_delay("h");
  expect(wait > 0.49 && wait < 0.51, "third call waits 1/qps");
  expect(rt.rate_limit_delay("other") == 0.0, "other host has its own bucket");
  expect(registry.state_for(policy.key())->host_count() == 2, "one host state per host");
  time.now += 2.0;
  expect(rt.rate_limit_delay("h") == 0.0, "bucket refills over time");

  auto unlimited = test_policy(1);
  vigil::PolicyRuntime free_rt(unlimited, registry, time.clock());
  for (int i = 0; i < 10; ++i) expect(free_rt.rate_limit_delay("h") == 0.0, "no qps means no delay");
}

void test_concurrency_slots_bounded() {
  vigil::PolicyStateRegistry registry;
  auto policy = test_policy(1, Object{{"id", "bounded"}, {"max_concurrency", 2}});
  std::atomic<int> in_flight{0};
  std::atomic<int> peak{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&] {
      vigil::PolicyRuntime rt(policy, registry);
      auto permit = rt.acquire_slot();
      const int now = ++in_flight;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      --in_flight;
    });
  }
  for (auto& t : threads) t.join();
  expect(peak.load() <= 2, "no more than max_concurrency slots in use");
  expect(peak.load() >= 1, "slots were acquired");
}

void test_slot_released_on_exception() {
  vigil::PolicyStateRegistry registry;
  auto policy = test_policy(1, Object{{"id", "unwind"}, {"max_concurrency", 1}});
  vigil::PolicyRuntime rt(policy, registry);
  try {
    auto permit = rt.acquire_slot();
    expect(permit.holds_slot(), "bounded policy hands out a real permit");
    throw std::runtime_error("boom");
  } catch (const std::runtime_error&) {
  }
  auto gate = registry.state_for("unwind")->gate(1);
  expect(gate->in_use() == 0, "permit released during unwinding");
  expect(gate->limit() == 1, "gate limit follows max_concurrency");

  vigil::PolicyRuntime unbounded(test_policy(1), registry);
  expect(!unbounded.acquire_slot().holds_slot(), "no limit means a no-op permit");
}

// ============================================================================
// Phase 4: Execution context
// ============================================================================

void test_render_typed_and_embedded() {
  vigil::ExecutionContext ctx;
  ctx.variables = Object{{"id", 42}, {"name", "ada"}, {"none", nullptr}, {"list", Array{1, 2, 3}}};
  expect(ctx.render(Value{"{{ variables.id }}"}).is_int(), "whole placeholder keeps type");
  expect(ctx.render(Value{"/users/{{variables.id}}"}).as_string() == "/users/42", "embedded is stringified");
  expect(ctx.render(Value{"x{{ none }}y"}).as_string() == "xy", "null embeds as empty");
  expect(ctx.render(Value{"{{ missing.path }}"}).as_string() == "{{ missing.path }}", "unresolved stays literal");
  expect(ctx.render(Value{"{{ list.-1 }}"}).as_int() == 3, "negative index from the end");
  const Value nested = ctx.render(Object{{"a", Array{"{{name}}", 7}}});
  expect(nested.find("a")->as_array()[0].as_string() == "ada", "renders inside containers");
  expect(nested.find("a")->as_array()[1].as_int() == 7, "non-string leaves pass through");
}

void test_render_roots() {
  vigil::ExecutionContext ctx;
  ctx.environment = Object{{"base", "http://api.test"}};
  ctx.secrets = Object{{"token", "s3cr3t"}};
  ctx.dataset_row = Object{{"user", "bob"}};
  ctx.remember_step("login", Object{{"status_code", 200}, {"json", Object{{"items", Array{Object{{"id", 9}}}}}}});
  ctx.set_current_response(Object{{"status_code", 201}});
  expect(ctx.render(Value{"{{env.base}}/x"}).as_string() == "http://api.test/x", "env root");
  expect(ctx.render(Value{"{{secret.token}}"}).as_string() == "s3cr3t", "secret root");
  expect(ctx.render(Value{"{{row.user}}"}).as_string() == "bob", "row root");
  expect(ctx.render(Value{"{{prev.login.status_code}}"}).as_int() == 200, "prev root");
  expect(ctx.render(Value{"{{steps.login.jsonpath('$.items[0].id')}}"}).as_int() == 9, "jsonpath segment");
  expect(ctx.render(Value{"{{response.status_code}}"}).as_int() == 201, "response root");
  expect(ctx.secret_values().size() == 1, "secret values collected");
}

void test_merge_inputs_one_level() {
  const Object base{{"headers", Object{{"a", "1"}, {"b", "2"}}}, {"url", "http://x"}, {"json", Object{{"k", Object{{"deep", 1}}}}}};
  const Object over{{"headers", Object{{"b", "3"}}}, {"url", "http://y"}, {"json", Object{{"k", Object{{"other", 2}}}}}};
  const Object merged = vigil::merge_inputs(base, over);
  const Value h{merged.at("headers")};
  expect(h.find("a")->as_string() == "1" && h.find("b")->as_string() == "3", "nested dict updated key by key");
  expect(merged.at("url").as_string() == "http://y", "scalars replaced");
  const Value k = *Value{merged.at("json")}.find("k");
  expect(!k.find("deep") && k.find("other"), "update is one level deep");
}

// ============================================================================
// Phase 5: JSONPath
// ============================================================================

void test_jsonpath_subset() {
  const Value doc = Object{{"store", Object{{"book", Array{Object{{"title", "A"}, {"price", 8}},
                                                          Object{{"title", "B"}, {"price", 12}},
                                                          Object{{"title", "C"}, {"price", 20}}}}}}};
  expect(vigil::jsonpath::query("$.store.book[0].title", doc).as_string() == "A", "child and index");
  expect(vigil::jsonpath::query("$.store.book[-1].title", doc).as_string() == "C", "negative index");
  expect(vigil::jsonpath::query("$..title", doc).as_array().size() == 3, "recursive descent");
  expect(vigil::jsonpath::query("$.store.book[?(@.price > 10)].title", doc).as_array().size() == 2, "filter");
  expect(vigil::jsonpath::query("$.store.book[0:2].price", doc).as_array().size() == 2, "slice");
  expect(vigil::jsonpath::query("$.missing", doc).is_null(), "no match is null");
  std::string err;
  vigil::jsonpath::find_all("$.store[", doc, &err);
  expect(!err.empty(), "malformed expression reports an error");
}

// ============================================================================
// Phase 6: Assertion engine
// ============================================================================

vigil::AssertionOutcome eval(const Value& defs, const Value& response = response_ctx(200, Object{{"id", 1}})) {
  vigil::ExecutionContext ctx;
  return vigil::AssertionEngine{}.evaluate(defs, response, ctx);
}

void test_assertions_empty() {
  expect(eval(Array{}).passed && eval(Array{}).results.empty(), "empty list passes with no results");
  expect(eval(Value{}).passed && eval(Value{}).results.empty(), "null list passes with no results");
}

void test_assertions_jsonpath_equals() {
  const auto ok = eval(Array{Object{{"operator", "jsonpath_equals"}, {"path", "$.id"}, {"expected", 1}}});
  expect(ok.passed, "jsonpath $.id equals 1");
  const auto miss = eval(Array{Object{{"operator", "jsonpath_equals"}, {"path", "$.missing"}, {"expected", 1}}});
  expect(!miss.passed, "missing path fails");
  expect(miss.results[0].actual.is_null(), "missing path resolves to null");
  expect(miss.results[0].path && *miss.results[0].path == "$.missing", "path recorded");
  const auto bad = eval(Array{Object{{"operator", "jsonpath_contains"}, {"path", "$.["}, {"expected", 1}}});
  expect(!bad.passed && bad.results[0].message->rfind("Invalid jsonpath expression", 0) == 0,
         "malformed path fails with message");
}

void test_assertions_numeric_rules() {
  const auto b = eval(Array{Object{{"operator", "gt"}, {"actual", true}, {"expected", 0}}});
  expect(!b.passed, "boolean actual fails gt");
  expect(*b.results[0].message == "Numeric comparison does not accept boolean values", "boolean type message");
  expect(eval(Array{Object{{"operator", "gt"}, {"actual", "10"}, {"expected", 9.5}}}).passed, "numeric strings coerce");
  expect(eval(Array{Object{{"operator", "lt"}, {"actual", 2.0}, {"expected", 3}}}).passed, "lt passes");
  const auto s = eval(Array{Object{{"operator", "lt"}, {"actual", "abc"}, {"expected", 3}}});
  expect(!s.passed && s.results[0].message->find("requires numeric") != std::string::npos, "non-numeric fails");
}

void test_assertions_length() {
  const auto frac = eval(Array{Object{{"operator", "length"}, {"actual", "abc"}, {"expected", "3.5"}}});
  expect(!frac.passed, "fractional expected length fails");
  expect(*frac.results[0].message == "Expected length must be an integer", "fractional length message");
  expect(eval(Array{Object{{"operator", "length"}, {"actual", "abc"}, {"expected", "3.0"}}}).passed,
         "integral decimal string accepted");
  expect(eval(Array{Object{{"operator", "length"}, {"actual", Array{1, 2}}, {"expected", 2}}}).passed, "list length");
  expect(eval(Array{Object{{"operator", "length"}, {"actual", "h\xC3\xA9"}, {"expected", 2}}}).passed,
         "length counts code points");
  const auto num = eval(Array{Object{{"operator", "length"}, {"actual", 5}, {"expected", 1}}});
  expect(!num.passed && num.results[0].message->find("got int") != std::string::npos, "unsized actual fails");
}

void test_assertions_contains_and_regex() {
  expect(eval(Array{Object{{"operator", "contains"}, {"actual", "hello world"}, {"expected", "world"}}}).passed,
         "substring containment");
  expect(eval(Array{Object{{"operator", "contains"}, {"actual", Array{1, 2, 3}}, {"expected", 2}}}).passed,
         "list membership");
  expect(eval(Array{Object{{"operator", "not_contains"}, {"actual", Array{1, 2}}, {"expected", 5}}}).passed,
         "not_contains passes");
  expect(eval(Array{Object{{"operator", "contains"}, {"actual", 4}, {"expected", 4}}}).passed, "falls back to equality");
  expect(eval(Array{Object{{"operator", "regex"}, {"actual", "order-123"}, {"expected", "\\d+"}}}).passed,
         "regex searches, not full match");
  const auto bad = eval(Array{Object{{"operator", "regex_match"}, {"actual", "x"}, {"expected", "("}}});
  expect(!bad.passed && bad.results[0].message->rfind("Invalid regex pattern", 0) == 0, "invalid regex fails");
  const auto types = eval(Array{Object{{"operator", "regex"}, {"actual", 5}, {"expected", "5"}}});
  expect(!types.passed, "regex requires strings");
}

void test_assertions_regex_subject_bound() {
  Value response = response_ctx(200, Value{});
  response.as_object()["body"] = std::string(200000, 'a');
  const auto big = eval(Array{Object{{"operator", "regex_match"}, {"actual", "{{response.body}}"}, {"expected", "(a|b)*c"}}},
                        response);
  expect(!big.passed, "oversized subject fails");
  expect(big.results[0].message->find("4096-byte limit") != std::string::npos, "size limit named in message");

  Value small = response_ctx(200, Value{});
  small.as_object()["body"] = std::string(1000, 'a') + "c";
  expect(eval(Array{Object{{"operator", "regex"}, {"actual", "{{response.body}}"}, {"expected", "(a|b)*c"}}}, small).passed,
         "subject under the limit is matched");
}

void test_assertions_totality() {
  const auto unknown = eval(Array{Object{{"operator", "between"}}});
  expect(!unknown.passed, "unknown operator fails");
  expect(unknown.results[0].op == "between", "unknown operator named");
  expect(*unknown.results[0].message == "Unsupported assertion operator 'between'", "unknown operator message");

  const auto missing = eval(Array{Object{{"expected", 1}}});
  expect(missing.results[0].op == "unknown", "missing operator reported as unknown");
  expect(*missing.results[0].message == "Assertion operator is required", "missing operator message");

  const auto disabled = eval(Array{Object{{"operator", "equals"}, {"enabled", false}, {"actual", 1}, {"expected", 2}}});
  expect(disabled.passed && disabled.results[0].passed, "disabled assertion passes");
  expect(*disabled.results[0].message == "Assertion disabled; skipped", "disabled message");
}

void test_assertions_status_names_and_messages() {
  const auto r = eval(Array{Object{{"operator", " Status_Code "}, {"expected", 201}, {"message", "expected created"}},
                            Object{{"name", "ok"}, {"operator", "status_code"}, {"expected", 200}}});
  expect(!r.passed, "any failure fails the outcome");
  expect(r.results[0].name == "assertion_0", "default name");
  expect(*r.results[0].message == "expected created", "custom message overrides default");
  expect(r.results[1].name == "ok" && r.results[1].passed, "named assertion passes");
  expect(!r.results[1].message, "passing result has no message");
}

void test_assertions_diff_on_failure_only() {
  const auto fail = eval(Array{Object{{"operator", "equals"}, {"actual", Object{{"a", 1}}}, {"expected", Object{{"a", 2}}}}});
  expect(fail.results[0].diff.has_value(), "diff attached on failure");
  const Value& entries = *fail.results[0].diff->find("entries");
  expect(entries.as_array().size() == 1, "one diff entry");
  expect(entries.as_array()[0].find("path")->as_string() == "$.a", "diff path");
  const auto pass = eval(Array{Object{{"operator", "equals"}, {"actual", Object{{"a", 1}}}, {"expected", Object{{"a", 1}}}}});
  expect(!pass.results[0].diff, "no diff when passing");
}

void test_assertions_templated_operands() {
  const auto r = eval(Array{Object{{"operator", "equals"}, {"actual", "{{ response.json.id }}"}, {"expected", 1}}});
  expect(r.passed, "actual rendered from the response");
}

void test_assertions_normalization() {
  expect(vigil::normalize_assertions(Object{{"status_code", 200}}).size() == 1, "shorthand object");
  expect(vigil::normalize_assertions(Object{{"items", Array{Object{{"operator", "equals"}}, 5}}}).size() == 1,
         "items list, non-objects dropped");
  const auto shorthand = vigil::normalize_assertions(Object{{"status_code", 200}});
  expect(shorthand[0].at("operator").as_string() == "status_code", "shorthand operator");
  expect(shorthand[0].at("expected").as_int() == 200, "shorthand expected");
}

// ============================================================================
// Phase 7: Diff
// ============================================================================

void test_diff_entries_and_paths() {
  const Value expected = Object{{"a", 1}, {"b", Array{1, 2}}, {"odd key", true}};
  const Value actual = Object{{"a", "1"}, {"b", Array{1}}, {"c", nullptr}};
  const auto entries = vigil::diff_json(expected, actual);
  expect(entries.size() == 4, "four differences");
  expect(entries[0].path == "$['odd key']" && entries[0].change == vigil::DiffChange::removed, "removed first");
  expect(entries[1].path == "$.c" && entries[1].change == vigil::DiffChange::added, "added next");
  expect(entries[2].path == "$.a" && entries[2].change == vigil::DiffChange::type, "type change");
  expect(entries[3].path == "$.b[1]" && entries[3].change == vigil::DiffChange::removed, "array tail removed");

  const auto text = vigil::format_diff(entries);
  expect(text && text->find("@@ $.a") != std::string::npos, "text has hunk headers");
  expect(text->find("- type: number") != std::string::npos, "type lines");
  expect(!vigil::format_diff({}).has_value(), "no text for no entries");
}

void test_diff_limits() {
  Array big_a, big_b;
  for (int i = 0; i < 400; ++i) {
    big_a.push_back(i);
    big_b.push_back(i + 1);
  }
  const auto entries = vigil::diff_json(big_a, big_b);
  expect(entries.size() == 250, "entry count capped");
  const auto text = vigil::format_diff(entries, 500);
  expect(text && text->size() < 600, "text capped");
  expect(text->find("... diff truncated") != std::string::npos, "truncation marker");
}

// ============================================================================
// Phase 8: HTTP step executor
// ============================================================================

vigil::HttpStepExecutor make_executor(std::shared_ptr<ScriptedTransport> transport, std::vector<double>* sleeps,
                                      vigil::EngineConfig config = {}) {
  return vigil::HttpStepExecutor(config, transport, [sleeps](double s) { sleeps->push_back(s); });
}

void test_executor_redaction() {
  auto transport = std::make_shared<ScriptedTransport>(std::deque<vigil::TransportResult>{ScriptedTransport::ok(
      200, "{\"access_token\":\"zzz\",\"data\":\"s3cr3t-x\"}", {{"set-cookie", "sid=1"}, {"x-req", "r1"}})});
  std::vector<double> sleeps;
  auto exec = make_executor(transport, &sleeps);
  vigil::ExecutionContext ctx;
  ctx.secrets = Object{{"api", "s3cr3t"}};
  const Object inputs{{"method", "post"},
                      {"url", "http://api.test/login"},
                      {"headers", Object{{"Authorization", "Bearer abc"}, {"X-Trace", "ok"}}},
                      {"json", Object{{"password", "pw"}, {"nested", Object{{"token", "t"}}}, {"note", "uses s3cr3t"},
                                      {"tpl", "{{ secret.api }}"}}}};
  const auto r = exec.execute(inputs, ctx, 5.0);
  const Value req{r.request_payload};
  expect(req.find("method")->as_string() == "POST", "method uppercased");
  expect(req.find("headers")->find("Authorization")->as_string() == "***", "auth header redacted");
  expect(req.find("headers")->find("X-Trace")->as_string() == "ok", "other headers kept");
  const Value* json = req.find("json");
  expect(json->find("password")->as_string() == "***", "password redacted");
  expect(json->find("nested")->find("token")->as_string() == "***", "nested field redacted");
  expect(json->find("note")->as_string() == "uses ***", "secret value masked inside strings");
  expect(json->find("tpl")->as_string() == "***", "secret template replaced whole");

  const Value resp{r.response_payload};
  expect(resp.find("headers")->find("set-cookie")->as_string() == "***", "response header redacted");
  expect(resp.find("json")->find("access_token")->as_string() == "***", "response field redacted");
  expect(resp.find("json")->find("data")->as_string() == "***-x", "response secret masked");
  expect(r.context_data.at("json").find("access_token")->as_string() == "zzz", "context keeps raw data");
  expect(ctx.current_response.has_value(), "current response installed");

  const auto& sent = transport->requests.at(0);
  expect(sent.timeout_seconds == 5.0, "policy timeout applied");
  bool content_type = false;
  for (const auto& [k, v] : sent.headers) content_type |= (k == "Content-Type" && v == "application/json");
  expect(content_type, "JSON content type added");
  expect(sent.has_body && sent.body.find("\"password\":\"pw\"") != std::string::npos, "raw body sent");
}

void test_executor_params_and_truncation() {
  auto transport = std::make_shared<ScriptedTransport>(
      std::deque<vigil::TransportResult>{ScriptedTransport::ok(404, "0123456789ABCDEF")});
  std::vector<double> sleeps;
  vigil::EngineConfig config;
  config.max_response_size_bytes = 10;
  auto exec = make_executor(transport, &sleeps, config);
  vigil::ExecutionContext ctx;
  const auto r = exec.execute(Object{{"url", "http://h/x"}, {"params", Object{{"q", "a b"}, {"n", 1}}}}, ctx, 1.0);
  expect(transport->requests.at(0).url == "http://h/x?n=1&q=a%20b", "params encoded and appended");
  const Value body = *Value{r.response_payload}.find("body");
  expect(body.find("truncated")->as_bool(), "oversized body flagged");
  expect(body.find("text")->as_string() == "0123456789", "body cut at cap");
  expect(body.find("note") != nullptr, "truncation note");
  expect(r.context_data.at("body").as_string().size() == 16, "context keeps full body");
  expect(r.metrics.at("status").as_string() == "completed", "4xx is still completed");
  expect(r.metrics.at("status_code").as_int() == 404, "status recorded");
}

void test_executor_retries_status() {
  auto transport = std::make_shared<ScriptedTransport>(std::deque<vigil::TransportResult>{
      ScriptedTransport::ok(503, ""), ScriptedTransport::ok(200, "{}")});
  std::vector<double> sleeps;
  auto exec = make_executor(transport, &sleeps);
  vigil::ExecutionContext ctx;
  const auto r = exec.execute(Object{{"url", "http://h/"}}, ctx, 1.0);
  expect(r.metrics.at("status_code").as_int() == 200, "retried into success");
  expect(r.metrics.at("attempts").as_int() == 2 && r.metrics.at("retries").as_int() == 1, "attempt counts");
  expect(sleeps.size() == 1 && sleeps[0] == 0.5, "transport backoff factor applied");
  expect(exec.transport_backoff(3) == 2.0, "backoff doubles");
  expect(!exec.should_retry_status("GET", 404), "404 not retried");
}

void test_executor_transport_error_keeps_partial_data() {
  auto transport = std::make_shared<ScriptedTransport>(std::deque<vigil::TransportResult>{
      ScriptedTransport::failed(vigil::ErrorCode::transport_timeout, "timed out"),
      ScriptedTransport::failed(vigil::ErrorCode::transport_timeout, "timed out"),
      ScriptedTransport::failed(vigil::ErrorCode::transport_timeout, "timed out")});
  std::vector<double> sleeps;
  auto exec = make_executor(transport, &sleeps);
  vigil::ExecutionContext ctx;
  bool threw = false;
  try {
    exec.execute(Object{{"url", "http://h/slow"}, {"headers", Object{{"Cookie", "c"}}}}, ctx, 1.0);
  } catch (const vigil::TransportError& e) {
    threw = true;
    expect(e.code() == vigil::ErrorCode::transport_timeout, "error code kept");
    expect(vigil::jsonlite::get_string(e.request_payload(), "url") == "http://h/slow", "request payload kept");
    expect(Value{e.request_payload()}.find("headers")->find("Cookie")->as_string() == "***", "partial data redacted");
    expect(e.metrics().at("status").as_string() == "network_error", "network_error status");
    expect(e.metrics().at("attempts").as_int() == 3, "all transport attempts used");
    expect(e.metrics().at("error_code").as_string() == "transport_timeout", "metrics error code");
  }
  expect(threw, "TransportError raised after retries");
  expect(sleeps.size() == 2, "sleeps between transport attempts only");
}

void test_executor_masks_scalar_secrets() {
  auto transport = std::make_shared<ScriptedTransport>(
      std::deque<vigil::TransportResult>{ScriptedTransport::ok(200, "{\"echo\":483920}")});
  std::vector<double> sleeps;
  auto exec = make_executor(transport, &sleeps);
  vigil::ExecutionContext ctx;
  ctx.secrets = Object{{"pin", 483920}, {"tok", "s3cr3t-value"}};
  const Value rendered = ctx.render(Object{
      {"method", "POST"},
      {"url", "http://api.test/v1?api_key=k-abc-9&page=2"},
      {"params", Object{{"pin", "{{secret.pin}}"}}},
      {"json", Object{{"code", "{{secret.pin}}"}, {"note", "pin={{secret.pin}} tok={{secret.tok}}"}}}});
  expect(rendered.find("json")->find("code")->as_int() == 483920, "whole placeholder renders typed");

  const auto r = exec.execute(rendered.as_object(), ctx, 1.0);
  const Value req{r.request_payload};
  expect(req.find("json")->find("code")->as_string() == "***", "numeric secret leaf masked");
  expect(req.find("json")->find("note")->as_string() == "pin=*** tok=***", "embedded numeric secret masked");
  expect(req.find("params")->find("pin")->as_string() == "***", "secret in params masked");
  expect(req.find("url")->as_string() == "http://api.test/v1?api_key=***&page=2", "sensitive query value redacted");
  const std::string req_text = vigil::jsonlite::to_json(req);
  expect(req_text.find("483920") == std::string::npos, "no numeric secret in request payload");
  expect(req_text.find("k-abc-9") == std::string::npos, "no api key in request payload");

  const Value resp{r.response_payload};
  expect(resp.find("json")->find("echo")->as_string() == "***", "numeric secret in response masked");
  expect(resp.find("body")->find("text")->as_string() == "{\"echo\":***}", "response text masked");

  const auto& sent = transport->requests.at(0);
  expect(sent.url.find("pin=483920") != std::string::npos, "wire request keeps real values");
  expect(sent.body.find("\"code\":483920") != std::string::npos, "wire body keeps typed secret");

  vigil::Redactor redactor(vigil::EngineConfig{}, ctx.secret_values());
  expect(redactor.apply(Value{true}).as_bool(), "unrelated scalars pass through");
  expect(redactor.apply_url("http://h/p?Token=x#frag") == "http://h/p?Token=***#frag", "query names match case-insensitively");
}

void test_executor_transport_error_masks_secrets() {
  auto transport = std::make_shared<ScriptedTransport>(std::deque<vigil::TransportResult>{
      ScriptedTransport::failed(vigil::ErrorCode::transport_connect, "refused"),
      ScriptedTransport::failed(vigil::ErrorCode::transport_connect, "refused"),
      ScriptedTransport::failed(vigil::ErrorCode::transport_connect, "refused")});
  std::vector<double> sleeps;
  auto exec = make_executor(transport, &sleeps);
  vigil::ExecutionContext ctx;
  ctx.secrets = Object{{"pin", 483920}, {"ratio", 0.25}};
  const Value rendered = ctx.render(Object{{"url", "http://h/x"},
                                           {"params", Object{{"pin", "{{secret.pin}}"}}},
                                           {"json", Object{{"code", "{{secret.pin}}"}, {"r", "{{secret.ratio}}"}}}});
  bool threw = false;
  try {
    exec.execute(rendered.as_object(), ctx, 1.0);
  } catch (const vigil::TransportError& e) {
    threw = true;
    const std::string text = vigil::jsonlite::to_json(Value{e.request_payload()});
    expect(text.find("483920") == std::string::npos, "partial request payload masks numeric secret");
    expect(text.find("0.25") == std::string::npos, "partial request payload masks double secret");
    expect(Value{e.request_payload()}.find("params")->find("pin")->as_string() == "***", "partial params masked");
  }
  expect(threw, "TransportError raised");
}

void test_executor_requires_url() {
  auto transport = std::make_shared<ScriptedTransport>(std::deque<vigil::TransportResult>{});
  std::vector<double> sleeps;
  auto exec = make_executor(transport, &sleeps);
  vigil::ExecutionContext ctx;
  bool threw = false;
  try {
    exec.execute(Object{{"method", "GET"}}, ctx, 1.0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  expect(threw, "missing url rejected");
  expect(vigil::host_key("https://user@API.test:8443/v1?x=1") == "api.test:8443", "host key normalized");
}

void test_curl_refused_connection() {
  vigil::EngineConfig config;
  config.transport_retry_attempts = 2;
  vigil::HttpStepExecutor exec(config, std::make_shared<vigil::CurlTransport>(), [](double) {});
  vigil::ExecutionContext ctx;
  bool threw = false;
  try {
    exec.execute(Object{{"url", "http://127.0.0.1:1/refused"}}, ctx, 2.0);
  } catch (const vigil::TransportError& e) {
    threw = true;
    expect(e.code() == vigil::ErrorCode::transport_connect, "refused maps to transport_connect");
    expect(vigil::jsonlite::get_string(e.request_payload(), "method") == "GET", "request method captured");
    expect(e.metrics().at("attempts").as_int() == 2, "curl attempts counted");
  }
  expect(threw, "refused connection raises TransportError");
}

void test_transport_logs_omit_credentials() {
  const fs::path path = fs::temp_directory_path() / "vigil_transport_log_test.jsonl";
  fs::remove(path);
  vigil::global_logger().set_path(path.string());
  vigil::global_logger().set_level(vigil::LogLevel::debug);

  vigil::EngineConfig config;
  config.transport_retry_attempts = 1;
  vigil::HttpStepExecutor exec(config, std::make_shared<vigil::CurlTransport>(), [](double) {});
  vigil::ExecutionContext ctx;
  bool threw = false;
  try {
    exec.execute(Object{{"url", "http://127.0.0.1:1/refused?token=t-inline-55"}, {"params", Object{{"api_key", "k-live-77"}}}},
                 ctx, 2.0);
  } catch (const vigil::TransportError& e) {
    threw = true;
    expect(vigil::jsonlite::get_string(e.request_payload(), "url") == "http://127.0.0.1:1/refused?token=***",
           "payload url query redacted");
  }
  vigil::global_logger().set_path("");
  vigil::global_logger().set_level(vigil::LogLevel::error);
  expect(threw, "refused connection raises TransportError");

  std::ifstream in(path);
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  expect(text.find("127.0.0.1:1/refused") != std::string::npos, "failure logged with its url");
  expect(text.find("k-live-77") == std::string::npos, "param credential absent from logs");
  expect(text.find("t-inline-55") == std::string::npos, "inline query credential absent from logs");
}

// ============================================================================
// Phase 9: Progress events
// ============================================================================

void test_progress_sanitize() {
  Value deep = Object{{"leaf", 1}};
  for (int i = 0; i < 6; ++i) deep = Object{{"n", deep}};
  const Value s = vigil::sanitize_progress_payload(Object{{"long", std::string(3000, 'x')}, {"deep", deep}});
  const std::string& clipped = s.find("long")->as_string();
  expect(clipped.size() == 2048 + std::string("... (truncated)").size(), "long string clipped");
  const Value* cur = s.find("deep");
  for (int i = 0; i < 3; ++i) cur = cur->find("n");
  expect(cur->find("__truncated__") != nullptr, "depth limit marker");

  Array many;
  for (int i = 0; i < 30; ++i) many.push_back(i);
  const Value a = vigil::sanitize_progress_payload(many);
  expect(a.as_array().size() == 21, "20 items plus overflow marker");
  expect(a.as_array().back().find("count")->as_int() == 30, "overflow marker counts");
}

void test_progress_event_size_cap() {
  Array chunks;
  for (int i = 0; i < 30; ++i) chunks.push_back(std::string(100, 'a'));
  const auto ev = vigil::make_progress_event(vigil::ProgressEventType::step_progress, "r1", Value{chunks},
                                             std::string("step_1"), 600);
  expect(ev.truncated, "oversized event flagged");
  expect(vigil::jsonlite::to_json(ev.to_json()).size() <= 600, "event fits the cap");
  expect(ev.step_alias && *ev.step_alias == "step_1", "alias kept");
  expect(vigil::progress_channel("r1") == "report_progress:r1", "channel name");
}

void test_progress_sink_failure_isolated() {
  vigil::ProgressPublisher publisher(std::make_shared<ThrowingSink>());
  const auto ev = publisher.publish(vigil::ProgressEventType::started, "r1", Value{Object{{"k", 1}}});
  expect(ev.type == vigil::ProgressEventType::started, "publisher survives a throwing sink");

  auto memory = std::make_shared<vigil::MemoryProgressSink>();
  auto second = std::make_shared<vigil::MemoryProgressSink>();
  vigil::ProgressPublisher fanout(
      std::make_shared<vigil::FanoutProgressSink>(std::vector<std::shared_ptr<vigil::IProgressSink>>{memory, second}));
  fanout.publish(vigil::ProgressEventType::finished, "r2");
  expect(memory->entries().size() == 1 && second->entries().size() == 1, "fan-out reaches every sink");
  expect(memory->entries()[0].channel == "report_progress:r2", "published on report channel");

  auto after_failure = std::make_shared<vigil::MemoryProgressSink>();
  vigil::FanoutProgressSink guarded({std::make_shared<ThrowingSink>(), after_failure});
  vigil::ProgressEvent raw_ev;
  raw_ev.type = vigil::ProgressEventType::started;
  raw_ev.report_id = "r3";
  guarded.publish("report_progress:r3", raw_ev);
  expect(after_failure->entries().size() == 1, "throwing sink does not starve later sinks");
}

void test_jsonl_progress_sink() {
  const fs::path path = fs::temp_directory_path() / "vigil_progress_test.jsonl";
  fs::remove(path);
  vigil::JsonlProgressSink sink(path.string());
  vigil::ProgressPublisher publisher(std::shared_ptr<vigil::IProgressSink>(&sink, [](vigil::IProgressSink*) {}));
  publisher.publish(vigil::ProgressEventType::started, "r1");
  publisher.publish(vigil::ProgressEventType::finished, "r1");
  std::ifstream in(path);
  std::string line;
  int lines = 0;
  while (std::getline(in, line)) {
    std::optional<vigil::jsonlite::JsonError> err;
    const Value v = vigil::jsonlite::parse_value(line, &err);
    expect(!err && v.find("channel")->as_string() == "report_progress:r1", "NDJSON framing");
    ++lines;
  }
  expect(lines == 2, "one line per event");
  expect(sink.write_failures() == 0, "no write failures");
  fs::remove(path);
}

// ============================================================================
// Phase 10: Orchestrator
// ============================================================================

void test_case_passes_first_attempt() {
  Harness h({respond(200)});
  const auto report = h.orchestrator->run_case("r-pass", status_case(200), test_policy(3));
  expect(report.status == vigil::ReportStatus::passed, "PASSED");
  expect(report.attempts_used == 1 && report.retry_attempt == 0, "one attempt");
  expect(report.metrics.at("worker_id").as_string() == "w-test", "worker id stamped");
  expect(report.metrics.at("policy_digest").as_string() == report.policy_digest, "policy digest stamped");
  expect(report.policy_snapshot.at("name").as_string() == "test", "policy snapshot stored verbatim");
  expect(report.metrics.at("attempt_history").as_array().size() == 1, "attempt history recorded");

  std::optional<vigil::jsonlite::JsonError> err;
  const Value doc = vigil::jsonlite::parse_value(vigil::report_to_json(report), &err);
  expect(!err && doc.find("entity_type")->as_string() == vigil::to_string(vigil::ReportKind::test_case),
         "report JSON carries entity_type");
  expect(doc.find("status")->as_string() == "PASSED", "report JSON status");

  const auto types = h.event_types("r-pass");
  expect((types == std::vector<std::string>{"started", "assertion_result", "finished"}), "event order");

  const auto saved = h.store->history("r-pass");
  expect(saved.size() == 2, "saved when running and when terminal");
  expect(saved.front().status == vigil::ReportStatus::running, "first save is RUNNING");
  expect(vigil::is_terminal(saved.back().status), "last save is terminal");
}

void test_transient_failures_then_success() {
  Harness h({network_failure(), network_failure(), respond(200)});
  const auto report = h.orchestrator->run_case("r-k", status_case(200), test_policy(4));
  expect(report.status == vigil::ReportStatus::passed, "succeeds after K failures");
  expect(report.attempts_used == 3, "exactly K+1 attempts");
  expect(report.retry_attempt == 2, "retry_attempt counts retries");
  expect(h.executor->seen_inputs.size() == 3, "executor called K+1 times");
  expect(h.time.sleeps.size() == 2, "backoff slept between attempts");
  expect(h.time.sleeps[0] == 0.1 && h.time.sleeps[1] == 0.2, "policy backoff schedule");
}

void test_transport_errors_then_failed_assertion() {
  Harness h({network_failure(), network_failure(), respond(500)});
  const auto report = h.orchestrator->run_case("r-fail", status_case(200), test_policy(3));
  expect(report.status == vigil::ReportStatus::failed, "FAILED, not ERROR");
  expect(report.attempts_used == 3, "three attempts used");
  expect(h.executor->seen_inputs.size() == 3, "assertion failure not retried");
  const auto history = report.metrics.at("attempt_history").as_array();
  expect(history[0].find("outcome")->as_string() == "transport_error", "first attempt outcome");
  expect(history[2].find("outcome")->as_string() == "assertions_failed", "last attempt outcome");
  expect(history[2].find("status_code")->as_int() == 500, "status in history");
  const auto types = h.event_types("r-fail");
  expect((types == std::vector<std::string>{"started", "retrying", "retrying", "assertion_result", "finished"}),
         "causal event order");
  expect(!report.assertions_result.at("passed").as_bool(), "assertions result persisted");
}

void test_transport_exhaustion_is_error() {
  Harness h({network_failure(), network_failure()});
  const auto report = h.orchestrator->run_case("r-err", status_case(200), test_policy(2));
  expect(report.status == vigil::ReportStatus::error, "ERROR after exhausting attempts");
  expect(report.request_payload.find("url")->as_string() == "http://api.test/health", "partial request kept");
  expect(report.response_payload.find("error")->as_string() == "connection refused", "error response recorded");
  expect(report.assertions_result.at("error").as_string() == "connection refused", "assertions error recorded");
  expect(report.metrics.at("status").as_string() == "network_error", "executor metrics kept");
  const auto types = h.event_types("r-err");
  expect((types == std::vector<std::string>{"started", "retrying", "finished"}), "no assertion_result on error");
}

void test_retry_on_assertions() {
  Harness h({respond(500), respond(500), respond(200)});
  auto policy = test_policy(3, Object{{"retry_backoff", Object{{"strategy", "exponential"},
                                                                {"base_seconds", 0.1},
                                                                {"retry_on_assertions", true}}}});
  const auto report = h.orchestrator->run_case("r-ra", status_case(200), policy);
  expect(report.status == vigil::ReportStatus::passed, "assertion retry recovers");
  expect(report.attempts_used == 3, "all attempts used");
  expect(report.response_payload.find("status_code")->as_int() == 200, "last attempt wins");
  const auto types = h.event_types("r-ra");
  expect(std::count(types.begin(), types.end(), "assertion_result") == 1, "one assertion_result");
  expect(std::count(types.begin(), types.end(), "retrying") == 2, "retrying per failed attempt");
}

void test_circuit_open_terminates() {
  Harness h({network_failure()});
  auto policy = test_policy(2, Object{{"circuit_breaker_threshold", 1},
                                      {"retry_backoff", Object{{"strategy", "exponential"},
                                                               {"base_seconds", 0.1},
                                                               {"cooldown_seconds", 5}}}});
  const auto report = h.orchestrator->run_case("r-co", status_case(200), policy);
  expect(report.status == vigil::ReportStatus::error, "blocked final attempt is ERROR");
  expect(report.metrics.at("error_code").as_string() == "circuit_open", "circuit_open code");
  expect(h.executor->seen_inputs.size() == 1, "blocked attempt never dispatched");
  const auto types = h.event_types("r-co");
  expect((types == std::vector<std::string>{"started", "retrying", "blocked", "finished"}), "blocked event");
}

void test_circuit_wait_then_recover() {
  Harness h({network_failure(), respond(200)});
  auto policy = test_policy(3, Object{{"circuit_breaker_threshold", 1},
                                      {"retry_backoff", Object{{"strategy", "exponential"},
                                                               {"base_seconds", 0.1},
                                                               {"cooldown_seconds", 1}}}});
  const auto report = h.orchestrator->run_case("r-cw", status_case(200), policy);
  expect(report.status == vigil::ReportStatus::passed, "run recovers after cooldown");
  expect(report.attempts_used == 3, "blocked attempt counts");
  const auto history = report.metrics.at("attempt_history").as_array();
  expect(history[1].find("outcome")->as_string() == "blocked", "blocked attempt in history");
}

void test_disabled_policy_uses_default() {
  Harness h({network_failure(), respond(200)});
  auto policy = test_policy(1, Object{{"enabled", false}});
  const auto report = h.orchestrator->run_case("r-dis", status_case(200), policy);
  expect(report.status == vigil::ReportStatus::passed, "default policy retries");
  expect(report.policy_snapshot.at("name").as_string() == "default", "default snapshot recorded");
}

void test_case_excluded_by_tags() {
  Harness h({});
  auto c = status_case(200);
  c.tags = {"slow"};
  const auto report = h.orchestrator->run_case("r-tag", c, test_policy(1, Object{{"tags_exclude", Array{"slow"}}}));
  expect(report.status == vigil::ReportStatus::error, "excluded case is ERROR");
  expect(report.assertions_result.at("error").as_string() == "case excluded by policy tags", "exclusion message");
  expect(h.executor->seen_inputs.empty(), "excluded case never dispatched");
}

void test_case_renders_inputs() {
  Harness h({respond(200)});
  auto c = status_case(200);
  c.inputs = Object{{"url", "{{env.base}}/users/{{ variables.id }}"}};
  c.variables = Object{{"id", 7}};
  vigil::ExecutionContext seed;
  seed.environment = Object{{"base", "http://api.test"}};
  h.orchestrator->run_case("r-render", c, test_policy(1), seed);
  expect(vigil::jsonlite::get_string(h.executor->seen_inputs.at(0), "url") == "http://api.test/users/7",
         "inputs rendered before dispatch");
}

vigil::CaseCatalog suite_catalog() {
  vigil::CaseDefinition login;
  login.id = "login";
  login.inputs = Object{{"method", "POST"},
                        {"url", "http://api.test/login"},
                        {"json", Object{{"user", "{{variables.user}}"}}}};
  login.assertions = Array{Object{{"operator", "status_code"}, {"expected", 200}}};
  vigil::CaseDefinition profile;
  profile.id = "profile";
  profile.inputs = Object{{"url", "http://api.test/users/{{prev.login.json.id}}"}};
  vigil::CaseCatalog catalog;
  catalog["login"] = login;
  catalog["profile"] = profile;
  return catalog;
}

void test_suite_flow_and_templating() {
  Harness h({respond(200, Object{{"id", 42}}), respond(200, Object{{"name", "bob"}})});
  vigil::SuiteDefinition suite;
  suite.id = "suite-1";
  suite.variables = Object{{"user", "ada"}};
  suite.steps = Array{Object{{"alias", "login"}, {"case_id", "login"}, {"inputs", Object{{"json", Object{{"extra", 1}}}}}},
                      Object{{"case_id", "profile"},
                             {"assertions", Array{Object{{"operator", "jsonpath_equals"},
                                                         {"path", "$.name"},
                                                         {"expected", "ada"}}}}},
                      Value{"not a step"}};
  const auto report = h.orchestrator->run_suite("r-suite", suite, suite_catalog(), test_policy(1));
  expect(report.status == vigil::ReportStatus::failed, "assertion failure fails the suite");
  expect(h.executor->seen_inputs.size() == 2, "both steps executed");

  const Value first_json{h.executor->seen_inputs[0].at("json")};
  expect(first_json.find("user")->as_string() == "ada", "suite variables rendered");
  expect(first_json.find("extra")->as_int() == 1, "step overrides merged into case inputs");
  expect(vigil::jsonlite::get_string(h.executor->seen_inputs[1], "url") == "http://api.test/users/42",
         "later step reads earlier response");

  const auto& steps = report.assertions_result.at("steps").as_array();
  expect(steps.size() == 2, "per-step assertion results");
  expect(steps[1].find("alias")->as_string() == "step_2", "default alias");
  expect(!steps[1].find("passed")->as_bool(), "second step failed");
  expect(report.metrics.at("steps").as_array().size() == 2, "per-step metrics");
  expect(report.duration_ms && *report.duration_ms == 10.0, "durations summed");

  const auto types = h.event_types("r-suite");
  expect(types.front() == "started" && types.back() == "finished", "suite framing events");
  expect(types[types.size() - 2] == "assertion_result", "assertion_result precedes finished");
  expect(std::count(types.begin(), types.end(), "step_progress") == 4, "running and completed per step");
}

void test_suite_continues_after_assertion_failure() {
  Harness h({respond(500), respond(200)});
  vigil::SuiteDefinition suite;
  suite.id = "suite-2";
  suite.steps = Array{Object{{"case_id", "login"}}, Object{{"inputs", Object{{"url", "http://api.test/ping"}}}}};
  const auto report = h.orchestrator->run_suite("r-s2", suite, suite_catalog(), test_policy(1));
  expect(h.executor->seen_inputs.size() == 2, "second step runs after a failed assertion");
  expect(report.status == vigil::ReportStatus::failed, "suite marked FAILED");
}

void test_suite_transport_failure_aborts() {
  Harness h({respond(200, Object{{"id", 1}}), network_failure()});
  vigil::SuiteDefinition suite;
  suite.id = "suite-3";
  suite.steps = Array{Object{{"alias", "login"}, {"case_id", "login"}}, Object{{"case_id", "profile"}},
                      Object{{"inputs", Object{{"url", "http://api.test/never"}}}}};
  const auto report = h.orchestrator->run_suite("r-s3", suite, suite_catalog(), test_policy(1));
  expect(report.status == vigil::ReportStatus::error, "transport exhaustion makes the suite ERROR");
  expect(h.executor->seen_inputs.size() == 2, "remaining steps aborted");
  expect(report.request_payload.find("steps")->as_array().size() == 2, "failed step recorded");
  expect(report.assertions_result.at("error").as_string() == "connection refused", "suite error recorded");
}

void test_suite_skips_unselected_steps() {
  Harness h({respond(200)});
  auto catalog = suite_catalog();
  catalog["login"].tags = {"slow"};
  vigil::SuiteDefinition suite;
  suite.id = "suite-4";
  suite.steps = Array{Object{{"case_id", "login"}}, Object{{"inputs", Object{{"url", "http://api.test/ping"}}}}};
  const auto report = h.orchestrator->run_suite("r-s4", suite, catalog,
                                                test_policy(1, Object{{"tags_exclude", Array{"slow"}}}));
  expect(report.status == vigil::ReportStatus::passed, "remaining step passes");
  expect(h.executor->seen_inputs.size() == 1, "excluded step not dispatched");
  bool skipped = false;
  for (const auto& ev : h.sink->events_for("r-s4")) {
    if (ev.type == vigil::ProgressEventType::step_progress && ev.payload &&
        ev.payload->find("state")->as_string() == "skipped") {
      skipped = ev.step_alias && *ev.step_alias == "step_1";
    }
  }
  expect(skipped, "skipped step_progress event");
}

void test_suite_missing_case_is_unexpected() {
  Harness h({});
  vigil::SuiteDefinition suite;
  suite.id = "suite-5";
  suite.steps = Array{Object{{"case_id", "nope"}}};
  bool threw = false;
  try {
    h.orchestrator->run_suite("r-s5", suite, suite_catalog(), test_policy(1));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  expect(threw, "unexpected error rethrown");
  const auto saved = h.store->latest("r-s5");
  expect(saved && saved->status == vigil::ReportStatus::error, "report marked ERROR before rethrow");
  expect(saved->metrics.at("error_code").as_string() == "unexpected", "unexpected code");
  expect(h.event_types("r-s5").back() == "finished", "finished published");
}

void test_catalog_shapes() {
  const auto from_list = vigil::case_catalog_from_json(Array{Object{{"id", "a"}}, Object{{"id", "b"}}, Value{3}});
  expect(from_list.size() == 2, "list of cases");
  const auto from_map = vigil::case_catalog_from_json(Object{{"x", Object{{"inputs", Object{}}}}});
  expect(from_map.count("x") == 1, "object keyed by id");
  const auto wrapped = vigil::case_catalog_from_json(Object{{"cases", Array{Object{{"id", "c"}}}}});
  expect(wrapped.count("c") == 1, "cases wrapper");
}

void test_orchestrator_on_worker_pool() {
  Harness h({});
  vigil::WorkerPool pool(3);
  std::vector<std::future<vigil::Report>> futures;
  for (int i = 0; i < 6; ++i) {
    const std::string id = "r-pool-" + std::to_string(i);
    futures.push_back(pool.submit([&h, id] {
      vigil::PolicyStateRegistry registry;
      vigil::OrchestratorOptions opts;
      opts.sleeper = [](double) {};
      opts.registry = &registry;
      opts.audit_log = &no_audit();
      opts.worker_id = "w-pool";
      auto executor = std::make_shared<ScriptedExecutor>(std::deque<ScriptStep>{respond(200)});
      vigil::ExecutionOrchestrator orch(executor, h.store, h.sink, opts);
      return orch.run_case(id, status_case(200), test_policy(1));
    }));
  }
  for (auto& f : futures) expect(f.get().status == vigil::ReportStatus::passed, "pooled run passed");
  for (int i = 0; i < 6; ++i) {
    const auto types = h.event_types("r-pool-" + std::to_string(i));
    expect(types.front() == "started" && types.back() == "finished", "per-report order under concurrency");
  }
}

// ============================================================================
// Phase 11: Ambient stack
// ============================================================================

void test_config_validation() {
  const auto ok = vigil::validate_config("{\"request_timeout_seconds\":5,\"retry_statuses\":[503]}");
  expect(ok.ok && ok.errors.empty(), "valid config");
  const auto bad = vigil::validate_config("{\"max_response_size_bytes\":-1,\"verify_tls\":\"yes\",\"colour\":1}");
  expect(!bad.ok && bad.errors.size() == 2, "type and range errors");
  expect(bad.warnings.size() == 1, "unknown key warning");
  const auto broken = vigil::validate_config("{");
  expect(!broken.ok, "parse error reported without throwing");

  const auto c = vigil::EngineConfig::from_json(Object{{"max_response_size_bytes", 64}, {"redaction_placeholder", "[x]"}});
  expect(c.max_response_size_bytes == 64 && c.redaction_placeholder == "[x]", "from_json overlays");
  expect(c.request_timeout_seconds == 30.0, "defaults kept");
}

void test_audit_chain() {
  const fs::path path = fs::temp_directory_path() / "vigil_audit_test.jsonl";
  fs::remove(path);
  {
    vigil::ImmutableAuditLog log(path.string());
    vigil::RunRecord a;
    a.report_id = "r1";
    a.status = "PASSED";
    vigil::RunRecord b;
    b.report_id = "r2";
    b.status = "FAILED";
    expect(log.append(a) && log.append(b), "appends succeed");
    expect(a.sequence == 1 && b.sequence == 2, "sequence increments");
    expect(a.previous_digest == std::string(64, '0'), "first line chains to zeros");
    expect(b.previous_digest == vigil::audit_chain_digest(vigil::run_record_to_json(a)), "chained digest");
    expect(log.entry_count() == 2 && log.failure_count() == 0, "counts");
  }
  std::ifstream in(path);
  std::string line;
  int n = 0;
  while (std::getline(in, line)) ++n;
  expect(n == 2, "one line per record");
  fs::remove(path);

  vigil::ImmutableAuditLog disabled("");
  vigil::RunRecord r;
  expect(disabled.append(r) && !disabled.enabled(), "disabled log accepts silently");
}

void test_worker_identity_and_pool() {
  const auto w = vigil::init_worker_identity("w-7", "node-a");
  expect(w.worker_id == "w-7" && w.node_id == "node-a", "explicit identity");
  expect(vigil::global_worker_identity().worker_id == "w-7", "global identity updated");
  expect(vigil::worker_identity_to_json(w).find("\"node_id\":\"node-a\"") != std::string::npos, "identity JSON");

  std::atomic<bool> stop{false};
  std::thread writer([&stop] {
    for (int i = 0; i < 2000 && !stop.load(); ++i) {
      vigil::init_worker_identity(i % 2 ? "w-long-identifier-beyond-sso-buffer" : "w-7", "node-a");
    }
  });
  bool consistent = true;
  for (int i = 0; i < 2000; ++i) {
    const vigil::WorkerIdentity seen = vigil::global_worker_identity();
    consistent &= seen.worker_id == "w-7" || seen.worker_id == "w-long-identifier-beyond-sso-buffer";
  }
  stop.store(true);
  writer.join();
  expect(consistent, "identity copies are never torn");
  vigil::init_worker_identity("w-7", "node-a");

  vigil::WorkerPool pool(2);
  auto square = pool.submit([] { return 9 * 9; });
  auto boom = pool.submit([]() -> int { throw std::runtime_error("task failed"); });
  expect(square.get() == 81, "future carries result");
  bool threw = false;
  try {
    boom.get();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  expect(threw, "future carries exception");
  pool.shutdown();
  bool rejected = false;
  try {
    pool.submit([] { return 1; });
  } catch (const std::runtime_error&) {
    rejected = true;
  }
  expect(rejected, "submit after shutdown rejected");
}

std::atomic<int> g_hooked_runs{0};

void count_hooked_run(const vigil::RunEvent& ev) {
  if (ev.report_id == "r-stats") g_hooked_runs++;
}

void test_stats_and_version() {
  auto& stats = vigil::global_engine_stats();
  const auto before = stats.runs_total.load();
  vigil::set_run_event_hook(count_hooked_run);
  Harness h({respond(200)});
  h.orchestrator->run_case("r-stats", status_case(200), test_policy(1));
  vigil::set_run_event_hook(nullptr);
  expect(stats.runs_total.load() == before + 1, "run counted");
  expect(g_hooked_runs.load() == 1, "run event handed to the hook");
  expect(stats.to_json().find("\"latency\"") != std::string::npos, "stats JSON has latency");
  const auto recent = stats.recent_runs_snapshot();
  expect(!recent.empty() && recent.back().report_id == "r-stats", "recent runs ring keeps the latest run");
  expect(recent.back().status == "PASSED" && recent.back().attempts == 1, "run event fields");

  const auto health = vigil::worker_health_snapshot();
  expect(health.runs_total == stats.runs_total.load(), "worker health reads engine stats");
  expect(vigil::worker_health_to_json(health).find("utilization_pct") != std::string::npos, "health JSON");

  const auto m = vigil::version::current_manifest();
  expect(m.report_format == vigil::version::REPORT_FORMAT_VERSION, "manifest report format");
  expect(vigil::version::manifest_to_json(m).find("engine_semver") != std::string::npos, "manifest JSON");
}

void test_log_value_truncation() {
  const Value v = vigil::truncate_log_value(Object{{"big", std::string(3000, 'y')}, {"small", "ok"}});
  const std::string& big = v.find("big")->as_string();
  expect(big.size() < 3000 && big.find("...(truncated)") != std::string::npos, "long values truncated");
  expect(v.find("small")->as_string() == "ok", "short values kept");
  expect(vigil::parse_log_level("warn") == vigil::LogLevel::warn, "level parsing");
  expect(vigil::iso8601_utc_now().back() == 'Z', "UTC timestamps");
}

}  // namespace

int main() {
  std::cout << "=== Vigil Engine Test Suite ===\n";
  vigil::global_logger().set_level(vigil::LogLevel::error);

  std::cout << "\n[Phase 1] JSON Model & Hashing\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("strict JSON parse", test_json_strict_parse);
  run_test("numeric value equality", test_values_equal_numeric);

  std::cout << "\n[Phase 2] Policy Snapshot\n";
  run_test("policy defaults", test_policy_defaults);
  run_test("lenient clamping", test_policy_lenient_clamping);
  run_test("strict validation", test_policy_strict_validation);
  run_test("digest and tag selection", test_policy_digest_and_tags);

  std::cout << "\n[Phase 3] Policy Runtime\n";
  run_test("backoff monotonic and capped", test_backoff_monotonic_and_capped);
  run_test("backoff jitter bounds", test_backoff_jitter_bounds);
  run_test("circuit breaker per host", test_circuit_breaker_per_host);
  run_test("circuit success resets", test_circuit_success_resets);
  run_test("circuit window expiry", test_circuit_window_expiry);
  run_test("state shared by policy key", test_state_shared_by_policy_key);
  run_test("rate limit delay", test_rate_limit_delay);
  run_test("concurrency slots bounded", test_concurrency_slots_bounded);
  run_test("slot released on exception", test_slot_released_on_exception);

  std::cout << "\n[Phase 4] Execution Context\n";
  run_test("typed and embedded rendering", test_render_typed_and_embedded);
  run_test("template roots", test_render_roots);
  run_test("merge inputs one level", test_merge_inputs_one_level);

  std::cout << "\n[Phase 5] JSONPath\n";
  run_test("JSONPath subset", test_jsonpath_subset);

  std::cout << "\n[Phase 6] Assertion Engine\n";
  run_test("empty assertions", test_assertions_empty);
  run_test("jsonpath_equals", test_assertions_jsonpath_equals);
  run_test("numeric rules", test_assertions_numeric_rules);
  run_test("length", test_assertions_length);
  run_test("contains and regex", test_assertions_contains_and_regex);
  run_test("regex subject bound", test_assertions_regex_subject_bound);
  run_test("evaluation is total", test_assertions_totality);
  run_test("status names and messages", test_assertions_status_names_and_messages);
  run_test("diff on failure only", test_assertions_diff_on_failure_only);
  run_test("templated operands", test_assertions_templated_operands);
  run_test("assertion normalization", test_assertions_normalization);

  std::cout << "\n[Phase 7] Diff\n";
  run_test("diff entries and paths", test_diff_entries_and_paths);
  run_test("diff limits", test_diff_limits);

  std::cout << "\n[Phase 8] HTTP Step Executor\n";
  run_test("redaction", test_executor_redaction);
  run_test("params and truncation", test_executor_params_and_truncation);
  run_test("status retry", test_executor_retries_status);
  run_test("transport error keeps partial data", test_executor_transport_error_keeps_partial_data);
  run_test("scalar secrets masked", test_executor_masks_scalar_secrets);
  run_test("transport error masks secrets", test_executor_transport_error_masks_secrets);
  run_test("url required", test_executor_requires_url);
  run_test("curl refused connection", test_curl_refused_connection);
  run_test("transport logs omit credentials", test_transport_logs_omit_credentials);

  std::cout << "\n[Phase 9] Progress Events\n";
  run_test("payload sanitization", test_progress_sanitize);
  run_test("event size cap", test_progress_event_size_cap);
  run_test("sink failure isolated", test_progress_sink_failure_isolated);
  run_test("NDJSON sink", test_jsonl_progress_sink);

  std::cout << "\n[Phase 10] Orchestrator\n";
  run_test("case passes first attempt", test_case_passes_first_attempt);
  run_test("transient failures then success", test_transient_failures_then_success);
  run_test("transport errors then failed assertion", test_transport_errors_then_failed_assertion);
  run_test("transport exhaustion is ERROR", test_transport_exhaustion_is_error);
  run_test("retry on assertions", test_retry_on_assertions);
  run_test("circuit open terminates", test_circuit_open_terminates);
  run_test("circuit wait then recover", test_circuit_wait_then_recover);
  run_test("disabled policy uses default", test_disabled_policy_uses_default);
  run_test("case excluded by tags", test_case_excluded_by_tags);
  run_test("case inputs rendered", test_case_renders_inputs);
  run_test("suite flow and templating", test_suite_flow_and_templating);
  run_test("suite continues after assertion failure", test_suite_continues_after_assertion_failure);
  run_test("suite transport failure aborts", test_suite_transport_failure_aborts);
  run_test("suite skips unselected steps", test_suite_skips_unselected_steps);
  run_test("suite missing case is unexpected", test_suite_missing_case_is_unexpected);
  run_test("catalog shapes", test_catalog_shapes);
  run_test("runs on worker pool", test_orchestrator_on_worker_pool);

  std::cout << "\n[Phase 11] Ambient Stack\n";
  run_test("config validation", test_config_validation);
  run_test("audit chain", test_audit_chain);
  run_test("worker identity and pool", test_worker_identity_and_pool);
  run_test("stats and version", test_stats_and_version);
  run_test("log value truncation", test_log_value_truncation);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
