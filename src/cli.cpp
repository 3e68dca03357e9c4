#include <algorithm>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "vigil/audit.hpp"
#include "vigil/config.hpp"
#include "vigil/http_executor.hpp"
#include "vigil/jsonlite.hpp"
#include "vigil/log.hpp"
#include "vigil/observability.hpp"
#include "vigil/orchestrator.hpp"
#include "vigil/policy.hpp"
#include "vigil/policy_runtime.hpp"
#include "vigil/progress.hpp"
#include "vigil/version.hpp"
#include "vigil/worker.hpp"

namespace {

using vigil::jsonlite::Object;
using vigil::jsonlite::Value;

constexpr int kExitPassed = 0;
constexpr int kExitFailed = 1;
constexpr int kExitError = 2;

bool read_file(const std::string& path, std::string& out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  out.assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return true;
}

int fail(const std::string& message) {
  std::cerr << "{\"error\":\"" << vigil::jsonlite::escape(message) << "\"}\n";
  return kExitError;
}

// Reads and strictly parses a JSON document. On failure prints the error and
// returns false.
bool load_json(const std::string& path, Value& out) {
  std::string text;
  if (!read_file(path, text)) {
    fail("cannot read " + path);
    return false;
  }
  std::optional<vigil::jsonlite::JsonError> err;
  out = vigil::jsonlite::parse_value(text, &err);
  if (err) {
    fail(path + ": " + err->code + ": " + err->message);
    return false;
  }
  return true;
}

bool load_object(const std::string& path, Object& out) {
  Value v;
  if (!load_json(path, v)) return false;
  if (!v.is_object()) {
    fail(path + ": expected a JSON object");
    return false;
  }
  out = v.as_object();
  return true;
}

int exit_code_for(vigil::ReportStatus status) {
  switch (status) {
    case vigil::ReportStatus::passed: return kExitPassed;
    case vigil::ReportStatus::failed: return kExitFailed;
    default: return kExitError;
  }
}

std::string default_report_id(const std::string& entity_id) {
  return "r-" + (entity_id.empty() ? std::string("adhoc") : entity_id) + "-" +
         std::to_string(vigil::unix_time_ms());
}

// Options shared by the run-* commands.
struct RunOptions {
  std::string config_path;
  std::string policy_path;
  std::string context_path;
  std::string events_path;
  std::string report_id;
  std::string worker_id;
  std::string audit_path;
};

void scan_run_options(int argc, char** argv, RunOptions& o) {
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) o.config_path = argv[++i];
    else if (a == "--policy" && i + 1 < argc) o.policy_path = argv[++i];
    else if (a == "--context" && i + 1 < argc) o.context_path = argv[++i];
    else if (a == "--events" && i + 1 < argc) o.events_path = argv[++i];
    else if (a == "--report-id" && i + 1 < argc) o.report_id = argv[++i];
    else if (a == "--worker-id" && i + 1 < argc) o.worker_id = argv[++i];
    else if (a == "--audit-log" && i + 1 < argc) o.audit_path = argv[++i];
  }
}

std::string option_value(int argc, char** argv, const std::string& name) {
  for (int i = 2; i + 1 < argc; ++i) {
    if (name == argv[i]) return argv[i + 1];
  }
  return "";
}

// Everything a run-* command needs, resolved from RunOptions.
struct RunSetup {
  vigil::EngineConfig config;
  vigil::PolicySnapshot policy;
  vigil::ExecutionContext seed;
  std::shared_ptr<vigil::IProgressSink> sink;
};

bool prepare_run(const RunOptions& o, RunSetup& setup) {
  vigil::EngineConfig config;
  if (!o.config_path.empty()) {
    Object doc;
    if (!load_object(o.config_path, doc)) return false;
    config = vigil::EngineConfig::from_json(doc);
  }
  setup.config = vigil::EngineConfig::from_env(config);

  setup.policy = vigil::default_policy_snapshot(setup.config.request_timeout_seconds);
  if (!o.policy_path.empty()) {
    Object doc;
    if (!load_object(o.policy_path, doc)) return false;
    setup.policy = vigil::PolicySnapshot::from_json(doc);
  }

  if (!o.context_path.empty()) {
    Object doc;
    if (!load_object(o.context_path, doc)) return false;
    setup.seed.variables = vigil::jsonlite::get_object(doc, "variables");
    setup.seed.environment = vigil::jsonlite::get_object(doc, "environment");
    setup.seed.secrets = vigil::jsonlite::get_object(doc, "secrets");
    if (auto it = doc.find("row"); it != doc.end() && it->second.is_object()) {
      setup.seed.dataset_row = it->second.as_object();
    }
  }

  const std::string events = !o.events_path.empty() ? o.events_path : setup.config.progress_log;
  if (!events.empty()) {
    setup.sink = std::make_shared<vigil::JsonlProgressSink>(events);
  } else {
    setup.sink = std::make_shared<vigil::NullProgressSink>();
  }
  vigil::init_worker_identity(o.worker_id);
  if (!o.audit_path.empty()) vigil::set_audit_log_path(o.audit_path);
  return true;
}

std::unique_ptr<vigil::ExecutionOrchestrator> make_orchestrator(const RunSetup& setup) {
  vigil::OrchestratorOptions opts;
  opts.config = setup.config;
  auto executor = std::make_shared<vigil::HttpStepExecutor>(setup.config,
                                                            std::make_shared<vigil::CurlTransport>());
  return std::make_unique<vigil::ExecutionOrchestrator>(executor, std::make_shared<vigil::MemoryReportStore>(),
                                                        setup.sink, opts);
}

void print_usage() {
  std::cerr << "usage: vigil <command> [options]\n"
               "  run-case --case <file> [--policy <file>] [--context <file>] [--report-id <id>] [--events <file>]\n"
               "  run-suite --suite <file> [--cases <file>] [--policy <file>] [--context <file>] ...\n"
               "  run-batch --cases <file> [--policy <file>] [--workers N]\n"
               "  policy-check --policy <file>\n"
               "  config-validate --config <file>\n"
               "  backoff --policy <file> [--attempts N]\n"
               "  stats\n"
               "  version\n"
               "common: --config <file> --worker-id <id> --audit-log <file> --log <file> --log-level <level>\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0) continue;
    cmd = argv[i];
    break;
  }
  if (cmd.empty()) {
    print_usage();
    return kExitError;
  }

  for (int i = 1; i + 1 < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--log") vigil::global_logger().set_path(argv[i + 1]);
    else if (a == "--log-level") vigil::global_logger().set_level(vigil::parse_log_level(argv[i + 1]));
  }

  if (cmd == "version") {
    std::cout << vigil::version::manifest_to_json(vigil::version::current_manifest()) << "\n";
    return 0;
  }

  if (cmd == "stats") {
    std::cout << vigil::global_engine_stats().to_json() << "\n";
    return 0;
  }

  if (cmd == "config-validate") {
    const std::string path = option_value(argc, argv, "--config");
    if (path.empty()) return fail("config-validate requires --config <file>");
    std::string text;
    if (!read_file(path, text)) return fail("cannot read " + path);
    const auto result = vigil::validate_config(text);
    std::cout << vigil::config_validation_to_json(result) << "\n";
    return result.ok ? 0 : kExitFailed;
  }

  if (cmd == "policy-check") {
    const std::string path = option_value(argc, argv, "--policy");
    if (path.empty()) return fail("policy-check requires --policy <file>");
    Object doc;
    if (!load_object(path, doc)) return kExitError;
    const auto validation = vigil::validate_policy(doc);
    const auto snapshot = vigil::PolicySnapshot::from_json(doc);
    vigil::jsonlite::Array errors;
    for (const auto& e : validation.errors) errors.emplace_back(e);
    Object out{{"ok", validation.ok},
               {"errors", std::move(errors)},
               {"key", snapshot.key()},
               {"digest", snapshot.digest()},
               {"snapshot", snapshot.to_json()}};
    std::cout << vigil::jsonlite::to_pretty_json(out) << "\n";
    return validation.ok ? 0 : kExitFailed;
  }

  if (cmd == "backoff") {
    const std::string path = option_value(argc, argv, "--policy");
    const std::string attempts_arg = option_value(argc, argv, "--attempts");
    vigil::PolicySnapshot policy = vigil::default_policy_snapshot();
    if (!path.empty()) {
      Object doc;
      if (!load_object(path, doc)) return kExitError;
      policy = vigil::PolicySnapshot::from_json(doc);
    }
    int attempts = static_cast<int>(policy.retry_max_attempts);
    if (!attempts_arg.empty()) {
      try {
        attempts = std::stoi(attempts_arg);
      } catch (const std::exception&) {
        return fail("--attempts must be an integer");
      }
    }
    attempts = std::clamp(attempts, 1, 100);
    std::mt19937_64 rng(0x5eed);
    vigil::jsonlite::Array table;
    for (int a = 1; a <= attempts; ++a) {
      table.emplace_back(Object{{"attempt", a}, {"delay_seconds", vigil::compute_backoff(policy.retry_backoff, a, rng)}});
    }
    Object out{{"strategy", vigil::to_string(policy.retry_backoff.strategy)},
               {"base_seconds", policy.retry_backoff.base_seconds},
               {"max_seconds", policy.retry_backoff.max_seconds},
               {"delays", std::move(table)}};
    std::cout << vigil::jsonlite::to_pretty_json(out) << "\n";
    return 0;
  }

  if (cmd == "run-case") {
    RunOptions o;
    scan_run_options(argc, argv, o);
    const std::string case_path = option_value(argc, argv, "--case");
    if (case_path.empty()) return fail("run-case requires --case <file>");
    Object doc;
    if (!load_object(case_path, doc)) return kExitError;
    RunSetup setup;
    if (!prepare_run(o, setup)) return kExitError;

    const auto test_case = vigil::CaseDefinition::from_json(doc);
    const std::string report_id = o.report_id.empty() ? default_report_id(test_case.id) : o.report_id;
    try {
      auto orchestrator = make_orchestrator(setup);
      const auto report = orchestrator->run_case(report_id, test_case, setup.policy, setup.seed);
      std::cout << vigil::jsonlite::to_pretty_json(vigil::report_to_value(report)) << "\n";
      return exit_code_for(report.status);
    } catch (const std::exception& e) {
      return fail(e.what());
    }
  }

  if (cmd == "run-suite") {
    RunOptions o;
    scan_run_options(argc, argv, o);
    const std::string suite_path = option_value(argc, argv, "--suite");
    const std::string cases_path = option_value(argc, argv, "--cases");
    if (suite_path.empty()) return fail("run-suite requires --suite <file>");
    Object doc;
    if (!load_object(suite_path, doc)) return kExitError;
    vigil::CaseCatalog catalog;
    if (!cases_path.empty()) {
      Value cases;
      if (!load_json(cases_path, cases)) return kExitError;
      catalog = vigil::case_catalog_from_json(cases);
    }
    RunSetup setup;
    if (!prepare_run(o, setup)) return kExitError;

    const auto suite = vigil::SuiteDefinition::from_json(doc);
    const std::string report_id = o.report_id.empty() ? default_report_id(suite.id) : o.report_id;
    try {
      auto orchestrator = make_orchestrator(setup);
      const auto report = orchestrator->run_suite(report_id, suite, catalog, setup.policy, setup.seed);
      std::cout << vigil::jsonlite::to_pretty_json(vigil::report_to_value(report)) << "\n";
      return exit_code_for(report.status);
    } catch (const std::exception& e) {
      return fail(e.what());
    }
  }

  if (cmd == "run-batch") {
    RunOptions o;
    scan_run_options(argc, argv, o);
    const std::string cases_path = option_value(argc, argv, "--cases");
    const std::string workers_arg = option_value(argc, argv, "--workers");
    if (cases_path.empty()) return fail("run-batch requires --cases <file>");
    Value cases;
    if (!load_json(cases_path, cases)) return kExitError;
    const auto catalog = vigil::case_catalog_from_json(cases);
    size_t workers = 4;
    if (!workers_arg.empty()) {
      try {
        workers = static_cast<size_t>(std::max(1, std::stoi(workers_arg)));
      } catch (const std::exception&) {
        return fail("--workers must be an integer");
      }
    }
    RunSetup setup;
    if (!prepare_run(o, setup)) return kExitError;

    auto orchestrator = make_orchestrator(setup);
    const std::string prefix = o.report_id.empty() ? "batch-" + std::to_string(vigil::unix_time_ms()) : o.report_id;
    vigil::WorkerPool pool(workers);
    std::vector<std::pair<std::string, std::future<vigil::Report>>> pending;
    for (const auto& [id, test_case] : catalog) {
      const std::string report_id = prefix + "-" + id;
      const vigil::CaseDefinition* c = &test_case;
      pending.emplace_back(id, pool.submit([&orchestrator, &setup, report_id, c] {
        return orchestrator->run_case(report_id, *c, setup.policy, setup.seed);
      }));
    }

    int exit_code = kExitPassed;
    size_t passed = 0, failed = 0, errored = 0;
    vigil::jsonlite::Array reports;
    for (auto& [id, fut] : pending) {
      try {
        const vigil::Report report = fut.get();
        exit_code = std::max(exit_code, exit_code_for(report.status));
        if (report.status == vigil::ReportStatus::passed) ++passed;
        else if (report.status == vigil::ReportStatus::failed) ++failed;
        else ++errored;
        reports.push_back(vigil::report_to_value(report));
      } catch (const std::exception& e) {
        exit_code = kExitError;
        ++errored;
        reports.emplace_back(Object{{"entity_id", id}, {"status", "ERROR"}, {"error", e.what()}});
      }
    }
    std::optional<vigil::jsonlite::JsonError> health_err;
    const Value health = vigil::jsonlite::parse_value(
        vigil::worker_health_to_json(vigil::worker_health_snapshot(&pool)), &health_err);
    pool.shutdown();

    Object out{{"worker", health},
               {"summary", Object{{"total", catalog.size()},
                                  {"passed", passed},
                                  {"failed", failed},
                                  {"error", errored},
                                  {"workers", workers}}},
               {"reports", std::move(reports)}};
    std::cout << vigil::jsonlite::to_pretty_json(out) << "\n";
    return exit_code;
  }

  print_usage();
  return kExitError;
}
