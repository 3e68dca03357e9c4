#include "vigil/audit.hpp"

#include <cstdio>
#include <cstdlib>
#include <mutex>

#include "vigil/hash.hpp"
#include "vigil/jsonlite.hpp"
#include "vigil/types.hpp"
#include "vigil/version.hpp"

namespace vigil {

std::string run_record_to_json(const RunRecord& r) {
  jsonlite::Object o;
  o["v"] = version::AUDIT_LOG_VERSION;
  o["seq"] = r.sequence;
  o["prev"] = r.previous_digest;
  o["report_id"] = r.report_id;
  o["kind"] = r.kind;
  o["status"] = r.status;
  o["policy_key"] = r.policy_key;
  o["policy_digest"] = r.policy_digest;
  o["attempts_used"] = r.attempts_used;
  o["duration_ms"] = r.duration_ms;
  if (!r.error_code.empty()) o["error_code"] = r.error_code;
  o["worker_id"] = r.worker_id;
  o["node_id"] = r.node_id;
  o["timestamp_unix_ms"] = r.timestamp_unix_ms;
  return jsonlite::to_json(o);
}

struct ImmutableAuditLog::Impl {
  std::mutex mu;
  std::FILE* file{nullptr};
  std::uint64_t seq{0};
  std::uint64_t entry_count{0};
  std::uint64_t failure_count{0};
  std::string last_digest = std::string(64, '0');
};

ImmutableAuditLog::ImmutableAuditLog(const std::string& path) : path_(path), impl_(std::make_unique<Impl>()) {
  if (!path_.empty()) {
    impl_->file = std::fopen(path_.c_str(), "a");
    if (!impl_->file) ++impl_->failure_count;
  }
}

ImmutableAuditLog::~ImmutableAuditLog() {
  if (impl_ && impl_->file) std::fclose(impl_->file);
}

bool ImmutableAuditLog::append(RunRecord& record) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (path_.empty()) return true;
  if (!impl_->file) {
    ++impl_->failure_count;
    return false;
  }

  record.sequence = impl_->seq + 1;
  record.previous_digest = impl_->last_digest;
  record.timestamp_unix_ms = unix_time_ms();

  const std::string line = run_record_to_json(record);
  const std::string framed = line + "\n";
  const bool written = std::fwrite(framed.data(), 1, framed.size(), impl_->file) == framed.size();
  std::fflush(impl_->file);
  if (!written) {
    ++impl_->failure_count;
    return false;
  }
  impl_->seq = record.sequence;
  impl_->last_digest = audit_chain_digest(line);
  ++impl_->entry_count;
  return true;
}

bool ImmutableAuditLog::enabled() const { return !path_.empty(); }

std::uint64_t ImmutableAuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

std::uint64_t ImmutableAuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

namespace {
std::mutex g_audit_init_mu;
std::string g_audit_path;
bool g_audit_path_set = false;
}  // namespace

void set_audit_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_audit_init_mu);
  g_audit_path = path;
  g_audit_path_set = true;
}

ImmutableAuditLog& global_audit_log() {
  static ImmutableAuditLog* instance = [] {
    std::lock_guard<std::mutex> lk(g_audit_init_mu);
    std::string path;
    if (g_audit_path_set) {
      path = g_audit_path;
    } else if (const char* env = std::getenv("VIGIL_AUDIT_LOG"); env && env[0]) {
      path = env;
    }
    return new ImmutableAuditLog(path);
  }();
  return *instance;
}

}  // namespace vigil
