#include "vigil/worker.hpp"

#include <unistd.h>  // getpid, gethostname

#include <cstdlib>
#include <mutex>

#include "vigil/jsonlite.hpp"
#include "vigil/observability.hpp"

namespace vigil {

namespace {

WorkerIdentity g_worker_identity;
std::mutex g_init_mu;
bool g_initialized{false};

std::string get_hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) == 0 && buf[0]) return buf;
  return "unknown-host";
}

std::string from_env_or(const char* name, std::string fallback) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? std::string(e) : fallback;
}

// Caller holds g_init_mu.
void resolve_identity_locked(const std::string& worker_id, const std::string& node_id) {
  g_worker_identity.worker_id = !worker_id.empty()
                                    ? worker_id
                                    : from_env_or("VIGIL_WORKER_ID", "w-" + std::to_string(::getpid()));
  g_worker_identity.node_id = !node_id.empty() ? node_id : from_env_or("VIGIL_NODE_ID", get_hostname());
  g_initialized = true;
}

}  // namespace

WorkerIdentity init_worker_identity(const std::string& worker_id, const std::string& node_id) {
  std::lock_guard<std::mutex> lk(g_init_mu);
  resolve_identity_locked(worker_id, node_id);
  return g_worker_identity;
}

WorkerIdentity global_worker_identity() {
  std::lock_guard<std::mutex> lk(g_init_mu);
  if (!g_initialized) resolve_identity_locked("", "");
  return g_worker_identity;
}

std::string worker_identity_to_json(const WorkerIdentity& w) {
  jsonlite::Object o;
  o["worker_id"] = w.worker_id;
  o["node_id"] = w.node_id;
  return jsonlite::to_json(o);
}

WorkerHealth worker_health_snapshot(const WorkerPool* pool) {
  WorkerHealth h;
  h.worker_id = global_worker_identity().worker_id;
  h.runs_total = global_engine_stats().runs_total.load(std::memory_order_relaxed);
  if (pool) {
    h.runs_inflight = pool->inflight();
    h.queue_depth = pool->queue_depth();
    if (pool->size() > 0) {
      h.utilization_pct = 100.0 * static_cast<double>(h.runs_inflight) / static_cast<double>(pool->size());
    }
  }
  return h;
}

std::string worker_health_to_json(const WorkerHealth& h) {
  jsonlite::Object o;
  o["worker_id"] = h.worker_id;
  o["runs_total"] = h.runs_total;
  o["runs_inflight"] = h.runs_inflight;
  o["queue_depth"] = h.queue_depth;
  o["utilization_pct"] = h.utilization_pct;
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// WorkerPool
// ---------------------------------------------------------------------------

WorkerPool::WorkerPool(size_t threads) {
  if (threads == 0) threads = 1;
  threads_.reserve(threads);
  for (size_t i = 0; i < threads; ++i) threads_.emplace_back([this] { loop(); });
}

WorkerPool::~WorkerPool() { shutdown(); }

void WorkerPool::shutdown() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_ && threads_.empty()) return;
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
}

std::uint64_t WorkerPool::queue_depth() const {
  std::lock_guard<std::mutex> lk(mu_);
  return queue_.size();
}

void WorkerPool::loop() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) return;  // stopping and drained
      job = std::move(queue_.front());
      queue_.pop();
    }
    inflight_.fetch_add(1, std::memory_order_relaxed);
    job();  // packaged_task captures exceptions into the future
    inflight_.fetch_sub(1, std::memory_order_relaxed);
  }
}

}  // namespace vigil
