#pragma once

// vigil/worker.hpp — Worker identity and the thread pool that runs cases.
//
// SCHEDULING:
//   Each submitted run occupies one pool thread from start to finish,
//   including its rate-limit, backoff and circuit-breaker sleeps. Nothing
//   else is scheduled on that thread meanwhile, so a pool of N threads runs
//   at most N runs at once. Policy concurrency limits apply on top of that.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace vigil {

struct WorkerIdentity {
  std::string worker_id;  // "w-<pid>" unless configured
  std::string node_id;    // host name unless configured
};

// Sources, in priority order: explicit arguments, VIGIL_WORKER_ID /
// VIGIL_NODE_ID, defaults.
WorkerIdentity init_worker_identity(const std::string& worker_id = "", const std::string& node_id = "");
// Returns a copy; init_worker_identity may replace the identity concurrently.
WorkerIdentity global_worker_identity();
std::string worker_identity_to_json(const WorkerIdentity& w);

struct WorkerHealth {
  std::string worker_id;
  std::uint64_t runs_total{0};
  std::uint64_t runs_inflight{0};
  std::uint64_t queue_depth{0};
  double utilization_pct{0.0};
};

class WorkerPool;
WorkerHealth worker_health_snapshot(const WorkerPool* pool = nullptr);
std::string worker_health_to_json(const WorkerHealth& h);

// ---------------------------------------------------------------------------
// WorkerPool — fixed set of threads draining a FIFO queue
// ---------------------------------------------------------------------------
class WorkerPool {
 public:
  explicit WorkerPool(size_t threads);
  ~WorkerPool();
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Exceptions thrown by fn surface through the returned future.
  template <typename F>
  auto submit(F fn) -> std::future<std::invoke_result_t<F>> {
    using R = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    std::future<R> fut = task->get_future();
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (stopping_) throw std::runtime_error("worker pool is shutting down");
      queue_.push([task] { (*task)(); });
    }
    cv_.notify_one();
    return fut;
  }

  // Finishes queued work, then joins. Idempotent.
  void shutdown();

  size_t size() const { return threads_.size(); }
  std::uint64_t inflight() const { return inflight_.load(std::memory_order_relaxed); }
  std::uint64_t queue_depth() const;

 private:
  void loop();

  std::vector<std::thread> threads_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::queue<std::function<void()>> queue_;
  bool stopping_{false};
  std::atomic<std::uint64_t> inflight_{0};
};

}  // namespace vigil
