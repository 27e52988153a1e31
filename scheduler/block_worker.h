#pragma once

#include "runtime/tensors/tensor.h"
#include "runtime/warm_cache/warm_model_cache.h"
#include "scheduler/execution_plan.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace blockpipe {

struct BlockJob {
  // "{session}_{step}_{block}".
  std::string job_id;
  std::string block_id;
  std::string session_id;
  int step{0};
  TensorMap inputs;
  // Empty means every declared output.
  std::vector<std::string> requested_outputs;
};

struct WorkerResult {
  std::string job_id;
  std::string block_id;
  std::string worker; // "CPU" or "GPU"
  bool success{false};
  std::string error;
  // ErrorKindName() of the failure; empty on success.
  std::string error_type;
  TensorMap outputs;
  double processing_time{0.0};
  double cache_access_time{0.0};
  double inference_time{0.0};
  nlohmann::json load_info;

  const char *status() const { return success ? "success" : "error"; }
};

struct WorkerStats {
  uint64_t jobs_completed{0};
  uint64_t jobs_failed{0};
  double total_processing_time{0.0};
  std::size_t queue_depth{0};
  int threads{0};

  nlohmann::json ToJson() const;
};

// A worker owns an execution context and runs block jobs on it. Results come
// back through a future; a worker never throws out of Submit().
class BlockWorker {
public:
  virtual ~BlockWorker() = default;

  virtual WorkerType Kind() const = 0;
  virtual std::future<WorkerResult> Submit(BlockJob job) = 0;
  virtual WorkerStats Stats() const = 0;
  // Joins the worker threads; queued jobs fail with "worker shutting down".
  virtual void Stop() = 0;
};

// Submits `job` and waits up to `timeout_s`. A job that misses the deadline
// yields a worker_timeout result; the job itself keeps running to completion
// in the background.
WorkerResult DispatchWithTimeout(BlockWorker &worker, BlockJob job,
                                 double timeout_s);

// ── CacheBlockWorker ────────────────────────────────────────────────────────
// Runs jobs against a WarmModelCache on a fixed number of threads. Outputs
// are normalized to a name -> tensor map before they leave the worker.
class CacheBlockWorker : public BlockWorker {
public:
  CacheBlockWorker(WorkerType kind, std::shared_ptr<WarmModelCache> cache,
                   int threads);
  ~CacheBlockWorker() override;

  CacheBlockWorker(const CacheBlockWorker &) = delete;
  CacheBlockWorker &operator=(const CacheBlockWorker &) = delete;

  WorkerType Kind() const override { return kind_; }
  std::future<WorkerResult> Submit(BlockJob job) override;
  WorkerStats Stats() const override;
  void Stop() override;

  WarmModelCache &cache() { return *cache_; }

private:
  struct PendingJob {
    BlockJob job;
    std::promise<WorkerResult> promise;
    std::chrono::steady_clock::time_point enqueue_time;
  };

  void WorkerLoop();
  WorkerResult Execute(const BlockJob &job);
  void UpdateQueueDepthLocked();

  WorkerType kind_;
  std::shared_ptr<WarmModelCache> cache_;
  int thread_count_;

  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<std::shared_ptr<PendingJob>> pending_;
  bool stop_{false};
  std::vector<std::thread> threads_;

  mutable std::mutex stats_mutex_;
  WorkerStats stats_;
};

// Thread-pool worker for CPU execution (two threads by default).
class CpuBlockWorker : public CacheBlockWorker {
public:
  explicit CpuBlockWorker(std::shared_ptr<WarmModelCache> cache,
                          int threads = 2)
      : CacheBlockWorker(WorkerType::kCpu, std::move(cache), threads) {}
};

// Sequential worker: one GPU graph in flight at a time.
class GpuBlockWorker : public CacheBlockWorker {
public:
  explicit GpuBlockWorker(std::shared_ptr<WarmModelCache> cache)
      : CacheBlockWorker(WorkerType::kGpu, std::move(cache), 1) {}
};

} // namespace blockpipe
