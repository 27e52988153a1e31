#include "scheduler/block_worker.h"

#include "runtime/errors.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <new>
#include <sstream>

using json = nlohmann::json;

namespace blockpipe {

namespace {

double SecondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       start)
      .count();
}

WorkerResult ErrorResult(const BlockJob &job, WorkerType kind,
                         ErrorKind error_kind, const std::string &message) {
  WorkerResult result;
  result.job_id = job.job_id;
  result.block_id = job.block_id;
  result.worker = WorkerTypeName(kind);
  result.success = false;
  result.error = message;
  result.error_type = ErrorKindName(error_kind);
  return result;
}

std::string FormatSeconds(double seconds) {
  std::ostringstream oss;
  oss << seconds;
  return oss.str();
}

} // namespace

json WorkerStats::ToJson() const {
  const uint64_t total = jobs_completed + jobs_failed;
  return {{"jobs_completed", jobs_completed},
          {"jobs_failed", jobs_failed},
          {"total_processing_time", total_processing_time},
          {"avg_processing_time",
           total ? total_processing_time / static_cast<double>(total) : 0.0},
          {"queue_depth", queue_depth},
          {"threads", threads}};
}

WorkerResult DispatchWithTimeout(BlockWorker &worker, BlockJob job,
                                 double timeout_s) {
  BlockJob copy_for_error;
  copy_for_error.job_id = job.job_id;
  copy_for_error.block_id = job.block_id;

  std::future<WorkerResult> future = worker.Submit(std::move(job));
  auto status = future.wait_for(std::chrono::duration<double>(timeout_s));
  if (status != std::future_status::ready) {
    log::Warn("worker",
              std::string(WorkerTypeName(worker.Kind())) + " timed out on " +
                  copy_for_error.block_id,
              copy_for_error.job_id);
    return ErrorResult(copy_for_error, worker.Kind(), ErrorKind::kWorkerTimeout,
                       "Worker timeout after " + FormatSeconds(timeout_s) +
                           "s");
  }
  return future.get();
}

CacheBlockWorker::CacheBlockWorker(WorkerType kind,
                                   std::shared_ptr<WarmModelCache> cache,
                                   int threads)
    : kind_(kind), cache_(std::move(cache)),
      thread_count_(threads < 1 ? 1 : threads) {
  stats_.threads = thread_count_;
  threads_.reserve(static_cast<std::size_t>(thread_count_));
  for (int i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&CacheBlockWorker::WorkerLoop, this);
  }
  log::Info("worker", std::string(WorkerTypeName(kind_)) + " worker started",
            "threads=" + std::to_string(thread_count_));
}

CacheBlockWorker::~CacheBlockWorker() { Stop(); }

std::future<WorkerResult> CacheBlockWorker::Submit(BlockJob job) {
  auto pending = std::make_shared<PendingJob>();
  pending->job = std::move(job);
  pending->enqueue_time = std::chrono::steady_clock::now();
  auto future = pending->promise.get_future();
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (stop_) {
      pending->promise.set_value(ErrorResult(pending->job, kind_,
                                             ErrorKind::kWorkerExecution,
                                             "worker shutting down"));
      return future;
    }
    pending_.push_back(pending);
    UpdateQueueDepthLocked();
  }
  queue_cv_.notify_one();
  return future;
}

void CacheBlockWorker::UpdateQueueDepthLocked() {
  GlobalMetrics().SetWorkerQueueDepth(WorkerTypeName(kind_),
                                      static_cast<int>(pending_.size()));
}

void CacheBlockWorker::Stop() {
  std::deque<std::shared_ptr<PendingJob>> abandoned;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (stop_ && threads_.empty()) {
      return;
    }
    stop_ = true;
    abandoned.swap(pending_);
    UpdateQueueDepthLocked();
  }
  queue_cv_.notify_all();
  for (auto &t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
  threads_.clear();
  for (auto &pending : abandoned) {
    pending->promise.set_value(ErrorResult(pending->job, kind_,
                                           ErrorKind::kWorkerExecution,
                                           "worker shutting down"));
  }
}

void CacheBlockWorker::WorkerLoop() {
  while (true) {
    std::shared_ptr<PendingJob> pending;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [&] { return stop_ || !pending_.empty(); });
      if (stop_ && pending_.empty()) {
        break;
      }
      pending = pending_.front();
      pending_.pop_front();
      UpdateQueueDepthLocked();
    }

    WorkerResult result = Execute(pending->job);
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      if (result.success) {
        ++stats_.jobs_completed;
      } else {
        ++stats_.jobs_failed;
      }
      stats_.total_processing_time += result.processing_time;
    }
    GlobalMetrics().RecordBlockExecution(WorkerTypeName(kind_), result.success,
                                         result.processing_time);
    pending->promise.set_value(std::move(result));
  }
}

WorkerResult CacheBlockWorker::Execute(const BlockJob &job) {
  const auto start = std::chrono::steady_clock::now();
  WorkerResult result;
  try {
    SessionLease lease = cache_->GetSession(job.block_id);
    result.cache_access_time = SecondsSince(start);
    result.load_info = lease.info.ToJson();
    if (!lease.session) {
      result = ErrorResult(job, kind_, ErrorKind::kLoad,
                           "Failed to load session for " + job.block_id);
      result.load_info = lease.info.ToJson();
      result.processing_time = SecondsSince(start);
      return result;
    }

    const auto infer_start = std::chrono::steady_clock::now();
    result.outputs = cache_->Execute(*lease.session, job.block_id, job.inputs,
                                     job.requested_outputs);
    result.inference_time = SecondsSince(infer_start);
    result.success = true;
  } catch (const std::bad_alloc &) {
    result = ErrorResult(job, kind_, ErrorKind::kWorkerExecution,
                         "bad allocation while executing " + job.block_id);
  } catch (const std::exception &ex) {
    result = ErrorResult(job, kind_, ErrorKind::kWorkerExecution, ex.what());
  }
  result.job_id = job.job_id;
  result.block_id = job.block_id;
  result.worker = WorkerTypeName(kind_);
  result.processing_time = SecondsSince(start);
  if (!result.success) {
    log::Warn("worker",
              std::string(WorkerTypeName(kind_)) + " failed " + job.block_id,
              result.error);
  }
  return result;
}

WorkerStats CacheBlockWorker::Stats() const {
  WorkerStats out;
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    out = stats_;
  }
  std::lock_guard<std::mutex> lock(queue_mutex_);
  out.queue_depth = pending_.size();
  return out;
}

} // namespace blockpipe
