#include "scheduler/adaptive_block_scheduler.h"

#include "server/logging/logger.h"

#include <chrono>

using json = nlohmann::json;

namespace blockpipe {

namespace {

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::set<std::string> BlockRange(int first, int last) {
  std::set<std::string> out;
  for (int i = first; i <= last; ++i) {
    out.insert("block_" + std::to_string(i));
  }
  return out;
}

} // namespace

SchedulerPolicy SchedulerPolicy::Defaults() {
  SchedulerPolicy policy;
  policy.force_cpu_blocks = BlockRange(28, 33);
  policy.memory_intensive_blocks = BlockRange(28, 33);
  policy.limited_gpu_large_blocks = BlockRange(30, 33);
  policy.tail_cpu_blocks = BlockRange(30, 33);
  return policy;
}

SchedulingDecision DecideWorker(const std::string &block_id, WorkerType base,
                                const TelemetrySnapshot &telemetry,
                                const SchedulerPolicy &policy) {
  if (policy.force_cpu_blocks.count(block_id)) {
    return {WorkerType::kCpu, "force_cpu"};
  }
  if (!policy.adaptive) {
    return {base, "base"};
  }
  if (policy.memory_intensive_blocks.count(block_id) &&
      telemetry.memory.usage_percent > policy.memory_high_water_percent) {
    return {WorkerType::kCpu, "memory_pressure"};
  }
  if (telemetry.gpu.capacity_limited &&
      policy.limited_gpu_large_blocks.count(block_id)) {
    return {WorkerType::kCpu, "limited_gpu_capacity"};
  }

  const double cpu_pf = telemetry.cpu.performance_factor;
  const double gpu_pf = telemetry.gpu.performance_factor;
  if (base == WorkerType::kGpu) {
    if (!telemetry.gpu.available) {
      return {WorkerType::kCpu, "gpu_unavailable"};
    }
    if (gpu_pf < policy.gpu_threshold && cpu_pf > policy.cpu_threshold) {
      return {WorkerType::kCpu, "gpu_overloaded"};
    }
    if (cpu_pf < policy.cpu_critical) {
      return {WorkerType::kGpu, "cpu_critical"};
    }
    return {base, "base"};
  }

  if (telemetry.gpu.available && !policy.tail_cpu_blocks.count(block_id) &&
      cpu_pf < policy.cpu_threshold && gpu_pf > policy.gpu_promote) {
    return {WorkerType::kGpu, "gpu_promotion"};
  }
  return {base, "base"};
}

json AssignmentChange::ToJson() const {
  return {{"block_id", block_id},
          {"from", from},
          {"to", to},
          {"reason", reason},
          {"timestamp", timestamp_ms}};
}

json FallbackEvent::ToJson() const {
  return {{"block_id", block_id}, {"from", from},       {"to", to},
          {"reason", reason},     {"success", success}, {"timestamp", timestamp_ms}};
}

json BlockExecutionStats::ToJson() const {
  double avg = 0.0;
  for (double t : execution_times) {
    avg += t;
  }
  if (!execution_times.empty()) {
    avg /= static_cast<double>(execution_times.size());
  }
  json errs = json::array();
  for (const auto &e : errors) {
    errs.push_back(e);
  }
  return {{"total", total},
          {"successful", successful},
          {"failed", failed},
          {"avg_execution_time", avg},
          {"execution_times",
           std::vector<double>(execution_times.begin(), execution_times.end())},
          {"errors", errs}};
}

void BlockAssignmentBook::Initialize(const ExecutionPlan &plan) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_.clear();
  history_.clear();
  const int64_t now = NowMs();
  for (const auto &[block, worker] : plan.assignments) {
    current_[block] = worker;
    history_.push_back(
        {block, "none", WorkerTypeName(worker), plan.source, now});
  }
}

bool BlockAssignmentBook::Assign(const std::string &block_id,
                                 WorkerType worker,
                                 const std::string &reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = current_.find(block_id);
  std::string from = "none";
  if (it != current_.end()) {
    if (it->second == worker) {
      return false;
    }
    from = WorkerTypeName(it->second);
  }
  current_[block_id] = worker;
  history_.push_back({block_id, from, WorkerTypeName(worker), reason, NowMs()});
  while (history_.size() > kMaxHistory) {
    history_.pop_front();
  }
  return true;
}

std::optional<WorkerType>
BlockAssignmentBook::Current(const std::string &block_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = current_.find(block_id);
  if (it == current_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void BlockAssignmentBook::RecordExecution(const std::string &block_id,
                                          WorkerType worker, double seconds,
                                          bool success,
                                          const std::string &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &stats = execution_[block_id];
  ++stats.total;
  ++blocks_processed_;
  if (success) {
    ++stats.successful;
    stats.execution_times.push_back(seconds);
    if (stats.execution_times.size() > BlockExecutionStats::kMaxTimes) {
      stats.execution_times.pop_front();
    }
  } else {
    ++stats.failed;
    stats.errors.push_back({{"worker", WorkerTypeName(worker)},
                            {"error", error},
                            {"timestamp", NowMs()}});
    if (stats.errors.size() > BlockExecutionStats::kMaxErrors) {
      stats.errors.pop_front();
    }
  }
}

void BlockAssignmentBook::RecordFallback(FallbackEvent event) {
  if (event.timestamp_ms == 0) {
    event.timestamp_ms = NowMs();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  fallbacks_.push_back(std::move(event));
  while (fallbacks_.size() > kMaxHistory) {
    fallbacks_.pop_front();
  }
}

std::vector<AssignmentChange> BlockAssignmentBook::History() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {history_.begin(), history_.end()};
}

std::vector<FallbackEvent> BlockAssignmentBook::Fallbacks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {fallbacks_.begin(), fallbacks_.end()};
}

std::optional<BlockExecutionStats>
BlockAssignmentBook::ExecutionStats(const std::string &block_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = execution_.find(block_id);
  if (it == execution_.end()) {
    return std::nullopt;
  }
  return it->second;
}

json BlockAssignmentBook::StatsJson() const {
  std::lock_guard<std::mutex> lock(mutex_);
  json current = json::object();
  for (const auto &[block, worker] : current_) {
    current[block] = WorkerTypeName(worker);
  }
  json changes = json::array();
  for (const auto &change : history_) {
    changes.push_back(change.ToJson());
  }
  json fallbacks = json::array();
  for (const auto &event : fallbacks_) {
    fallbacks.push_back(event.ToJson());
  }
  json execution = json::object();
  for (const auto &[block, stats] : execution_) {
    execution[block] = stats.ToJson();
  }
  return {{"assignment_stats",
           {{"current_assignments", current},
            {"assignment_changes", changes},
            {"fallback_events", fallbacks},
            {"total_blocks_processed", blocks_processed_}}},
          {"execution_stats", execution}};
}

AdaptiveBlockScheduler::AdaptiveBlockScheduler(ExecutionPlan plan,
                                               SchedulerPolicy policy,
                                               BlockAssignmentBook *book)
    : plan_(std::move(plan)), policy_(std::move(policy)), book_(book) {
  if (book_) {
    book_->Initialize(plan_);
  }
}

WorkerType AdaptiveBlockScheduler::Resolve(const std::string &block_id,
                                           const TelemetrySnapshot &telemetry) {
  const WorkerType base = plan_.Get(block_id);
  SchedulingDecision decision =
      DecideWorker(block_id, base, telemetry, policy_);
  if (book_ && book_->Assign(block_id, decision.worker, decision.reason)) {
    log::Debug("scheduler", block_id + " -> " +
                                WorkerTypeName(decision.worker),
               decision.reason);
  }
  return decision.worker;
}

} // namespace blockpipe
