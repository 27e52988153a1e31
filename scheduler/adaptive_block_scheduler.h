#pragma once

#include "runtime/telemetry/system_profiler.h"
#include "scheduler/execution_plan.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace blockpipe {

struct SchedulerPolicy {
  bool adaptive{true};
  std::set<std::string> force_cpu_blocks;
  std::set<std::string> memory_intensive_blocks;
  // Large blocks kept off a capacity-limited (integrated) GPU.
  std::set<std::string> limited_gpu_large_blocks;
  // Tail blocks never promoted from CPU to GPU.
  std::set<std::string> tail_cpu_blocks;

  double memory_high_water_percent{85.0};
  // GPU-assigned blocks move to CPU when gpu_pf < gpu_threshold and
  // cpu_pf > cpu_threshold.
  double gpu_threshold{0.6};
  double cpu_threshold{0.3};
  // Below this CPU factor a GPU assignment is never moved to CPU.
  double cpu_critical{0.2};
  // CPU-assigned blocks move to GPU when cpu_pf < cpu_threshold and
  // gpu_pf > gpu_promote.
  double gpu_promote{0.7};

  // block_28..33 forced to CPU and treated as memory intensive;
  // block_30..33 as large and tail blocks.
  static SchedulerPolicy Defaults();
};

struct SchedulingDecision {
  WorkerType worker{WorkerType::kGpu};
  // "base", "force_cpu", "memory_pressure", "limited_gpu_capacity",
  // "gpu_unavailable", "gpu_overloaded", "cpu_critical", "gpu_promotion".
  std::string reason{"base"};
};

// Pure worker selection for one block. Rules, first match wins:
//   1. force-CPU blocks run on CPU;
//   2. memory-intensive blocks run on CPU above the memory high-water mark;
//   3. large blocks run on CPU when the GPU is capacity limited;
//   4. GPU blocks fall back to CPU when no GPU is present, or when the GPU is
//      busy and the CPU has headroom (unless the CPU is critically loaded);
//   5. CPU blocks (except tail blocks) move to GPU when the CPU is loaded
//      and the GPU is comfortable;
//   6. otherwise the base assignment stands.
SchedulingDecision DecideWorker(const std::string &block_id, WorkerType base,
                                const TelemetrySnapshot &telemetry,
                                const SchedulerPolicy &policy);

inline WorkerType SelectWorker(const std::string &block_id, WorkerType base,
                               const TelemetrySnapshot &telemetry,
                               const SchedulerPolicy &policy) {
  return DecideWorker(block_id, base, telemetry, policy).worker;
}

struct AssignmentChange {
  std::string block_id;
  std::string from; // "none" for the initial assignment
  std::string to;
  std::string reason;
  int64_t timestamp_ms{0};

  nlohmann::json ToJson() const;
};

struct FallbackEvent {
  std::string block_id;
  std::string from;
  std::string to;
  std::string reason{"primary_worker_failure"};
  bool success{false};
  int64_t timestamp_ms{0};

  nlohmann::json ToJson() const;
};

struct BlockExecutionStats {
  static constexpr std::size_t kMaxTimes = 100;
  static constexpr std::size_t kMaxErrors = 20;

  uint64_t total{0};
  uint64_t successful{0};
  uint64_t failed{0};
  std::deque<double> execution_times;
  std::deque<nlohmann::json> errors;

  nlohmann::json ToJson() const;
};

// ── BlockAssignmentBook ─────────────────────────────────────────────────────
// Current worker per block plus the history of how it got there, fallback
// events and per-block execution statistics. Thread-safe.
class BlockAssignmentBook {
public:
  static constexpr std::size_t kMaxHistory = 1000;

  void Initialize(const ExecutionPlan &plan);
  // Records a change when `worker` differs from the current assignment.
  // Returns true when a change was recorded.
  bool Assign(const std::string &block_id, WorkerType worker,
              const std::string &reason);
  std::optional<WorkerType> Current(const std::string &block_id) const;

  void RecordExecution(const std::string &block_id, WorkerType worker,
                       double seconds, bool success,
                       const std::string &error = {});
  void RecordFallback(FallbackEvent event);

  std::vector<AssignmentChange> History() const;
  std::vector<FallbackEvent> Fallbacks() const;
  std::optional<BlockExecutionStats>
  ExecutionStats(const std::string &block_id) const;

  // {"assignment_stats": {...}, "execution_stats": {...}}
  nlohmann::json StatsJson() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, WorkerType> current_;
  std::deque<AssignmentChange> history_;
  std::deque<FallbackEvent> fallbacks_;
  std::map<std::string, BlockExecutionStats> execution_;
  uint64_t blocks_processed_{0};
};

// Combines the base plan, the policy and the latest telemetry, recording
// every decision in the assignment book.
class AdaptiveBlockScheduler {
public:
  AdaptiveBlockScheduler(ExecutionPlan plan, SchedulerPolicy policy,
                         BlockAssignmentBook *book);

  // Throws std::out_of_range for blocks without a plan entry.
  WorkerType Resolve(const std::string &block_id,
                     const TelemetrySnapshot &telemetry);
  WorkerType Base(const std::string &block_id) const {
    return plan_.Get(block_id);
  }

  const ExecutionPlan &plan() const { return plan_; }
  const SchedulerPolicy &policy() const { return policy_; }

private:
  ExecutionPlan plan_;
  SchedulerPolicy policy_;
  BlockAssignmentBook *book_;
};

} // namespace blockpipe
