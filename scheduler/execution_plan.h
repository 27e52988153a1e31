#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace blockpipe {

enum class WorkerType { kCpu, kGpu };

inline const char *WorkerTypeName(WorkerType type) {
  return type == WorkerType::kGpu ? "GPU" : "CPU";
}
inline WorkerType OtherWorker(WorkerType type) {
  return type == WorkerType::kGpu ? WorkerType::kCpu : WorkerType::kGpu;
}
// Accepts "CPU"/"GPU" in any case.
std::optional<WorkerType> ParseWorkerType(const std::string &name);

// Base block -> worker assignment the adaptive scheduler starts from.
struct ExecutionPlan {
  std::map<std::string, WorkerType> assignments;
  // "default", "plan_file" or "profile_split".
  std::string source{"default"};

  bool Has(const std::string &block_id) const;
  // Throws std::out_of_range for unplanned blocks.
  WorkerType Get(const std::string &block_id) const;
  void ApplyForceCpu(const std::set<std::string> &force_cpu_blocks);
  nlohmann::json ToJson() const;
};

// Force-CPU and memory-intensive blocks on CPU, everything else on GPU.
ExecutionPlan DefaultExecutionPlan(const std::vector<std::string> &chain,
                                   const std::set<std::string> &cpu_blocks);

// {"block_1": "GPU", ...}. Blocks of `chain` missing from the file are
// placed on GPU. Throws ConfigError on unreadable files or bad values.
ExecutionPlan LoadExecutionPlanFile(const std::filesystem::path &path,
                                    const std::vector<std::string> &chain);

// ── StaticSplitPlanner ──────────────────────────────────────────────────────
// Chooses the split k over the chain that minimizes
// max(sum of CPU times of blocks [0, k), sum of GPU times of blocks [k, n)),
// reading per-block timings from a profile:
//
//   {"block_1": {"CPUExecutionProvider": {"mean_ms": 41.2},
//                "CUDAExecutionProvider": {"measurements_ms": [9.8, 10.1]}}}
//
// Missing timings count as 1000 ms.
class StaticSplitPlanner {
public:
  static constexpr double kMissingTimeMs = 1000.0;

  struct SplitPoint {
    std::size_t k{0};
    double cpu_ms{0.0};
    double gpu_ms{0.0};
    double pipeline_ms{0.0};
  };

  StaticSplitPlanner(nlohmann::json profile, std::vector<std::string> chain);

  // Throws ConfigError when the profile cannot be read.
  static StaticSplitPlanner FromFile(const std::filesystem::path &path,
                                     std::vector<std::string> chain);

  ExecutionPlan Plan();
  double BlockTimeMs(const std::string &block_id, WorkerType worker) const;
  const std::vector<SplitPoint> &analysis() const { return analysis_; }
  const SplitPoint &best() const { return best_; }

private:
  nlohmann::json profile_;
  std::vector<std::string> chain_;
  std::vector<SplitPoint> analysis_;
  SplitPoint best_;
};

// Plan file first, then the profiling split, then the default plan. The
// force-CPU list is applied on top of whichever plan is chosen.
ExecutionPlan ResolveExecutionPlan(const std::filesystem::path &plan_file,
                                   const std::filesystem::path &profile_file,
                                   const std::vector<std::string> &chain,
                                   const std::set<std::string> &force_cpu,
                                   const std::set<std::string> &memory_intensive);

} // namespace blockpipe
