#include "scheduler/execution_plan.h"

#include "runtime/errors.h"
#include "server/logging/logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <numeric>
#include <stdexcept>

using json = nlohmann::json;

namespace blockpipe {

namespace {

json ReadJsonFile(const std::filesystem::path &path, const char *what) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError(std::string("cannot open ") + what + " " +
                      path.string());
  }
  try {
    json j;
    in >> j;
    return j;
  } catch (const json::exception &ex) {
    throw ConfigError(std::string("invalid ") + what + " " + path.string() +
                      ": " + ex.what());
  }
}

double ProviderTimeMs(const json &provider) {
  if (provider.contains("mean_ms") && provider["mean_ms"].is_number()) {
    return provider["mean_ms"].get<double>();
  }
  if (provider.contains("measurements_ms") &&
      provider["measurements_ms"].is_array() &&
      !provider["measurements_ms"].empty()) {
    double sum = 0.0;
    for (const auto &m : provider["measurements_ms"]) {
      sum += m.get<double>();
    }
    return sum / static_cast<double>(provider["measurements_ms"].size());
  }
  return StaticSplitPlanner::kMissingTimeMs;
}

} // namespace

std::optional<WorkerType> ParseWorkerType(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "CPU") {
    return WorkerType::kCpu;
  }
  if (upper == "GPU") {
    return WorkerType::kGpu;
  }
  return std::nullopt;
}

bool ExecutionPlan::Has(const std::string &block_id) const {
  return assignments.count(block_id) > 0;
}

WorkerType ExecutionPlan::Get(const std::string &block_id) const {
  auto it = assignments.find(block_id);
  if (it == assignments.end()) {
    throw std::out_of_range("no execution plan entry for " + block_id);
  }
  return it->second;
}

void ExecutionPlan::ApplyForceCpu(const std::set<std::string> &force_cpu) {
  for (auto &[block, worker] : assignments) {
    if (force_cpu.count(block) && worker != WorkerType::kCpu) {
      log::Info("scheduler", block + " forced to CPU over " + source +
                                 " plan");
      worker = WorkerType::kCpu;
    }
  }
}

json ExecutionPlan::ToJson() const {
  json j = json::object();
  for (const auto &[block, worker] : assignments) {
    j[block] = WorkerTypeName(worker);
  }
  return {{"source", source}, {"assignments", j}};
}

ExecutionPlan DefaultExecutionPlan(const std::vector<std::string> &chain,
                                   const std::set<std::string> &cpu_blocks) {
  ExecutionPlan plan;
  plan.source = "default";
  for (const auto &block : chain) {
    plan.assignments[block] =
        cpu_blocks.count(block) ? WorkerType::kCpu : WorkerType::kGpu;
  }
  return plan;
}

ExecutionPlan LoadExecutionPlanFile(const std::filesystem::path &path,
                                    const std::vector<std::string> &chain) {
  json root = ReadJsonFile(path, "execution plan");
  if (!root.is_object()) {
    throw ConfigError("execution plan must be a JSON object");
  }
  ExecutionPlan plan;
  plan.source = "plan_file";
  for (const auto &block : chain) {
    plan.assignments[block] = WorkerType::kGpu;
  }
  for (auto it = root.begin(); it != root.end(); ++it) {
    if (!it.value().is_string()) {
      throw ConfigError("execution plan entry for " + it.key() +
                        " must be \"CPU\" or \"GPU\"");
    }
    auto worker = ParseWorkerType(it.value().get<std::string>());
    if (!worker) {
      throw ConfigError("execution plan entry for " + it.key() +
                        " must be \"CPU\" or \"GPU\"");
    }
    plan.assignments[it.key()] = *worker;
  }
  return plan;
}

StaticSplitPlanner::StaticSplitPlanner(json profile,
                                       std::vector<std::string> chain)
    : profile_(std::move(profile)), chain_(std::move(chain)) {}

StaticSplitPlanner
StaticSplitPlanner::FromFile(const std::filesystem::path &path,
                             std::vector<std::string> chain) {
  return StaticSplitPlanner(ReadJsonFile(path, "performance profile"),
                            std::move(chain));
}

double StaticSplitPlanner::BlockTimeMs(const std::string &block_id,
                                       WorkerType worker) const {
  if (!profile_.is_object() || !profile_.contains(block_id)) {
    return kMissingTimeMs;
  }
  const json &block = profile_[block_id];
  static const char *kCpuProviders[] = {"CPUExecutionProvider", "CPU"};
  static const char *kGpuProviders[] = {"CUDAExecutionProvider",
                                        "DmlExecutionProvider",
                                        "ROCMExecutionProvider", "GPU"};
  if (worker == WorkerType::kCpu) {
    for (const char *key : kCpuProviders) {
      if (block.contains(key)) {
        return ProviderTimeMs(block[key]);
      }
    }
  } else {
    for (const char *key : kGpuProviders) {
      if (block.contains(key)) {
        return ProviderTimeMs(block[key]);
      }
    }
  }
  return kMissingTimeMs;
}

ExecutionPlan StaticSplitPlanner::Plan() {
  const std::size_t n = chain_.size();
  std::vector<double> cpu(n);
  std::vector<double> gpu(n);
  for (std::size_t i = 0; i < n; ++i) {
    cpu[i] = BlockTimeMs(chain_[i], WorkerType::kCpu);
    gpu[i] = BlockTimeMs(chain_[i], WorkerType::kGpu);
  }

  analysis_.clear();
  best_ = SplitPoint{};
  best_.pipeline_ms = std::numeric_limits<double>::infinity();
  for (std::size_t k = 0; k <= n; ++k) {
    SplitPoint point;
    point.k = k;
    point.cpu_ms = std::accumulate(cpu.begin(), cpu.begin() + k, 0.0);
    point.gpu_ms = std::accumulate(gpu.begin() + k, gpu.end(), 0.0);
    point.pipeline_ms = std::max(point.cpu_ms, point.gpu_ms);
    analysis_.push_back(point);
    if (point.pipeline_ms < best_.pipeline_ms) {
      best_ = point;
    }
  }

  ExecutionPlan plan;
  plan.source = "profile_split";
  for (std::size_t i = 0; i < n; ++i) {
    plan.assignments[chain_[i]] = i < best_.k ? WorkerType::kCpu
                                              : WorkerType::kGpu;
  }
  log::Info("scheduler",
            "static split k=" + std::to_string(best_.k) + " of " +
                std::to_string(n),
            "pipeline_ms=" + std::to_string(best_.pipeline_ms));
  return plan;
}

ExecutionPlan ResolveExecutionPlan(const std::filesystem::path &plan_file,
                                   const std::filesystem::path &profile_file,
                                   const std::vector<std::string> &chain,
                                   const std::set<std::string> &force_cpu,
                                   const std::set<std::string> &memory_intensive) {
  ExecutionPlan plan;
  if (!plan_file.empty() && std::filesystem::exists(plan_file)) {
    plan = LoadExecutionPlanFile(plan_file, chain);
  } else if (!profile_file.empty() && std::filesystem::exists(profile_file)) {
    plan = StaticSplitPlanner::FromFile(profile_file, chain).Plan();
  } else {
    std::set<std::string> cpu_blocks = force_cpu;
    cpu_blocks.insert(memory_intensive.begin(), memory_intensive.end());
    plan = DefaultExecutionPlan(chain, cpu_blocks);
  }
  plan.ApplyForceCpu(force_cpu);
  return plan;
}

} // namespace blockpipe
