#pragma once

#include "model/block_metadata.h"
#include "model/network_config.h"
#include "net/node_forwarder.h"
#include "runtime/backends/inference_session.h"
#include "runtime/kv_cache/kv_cache_store.h"
#include "runtime/telemetry/system_profiler.h"
#include "runtime/warm_cache/warm_model_cache.h"
#include "scheduler/adaptive_block_scheduler.h"
#include "scheduler/block_worker.h"
#include "scheduler/pipeline_executor.h"
#include "server/node_config.h"
#include "server/security/license_gate.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace blockpipe {

// Collaborators a runtime is assembled from. Create() fills them from the
// config files; tests pass fakes.
struct NodeRuntimeParts {
  NetworkConfig network;
  ModelMetadata metadata;
  std::shared_ptr<SessionBackend> backend;
  std::unique_ptr<TelemetrySource> telemetry_source;
  std::unique_ptr<NodeForwarder> forwarder;
  std::unique_ptr<LicenseValidator> license_validator;
  // Overrides the per-block worker timeout (tests).
  PipelineConfig pipeline;
};

// ── NodeRuntime ─────────────────────────────────────────────────────────────
// Owns every long-lived component of one node: topology, metadata, warm
// caches, workers, KV store, telemetry, scheduler, license gate and the
// pipeline executor. Nothing in the process reaches these through globals.
class NodeRuntime {
public:
  static constexpr int kHealthIntervalS = 10;
  static constexpr int kStatsIntervalS = 60;

  // Loads the network config and model metadata named by `config`. Throws
  // ConfigError.
  static std::unique_ptr<NodeRuntime> Create(const NodeConfig &config);

  NodeRuntime(NodeConfig config, NodeRuntimeParts parts);
  ~NodeRuntime();

  NodeRuntime(const NodeRuntime &) = delete;
  NodeRuntime &operator=(const NodeRuntime &) = delete;

  // Starts telemetry sampling and the health monitor.
  void Start();
  // Stops new steps, the monitor, the profiler and the workers, then
  // releases the caches. Safe to call more than once.
  void Shutdown();

  nlohmann::json RunStep(const StepRequest &request);
  bool AuthorizeSession(const std::string &session_id,
                        const std::string &license_key);
  bool RevokeSession(const std::string &session_id);

  // One health-monitor pass; returns the number of pruned authorizations.
  std::size_t HealthCheck(bool log_stats);

  nlohmann::json StatsJson() const;
  nlohmann::json HealthJson() const;
  bool Ready() const { return ready_.load(); }

  const NodeConfig &config() const { return config_; }
  const NetworkConfig &network() const { return network_; }
  const ModelMetadata &metadata() const { return metadata_; }
  const std::vector<std::string> &assigned_blocks() const {
    return assigned_blocks_;
  }
  PipelineExecutor &executor() { return *executor_; }
  KVCacheStore &kv_store() { return *kv_store_; }
  LicenseGate &license() { return *license_; }
  SystemTelemetryProfiler &profiler() { return *profiler_; }
  BlockAssignmentBook &assignments() { return book_; }
  WarmModelCache &cpu_cache() { return *cpu_cache_; }
  WarmModelCache *gpu_cache() { return gpu_cache_.get(); }

private:
  void HealthMonitorLoop();
  void ClearSecureState();

  NodeConfig config_;
  NetworkConfig network_;
  ModelMetadata metadata_;
  std::vector<std::string> assigned_blocks_;
  std::shared_ptr<SessionBackend> backend_;

  std::shared_ptr<WarmModelCache> cpu_cache_;
  std::shared_ptr<WarmModelCache> gpu_cache_;
  std::unique_ptr<CpuBlockWorker> cpu_worker_;
  std::unique_ptr<GpuBlockWorker> gpu_worker_;
  std::unique_ptr<KVCacheStore> kv_store_;
  std::unique_ptr<SystemTelemetryProfiler> profiler_;
  BlockAssignmentBook book_;
  std::unique_ptr<AdaptiveBlockScheduler> scheduler_;
  std::unique_ptr<NodeForwarder> forwarder_;
  std::unique_ptr<LicenseGate> license_;
  std::unique_ptr<PipelineExecutor> executor_;

  std::atomic<bool> ready_{false};
  std::atomic<bool> running_{false};
  std::atomic<bool> shut_down_{false};
  std::thread monitor_thread_;
  std::chrono::steady_clock::time_point started_at_;
};

} // namespace blockpipe
