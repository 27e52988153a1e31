#include "server/node_runtime.h"

#include "runtime/backends/backend_factory.h"
#include "runtime/errors.h"
#include "scheduler/execution_plan.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <malloc.h>

using json = nlohmann::json;

namespace blockpipe {

namespace {

void ReleaseFreedHeap() {
  // Returns freed arena pages to the OS after large tensors are dropped.
  malloc_trim(0);
}

} // namespace

std::unique_ptr<NodeRuntime> NodeRuntime::Create(const NodeConfig &config) {
  NodeRuntimeParts parts;
  parts.network = LoadNetworkConfig(config.network_config);
  if (parts.network.metadata_file.empty()) {
    throw ConfigError("network config does not name a metadata file");
  }
  parts.metadata = LoadModelMetadata(parts.network.metadata_file);
  parts.backend = BackendFactory::Create();
  parts.telemetry_source = std::make_unique<ProcfsTelemetrySource>(
      "/proc", "/sys", config.gpu_type);
  HttpClientOptions http;
  http.connect_timeout_s = config.connect_timeout_s;
  http.response_timeout_s = config.forward_timeout_s;
  parts.forwarder = std::make_unique<HttpNodeForwarder>(http);
  parts.pipeline.worker_timeout_s = config.worker_timeout_s;
  return std::make_unique<NodeRuntime>(config, std::move(parts));
}

NodeRuntime::NodeRuntime(NodeConfig config, NodeRuntimeParts parts)
    : config_(std::move(config)), network_(std::move(parts.network)),
      metadata_(std::move(parts.metadata)),
      backend_(std::move(parts.backend)),
      forwarder_(std::move(parts.forwarder)),
      started_at_(std::chrono::steady_clock::now()) {
  assigned_blocks_ = network_.Node(config_.node_id).assigned_blocks;
  if (assigned_blocks_.empty()) {
    throw ConfigError("node " + config_.node_id + " has no assigned blocks");
  }
  for (const auto &block : assigned_blocks_) {
    if (!metadata_.HasBlock(block)) {
      throw ConfigError("model metadata has no entry for " + block);
    }
  }
  GlobalMetrics().SetNodeId(config_.node_id);

  // ── Warm caches and workers ───────────────────────────────────────────
  auto resolver = std::make_shared<const BlockAssetResolver>(
      network_.onnx_blocks_dir, &metadata_);
  SessionOptions cpu_options;
  cpu_options.target = ExecutionTarget::kCpu;
  WarmCacheConfig cpu_cache_config;
  cpu_cache_config.max_warm_sessions = config_.max_warm_sessions;
  cpu_cache_config.warmup_runs = config_.warmup_runs;
  cpu_cache_config.warmup_enabled = config_.warmup_runs > 0;
  cpu_cache_config.label = "cpu";
  cpu_cache_ = std::make_shared<WarmModelCache>(
      DefaultLoadStrategies(backend_, resolver, cpu_options), &metadata_,
      cpu_cache_config);
  cpu_worker_ =
      std::make_unique<CpuBlockWorker>(cpu_cache_, config_.cpu_worker_threads);

  if (config_.gpu_worker_enabled) {
    SessionOptions gpu_options;
    gpu_options.target = ExecutionTarget::kGpu;
    WarmCacheConfig gpu_cache_config = cpu_cache_config;
    gpu_cache_config.max_warm_sessions = config_.max_warm_sessions_gpu;
    gpu_cache_config.label = "gpu";
    gpu_cache_ = std::make_shared<WarmModelCache>(
        DefaultLoadStrategies(backend_, resolver, gpu_options), &metadata_,
        gpu_cache_config);
    gpu_worker_ = std::make_unique<GpuBlockWorker>(gpu_cache_);
  }

  // ── KV store ──────────────────────────────────────────────────────────
  KVCacheConfig kv_config;
  kv_config.num_kv_heads = metadata_.num_kv_heads;
  kv_config.head_dim = metadata_.head_dim;
  kv_config.page_capacity_tokens = config_.kv_page_capacity_tokens;
  kv_config.initial_pages = config_.initial_kv_pages;
  kv_config.dtype = ParseDType(config_.kv_dtype);
  kv_store_ =
      std::make_unique<KVCacheStore>(config_.max_cached_sessions_kv, kv_config);

  // ── Telemetry and scheduling ──────────────────────────────────────────
  TelemetryThresholds thresholds;
  thresholds.memory_pressure_percent =
      config_.scheduler.memory_high_water_percent;
  if (!parts.telemetry_source) {
    parts.telemetry_source = std::make_unique<ProcfsTelemetrySource>(
        "/proc", "/sys", config_.gpu_type);
  }
  profiler_ = std::make_unique<SystemTelemetryProfiler>(
      std::move(parts.telemetry_source), config_.sampling_interval_s,
      thresholds);

  ExecutionPlan plan = ResolveExecutionPlan(
      network_.execution_plan_file, network_.profiling_file, assigned_blocks_,
      config_.scheduler.force_cpu_blocks,
      config_.scheduler.memory_intensive_blocks);
  log::Info("scheduler", "execution plan loaded", plan.ToJson().dump());
  scheduler_ = std::make_unique<AdaptiveBlockScheduler>(
      std::move(plan), config_.scheduler, &book_);

  // ── License gate ──────────────────────────────────────────────────────
  license_ = std::make_unique<LicenseGate>(config_.license,
                                           std::move(parts.license_validator));
  license_->SetClearHook([this] { ClearSecureState(); });
  license_->SetRevokeHook(
      [this](const std::string &session_id) { kv_store_->Remove(session_id); });

  // ── Executor ──────────────────────────────────────────────────────────
  PipelineDeps deps;
  deps.node_id = config_.node_id;
  deps.chain = assigned_blocks_;
  deps.metadata = &metadata_;
  deps.network = &network_;
  deps.scheduler = scheduler_.get();
  deps.book = &book_;
  deps.workers[WorkerType::kCpu] = cpu_worker_.get();
  deps.shared_input_caches.push_back(cpu_cache_.get());
  if (gpu_worker_) {
    deps.workers[WorkerType::kGpu] = gpu_worker_.get();
    deps.shared_input_caches.push_back(gpu_cache_.get());
  }
  deps.kv_store = kv_store_.get();
  SystemTelemetryProfiler *profiler = profiler_.get();
  deps.telemetry = [profiler] { return profiler->Latest(); };
  deps.collect_garbage = ReleaseFreedHeap;
  deps.forwarder = forwarder_.get();
  deps.license = license_->enabled() ? license_.get() : nullptr;
  executor_ = std::make_unique<PipelineExecutor>(std::move(deps),
                                                 parts.pipeline);

  log::Info("node", "runtime ready for " + config_.node_id,
            std::to_string(assigned_blocks_.size()) + " blocks, backend=" +
                (backend_ ? backend_->Name() : std::string("none")));
  ready_.store(true);
}

NodeRuntime::~NodeRuntime() { Shutdown(); }

void NodeRuntime::Start() {
  if (running_.load()) {
    return;
  }
  profiler_->Start();
  running_.store(true);
  monitor_thread_ = std::thread([this] { HealthMonitorLoop(); });
}

void NodeRuntime::Shutdown() {
  if (shut_down_.exchange(true)) {
    return;
  }
  ready_.store(false);
  if (executor_) {
    executor_->RequestStop();
  }
  running_.store(false);
  if (monitor_thread_.joinable()) {
    monitor_thread_.join();
  }
  if (profiler_) {
    profiler_->Stop();
  }
  if (gpu_worker_) {
    gpu_worker_->Stop();
  }
  if (cpu_worker_) {
    cpu_worker_->Stop();
  }
  if (gpu_cache_) {
    gpu_cache_->Clear();
  }
  if (cpu_cache_) {
    cpu_cache_->Clear();
  }
  if (kv_store_) {
    kv_store_->Clear();
  }
  log::Info("node", "runtime stopped", config_.node_id);
}

json NodeRuntime::RunStep(const StepRequest &request) {
  return executor_->RunStep(request);
}

bool NodeRuntime::AuthorizeSession(const std::string &session_id,
                                   const std::string &license_key) {
  return license_->AuthorizeSession(session_id, license_key);
}

bool NodeRuntime::RevokeSession(const std::string &session_id) {
  return license_->RevokeSession(session_id);
}

void NodeRuntime::ClearSecureState() {
  log::Warn("license", "clearing in-memory model state");
  if (gpu_cache_) {
    gpu_cache_->Clear();
  }
  cpu_cache_->Clear();
  kv_store_->Clear();
  ReleaseFreedHeap();
}

std::size_t NodeRuntime::HealthCheck(bool log_stats) {
  TelemetrySnapshot snapshot = profiler_->Latest();
  GlobalMetrics().SetTelemetry(snapshot.cpu.utilization,
                               snapshot.memory.usage_percent,
                               snapshot.system_health_score);
  if (snapshot.recommendation != Recommendation::kNormal) {
    log::Warn("node",
              std::string("system recommendation: ") +
                  RecommendationName(snapshot.recommendation),
              "cpu=" + std::to_string(snapshot.cpu.utilization) +
                  " mem=" + std::to_string(snapshot.memory.usage_percent));
  }
  if (log_stats) {
    WarmCacheStats cache = cpu_cache_->Stats();
    log::Info("node", "periodic stats",
              "warm_hits=" + std::to_string(cache.cache_hits) +
                  " warm_misses=" + std::to_string(cache.cache_misses) +
                  " kv_sessions=" + std::to_string(kv_store_->Size()) +
                  " health=" + std::to_string(snapshot.system_health_score));
  }
  std::size_t pruned = license_->PruneIdle();
  if (pruned > 0) {
    log::Info("license", "pruned idle authorizations",
              "count=" + std::to_string(pruned));
  }
  return pruned;
}

void NodeRuntime::HealthMonitorLoop() {
  int elapsed_s = 0;
  while (running_.load()) {
    for (int i = 0; i < kHealthIntervalS * 10 && running_.load(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (!running_.load()) {
      break;
    }
    elapsed_s += kHealthIntervalS;
    try {
      HealthCheck(elapsed_s % kStatsIntervalS == 0);
    } catch (const std::exception &ex) {
      log::Error("node", "health monitor pass failed", ex.what());
    }
  }
}

json NodeRuntime::StatsJson() const {
  json stats = book_.StatsJson();
  json warm = {{"cpu", cpu_cache_->Stats().ToJson()}};
  json workers = {{"CPU", cpu_worker_->Stats().ToJson()}};
  if (gpu_cache_) {
    warm["gpu"] = gpu_cache_->Stats().ToJson();
    workers["GPU"] = gpu_worker_->Stats().ToJson();
  }
  stats["warm_cache"] = warm;
  stats["kv_cache"] = kv_store_->StatsJson();
  stats["workers"] = workers;
  stats["telemetry"] = {{"latest", profiler_->Latest().ToJson()},
                        {"history", profiler_->History(120).ToJson()}};
  stats["license"] = license_->StatsJson();
  stats["execution_plan"] = scheduler_->plan().ToJson();
  stats["node_id"] = config_.node_id;
  return stats;
}

json NodeRuntime::HealthJson() const {
  TelemetrySnapshot snapshot = profiler_->Latest();
  const double uptime = std::chrono::duration<double>(
                            std::chrono::steady_clock::now() - started_at_)
                            .count();
  return {{"status", ready_.load() ? "ok" : "stopping"},
          {"node_id", config_.node_id},
          {"assigned_blocks", assigned_blocks_},
          {"backend", backend_ ? backend_->Name() : std::string("none")},
          {"uptime_seconds", uptime},
          {"system_health_score", snapshot.system_health_score},
          {"recommendation", RecommendationName(snapshot.recommendation)},
          {"kv_sessions", kv_store_->Size()}};
}

} // namespace blockpipe
