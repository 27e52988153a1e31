#include "server/metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace blockpipe {

namespace {
MetricsRegistry g_metrics;

void RenderHistogram(std::ostringstream &out, const std::string &name,
                     const std::string &help, const std::string &node,
                     const LatencyHistogram &hist) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << name << "_bucket{node=\"" << node << "\",le=\"" << std::fixed
        << std::setprecision(0) << LatencyHistogram::kBuckets[i] << "\"} "
        << hist.counts[i].load() << "\n";
  }
  out << name << "_bucket{node=\"" << node << "\",le=\"+Inf\"} "
      << hist.counts[LatencyHistogram::kBuckets.size()].load() << "\n";
  out << name << "_sum{node=\"" << node << "\"} " << hist.sum_ms.load()
      << "\n";
  out << name << "_count{node=\"" << node << "\"} " << hist.total.load()
      << "\n";
}

void RenderCounter(std::ostringstream &out, const std::string &name,
                   const std::string &help, const std::string &node,
                   uint64_t value, const char *type = "counter") {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " " << type << "\n";
  out << name << "{node=\"" << node << "\"} " << value << "\n";
}

} // namespace

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)),
                   std::memory_order_relaxed);
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::SetNodeId(const std::string &node_id) {
  std::lock_guard<std::mutex> lock(node_mutex_);
  node_id_ = node_id;
}

void MetricsRegistry::RecordPipelineStep(bool success, double seconds) {
  (success ? steps_success_ : steps_error_)
      .fetch_add(1, std::memory_order_relaxed);
  step_latency_.Record(seconds * 1000.0);
}

void MetricsRegistry::RecordBlockExecution(const std::string &worker,
                                           bool success, double seconds) {
  block_latency_.Record(seconds * 1000.0);
  std::lock_guard<std::mutex> lock(worker_mutex_);
  auto &stats = worker_blocks_[worker];
  if (success) {
    ++stats.success;
  } else {
    ++stats.failure;
  }
}

void MetricsRegistry::RecordFallback(bool success) {
  fallbacks_.fetch_add(1, std::memory_order_relaxed);
  if (!success) {
    fallbacks_failed_.fetch_add(1, std::memory_order_relaxed);
  }
}

void MetricsRegistry::RecordMemorySkip() {
  memory_skips_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordWarmCacheHit() {
  warm_hits_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordWarmCacheMiss() {
  warm_misses_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordWarmCacheEviction() {
  warm_evictions_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordColdLoad(const std::string &strategy) {
  std::lock_guard<std::mutex> lock(load_mutex_);
  ++cold_loads_[strategy];
}

void MetricsRegistry::RecordFailedLoad() {
  failed_loads_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordWarmup(bool success) {
  (success ? warmup_successes_ : warmup_failures_)
      .fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordKVSessionCreated() {
  kv_sessions_created_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordKVSessionEvicted() {
  kv_sessions_evicted_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::SetKVSessions(std::size_t sessions) {
  kv_sessions_.store(sessions, std::memory_order_relaxed);
}

void MetricsRegistry::RecordForward(bool success, double seconds) {
  forwards_.fetch_add(1, std::memory_order_relaxed);
  if (!success) {
    forward_failures_.fetch_add(1, std::memory_order_relaxed);
  }
  forward_latency_.Record(seconds * 1000.0);
}

void MetricsRegistry::RecordLicenseDenied() {
  license_denied_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::SetTelemetry(double cpu_utilization,
                                   double memory_usage_percent,
                                   double health_score) {
  cpu_utilization_milli_.store(static_cast<int64_t>(cpu_utilization * 1000.0));
  memory_usage_milli_.store(
      static_cast<int64_t>(memory_usage_percent * 1000.0));
  health_milli_.store(static_cast<int64_t>(health_score * 1000.0));
}

void MetricsRegistry::IncrementConnections() {
  active_connections_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::DecrementConnections() {
  active_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void MetricsRegistry::SetWorkerQueueDepth(const std::string &worker,
                                          int depth) {
  std::lock_guard<std::mutex> lock(worker_mutex_);
  worker_queue_depth_[worker] = depth;
}

MetricsRegistry::WarmCacheCounters
MetricsRegistry::GetWarmCacheCounters() const {
  WarmCacheCounters counters;
  counters.hits = warm_hits_.load();
  counters.misses = warm_misses_.load();
  counters.evictions = warm_evictions_.load();
  counters.failed_loads = failed_loads_.load();
  return counters;
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::string node;
  {
    std::lock_guard<std::mutex> lock(node_mutex_);
    node = node_id_;
  }
  std::ostringstream out;

  // --- Pipeline ---
  out << "# HELP blockpipe_pipeline_steps_total Pipeline steps by outcome\n";
  out << "# TYPE blockpipe_pipeline_steps_total counter\n";
  out << "blockpipe_pipeline_steps_total{node=\"" << node
      << "\",status=\"success\"} " << steps_success_.load() << "\n";
  out << "blockpipe_pipeline_steps_total{node=\"" << node
      << "\",status=\"error\"} " << steps_error_.load() << "\n";

  {
    std::lock_guard<std::mutex> lock(worker_mutex_);
    out << "# HELP blockpipe_block_executions_total Block executions by "
           "worker and outcome\n";
    out << "# TYPE blockpipe_block_executions_total counter\n";
    for (const auto &[worker, stats] : worker_blocks_) {
      out << "blockpipe_block_executions_total{node=\"" << node
          << "\",worker=\"" << worker << "\",status=\"success\"} "
          << stats.success << "\n";
      out << "blockpipe_block_executions_total{node=\"" << node
          << "\",worker=\"" << worker << "\",status=\"error\"} "
          << stats.failure << "\n";
    }
    out << "# HELP blockpipe_worker_queue_depth Jobs waiting per worker\n";
    out << "# TYPE blockpipe_worker_queue_depth gauge\n";
    for (const auto &[worker, depth] : worker_queue_depth_) {
      out << "blockpipe_worker_queue_depth{node=\"" << node << "\",worker=\""
          << worker << "\"} " << depth << "\n";
    }
  }

  RenderCounter(out, "blockpipe_fallbacks_total",
                "Blocks retried on the other worker", node, fallbacks_.load());
  RenderCounter(out, "blockpipe_fallbacks_failed_total",
                "Fallback attempts that also failed", node,
                fallbacks_failed_.load());
  RenderCounter(out, "blockpipe_memory_skips_total",
                "Blocks skipped after transient allocation failures", node,
                memory_skips_.load());

  // --- Warm cache ---
  RenderCounter(out, "blockpipe_warm_cache_hits_total", "Warm session hits",
                node, warm_hits_.load());
  RenderCounter(out, "blockpipe_warm_cache_misses_total",
                "Warm session misses", node, warm_misses_.load());
  RenderCounter(out, "blockpipe_warm_cache_evictions_total",
                "Warm sessions evicted", node, warm_evictions_.load());
  RenderCounter(out, "blockpipe_failed_loads_total",
                "Blocks for which every load strategy failed", node,
                failed_loads_.load());
  RenderCounter(out, "blockpipe_warmup_successes_total",
                "Warm-up passes with at least one successful run", node,
                warmup_successes_.load());
  RenderCounter(out, "blockpipe_warmup_failures_total",
                "Warm-up passes where every run failed", node,
                warmup_failures_.load());
  {
    std::lock_guard<std::mutex> lock(load_mutex_);
    out << "# HELP blockpipe_cold_loads_total Cold loads by strategy\n";
    out << "# TYPE blockpipe_cold_loads_total counter\n";
    for (const auto &[strategy, count] : cold_loads_) {
      out << "blockpipe_cold_loads_total{node=\"" << node << "\",strategy=\""
          << strategy << "\"} " << count << "\n";
    }
  }

  // --- KV cache ---
  RenderCounter(out, "blockpipe_kv_sessions_created_total",
                "KV cache sessions created", node,
                kv_sessions_created_.load());
  RenderCounter(out, "blockpipe_kv_sessions_evicted_total",
                "KV cache sessions evicted", node, kv_sessions_evicted_.load());
  RenderCounter(out, "blockpipe_kv_sessions", "KV cache sessions resident",
                node, kv_sessions_.load(), "gauge");

  // --- Forwarding / license ---
  RenderCounter(out, "blockpipe_forwards_total",
                "Steps forwarded to the next node", node, forwards_.load());
  RenderCounter(out, "blockpipe_forward_failures_total",
                "Forwarded steps that failed", node, forward_failures_.load());
  RenderCounter(out, "blockpipe_license_denied_total",
                "Requests rejected by the license gate", node,
                license_denied_.load());

  // --- Gauges ---
  out << "# HELP blockpipe_cpu_utilization_percent Latest sampled CPU "
         "utilization\n";
  out << "# TYPE blockpipe_cpu_utilization_percent gauge\n";
  out << "blockpipe_cpu_utilization_percent{node=\"" << node << "\"} "
      << std::fixed << std::setprecision(1)
      << cpu_utilization_milli_.load() / 1000.0 << "\n";
  out << "# HELP blockpipe_memory_usage_percent Latest sampled memory usage\n";
  out << "# TYPE blockpipe_memory_usage_percent gauge\n";
  out << "blockpipe_memory_usage_percent{node=\"" << node << "\"} "
      << memory_usage_milli_.load() / 1000.0 << "\n";
  out << "# HELP blockpipe_system_health_score Latest system health score\n";
  out << "# TYPE blockpipe_system_health_score gauge\n";
  out << "blockpipe_system_health_score{node=\"" << node << "\"} "
      << std::setprecision(3) << health_milli_.load() / 1000.0 << "\n";
  RenderCounter(out, "blockpipe_active_connections",
                "Open HTTP connections", node,
                static_cast<uint64_t>(std::max(0, active_connections_.load())),
                "gauge");

  // --- Histograms ---
  RenderHistogram(out, "blockpipe_step_duration_ms",
                  "Pipeline step wall-clock duration", node, step_latency_);
  RenderHistogram(out, "blockpipe_block_duration_ms",
                  "Per-block execution duration", node, block_latency_);
  RenderHistogram(out, "blockpipe_forward_duration_ms",
                  "Cross-node forward round-trip duration", node,
                  forward_latency_);

  return out.str();
}

MetricsRegistry &GlobalMetrics() { return g_metrics; }

} // namespace blockpipe
