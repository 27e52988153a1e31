#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace blockpipe {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds: 10, 50, 100, 250, 500, 1000, 2500, 5000, +Inf
  static constexpr std::array<double, 8> kBuckets{
      10.0, 50.0, 100.0, 250.0, 500.0, 1000.0, 2500.0, 5000.0};
  std::array<std::atomic<uint64_t>, 9> counts{}; // 8 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

class MetricsRegistry {
public:
  void SetNodeId(const std::string &node_id);

  // Pipeline.
  void RecordPipelineStep(bool success, double seconds);
  void RecordBlockExecution(const std::string &worker, bool success,
                            double seconds);
  void RecordFallback(bool success);
  void RecordMemorySkip();

  // Warm model cache.
  void RecordWarmCacheHit();
  void RecordWarmCacheMiss();
  void RecordWarmCacheEviction();
  void RecordColdLoad(const std::string &strategy);
  void RecordFailedLoad();
  void RecordWarmup(bool success);

  // KV cache store.
  void RecordKVSessionCreated();
  void RecordKVSessionEvicted();
  void SetKVSessions(std::size_t sessions);

  // Cross-node forwarding.
  void RecordForward(bool success, double seconds);

  void RecordLicenseDenied();

  // Telemetry gauges (percent values, health in [0,1]).
  void SetTelemetry(double cpu_utilization, double memory_usage_percent,
                    double health_score);

  void IncrementConnections();
  void DecrementConnections();
  void SetWorkerQueueDepth(const std::string &worker, int depth);

  struct WarmCacheCounters {
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t evictions{0};
    uint64_t failed_loads{0};
  };
  WarmCacheCounters GetWarmCacheCounters() const;
  uint64_t FallbackCount() const { return fallbacks_.load(); }

  std::string RenderPrometheus() const;

private:
  mutable std::mutex node_mutex_;
  std::string node_id_{"node"};

  std::atomic<uint64_t> steps_success_{0};
  std::atomic<uint64_t> steps_error_{0};
  std::atomic<uint64_t> fallbacks_{0};
  std::atomic<uint64_t> fallbacks_failed_{0};
  std::atomic<uint64_t> memory_skips_{0};
  std::atomic<uint64_t> warm_hits_{0};
  std::atomic<uint64_t> warm_misses_{0};
  std::atomic<uint64_t> warm_evictions_{0};
  std::atomic<uint64_t> failed_loads_{0};
  std::atomic<uint64_t> warmup_successes_{0};
  std::atomic<uint64_t> warmup_failures_{0};
  std::atomic<uint64_t> kv_sessions_created_{0};
  std::atomic<uint64_t> kv_sessions_evicted_{0};
  std::atomic<uint64_t> kv_sessions_{0};
  std::atomic<uint64_t> forwards_{0};
  std::atomic<uint64_t> forward_failures_{0};
  std::atomic<uint64_t> license_denied_{0};

  // Gauges stored as value * 1000 to stay lock-free.
  std::atomic<int64_t> cpu_utilization_milli_{0};
  std::atomic<int64_t> memory_usage_milli_{0};
  std::atomic<int64_t> health_milli_{0};
  std::atomic<int> active_connections_{0};

  LatencyHistogram step_latency_;
  LatencyHistogram block_latency_;
  LatencyHistogram forward_latency_;

  struct BlockWorkerStats {
    uint64_t success{0};
    uint64_t failure{0};
  };
  mutable std::mutex worker_mutex_;
  std::unordered_map<std::string, BlockWorkerStats> worker_blocks_;
  std::unordered_map<std::string, int> worker_queue_depth_;
  mutable std::mutex load_mutex_;
  std::unordered_map<std::string, uint64_t> cold_loads_;
};

MetricsRegistry &GlobalMetrics();

} // namespace blockpipe
