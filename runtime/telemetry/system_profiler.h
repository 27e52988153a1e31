#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace blockpipe {

enum class Recommendation {
  kNormal,
  kCpuPressure,
  kMemoryPressure,
  kThermalWarning,
  kSystemOverloaded,
};

const char *RecommendationName(Recommendation rec);

struct CpuTelemetry {
  double utilization{0.0}; // percent
  double performance_factor{1.0};
  int cores{0};
};

struct GpuTelemetry {
  bool available{false};
  std::string type{"none"}; // nvidia, amd, intel, none
  double utilization{-1.0}; // percent; -1 when the driver does not report it
  double performance_factor{0.0};
  // Integrated GPU sharing system memory.
  bool capacity_limited{false};
};

struct MemoryTelemetry {
  double usage_percent{0.0};
  double available_gb{0.0};
  double total_gb{0.0};
};

struct TelemetrySnapshot {
  CpuTelemetry cpu;
  GpuTelemetry gpu;
  MemoryTelemetry memory;
  double temperature_c{-1.0};
  double system_health_score{1.0};
  Recommendation recommendation{Recommendation::kNormal};
  int64_t timestamp_ms{0};

  nlohmann::json ToJson() const;
};

// Raw values read from the host before any derivation.
struct RawReadings {
  double cpu_utilization{0.0};
  int cores{0};
  double mem_total_kb{0.0};
  double mem_available_kb{0.0};
  bool gpu_available{false};
  std::string gpu_type{"none"};
  double gpu_utilization{-1.0};
  double temperature_c{-1.0};
};

struct TelemetryThresholds {
  double cpu_pressure_percent{85.0};
  double memory_pressure_percent{85.0};
  double overload_cpu_percent{90.0};
  double overload_memory_percent{90.0};
  double thermal_warning_c{85.0};
  // Performance factor assumed for a GPU that reports no utilization.
  double unreported_gpu_factor{0.7};
};

TelemetrySnapshot DeriveSnapshot(const RawReadings &raw,
                                 const TelemetryThresholds &thresholds);

class TelemetrySource {
public:
  virtual ~TelemetrySource() = default;
  virtual RawReadings Read() = 0;
};

// Reads /proc/stat, /proc/meminfo, DRM and thermal-zone sysfs entries. CPU
// utilization is the busy share between two consecutive reads. The roots
// are configurable so tests can point at fixture trees.
class ProcfsTelemetrySource : public TelemetrySource {
public:
  // `gpu_type`: "auto" scans DRM vendors; "none" disables the GPU; any other
  // value forces that GPU type as available.
  explicit ProcfsTelemetrySource(std::filesystem::path proc_root = "/proc",
                                 std::filesystem::path sys_root = "/sys",
                                 std::string gpu_type = "auto");

  RawReadings Read() override;

private:
  double ReadCpuUtilization();
  void ReadMemory(RawReadings &out) const;
  void ReadGpu(RawReadings &out) const;
  double ReadTemperature() const;

  std::filesystem::path proc_root_;
  std::filesystem::path sys_root_;
  std::string gpu_type_;
  uint64_t last_total_{0};
  uint64_t last_idle_{0};
  bool primed_{false};
};

struct TelemetryHistoryStats {
  std::size_t samples{0};
  double avg_cpu_utilization{0.0};
  double max_cpu_utilization{0.0};
  double avg_memory_percent{0.0};
  double max_memory_percent{0.0};

  nlohmann::json ToJson() const;
};

// ── SystemTelemetryProfiler ─────────────────────────────────────────────────
// Samples the host on a background thread every `interval_s` and publishes
// the latest snapshot. Latest() never waits for a fresh sample.
class SystemTelemetryProfiler {
public:
  static constexpr std::size_t kHistoryCapacity = 1200;

  SystemTelemetryProfiler(std::unique_ptr<TelemetrySource> source,
                          double interval_s = 0.5,
                          TelemetryThresholds thresholds = {});
  ~SystemTelemetryProfiler();

  SystemTelemetryProfiler(const SystemTelemetryProfiler &) = delete;
  SystemTelemetryProfiler &operator=(const SystemTelemetryProfiler &) = delete;

  void Start();
  // Safe to call more than once.
  void Stop();
  bool IsRunning() const { return running_.load(); }

  // Reads the source now, publishes and returns the result.
  TelemetrySnapshot Sample();
  TelemetrySnapshot Latest() const;
  // Statistics over the most recent `window` samples (0 = all retained).
  TelemetryHistoryStats History(std::size_t window = 0) const;

  double interval_s() const { return interval_s_; }

private:
  void SampleLoop();

  std::unique_ptr<TelemetrySource> source_;
  double interval_s_;
  TelemetryThresholds thresholds_;

  std::mutex source_mutex_;
  std::shared_ptr<const TelemetrySnapshot> latest_;
  mutable std::mutex history_mutex_;
  std::deque<TelemetrySnapshot> history_;

  std::atomic<bool> running_{false};
  std::thread sample_thread_;
};

} // namespace blockpipe
