#include "runtime/telemetry/system_profiler.h"

#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>

namespace blockpipe {

namespace fs = std::filesystem;

namespace {

double Clamp01(double v) { return std::max(0.0, std::min(1.0, v)); }

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string ReadFirstLine(const fs::path &path) {
  std::ifstream in(path);
  std::string line;
  if (in.is_open()) {
    std::getline(in, line);
  }
  return line;
}

} // namespace

const char *RecommendationName(Recommendation rec) {
  switch (rec) {
  case Recommendation::kNormal:
    return "normal";
  case Recommendation::kCpuPressure:
    return "cpu_pressure";
  case Recommendation::kMemoryPressure:
    return "memory_pressure";
  case Recommendation::kThermalWarning:
    return "thermal_warning";
  case Recommendation::kSystemOverloaded:
    return "system_overloaded";
  }
  return "normal";
}

nlohmann::json TelemetrySnapshot::ToJson() const {
  nlohmann::json j;
  j["cpu"] = {{"utilization", cpu.utilization},
              {"performance_factor", cpu.performance_factor},
              {"cores", cpu.cores}};
  j["gpu"] = {{"available", gpu.available},
              {"type", gpu.type},
              {"utilization", gpu.utilization},
              {"performance_factor", gpu.performance_factor},
              {"capacity_limited", gpu.capacity_limited}};
  j["memory"] = {{"usage_percent", memory.usage_percent},
                 {"available_gb", memory.available_gb},
                 {"total_gb", memory.total_gb}};
  j["temperature_c"] = temperature_c;
  j["system_health_score"] = system_health_score;
  j["recommendation"] = RecommendationName(recommendation);
  j["timestamp_ms"] = timestamp_ms;
  return j;
}

nlohmann::json TelemetryHistoryStats::ToJson() const {
  return {{"samples", samples},
          {"avg_cpu_utilization", avg_cpu_utilization},
          {"max_cpu_utilization", max_cpu_utilization},
          {"avg_memory_percent", avg_memory_percent},
          {"max_memory_percent", max_memory_percent}};
}

TelemetrySnapshot DeriveSnapshot(const RawReadings &raw,
                                 const TelemetryThresholds &thresholds) {
  TelemetrySnapshot snap;
  snap.timestamp_ms = NowMs();

  snap.cpu.utilization = std::max(0.0, std::min(100.0, raw.cpu_utilization));
  snap.cpu.cores = raw.cores;
  snap.cpu.performance_factor = Clamp01(1.0 - snap.cpu.utilization / 100.0);

  snap.gpu.available = raw.gpu_available;
  snap.gpu.type = raw.gpu_available ? raw.gpu_type : "none";
  snap.gpu.utilization = raw.gpu_utilization;
  snap.gpu.capacity_limited = raw.gpu_available && raw.gpu_type == "intel";
  if (!raw.gpu_available) {
    snap.gpu.performance_factor = 0.0;
  } else if (raw.gpu_utilization < 0.0) {
    snap.gpu.performance_factor = Clamp01(thresholds.unreported_gpu_factor);
  } else {
    snap.gpu.performance_factor = Clamp01(1.0 - raw.gpu_utilization / 100.0);
  }

  if (raw.mem_total_kb > 0.0) {
    snap.memory.total_gb = raw.mem_total_kb / (1024.0 * 1024.0);
    snap.memory.available_gb = raw.mem_available_kb / (1024.0 * 1024.0);
    snap.memory.usage_percent = std::max(
        0.0, std::min(100.0, 100.0 * (1.0 - raw.mem_available_kb /
                                                raw.mem_total_kb)));
  }
  snap.temperature_c = raw.temperature_c;

  const double memory_headroom = Clamp01(1.0 - snap.memory.usage_percent / 100.0);
  const double accel = snap.gpu.available ? snap.gpu.performance_factor
                                          : snap.cpu.performance_factor;
  snap.system_health_score = Clamp01(0.4 * snap.cpu.performance_factor +
                                     0.4 * memory_headroom + 0.2 * accel);

  if (snap.cpu.utilization >= thresholds.overload_cpu_percent &&
      snap.memory.usage_percent >= thresholds.overload_memory_percent) {
    snap.recommendation = Recommendation::kSystemOverloaded;
  } else if (snap.temperature_c >= thresholds.thermal_warning_c) {
    snap.recommendation = Recommendation::kThermalWarning;
  } else if (snap.memory.usage_percent >= thresholds.memory_pressure_percent) {
    snap.recommendation = Recommendation::kMemoryPressure;
  } else if (snap.cpu.utilization >= thresholds.cpu_pressure_percent) {
    snap.recommendation = Recommendation::kCpuPressure;
  } else {
    snap.recommendation = Recommendation::kNormal;
  }
  return snap;
}

// ── ProcfsTelemetrySource ───────────────────────────────────────────────────

ProcfsTelemetrySource::ProcfsTelemetrySource(fs::path proc_root,
                                             fs::path sys_root,
                                             std::string gpu_type)
    : proc_root_(std::move(proc_root)), sys_root_(std::move(sys_root)),
      gpu_type_(std::move(gpu_type)) {}

RawReadings ProcfsTelemetrySource::Read() {
  RawReadings out;
  out.cpu_utilization = ReadCpuUtilization();
  std::ifstream stat(proc_root_ / "stat");
  std::string line;
  while (std::getline(stat, line)) {
    if (line.rfind("cpu", 0) == 0 && line.size() > 3 &&
        std::isdigit(static_cast<unsigned char>(line[3]))) {
      ++out.cores;
    }
  }
  ReadMemory(out);
  ReadGpu(out);
  out.temperature_c = ReadTemperature();
  return out;
}

double ProcfsTelemetrySource::ReadCpuUtilization() {
  std::istringstream fields(ReadFirstLine(proc_root_ / "stat"));
  std::string label;
  fields >> label;
  if (label != "cpu") {
    return 0.0;
  }
  uint64_t value = 0;
  uint64_t total = 0;
  uint64_t idle = 0;
  int index = 0;
  while (fields >> value) {
    total += value;
    if (index == 3 || index == 4) { // idle, iowait
      idle += value;
    }
    ++index;
  }

  uint64_t d_total = total;
  uint64_t d_idle = idle;
  if (primed_ && total >= last_total_ && idle >= last_idle_) {
    d_total = total - last_total_;
    d_idle = idle - last_idle_;
  }
  last_total_ = total;
  last_idle_ = idle;
  primed_ = true;
  if (d_total == 0) {
    return 0.0;
  }
  return 100.0 * static_cast<double>(d_total - d_idle) /
         static_cast<double>(d_total);
}

void ProcfsTelemetrySource::ReadMemory(RawReadings &out) const {
  std::ifstream in(proc_root_ / "meminfo");
  std::string key;
  double value = 0.0;
  std::string unit;
  while (in >> key >> value) {
    std::getline(in, unit);
    if (key == "MemTotal:") {
      out.mem_total_kb = value;
    } else if (key == "MemAvailable:") {
      out.mem_available_kb = value;
    }
  }
}

void ProcfsTelemetrySource::ReadGpu(RawReadings &out) const {
  if (gpu_type_ == "none") {
    return;
  }
  if (gpu_type_ != "auto" && !gpu_type_.empty()) {
    out.gpu_available = true;
    out.gpu_type = gpu_type_;
  }
  const fs::path drm = sys_root_ / "class" / "drm";
  std::error_code ec;
  if (!fs::is_directory(drm, ec)) {
    return;
  }
  for (const auto &entry : fs::directory_iterator(drm, ec)) {
    const std::string name = entry.path().filename().string();
    if (name.rfind("card", 0) != 0 || name.find('-') != std::string::npos) {
      continue;
    }
    const fs::path device = entry.path() / "device";
    const std::string vendor = ReadFirstLine(device / "vendor");
    std::string type;
    if (vendor == "0x10de") {
      type = "nvidia";
    } else if (vendor == "0x1002") {
      type = "amd";
    } else if (vendor == "0x8086") {
      type = "intel";
    } else {
      continue;
    }
    if (!out.gpu_available) {
      out.gpu_available = true;
      out.gpu_type = type;
    } else if (out.gpu_type != type) {
      continue;
    }
    const std::string busy = ReadFirstLine(device / "gpu_busy_percent");
    if (!busy.empty()) {
      try {
        out.gpu_utilization = std::stod(busy);
      } catch (const std::exception &) {
        out.gpu_utilization = -1.0;
      }
    }
    break;
  }
}

double ProcfsTelemetrySource::ReadTemperature() const {
  const fs::path thermal = sys_root_ / "class" / "thermal";
  std::error_code ec;
  if (!fs::is_directory(thermal, ec)) {
    return -1.0;
  }
  double max_c = -1.0;
  for (const auto &entry : fs::directory_iterator(thermal, ec)) {
    if (entry.path().filename().string().rfind("thermal_zone", 0) != 0) {
      continue;
    }
    const std::string raw = ReadFirstLine(entry.path() / "temp");
    if (raw.empty()) {
      continue;
    }
    try {
      max_c = std::max(max_c, std::stod(raw) / 1000.0);
    } catch (const std::exception &) {
      continue;
    }
  }
  return max_c;
}

// ── SystemTelemetryProfiler ─────────────────────────────────────────────────

SystemTelemetryProfiler::SystemTelemetryProfiler(
    std::unique_ptr<TelemetrySource> source, double interval_s,
    TelemetryThresholds thresholds)
    : source_(std::move(source)),
      interval_s_(interval_s > 0.0 ? interval_s : 0.5),
      thresholds_(thresholds) {
  std::atomic_store(&latest_, std::make_shared<const TelemetrySnapshot>());
}

SystemTelemetryProfiler::~SystemTelemetryProfiler() { Stop(); }

void SystemTelemetryProfiler::Start() {
  if (running_.load()) {
    return;
  }
  Sample();
  running_.store(true);
  sample_thread_ = std::thread([this] { SampleLoop(); });
  log::Info("telemetry", "profiler started",
            "interval_s=" + std::to_string(interval_s_));
}

void SystemTelemetryProfiler::Stop() {
  if (!running_.load()) {
    return;
  }
  running_.store(false);
  if (sample_thread_.joinable()) {
    sample_thread_.join();
  }
}

TelemetrySnapshot SystemTelemetryProfiler::Sample() {
  RawReadings raw;
  {
    std::lock_guard<std::mutex> lock(source_mutex_);
    raw = source_->Read();
  }
  TelemetrySnapshot snap = DeriveSnapshot(raw, thresholds_);
  std::atomic_store(&latest_, std::make_shared<const TelemetrySnapshot>(snap));
  {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.push_back(snap);
    while (history_.size() > kHistoryCapacity) {
      history_.pop_front();
    }
  }
  GlobalMetrics().SetTelemetry(snap.cpu.utilization, snap.memory.usage_percent,
                               snap.system_health_score);
  return snap;
}

TelemetrySnapshot SystemTelemetryProfiler::Latest() const {
  return *std::atomic_load(&latest_);
}

TelemetryHistoryStats
SystemTelemetryProfiler::History(std::size_t window) const {
  std::lock_guard<std::mutex> lock(history_mutex_);
  TelemetryHistoryStats stats;
  std::size_t count = history_.size();
  if (window > 0) {
    count = std::min(count, window);
  }
  if (count == 0) {
    return stats;
  }
  stats.samples = count;
  for (auto it = history_.end() - static_cast<std::ptrdiff_t>(count);
       it != history_.end(); ++it) {
    stats.avg_cpu_utilization += it->cpu.utilization;
    stats.avg_memory_percent += it->memory.usage_percent;
    stats.max_cpu_utilization =
        std::max(stats.max_cpu_utilization, it->cpu.utilization);
    stats.max_memory_percent =
        std::max(stats.max_memory_percent, it->memory.usage_percent);
  }
  stats.avg_cpu_utilization /= static_cast<double>(count);
  stats.avg_memory_percent /= static_cast<double>(count);
  return stats;
}

void SystemTelemetryProfiler::SampleLoop() {
  const auto interval = std::chrono::milliseconds(
      static_cast<int64_t>(interval_s_ * 1000.0));
  while (running_.load()) {
    auto deadline = std::chrono::steady_clock::now() + interval;
    while (running_.load() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(25));
    }
    if (!running_.load()) {
      break;
    }
    try {
      Sample();
    } catch (const std::exception &ex) {
      log::Warn("telemetry", std::string("sampling failed: ") + ex.what());
    }
  }
}

} // namespace blockpipe
