#include "scheduler/adaptive_block_scheduler.h"

#include <catch2/catch_test_macros.hpp>

using namespace blockpipe;

namespace {

TelemetrySnapshot Telemetry(double cpu_util, double mem_percent,
                            bool gpu = true, double gpu_util = 20.0,
                            const std::string &gpu_type = "nvidia") {
  RawReadings raw;
  raw.cpu_utilization = cpu_util;
  raw.cores = 8;
  raw.mem_total_kb = 1000.0;
  raw.mem_available_kb = 1000.0 * (1.0 - mem_percent / 100.0);
  raw.gpu_available = gpu;
  raw.gpu_type = gpu ? gpu_type : "none";
  raw.gpu_utilization = gpu_util;
  return DeriveSnapshot(raw, TelemetryThresholds{});
}

SchedulerPolicy EmptyPolicy() {
  SchedulerPolicy policy;
  return policy;
}

} // namespace

TEST_CASE("DecideWorker: force-CPU wins even when adaptation is off",
          "[scheduler]") {
  SchedulerPolicy policy = EmptyPolicy();
  policy.force_cpu_blocks = {"block_30"};
  policy.adaptive = false;
  auto decision =
      DecideWorker("block_30", WorkerType::kGpu, Telemetry(10, 10), policy);
  REQUIRE(decision.worker == WorkerType::kCpu);
  REQUIRE(decision.reason == "force_cpu");

  auto other =
      DecideWorker("block_2", WorkerType::kGpu, Telemetry(10, 10, false), policy);
  REQUIRE(other.worker == WorkerType::kGpu);
  REQUIRE(other.reason == "base");
}

TEST_CASE("DecideWorker: memory-intensive blocks leave GPU above high water",
          "[scheduler]") {
  SchedulerPolicy policy = EmptyPolicy();
  policy.memory_intensive_blocks = {"block_29"};
  auto under =
      DecideWorker("block_29", WorkerType::kGpu, Telemetry(10, 50), policy);
  REQUIRE(under.worker == WorkerType::kGpu);

  auto over =
      DecideWorker("block_29", WorkerType::kGpu, Telemetry(10, 92), policy);
  REQUIRE(over.worker == WorkerType::kCpu);
  REQUIRE(over.reason == "memory_pressure");
}

TEST_CASE("DecideWorker: capacity-limited GPU keeps large blocks on CPU",
          "[scheduler]") {
  SchedulerPolicy policy = EmptyPolicy();
  policy.limited_gpu_large_blocks = {"block_31"};
  auto intel = Telemetry(10, 10, true, 10.0, "intel");
  REQUIRE(intel.gpu.capacity_limited);
  auto decision = DecideWorker("block_31", WorkerType::kGpu, intel, policy);
  REQUIRE(decision.worker == WorkerType::kCpu);
  REQUIRE(decision.reason == "limited_gpu_capacity");

  auto small = DecideWorker("block_3", WorkerType::kGpu, intel, policy);
  REQUIRE(small.worker == WorkerType::kGpu);
}

TEST_CASE("DecideWorker: GPU-assigned blocks", "[scheduler]") {
  SchedulerPolicy policy = EmptyPolicy();

  SECTION("no GPU present") {
    auto d = DecideWorker("block_1", WorkerType::kGpu,
                          Telemetry(10, 10, false), policy);
    REQUIRE(d.worker == WorkerType::kCpu);
    REQUIRE(d.reason == "gpu_unavailable");
  }
  SECTION("busy GPU with CPU headroom falls back") {
    // gpu_pf 0.1 < 0.6, cpu_pf 0.8 > 0.3
    auto d = DecideWorker("block_1", WorkerType::kGpu,
                          Telemetry(20, 10, true, 90.0), policy);
    REQUIRE(d.worker == WorkerType::kCpu);
    REQUIRE(d.reason == "gpu_overloaded");
  }
  SECTION("critically loaded CPU keeps the GPU") {
    // cpu_pf 0.05 < 0.2
    auto d = DecideWorker("block_1", WorkerType::kGpu,
                          Telemetry(95, 10, true, 90.0), policy);
    REQUIRE(d.worker == WorkerType::kGpu);
    REQUIRE(d.reason == "cpu_critical");
  }
  SECTION("rebalance wins over a raised critical level") {
    policy.cpu_critical = 0.5;
    policy.cpu_threshold = 0.3;
    // cpu_pf 0.4 sits under cpu_critical and over cpu_threshold
    auto d = DecideWorker("block_1", WorkerType::kGpu,
                          Telemetry(60, 10, true, 90.0), policy);
    REQUIRE(d.worker == WorkerType::kCpu);
    REQUIRE(d.reason == "gpu_overloaded");
  }
  SECTION("busy GPU and busy CPU stays put") {
    // gpu_pf 0.1, cpu_pf 0.25: neither rule fires
    auto d = DecideWorker("block_1", WorkerType::kGpu,
                          Telemetry(75, 10, true, 90.0), policy);
    REQUIRE(d.worker == WorkerType::kGpu);
    REQUIRE(d.reason == "base");
  }
}

TEST_CASE("DecideWorker: CPU-assigned blocks promote to an idle GPU",
          "[scheduler]") {
  SchedulerPolicy policy = EmptyPolicy();
  policy.tail_cpu_blocks = {"block_33"};
  // cpu_pf 0.2 < 0.3, gpu_pf 0.9 > 0.7
  auto busy_cpu = Telemetry(80, 10, true, 10.0);
  auto d = DecideWorker("block_5", WorkerType::kCpu, busy_cpu, policy);
  REQUIRE(d.worker == WorkerType::kGpu);
  REQUIRE(d.reason == "gpu_promotion");

  auto tail = DecideWorker("block_33", WorkerType::kCpu, busy_cpu, policy);
  REQUIRE(tail.worker == WorkerType::kCpu);

  auto idle_cpu = DecideWorker("block_5", WorkerType::kCpu,
                               Telemetry(10, 10, true, 10.0), policy);
  REQUIRE(idle_cpu.worker == WorkerType::kCpu);
}

TEST_CASE("SchedulerPolicy: defaults cover the tail of a 33-block chain",
          "[scheduler]") {
  SchedulerPolicy policy = SchedulerPolicy::Defaults();
  REQUIRE(policy.force_cpu_blocks.count("block_28") == 1);
  REQUIRE(policy.force_cpu_blocks.count("block_33") == 1);
  REQUIRE(policy.force_cpu_blocks.count("block_27") == 0);
  REQUIRE(policy.limited_gpu_large_blocks.count("block_30") == 1);
  REQUIRE(policy.limited_gpu_large_blocks.count("block_29") == 0);
  REQUIRE(policy.adaptive);
}

TEST_CASE("BlockAssignmentBook: records only real changes", "[scheduler]") {
  BlockAssignmentBook book;
  ExecutionPlan plan = DefaultExecutionPlan({"block_1", "block_2"}, {"block_2"});
  book.Initialize(plan);
  REQUIRE(book.History().size() == 2);
  REQUIRE(book.Current("block_1") == WorkerType::kGpu);
  REQUIRE_FALSE(book.Current("block_9").has_value());

  REQUIRE_FALSE(book.Assign("block_1", WorkerType::kGpu, "base"));
  REQUIRE(book.Assign("block_1", WorkerType::kCpu, "gpu_unavailable"));
  auto history = book.History();
  REQUIRE(history.size() == 3);
  REQUIRE(history.back().from == "GPU");
  REQUIRE(history.back().to == "CPU");
  REQUIRE(history.back().reason == "gpu_unavailable");
}

TEST_CASE("BlockAssignmentBook: history and fallbacks are bounded",
          "[scheduler]") {
  BlockAssignmentBook book;
  for (std::size_t i = 0; i < BlockAssignmentBook::kMaxHistory + 50; ++i) {
    book.Assign("block_1", i % 2 ? WorkerType::kCpu : WorkerType::kGpu, "x");
    FallbackEvent event;
    event.block_id = "block_1";
    event.from = "GPU";
    event.to = "CPU";
    book.RecordFallback(event);
  }
  REQUIRE(book.History().size() == BlockAssignmentBook::kMaxHistory);
  REQUIRE(book.Fallbacks().size() == BlockAssignmentBook::kMaxHistory);
  REQUIRE(book.Fallbacks().front().timestamp_ms > 0);
}

TEST_CASE("BlockAssignmentBook: execution stats keep recent timings",
          "[scheduler]") {
  BlockAssignmentBook book;
  for (int i = 0; i < 120; ++i) {
    book.RecordExecution("block_4", WorkerType::kCpu, 0.01, true);
  }
  book.RecordExecution("block_4", WorkerType::kGpu, 0.0, false, "boom");
  auto stats = book.ExecutionStats("block_4");
  REQUIRE(stats.has_value());
  REQUIRE(stats->total == 121);
  REQUIRE(stats->successful == 120);
  REQUIRE(stats->failed == 1);
  REQUIRE(stats->execution_times.size() == BlockExecutionStats::kMaxTimes);
  REQUIRE(stats->errors.size() == 1);
  REQUIRE(stats->errors.front()["worker"] == "GPU");

  auto json = book.StatsJson();
  REQUIRE(json["assignment_stats"]["total_blocks_processed"] == 121);
  REQUIRE(json["execution_stats"]["block_4"]["failed"] == 1);
}

TEST_CASE("AdaptiveBlockScheduler: resolves against the base plan",
          "[scheduler]") {
  BlockAssignmentBook book;
  ExecutionPlan plan = DefaultExecutionPlan({"block_1", "block_2"}, {});
  AdaptiveBlockScheduler scheduler(plan, EmptyPolicy(), &book);

  REQUIRE(scheduler.Resolve("block_1", Telemetry(10, 10)) == WorkerType::kGpu);
  REQUIRE(scheduler.Resolve("block_2", Telemetry(10, 10, false)) ==
          WorkerType::kCpu);
  REQUIRE(book.Current("block_2") == WorkerType::kCpu);
  // The base plan is not rewritten by adaptive decisions.
  REQUIRE(scheduler.Base("block_2") == WorkerType::kGpu);
  REQUIRE_THROWS_AS(scheduler.Resolve("block_7", Telemetry(10, 10)),
                    std::out_of_range);
}
