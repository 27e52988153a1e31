#include "runtime/errors.h"
#include "scheduler/execution_plan.h"
#include "tests/unit/test_support.h"

#include <catch2/catch_test_macros.hpp>

using namespace blockpipe;
using blockpipe::testing::TempDir;
using blockpipe::testing::WriteFile;

TEST_CASE("ParseWorkerType: case-insensitive", "[execution_plan]") {
  REQUIRE(ParseWorkerType("cpu") == WorkerType::kCpu);
  REQUIRE(ParseWorkerType("GPU") == WorkerType::kGpu);
  REQUIRE_FALSE(ParseWorkerType("tpu").has_value());
}

TEST_CASE("DefaultExecutionPlan: listed blocks on CPU", "[execution_plan]") {
  auto plan = DefaultExecutionPlan({"block_1", "block_2", "block_3"},
                                   {"block_3"});
  REQUIRE(plan.source == "default");
  REQUIRE(plan.Get("block_1") == WorkerType::kGpu);
  REQUIRE(plan.Get("block_3") == WorkerType::kCpu);
  REQUIRE_FALSE(plan.Has("block_4"));
  REQUIRE_THROWS_AS(plan.Get("block_4"), std::out_of_range);
}

TEST_CASE("LoadExecutionPlanFile: reads assignments", "[execution_plan]") {
  TempDir dir;
  auto path = dir.path() / "plan.json";

  SECTION("valid file fills missing blocks with GPU") {
    WriteFile(path, R"({"block_1": "cpu"})");
    auto plan = LoadExecutionPlanFile(path, {"block_1", "block_2"});
    REQUIRE(plan.source == "plan_file");
    REQUIRE(plan.Get("block_1") == WorkerType::kCpu);
    REQUIRE(plan.Get("block_2") == WorkerType::kGpu);
  }
  SECTION("bad worker name") {
    WriteFile(path, R"({"block_1": "NPU"})");
    REQUIRE_THROWS_AS(LoadExecutionPlanFile(path, {"block_1"}), ConfigError);
  }
  SECTION("not an object") {
    WriteFile(path, R"(["block_1"])");
    REQUIRE_THROWS_AS(LoadExecutionPlanFile(path, {"block_1"}), ConfigError);
  }
  SECTION("missing file") {
    REQUIRE_THROWS_AS(LoadExecutionPlanFile(dir.path() / "nope.json", {}),
                      ConfigError);
  }
}

TEST_CASE("StaticSplitPlanner: minimizes the slower side", "[execution_plan]") {
  // CPU is fast on the first two blocks, GPU on the last two.
  nlohmann::json profile = {
      {"block_1", {{"CPUExecutionProvider", {{"mean_ms", 10.0}}},
                   {"CUDAExecutionProvider", {{"mean_ms", 50.0}}}}},
      {"block_2", {{"CPUExecutionProvider", {{"mean_ms", 10.0}}},
                   {"CUDAExecutionProvider", {{"mean_ms", 50.0}}}}},
      {"block_3", {{"CPUExecutionProvider", {{"mean_ms", 80.0}}},
                   {"CUDAExecutionProvider", {{"measurements_ms", {8.0, 12.0}}}}}},
      {"block_4", {{"CPUExecutionProvider", {{"mean_ms", 80.0}}},
                   {"CUDAExecutionProvider", {{"mean_ms", 10.0}}}}}};
  StaticSplitPlanner planner(profile,
                             {"block_1", "block_2", "block_3", "block_4"});
  REQUIRE(planner.BlockTimeMs("block_3", WorkerType::kGpu) == 10.0);
  REQUIRE(planner.BlockTimeMs("block_9", WorkerType::kCpu) ==
          StaticSplitPlanner::kMissingTimeMs);

  auto plan = planner.Plan();
  REQUIRE(plan.source == "profile_split");
  REQUIRE(planner.best().k == 2);
  REQUIRE(planner.best().pipeline_ms == 20.0);
  REQUIRE(planner.analysis().size() == 5);
  REQUIRE(plan.Get("block_1") == WorkerType::kCpu);
  REQUIRE(plan.Get("block_2") == WorkerType::kCpu);
  REQUIRE(plan.Get("block_3") == WorkerType::kGpu);
  REQUIRE(plan.Get("block_4") == WorkerType::kGpu);
}

TEST_CASE("ResolveExecutionPlan: precedence and force-CPU overlay",
          "[execution_plan]") {
  TempDir dir;
  const std::vector<std::string> chain = {"block_1", "block_2", "block_3"};
  auto plan_file = dir.path() / "plan.json";
  auto profile_file = dir.path() / "profile.json";

  SECTION("plan file beats profile") {
    WriteFile(plan_file, R"({"block_1": "GPU", "block_2": "GPU", "block_3": "GPU"})");
    WriteFile(profile_file, "{}");
    auto plan = ResolveExecutionPlan(plan_file, profile_file, chain,
                                     {"block_3"}, {});
    REQUIRE(plan.source == "plan_file");
    REQUIRE(plan.Get("block_1") == WorkerType::kGpu);
    REQUIRE(plan.Get("block_3") == WorkerType::kCpu);
  }
  SECTION("profile used when no plan file") {
    WriteFile(profile_file, "{}");
    auto plan = ResolveExecutionPlan(plan_file, profile_file, chain, {}, {});
    REQUIRE(plan.source == "profile_split");
  }
  SECTION("default plan puts memory-intensive blocks on CPU") {
    auto plan = ResolveExecutionPlan({}, {}, chain, {}, {"block_2"});
    REQUIRE(plan.source == "default");
    REQUIRE(plan.Get("block_2") == WorkerType::kCpu);
    REQUIRE(plan.Get("block_1") == WorkerType::kGpu);
  }
}
