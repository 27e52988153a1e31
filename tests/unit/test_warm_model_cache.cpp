#include "runtime/errors.h"
#include "runtime/warm_cache/load_strategy.h"
#include "runtime/warm_cache/warm_model_cache.h"
#include "tests/unit/test_support.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>

using namespace blockpipe;
using blockpipe::testing::StubBackend;
using blockpipe::testing::StubSession;
using blockpipe::testing::TempDir;
using blockpipe::testing::WriteFile;

namespace {

// Strategy whose outcome is scripted per test.
class StubStrategy : public LoadStrategy {
public:
  enum class Mode { kLoad, kAbsent, kThrow };

  StubStrategy(std::string name, Mode mode, const ModelMetadata *metadata)
      : name_(std::move(name)), mode_(mode), metadata_(metadata) {}

  std::string Name() const override { return name_; }
  std::string LoadFormat() const override { return name_ + "_format"; }

  std::unique_ptr<LoadedSession> TryLoad(const std::string &block_id) override {
    ++*calls;
    if (mode_ == Mode::kAbsent) {
      return nullptr;
    }
    if (mode_ == Mode::kThrow) {
      throw LoadError("scripted failure for " + block_id);
    }
    const BlockIO &io = metadata_->Block(block_id);
    auto session = std::make_unique<StubSession>(io.inputs, io.outputs);
    last_session = session.get();
    return std::make_unique<LoadedSession>(block_id, std::move(session), Name(),
                                           LoadFormat());
  }

  std::shared_ptr<int> calls = std::make_shared<int>(0);
  StubSession *last_session{nullptr};

private:
  std::string name_;
  Mode mode_;
  const ModelMetadata *metadata_;
};

// Loads every block at once except `gated_block`, which waits until Open().
class GatedStrategy : public LoadStrategy {
public:
  GatedStrategy(std::string gated_block, const ModelMetadata *metadata)
      : gated_block_(std::move(gated_block)), metadata_(metadata),
        opened_(gate_.get_future().share()) {}

  std::string Name() const override { return "gated"; }
  std::string LoadFormat() const override { return "gated_format"; }

  std::unique_ptr<LoadedSession> TryLoad(const std::string &block_id) override {
    if (block_id == gated_block_) {
      ++gated_loads;
      entered_.set_value();
      opened_.wait();
    }
    const BlockIO &io = metadata_->Block(block_id);
    return std::make_unique<LoadedSession>(
        block_id, std::make_unique<StubSession>(io.inputs, io.outputs), Name(),
        LoadFormat());
  }

  std::future<void> Entered() { return entered_.get_future(); }
  void Open() { gate_.set_value(); }

  std::atomic<int> gated_loads{0};

private:
  std::string gated_block_;
  const ModelMetadata *metadata_;
  std::promise<void> entered_;
  std::promise<void> gate_;
  std::shared_future<void> opened_;
};

std::unique_ptr<WarmModelCache>
MakeGatedCache(const ModelMetadata &metadata, GatedStrategy **gated) {
  auto strategy = std::make_unique<GatedStrategy>("block_1", &metadata);
  *gated = strategy.get();
  std::vector<std::unique_ptr<LoadStrategy>> strategies;
  strategies.push_back(std::move(strategy));
  WarmCacheConfig config;
  config.max_warm_sessions = 3;
  config.warmup_enabled = false;
  return std::make_unique<WarmModelCache>(std::move(strategies), &metadata,
                                          config);
}

struct CacheFixture {
  ModelMetadata metadata = testing::ThreeBlockMetadata();
  std::shared_ptr<int> first_calls;
  std::shared_ptr<int> second_calls;
  StubStrategy *loader{nullptr};

  std::unique_ptr<WarmModelCache> Make(StubStrategy::Mode first,
                                       StubStrategy::Mode second,
                                       std::size_t capacity = 2,
                                       int warmup_runs = 1) {
    std::vector<std::unique_ptr<LoadStrategy>> strategies;
    auto a = std::make_unique<StubStrategy>("first", first, &metadata);
    auto b = std::make_unique<StubStrategy>("second", second, &metadata);
    first_calls = a->calls;
    second_calls = b->calls;
    loader = first == StubStrategy::Mode::kLoad ? a.get() : b.get();
    strategies.push_back(std::move(a));
    strategies.push_back(std::move(b));
    WarmCacheConfig config;
    config.max_warm_sessions = capacity;
    config.warmup_runs = warmup_runs;
    config.warmup_enabled = warmup_runs > 0;
    return std::make_unique<WarmModelCache>(std::move(strategies), &metadata,
                                            config);
  }
};

} // namespace

TEST_CASE("WarmModelCache: cold load then warm hit", "[warm_cache]") {
  CacheFixture fx;
  auto cache = fx.Make(StubStrategy::Mode::kAbsent, StubStrategy::Mode::kLoad);

  SessionLease cold = cache->GetSession("block_1");
  REQUIRE(cold.session != nullptr);
  REQUIRE(cold.info.method == "cold_load_second");
  REQUIRE(cold.info.load_format == "second_format");
  REQUIRE(cold.info.attempted_methods ==
          std::vector<std::string>{"first", "second"});
  REQUIRE(cold.info.warmup_succeeded);

  SessionLease warm = cache->GetSession("block_1");
  REQUIRE(warm.session == cold.session);
  REQUIRE(warm.info.method == "warm_cache_hit");
  REQUIRE(warm.info.load_format == "memory_warm");
  REQUIRE(warm.info.original_method == "cold_load_second");
  REQUIRE(*fx.second_calls == 1);

  auto stats = cache->Stats();
  REQUIRE(stats.cache_hits == 1);
  REQUIRE(stats.cache_misses == 1);
  REQUIRE(stats.warmup_successes == 1);
  REQUIRE(stats.ToJson()["hit_rate"] == 0.5);
}

TEST_CASE("WarmModelCache: load errors fall through to the next strategy",
          "[warm_cache]") {
  CacheFixture fx;
  auto cache = fx.Make(StubStrategy::Mode::kThrow, StubStrategy::Mode::kLoad);
  SessionLease lease = cache->GetSession("block_2");
  REQUIRE(lease.session != nullptr);
  REQUIRE(lease.info.method == "cold_load_second");
  REQUIRE(*fx.first_calls == 1);
}

TEST_CASE("WarmModelCache: every strategy failing yields an empty lease",
          "[warm_cache]") {
  CacheFixture fx;
  auto cache = fx.Make(StubStrategy::Mode::kThrow, StubStrategy::Mode::kAbsent);
  SessionLease lease = cache->GetSession("block_2");
  REQUIRE(lease.session == nullptr);
  REQUIRE(lease.info.method == "failed_all_load_attempts");
  REQUIRE(lease.info.load_format == "none");
  REQUIRE_FALSE(cache->Contains("block_2"));
  REQUIRE(cache->Stats().failed_loads == 1);

  // Nothing is cached, so the next request retries every strategy.
  cache->GetSession("block_2");
  REQUIRE(*fx.first_calls == 2);
}

TEST_CASE("WarmModelCache: least recently used block is evicted",
          "[warm_cache]") {
  CacheFixture fx;
  auto cache = fx.Make(StubStrategy::Mode::kLoad, StubStrategy::Mode::kAbsent,
                       2, 0);
  SessionLease first = cache->GetSession("block_1");
  cache->GetSession("block_2");
  cache->GetSession("block_1"); // block_2 is now least recent
  cache->GetSession("block_3");

  REQUIRE(cache->Size() == 2);
  REQUIRE(cache->Contains("block_1"));
  REQUIRE_FALSE(cache->Contains("block_2"));
  auto stats = cache->Stats();
  REQUIRE(stats.cache_evictions == 1);
  REQUIRE(stats.resident_blocks ==
          std::vector<std::string>{"block_1", "block_3"});
  REQUIRE(stats.warmup_successes == 0);

  // A held lease survives eviction of its entry.
  cache->Evict("block_1");
  REQUIRE_FALSE(cache->Contains("block_1"));
  TensorMap inputs;
  inputs["input_ids"] = testing::InputIds({1, 2});
  TensorMap out = cache->Execute(*first.session, "block_1", inputs, {});
  REQUIRE(out.count("present.0.key") == 1);
}

TEST_CASE("WarmModelCache: execute fills shared inputs without overriding",
          "[warm_cache]") {
  CacheFixture fx;
  auto cache = fx.Make(StubStrategy::Mode::kLoad, StubStrategy::Mode::kAbsent,
                       2, 0);
  SessionLease lease = cache->GetSession("block_2");
  auto *session = fx.loader->last_session;
  REQUIRE(session != nullptr);

  cache->SetSharedInput("/model/ScatterND_output_0",
                        testing::FilledFloat({1, 1, 2, 2}, 7.0f));
  cache->SetSharedInput("unrelated", testing::FilledFloat({1}, 1.0f));
  REQUIRE(cache->SharedInputCount() == 2);

  TensorMap inputs;
  inputs["/model/layers.0/Add_1_output_0"] =
      testing::FilledFloat({1, 2, testing::kHidden}, 1.0f);
  TensorMap out = cache->Execute(*lease.session, "block_2", inputs,
                                 {"/model/layers.1/Add_1_output_0"});
  REQUIRE(out.size() == 1);
  REQUIRE(session->last_inputs.count("/model/ScatterND_output_0") == 1);
  // Only inputs the graph declares are filled.
  REQUIRE(session->last_inputs.count("unrelated") == 0);

  inputs["/model/ScatterND_output_0"] = testing::FilledFloat({1, 1, 2, 2}, 3.0f);
  cache->Execute(*lease.session, "block_2", inputs, {});
  REQUIRE(session->last_inputs.at("/model/ScatterND_output_0")
              .Values<float>()
              .front() == 3.0f);
  REQUIRE(cache->Stats().session_executions == 2);

  cache->Clear();
  REQUIRE(cache->SharedInputCount() == 0);
  REQUIRE(cache->Size() == 0);
}

TEST_CASE("WarmModelCache: failed runs are counted and rethrown",
          "[warm_cache]") {
  ModelMetadata metadata = testing::ThreeBlockMetadata();
  const BlockIO &io = metadata.Block("block_3");
  auto stub = std::make_unique<StubSession>(
      io.inputs, io.outputs,
      [](const TensorMap &, const std::vector<std::string> &)
          -> std::vector<Tensor> {
        throw std::runtime_error("Failed to allocate memory for tensor");
      });
  LoadedSession loaded("block_3", std::move(stub), "manual", "manual");
  WarmModelCache cache({}, &metadata, WarmCacheConfig{});

  REQUIRE_FALSE(cache.Warmup(loaded, "block_3"));
  REQUIRE(cache.Stats().warmup_failures == 1);
  REQUIRE_THROWS_AS(cache.Execute(loaded, "block_3", {}, {}),
                    std::runtime_error);
  REQUIRE(cache.Stats().session_execution_failures == 1);
}

TEST_CASE("WarmModelCache: warm-up feeds zero-length past", "[warm_cache]") {
  ModelMetadata metadata = testing::ThreeBlockMetadata();
  const BlockIO &io = metadata.Block("block_1");
  auto stub = std::make_unique<StubSession>(io.inputs, io.outputs);
  StubSession *raw = stub.get();
  LoadedSession loaded("block_1", std::move(stub), "manual", "manual");
  WarmCacheConfig config;
  config.warmup_runs = 3;
  WarmModelCache cache({}, &metadata, config);

  REQUIRE(cache.Warmup(loaded, "block_1"));
  REQUIRE(raw->runs == 3);
  REQUIRE(raw->last_inputs.at("past_key_values.0.key").shape ==
          std::vector<int64_t>{1, 2, 0, 4});
  REQUIRE(raw->last_inputs.at("input_ids").dtype == DType::kInt64);
  REQUIRE(raw->last_inputs.at("input_ids").shape ==
          std::vector<int64_t>{1, 1});
}

// ── Asset-based strategies ──────────────────────────────────────────────────

TEST_CASE("DefaultLoadStrategies: priority follows the assets on disk",
          "[warm_cache]") {
  TempDir dir;
  ModelMetadata metadata = testing::ThreeBlockMetadata();
  auto backend = std::make_shared<StubBackend>(metadata);
  auto resolver =
      std::make_shared<const BlockAssetResolver>(dir.path(), &metadata);
  WarmCacheConfig config;
  config.max_warm_sessions = 3;
  config.warmup_runs = 0;
  config.warmup_enabled = false;
  WarmModelCache cache(DefaultLoadStrategies(backend, resolver, {}), &metadata,
                       config);

  // block_1: optimized graph plus weights dir.
  WriteFile(dir.path() / "block_1_skeleton.optimized.onnx", "g");
  WriteFile(dir.path() / "block_1_weights" / "w.bin", "");
  WriteFile(dir.path() / "block_1.onnx", "g");
  // block_2: zero skeleton with a mapped weight.
  WriteFile(dir.path() / "block_2_skeleton_with_zeros.onnx", "g");
  WriteFile(dir.path() / "block_2_weights" / "weights_metadata.json",
            R"({"lm.weight": {"file_path": "lm.bin", "shape": [2], "dtype": "float32"}})");
  WriteFile(dir.path() / "block_2_weights" / "lm.bin", std::string(8, '\0'));
  // block_3: plain graph only.
  WriteFile(dir.path() / "block_3.onnx", "g");

  auto l1 = cache.GetSession("block_1");
  REQUIRE(l1.info.method == "cold_load_optimized_external");
  REQUIRE(l1.info.load_format == "optimized_onnx_external");
  REQUIRE(l1.info.attempted_methods.size() == 1);

  auto l2 = cache.GetSession("block_2");
  REQUIRE(l2.info.method == "cold_load_mmap_zeroskel");
  REQUIRE(l2.session->mapped_weight_count() == 1);
  REQUIRE(backend->injected == 1);

  auto l3 = cache.GetSession("block_3");
  REQUIRE(l3.info.method == "cold_load_standard_onnx");
  REQUIRE(l3.info.attempted_methods ==
          std::vector<std::string>{"optimized_external", "mmap_zeroskel",
                                   "standard_onnx"});
}

TEST_CASE("MmapZeroSkeletonStrategy: a bad weight fails the strategy",
          "[warm_cache]") {
  TempDir dir;
  ModelMetadata metadata = testing::ThreeBlockMetadata();
  auto backend = std::make_shared<StubBackend>(metadata);
  auto resolver =
      std::make_shared<const BlockAssetResolver>(dir.path(), &metadata);
  WriteFile(dir.path() / "block_2_skeleton_with_zeros.onnx", "g");
  WriteFile(dir.path() / "block_2_weights" / "weights_metadata.json",
            R"({"lm.weight": {"file_path": "lm.bin", "shape": [4], "dtype": "float32"}})");
  WriteFile(dir.path() / "block_2_weights" / "lm.bin", std::string(8, '\0'));

  MmapZeroSkeletonStrategy strategy(backend, resolver, {});
  REQUIRE_THROWS_AS(strategy.TryLoad("block_2"), LoadError);
  REQUIRE(strategy.TryLoad("block_3") == nullptr);

  // The cache moves on to the plain graph when it exists.
  WriteFile(dir.path() / "block_2.onnx", "g");
  WarmCacheConfig config;
  config.warmup_enabled = false;
  WarmModelCache cache(DefaultLoadStrategies(backend, resolver, {}), &metadata,
                       config);
  auto lease = cache.GetSession("block_2");
  REQUIRE(lease.info.method == "cold_load_standard_onnx");
}

TEST_CASE("LoadWeightManifest: accepts safe_filename", "[warm_cache]") {
  TempDir dir;
  auto manifest = dir.path() / "weights_metadata.json";
  WriteFile(manifest,
            R"({"a": {"safe_filename": "a.bin", "shape": [1, 2], "dtype": "float16"}})");
  auto entries = LoadWeightManifest(manifest);
  REQUIRE(entries.size() == 1);
  REQUIRE(entries[0].file == "a.bin");
  REQUIRE(entries[0].dtype == DType::kFloat16);

  WriteFile(manifest, R"({"a": {"shape": [1]}})");
  REQUIRE_THROWS_AS(LoadWeightManifest(manifest), LoadError);
  REQUIRE_THROWS_AS(MappedFile(dir.path() / "missing.bin"), LoadError);
}

TEST_CASE("WarmModelCache: hits are served while another block loads",
          "[warm_cache]") {
  ModelMetadata metadata = testing::ThreeBlockMetadata();
  GatedStrategy *gated = nullptr;
  auto cache = MakeGatedCache(metadata, &gated);
  REQUIRE(cache->GetSession("block_2").session != nullptr);

  auto entered = gated->Entered();
  auto slow = std::async(std::launch::async,
                         [&] { return cache->GetSession("block_1"); });
  entered.wait();

  auto hit = std::async(std::launch::async,
                        [&] { return cache->GetSession("block_2"); });
  REQUIRE(hit.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
  REQUIRE(hit.get().info.method == "warm_cache_hit");
  REQUIRE(cache->Size() == 1);

  gated->Open();
  REQUIRE(slow.get().info.method == "cold_load_gated");
  REQUIRE(cache->Contains("block_1"));
}

TEST_CASE("WarmModelCache: concurrent misses share one cold load",
          "[warm_cache]") {
  ModelMetadata metadata = testing::ThreeBlockMetadata();
  GatedStrategy *gated = nullptr;
  auto cache = MakeGatedCache(metadata, &gated);

  auto entered = gated->Entered();
  auto first = std::async(std::launch::async,
                          [&] { return cache->GetSession("block_1"); });
  entered.wait();
  auto second = std::async(std::launch::async,
                           [&] { return cache->GetSession("block_1"); });
  REQUIRE(second.wait_for(std::chrono::milliseconds(50)) ==
          std::future_status::timeout);

  gated->Open();
  SessionLease loaded = first.get();
  SessionLease waited = second.get();
  REQUIRE(waited.session == loaded.session);
  REQUIRE(waited.info.method == "warm_cache_hit");
  REQUIRE(gated->gated_loads == 1);
}

TEST_CASE("WarmModelCache: a load that straddles Clear is not cached",
          "[warm_cache]") {
  ModelMetadata metadata = testing::ThreeBlockMetadata();
  GatedStrategy *gated = nullptr;
  auto cache = MakeGatedCache(metadata, &gated);

  auto entered = gated->Entered();
  auto slow = std::async(std::launch::async,
                         [&] { return cache->GetSession("block_1"); });
  entered.wait();
  cache->Clear();
  gated->Open();

  REQUIRE(slow.get().session != nullptr);
  REQUIRE_FALSE(cache->Contains("block_1"));
  REQUIRE(cache->Size() == 0);
}
