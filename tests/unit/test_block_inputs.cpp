#include "runtime/errors.h"
#include "scheduler/block_inputs.h"
#include "tests/unit/test_support.h"

#include <catch2/catch_test_macros.hpp>

using namespace blockpipe;

namespace {

KVCacheConfig ModelKVConfig() {
  KVCacheConfig config;
  config.num_kv_heads = testing::kHeads;
  config.head_dim = testing::kHeadDim;
  config.page_capacity_tokens = 4;
  config.initial_pages = 2;
  return config;
}

Tensor KV(int64_t tokens, float value) {
  std::vector<float> values(
      static_cast<std::size_t>(testing::kHeads * tokens * testing::kHeadDim),
      value);
  return MakeTensor<float>(DType::kFloat32,
                           {1, testing::kHeads, tokens, testing::kHeadDim},
                           values);
}

} // namespace

TEST_CASE("PrepareBlockInputs: first block of a fresh session",
          "[block_inputs]") {
  ModelMetadata meta = testing::ThreeBlockMetadata();
  TensorMap propagating;
  propagating["input_ids"] = testing::InputIds({10, 11, 12});

  TensorMap feed =
      PrepareBlockInputs(meta.Block("block_1"), meta, propagating, nullptr);
  REQUIRE(feed.size() == 5);
  REQUIRE(feed.at("past_key_values.0.key").shape ==
          std::vector<int64_t>{1, 2, 0, 4});
  REQUIRE(feed.at("past_key_values.0.key").dtype == DType::kFloat16);
  REQUIRE(feed.at("attention_mask").Values<int64_t>() ==
          std::vector<int64_t>{1, 1, 1});
  REQUIRE(feed.at("position_ids").Values<int64_t>() ==
          std::vector<int64_t>{0, 1, 2});
}

TEST_CASE("PrepareBlockInputs: cached history shifts mask and positions",
          "[block_inputs]") {
  ModelMetadata meta = testing::ThreeBlockMetadata();
  auto pages = std::make_shared<KVPageManager>(ModelKVConfig());
  SessionPagedKVCache kv("s1", {0, 1}, pages);
  kv.Store(0, KV(3, 0.5f), KV(3, 0.25f));

  TensorMap propagating;
  propagating["input_ids"] = testing::InputIds({13});
  TensorMap feed =
      PrepareBlockInputs(meta.Block("block_1"), meta, propagating, &kv);
  REQUIRE(feed.at("past_key_values.0.value").shape ==
          std::vector<int64_t>{1, 2, 3, 4});
  REQUIRE(feed.at("attention_mask").shape == std::vector<int64_t>{1, 4});
  REQUIRE(feed.at("position_ids").Values<int64_t>() ==
          std::vector<int64_t>{3});
}

TEST_CASE("PrepareBlockInputs: propagated tensors win and are cast",
          "[block_inputs]") {
  ModelMetadata meta = testing::ThreeBlockMetadata();
  TensorMap propagating;
  propagating["input_ids"] = testing::InputIds({1, 2});
  propagating["/model/layers.0/Add_1_output_0"] =
      CastTo(testing::FilledFloat({1, 2, 8}, 1.0f), DType::kFloat16);
  propagating["past_key_values.1.key"] = KV(2, 1.0f);
  propagating["position_ids"] =
      MakeTensor<int64_t>(DType::kInt64, {1, 2}, {7, 8});

  TensorMap feed =
      PrepareBlockInputs(meta.Block("block_2"), meta, propagating, nullptr);
  // Declared float32 hidden state, declared float16 past.
  REQUIRE(feed.at("/model/layers.0/Add_1_output_0").dtype == DType::kFloat32);
  REQUIRE(feed.at("past_key_values.1.key").dtype == DType::kFloat16);
  REQUIRE(feed.at("past_key_values.1.key").shape[2] == 2);
  REQUIRE(feed.at("past_key_values.1.value").shape[2] == 0);
  // Shared attention input left for the warm cache.
  REQUIRE(feed.count("/model/ScatterND_output_0") == 0);
  // Inputs the block does not declare are not fed.
  REQUIRE(feed.count("input_ids") == 0);

  TensorMap first =
      PrepareBlockInputs(meta.Block("block_1"), meta, propagating, nullptr);
  REQUIRE(first.at("position_ids").Values<int64_t>() ==
          std::vector<int64_t>{7, 8});
}

TEST_CASE("PrepareBlockInputs: nothing to feed is an error", "[block_inputs]") {
  ModelMetadata meta = testing::ThreeBlockMetadata();
  REQUIRE_THROWS_AS(
      PrepareBlockInputs(meta.Block("block_3"), meta, TensorMap{}, nullptr),
      InputPreparationError);
}

TEST_CASE("ExtractPresentKV: pairs by layer", "[block_inputs]") {
  TensorMap outputs;
  outputs["present.0.key"] = KV(1, 0.0f);
  outputs["present.0.value"] = KV(1, 0.0f);
  outputs["present.4.key"] = KV(1, 0.0f); // value missing
  outputs["logits"] = testing::FilledFloat({1, 1, 16}, 0.0f);
  auto present = ExtractPresentKV(outputs);
  REQUIRE(present.size() == 1);
  REQUIRE(present.count(0) == 1);
}

TEST_CASE("StorePresentKV: delta rule", "[block_inputs]") {
  auto pages = std::make_shared<KVPageManager>(ModelKVConfig());
  SessionPagedKVCache kv("s1", {0}, pages);

  SECTION("first step stores everything") {
    StorePresentKV(kv, 0, {KV(3, 1.0f), KV(3, 1.0f)}, 0);
    REQUIRE(kv.LayerTokens(0) == 3);
  }
  SECTION("full-history output appends only the new slice") {
    kv.Store(0, KV(3, 1.0f), KV(3, 1.0f));
    StorePresentKV(kv, 0, {KV(4, 2.0f), KV(4, 2.0f)}, 3);
    REQUIRE(kv.LayerTokens(0) == 4);
  }
  SECTION("new-token-only output is appended whole") {
    kv.Store(0, KV(3, 1.0f), KV(3, 1.0f));
    StorePresentKV(kv, 0, {KV(1, 2.0f), KV(1, 2.0f)}, 3);
    REQUIRE(kv.LayerTokens(0) == 4);
  }
  SECTION("wrong rank") {
    Tensor flat = testing::FilledFloat({4}, 0.0f);
    REQUIRE_THROWS_AS(StorePresentKV(kv, 0, {flat, flat}, 0),
                      InputPreparationError);
  }
}

TEST_CASE("Block input names", "[block_inputs]") {
  REQUIRE(HiddenStateName(5) == "/model/layers.5/Add_1_output_0");
  REQUIRE(IsGlobalAttentionInput("/model/ScatterND_output_0"));
  REQUIRE_FALSE(IsGlobalAttentionInput("input_ids"));
  REQUIRE(GlobalAttentionInputNames().size() == 3);
}
