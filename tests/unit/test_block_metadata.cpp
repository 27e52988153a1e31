#include "model/block_metadata.h"
#include "runtime/errors.h"
#include "tests/unit/test_support.h"

#include <catch2/catch_test_macros.hpp>

using namespace blockpipe;
using blockpipe::testing::TempDir;
using blockpipe::testing::WriteFile;

TEST_CASE("ParseModelMetadata: blocks, layers and symbolic dims",
          "[block_metadata]") {
  ModelMetadata meta = testing::ThreeBlockMetadata();
  REQUIRE(meta.num_kv_heads == 2);
  REQUIRE(meta.head_dim == 4);
  REQUIRE(meta.blocks.size() == 3);

  const BlockIO &first = meta.Block("block_1");
  REQUIRE(first.file_path == "block_1.onnx");
  REQUIRE(first.layer_index == 0);
  REQUIRE(meta.Block("block_2").layer_index == 1);
  REQUIRE_FALSE(meta.Block("block_3").layer_index.has_value());

  const TensorSpec *past = first.FindInput("past_key_values.0.key");
  REQUIRE(past != nullptr);
  REQUIRE(past->dtype == DType::kFloat16);
  REQUIRE(past->shape == std::vector<int64_t>{-1, 2, -1, 4});
  REQUIRE(past->dim_names[2] == "past_sequence_length");
  REQUIRE(past->dim_names[1].empty());
  REQUIRE(first.FindInput("logits") == nullptr);

  REQUIRE(meta.Block("block_3").OutputNames() ==
          std::vector<std::string>{"logits"});
  REQUIRE(meta.LayerRange({"block_3", "block_2", "block_1", "block_9"}) ==
          std::vector<int>{0, 1});
}

TEST_CASE("ModelMetadata: input dtype resolution order", "[block_metadata]") {
  ModelMetadata meta = testing::ThreeBlockMetadata();
  // Declared on the block.
  REQUIRE(meta.InputDType("block_1", "past_key_values.0.key") ==
          DType::kFloat16);
  // expected_dtypes for a block that does not declare it.
  REQUIRE(meta.InputDType("block_3", "input_ids") == DType::kInt64);
  // Name-based defaults.
  REQUIRE(meta.InputDType("block_3", "attention_mask") == DType::kInt64);
  REQUIRE(meta.InputDType("block_3", "hidden") == DType::kFloat32);
}

TEST_CASE("ParseModelMetadata: required sections", "[block_metadata]") {
  REQUIRE_THROWS_AS(ParseModelMetadata("{not json"), ConfigError);
  REQUIRE_THROWS_AS(
      ParseModelMetadata(R"({"num_key_value_heads": 2, "head_dim": 4})"),
      ConfigError);
  REQUIRE_THROWS_AS(ParseModelMetadata(R"({"block_io_details": {}})"),
                    ConfigError);
  REQUIRE_THROWS_AS(
      ParseModelMetadata(
          R"({"block_io_details": {}, "num_key_value_heads": 0, "head_dim": 4})"),
      ConfigError);
  REQUIRE_THROWS_AS(
      ParseModelMetadata(R"({"block_io_details": {"block_1": {"inputs": [{"dtype": "int64"}]}},
                             "num_key_value_heads": 2, "head_dim": 4})"),
      ConfigError);
  REQUIRE_THROWS_AS(testing::ThreeBlockMetadata().Block("block_7"),
                    ConfigError);
}

TEST_CASE("LoadModelMetadata: file access", "[block_metadata]") {
  TempDir dir;
  auto path = dir.path() / "model_metadata.json";
  WriteFile(path, testing::ThreeBlockMetadataJson());
  REQUIRE(LoadModelMetadata(path).HasBlock("block_2"));
  REQUIRE_THROWS_AS(LoadModelMetadata(dir.path() / "missing.json"),
                    ConfigError);
}

TEST_CASE("LayerFromTensorName: KV tensor names", "[block_metadata]") {
  REQUIRE(LayerFromTensorName("past_key_values.12.key") == 12);
  REQUIRE(LayerFromTensorName("present.3.value") == 3);
  REQUIRE_FALSE(LayerFromTensorName("past_key_values.x.key").has_value());
  REQUIRE_FALSE(LayerFromTensorName("present").has_value());
  REQUIRE_FALSE(LayerFromTensorName("input_ids").has_value());
}
