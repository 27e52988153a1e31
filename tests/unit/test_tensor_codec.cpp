#include "runtime/errors.h"
#include "runtime/tensors/tensor.h"
#include "runtime/tensors/tensor_codec.h"

#include <catch2/catch_test_macros.hpp>

using namespace blockpipe;
using json = nlohmann::json;

TEST_CASE("TensorCodec: wire form", "[tensor_codec]") {
  Tensor t = MakeTensor<float>(DType::kFloat32, {1, 2}, {1.5f, -2.0f});
  json encoded = TensorCodec::Encode(t);
  REQUIRE(encoded["_tensor_"] == true);
  REQUIRE(encoded["dtype"] == "float32");
  REQUIRE(encoded["shape"] == json::array({1, 2}));
  REQUIRE(TensorCodec::IsEncodedTensor(encoded));

  Tensor back = TensorCodec::Decode(encoded);
  REQUIRE(back.dtype == DType::kFloat32);
  REQUIRE(back.shape == t.shape);
  REQUIRE(back.Values<float>() == std::vector<float>{1.5f, -2.0f});
}

TEST_CASE("TensorCodec: int64 and float16 payloads keep their bytes",
          "[tensor_codec]") {
  Tensor ids = MakeTensor<int64_t>(DType::kInt64, {1, 3}, {101, 7592, 102});
  Tensor half = CastTo(MakeTensor<float>(DType::kFloat32, {2}, {0.5f, 3.0f}),
                       DType::kFloat16);
  Tensor ids_back = TensorCodec::Decode(TensorCodec::Encode(ids));
  REQUIRE(ids_back.Values<int64_t>() == std::vector<int64_t>{101, 7592, 102});

  json half_json = TensorCodec::Encode(half);
  REQUIRE(half_json["dtype"] == "float16");
  Tensor half_back = TensorCodec::Decode(half_json);
  REQUIRE(half_back.data == half.data);
  REQUIRE(CastTo(half_back, DType::kFloat32).Values<float>() ==
          std::vector<float>{0.5f, 3.0f});
}

TEST_CASE("TensorCodec: scalars and empty tensors", "[tensor_codec]") {
  Tensor scalar = MakeTensor<int64_t>(DType::kInt64, {}, {42});
  Tensor back = TensorCodec::Decode(TensorCodec::Encode(scalar));
  REQUIRE(back.shape.empty());
  REQUIRE(back.Values<int64_t>() == std::vector<int64_t>{42});

  Tensor empty = MakeZeros(DType::kFloat16, {1, 2, 0, 4});
  json encoded = TensorCodec::Encode(empty);
  REQUIRE(encoded["data_b64"] == "");
  Tensor empty_back = TensorCodec::Decode(encoded);
  REQUIRE(empty_back.shape == std::vector<int64_t>{1, 2, 0, 4});
  REQUIRE(empty_back.Empty());
}

TEST_CASE("TensorCodec: malformed payloads are format errors",
          "[tensor_codec]") {
  json good = TensorCodec::Encode(
      MakeTensor<float>(DType::kFloat32, {2}, {1.0f, 2.0f}));

  SECTION("byte count mismatch") {
    json bad = good;
    bad["shape"] = {3};
    REQUIRE_THROWS_AS(TensorCodec::Decode(bad), FormatError);
  }
  SECTION("unknown dtype") {
    json bad = good;
    bad["dtype"] = "complex64";
    REQUIRE_THROWS_AS(TensorCodec::Decode(bad), FormatError);
  }
  SECTION("negative dimension") {
    json bad = good;
    bad["shape"] = {-2};
    REQUIRE_THROWS_AS(TensorCodec::Decode(bad), FormatError);
  }
  SECTION("element count overflow") {
    json bad = good;
    bad["shape"] = {int64_t{1} << 32, int64_t{1} << 32};
    bad["data_b64"] = "";
    REQUIRE_THROWS_AS(TensorCodec::Decode(bad), FormatError);
  }
  SECTION("byte count overflow") {
    json bad = good;
    bad["shape"] = {int64_t{1} << 62};
    bad["data_b64"] = "";
    REQUIRE_THROWS_AS(TensorCodec::Decode(bad), FormatError);
  }
  SECTION("broken base64") {
    json bad = good;
    bad["data_b64"] = "@@@";
    REQUIRE_THROWS_AS(TensorCodec::Decode(bad), FormatError);
  }
  SECTION("missing marker") {
    json bad = good;
    bad.erase("_tensor_");
    REQUIRE_FALSE(TensorCodec::IsEncodedTensor(bad));
    REQUIRE_THROWS_AS(TensorCodec::Decode(bad), FormatError);
  }
}

TEST_CASE("TensorCodec: maps keep non-tensor members aside", "[tensor_codec]") {
  TensorMap tensors;
  tensors["input_ids"] = MakeTensor<int64_t>(DType::kInt64, {1, 1}, {5});
  json wire = TensorCodec::EncodeMap(tensors);
  wire["note"] = "metadata";

  json passthrough = json::object();
  TensorMap decoded = TensorCodec::DecodeMap(wire, &passthrough);
  REQUIRE(decoded.size() == 1);
  REQUIRE(decoded.count("input_ids") == 1);
  REQUIRE(passthrough["note"] == "metadata");

  REQUIRE(TensorCodec::DecodeMap(wire).size() == 1);
  REQUIRE_THROWS_AS(TensorCodec::DecodeMap(json::array()), FormatError);
}

TEST_CASE("TensorCodec: base64 padding", "[tensor_codec]") {
  const std::uint8_t bytes[] = {'a', 'b', 'c', 'd'};
  REQUIRE(TensorCodec::Base64Encode(bytes, 1) == "YQ==");
  REQUIRE(TensorCodec::Base64Encode(bytes, 2) == "YWI=");
  REQUIRE(TensorCodec::Base64Encode(bytes, 3) == "YWJj");
  REQUIRE(TensorCodec::Base64Decode("YWJjZA==") ==
          std::vector<std::uint8_t>{'a', 'b', 'c', 'd'});
  REQUIRE_THROWS_AS(TensorCodec::Base64Decode("YWJ"), FormatError);
}

TEST_CASE("Tensor: concat and slice along the sequence axis", "[tensor]") {
  Tensor a = MakeTensor<float>(DType::kFloat32, {1, 1, 2, 1}, {1, 2});
  Tensor b = MakeTensor<float>(DType::kFloat32, {1, 1, 1, 1}, {3});
  Tensor joined = Concat({&a, &b}, 2);
  REQUIRE(joined.shape == std::vector<int64_t>{1, 1, 3, 1});
  REQUIRE(joined.Values<float>() == std::vector<float>{1, 2, 3});

  Tensor tail = Slice(joined, 2, 1, 3);
  REQUIRE(tail.Values<float>() == std::vector<float>{2, 3});
  // Bounds are clamped.
  REQUIRE(Slice(joined, 2, 2, 99).shape[2] == 1);
  REQUIRE_THROWS_AS(Slice(joined, 4, 0, 1), std::out_of_range);

  Tensor wrong = MakeTensor<float>(DType::kFloat32, {1, 2, 1, 1}, {0, 0});
  REQUIRE_THROWS_AS(Concat({&a, &wrong}, 2), std::invalid_argument);
}

TEST_CASE("Tensor: element count rejects overflowing shapes", "[tensor]") {
  REQUIRE(NumElements({0, int64_t{1} << 62, int64_t{1} << 62}) == 0);
  REQUIRE_THROWS_AS(NumElements({int64_t{1} << 32, int64_t{1} << 32}),
                    std::overflow_error);
}

TEST_CASE("Tensor: dtype names and aliases", "[tensor]") {
  REQUIRE(ParseDType("float") == DType::kFloat32);
  REQUIRE(ParseDType("tensor(float)") == DType::kFloat32);
  REQUIRE(ParseDType("fp16") == DType::kFloat16);
  REQUIRE(ParseDType("long") == DType::kInt64);
  REQUIRE(ParseDType("string") == DType::kUnknown);
  REQUIRE(std::string(DTypeName(DType::kInt64)) == "int64");
  REQUIRE(DTypeSize(DType::kFloat16) == 2);
  REQUIRE(ShapeString({1, 2, 0}) == "[1, 2, 0]");
  REQUIRE_THROWS_AS(CastTo(MakeZeros(DType::kInt64, {1}), DType::kFloat16),
                    std::invalid_argument);
}
