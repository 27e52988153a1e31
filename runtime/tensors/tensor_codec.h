#pragma once

#include "runtime/tensors/tensor.h"

#include <nlohmann/json.hpp>

#include <string>

namespace blockpipe {

// Wire form of a tensor:
//   {"_tensor_": true, "dtype": "float32", "shape": [1, 4],
//    "data_b64": "<base64 of raw little-endian bytes>"}
class TensorCodec {
public:
  static bool IsEncodedTensor(const nlohmann::json &value);

  static nlohmann::json Encode(const Tensor &tensor);
  // Throws FormatError when the payload does not hold exactly
  // product(shape) * itemsize(dtype) bytes, or the dtype is unknown.
  static Tensor Decode(const nlohmann::json &encoded);

  static nlohmann::json EncodeMap(const TensorMap &tensors);
  // Decodes every encoded-tensor member of `object`. Members that are not
  // encoded tensors are copied into `passthrough` when it is non-null.
  static TensorMap DecodeMap(const nlohmann::json &object,
                             nlohmann::json *passthrough = nullptr);

  static std::string Base64Encode(const std::uint8_t *data, std::size_t len);
  static std::vector<std::uint8_t> Base64Decode(const std::string &text);
};

} // namespace blockpipe
