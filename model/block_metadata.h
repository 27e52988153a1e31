#pragma once

#include "runtime/tensors/tensor.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace blockpipe {

// Declared input or output of a block graph. Symbolic dimensions are -1 and
// keep their symbol in `dim_names` ("batch_size", "past_sequence_length").
struct TensorSpec {
  std::string name;
  DType dtype{DType::kFloat32};
  std::vector<int64_t> shape;
  std::vector<std::string> dim_names;
};

struct BlockIO {
  std::string block_id;
  std::string file_path;
  std::vector<TensorSpec> inputs;
  std::vector<TensorSpec> outputs;
  // Transformer layer whose KV this block owns; nullopt for the final
  // projection block.
  std::optional<int> layer_index;

  const TensorSpec *FindInput(const std::string &name) const;
  std::vector<std::string> InputNames() const;
  std::vector<std::string> OutputNames() const;
};

// Static description of the partitioned model, loaded from the metadata JSON:
//
//   {
//     "num_key_value_heads": 8, "head_dim": 128,
//     "expected_dtypes": {"input_ids": "int64"},
//     "block_io_details": {
//       "block_1": {"file_path": "block_1.onnx",
//                   "inputs": [{"name": "input_ids", "dtype": "int64",
//                               "shape": ["batch_size", "sequence_length"]}],
//                   "outputs": [...]}
//     }
//   }
class ModelMetadata {
public:
  int num_kv_heads{0};
  int head_dim{0};
  std::map<std::string, DType> expected_dtypes;
  std::map<std::string, BlockIO> blocks;

  bool HasBlock(const std::string &block_id) const;
  // Throws ConfigError for unknown blocks.
  const BlockIO &Block(const std::string &block_id) const;
  // Dtype of `input_name` for `block_id`: the block's declared dtype first,
  // then expected_dtypes, then name-based defaults.
  DType InputDType(const std::string &block_id,
                   const std::string &input_name) const;
  // Sorted, de-duplicated layer indices owned by `block_ids`.
  std::vector<int> LayerRange(const std::vector<std::string> &block_ids) const;
};

// Throws ConfigError when the file is missing, malformed, or lacks
// block_io_details / num_key_value_heads / head_dim.
ModelMetadata LoadModelMetadata(const std::filesystem::path &path);
ModelMetadata ParseModelMetadata(const std::string &json_text);

// Returns L for names of the form "past_key_values.L.key" / "present.L.value".
std::optional<int> LayerFromTensorName(const std::string &name);

} // namespace blockpipe
