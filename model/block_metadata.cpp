#include "model/block_metadata.h"

#include "runtime/errors.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace blockpipe {

namespace {

TensorSpec ParseTensorSpec(const json &j, const std::string &block_id) {
  if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
    throw ConfigError("tensor spec without a name in block " + block_id);
  }
  TensorSpec spec;
  spec.name = j["name"].get<std::string>();
  if (j.contains("dtype") && j["dtype"].is_string()) {
    spec.dtype = ParseDType(j["dtype"].get<std::string>());
  }
  if (j.contains("shape") && j["shape"].is_array()) {
    for (const auto &dim : j["shape"]) {
      if (dim.is_number_integer()) {
        spec.shape.push_back(dim.get<int64_t>());
        spec.dim_names.emplace_back();
      } else {
        spec.shape.push_back(-1);
        spec.dim_names.push_back(dim.is_string() ? dim.get<std::string>()
                                                 : std::string());
      }
    }
  }
  return spec;
}

} // namespace

std::optional<int> LayerFromTensorName(const std::string &name) {
  static const std::string kPrefixes[] = {"past_key_values.", "present."};
  for (const auto &prefix : kPrefixes) {
    if (name.rfind(prefix, 0) != 0) {
      continue;
    }
    auto dot = name.find('.', prefix.size());
    if (dot == std::string::npos) {
      return std::nullopt;
    }
    std::string digits = name.substr(prefix.size(), dot - prefix.size());
    if (digits.empty() ||
        !std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
      return std::nullopt;
    }
    return std::stoi(digits);
  }
  return std::nullopt;
}

const TensorSpec *BlockIO::FindInput(const std::string &name) const {
  for (const auto &spec : inputs) {
    if (spec.name == name) {
      return &spec;
    }
  }
  return nullptr;
}

std::vector<std::string> BlockIO::InputNames() const {
  std::vector<std::string> names;
  names.reserve(inputs.size());
  for (const auto &spec : inputs) {
    names.push_back(spec.name);
  }
  return names;
}

std::vector<std::string> BlockIO::OutputNames() const {
  std::vector<std::string> names;
  names.reserve(outputs.size());
  for (const auto &spec : outputs) {
    names.push_back(spec.name);
  }
  return names;
}

bool ModelMetadata::HasBlock(const std::string &block_id) const {
  return blocks.count(block_id) > 0;
}

const BlockIO &ModelMetadata::Block(const std::string &block_id) const {
  auto it = blocks.find(block_id);
  if (it == blocks.end()) {
    throw ConfigError("block '" + block_id + "' not found in model metadata");
  }
  return it->second;
}

DType ModelMetadata::InputDType(const std::string &block_id,
                                const std::string &input_name) const {
  auto it = blocks.find(block_id);
  if (it != blocks.end()) {
    const TensorSpec *spec = it->second.FindInput(input_name);
    if (spec && spec->dtype != DType::kUnknown) {
      return spec->dtype;
    }
  }
  auto exp = expected_dtypes.find(input_name);
  if (exp != expected_dtypes.end() && exp->second != DType::kUnknown) {
    return exp->second;
  }
  if (input_name.find("input_ids") != std::string::npos ||
      input_name.find("attention_mask") != std::string::npos ||
      input_name.find("position_ids") != std::string::npos) {
    return DType::kInt64;
  }
  return DType::kFloat32;
}

std::vector<int>
ModelMetadata::LayerRange(const std::vector<std::string> &block_ids) const {
  std::set<int> layers;
  for (const auto &id : block_ids) {
    auto it = blocks.find(id);
    if (it != blocks.end() && it->second.layer_index) {
      layers.insert(*it->second.layer_index);
    }
  }
  return {layers.begin(), layers.end()};
}

ModelMetadata ParseModelMetadata(const std::string &json_text) {
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::parse_error &ex) {
    throw ConfigError(std::string("model metadata is not valid JSON: ") +
                      ex.what());
  }
  if (!root.is_object() || !root.contains("block_io_details") ||
      !root["block_io_details"].is_object()) {
    throw ConfigError("'block_io_details' missing in model metadata");
  }
  if (!root.contains("num_key_value_heads") ||
      !root["num_key_value_heads"].is_number_integer() ||
      !root.contains("head_dim") || !root["head_dim"].is_number_integer()) {
    throw ConfigError(
        "'num_key_value_heads' or 'head_dim' missing in model metadata");
  }

  ModelMetadata meta;
  meta.num_kv_heads = root["num_key_value_heads"].get<int>();
  meta.head_dim = root["head_dim"].get<int>();
  if (meta.num_kv_heads <= 0 || meta.head_dim <= 0) {
    throw ConfigError("num_key_value_heads and head_dim must be positive");
  }

  if (root.contains("expected_dtypes") && root["expected_dtypes"].is_object()) {
    for (auto it = root["expected_dtypes"].begin();
         it != root["expected_dtypes"].end(); ++it) {
      if (it.value().is_string()) {
        meta.expected_dtypes[it.key()] =
            ParseDType(it.value().get<std::string>());
      }
    }
  }

  for (auto it = root["block_io_details"].begin();
       it != root["block_io_details"].end(); ++it) {
    BlockIO block;
    block.block_id = it.key();
    const json &details = it.value();
    if (!details.is_object()) {
      throw ConfigError("block_io_details entry for " + block.block_id +
                        " is not an object");
    }
    block.file_path = details.value("file_path", block.block_id + ".onnx");
    if (details.contains("inputs") && details["inputs"].is_array()) {
      for (const auto &spec : details["inputs"]) {
        block.inputs.push_back(ParseTensorSpec(spec, block.block_id));
      }
    }
    if (details.contains("outputs") && details["outputs"].is_array()) {
      for (const auto &spec : details["outputs"]) {
        block.outputs.push_back(ParseTensorSpec(spec, block.block_id));
      }
    }
    for (const auto &spec : block.inputs) {
      auto layer = LayerFromTensorName(spec.name);
      if (layer) {
        block.layer_index = layer;
        break;
      }
    }
    meta.blocks.emplace(block.block_id, std::move(block));
  }
  return meta;
}

ModelMetadata LoadModelMetadata(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("cannot open model metadata file: " + path.string());
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return ParseModelMetadata(buf.str());
}

} // namespace blockpipe
