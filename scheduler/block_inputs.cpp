#include "scheduler/block_inputs.h"

#include "runtime/errors.h"

#include <algorithm>

namespace blockpipe {

namespace {

const char *kPastPrefix = "past_key_values.";

bool IsPastKV(const std::string &name, bool *is_key) {
  if (name.rfind(kPastPrefix, 0) != 0) {
    return false;
  }
  if (name.size() > 4 && name.compare(name.size() - 4, 4, ".key") == 0) {
    *is_key = true;
    return true;
  }
  if (name.size() > 6 && name.compare(name.size() - 6, 6, ".value") == 0) {
    *is_key = false;
    return true;
  }
  return false;
}

Tensor MatchDType(const Tensor &tensor, DType declared) {
  if (tensor.dtype == declared) {
    return tensor;
  }
  const bool float_pair =
      (tensor.dtype == DType::kFloat32 && declared == DType::kFloat16) ||
      (tensor.dtype == DType::kFloat16 && declared == DType::kFloat32);
  return float_pair ? CastTo(tensor, declared) : tensor;
}

// Cached tokens ahead of this step for the block's own layer.
int64_t PastLength(const BlockIO &block, const SessionPagedKVCache *kv) {
  if (!kv || !block.layer_index) {
    return 0;
  }
  return kv->LayerTokens(*block.layer_index);
}

Tensor MakeAttentionMask(int64_t batch, int64_t total) {
  std::vector<int64_t> ones(static_cast<std::size_t>(batch * total), 1);
  return MakeTensor<int64_t>(DType::kInt64, {batch, total}, ones);
}

Tensor MakePositionIds(int64_t batch, int64_t seq, int64_t past) {
  std::vector<int64_t> ids;
  ids.reserve(static_cast<std::size_t>(batch * seq));
  for (int64_t b = 0; b < batch; ++b) {
    for (int64_t i = 0; i < seq; ++i) {
      ids.push_back(past + i);
    }
  }
  return MakeTensor<int64_t>(DType::kInt64, {batch, seq}, ids);
}

} // namespace

const std::vector<std::string> &GlobalAttentionInputNames() {
  static const std::vector<std::string> kNames = {
      "/model/ScatterND_output_0",
      "/model/layers.0/self_attn/Unsqueeze_6_output_0",
      "/model/layers.0/self_attn/Unsqueeze_7_output_0",
  };
  return kNames;
}

bool IsGlobalAttentionInput(const std::string &name) {
  const auto &names = GlobalAttentionInputNames();
  return std::find(names.begin(), names.end(), name) != names.end();
}

std::string HiddenStateName(int layer) {
  return "/model/layers." + std::to_string(layer) + "/Add_1_output_0";
}

TensorMap PrepareBlockInputs(const BlockIO &block, const ModelMetadata &metadata,
                             const TensorMap &propagating,
                             const SessionPagedKVCache *kv) {
  TensorMap feed;
  const int64_t past = PastLength(block, kv);

  for (const TensorSpec &spec : block.inputs) {
    const DType declared = metadata.InputDType(block.block_id, spec.name);

    auto it = propagating.find(spec.name);
    if (it != propagating.end()) {
      feed[spec.name] = MatchDType(it->second, declared);
      continue;
    }

    bool is_key = false;
    if (IsPastKV(spec.name, &is_key)) {
      auto layer = LayerFromTensorName(spec.name);
      if (!layer) {
        throw InputPreparationError("cannot parse layer from " + spec.name);
      }
      KVPair pair;
      if (kv) {
        pair = kv->Retrieve(*layer);
      } else {
        pair.key = MakeZeros(DType::kFloat16,
                             {1, metadata.num_kv_heads, 0, metadata.head_dim});
        pair.value = pair.key;
      }
      feed[spec.name] = MatchDType(is_key ? pair.key : pair.value, declared);
      continue;
    }

    auto ids = propagating.find("input_ids");
    if (ids == propagating.end() || ids->second.shape.size() != 2) {
      continue;
    }
    const int64_t batch = ids->second.shape[0];
    const int64_t seq = ids->second.shape[1];
    if (spec.name == "attention_mask") {
      feed[spec.name] = MakeAttentionMask(batch, past + seq);
    } else if (spec.name == "position_ids") {
      feed[spec.name] = MakePositionIds(batch, seq, past);
    }
  }

  if (feed.empty()) {
    throw InputPreparationError("No valid inputs prepared for " +
                                block.block_id);
  }
  return feed;
}

std::map<int, KVPair> ExtractPresentKV(const TensorMap &outputs) {
  std::map<int, KVPair> out;
  for (const auto &[name, tensor] : outputs) {
    if (name.rfind("present.", 0) != 0) {
      continue;
    }
    auto layer = LayerFromTensorName(name);
    if (!layer) {
      continue;
    }
    if (name.size() > 4 && name.compare(name.size() - 4, 4, ".key") == 0) {
      out[*layer].key = tensor;
    } else if (name.size() > 6 &&
               name.compare(name.size() - 6, 6, ".value") == 0) {
      out[*layer].value = tensor;
    }
  }
  for (auto it = out.begin(); it != out.end();) {
    if (it->second.key.shape.empty() || it->second.value.shape.empty()) {
      it = out.erase(it);
    } else {
      ++it;
    }
  }
  return out;
}

void StorePresentKV(SessionPagedKVCache &kv, int layer, const KVPair &present,
                    int64_t past_tokens) {
  if (present.key.shape.size() != 4 || present.value.shape.size() != 4) {
    throw InputPreparationError("present KV for layer " +
                                std::to_string(layer) + " is not rank 4");
  }
  const int64_t n = present.key.shape[2];
  if (past_tokens > 0 && n > past_tokens) {
    kv.Store(layer, Slice(present.key, 2, past_tokens, n),
             Slice(present.value, 2, past_tokens, n));
  } else {
    kv.Store(layer, present.key, present.value);
  }
}

} // namespace blockpipe
