#pragma once

#include "model/block_metadata.h"
#include "runtime/kv_cache/paged_kv_cache.h"
#include "runtime/tensors/tensor.h"

#include <map>
#include <string>
#include <vector>

namespace blockpipe {

// Attention-pattern tensors produced by the first block and consumed by
// every later block.
const std::vector<std::string> &GlobalAttentionInputNames();
bool IsGlobalAttentionInput(const std::string &name);

// "/model/layers.{layer}/Add_1_output_0": residual stream leaving `layer`.
std::string HiddenStateName(int layer);

// Builds the feed for `block` from the propagating tensors and the session's
// KV history:
//   - declared inputs already present in `propagating` are used as-is, with
//     float32/float16 converted to the declared dtype;
//   - past_key_values.L.{key,value} come from `kv` (empty history when the
//     layer has none) in the metadata's dtype;
//   - attention_mask and position_ids are synthesized from input_ids and
//     the cached sequence length when the caller did not send them.
// Inputs that cannot be sourced are left out; shared inputs held by the warm
// cache fill them at execution time. Throws InputPreparationError when
// nothing at all could be prepared.
TensorMap PrepareBlockInputs(const BlockIO &block, const ModelMetadata &metadata,
                             const TensorMap &propagating,
                             const SessionPagedKVCache *kv);

// present.L.{key,value} pairs found in `outputs`, keyed by layer.
std::map<int, KVPair> ExtractPresentKV(const TensorMap &outputs);

// Appends the tokens of `present` beyond `past_tokens` to `layer`. Graphs
// that return the full history grow along dim 2 past the cached length; the
// slice [past_tokens, n) is appended. Otherwise the whole tensor is new.
void StorePresentKV(SessionPagedKVCache &kv, int layer, const KVPair &present,
                    int64_t past_tokens);

} // namespace blockpipe
