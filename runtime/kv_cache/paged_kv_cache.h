#pragma once

#include "runtime/tensors/tensor.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace blockpipe {

struct KVCacheConfig {
  int num_kv_heads{8};
  int head_dim{128};
  int batch_size{1};
  int page_capacity_tokens{16};
  // Pages kept in the free pool; the pool grows past this on demand and
  // shrinks back on release.
  int initial_pages{16};
  DType dtype{DType::kFloat16};
};

// Fixed-capacity token page for one layer: key and value buffers shaped
// [batch, kv_heads, capacity, head_dim].
struct KVPage {
  Tensor key;
  Tensor value;
  int64_t tokens{0};
  int64_t capacity{0};

  bool Full() const { return tokens >= capacity; }
  int64_t Remaining() const { return capacity - tokens; }
};

// Pool of zeroed pages shared by every session of a node.
class KVPageManager {
public:
  explicit KVPageManager(const KVCacheConfig &config);

  std::unique_ptr<KVPage> Acquire();
  void Release(std::unique_ptr<KVPage> page);

  std::size_t FreePages() const;
  std::size_t PagesInUse() const;
  std::size_t TotalAllocated() const;
  const KVCacheConfig &config() const { return config_; }

private:
  std::unique_ptr<KVPage> NewPage() const;

  KVCacheConfig config_;
  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<KVPage>> free_;
  std::size_t in_use_{0};
  std::size_t total_allocated_{0};
};

struct KVPair {
  Tensor key;
  Tensor value;
};

// Pages of one transformer layer, filled in order.
class KVLayerStorage {
public:
  // `key`/`value` are [batch, kv_heads, n, head_dim]; they are converted to
  // the cache dtype. Throws std::invalid_argument on shape mismatch.
  void Append(const Tensor &key, const Tensor &value, KVPageManager &pages);
  // Concatenation of every page trimmed to its token count.
  KVPair Retrieve(const KVCacheConfig &config) const;
  void Clear(KVPageManager &pages);

  int64_t tokens() const { return tokens_; }
  std::size_t active_pages() const { return pages_.size(); }

private:
  std::vector<std::unique_ptr<KVPage>> pages_;
  int64_t tokens_{0};
};

struct KVCacheMetadata {
  int64_t total_tokens{0};
  std::size_t total_active_pages{0};

  nlohmann::json ToJson() const;
};

// ── SessionPagedKVCache ─────────────────────────────────────────────────────
// Key/value history of one session for a fixed set of layers. Pages return
// to the shared KVPageManager on reset and destruction.
class SessionPagedKVCache {
public:
  SessionPagedKVCache(std::string session_id, const std::vector<int> &layers,
                      std::shared_ptr<KVPageManager> pages);
  ~SessionPagedKVCache();

  SessionPagedKVCache(const SessionPagedKVCache &) = delete;
  SessionPagedKVCache &operator=(const SessionPagedKVCache &) = delete;

  // Never fails: unwritten or unmanaged layers yield [1, H, 0, D] tensors.
  KVPair Retrieve(int layer) const;
  // Appends the step's new tokens. Throws std::out_of_range for layers this
  // session does not manage.
  void Store(int layer, const Tensor &key, const Tensor &value);
  // Clears every layer; the object itself stays registered.
  void ResetForNewPrompt();

  KVCacheMetadata GetMetadata() const;
  int64_t LayerTokens(int layer) const;
  bool ManagesLayer(int layer) const;
  std::vector<int> Layers() const;
  const std::string &session_id() const { return session_id_; }

private:
  std::string session_id_;
  std::shared_ptr<KVPageManager> pages_;
  mutable std::mutex mutex_;
  std::map<int, KVLayerStorage> layers_;
};

} // namespace blockpipe
