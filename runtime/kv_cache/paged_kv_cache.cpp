#include "runtime/kv_cache/paged_kv_cache.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace blockpipe {

namespace {

// Copies `count` tokens along axis 2 between [B, H, S, D] tensors.
void CopyTokens(const Tensor &src, int64_t src_start, Tensor &dst,
                int64_t dst_start, int64_t count) {
  const int64_t batch = src.shape[0];
  const int64_t heads = src.shape[1];
  const int64_t src_seq = src.shape[2];
  const int64_t dst_seq = dst.shape[2];
  const std::size_t row =
      static_cast<std::size_t>(src.shape[3]) * DTypeSize(src.dtype);
  for (int64_t b = 0; b < batch; ++b) {
    for (int64_t h = 0; h < heads; ++h) {
      const std::size_t plane = static_cast<std::size_t>(b * heads + h);
      const std::uint8_t *from =
          src.data.data() +
          (plane * src_seq + static_cast<std::size_t>(src_start)) * row;
      std::uint8_t *to =
          dst.data.data() +
          (plane * dst_seq + static_cast<std::size_t>(dst_start)) * row;
      std::memcpy(to, from, static_cast<std::size_t>(count) * row);
    }
  }
}

void CheckKVShape(const Tensor &t, const KVCacheConfig &config,
                  const char *what) {
  if (t.shape.size() != 4 || t.shape[0] != config.batch_size ||
      t.shape[1] != config.num_kv_heads || t.shape[3] != config.head_dim) {
    throw std::invalid_argument(std::string(what) + " tensor shape " +
                                ShapeString(t.shape) +
                                " does not match [batch, " +
                                std::to_string(config.num_kv_heads) +
                                ", seq, " + std::to_string(config.head_dim) +
                                "]");
  }
}

Tensor EmptyKV(const KVCacheConfig &config) {
  return MakeZeros(config.dtype,
                   {config.batch_size, config.num_kv_heads, 0, config.head_dim});
}

} // namespace

KVPageManager::KVPageManager(const KVCacheConfig &config) : config_(config) {
  if (config_.page_capacity_tokens <= 0) {
    throw std::invalid_argument("page_capacity_tokens must be positive");
  }
  for (int i = 0; i < config_.initial_pages; ++i) {
    free_.push_back(NewPage());
    ++total_allocated_;
  }
}

std::unique_ptr<KVPage> KVPageManager::NewPage() const {
  auto page = std::make_unique<KVPage>();
  const std::vector<int64_t> shape{config_.batch_size, config_.num_kv_heads,
                                   config_.page_capacity_tokens,
                                   config_.head_dim};
  page->key = MakeZeros(config_.dtype, shape);
  page->value = MakeZeros(config_.dtype, shape);
  page->capacity = config_.page_capacity_tokens;
  return page;
}

std::unique_ptr<KVPage> KVPageManager::Acquire() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++in_use_;
  if (!free_.empty()) {
    auto page = std::move(free_.back());
    free_.pop_back();
    return page;
  }
  ++total_allocated_;
  return NewPage();
}

void KVPageManager::Release(std::unique_ptr<KVPage> page) {
  if (!page) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (in_use_ > 0) {
    --in_use_;
  }
  if (free_.size() >= static_cast<std::size_t>(std::max(config_.initial_pages, 0))) {
    --total_allocated_;
    return; // pool is full; let the page go
  }
  page->tokens = 0;
  std::fill(page->key.data.begin(), page->key.data.end(), 0);
  std::fill(page->value.data.begin(), page->value.data.end(), 0);
  free_.push_back(std::move(page));
}

std::size_t KVPageManager::FreePages() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return free_.size();
}

std::size_t KVPageManager::PagesInUse() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_use_;
}

std::size_t KVPageManager::TotalAllocated() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_allocated_;
}

void KVLayerStorage::Append(const Tensor &key, const Tensor &value,
                            KVPageManager &pages) {
  const KVCacheConfig &config = pages.config();
  CheckKVShape(key, config, "key");
  CheckKVShape(value, config, "value");
  if (key.shape != value.shape) {
    throw std::invalid_argument("key and value shapes differ");
  }
  const Tensor k = CastTo(key, config.dtype);
  const Tensor v = CastTo(value, config.dtype);

  const int64_t incoming = k.shape[2];
  int64_t written = 0;
  while (written < incoming) {
    if (pages_.empty() || pages_.back()->Full()) {
      pages_.push_back(pages.Acquire());
    }
    KVPage &page = *pages_.back();
    const int64_t n = std::min(page.Remaining(), incoming - written);
    CopyTokens(k, written, page.key, page.tokens, n);
    CopyTokens(v, written, page.value, page.tokens, n);
    page.tokens += n;
    written += n;
  }
  tokens_ += incoming;
}

KVPair KVLayerStorage::Retrieve(const KVCacheConfig &config) const {
  if (tokens_ == 0) {
    return {EmptyKV(config), EmptyKV(config)};
  }
  std::vector<Tensor> keys;
  std::vector<Tensor> values;
  keys.reserve(pages_.size());
  values.reserve(pages_.size());
  for (const auto &page : pages_) {
    keys.push_back(Slice(page->key, 2, 0, page->tokens));
    values.push_back(Slice(page->value, 2, 0, page->tokens));
  }
  std::vector<const Tensor *> key_parts;
  std::vector<const Tensor *> value_parts;
  for (std::size_t i = 0; i < keys.size(); ++i) {
    key_parts.push_back(&keys[i]);
    value_parts.push_back(&values[i]);
  }
  return {Concat(key_parts, 2), Concat(value_parts, 2)};
}

void KVLayerStorage::Clear(KVPageManager &pages) {
  for (auto &page : pages_) {
    pages.Release(std::move(page));
  }
  pages_.clear();
  tokens_ = 0;
}

nlohmann::json KVCacheMetadata::ToJson() const {
  return {{"total_tokens", total_tokens},
          {"total_active_pages", total_active_pages}};
}

SessionPagedKVCache::SessionPagedKVCache(std::string session_id,
                                         const std::vector<int> &layers,
                                         std::shared_ptr<KVPageManager> pages)
    : session_id_(std::move(session_id)), pages_(std::move(pages)) {
  if (!pages_) {
    throw std::invalid_argument("SessionPagedKVCache requires a page manager");
  }
  for (int layer : layers) {
    layers_[layer];
  }
}

SessionPagedKVCache::~SessionPagedKVCache() {
  for (auto &[layer, storage] : layers_) {
    storage.Clear(*pages_);
  }
}

KVPair SessionPagedKVCache::Retrieve(int layer) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = layers_.find(layer);
  if (it == layers_.end()) {
    const Tensor empty = EmptyKV(pages_->config());
    return {empty, empty};
  }
  return it->second.Retrieve(pages_->config());
}

void SessionPagedKVCache::Store(int layer, const Tensor &key,
                                const Tensor &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = layers_.find(layer);
  if (it == layers_.end()) {
    throw std::out_of_range("layer " + std::to_string(layer) +
                            " is not managed by session " + session_id_);
  }
  it->second.Append(key, value, *pages_);
}

void SessionPagedKVCache::ResetForNewPrompt() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[layer, storage] : layers_) {
    storage.Clear(*pages_);
  }
}

KVCacheMetadata SessionPagedKVCache::GetMetadata() const {
  std::lock_guard<std::mutex> lock(mutex_);
  KVCacheMetadata meta;
  for (const auto &[layer, storage] : layers_) {
    meta.total_tokens += storage.tokens();
    meta.total_active_pages += storage.active_pages();
  }
  return meta;
}

int64_t SessionPagedKVCache::LayerTokens(int layer) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = layers_.find(layer);
  return it == layers_.end() ? 0 : it->second.tokens();
}

bool SessionPagedKVCache::ManagesLayer(int layer) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return layers_.count(layer) > 0;
}

std::vector<int> SessionPagedKVCache::Layers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<int> out;
  for (const auto &[layer, storage] : layers_) {
    out.push_back(layer);
  }
  return out;
}

} // namespace blockpipe
