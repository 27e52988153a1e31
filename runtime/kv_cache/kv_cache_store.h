#pragma once

#include "runtime/kv_cache/paged_kv_cache.h"

#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace blockpipe {

// Process-wide session_id -> SessionPagedKVCache map, bounded at
// max_sessions with oldest-inserted eviction.
class KVCacheStore {
public:
  KVCacheStore(std::size_t max_sessions, const KVCacheConfig &config);

  // Returns the session's cache, creating it over `layers` when absent.
  // Creating a session at capacity evicts the oldest one first.
  std::shared_ptr<SessionPagedKVCache>
  GetOrCreate(const std::string &session_id, const std::vector<int> &layers,
              bool *created = nullptr);
  std::shared_ptr<SessionPagedKVCache> Find(const std::string &session_id) const;
  bool Remove(const std::string &session_id);
  // Evicts oldest sessions until the store is within capacity; returns the
  // evicted ids.
  std::vector<std::string> EvictOverCapacity();
  void Clear();

  std::size_t Size() const;
  std::size_t Capacity() const { return max_sessions_; }
  // Oldest first.
  std::vector<std::string> SessionIds() const;
  const KVPageManager &pages() const { return *pages_; }

  nlohmann::json StatsJson() const;

private:
  std::string EvictOldestLocked();

  std::size_t max_sessions_;
  std::shared_ptr<KVPageManager> pages_;
  mutable std::recursive_mutex mutex_;
  std::list<std::string> order_;
  std::unordered_map<std::string, std::shared_ptr<SessionPagedKVCache>>
      sessions_;
  uint64_t evictions_{0};
};

} // namespace blockpipe
