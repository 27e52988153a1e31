#include "runtime/kv_cache/kv_cache_store.h"

#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <algorithm>

namespace blockpipe {

KVCacheStore::KVCacheStore(std::size_t max_sessions,
                           const KVCacheConfig &config)
    : max_sessions_(max_sessions == 0 ? 1 : max_sessions),
      pages_(std::make_shared<KVPageManager>(config)) {}

std::shared_ptr<SessionPagedKVCache>
KVCacheStore::GetOrCreate(const std::string &session_id,
                          const std::vector<int> &layers, bool *created) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it != sessions_.end()) {
    if (created) {
      *created = false;
    }
    return it->second;
  }
  while (sessions_.size() >= max_sessions_ && !order_.empty()) {
    EvictOldestLocked();
  }
  auto cache =
      std::make_shared<SessionPagedKVCache>(session_id, layers, pages_);
  sessions_.emplace(session_id, cache);
  order_.push_back(session_id);
  if (created) {
    *created = true;
  }
  GlobalMetrics().RecordKVSessionCreated();
  GlobalMetrics().SetKVSessions(sessions_.size());
  log::Debug("kv_cache", "created KV cache for session " + session_id,
             "layers=" + std::to_string(layers.size()));
  return cache;
}

std::shared_ptr<SessionPagedKVCache>
KVCacheStore::Find(const std::string &session_id) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  return it == sessions_.end() ? nullptr : it->second;
}

bool KVCacheStore::Remove(const std::string &session_id) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return false;
  }
  sessions_.erase(it);
  order_.remove(session_id);
  GlobalMetrics().SetKVSessions(sessions_.size());
  return true;
}

std::string KVCacheStore::EvictOldestLocked() {
  std::string victim = order_.front();
  order_.pop_front();
  sessions_.erase(victim);
  ++evictions_;
  GlobalMetrics().RecordKVSessionEvicted();
  GlobalMetrics().SetKVSessions(sessions_.size());
  log::Info("kv_cache", "evicted oldest session " + victim);
  return victim;
}

std::vector<std::string> KVCacheStore::EvictOverCapacity() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  std::vector<std::string> evicted;
  while (sessions_.size() > max_sessions_ && !order_.empty()) {
    evicted.push_back(EvictOldestLocked());
  }
  return evicted;
}

void KVCacheStore::Clear() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  sessions_.clear();
  order_.clear();
  GlobalMetrics().SetKVSessions(0);
}

std::size_t KVCacheStore::Size() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<std::string> KVCacheStore::SessionIds() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return {order_.begin(), order_.end()};
}

nlohmann::json KVCacheStore::StatsJson() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  nlohmann::json sessions = nlohmann::json::object();
  for (const auto &id : order_) {
    sessions[id] = sessions_.at(id)->GetMetadata().ToJson();
  }
  return {{"sessions", sessions},
          {"session_count", sessions_.size()},
          {"max_sessions", max_sessions_},
          {"evictions", evictions_},
          {"pages_in_use", pages_->PagesInUse()},
          {"free_pages", pages_->FreePages()}};
}

} // namespace blockpipe
