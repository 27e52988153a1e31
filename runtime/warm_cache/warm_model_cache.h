#pragma once

#include "model/block_metadata.h"
#include "runtime/warm_cache/load_strategy.h"

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace blockpipe {

struct WarmCacheConfig {
  std::size_t max_warm_sessions{1};
  int warmup_runs{3};
  bool warmup_enabled{true};
  std::string label{"cpu"};
};

// How a GetSession() result was produced.
struct LoadInfo {
  // "warm_cache_hit", "cold_load_<strategy>", or "failed_all_load_attempts".
  std::string method;
  // "memory_warm", the strategy's format, or "none".
  std::string load_format;
  std::vector<std::string> attempted_methods;
  // On hits: how the resident session was originally loaded.
  std::string original_method;
  double original_load_seconds{0.0};
  bool warmup_succeeded{false};

  nlohmann::json ToJson() const;
};

struct SessionLease {
  std::shared_ptr<LoadedSession> session; // null when every strategy failed
  double load_seconds{0.0};
  LoadInfo info;
};

struct WarmCacheStats {
  uint64_t cache_hits{0};
  uint64_t cache_misses{0};
  uint64_t failed_loads{0};
  uint64_t warmup_successes{0};
  uint64_t warmup_failures{0};
  uint64_t session_executions{0};
  uint64_t session_execution_failures{0};
  uint64_t cache_evictions{0};
  std::size_t resident{0};
  std::size_t capacity{0};
  std::vector<std::string> resident_blocks; // least recently used first

  nlohmann::json ToJson() const;
};

// ── WarmModelCache ──────────────────────────────────────────────────────────
// Per-block cache of loaded sessions, bounded by max_warm_sessions. Misses
// walk the load strategies in order and stop at the first success; the new
// session is warmed up with dummy inputs before it is published. Hits move the
// entry to the most-recently-used end; eviction drops the other end.
//
// Evicted sessions stay alive while a caller still holds their lease. Cold
// loads and warm-up run outside the cache lock, so hits on other blocks do
// not wait behind them.
// Thread safety: all public methods are thread-safe.
class WarmModelCache {
public:
  WarmModelCache(std::vector<std::unique_ptr<LoadStrategy>> strategies,
                 const ModelMetadata *metadata, WarmCacheConfig config = {});
  ~WarmModelCache();

  WarmModelCache(const WarmModelCache &) = delete;
  WarmModelCache &operator=(const WarmModelCache &) = delete;

  SessionLease GetSession(const std::string &block_id);

  // Runs `session` and returns its outputs keyed by name. Shared inputs the
  // graph declares but the caller did not pass are filled in; caller inputs
  // are never replaced. Empty `requested_outputs` means every declared
  // output. Throws std::runtime_error when the run fails.
  TensorMap Execute(LoadedSession &session, const std::string &block_id,
                    const TensorMap &inputs,
                    const std::vector<std::string> &requested_outputs);

  // Global attention-pattern tensors reused by every block after the first.
  void SetSharedInput(const std::string &name, Tensor tensor);
  void ClearSharedInputs();
  std::size_t SharedInputCount() const;

  // Runs the warm-up pass; true when at least one run succeeded.
  bool Warmup(LoadedSession &session, const std::string &block_id);

  bool Contains(const std::string &block_id) const;
  std::size_t Size() const;
  std::size_t Capacity() const { return config_.max_warm_sessions; }
  void Evict(const std::string &block_id);
  void Clear();

  WarmCacheStats Stats() const;
  const WarmCacheConfig &config() const { return config_; }

private:
  struct Entry {
    std::shared_ptr<LoadedSession> session;
    std::list<std::string>::iterator lru_pos;
  };

  void EvictOldestLocked();
  TensorMap BuildWarmupInputs(const InferenceSession &session,
                              const std::string &block_id) const;

  std::vector<std::unique_ptr<LoadStrategy>> strategies_;
  const ModelMetadata *metadata_;
  WarmCacheConfig config_;

  mutable std::recursive_mutex mutex_;
  std::condition_variable_any loaded_cv_;
  // Blocks with a cold load in flight.
  std::unordered_set<std::string> loading_;
  // Bumped by Clear(); loads that straddle a clear are not cached.
  uint64_t generation_{0};
  std::list<std::string> lru_; // front = least recently used
  std::unordered_map<std::string, Entry> sessions_;
  TensorMap shared_inputs_;
  WarmCacheStats stats_;
};

} // namespace blockpipe
