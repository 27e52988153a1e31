#include "runtime/warm_cache/warm_model_cache.h"

#include "runtime/errors.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <chrono>
#include <iterator>

using json = nlohmann::json;

namespace blockpipe {

namespace {

double SecondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       start)
      .count();
}

} // namespace

json LoadInfo::ToJson() const {
  json j;
  j["method"] = method;
  j["load_format"] = load_format;
  j["attempted_methods"] = attempted_methods;
  if (!original_method.empty()) {
    j["original_cold_load_method"] = original_method;
    j["original_cold_load_time"] = original_load_seconds;
  }
  j["warmup_succeeded"] = warmup_succeeded;
  return j;
}

json WarmCacheStats::ToJson() const {
  json j;
  j["cache_hits"] = cache_hits;
  j["cache_misses"] = cache_misses;
  j["failed_loads"] = failed_loads;
  j["warmup_successes"] = warmup_successes;
  j["warmup_failures"] = warmup_failures;
  j["session_executions"] = session_executions;
  j["session_execution_failures"] = session_execution_failures;
  j["cache_evictions"] = cache_evictions;
  j["resident"] = resident;
  j["capacity"] = capacity;
  j["resident_blocks"] = resident_blocks;
  uint64_t lookups = cache_hits + cache_misses;
  j["hit_rate"] = lookups ? static_cast<double>(cache_hits) / lookups : 0.0;
  return j;
}

WarmModelCache::WarmModelCache(
    std::vector<std::unique_ptr<LoadStrategy>> strategies,
    const ModelMetadata *metadata, WarmCacheConfig config)
    : strategies_(std::move(strategies)), metadata_(metadata),
      config_(std::move(config)) {
  if (config_.max_warm_sessions == 0) {
    config_.max_warm_sessions = 1;
  }
}

WarmModelCache::~WarmModelCache() { Clear(); }

SessionLease WarmModelCache::GetSession(const std::string &block_id) {
  auto start = std::chrono::steady_clock::now();
  uint64_t generation = 0;
  {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    // One cold load per block; concurrent callers wait for it.
    loaded_cv_.wait(lock, [&] { return loading_.count(block_id) == 0; });

    auto it = sessions_.find(block_id);
    if (it != sessions_.end()) {
      lru_.splice(lru_.end(), lru_, it->second.lru_pos);
      ++stats_.cache_hits;
      GlobalMetrics().RecordWarmCacheHit();
      SessionLease lease;
      lease.session = it->second.session;
      lease.info.method = "warm_cache_hit";
      lease.info.load_format = "memory_warm";
      lease.info.original_method = "cold_load_" + lease.session->strategy();
      lease.info.original_load_seconds = lease.session->load_seconds();
      lease.load_seconds = SecondsSince(start);
      return lease;
    }

    ++stats_.cache_misses;
    GlobalMetrics().RecordWarmCacheMiss();
    loading_.insert(block_id);
    generation = generation_;
  }

  // Loads and warm-up run without the cache lock held.
  struct LoadingGuard {
    WarmModelCache *cache;
    const std::string &block_id;
    ~LoadingGuard() {
      {
        std::lock_guard<std::recursive_mutex> lock(cache->mutex_);
        cache->loading_.erase(block_id);
      }
      cache->loaded_cv_.notify_all();
    }
  } loading_guard{this, block_id};

  SessionLease lease;
  std::unique_ptr<LoadedSession> loaded;
  for (auto &strategy : strategies_) {
    lease.info.attempted_methods.push_back(strategy->Name());
    auto attempt_start = std::chrono::steady_clock::now();
    try {
      loaded = strategy->TryLoad(block_id);
    } catch (const std::exception &ex) {
      log::Warn("warm_cache",
                block_id + ": " + strategy->Name() + " load failed",
                std::string("error=") + ex.what());
      continue;
    }
    if (!loaded) {
      log::Debug("warm_cache",
                 block_id + ": assets for " + strategy->Name() + " not found");
      continue;
    }
    loaded->set_load_seconds(SecondsSince(attempt_start));
    break;
  }

  if (!loaded) {
    {
      std::lock_guard<std::recursive_mutex> lock(mutex_);
      ++stats_.failed_loads;
    }
    GlobalMetrics().RecordFailedLoad();
    log::Error("warm_cache", block_id + ": every load strategy failed");
    lease.info.method = "failed_all_load_attempts";
    lease.info.load_format = "none";
    lease.load_seconds = SecondsSince(start);
    return lease;
  }

  std::shared_ptr<LoadedSession> session(std::move(loaded));
  lease.info.method = "cold_load_" + session->strategy();
  lease.info.load_format = session->load_format();
  GlobalMetrics().RecordColdLoad(session->strategy());

  if (config_.warmup_enabled && config_.warmup_runs > 0) {
    lease.info.warmup_succeeded = Warmup(*session, block_id);
  }

  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (generation != generation_) {
    // Cleared while loading; the caller still gets its session.
    lease.session = std::move(session);
    lease.load_seconds = SecondsSince(start);
    return lease;
  }
  while (sessions_.size() >= config_.max_warm_sessions && !lru_.empty()) {
    EvictOldestLocked();
  }
  lru_.push_back(block_id);
  sessions_[block_id] = Entry{session, std::prev(lru_.end())};

  lease.session = std::move(session);
  lease.load_seconds = SecondsSince(start);
  log::Info("warm_cache",
            block_id + " loaded via " + lease.info.method + " [" +
                config_.label + "]",
            "seconds=" + std::to_string(lease.load_seconds) +
                " resident=" + std::to_string(sessions_.size()));
  return lease;
}

void WarmModelCache::EvictOldestLocked() {
  const std::string victim = lru_.front();
  lru_.pop_front();
  sessions_.erase(victim);
  ++stats_.cache_evictions;
  GlobalMetrics().RecordWarmCacheEviction();
  log::Info("warm_cache", "evicted " + victim + " [" + config_.label + "]");
}

TensorMap
WarmModelCache::Execute(LoadedSession &session, const std::string &block_id,
                        const TensorMap &inputs,
                        const std::vector<std::string> &requested_outputs) {
  TensorMap feed = inputs;
  {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (const auto &spec : session.session().Inputs()) {
      if (feed.count(spec.name)) {
        continue;
      }
      auto shared = shared_inputs_.find(spec.name);
      if (shared != shared_inputs_.end()) {
        feed.emplace(spec.name, shared->second);
      }
    }
  }

  std::vector<std::string> names = requested_outputs;
  if (names.empty()) {
    for (const auto &spec : session.session().Outputs()) {
      names.push_back(spec.name);
    }
    if (names.empty() && metadata_ && metadata_->HasBlock(block_id)) {
      names = metadata_->Block(block_id).OutputNames();
    }
  }

  std::vector<Tensor> results;
  try {
    std::lock_guard<std::mutex> run_lock(session.run_mutex());
    results = session.session().Run(feed, names);
  } catch (const std::exception &) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ++stats_.session_execution_failures;
    throw;
  }

  {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ++stats_.session_executions;
  }

  if (results.size() != names.size()) {
    throw std::runtime_error(block_id + " returned " +
                             std::to_string(results.size()) +
                             " outputs, expected " +
                             std::to_string(names.size()));
  }
  TensorMap named;
  for (std::size_t i = 0; i < names.size(); ++i) {
    named[names[i]] = std::move(results[i]);
  }
  return named;
}

void WarmModelCache::SetSharedInput(const std::string &name, Tensor tensor) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  shared_inputs_[name] = std::move(tensor);
}

void WarmModelCache::ClearSharedInputs() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  shared_inputs_.clear();
}

std::size_t WarmModelCache::SharedInputCount() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return shared_inputs_.size();
}

TensorMap
WarmModelCache::BuildWarmupInputs(const InferenceSession &session,
                                  const std::string &block_id) const {
  std::vector<TensorSpec> specs = session.Inputs();
  if (specs.empty() && metadata_ && metadata_->HasBlock(block_id)) {
    specs = metadata_->Block(block_id).inputs;
  }
  TensorMap inputs;
  for (const auto &spec : specs) {
    const bool is_past = spec.name.find("past_key_values") != std::string::npos;
    std::vector<int64_t> shape;
    for (std::size_t d = 0; d < spec.shape.size(); ++d) {
      int64_t dim = spec.shape[d];
      if (dim > 0) {
        shape.push_back(dim);
        continue;
      }
      const std::string symbol =
          d < spec.dim_names.size() ? spec.dim_names[d] : std::string();
      const bool past_dim = symbol.find("past") != std::string::npos ||
                            (is_past && d == 2);
      shape.push_back(past_dim ? 0 : 1);
    }
    DType dtype = spec.dtype;
    if (dtype == DType::kUnknown && metadata_) {
      dtype = metadata_->InputDType(block_id, spec.name);
    }
    inputs.emplace(spec.name, MakeZeros(dtype, shape));
  }
  return inputs;
}

bool WarmModelCache::Warmup(LoadedSession &session,
                            const std::string &block_id) {
  TensorMap inputs = BuildWarmupInputs(session.session(), block_id);
  int succeeded = 0;
  std::string last_error;
  for (int run = 0; run < config_.warmup_runs; ++run) {
    try {
      std::lock_guard<std::mutex> run_lock(session.run_mutex());
      session.session().Run(inputs, {});
      ++succeeded;
    } catch (const std::exception &ex) {
      last_error = ex.what();
    }
  }

  const bool ok = succeeded > 0;
  {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (ok) {
      ++stats_.warmup_successes;
    } else {
      ++stats_.warmup_failures;
    }
  }
  GlobalMetrics().RecordWarmup(ok);
  if (!ok) {
    log::Warn("warm_cache", block_id + ": warm-up failed, session kept",
              "error=" + last_error);
  } else {
    log::Debug("warm_cache", block_id + ": warm-up " +
                                 std::to_string(succeeded) + "/" +
                                 std::to_string(config_.warmup_runs) +
                                 " runs succeeded");
  }
  return ok;
}

bool WarmModelCache::Contains(const std::string &block_id) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return sessions_.count(block_id) > 0;
}

std::size_t WarmModelCache::Size() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return sessions_.size();
}

void WarmModelCache::Evict(const std::string &block_id) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  auto it = sessions_.find(block_id);
  if (it == sessions_.end()) {
    return;
  }
  lru_.erase(it->second.lru_pos);
  sessions_.erase(it);
  ++stats_.cache_evictions;
  GlobalMetrics().RecordWarmCacheEviction();
}

void WarmModelCache::Clear() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  ++generation_;
  sessions_.clear();
  lru_.clear();
  shared_inputs_.clear();
}

WarmCacheStats WarmModelCache::Stats() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  WarmCacheStats stats = stats_;
  stats.resident = sessions_.size();
  stats.capacity = config_.max_warm_sessions;
  stats.resident_blocks.assign(lru_.begin(), lru_.end());
  return stats;
}

} // namespace blockpipe
