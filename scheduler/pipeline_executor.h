#pragma once

#include "model/block_metadata.h"
#include "model/network_config.h"
#include "net/node_forwarder.h"
#include "runtime/kv_cache/kv_cache_store.h"
#include "runtime/telemetry/system_profiler.h"
#include "runtime/warm_cache/warm_model_cache.h"
#include "scheduler/adaptive_block_scheduler.h"
#include "scheduler/block_worker.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace blockpipe {

class LicenseGate;

struct StepRequest {
  std::string session_id;
  int step{0};
  // Empty starts at this node's first assigned block.
  std::string target_block_id;
  TensorMap input_tensors;
  nlohmann::json passthrough = nlohmann::json::object();
};

// Parses {"session_id", "step", "target_block_id", "input_tensors"}.
// Throws InputPreparationError when session_id or input_tensors is missing
// and FormatError for undecodable tensors.
StepRequest ParseStepRequest(const nlohmann::json &body);

struct PipelineConfig {
  double worker_timeout_s{120.0};
  // Garbage-collection pass after every N successful blocks.
  int gc_every_blocks{5};
  // Pause after the pre-block collection of a memory-intensive block.
  int memory_yield_ms{50};
  // Back-off applied when telemetry reports an overloaded system.
  double overload_backoff_s{0.5};
};

// Collaborators of the executor. Raw pointers are non-owning; the node
// runtime outlives every executor it builds.
struct PipelineDeps {
  std::string node_id;
  // This node's blocks in chain order.
  std::vector<std::string> chain;
  const ModelMetadata *metadata{nullptr};
  // Null on a node without peers; no forwarding happens then.
  const NetworkConfig *network{nullptr};
  AdaptiveBlockScheduler *scheduler{nullptr};
  BlockAssignmentBook *book{nullptr};
  std::map<WorkerType, BlockWorker *> workers;
  KVCacheStore *kv_store{nullptr};
  // Caches receiving the attention-pattern tensors of the first block.
  std::vector<WarmModelCache *> shared_input_caches;
  std::function<TelemetrySnapshot()> telemetry;
  // Releases freed heap back to the system.
  std::function<void()> collect_garbage;
  NodeForwarder *forwarder{nullptr};
  LicenseGate *license{nullptr};
};

// ── PipelineExecutor ────────────────────────────────────────────────────────
// Runs one inference step over this node's blocks:
//
//   INIT -> KV_RESOLVED -> PER_BLOCK_LOOP -> COMPLETE | FAILED
//
// Blocks run strictly in chain order. A failed block is retried once on the
// other worker type; a second failure aborts the step with partial results,
// except for allocation failures on a non-final block, which are skipped.
// When the node's blocks end mid-chain, the propagating tensors are
// forwarded to the owner of the next block and its reply is returned.
//
// RunStep() reports every failure inside the result JSON except LicenseError,
// which propagates to the caller.
class PipelineExecutor {
public:
  PipelineExecutor(PipelineDeps deps, PipelineConfig config = {});

  nlohmann::json RunStep(const StepRequest &request);

  // Steps arriving after this call fail at INIT.
  void RequestStop() { stopping_.store(true); }
  bool stopping() const { return stopping_.load(); }

  const PipelineDeps &deps() const { return deps_; }
  const PipelineConfig &config() const { return config_; }

private:
  struct StepState;

  nlohmann::json Fail(const StepRequest &request, StepState &state,
                      const std::string &message,
                      const std::string &error_type) const;
  WorkerType ChooseWorker(const std::string &block_id,
                          const TelemetrySnapshot &telemetry) const;
  BlockWorker *WorkerFor(WorkerType type) const;
  void CollectGarbage() const;
  void PublishSharedInputs(const TensorMap &outputs) const;
  nlohmann::json ForwardRemainder(const StepRequest &request,
                                  const TensorMap &propagating,
                                  const std::string &last_block) const;

  PipelineDeps deps_;
  PipelineConfig config_;
  std::atomic<bool> stopping_{false};
};

// True for failures raised by a failed allocation inside the inference
// runtime ("bad allocation", "Failed to allocate memory").
bool IsMemoryAllocationError(const std::string &message);

} // namespace blockpipe
