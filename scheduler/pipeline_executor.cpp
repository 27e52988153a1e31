#include "scheduler/pipeline_executor.h"

#include "runtime/errors.h"
#include "runtime/tensors/tensor_codec.h"
#include "scheduler/block_inputs.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"
#include "server/security/license_gate.h"

#include <algorithm>
#include <chrono>
#include <thread>

using json = nlohmann::json;

namespace blockpipe {

namespace {

double SecondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       start)
      .count();
}

bool IsPresentKV(const std::string &name) {
  return name.rfind("present.", 0) == 0;
}

} // namespace

bool IsMemoryAllocationError(const std::string &message) {
  return message.find("bad allocation") != std::string::npos ||
         message.find("allocate memory") != std::string::npos;
}

StepRequest ParseStepRequest(const json &body) {
  if (!body.is_object()) {
    throw InputPreparationError("request body must be a JSON object");
  }
  if (!body.contains("input_tensors")) {
    throw InputPreparationError("Missing input_tensors in request");
  }
  if (!body.contains("session_id") || !body["session_id"].is_string() ||
      body["session_id"].get<std::string>().empty()) {
    throw InputPreparationError("Missing session_id in request");
  }
  StepRequest request;
  request.session_id = body["session_id"].get<std::string>();
  if (body.contains("step")) {
    if (!body["step"].is_number_integer() || body["step"].get<int>() < 0) {
      throw InputPreparationError("step must be a non-negative integer");
    }
    request.step = body["step"].get<int>();
  }
  if (body.contains("target_block_id") && body["target_block_id"].is_string()) {
    request.target_block_id = body["target_block_id"].get<std::string>();
  }
  request.input_tensors =
      TensorCodec::DecodeMap(body["input_tensors"], &request.passthrough);
  return request;
}

struct PipelineExecutor::StepState {
  std::chrono::steady_clock::time_point start{
      std::chrono::steady_clock::now()};
  json successful_blocks = json::array();
  json failed_blocks = json::array();
  json execution_times = json::object();
  json fallback_events = json::array();
  json block_workers = json::object();
};

PipelineExecutor::PipelineExecutor(PipelineDeps deps, PipelineConfig config)
    : deps_(std::move(deps)), config_(config) {}

json PipelineExecutor::Fail(const StepRequest &request, StepState &state,
                            const std::string &message,
                            const std::string &error_type) const {
  const double total = SecondsSince(state.start);
  GlobalMetrics().RecordPipelineStep(false, total);
  log::Error("pipeline", message,
             request.session_id + " step " + std::to_string(request.step));
  return {{"status", "error"},
          {"message", message},
          {"error_type", error_type},
          {"session_id", request.session_id},
          {"step", request.step},
          {"node_id", deps_.node_id},
          {"successful_blocks", state.successful_blocks},
          {"failed_blocks", state.failed_blocks},
          {"execution_times", state.execution_times},
          {"fallback_events", state.fallback_events},
          {"block_workers", state.block_workers},
          {"total_pipeline_time", total}};
}

BlockWorker *PipelineExecutor::WorkerFor(WorkerType type) const {
  auto it = deps_.workers.find(type);
  return it == deps_.workers.end() ? nullptr : it->second;
}

WorkerType
PipelineExecutor::ChooseWorker(const std::string &block_id,
                               const TelemetrySnapshot &telemetry) const {
  WorkerType chosen = WorkerType::kGpu;
  try {
    chosen = deps_.scheduler->Resolve(block_id, telemetry);
  } catch (const std::exception &ex) {
    log::Warn("pipeline", "adaptive selection failed for " + block_id,
              ex.what());
    chosen = deps_.scheduler->plan().Has(block_id)
                 ? deps_.scheduler->Base(block_id)
                 : WorkerType::kGpu;
  }
  if (!WorkerFor(chosen)) {
    chosen = OtherWorker(chosen);
  }
  return chosen;
}

void PipelineExecutor::CollectGarbage() const {
  if (deps_.collect_garbage) {
    deps_.collect_garbage();
  }
}

void PipelineExecutor::PublishSharedInputs(const TensorMap &outputs) const {
  for (const auto &name : GlobalAttentionInputNames()) {
    auto it = outputs.find(name);
    if (it == outputs.end()) {
      continue;
    }
    for (WarmModelCache *cache : deps_.shared_input_caches) {
      cache->SetSharedInput(name, it->second);
    }
  }
}

json PipelineExecutor::ForwardRemainder(const StepRequest &request,
                                        const TensorMap &propagating,
                                        const std::string &last_block) const {
  const NodeEndpoint *next = deps_.network->NextNode(deps_.node_id);
  ForwardRequest forward;
  forward.session_id = request.session_id;
  forward.step = request.step;
  forward.target_block_id =
      deps_.network->NextBlockAfter(deps_.node_id).value_or("");
  forward.passthrough = request.passthrough;
  for (const auto &[name, tensor] : propagating) {
    if (!IsPresentKV(name)) {
      forward.tensors.emplace(name, tensor);
    }
  }
  const std::string target_uri = HttpNodeForwarder::StepUrl(*next);
  log::Debug("pipeline", "chain continues after " + last_block,
             "next=" + next->node_id);
  try {
    return deps_.forwarder->Forward(*next, forward);
  } catch (const ForwardingError &ex) {
    return ForwardingErrorPayload(forward, target_uri, ex.what(),
                                  "ForwardingError");
  } catch (const std::exception &ex) {
    return ForwardingErrorPayload(forward, target_uri, ex.what(),
                                  "std::exception");
  }
}

json PipelineExecutor::RunStep(const StepRequest &request) {
  StepState state;

  // ── INIT ──────────────────────────────────────────────────────────────
  if (stopping_.load()) {
    return Fail(request, state, "Node is shutting down", "config_error");
  }
  if (deps_.chain.empty()) {
    return Fail(request, state, "Model chain order not initialized",
                "config_error");
  }
  if (!deps_.metadata) {
    return Fail(request, state, "Model metadata not initialized",
                "config_error");
  }
  if (!deps_.scheduler) {
    return Fail(request, state, "Execution plan not initialized",
                "config_error");
  }
  if (deps_.workers.empty()) {
    return Fail(request, state, "No workers available", "config_error");
  }
  if (!deps_.kv_store) {
    return Fail(request, state, "KV Cache manager not initialized",
                "config_error");
  }
  if (deps_.license) {
    deps_.license->CheckRuntime();
    deps_.license->RequireAuthorized(request.session_id);
  }

  std::size_t first = 0;
  if (!request.target_block_id.empty()) {
    auto it = std::find(deps_.chain.begin(), deps_.chain.end(),
                        request.target_block_id);
    if (it == deps_.chain.end()) {
      return Fail(request, state,
                  "Block " + request.target_block_id +
                      " is not assigned to node " + deps_.node_id,
                  "input_preparation_error");
    }
    first = static_cast<std::size_t>(it - deps_.chain.begin());
  }

  // ── KV_RESOLVED ───────────────────────────────────────────────────────
  auto kv = deps_.kv_store->GetOrCreate(
      request.session_id, deps_.metadata->LayerRange(deps_.chain));
  if (request.step == 0) {
    kv->ResetForNewPrompt();
  }

  // ── PER_BLOCK_LOOP ────────────────────────────────────────────────────
  TensorMap propagating = request.input_tensors;
  TensorMap last_outputs;
  std::string last_block;
  int blocks_since_gc = 0;
  const auto &memory_intensive =
      deps_.scheduler->policy().memory_intensive_blocks;
  const std::string &model_first_block =
      deps_.network && !deps_.network->chain_order.empty()
          ? deps_.network->chain_order.front()
          : deps_.chain.front();

  for (std::size_t i = first; i < deps_.chain.size(); ++i) {
    const std::string &block_id = deps_.chain[i];
    const bool final_block = i + 1 == deps_.chain.size();

    if (memory_intensive.count(block_id)) {
      CollectGarbage();
      if (config_.memory_yield_ms > 0) {
        std::this_thread::sleep_for(
            std::chrono::milliseconds(config_.memory_yield_ms));
      }
    }

    TelemetrySnapshot telemetry =
        deps_.telemetry ? deps_.telemetry() : TelemetrySnapshot{};
    if (telemetry.recommendation == Recommendation::kSystemOverloaded &&
        config_.overload_backoff_s > 0) {
      std::this_thread::sleep_for(
          std::chrono::duration<double>(config_.overload_backoff_s));
    }
    const WorkerType primary = ChooseWorker(block_id, telemetry);
    state.block_workers[block_id] = WorkerTypeName(primary);

    BlockJob job;
    job.job_id = request.session_id + "_" + std::to_string(request.step) +
                 "_" + block_id;
    job.block_id = block_id;
    job.session_id = request.session_id;
    job.step = request.step;
    std::map<int, int64_t> past_tokens;
    try {
      const BlockIO &io = deps_.metadata->Block(block_id);
      job.inputs = PrepareBlockInputs(io, *deps_.metadata, propagating,
                                      kv.get());
      job.requested_outputs = io.OutputNames();
      for (int layer : kv->Layers()) {
        past_tokens[layer] = kv->LayerTokens(layer);
      }
    } catch (const std::exception &ex) {
      state.failed_blocks.push_back({{"block_id", block_id},
                                     {"error", ex.what()},
                                     {"execution_time", 0.0},
                                     {"worker", WorkerTypeName(primary)}});
      return Fail(request, state,
                  "Pipeline failed at block " + block_id + ": " + ex.what(),
                  ErrorKindName(ErrorKind::kInputPreparation));
    }

    WorkerResult result =
        DispatchWithTimeout(*WorkerFor(primary), job, config_.worker_timeout_s);
    if (deps_.book) {
      deps_.book->RecordExecution(block_id, primary, result.processing_time,
                                  result.success, result.error);
    }

    BlockWorker *fallback = WorkerFor(OtherWorker(primary));
    if (!result.success && fallback) {
      log::Warn("pipeline",
                std::string(WorkerTypeName(primary)) + " failed " + block_id +
                    ", retrying on " + WorkerTypeName(fallback->Kind()),
                result.error);
      WorkerResult retry =
          DispatchWithTimeout(*fallback, job, config_.worker_timeout_s);
      if (deps_.book) {
        deps_.book->RecordExecution(block_id, fallback->Kind(),
                                    retry.processing_time, retry.success,
                                    retry.error);
      }
      FallbackEvent event;
      event.block_id = block_id;
      event.from = WorkerTypeName(primary);
      event.to = WorkerTypeName(fallback->Kind());
      event.success = retry.success;
      if (deps_.book) {
        deps_.book->RecordFallback(event);
      }
      GlobalMetrics().RecordFallback(retry.success);
      state.fallback_events.push_back({{"block_id", event.block_id},
                                       {"from", event.from},
                                       {"to", event.to},
                                       {"reason", event.reason},
                                       {"success", event.success}});
      retry.processing_time += result.processing_time;
      result = std::move(retry);
      state.block_workers[block_id] = WorkerTypeName(fallback->Kind());
    }

    if (!result.success) {
      state.failed_blocks.push_back({{"block_id", block_id},
                                     {"error", result.error},
                                     {"execution_time", result.processing_time},
                                     {"worker", result.worker}});
      state.execution_times[block_id] = result.processing_time;
      if (!final_block && IsMemoryAllocationError(result.error)) {
        log::Warn("pipeline", "skipping " + block_id + " after allocation failure",
                  result.error);
        GlobalMetrics().RecordMemorySkip();
        CollectGarbage();
        continue;
      }
      json failure =
          Fail(request, state,
               "Pipeline failed at block " + block_id + ": " + result.error,
               result.error_type.empty()
                   ? ErrorKindName(ErrorKind::kWorkerExecution)
                   : result.error_type);
      failure["failed_block"] = block_id;
      return failure;
    }

    try {
      for (const auto &[layer, pair] : ExtractPresentKV(result.outputs)) {
        if (kv->ManagesLayer(layer)) {
          StorePresentKV(*kv, layer, pair, past_tokens[layer]);
        }
      }
    } catch (const std::exception &ex) {
      state.failed_blocks.push_back({{"block_id", block_id},
                                     {"error", ex.what()},
                                     {"execution_time", result.processing_time},
                                     {"worker", result.worker}});
      state.execution_times[block_id] = result.processing_time;
      json failure = Fail(request, state,
                          "Pipeline failed at block " + block_id +
                              ": KV update failed: " + ex.what(),
                          ErrorKindName(ErrorKind::kInputPreparation));
      failure["failed_block"] = block_id;
      return failure;
    }
    if (block_id == model_first_block) {
      PublishSharedInputs(result.outputs);
    }

    last_outputs.clear();
    for (auto &[name, tensor] : result.outputs) {
      if (IsPresentKV(name)) {
        continue;
      }
      last_outputs[name] = tensor;
      propagating[name] = std::move(tensor);
    }
    last_block = block_id;
    state.successful_blocks.push_back(block_id);
    state.execution_times[block_id] = result.processing_time;

    if (config_.gc_every_blocks > 0 &&
        ++blocks_since_gc % config_.gc_every_blocks == 0) {
      CollectGarbage();
    }
  }

  // ── COMPLETE ──────────────────────────────────────────────────────────
  if (deps_.network && deps_.forwarder && deps_.network->NextNode(deps_.node_id)) {
    json reply = ForwardRemainder(request, propagating, last_block);
    GlobalMetrics().RecordPipelineStep(reply.value("status", "") == "success",
                                       SecondsSince(state.start));
    return reply;
  }

  const KVCacheMetadata kv_meta = kv->GetMetadata();
  for (const auto &evicted : deps_.kv_store->EvictOverCapacity()) {
    log::Debug("pipeline", "evicted KV session " + evicted);
  }

  const double total = SecondsSince(state.start);
  GlobalMetrics().RecordPipelineStep(true, total);
  log::Info("pipeline",
            "step complete for " + request.session_id + " step " +
                std::to_string(request.step),
            std::to_string(state.successful_blocks.size()) + " blocks in " +
                std::to_string(total) + "s");

  return {{"status", "success"},
          {"session_id", request.session_id},
          {"step", request.step},
          {"node_id", deps_.node_id},
          {"outputs", TensorCodec::EncodeMap(last_outputs)},
          {"successful_blocks", state.successful_blocks},
          {"failed_blocks", state.failed_blocks},
          {"execution_times", state.execution_times},
          {"fallback_events", state.fallback_events},
          {"block_workers", state.block_workers},
          {"kv_cache_metadata", kv_meta.ToJson()},
          {"total_pipeline_time", total}};
}

} // namespace blockpipe
