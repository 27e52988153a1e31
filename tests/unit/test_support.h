#pragma once

#include "model/block_metadata.h"
#include "model/network_config.h"
#include "runtime/backends/inference_session.h"
#include "runtime/telemetry/system_profiler.h"
#include "runtime/tensors/tensor.h"
#include "scheduler/block_worker.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace blockpipe {
namespace testing {

// Scratch directory removed on destruction.
class TempDir {
public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("blockpipe_test_" + std::to_string(rd()) + "_" +
             std::to_string(counter_++));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return path_; }

private:
  static inline std::atomic<int> counter_{0};
  std::filesystem::path path_;
};

inline void WriteFile(const std::filesystem::path &path,
                      const std::string &content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << content;
}

constexpr int kHeads = 2;
constexpr int kHeadDim = 4;
constexpr int kHidden = 8;

// Three-block model: two transformer layers (block_1 owns layer 0, block_2
// owns layer 1) and a final projection block without KV.
inline std::string ThreeBlockMetadataJson() {
  return R"({
    "num_key_value_heads": 2,
    "head_dim": 4,
    "expected_dtypes": {"input_ids": "int64"},
    "block_io_details": {
      "block_1": {
        "file_path": "block_1.onnx",
        "inputs": [
          {"name": "input_ids", "dtype": "int64", "shape": ["batch_size", "sequence_length"]},
          {"name": "attention_mask", "dtype": "int64", "shape": ["batch_size", "total_sequence_length"]},
          {"name": "position_ids", "dtype": "int64", "shape": ["batch_size", "sequence_length"]},
          {"name": "past_key_values.0.key", "dtype": "float16", "shape": ["batch_size", 2, "past_sequence_length", 4]},
          {"name": "past_key_values.0.value", "dtype": "float16", "shape": ["batch_size", 2, "past_sequence_length", 4]}
        ],
        "outputs": [
          {"name": "/model/layers.0/Add_1_output_0", "dtype": "float32", "shape": ["batch_size", "sequence_length", 8]},
          {"name": "/model/ScatterND_output_0", "dtype": "float32", "shape": ["batch_size", 1, "sequence_length", "total_sequence_length"]},
          {"name": "present.0.key", "dtype": "float16", "shape": ["batch_size", 2, "total_sequence_length", 4]},
          {"name": "present.0.value", "dtype": "float16", "shape": ["batch_size", 2, "total_sequence_length", 4]}
        ]
      },
      "block_2": {
        "file_path": "block_2.onnx",
        "inputs": [
          {"name": "/model/layers.0/Add_1_output_0", "dtype": "float32", "shape": ["batch_size", "sequence_length", 8]},
          {"name": "/model/ScatterND_output_0", "dtype": "float32", "shape": ["batch_size", 1, "sequence_length", "total_sequence_length"]},
          {"name": "past_key_values.1.key", "dtype": "float16", "shape": ["batch_size", 2, "past_sequence_length", 4]},
          {"name": "past_key_values.1.value", "dtype": "float16", "shape": ["batch_size", 2, "past_sequence_length", 4]}
        ],
        "outputs": [
          {"name": "/model/layers.1/Add_1_output_0", "dtype": "float32", "shape": ["batch_size", "sequence_length", 8]},
          {"name": "present.1.key", "dtype": "float16", "shape": ["batch_size", 2, "total_sequence_length", 4]},
          {"name": "present.1.value", "dtype": "float16", "shape": ["batch_size", 2, "total_sequence_length", 4]}
        ]
      },
      "block_3": {
        "file_path": "block_3.onnx",
        "inputs": [
          {"name": "/model/layers.1/Add_1_output_0", "dtype": "float32", "shape": ["batch_size", "sequence_length", 8]}
        ],
        "outputs": [
          {"name": "logits", "dtype": "float32", "shape": ["batch_size", "sequence_length", 16]}
        ]
      }
    }
  })";
}

inline ModelMetadata ThreeBlockMetadata() {
  return ParseModelMetadata(ThreeBlockMetadataJson());
}

inline std::vector<std::string> ThreeBlockChain() {
  return {"block_1", "block_2", "block_3"};
}

// Single node owning all three blocks.
inline std::string SingleNodeNetworkJson(int port = 8701) {
  return R"({
    "nodes": {"node_a": {"host": "127.0.0.1", "port": )" +
         std::to_string(port) + R"(,
                         "assigned_block_ids_ordered_list": ["block_1", "block_2", "block_3"]}},
    "model_chain_order": ["block_1", "block_2", "block_3"],
    "paths": {"metadata_file": "model_metadata.json", "onnx_blocks_dir": "blocks"}
  })";
}

inline Tensor InputIds(const std::vector<int64_t> &ids) {
  return MakeTensor<int64_t>(DType::kInt64,
                             {1, static_cast<int64_t>(ids.size())}, ids);
}

inline Tensor FilledFloat(const std::vector<int64_t> &shape, float value) {
  std::vector<float> values(NumElements(shape), value);
  return MakeTensor<float>(DType::kFloat32, shape, values);
}

// Sequence length of the step: input_ids or the incoming hidden state.
inline int64_t StepSequenceLength(const TensorMap &inputs) {
  auto ids = inputs.find("input_ids");
  if (ids != inputs.end() && ids->second.shape.size() == 2) {
    return ids->second.shape[1];
  }
  for (const auto &[name, tensor] : inputs) {
    if (name.find("Add_1_output_0") != std::string::npos &&
        tensor.shape.size() == 3) {
      return tensor.shape[1];
    }
  }
  return 1;
}

// Produces zero-filled outputs shaped from the declared output specs. KV
// outputs carry only the step's new tokens.
inline std::vector<Tensor> FakeBlockOutputs(const std::vector<TensorSpec> &specs,
                                            const TensorMap &inputs,
                                            const std::vector<std::string> &names) {
  const int64_t seq = StepSequenceLength(inputs);
  std::vector<Tensor> out;
  for (const auto &name : names) {
    const TensorSpec *spec = nullptr;
    for (const auto &s : specs) {
      if (s.name == name) {
        spec = &s;
      }
    }
    if (name.rfind("present.", 0) == 0) {
      out.push_back(MakeZeros(DType::kFloat16, {1, kHeads, seq, kHeadDim}));
    } else if (name == "logits") {
      out.push_back(FilledFloat({1, seq, 16}, 0.5f));
    } else if (name == "/model/ScatterND_output_0") {
      out.push_back(FilledFloat({1, 1, seq, seq}, 0.0f));
    } else {
      out.push_back(FilledFloat({1, seq, kHidden},
                                spec ? 1.0f : 0.0f));
    }
  }
  return out;
}

// ── Stub inference runtime ─────────────────────────────────────────────────

class StubSession : public InferenceSession {
public:
  using RunFn = std::function<std::vector<Tensor>(
      const TensorMap &, const std::vector<std::string> &)>;

  StubSession(std::vector<TensorSpec> inputs, std::vector<TensorSpec> outputs,
              RunFn run = nullptr)
      : inputs_(std::move(inputs)), outputs_(std::move(outputs)),
        run_(std::move(run)) {}

  const std::vector<TensorSpec> &Inputs() const override { return inputs_; }
  const std::vector<TensorSpec> &Outputs() const override { return outputs_; }

  std::vector<Tensor> Run(const TensorMap &inputs,
                          const std::vector<std::string> &names) override {
    ++runs;
    last_inputs = inputs;
    std::vector<std::string> wanted = names;
    if (wanted.empty()) {
      for (const auto &spec : outputs_) {
        wanted.push_back(spec.name);
      }
    }
    if (run_) {
      return run_(inputs, wanted);
    }
    return FakeBlockOutputs(outputs_, inputs, wanted);
  }

  int runs{0};
  TensorMap last_inputs;

private:
  std::vector<TensorSpec> inputs_;
  std::vector<TensorSpec> outputs_;
  RunFn run_;
};

// Opens StubSessions shaped after the metadata entry matching the file stem.
class StubBackend : public SessionBackend {
public:
  explicit StubBackend(ModelMetadata metadata)
      : metadata_(std::move(metadata)) {}

  std::string Name() const override { return "stub"; }

  std::unique_ptr<InferenceSession>
  Open(const std::filesystem::path &model, const SessionOptions &) override {
    std::lock_guard<std::mutex> lock(mutex_);
    opened.push_back(model.filename().string());
    return MakeSession(model);
  }

  std::unique_ptr<InferenceSession>
  OpenWithInitializers(const std::filesystem::path &skeleton,
                       const std::vector<NamedInitializer> &initializers,
                       const SessionOptions &) override {
    std::lock_guard<std::mutex> lock(mutex_);
    opened.push_back(skeleton.filename().string());
    injected += initializers.size();
    return MakeSession(skeleton);
  }

  std::vector<std::string> opened;
  std::size_t injected{0};

private:
  std::unique_ptr<InferenceSession>
  MakeSession(const std::filesystem::path &path) const {
    std::string stem = path.stem().string();
    auto cut = stem.find("_skeleton");
    if (cut != std::string::npos) {
      stem.resize(cut);
    }
    if (!metadata_.HasBlock(stem)) {
      return std::make_unique<StubSession>(std::vector<TensorSpec>{},
                                           std::vector<TensorSpec>{});
    }
    const BlockIO &io = metadata_.Block(stem);
    return std::make_unique<StubSession>(io.inputs, io.outputs);
  }

  ModelMetadata metadata_;
  std::mutex mutex_;
};

// Writes the plain graph file of every block so StandardOnnxStrategy finds
// it.
inline void WritePlainGraphs(const std::filesystem::path &blocks_dir,
                             const std::vector<std::string> &blocks) {
  for (const auto &block : blocks) {
    WriteFile(blocks_dir / (block + ".onnx"), "onnx");
  }
}

class StubTelemetrySource : public TelemetrySource {
public:
  explicit StubTelemetrySource(RawReadings readings = Idle())
      : readings_(readings) {}

  RawReadings Read() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++reads;
    return readings_;
  }
  void Set(const RawReadings &readings) {
    std::lock_guard<std::mutex> lock(mutex_);
    readings_ = readings;
  }

  static RawReadings Idle() {
    RawReadings r;
    r.cpu_utilization = 10.0;
    r.cores = 8;
    r.mem_total_kb = 16.0 * 1024 * 1024;
    r.mem_available_kb = 12.0 * 1024 * 1024;
    return r;
  }

  std::atomic<int> reads{0};

private:
  std::mutex mutex_;
  RawReadings readings_;
};

// ── Stub worker ────────────────────────────────────────────────────────────

class StubWorker : public BlockWorker {
public:
  using Handler = std::function<WorkerResult(const BlockJob &)>;

  StubWorker(WorkerType kind, Handler handler)
      : kind_(kind), handler_(std::move(handler)) {}

  WorkerType Kind() const override { return kind_; }

  std::future<WorkerResult> Submit(BlockJob job) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      jobs.push_back(job.block_id);
    }
    std::promise<WorkerResult> promise;
    WorkerResult result = handler_(job);
    result.job_id = job.job_id;
    result.block_id = job.block_id;
    result.worker = WorkerTypeName(kind_);
    promise.set_value(std::move(result));
    return promise.get_future();
  }

  WorkerStats Stats() const override { return {}; }
  void Stop() override {}

  std::vector<std::string> Jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs;
  }

private:
  WorkerType kind_;
  Handler handler_;
  mutable std::mutex mutex_;
  std::vector<std::string> jobs;
};

inline WorkerResult Succeeded(TensorMap outputs) {
  WorkerResult r;
  r.success = true;
  r.outputs = std::move(outputs);
  r.processing_time = 0.001;
  return r;
}

inline WorkerResult Failed(const std::string &error,
                           const std::string &error_type =
                               "worker_execution_error") {
  WorkerResult r;
  r.success = false;
  r.error = error;
  r.error_type = error_type;
  r.processing_time = 0.001;
  return r;
}

// Worker handler producing well-formed outputs for the three-block model.
inline WorkerResult RunThreeBlockJob(const ModelMetadata &metadata,
                                     const BlockJob &job) {
  const BlockIO &io = metadata.Block(job.block_id);
  std::vector<std::string> names = job.requested_outputs;
  if (names.empty()) {
    names = io.OutputNames();
  }
  std::vector<Tensor> tensors = FakeBlockOutputs(io.outputs, job.inputs, names);
  TensorMap outputs;
  for (std::size_t i = 0; i < names.size(); ++i) {
    outputs[names[i]] = std::move(tensors[i]);
  }
  return Succeeded(std::move(outputs));
}

} // namespace testing
} // namespace blockpipe
