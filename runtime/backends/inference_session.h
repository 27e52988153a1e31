#pragma once

#include "model/block_metadata.h"
#include "runtime/tensors/tensor.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace blockpipe {

enum class ExecutionTarget { kCpu, kGpu };

inline const char *ExecutionTargetName(ExecutionTarget target) {
  return target == ExecutionTarget::kGpu ? "GPU" : "CPU";
}

enum class GraphOptimization { kDisabled, kBasic, kAll };

struct SessionOptions {
  ExecutionTarget target{ExecutionTarget::kCpu};
  GraphOptimization optimization{GraphOptimization::kBasic};
  int intra_op_threads{0}; // 0 = runtime default
  // Sequential execution with the CPU arena and memory patterns disabled.
  bool low_memory{false};
};

// Weight injected into a skeleton graph before session construction. The
// tensor bytes are borrowed and must outlive the session.
struct NamedInitializer {
  std::string name;
  const Tensor *tensor{nullptr};
};

// One loaded block graph. Run() is not required to be thread-safe; callers
// serialize access per session.
class InferenceSession {
public:
  virtual ~InferenceSession() = default;

  virtual const std::vector<TensorSpec> &Inputs() const = 0;
  virtual const std::vector<TensorSpec> &Outputs() const = 0;

  // Feeds the inputs the graph declares (extra entries are ignored) and
  // returns outputs positionally, in `output_names` order or in declaration
  // order when `output_names` is empty. Throws std::runtime_error on failure.
  virtual std::vector<Tensor> Run(const TensorMap &inputs,
                                  const std::vector<std::string> &output_names) = 0;
};

class SessionBackend {
public:
  virtual ~SessionBackend() = default;

  virtual std::string Name() const = 0;

  // Loads a self-contained graph, resolving external-data references
  // relative to the model file. Throws LoadError.
  virtual std::unique_ptr<InferenceSession>
  Open(const std::filesystem::path &model, const SessionOptions &options) = 0;

  // Loads a skeleton graph with `initializers` replacing its placeholder
  // weights. Throws LoadError.
  virtual std::unique_ptr<InferenceSession>
  OpenWithInitializers(const std::filesystem::path &skeleton,
                       const std::vector<NamedInitializer> &initializers,
                       const SessionOptions &options) = 0;
};

} // namespace blockpipe
