#pragma once

#include "model/block_metadata.h"
#include "runtime/backends/inference_session.h"
#include "runtime/warm_cache/mapped_weights.h"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace blockpipe {

// A block graph resident in memory. Owns the weight buffers and memory maps
// injected into the session; the session is always released first.
class LoadedSession {
public:
  LoadedSession(std::string block_id, std::unique_ptr<InferenceSession> session,
                std::string strategy, std::string load_format,
                std::vector<MappedFile> mappings = {},
                std::vector<Tensor> weights = {});
  ~LoadedSession();

  LoadedSession(const LoadedSession &) = delete;
  LoadedSession &operator=(const LoadedSession &) = delete;

  const std::string &block_id() const { return block_id_; }
  const std::string &strategy() const { return strategy_; }
  const std::string &load_format() const { return load_format_; }
  double load_seconds() const { return load_seconds_; }
  void set_load_seconds(double seconds) { load_seconds_ = seconds; }
  std::size_t mapped_weight_count() const { return mappings_.size(); }

  InferenceSession &session() { return *session_; }
  const InferenceSession &session() const { return *session_; }
  // Serializes Run() calls on this session.
  std::mutex &run_mutex() { return run_mutex_; }

private:
  std::string block_id_;
  std::string strategy_;
  std::string load_format_;
  double load_seconds_{0.0};
  std::vector<MappedFile> mappings_;
  std::vector<Tensor> weights_;
  std::unique_ptr<InferenceSession> session_;
  std::mutex run_mutex_;
};

// On-disk assets of one block. Given the plain graph "<dir>/<stem>.onnx":
//   optimized graph   <dir>/<stem>_skeleton.optimized.onnx
//   zero skeleton     <dir>/<stem>_skeleton_with_zeros.onnx
//   weights dir       <dir>/<stem>_weights/
//   weights manifest  <dir>/<stem>_weights/weights_metadata.json
struct BlockAssets {
  std::filesystem::path plain_graph;
  std::filesystem::path optimized_graph;
  std::filesystem::path skeleton_graph;
  std::filesystem::path weights_dir;
  std::filesystem::path weights_manifest;
};

class BlockAssetResolver {
public:
  BlockAssetResolver(std::filesystem::path blocks_dir,
                     const ModelMetadata *metadata);

  BlockAssets Resolve(const std::string &block_id) const;
  const std::filesystem::path &blocks_dir() const { return blocks_dir_; }

private:
  std::filesystem::path blocks_dir_;
  const ModelMetadata *metadata_;
};

// One way of turning a block id into a LoadedSession.
class LoadStrategy {
public:
  virtual ~LoadStrategy() = default;

  // Short tag: "optimized_external", "mmap_zeroskel", "standard_onnx".
  virtual std::string Name() const = 0;
  virtual std::string LoadFormat() const = 0;

  // Returns nullptr when this strategy's assets are not present. Throws
  // LoadError when they are present but loading fails.
  virtual std::unique_ptr<LoadedSession>
  TryLoad(const std::string &block_id) = 0;
};

class AssetLoadStrategy : public LoadStrategy {
public:
  AssetLoadStrategy(std::shared_ptr<SessionBackend> backend,
                    std::shared_ptr<const BlockAssetResolver> resolver,
                    SessionOptions options)
      : backend_(std::move(backend)), resolver_(std::move(resolver)),
        options_(options) {}

protected:
  std::shared_ptr<SessionBackend> backend_;
  std::shared_ptr<const BlockAssetResolver> resolver_;
  SessionOptions options_;
};

// Pre-optimized graph whose weights live in the external-data directory.
// Loaded with graph optimization disabled.
class OptimizedExternalStrategy : public AssetLoadStrategy {
public:
  using AssetLoadStrategy::AssetLoadStrategy;
  std::string Name() const override { return "optimized_external"; }
  std::string LoadFormat() const override { return "optimized_onnx_external"; }
  std::unique_ptr<LoadedSession> TryLoad(const std::string &block_id) override;
};

// Zero-weight skeleton graph plus memory-mapped weights injected as named
// initializers before session construction.
class MmapZeroSkeletonStrategy : public AssetLoadStrategy {
public:
  using AssetLoadStrategy::AssetLoadStrategy;
  std::string Name() const override { return "mmap_zeroskel"; }
  std::string LoadFormat() const override {
    return "onnx_zeroskel_mmap_weights";
  }
  std::unique_ptr<LoadedSession> TryLoad(const std::string &block_id) override;
};

// Plain graph file with basic graph optimization.
class StandardOnnxStrategy : public AssetLoadStrategy {
public:
  using AssetLoadStrategy::AssetLoadStrategy;
  std::string Name() const override { return "standard_onnx"; }
  std::string LoadFormat() const override { return "standard_onnx"; }
  std::unique_ptr<LoadedSession> TryLoad(const std::string &block_id) override;
};

// The three strategies above, in priority order.
std::vector<std::unique_ptr<LoadStrategy>>
DefaultLoadStrategies(std::shared_ptr<SessionBackend> backend,
                      std::shared_ptr<const BlockAssetResolver> resolver,
                      const SessionOptions &options);

} // namespace blockpipe
