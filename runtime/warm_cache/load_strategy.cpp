#include "runtime/warm_cache/load_strategy.h"

#include "runtime/errors.h"
#include "server/logging/logger.h"

namespace blockpipe {

namespace fs = std::filesystem;

LoadedSession::LoadedSession(std::string block_id,
                             std::unique_ptr<InferenceSession> session,
                             std::string strategy, std::string load_format,
                             std::vector<MappedFile> mappings,
                             std::vector<Tensor> weights)
    : block_id_(std::move(block_id)), strategy_(std::move(strategy)),
      load_format_(std::move(load_format)), mappings_(std::move(mappings)),
      weights_(std::move(weights)), session_(std::move(session)) {
  if (!session_) {
    throw LoadError("LoadedSession for " + block_id_ + " has no session");
  }
}

LoadedSession::~LoadedSession() {
  // Weights and mappings back the session's initializers.
  session_.reset();
  weights_.clear();
  mappings_.clear();
}

BlockAssetResolver::BlockAssetResolver(fs::path blocks_dir,
                                       const ModelMetadata *metadata)
    : blocks_dir_(std::move(blocks_dir)), metadata_(metadata) {}

BlockAssets BlockAssetResolver::Resolve(const std::string &block_id) const {
  std::string file_name = block_id + ".onnx";
  if (metadata_ && metadata_->HasBlock(block_id) &&
      !metadata_->Block(block_id).file_path.empty()) {
    file_name = metadata_->Block(block_id).file_path;
  }

  BlockAssets assets;
  assets.plain_graph = blocks_dir_ / file_name;
  if (!fs::is_regular_file(assets.plain_graph)) {
    for (const auto &candidate :
         {blocks_dir_ / (block_id + ".onnx"),
          blocks_dir_ / (block_id + "_optimized.onnx")}) {
      if (fs::is_regular_file(candidate)) {
        assets.plain_graph = candidate;
        break;
      }
    }
  }

  const fs::path dir = assets.plain_graph.parent_path();
  const std::string stem = fs::path(file_name).stem().string();
  assets.optimized_graph = dir / (stem + "_skeleton.optimized.onnx");
  assets.skeleton_graph = dir / (stem + "_skeleton_with_zeros.onnx");
  assets.weights_dir = dir / (stem + "_weights");
  assets.weights_manifest = assets.weights_dir / "weights_metadata.json";
  return assets;
}

std::unique_ptr<LoadedSession>
OptimizedExternalStrategy::TryLoad(const std::string &block_id) {
  BlockAssets assets = resolver_->Resolve(block_id);
  if (!fs::is_regular_file(assets.optimized_graph) ||
      !fs::is_directory(assets.weights_dir)) {
    return nullptr;
  }
  SessionOptions opts = options_;
  opts.optimization = GraphOptimization::kDisabled;
  auto session = backend_->Open(assets.optimized_graph, opts);
  return std::make_unique<LoadedSession>(block_id, std::move(session), Name(),
                                         LoadFormat());
}

std::unique_ptr<LoadedSession>
MmapZeroSkeletonStrategy::TryLoad(const std::string &block_id) {
  BlockAssets assets = resolver_->Resolve(block_id);
  if (!fs::is_regular_file(assets.skeleton_graph) ||
      !fs::is_regular_file(assets.weights_manifest) ||
      !fs::is_directory(assets.weights_dir)) {
    return nullptr;
  }

  std::vector<WeightEntry> entries = LoadWeightManifest(assets.weights_manifest);
  std::vector<MappedFile> mappings(entries.size());
  std::vector<Tensor> weights;
  weights.reserve(entries.size());
  std::size_t total_bytes = 0;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    weights.push_back(
        MaterializeWeight(entries[i], assets.weights_dir, mappings[i]));
    total_bytes += weights.back().ByteSize();
  }

  std::vector<NamedInitializer> initializers;
  initializers.reserve(entries.size());
  for (std::size_t i = 0; i < entries.size(); ++i) {
    initializers.push_back({entries[i].name, &weights[i]});
  }

  SessionOptions opts = options_;
  opts.optimization = GraphOptimization::kBasic;
  opts.low_memory = true;
  auto session =
      backend_->OpenWithInitializers(assets.skeleton_graph, initializers, opts);

  log::Debug("warm_cache",
             block_id + ": injected " + std::to_string(weights.size()) +
                 " mmap weights",
             "bytes=" + std::to_string(total_bytes));
  return std::make_unique<LoadedSession>(block_id, std::move(session), Name(),
                                         LoadFormat(), std::move(mappings),
                                         std::move(weights));
}

std::unique_ptr<LoadedSession>
StandardOnnxStrategy::TryLoad(const std::string &block_id) {
  BlockAssets assets = resolver_->Resolve(block_id);
  if (!fs::is_regular_file(assets.plain_graph)) {
    return nullptr;
  }
  SessionOptions opts = options_;
  opts.optimization = GraphOptimization::kBasic;
  auto session = backend_->Open(assets.plain_graph, opts);
  return std::make_unique<LoadedSession>(block_id, std::move(session), Name(),
                                         LoadFormat());
}

std::vector<std::unique_ptr<LoadStrategy>>
DefaultLoadStrategies(std::shared_ptr<SessionBackend> backend,
                      std::shared_ptr<const BlockAssetResolver> resolver,
                      const SessionOptions &options) {
  std::vector<std::unique_ptr<LoadStrategy>> strategies;
  strategies.push_back(
      std::make_unique<OptimizedExternalStrategy>(backend, resolver, options));
  strategies.push_back(
      std::make_unique<MmapZeroSkeletonStrategy>(backend, resolver, options));
  strategies.push_back(
      std::make_unique<StandardOnnxStrategy>(backend, resolver, options));
  return strategies;
}

} // namespace blockpipe
