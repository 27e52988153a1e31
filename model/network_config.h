#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace blockpipe {

struct NodeEndpoint {
  std::string node_id;
  std::string host;
  int port{0};
  std::vector<std::string> assigned_blocks; // chain order

  std::string BaseUrl() const;
};

// Cluster topology, loaded from the network config JSON:
//
//   {
//     "nodes": {"node_a": {"host": "10.0.0.2", "port": 8702,
//                          "assigned_block_ids_ordered_list": ["block_1"]}},
//     "model_chain_order": ["block_1", ..., "block_33"],
//     "paths": {"metadata_file": "...", "onnx_blocks_dir": "..."},
//     "profiling_file_path": "...",        (optional)
//     "execution_plan_file": "..."         (optional)
//   }
//
// Relative paths are resolved against `base_dir` (the config's directory).
struct NetworkConfig {
  std::map<std::string, NodeEndpoint> nodes;
  std::vector<std::string> chain_order;
  std::filesystem::path base_dir;
  std::filesystem::path metadata_file;
  std::filesystem::path onnx_blocks_dir;
  std::filesystem::path profiling_file;
  std::filesystem::path execution_plan_file;

  // Throws ConfigError for unknown nodes.
  const NodeEndpoint &Node(const std::string &node_id) const;
  // Position of `block_id` in the chain, or -1.
  int ChainIndex(const std::string &block_id) const;
  // Node owning `block_id`, if any.
  const NodeEndpoint *OwnerOf(const std::string &block_id) const;
  // Block that follows `node_id`'s last assigned block in the chain, or
  // nullopt when the node ends the chain.
  std::optional<std::string> NextBlockAfter(const std::string &node_id) const;
  // Node that owns NextBlockAfter(node_id).
  const NodeEndpoint *NextNode(const std::string &node_id) const;
};

// Throws ConfigError on missing file or missing required sections.
NetworkConfig LoadNetworkConfig(const std::filesystem::path &path);
NetworkConfig ParseNetworkConfig(const std::string &json_text,
                                 const std::filesystem::path &base_dir);

} // namespace blockpipe
