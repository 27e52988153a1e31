#include "model/network_config.h"

#include "runtime/errors.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace blockpipe {

namespace {

std::filesystem::path Resolve(const std::filesystem::path &base,
                              const std::string &value) {
  if (value.empty()) {
    return {};
  }
  std::filesystem::path p(value);
  if (p.is_absolute() || base.empty()) {
    return p;
  }
  return base / p;
}

} // namespace

std::string NodeEndpoint::BaseUrl() const {
  return "http://" + host + ":" + std::to_string(port);
}

const NodeEndpoint &NetworkConfig::Node(const std::string &node_id) const {
  auto it = nodes.find(node_id);
  if (it == nodes.end()) {
    throw ConfigError("node '" + node_id + "' not found in network config");
  }
  return it->second;
}

int NetworkConfig::ChainIndex(const std::string &block_id) const {
  auto it = std::find(chain_order.begin(), chain_order.end(), block_id);
  if (it == chain_order.end()) {
    return -1;
  }
  return static_cast<int>(it - chain_order.begin());
}

const NodeEndpoint *NetworkConfig::OwnerOf(const std::string &block_id) const {
  for (const auto &[id, node] : nodes) {
    if (std::find(node.assigned_blocks.begin(), node.assigned_blocks.end(),
                  block_id) != node.assigned_blocks.end()) {
      return &node;
    }
  }
  return nullptr;
}

std::optional<std::string>
NetworkConfig::NextBlockAfter(const std::string &node_id) const {
  const NodeEndpoint &node = Node(node_id);
  if (node.assigned_blocks.empty()) {
    return std::nullopt;
  }
  int last = ChainIndex(node.assigned_blocks.back());
  if (last < 0 || last + 1 >= static_cast<int>(chain_order.size())) {
    return std::nullopt;
  }
  return chain_order[static_cast<std::size_t>(last + 1)];
}

const NodeEndpoint *NetworkConfig::NextNode(const std::string &node_id) const {
  auto next_block = NextBlockAfter(node_id);
  if (!next_block) {
    return nullptr;
  }
  return OwnerOf(*next_block);
}

NetworkConfig ParseNetworkConfig(const std::string &json_text,
                                 const std::filesystem::path &base_dir) {
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::parse_error &ex) {
    throw ConfigError(std::string("network config is not valid JSON: ") +
                      ex.what());
  }

  NetworkConfig cfg;
  cfg.base_dir = base_dir;
  try {
    if (!root.contains("nodes") || !root["nodes"].is_object()) {
      throw ConfigError("'nodes' missing in network config");
    }
    for (auto it = root["nodes"].begin(); it != root["nodes"].end(); ++it) {
      NodeEndpoint node;
      node.node_id = it.key();
      node.host = it.value().value("host", std::string("127.0.0.1"));
      node.port = it.value().value("port", 0);
      if (it.value().contains("assigned_block_ids_ordered_list")) {
        node.assigned_blocks = it.value()["assigned_block_ids_ordered_list"]
                                   .get<std::vector<std::string>>();
      }
      cfg.nodes.emplace(node.node_id, std::move(node));
    }

    if (!root.contains("model_chain_order") ||
        !root["model_chain_order"].is_array()) {
      throw ConfigError("'model_chain_order' missing in network config");
    }
    cfg.chain_order = root["model_chain_order"].get<std::vector<std::string>>();

    if (!root.contains("paths") || !root["paths"].is_object()) {
      throw ConfigError("'paths' missing in network config");
    }
    const json &paths = root["paths"];
    if (!paths.contains("metadata_file") || !paths.contains("onnx_blocks_dir")) {
      throw ConfigError(
          "'paths' must define metadata_file and onnx_blocks_dir");
    }
    cfg.metadata_file =
        Resolve(base_dir, paths["metadata_file"].get<std::string>());
    cfg.onnx_blocks_dir =
        Resolve(base_dir, paths["onnx_blocks_dir"].get<std::string>());
    cfg.profiling_file =
        Resolve(base_dir, root.value("profiling_file_path", std::string()));
    cfg.execution_plan_file =
        Resolve(base_dir, root.value("execution_plan_file", std::string()));
  } catch (const json::exception &ex) {
    throw ConfigError(std::string("invalid network config: ") + ex.what());
  }

  for (const auto &[id, node] : cfg.nodes) {
    for (const auto &block : node.assigned_blocks) {
      if (cfg.ChainIndex(block) < 0) {
        throw ConfigError("node '" + id + "' is assigned " + block +
                          " which is not in model_chain_order");
      }
    }
  }
  return cfg;
}

NetworkConfig LoadNetworkConfig(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("cannot open network config file: " + path.string());
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return ParseNetworkConfig(buf.str(), path.parent_path());
}

} // namespace blockpipe
