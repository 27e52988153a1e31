#pragma once

#include "scheduler/adaptive_block_scheduler.h"
#include "server/security/license_gate.h"

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace blockpipe {

// Everything a node process needs besides the network/topology JSON.
// Precedence: defaults < YAML file < BLOCKPIPE_* environment < CLI flags.
struct NodeConfig {
  // node
  std::string node_id;
  std::string network_config;
  std::string host{"0.0.0.0"};
  // 0 takes the port from this node's entry in the network config.
  int port{0};
  std::string log_level{"info"};
  std::string log_format{"text"};
  std::string log_file;
  // Serving over TLS requires both paths.
  std::string tls_cert_path;
  std::string tls_key_path;

  // runtime
  std::size_t max_warm_sessions{1};
  std::size_t max_warm_sessions_gpu{1};
  int warmup_runs{3};
  int initial_kv_pages{16};
  int kv_page_capacity_tokens{16};
  std::size_t max_cached_sessions_kv{10};
  std::string kv_dtype{"float16"};
  double worker_timeout_s{120.0};
  double forward_timeout_s{1200.0};
  double connect_timeout_s{30.0};
  int cpu_worker_threads{2};
  bool gpu_worker_enabled{true};
  int http_workers{4};

  // scheduler
  SchedulerPolicy scheduler{SchedulerPolicy::Defaults()};

  // telemetry
  double sampling_interval_s{0.5};
  std::string gpu_type{"auto"};

  LicenseConfig license;

  std::string config_path;
};

// Applies the sections present in `root` onto `config`. Throws ConfigError
// on values of the wrong type.
void ApplyNodeConfigYaml(const YAML::Node &root, NodeConfig *config);
// Throws ConfigError when the file cannot be parsed.
void LoadNodeConfigFile(const std::string &path, NodeConfig *config);
void ApplyEnvOverrides(NodeConfig *config);

struct CliParseResult {
  NodeConfig config;
  bool show_help{false};
};

// Resolves the full configuration for a process started with `argv`.
// Throws ConfigError for unknown flags or unusable values.
CliParseResult ParseNodeArgs(int argc, const char *const *argv);
// Throws ConfigError when required settings are missing or out of range.
void ValidateNodeConfig(const NodeConfig &config);

std::string NodeUsage();

// "block_1,block_2" -> {"block_1", "block_2"}; blanks are dropped.
std::set<std::string> ParseBlockList(const std::string &text);

} // namespace blockpipe
