#include "server/node_config.h"

#include "runtime/errors.h"
#include "runtime/tensors/tensor.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace blockpipe {

namespace {

std::string Trim(const std::string &input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &name, const std::string &value) {
  auto lowered = ToLower(Trim(value));
  if (lowered == "true" || lowered == "1" || lowered == "yes" ||
      lowered == "on") {
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no" ||
      lowered == "off") {
    return false;
  }
  throw ConfigError(name + ": expected a boolean, got '" + value + "'");
}

int ParseInt(const std::string &name, const std::string &value) {
  try {
    std::size_t used = 0;
    int out = std::stoi(value, &used);
    if (used != Trim(value).size()) {
      throw std::invalid_argument(value);
    }
    return out;
  } catch (const std::exception &) {
    throw ConfigError(name + ": expected an integer, got '" + value + "'");
  }
}

double ParseDouble(const std::string &name, const std::string &value) {
  try {
    return std::stod(value);
  } catch (const std::exception &) {
    throw ConfigError(name + ": expected a number, got '" + value + "'");
  }
}

std::size_t ParseSize(const std::string &name, const std::string &value) {
  int parsed = ParseInt(name, value);
  if (parsed < 0) {
    throw ConfigError(name + " must not be negative");
  }
  return static_cast<std::size_t>(parsed);
}

template <typename T>
void Read(const YAML::Node &section, const char *key, T *out) {
  if (!section || !section[key]) {
    return;
  }
  try {
    *out = section[key].as<T>();
  } catch (const YAML::Exception &ex) {
    throw ConfigError(std::string("config key '") + key + "': " + ex.what());
  }
}

void ReadBlocks(const YAML::Node &section, const char *key,
                std::set<std::string> *out) {
  if (!section || !section[key]) {
    return;
  }
  const YAML::Node &node = section[key];
  try {
    if (node.IsSequence()) {
      out->clear();
      for (const auto &item : node) {
        out->insert(item.as<std::string>());
      }
    } else if (node.IsScalar()) {
      *out = ParseBlockList(node.as<std::string>());
    } else if (node.IsNull()) {
      out->clear();
    }
  } catch (const YAML::Exception &ex) {
    throw ConfigError(std::string("config key '") + key + "': " + ex.what());
  }
}

const char *Env(const char *name) {
  const char *value = std::getenv(name);
  return value && *value ? value : nullptr;
}

} // namespace

std::set<std::string> ParseBlockList(const std::string &text) {
  std::set<std::string> out;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = Trim(item);
    if (!item.empty()) {
      out.insert(item);
    }
  }
  return out;
}

void ApplyNodeConfigYaml(const YAML::Node &root, NodeConfig *config) {
  if (!root || root.IsNull()) {
    return;
  }
  if (!root.IsMap()) {
    throw ConfigError("node config must be a YAML mapping");
  }

  const YAML::Node node = root["node"];
  Read(node, "id", &config->node_id);
  Read(node, "network_config", &config->network_config);
  Read(node, "host", &config->host);
  Read(node, "port", &config->port);
  Read(node, "log_level", &config->log_level);
  Read(node, "log_format", &config->log_format);
  Read(node, "log_file", &config->log_file);
  Read(node, "tls_cert", &config->tls_cert_path);
  Read(node, "tls_key", &config->tls_key_path);

  const YAML::Node runtime = root["runtime"];
  Read(runtime, "max_warm_sessions", &config->max_warm_sessions);
  Read(runtime, "max_warm_sessions_gpu", &config->max_warm_sessions_gpu);
  Read(runtime, "warmup_runs", &config->warmup_runs);
  Read(runtime, "initial_kv_pages", &config->initial_kv_pages);
  Read(runtime, "kv_page_capacity_tokens", &config->kv_page_capacity_tokens);
  Read(runtime, "max_cached_sessions_kv", &config->max_cached_sessions_kv);
  Read(runtime, "kv_dtype", &config->kv_dtype);
  Read(runtime, "worker_timeout_s", &config->worker_timeout_s);
  Read(runtime, "forward_timeout_s", &config->forward_timeout_s);
  Read(runtime, "connect_timeout_s", &config->connect_timeout_s);
  Read(runtime, "cpu_worker_threads", &config->cpu_worker_threads);
  Read(runtime, "gpu_worker_enabled", &config->gpu_worker_enabled);
  Read(runtime, "http_workers", &config->http_workers);

  const YAML::Node scheduler = root["scheduler"];
  SchedulerPolicy &policy = config->scheduler;
  Read(scheduler, "adaptive", &policy.adaptive);
  Read(scheduler, "memory_threshold_percent",
       &policy.memory_high_water_percent);
  ReadBlocks(scheduler, "force_cpu_blocks", &policy.force_cpu_blocks);
  ReadBlocks(scheduler, "memory_intensive_blocks",
             &policy.memory_intensive_blocks);
  ReadBlocks(scheduler, "limited_gpu_large_blocks",
             &policy.limited_gpu_large_blocks);
  ReadBlocks(scheduler, "tail_cpu_blocks", &policy.tail_cpu_blocks);
  if (scheduler && scheduler["thresholds"]) {
    const YAML::Node thresholds = scheduler["thresholds"];
    Read(thresholds, "gpu", &policy.gpu_threshold);
    Read(thresholds, "cpu", &policy.cpu_threshold);
    Read(thresholds, "cpu_critical", &policy.cpu_critical);
    Read(thresholds, "gpu_promote", &policy.gpu_promote);
  }

  const YAML::Node telemetry = root["telemetry"];
  Read(telemetry, "sampling_interval_s", &config->sampling_interval_s);
  Read(telemetry, "gpu_type", &config->gpu_type);

  const YAML::Node license = root["license"];
  Read(license, "enabled", &config->license.enabled);
  Read(license, "key", &config->license.key);
  Read(license, "expires_at", &config->license.expires_at);
  Read(license, "check_interval_s", &config->license.check_interval_s);
  Read(license, "session_ttl_s", &config->license.session_ttl_s);
}

void LoadNodeConfigFile(const std::string &path, NodeConfig *config) {
  try {
    ApplyNodeConfigYaml(YAML::LoadFile(path), config);
  } catch (const YAML::Exception &ex) {
    throw ConfigError("Error parsing config file " + path + ": " + ex.what());
  }
  config->config_path = path;
}

void ApplyEnvOverrides(NodeConfig *config) {
  if (const char *v = Env("BLOCKPIPE_NODE_ID")) {
    config->node_id = v;
  }
  if (const char *v = Env("BLOCKPIPE_NETWORK_CONFIG")) {
    config->network_config = v;
  }
  if (const char *v = Env("BLOCKPIPE_HOST")) {
    config->host = v;
  }
  if (const char *v = Env("BLOCKPIPE_PORT")) {
    config->port = ParseInt("BLOCKPIPE_PORT", v);
  }
  if (const char *v = Env("BLOCKPIPE_LOG_LEVEL")) {
    config->log_level = v;
  }
  if (const char *v = Env("BLOCKPIPE_LOG_FORMAT")) {
    config->log_format = v;
  }
  if (const char *v = Env("BLOCKPIPE_LOG_FILE")) {
    config->log_file = v;
  }
  if (const char *v = Env("BLOCKPIPE_TLS_CERT")) {
    config->tls_cert_path = v;
  }
  if (const char *v = Env("BLOCKPIPE_TLS_KEY")) {
    config->tls_key_path = v;
  }
  if (const char *v = Env("BLOCKPIPE_MAX_WARM_SESSIONS")) {
    config->max_warm_sessions = ParseSize("BLOCKPIPE_MAX_WARM_SESSIONS", v);
  }
  if (const char *v = Env("BLOCKPIPE_MAX_WARM_SESSIONS_GPU")) {
    config->max_warm_sessions_gpu =
        ParseSize("BLOCKPIPE_MAX_WARM_SESSIONS_GPU", v);
  }
  if (const char *v = Env("BLOCKPIPE_WARMUP_RUNS")) {
    config->warmup_runs = ParseInt("BLOCKPIPE_WARMUP_RUNS", v);
  }
  if (const char *v = Env("BLOCKPIPE_INITIAL_KV_PAGES")) {
    config->initial_kv_pages = ParseInt("BLOCKPIPE_INITIAL_KV_PAGES", v);
  }
  if (const char *v = Env("BLOCKPIPE_KV_PAGE_CAPACITY")) {
    config->kv_page_capacity_tokens =
        ParseInt("BLOCKPIPE_KV_PAGE_CAPACITY", v);
  }
  if (const char *v = Env("BLOCKPIPE_MAX_CACHED_SESSIONS_KV")) {
    config->max_cached_sessions_kv =
        ParseSize("BLOCKPIPE_MAX_CACHED_SESSIONS_KV", v);
  }
  if (const char *v = Env("BLOCKPIPE_KV_DTYPE")) {
    config->kv_dtype = v;
  }
  if (const char *v = Env("BLOCKPIPE_WORKER_TIMEOUT")) {
    config->worker_timeout_s = ParseDouble("BLOCKPIPE_WORKER_TIMEOUT", v);
  }
  if (const char *v = Env("BLOCKPIPE_FORWARD_TIMEOUT")) {
    config->forward_timeout_s = ParseDouble("BLOCKPIPE_FORWARD_TIMEOUT", v);
  }
  if (const char *v = Env("BLOCKPIPE_CPU_WORKER_THREADS")) {
    config->cpu_worker_threads = ParseInt("BLOCKPIPE_CPU_WORKER_THREADS", v);
  }
  if (const char *v = Env("BLOCKPIPE_GPU_WORKER_ENABLED")) {
    config->gpu_worker_enabled = ParseBool("BLOCKPIPE_GPU_WORKER_ENABLED", v);
  }
  if (const char *v = Env("BLOCKPIPE_HTTP_WORKERS")) {
    config->http_workers = ParseInt("BLOCKPIPE_HTTP_WORKERS", v);
  }
  if (const char *v = Env("BLOCKPIPE_ADAPTIVE")) {
    config->scheduler.adaptive = ParseBool("BLOCKPIPE_ADAPTIVE", v);
  }
  if (const char *v = Env("BLOCKPIPE_MEMORY_THRESHOLD")) {
    config->scheduler.memory_high_water_percent =
        ParseDouble("BLOCKPIPE_MEMORY_THRESHOLD", v);
  }
  if (const char *v = Env("BLOCKPIPE_FORCE_CPU_BLOCKS")) {
    config->scheduler.force_cpu_blocks = ParseBlockList(v);
  }
  if (const char *v = Env("BLOCKPIPE_SAMPLING_INTERVAL")) {
    config->sampling_interval_s = ParseDouble("BLOCKPIPE_SAMPLING_INTERVAL", v);
  }
  if (const char *v = Env("BLOCKPIPE_GPU_TYPE")) {
    config->gpu_type = v;
  }
  if (const char *v = Env("BLOCKPIPE_LICENSE_ENABLED")) {
    config->license.enabled = ParseBool("BLOCKPIPE_LICENSE_ENABLED", v);
  }
  if (const char *v = Env("BLOCKPIPE_LICENSE_KEY")) {
    config->license.key = v;
  }
}

std::string NodeUsage() {
  return "Usage: blockpipe-node [options]\n"
         "  --config PATH             node YAML config (default config/node.yaml)\n"
         "  --node-id ID              this node's id in the network config\n"
         "  --network-config PATH     network/topology JSON\n"
         "  --host HOST               bind address\n"
         "  --port PORT               bind port (default: from network config)\n"
         "  --log-level LEVEL         debug|info|warn|error\n"
         "  --log-file PATH           also append logs to PATH\n"
         "  --max-warm-sessions N     warm sessions kept per worker cache\n"
         "  --initial-kv-pages N      KV pages preallocated in the pool\n"
         "  --kv-page-capacity N      tokens per KV page\n"
         "  --no-adaptive             use the static execution plan only\n"
         "  --sampling-interval SEC   telemetry sampling interval\n"
         "  --force-cpu-blocks LIST   comma-separated blocks pinned to CPU\n"
         "  --memory-threshold PCT    memory high-water mark for scheduling\n"
         "  --help                    show this message\n";
}

CliParseResult ParseNodeArgs(int argc, const char *const *argv) {
  CliParseResult result;
  NodeConfig &config = result.config;

  std::string config_path = "config/node.yaml";
  bool explicit_config = false;
  if (const char *v = Env("BLOCKPIPE_CONFIG")) {
    config_path = v;
    explicit_config = true;
  }
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--config" && i + 1 < argc) {
      config_path = argv[i + 1];
      explicit_config = true;
    }
  }
  if (std::filesystem::exists(config_path)) {
    LoadNodeConfigFile(config_path, &config);
  } else if (explicit_config) {
    throw ConfigError("config file not found: " + config_path);
  }
  ApplyEnvOverrides(&config);

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw ConfigError(arg + " requires a value");
      }
      return argv[++i];
    };
    if (arg == "--help" || arg == "-h") {
      result.show_help = true;
    } else if (arg == "--config") {
      value();
    } else if (arg == "--node-id") {
      config.node_id = value();
    } else if (arg == "--network-config") {
      config.network_config = value();
    } else if (arg == "--host") {
      config.host = value();
    } else if (arg == "--port") {
      config.port = ParseInt(arg, value());
    } else if (arg == "--log-level") {
      config.log_level = value();
    } else if (arg == "--log-file") {
      config.log_file = value();
    } else if (arg == "--max-warm-sessions") {
      config.max_warm_sessions = ParseSize(arg, value());
    } else if (arg == "--initial-kv-pages") {
      config.initial_kv_pages = ParseInt(arg, value());
    } else if (arg == "--kv-page-capacity") {
      config.kv_page_capacity_tokens = ParseInt(arg, value());
    } else if (arg == "--no-adaptive") {
      config.scheduler.adaptive = false;
    } else if (arg == "--sampling-interval") {
      config.sampling_interval_s = ParseDouble(arg, value());
    } else if (arg == "--force-cpu-blocks") {
      config.scheduler.force_cpu_blocks = ParseBlockList(value());
    } else if (arg == "--memory-threshold") {
      config.scheduler.memory_high_water_percent = ParseDouble(arg, value());
    } else {
      throw ConfigError("unknown option " + arg);
    }
  }
  return result;
}

void ValidateNodeConfig(const NodeConfig &config) {
  if (config.node_id.empty()) {
    throw ConfigError("node id is required (--node-id or node.id)");
  }
  if (config.network_config.empty()) {
    throw ConfigError(
        "network config is required (--network-config or node.network_config)");
  }
  if (config.max_warm_sessions < 1 || config.max_warm_sessions_gpu < 1) {
    throw ConfigError("max_warm_sessions must be at least 1");
  }
  if (config.initial_kv_pages < 0) {
    throw ConfigError("initial_kv_pages must not be negative");
  }
  if (config.kv_page_capacity_tokens < 1) {
    throw ConfigError("kv_page_capacity_tokens must be at least 1");
  }
  if (config.max_cached_sessions_kv < 1) {
    throw ConfigError("max_cached_sessions_kv must be at least 1");
  }
  DType kv_dtype = ParseDType(config.kv_dtype);
  if (kv_dtype != DType::kFloat16 && kv_dtype != DType::kFloat32) {
    throw ConfigError("kv_dtype must be float16 or float32");
  }
  if (config.worker_timeout_s <= 0 || config.forward_timeout_s <= 0) {
    throw ConfigError("timeouts must be positive");
  }
  if (config.sampling_interval_s <= 0) {
    throw ConfigError("sampling_interval_s must be positive");
  }
  if (config.port < 0 || config.port > 65535) {
    throw ConfigError("port out of range");
  }
  const std::string format = ToLower(config.log_format);
  if (format != "text" && format != "json") {
    throw ConfigError("log_format must be text or json");
  }
}

} // namespace blockpipe
