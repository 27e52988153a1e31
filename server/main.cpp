#include "runtime/errors.h"
#include "server/http/http_server.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"
#include "server/node_config.h"
#include "server/node_runtime.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void SignalHandler(int) { g_running = false; }

void ConfigureLogging(const blockpipe::NodeConfig &config) {
  namespace log = blockpipe::log;
  log::SetLevel(log::ParseLevel(config.log_level));
  log::SetJsonMode(config.log_format == "json");
  if (!config.log_file.empty() && !log::SetLogFile(config.log_file)) {
    log::Warn("node", "cannot open log file; logging to stderr only",
              config.log_file);
  }
}

} // namespace

int main(int argc, char **argv) {
  namespace log = blockpipe::log;

  blockpipe::CliParseResult parsed;
  try {
    parsed = blockpipe::ParseNodeArgs(argc, argv);
  } catch (const blockpipe::ConfigError &ex) {
    std::cerr << "blockpipe-node: " << ex.what() << "\n\n"
              << blockpipe::NodeUsage();
    return 1;
  }
  if (parsed.show_help) {
    std::cout << blockpipe::NodeUsage();
    return 0;
  }
  const blockpipe::NodeConfig &config = parsed.config;
  ConfigureLogging(config);

  std::unique_ptr<blockpipe::NodeRuntime> runtime;
  try {
    blockpipe::ValidateNodeConfig(config);
    runtime = blockpipe::NodeRuntime::Create(config);
  } catch (const blockpipe::ConfigError &ex) {
    log::Error("node", "configuration error", ex.what());
    return 1;
  } catch (const std::runtime_error &ex) {
    log::Error("node", "startup failed", ex.what());
    return 1;
  }

  int port = config.port;
  if (port == 0) {
    port = runtime->network().Node(config.node_id).port;
  }
  if (port <= 0) {
    log::Error("node", "no listen port configured", config.node_id);
    return 1;
  }

  blockpipe::HttpServer::TlsConfig tls;
  tls.enabled = !config.tls_cert_path.empty() || !config.tls_key_path.empty();
  tls.cert_path = config.tls_cert_path;
  tls.key_path = config.tls_key_path;

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  runtime->Start();
  blockpipe::HttpServer server(config.host, port, runtime.get(),
                               &blockpipe::GlobalMetrics(), tls,
                               config.http_workers);
  server.Start();
  log::Info("node", "node " + config.node_id + " serving",
            config.host + ":" + std::to_string(port) +
                (tls.enabled ? " (TLS)" : ""));

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  log::Info("node", "shutting down", config.node_id);
  server.Stop();
  runtime->Shutdown();
  return 0;
}
