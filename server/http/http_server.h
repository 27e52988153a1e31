#pragma once

#include "server/metrics/metrics.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include <openssl/ssl.h>

namespace blockpipe {

class NodeRuntime;

struct HttpReply {
  int status{200};
  std::string status_text{"OK"};
  std::string content_type{"application/json"};
  std::string body;
};

struct HttpServerTlsConfig {
  bool enabled{false};
  std::string cert_path;
  std::string key_path;
};

// Node HTTP surface:
//   POST   /v1/pipeline/step
//   POST   /v1/sessions/{id}/authorize
//   DELETE /v1/sessions/{id}
//   GET    /healthz  /livez  /metrics  /v1/admin/stats
//
// One request per connection; accepted sockets are handed to a fixed pool of
// worker threads so long pipeline steps never block the accept loop.
class HttpServer {
public:
  using TlsConfig = HttpServerTlsConfig;

  static constexpr std::size_t kMaxRequestBytes = 512ull * 1024 * 1024;

  HttpServer(std::string host, int port, NodeRuntime *runtime,
             MetricsRegistry *metrics, TlsConfig tls_config = {},
             int num_workers = 4);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  void Start();
  void Stop();

  // Routes one parsed request. Used by HandleClient and directly by tests.
  HttpReply Dispatch(const std::string &method, const std::string &path,
                     const std::string &body);

private:
  struct ClientSession {
    int fd{-1};
    SSL *ssl{nullptr};
  };

  void Run();
  void WorkerLoop();
  void HandleClient(ClientSession &session);

  HttpReply HandlePipelineStep(const std::string &body);
  HttpReply HandleAuthorize(const std::string &session_id,
                            const std::string &body);
  HttpReply HandleRevoke(const std::string &session_id);

  bool SendAll(ClientSession &session, const std::string &payload);
  ssize_t Receive(ClientSession &session, char *buffer, std::size_t length);
  void CloseSession(ClientSession &session);

  std::string host_;
  int port_;
  NodeRuntime *runtime_;
  MetricsRegistry *metrics_;
  bool tls_enabled_{false};
  SSL_CTX *ssl_ctx_{nullptr};
  std::atomic<bool> running_{false};
  std::atomic<int> server_fd_{-1};
  int num_workers_;
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::queue<ClientSession> client_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
};

} // namespace blockpipe
