#include "server/http/http_server.h"

#include "runtime/errors.h"
#include "scheduler/pipeline_executor.h"
#include "server/logging/logger.h"
#include "server/node_runtime.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include <openssl/err.h>

using json = nlohmann::json;

namespace blockpipe {

namespace {

const char *kStepPath = "/v1/pipeline/step";
const char *kSessionsPrefix = "/v1/sessions/";

std::string BuildResponse(const HttpReply &reply) {
  std::string headers = "HTTP/1.1 " + std::to_string(reply.status) + " " +
                        reply.status_text + "\r\n";
  headers += "Content-Type: " + reply.content_type + "\r\n";
  headers += "Connection: close\r\n";
  headers += "Content-Length: " + std::to_string(reply.body.size()) +
             "\r\n\r\n";
  return headers + reply.body;
}

HttpReply JsonReply(const json &body, int status = 200,
                    const std::string &status_text = "OK") {
  HttpReply reply;
  reply.status = status;
  reply.status_text = status_text;
  reply.body = body.dump();
  return reply;
}

HttpReply ErrorReply(int status, const std::string &status_text,
                     const std::string &message,
                     const std::string &error_type) {
  return JsonReply({{"status", "error"},
                    {"message", message},
                    {"error_type", error_type}},
                   status, status_text);
}

// Case-insensitive lookup of Content-Length in the raw header block.
// Returns false when the header is present but not a number.
bool ParseContentLength(const std::string &headers, std::size_t *length) {
  *length = 0;
  std::string lowered(headers);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  auto pos = lowered.find("\r\ncontent-length:");
  if (pos == std::string::npos) {
    return true;
  }
  pos += 17;
  auto end = lowered.find("\r\n", pos);
  std::string value = lowered.substr(pos, end == std::string::npos
                                              ? std::string::npos
                                              : end - pos);
  value.erase(0, value.find_first_not_of(" \t"));
  if (value.empty() ||
      value.find_first_not_of("0123456789 \t") != std::string::npos) {
    return false;
  }
  try {
    *length = std::stoull(value);
  } catch (const std::out_of_range &) {
    return false;
  }
  return true;
}

} // namespace

HttpServer::HttpServer(std::string host, int port, NodeRuntime *runtime,
                       MetricsRegistry *metrics, TlsConfig tls_config,
                       int num_workers)
    : host_(std::move(host)), port_(port), runtime_(runtime),
      metrics_(metrics), num_workers_(num_workers > 0 ? num_workers : 4) {
  if (!tls_config.enabled) {
    return;
  }
  if (tls_config.cert_path.empty() || tls_config.key_path.empty()) {
    log::Warn("http", "TLS enabled without cert/key; falling back to HTTP");
    return;
  }
  SSL_load_error_strings();
  OpenSSL_add_ssl_algorithms();
  ssl_ctx_ = SSL_CTX_new(TLS_server_method());
  if (!ssl_ctx_) {
    log::Error("http", "failed to initialize TLS context");
    return;
  }
  SSL_CTX_set_ecdh_auto(ssl_ctx_, 1);
  if (SSL_CTX_use_certificate_file(ssl_ctx_, tls_config.cert_path.c_str(),
                                   SSL_FILETYPE_PEM) <= 0) {
    log::Error("http", "failed to load TLS certificate", tls_config.cert_path);
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  } else if (SSL_CTX_use_PrivateKey_file(ssl_ctx_, tls_config.key_path.c_str(),
                                         SSL_FILETYPE_PEM) <= 0) {
    log::Error("http", "failed to load TLS key", tls_config.key_path);
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  } else {
    tls_enabled_ = true;
    log::Info("http", "TLS enabled", "cert=" + tls_config.cert_path);
  }
}

HttpServer::~HttpServer() {
  Stop();
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

void HttpServer::Start() {
  if (running_) {
    return;
  }
  running_ = true;
  for (int i = 0; i < num_workers_; ++i) {
    workers_.emplace_back(&HttpServer::WorkerLoop, this);
  }
  accept_thread_ = std::thread(&HttpServer::Run, this);
}

void HttpServer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  // Closing the listening socket unblocks accept() in Run().
  int fd = server_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  queue_cv_.notify_all();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  for (auto &w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!client_queue_.empty()) {
    auto session = client_queue_.front();
    client_queue_.pop();
    CloseSession(session);
  }
}

void HttpServer::WorkerLoop() {
  while (true) {
    ClientSession session;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock,
                     [this] { return !client_queue_.empty() || !running_; });
      if (!running_ && client_queue_.empty()) {
        return;
      }
      session = client_queue_.front();
      client_queue_.pop();
    }
    if (session.fd >= 0) {
      HandleClient(session);
      CloseSession(session);
    }
  }
}

void HttpServer::Run() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    log::Error("http", "socket() failed", std::strerror(errno));
    return;
  }

  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port_));
  addr.sin_addr.s_addr = inet_addr(host_.c_str());

  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    log::Error("http", "bind failed",
               host_ + ":" + std::to_string(port_) + " " +
                   std::strerror(errno));
    ::close(fd);
    return;
  }
  if (::listen(fd, 128) < 0) {
    log::Error("http", "listen failed", std::strerror(errno));
    ::close(fd);
    return;
  }
  server_fd_.store(fd);
  log::Info("http", "listening", host_ + ":" + std::to_string(port_));

  while (running_) {
    sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd =
        ::accept(fd, reinterpret_cast<sockaddr *>(&client_addr), &client_len);
    if (client_fd < 0) {
      break;
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    ClientSession session;
    session.fd = client_fd;
    if (tls_enabled_) {
      SSL *ssl = SSL_new(ssl_ctx_);
      if (!ssl) {
        ::close(client_fd);
        continue;
      }
      SSL_set_fd(ssl, client_fd);
      if (SSL_accept(ssl) != 1) {
        SSL_free(ssl);
        ::close(client_fd);
        continue;
      }
      session.ssl = ssl;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      client_queue_.push(session);
    }
    queue_cv_.notify_one();
  }

  int expected = fd;
  if (server_fd_.compare_exchange_strong(expected, -1)) {
    ::close(fd);
  }
}

void HttpServer::HandleClient(ClientSession &session) {
  struct ConnectionGuard {
    MetricsRegistry *metrics;
    ~ConnectionGuard() {
      if (metrics) {
        metrics->DecrementConnections();
      }
    }
  } guard{metrics_};
  if (metrics_) {
    metrics_->IncrementConnections();
  }

  constexpr std::size_t kInitialBuf = 4096;
  constexpr std::size_t kMaxHeaderBytes = 64 * 1024;
  std::string request;
  request.resize(kInitialBuf);
  std::size_t total = 0;
  std::size_t header_end_pos = std::string::npos;

  // Phase 1: headers.
  while (header_end_pos == std::string::npos) {
    if (total >= kMaxHeaderBytes) {
      SendAll(session, BuildResponse(ErrorReply(431, "Header Too Large",
                                                "request headers too large",
                                                "format_error")));
      return;
    }
    if (total >= request.size()) {
      request.resize(request.size() * 2);
    }
    ssize_t bytes = Receive(session, &request[total], request.size() - total);
    if (bytes <= 0) {
      return;
    }
    total += static_cast<std::size_t>(bytes);
    header_end_pos = std::string(request, 0, total).find("\r\n\r\n");
  }

  // Phase 2: body by Content-Length.
  std::string headers = request.substr(0, header_end_pos);
  std::size_t content_length = 0;
  if (!ParseContentLength(headers, &content_length)) {
    SendAll(session, BuildResponse(ErrorReply(400, "Bad Request",
                                              "invalid Content-Length",
                                              "format_error")));
    return;
  }
  if (content_length > kMaxRequestBytes) {
    SendAll(session, BuildResponse(ErrorReply(413, "Payload Too Large",
                                              "request_too_large",
                                              "format_error")));
    return;
  }
  const std::size_t body_start = header_end_pos + 4;
  const std::size_t needed = body_start + content_length;
  if (needed > request.size()) {
    request.resize(needed);
  }
  while (total < needed) {
    ssize_t bytes = Receive(session, &request[total], needed - total);
    if (bytes <= 0) {
      return;
    }
    total += static_cast<std::size_t>(bytes);
  }
  std::string body = request.substr(body_start, content_length);

  auto first_line_end = headers.find("\r\n");
  std::string first_line = headers.substr(0, first_line_end);
  auto method_end = first_line.find(' ');
  auto path_end = first_line.find(' ', method_end + 1);
  if (method_end == std::string::npos || path_end == std::string::npos) {
    SendAll(session, BuildResponse(ErrorReply(400, "Bad Request",
                                              "malformed request line",
                                              "format_error")));
    return;
  }
  std::string method = first_line.substr(0, method_end);
  std::string path =
      first_line.substr(method_end + 1, path_end - method_end - 1);
  auto query = path.find('?');
  if (query != std::string::npos) {
    path.resize(query);
  }

  HttpReply reply;
  try {
    reply = Dispatch(method, path, body);
  } catch (const std::exception &ex) {
    log::Error("http", "request handler raised", path + ": " + ex.what());
    reply = ErrorReply(500, "Internal Server Error", ex.what(),
                       "internal_error");
  }
  if (!SendAll(session, BuildResponse(reply))) {
    log::Debug("http", "client went away before the reply was sent", path);
  }
}

HttpReply HttpServer::Dispatch(const std::string &method,
                               const std::string &path,
                               const std::string &body) {
  if (path == "/livez") {
    return JsonReply({{"status", "ok"}});
  }
  if (path == "/healthz") {
    if (!runtime_) {
      return ErrorReply(503, "Service Unavailable", "runtime not ready",
                        "config_error");
    }
    return JsonReply(runtime_->HealthJson(), runtime_->Ready() ? 200 : 503,
                     runtime_->Ready() ? "OK" : "Service Unavailable");
  }
  if (path == "/metrics" && method == "GET") {
    HttpReply reply;
    reply.content_type = "text/plain; version=0.0.4";
    reply.body = metrics_ ? metrics_->RenderPrometheus() : std::string();
    return reply;
  }
  if (!runtime_) {
    return ErrorReply(503, "Service Unavailable", "runtime not ready",
                      "config_error");
  }
  if (path == "/v1/admin/stats" && method == "GET") {
    return JsonReply(runtime_->StatsJson());
  }
  if (path == kStepPath) {
    if (method != "POST") {
      return ErrorReply(405, "Method Not Allowed", "use POST", "format_error");
    }
    return HandlePipelineStep(body);
  }
  if (path.compare(0, std::strlen(kSessionsPrefix), kSessionsPrefix) == 0) {
    std::string rest = path.substr(std::strlen(kSessionsPrefix));
    const std::string suffix = "/authorize";
    if (method == "POST" && rest.size() > suffix.size() &&
        rest.compare(rest.size() - suffix.size(), suffix.size(), suffix) ==
            0) {
      return HandleAuthorize(rest.substr(0, rest.size() - suffix.size()),
                             body);
    }
    if (method == "DELETE" && !rest.empty() &&
        rest.find('/') == std::string::npos) {
      return HandleRevoke(rest);
    }
  }
  return ErrorReply(404, "Not Found", "not_found", "not_found");
}

HttpReply HttpServer::HandlePipelineStep(const std::string &body) {
  json payload;
  try {
    payload = json::parse(body);
  } catch (const json::parse_error &ex) {
    return ErrorReply(400, "Bad Request",
                      std::string("Invalid JSON: ") + ex.what(),
                      "json_decode_error");
  }

  StepRequest request;
  try {
    request = ParseStepRequest(payload);
  } catch (const PipelineError &ex) {
    json err = {{"status", "error"},
                {"message", ex.what()},
                {"error_type", ex.kind_name()}};
    if (payload.is_object() && payload.contains("session_id")) {
      err["session_id"] = payload["session_id"];
    }
    return JsonReply(err, 400, "Bad Request");
  }

  json result;
  try {
    result = runtime_->RunStep(request);
  } catch (const LicenseError &ex) {
    log::Warn("license", "step rejected", request.session_id + ": " +
                                              ex.what());
    json err = {{"status", "error"},
                {"message", ex.what()},
                {"error_type", ex.kind_name()},
                {"session_id", request.session_id},
                {"step", request.step}};
    return JsonReply(err, 403, "Forbidden");
  } catch (const std::exception &ex) {
    log::Error("http", "pipeline step raised", request.session_id + ": " +
                                                   ex.what());
    json err = {{"status", "error"},
                {"message", ex.what()},
                {"error_type", "internal_error"},
                {"session_id", request.session_id},
                {"step", request.step}};
    return JsonReply(err, 500, "Internal Server Error");
  }
  const bool ok = result.value("status", std::string()) == "success";
  return JsonReply(result, ok ? 200 : 500,
                   ok ? "OK" : "Internal Server Error");
}

HttpReply HttpServer::HandleAuthorize(const std::string &session_id,
                                      const std::string &body) {
  json payload;
  try {
    payload = body.empty() ? json::object() : json::parse(body);
  } catch (const json::parse_error &ex) {
    return ErrorReply(400, "Bad Request",
                      std::string("Invalid JSON: ") + ex.what(),
                      "json_decode_error");
  }
  std::string key;
  if (payload.is_object() && payload.contains("license_key") &&
      payload["license_key"].is_string()) {
    key = payload["license_key"].get<std::string>();
  }
  if (!runtime_->AuthorizeSession(session_id, key)) {
    json err = {{"status", "error"},
                {"message", "License validation failed for " + session_id},
                {"error_type", "license_error"},
                {"session_id", session_id}};
    return JsonReply(err, 403, "Forbidden");
  }
  return JsonReply({{"status", "authorized"}, {"session_id", session_id}});
}

HttpReply HttpServer::HandleRevoke(const std::string &session_id) {
  const bool was_authorized = runtime_->RevokeSession(session_id);
  return JsonReply({{"status", "revoked"},
                    {"session_id", session_id},
                    {"was_authorized", was_authorized}});
}

bool HttpServer::SendAll(ClientSession &session, const std::string &payload) {
  const char *data = payload.c_str();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    int sent = 0;
    if (session.ssl) {
      sent = SSL_write(session.ssl, data,
                       static_cast<int>(std::min<std::size_t>(
                           remaining, 1u << 30)));
      if (sent <= 0) {
        int err = SSL_get_error(session.ssl, sent);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
          continue;
        }
        return false;
      }
    } else {
      ssize_t n = ::send(session.fd, data, remaining, MSG_NOSIGNAL);
      if (n <= 0) {
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
      sent = static_cast<int>(n);
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

ssize_t HttpServer::Receive(ClientSession &session, char *buffer,
                            std::size_t length) {
  if (session.ssl) {
    while (true) {
      int received = SSL_read(
          session.ssl, buffer,
          static_cast<int>(std::min<std::size_t>(length, 1u << 30)));
      if (received > 0) {
        return received;
      }
      int err = SSL_get_error(session.ssl, received);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      return -1;
    }
  }
  while (true) {
    ssize_t received = ::recv(session.fd, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

void HttpServer::CloseSession(ClientSession &session) {
  if (session.ssl) {
    SSL_shutdown(session.ssl);
    SSL_free(session.ssl);
    session.ssl = nullptr;
  }
  if (session.fd >= 0) {
    ::close(session.fd);
    session.fd = -1;
  }
}

} // namespace blockpipe
