#pragma once

#include <map>
#include <string>

#include <openssl/ssl.h>

namespace blockpipe {

struct HttpResponse {
  int status{0};
  std::string body;
};

struct HttpClientOptions {
  double connect_timeout_s{30.0};
  // Upper bound on waiting for response bytes; sized for a downstream node
  // running the rest of a large model.
  double response_timeout_s{1200.0};
};

// Blocking HTTP/1.1 client, one connection per request. https URLs use
// OpenSSL with peer verification. Transport failures throw
// std::runtime_error; HTTP error statuses are returned, not thrown.
class HttpClient {
public:
  explicit HttpClient(HttpClientOptions options = {});
  ~HttpClient();
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  HttpResponse
  Get(const std::string &url,
      const std::map<std::string, std::string> &headers = {}) const;
  HttpResponse
  Post(const std::string &url, const std::string &body,
       const std::map<std::string, std::string> &headers = {}) const;
  HttpResponse
  Delete(const std::string &url,
         const std::map<std::string, std::string> &headers = {}) const;

  const HttpClientOptions &options() const { return options_; }

private:
  HttpResponse Send(const std::string &method, const std::string &url,
                    const std::string &body,
                    const std::map<std::string, std::string> &headers) const;

  HttpClientOptions options_;
  SSL_CTX *ssl_ctx_{nullptr};
  bool tls_ready_{false};
};

} // namespace blockpipe
