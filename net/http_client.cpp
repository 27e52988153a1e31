#include "net/http_client.h"

#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace blockpipe {
namespace {
struct ParsedUrl {
  std::string host;
  std::string path{"/"};
  int port{80};
  bool use_tls{false};
};

ParsedUrl ParseUrl(const std::string &url) {
  ParsedUrl parsed;
  std::string remainder = url;
  auto scheme_pos = url.find("://");
  if (scheme_pos != std::string::npos) {
    const std::string scheme = url.substr(0, scheme_pos);
    if (scheme != "http" && scheme != "https") {
      throw std::runtime_error("unsupported URL scheme '" + scheme + "'");
    }
    parsed.use_tls = scheme == "https";
    remainder = url.substr(scheme_pos + 3);
  }
  parsed.port = parsed.use_tls ? 443 : 80;

  auto slash = remainder.find('/');
  std::string host_port =
      slash == std::string::npos ? remainder : remainder.substr(0, slash);
  parsed.path = slash == std::string::npos ? "/" : remainder.substr(slash);

  auto colon = host_port.find(':');
  if (colon == std::string::npos) {
    parsed.host = host_port;
  } else {
    parsed.host = host_port.substr(0, colon);
    try {
      parsed.port = std::stoi(host_port.substr(colon + 1));
    } catch (const std::exception &) {
      throw std::runtime_error("invalid URL port in " + url);
    }
  }
  if (parsed.host.empty()) {
    throw std::runtime_error("invalid URL host");
  }
  return parsed;
}

timeval ToTimeval(double seconds) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(seconds);
  tv.tv_usec = static_cast<suseconds_t>((seconds - tv.tv_sec) * 1e6);
  return tv;
}

// Non-blocking connect bounded by `timeout_s`.
bool ConnectWithTimeout(int sock, const sockaddr *addr, socklen_t len,
                        double timeout_s) {
  int flags = fcntl(sock, F_GETFL, 0);
  fcntl(sock, F_SETFL, flags | O_NONBLOCK);
  int rc = ::connect(sock, addr, len);
  if (rc != 0 && errno != EINPROGRESS) {
    return false;
  }
  if (rc != 0) {
    pollfd pfd{sock, POLLOUT, 0};
    if (::poll(&pfd, 1, static_cast<int>(timeout_s * 1000)) <= 0) {
      return false;
    }
    int err = 0;
    socklen_t err_len = sizeof(err);
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &err, &err_len) != 0 ||
        err != 0) {
      return false;
    }
  }
  fcntl(sock, F_SETFL, flags);
  return true;
}

int CreateSocket(const ParsedUrl &parsed, const HttpClientOptions &options) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  if (getaddrinfo(parsed.host.c_str(), std::to_string(parsed.port).c_str(),
                  &hints, &result) != 0) {
    throw std::runtime_error("failed to resolve host " + parsed.host);
  }
  int sock = -1;
  for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
    sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock == -1)
      continue;
    if (ConnectWithTimeout(sock, rp->ai_addr, rp->ai_addrlen,
                           options.connect_timeout_s))
      break;
    ::close(sock);
    sock = -1;
  }
  freeaddrinfo(result);
  if (sock == -1)
    throw std::runtime_error("failed to connect to " + parsed.host + ":" +
                             std::to_string(parsed.port));
  timeval rcv = ToTimeval(options.response_timeout_s);
  timeval snd = ToTimeval(options.connect_timeout_s);
  setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &rcv, sizeof(rcv));
  setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &snd, sizeof(snd));
  return sock;
}

std::string BuildRequest(const ParsedUrl &parsed, const std::string &method,
                         const std::string &body,
                         const std::map<std::string, std::string> &headers) {
  std::ostringstream request;
  request << method << " " << parsed.path << " HTTP/1.1\r\n";
  request << "Host: " << parsed.host << ":" << parsed.port << "\r\n";
  request << "Content-Length: " << body.size() << "\r\n";
  request << "Content-Type: application/json\r\n";
  for (const auto &[key, value] : headers) {
    request << key << ": " << value << "\r\n";
  }
  request << "Connection: close\r\n\r\n";
  request << body;
  return request.str();
}

HttpResponse ParseResponse(const std::string &raw) {
  HttpResponse out;
  auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    throw std::runtime_error("malformed HTTP response");
  }
  const std::string header = raw.substr(0, header_end);
  out.body = raw.substr(header_end + 4);
  auto status_pos = header.find(' ');
  if (status_pos == std::string::npos ||
      status_pos + 4 > header.size() ||
      !std::isdigit(static_cast<unsigned char>(header[status_pos + 1]))) {
    throw std::runtime_error("malformed HTTP status line");
  }
  out.status = std::stoi(header.substr(status_pos + 1, 3));
  return out;
}
} // namespace

HttpClient::HttpClient(HttpClientOptions options)
    : options_(options) {
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_) {
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
    tls_ready_ = true;
  }
}

HttpClient::~HttpClient() {
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

HttpResponse
HttpClient::Get(const std::string &url,
                const std::map<std::string, std::string> &headers) const {
  return Send("GET", url, "", headers);
}

HttpResponse
HttpClient::Post(const std::string &url, const std::string &body,
                 const std::map<std::string, std::string> &headers) const {
  return Send("POST", url, body, headers);
}

HttpResponse
HttpClient::Delete(const std::string &url,
                   const std::map<std::string, std::string> &headers) const {
  return Send("DELETE", url, "", headers);
}

HttpResponse
HttpClient::Send(const std::string &method, const std::string &url,
                 const std::string &body,
                 const std::map<std::string, std::string> &headers) const {
  auto parsed = ParseUrl(url);
  int sock = CreateSocket(parsed, options_);
  auto payload = BuildRequest(parsed, method, body, headers);
  std::string response;

  auto close_socket = [&]() {
    if (sock != -1) {
      ::close(sock);
      sock = -1;
    }
  };

  if (parsed.use_tls) {
    if (!tls_ready_) {
      close_socket();
      throw std::runtime_error("TLS not available in HttpClient");
    }
    SSL *ssl = SSL_new(ssl_ctx_);
    if (!ssl) {
      close_socket();
      throw std::runtime_error("failed to allocate TLS context");
    }
    auto fail = [&](const char *message) {
      SSL_free(ssl);
      close_socket();
      throw std::runtime_error(message);
    };
    SSL_set_tlsext_host_name(ssl, parsed.host.c_str());
    SSL_set1_host(ssl, parsed.host.c_str());
    SSL_set_fd(ssl, sock);
    if (SSL_connect(ssl) != 1) {
      fail("TLS handshake failed");
    }
    if (SSL_get_verify_result(ssl) != X509_V_OK) {
      fail("TLS certificate verification failed");
    }
    const char *send_ptr = payload.c_str();
    std::size_t send_remaining = payload.size();
    while (send_remaining > 0) {
      int sent = SSL_write(ssl, send_ptr, static_cast<int>(send_remaining));
      if (sent <= 0) {
        fail("failed to send TLS request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
    }
    char buffer[16384];
    int read_bytes = 0;
    while ((read_bytes = SSL_read(ssl, buffer, sizeof(buffer))) > 0) {
      response.append(buffer, buffer + read_bytes);
    }
    SSL_shutdown(ssl);
    SSL_free(ssl);
  } else {
    const char *send_ptr = payload.c_str();
    std::size_t send_remaining = payload.size();
    while (send_remaining > 0) {
      ssize_t sent = ::send(sock, send_ptr, send_remaining, MSG_NOSIGNAL);
      if (sent <= 0) {
        close_socket();
        throw std::runtime_error("failed to send request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
    }
    char buffer[16384];
    while (true) {
      ssize_t read_bytes = ::recv(sock, buffer, sizeof(buffer), 0);
      if (read_bytes > 0) {
        response.append(buffer, buffer + read_bytes);
        continue;
      }
      if (read_bytes < 0 && errno == EINTR) {
        continue;
      }
      if (read_bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        close_socket();
        throw std::runtime_error("timed out waiting for response from " +
                                 parsed.host);
      }
      break;
    }
  }

  close_socket();
  if (response.empty()) {
    throw std::runtime_error("empty response from " + parsed.host);
  }
  return ParseResponse(response);
}

} // namespace blockpipe
