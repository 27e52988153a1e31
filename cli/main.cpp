#include "net/http_client.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace {

void PrintUsage() {
  std::cout
      << "Usage: blockpipectl <command> [options]\n"
         "Commands:\n"
         "  health                         node health summary\n"
         "  stats                          scheduler, cache and worker stats\n"
         "  metrics                        Prometheus metrics text\n"
         "  step --file REQUEST.json       run one pipeline step\n"
         "  authorize --session ID --key KEY\n"
         "  revoke --session ID\n"
         "Options:\n"
         "  --host HOST    node address (default 127.0.0.1, or "
         "BLOCKPIPE_HOST)\n"
         "  --port PORT    node port (default 8700, or BLOCKPIPE_PORT)\n"
         "  --https        connect with TLS\n"
         "  --timeout SEC  response timeout (default 1200)\n"
         "  --compact      print JSON on one line\n";
}

std::string BuildUrl(bool https, const std::string &host, int port,
                     const std::string &path) {
  return std::string(https ? "https://" : "http://") + host + ":" +
         std::to_string(port) + path;
}

std::string ReadFile(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// Prints the response body (pretty when JSON) and maps the status to an exit
// code.
int Report(const blockpipe::HttpResponse &response, bool compact) {
  json parsed = json::parse(response.body, nullptr, false);
  if (parsed.is_discarded()) {
    std::cout << response.body;
    if (!response.body.empty() && response.body.back() != '\n') {
      std::cout << "\n";
    }
  } else {
    std::cout << (compact ? parsed.dump() : parsed.dump(2)) << "\n";
  }
  if (response.status >= 200 && response.status < 300) {
    return 0;
  }
  std::cerr << "blockpipectl: HTTP " << response.status << "\n";
  return 2;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    PrintUsage();
    return 1;
  }
  std::string command = argv[1];
  if (command == "--help" || command == "-h" || command == "help") {
    PrintUsage();
    return 0;
  }

  std::string host = "127.0.0.1";
  int port = 8700;
  bool https = false;
  bool compact = false;
  double timeout_s = 1200.0;
  std::string file;
  std::string session;
  std::string key;
  if (const char *env = std::getenv("BLOCKPIPE_HOST")) {
    host = env;
  }

  try {
    if (const char *env = std::getenv("BLOCKPIPE_PORT")) {
      port = std::stoi(env);
    }
    for (int i = 2; i < argc; ++i) {
      std::string arg = argv[i];
      auto value = [&]() -> std::string {
        if (i + 1 >= argc) {
          throw std::invalid_argument(arg + " requires a value");
        }
        return argv[++i];
      };
      if (arg == "--host" || arg == "-H") {
        host = value();
      } else if (arg == "--port" || arg == "-p") {
        port = std::stoi(value());
      } else if (arg == "--https") {
        https = true;
      } else if (arg == "--compact") {
        compact = true;
      } else if (arg == "--timeout") {
        timeout_s = std::stod(value());
      } else if (arg == "--file" || arg == "-f") {
        file = value();
      } else if (arg == "--session") {
        session = value();
      } else if (arg == "--key") {
        key = value();
      } else {
        throw std::invalid_argument("unknown option " + arg);
      }
    }
  } catch (const std::logic_error &ex) {
    std::cerr << "blockpipectl: " << ex.what() << "\n";
    PrintUsage();
    return 1;
  }

  blockpipe::HttpClientOptions options;
  options.response_timeout_s = timeout_s;
  blockpipe::HttpClient client(options);
  const std::map<std::string, std::string> json_headers = {
      {"Content-Type", "application/json"}};

  try {
    if (command == "health") {
      return Report(client.Get(BuildUrl(https, host, port, "/healthz")),
                    compact);
    }
    if (command == "stats") {
      return Report(client.Get(BuildUrl(https, host, port, "/v1/admin/stats")),
                    compact);
    }
    if (command == "metrics") {
      return Report(client.Get(BuildUrl(https, host, port, "/metrics")),
                    compact);
    }
    if (command == "step") {
      if (file.empty()) {
        std::cerr << "blockpipectl: step requires --file\n";
        return 1;
      }
      std::string body = ReadFile(file);
      json request = json::parse(body, nullptr, false);
      if (request.is_discarded()) {
        std::cerr << "blockpipectl: " << file << " is not valid JSON\n";
        return 1;
      }
      return Report(client.Post(BuildUrl(https, host, port,
                                         "/v1/pipeline/step"),
                                request.dump(), json_headers),
                    compact);
    }
    if (command == "authorize") {
      if (session.empty()) {
        std::cerr << "blockpipectl: authorize requires --session\n";
        return 1;
      }
      json body = {{"license_key", key}};
      return Report(
          client.Post(BuildUrl(https, host, port,
                               "/v1/sessions/" + session + "/authorize"),
                      body.dump(), json_headers),
          compact);
    }
    if (command == "revoke") {
      if (session.empty()) {
        std::cerr << "blockpipectl: revoke requires --session\n";
        return 1;
      }
      return Report(client.Delete(BuildUrl(https, host, port,
                                           "/v1/sessions/" + session)),
                    compact);
    }
  } catch (const std::runtime_error &ex) {
    std::cerr << "blockpipectl: " << ex.what() << "\n";
    return 2;
  }

  std::cerr << "blockpipectl: unknown command " << command << "\n";
  PrintUsage();
  return 1;
}
