#include "net/node_forwarder.h"

#include "runtime/errors.h"
#include "runtime/tensors/tensor_codec.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <chrono>

using json = nlohmann::json;

namespace blockpipe {

json BuildStepRequest(const ForwardRequest &request) {
  json tensors = TensorCodec::EncodeMap(request.tensors);
  if (request.passthrough.is_object()) {
    for (auto it = request.passthrough.begin();
         it != request.passthrough.end(); ++it) {
      if (!tensors.contains(it.key())) {
        tensors[it.key()] = it.value();
      }
    }
  }
  return {{"session_id", request.session_id},
          {"step", request.step},
          {"target_block_id", request.target_block_id},
          {"input_tensors", tensors}};
}

json ForwardingErrorPayload(const ForwardRequest &request,
                            const std::string &target_uri,
                            const std::string &details,
                            const std::string &exception_class) {
  return {{"status", "error"},
          {"error_type", ErrorKindName(ErrorKind::kForwarding)},
          {"session_id", request.session_id},
          {"step", request.step},
          {"message", "Failed to forward to " + target_uri + ": " + details},
          {"error_details_at_forwarder_node", details},
          {"error_target_next_node_uri", target_uri},
          {"error_target_block_id", request.target_block_id},
          {"exception_class_name", exception_class}};
}

HttpNodeForwarder::HttpNodeForwarder(HttpClientOptions options)
    : client_(options) {}

std::string HttpNodeForwarder::StepUrl(const NodeEndpoint &next) {
  return next.BaseUrl() + "/v1/pipeline/step";
}

json HttpNodeForwarder::Forward(const NodeEndpoint &next,
                                const ForwardRequest &request) {
  const std::string url = StepUrl(next);
  const auto start = std::chrono::steady_clock::now();
  log::Info("forwarder",
            "forwarding " + request.session_id + " step " +
                std::to_string(request.step) + " to " + next.node_id,
            request.target_block_id);

  HttpResponse response;
  try {
    response = client_.Post(url, BuildStepRequest(request).dump());
  } catch (const std::runtime_error &ex) {
    GlobalMetrics().RecordForward(false, 0.0);
    throw ForwardingError(ex.what());
  }
  const double elapsed = std::chrono::duration<double>(
                             std::chrono::steady_clock::now() - start)
                             .count();

  json reply = json::parse(response.body, nullptr, false);
  if (reply.is_discarded() || !reply.is_object()) {
    GlobalMetrics().RecordForward(false, elapsed);
    throw ForwardingError("next node returned HTTP " +
                          std::to_string(response.status) +
                          " with a non-JSON body");
  }
  const bool ok = response.status >= 200 && response.status < 300 &&
                  reply.value("status", "") == "success";
  GlobalMetrics().RecordForward(ok, elapsed);
  if (!ok) {
    log::Warn("forwarder", "next node " + next.node_id + " reported an error",
              reply.value("message", ""));
  }
  return reply;
}

} // namespace blockpipe
