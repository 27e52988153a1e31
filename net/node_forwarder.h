#pragma once

#include "model/network_config.h"
#include "net/http_client.h"
#include "runtime/tensors/tensor.h"

#include <nlohmann/json.hpp>

#include <string>

namespace blockpipe {

struct ForwardRequest {
  std::string session_id;
  int step{0};
  std::string target_block_id;
  TensorMap tensors;
  // Plain JSON values carried next to the tensors.
  nlohmann::json passthrough = nlohmann::json::object();
};

// Wire form of a pipeline step request:
//   {"session_id", "step", "target_block_id", "input_tensors": {...}}
nlohmann::json BuildStepRequest(const ForwardRequest &request);

// Error payload returned to the caller when the next node cannot be reached
// or its reply cannot be read.
nlohmann::json ForwardingErrorPayload(const ForwardRequest &request,
                                      const std::string &target_uri,
                                      const std::string &details,
                                      const std::string &exception_class);

// Hands the remainder of a step to the node owning the next block.
class NodeForwarder {
public:
  virtual ~NodeForwarder() = default;

  // Returns the downstream node's response untouched, including error
  // responses. Throws ForwardingError when no usable response arrives.
  virtual nlohmann::json Forward(const NodeEndpoint &next,
                                 const ForwardRequest &request) = 0;
};

// POSTs to <next>/v1/pipeline/step.
class HttpNodeForwarder : public NodeForwarder {
public:
  explicit HttpNodeForwarder(HttpClientOptions options = {});

  nlohmann::json Forward(const NodeEndpoint &next,
                         const ForwardRequest &request) override;

  static std::string StepUrl(const NodeEndpoint &next);

private:
  HttpClient client_;
};

} // namespace blockpipe
