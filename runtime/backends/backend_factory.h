#pragma once

#include "runtime/backends/inference_session.h"

#include <memory>
#include <string>

namespace blockpipe {

class BackendFactory {
public:
  // Returns the ONNX Runtime backend when compiled in; otherwise a backend
  // whose every load fails with LoadError.
  static std::shared_ptr<SessionBackend> Create();
  static bool OnnxRuntimeAvailable();
};

} // namespace blockpipe
