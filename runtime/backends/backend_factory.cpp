#include "runtime/backends/backend_factory.h"

#include "runtime/errors.h"
#include "server/logging/logger.h"

#ifdef BLOCKPIPE_HAS_ONNXRUNTIME
#include "runtime/backends/onnx/onnx_session.h"
#endif

namespace blockpipe {

#ifndef BLOCKPIPE_HAS_ONNXRUNTIME
namespace {

class UnavailableBackend : public SessionBackend {
public:
  std::string Name() const override { return "unavailable"; }

  std::unique_ptr<InferenceSession>
  Open(const std::filesystem::path &model, const SessionOptions &) override {
    throw LoadError("cannot load " + model.string() +
                    ": onnxruntime support not compiled in");
  }

  std::unique_ptr<InferenceSession>
  OpenWithInitializers(const std::filesystem::path &skeleton,
                       const std::vector<NamedInitializer> &,
                       const SessionOptions &) override {
    throw LoadError("cannot load " + skeleton.string() +
                    ": onnxruntime support not compiled in");
  }
};

} // namespace
#endif

std::shared_ptr<SessionBackend> BackendFactory::Create() {
#ifdef BLOCKPIPE_HAS_ONNXRUNTIME
  return std::make_shared<OnnxSessionBackend>();
#else
  log::Warn("backend_factory",
            "binary was built without onnxruntime; block loads will fail");
  return std::make_shared<UnavailableBackend>();
#endif
}

bool BackendFactory::OnnxRuntimeAvailable() {
#ifdef BLOCKPIPE_HAS_ONNXRUNTIME
  return true;
#else
  return false;
#endif
}

} // namespace blockpipe
