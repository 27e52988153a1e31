#pragma once

#include "runtime/backends/inference_session.h"

#include <onnxruntime_cxx_api.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace blockpipe {

class OnnxSession : public InferenceSession {
public:
  OnnxSession(std::unique_ptr<Ort::Session> session,
              std::vector<Ort::Value> initializer_values);
  ~OnnxSession() override;

  OnnxSession(const OnnxSession &) = delete;
  OnnxSession &operator=(const OnnxSession &) = delete;

  const std::vector<TensorSpec> &Inputs() const override { return inputs_; }
  const std::vector<TensorSpec> &Outputs() const override { return outputs_; }

  std::vector<Tensor> Run(const TensorMap &inputs,
                          const std::vector<std::string> &output_names) override;

private:
  void ExtractIOSpecs();

  // Injected weights reference caller-owned buffers and must be released
  // after session_.
  std::vector<Ort::Value> initializer_values_;
  std::unique_ptr<Ort::Session> session_;
  std::vector<TensorSpec> inputs_;
  std::vector<TensorSpec> outputs_;
};

class OnnxSessionBackend : public SessionBackend {
public:
  OnnxSessionBackend();

  std::string Name() const override { return "onnxruntime"; }

  std::unique_ptr<InferenceSession>
  Open(const std::filesystem::path &model,
       const SessionOptions &options) override;

  std::unique_ptr<InferenceSession>
  OpenWithInitializers(const std::filesystem::path &skeleton,
                       const std::vector<NamedInitializer> &initializers,
                       const SessionOptions &options) override;

private:
  Ort::SessionOptions BuildOptions(const SessionOptions &options) const;

  Ort::Env env_;
  std::mutex mutex_;
};

} // namespace blockpipe
