#include "runtime/backends/onnx/onnx_session.h"

#include "runtime/errors.h"
#include "server/logging/logger.h"

#include <cstring>
#include <stdexcept>

namespace blockpipe {

namespace {

ONNXTensorElementDataType ToOnnxType(DType dtype) {
  switch (dtype) {
  case DType::kFloat16:
    return ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16;
  case DType::kFloat32:
    return ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT;
  case DType::kFloat64:
    return ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE;
  case DType::kInt8:
    return ONNX_TENSOR_ELEMENT_DATA_TYPE_INT8;
  case DType::kInt16:
    return ONNX_TENSOR_ELEMENT_DATA_TYPE_INT16;
  case DType::kInt32:
    return ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32;
  case DType::kInt64:
    return ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64;
  case DType::kUInt8:
    return ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT8;
  case DType::kBool:
    return ONNX_TENSOR_ELEMENT_DATA_TYPE_BOOL;
  case DType::kUnknown:
    break;
  }
  return ONNX_TENSOR_ELEMENT_DATA_TYPE_UNDEFINED;
}

DType FromOnnxType(ONNXTensorElementDataType type) {
  switch (type) {
  case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16:
    return DType::kFloat16;
  case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:
    return DType::kFloat32;
  case ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE:
    return DType::kFloat64;
  case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT8:
    return DType::kInt8;
  case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT16:
    return DType::kInt16;
  case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32:
    return DType::kInt32;
  case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64:
    return DType::kInt64;
  case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT8:
    return DType::kUInt8;
  case ONNX_TENSOR_ELEMENT_DATA_TYPE_BOOL:
    return DType::kBool;
  default:
    break;
  }
  return DType::kUnknown;
}

Ort::Value WrapTensor(const Ort::MemoryInfo &memory_info,
                      const Tensor &tensor) {
  // ORT never writes through input buffers.
  return Ort::Value::CreateTensor(
      memory_info, const_cast<std::uint8_t *>(tensor.data.data()),
      tensor.data.size(), tensor.shape.data(), tensor.shape.size(),
      ToOnnxType(tensor.dtype));
}

TensorSpec DescribeTypeInfo(const std::string &name,
                            const Ort::TypeInfo &type_info) {
  TensorSpec spec;
  spec.name = name;
  auto shape_info = type_info.GetTensorTypeAndShapeInfo();
  spec.dtype = FromOnnxType(shape_info.GetElementType());
  spec.shape = shape_info.GetShape();
  std::vector<const char *> symbols(spec.shape.size(), nullptr);
  shape_info.GetSymbolicDimensions(symbols.data(), symbols.size());
  for (const char *symbol : symbols) {
    spec.dim_names.emplace_back(symbol ? symbol : "");
  }
  return spec;
}

} // namespace

OnnxSession::OnnxSession(std::unique_ptr<Ort::Session> session,
                         std::vector<Ort::Value> initializer_values)
    : initializer_values_(std::move(initializer_values)),
      session_(std::move(session)) {
  ExtractIOSpecs();
}

OnnxSession::~OnnxSession() { session_.reset(); }

void OnnxSession::ExtractIOSpecs() {
  Ort::AllocatorWithDefaultOptions allocator;
  for (std::size_t i = 0; i < session_->GetInputCount(); ++i) {
    auto name = session_->GetInputNameAllocated(i, allocator);
    inputs_.push_back(DescribeTypeInfo(name.get(), session_->GetInputTypeInfo(i)));
  }
  for (std::size_t i = 0; i < session_->GetOutputCount(); ++i) {
    auto name = session_->GetOutputNameAllocated(i, allocator);
    outputs_.push_back(
        DescribeTypeInfo(name.get(), session_->GetOutputTypeInfo(i)));
  }
}

std::vector<Tensor>
OnnxSession::Run(const TensorMap &inputs,
                 const std::vector<std::string> &output_names) {
  Ort::MemoryInfo memory_info =
      Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

  std::vector<const char *> input_names;
  std::vector<Ort::Value> input_values;
  for (const auto &spec : inputs_) {
    auto it = inputs.find(spec.name);
    if (it == inputs.end()) {
      throw std::runtime_error("missing required input '" + spec.name + "'");
    }
    input_names.push_back(spec.name.c_str());
    input_values.push_back(WrapTensor(memory_info, it->second));
  }

  std::vector<const char *> out_names;
  if (output_names.empty()) {
    for (const auto &spec : outputs_) {
      out_names.push_back(spec.name.c_str());
    }
  } else {
    for (const auto &name : output_names) {
      out_names.push_back(name.c_str());
    }
  }

  std::vector<Ort::Value> results;
  try {
    results = session_->Run(Ort::RunOptions{nullptr}, input_names.data(),
                            input_values.data(), input_values.size(),
                            out_names.data(), out_names.size());
  } catch (const Ort::Exception &ex) {
    throw std::runtime_error(std::string("onnxruntime run failed: ") +
                             ex.what());
  }

  std::vector<Tensor> outputs;
  outputs.reserve(results.size());
  for (auto &value : results) {
    auto info = value.GetTensorTypeAndShapeInfo();
    Tensor t;
    t.dtype = FromOnnxType(info.GetElementType());
    t.shape = info.GetShape();
    std::size_t bytes = info.GetElementCount() * DTypeSize(t.dtype);
    t.data.resize(bytes);
    if (bytes > 0) {
      std::memcpy(t.data.data(), value.GetTensorMutableData<std::uint8_t>(),
                  bytes);
    }
    outputs.push_back(std::move(t));
  }
  return outputs;
}

OnnxSessionBackend::OnnxSessionBackend()
    : env_(ORT_LOGGING_LEVEL_WARNING, "blockpipe") {}

Ort::SessionOptions
OnnxSessionBackend::BuildOptions(const SessionOptions &options) const {
  Ort::SessionOptions opts;
  if (options.intra_op_threads > 0) {
    opts.SetIntraOpNumThreads(options.intra_op_threads);
  }
  switch (options.optimization) {
  case GraphOptimization::kDisabled:
    opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_DISABLE_ALL);
    break;
  case GraphOptimization::kBasic:
    opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_BASIC);
    break;
  case GraphOptimization::kAll:
    opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
    break;
  }
  if (options.low_memory) {
    opts.DisableCpuMemArena();
    opts.DisableMemPattern();
    opts.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);
  }
  if (options.target == ExecutionTarget::kGpu) {
    try {
      OrtCUDAProviderOptions cuda_options{};
      cuda_options.device_id = 0;
      opts.AppendExecutionProvider_CUDA(cuda_options);
    } catch (const Ort::Exception &ex) {
      log::Warn("onnx_backend",
                std::string("CUDA execution provider not available, using "
                            "CPU: ") +
                    ex.what());
    }
  }
  return opts;
}

std::unique_ptr<InferenceSession>
OnnxSessionBackend::Open(const std::filesystem::path &model,
                         const SessionOptions &options) {
  try {
    Ort::SessionOptions opts = BuildOptions(options);
    std::lock_guard<std::mutex> lock(mutex_);
    auto session =
        std::make_unique<Ort::Session>(env_, model.c_str(), opts);
    return std::make_unique<OnnxSession>(std::move(session),
                                         std::vector<Ort::Value>{});
  } catch (const Ort::Exception &ex) {
    throw LoadError("onnxruntime failed to load " + model.string() + ": " +
                    ex.what());
  }
}

std::unique_ptr<InferenceSession> OnnxSessionBackend::OpenWithInitializers(
    const std::filesystem::path &skeleton,
    const std::vector<NamedInitializer> &initializers,
    const SessionOptions &options) {
  try {
    Ort::SessionOptions opts = BuildOptions(options);
    Ort::MemoryInfo memory_info =
        Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    std::vector<Ort::Value> values;
    values.reserve(initializers.size());
    for (const auto &init : initializers) {
      if (!init.tensor) {
        continue;
      }
      values.push_back(WrapTensor(memory_info, *init.tensor));
      opts.AddInitializer(init.name.c_str(), values.back());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto session =
        std::make_unique<Ort::Session>(env_, skeleton.c_str(), opts);
    return std::make_unique<OnnxSession>(std::move(session), std::move(values));
  } catch (const Ort::Exception &ex) {
    throw LoadError("onnxruntime failed to load skeleton " +
                    skeleton.string() + ": " + ex.what());
  }
}

} // namespace blockpipe
