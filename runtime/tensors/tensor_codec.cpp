#include "runtime/tensors/tensor_codec.h"

#include "runtime/errors.h"

#include <openssl/evp.h>

#include <cctype>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace blockpipe {

namespace {
constexpr const char *kTensorMarker = "_tensor_";
} // namespace

std::string TensorCodec::Base64Encode(const std::uint8_t *data,
                                      std::size_t len) {
  if (len == 0) {
    return {};
  }
  std::string out(4 * ((len + 2) / 3), '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                data, static_cast<int>(len));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::vector<std::uint8_t> TensorCodec::Base64Decode(const std::string &text) {
  std::string clean;
  clean.reserve(text.size());
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      clean.push_back(c);
    }
  }
  if (clean.empty()) {
    return {};
  }
  if (clean.size() % 4 != 0) {
    throw FormatError("base64 payload length is not a multiple of 4");
  }
  std::vector<std::uint8_t> out(3 * clean.size() / 4);
  int decoded =
      EVP_DecodeBlock(out.data(),
                      reinterpret_cast<const unsigned char *>(clean.data()),
                      static_cast<int>(clean.size()));
  if (decoded < 0) {
    throw FormatError("invalid base64 payload");
  }
  // EVP_DecodeBlock counts '=' padding as zero bytes.
  std::size_t padding = 0;
  if (clean[clean.size() - 1] == '=') {
    ++padding;
    if (clean[clean.size() - 2] == '=') {
      ++padding;
    }
  }
  out.resize(static_cast<std::size_t>(decoded) - padding);
  return out;
}

bool TensorCodec::IsEncodedTensor(const json &value) {
  if (!value.is_object()) {
    return false;
  }
  auto it = value.find(kTensorMarker);
  return it != value.end() && it->is_boolean() && it->get<bool>();
}

json TensorCodec::Encode(const Tensor &tensor) {
  json out;
  out[kTensorMarker] = true;
  out["dtype"] = DTypeName(tensor.dtype);
  out["shape"] = tensor.shape;
  out["data_b64"] = Base64Encode(tensor.data.data(), tensor.data.size());
  return out;
}

Tensor TensorCodec::Decode(const json &encoded) {
  if (!IsEncodedTensor(encoded)) {
    throw FormatError("value is not an encoded tensor");
  }
  if (!encoded.contains("dtype") || !encoded["dtype"].is_string()) {
    throw FormatError("encoded tensor is missing dtype");
  }
  if (!encoded.contains("shape") || !encoded["shape"].is_array()) {
    throw FormatError("encoded tensor is missing shape");
  }
  if (!encoded.contains("data_b64") || !encoded["data_b64"].is_string()) {
    throw FormatError("encoded tensor is missing data_b64");
  }

  Tensor tensor;
  tensor.dtype = ParseDType(encoded["dtype"].get<std::string>());
  if (tensor.dtype == DType::kUnknown) {
    throw FormatError("unsupported dtype '" +
                      encoded["dtype"].get<std::string>() + "'");
  }
  for (const auto &dim : encoded["shape"]) {
    if (!dim.is_number_integer() || dim.get<int64_t>() < 0) {
      throw FormatError("invalid shape entry " + dim.dump());
    }
    tensor.shape.push_back(dim.get<int64_t>());
  }
  std::size_t elements = 0;
  try {
    elements = NumElements(tensor.shape);
  } catch (const std::overflow_error &) {
    throw FormatError("tensor shape " + ShapeString(tensor.shape) +
                      " is too large");
  }
  const std::size_t width = DTypeSize(tensor.dtype);
  if (elements > std::numeric_limits<std::size_t>::max() / width) {
    throw FormatError("tensor shape " + ShapeString(tensor.shape) +
                      " is too large");
  }
  tensor.data = Base64Decode(encoded["data_b64"].get<std::string>());

  const std::size_t expected = elements * width;
  if (tensor.data.size() != expected) {
    throw FormatError("tensor payload holds " +
                      std::to_string(tensor.data.size()) + " bytes, shape " +
                      ShapeString(tensor.shape) + " of " +
                      DTypeName(tensor.dtype) + " requires " +
                      std::to_string(expected));
  }
  return tensor;
}

json TensorCodec::EncodeMap(const TensorMap &tensors) {
  json out = json::object();
  for (const auto &[name, tensor] : tensors) {
    out[name] = Encode(tensor);
  }
  return out;
}

TensorMap TensorCodec::DecodeMap(const json &object, json *passthrough) {
  if (!object.is_object()) {
    throw FormatError("tensor map must be a JSON object");
  }
  TensorMap out;
  for (auto it = object.begin(); it != object.end(); ++it) {
    if (IsEncodedTensor(it.value())) {
      out.emplace(it.key(), Decode(it.value()));
    } else if (passthrough) {
      (*passthrough)[it.key()] = it.value();
    }
  }
  return out;
}

} // namespace blockpipe
