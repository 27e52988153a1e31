#pragma once

#include <cstdint>
#include <cstring>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace blockpipe {

// Element types carried across the pipeline. Names follow the numpy
// vocabulary used on the wire ("float32", "int64", ...).
enum class DType {
  kFloat16,
  kFloat32,
  kFloat64,
  kInt8,
  kInt16,
  kInt32,
  kInt64,
  kUInt8,
  kBool,
  kUnknown,
};

std::size_t DTypeSize(DType dtype);
const char *DTypeName(DType dtype);
// Accepts numpy names plus the aliases found in model metadata
// ("float", "fp16", "half", "long", "int", "double", "tensor(float)").
DType ParseDType(const std::string &name);

// Dense tensor with raw little-endian element bytes. An empty shape is a
// 0-d scalar holding exactly one element.
struct Tensor {
  DType dtype{DType::kFloat32};
  std::vector<int64_t> shape;
  std::vector<std::uint8_t> data;

  std::size_t NumElements() const;
  std::size_t ByteSize() const { return data.size(); }
  bool Empty() const { return NumElements() == 0; }

  template <typename T> const T *As() const {
    return reinterpret_cast<const T *>(data.data());
  }
  template <typename T> T *MutableAs() {
    return reinterpret_cast<T *>(data.data());
  }

  // Copies values out as T; throws when sizeof(T) does not match the dtype.
  template <typename T> std::vector<T> Values() const {
    if (sizeof(T) != DTypeSize(dtype)) {
      throw std::invalid_argument("tensor element size mismatch");
    }
    std::vector<T> out(NumElements());
    if (!out.empty()) {
      std::memcpy(out.data(), data.data(), out.size() * sizeof(T));
    }
    return out;
  }
};

// Tensors keyed by ONNX tensor name.
using TensorMap = std::map<std::string, Tensor>;

std::size_t NumElements(const std::vector<int64_t> &shape);

Tensor MakeZeros(DType dtype, const std::vector<int64_t> &shape);

template <typename T>
Tensor MakeTensor(DType dtype, const std::vector<int64_t> &shape,
                  const std::vector<T> &values) {
  if (sizeof(T) != DTypeSize(dtype)) {
    throw std::invalid_argument("tensor element size mismatch");
  }
  if (values.size() != NumElements(shape)) {
    throw std::invalid_argument("tensor value count does not match shape");
  }
  Tensor t;
  t.dtype = dtype;
  t.shape = shape;
  t.data.resize(values.size() * sizeof(T));
  if (!values.empty()) {
    std::memcpy(t.data.data(), values.data(), t.data.size());
  }
  return t;
}

// Concatenates along `axis`; all other dimensions and the dtype must match.
Tensor Concat(const std::vector<const Tensor *> &parts, std::size_t axis);

// Returns [begin, end) along `axis`.
Tensor Slice(const Tensor &tensor, std::size_t axis, int64_t begin,
             int64_t end);

// Converts between float32 and float16 element types. Other pairs throw.
Tensor CastTo(const Tensor &tensor, DType dtype);

std::string ShapeString(const std::vector<int64_t> &shape);

} // namespace blockpipe
