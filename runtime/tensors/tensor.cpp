#include "runtime/tensors/tensor.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace blockpipe {

namespace {

std::uint16_t FloatToHalf(float value) {
  std::uint32_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  std::uint32_t sign = (bits >> 16) & 0x8000u;
  std::int32_t exponent = static_cast<std::int32_t>((bits >> 23) & 0xffu) - 127 + 15;
  std::uint32_t mantissa = bits & 0x7fffffu;

  if (((bits >> 23) & 0xffu) == 0xffu) {
    // Inf / NaN.
    return static_cast<std::uint16_t>(sign | 0x7c00u | (mantissa ? 0x200u : 0u));
  }
  if (exponent >= 0x1f) {
    return static_cast<std::uint16_t>(sign | 0x7c00u);
  }
  if (exponent <= 0) {
    if (exponent < -10) {
      return static_cast<std::uint16_t>(sign);
    }
    mantissa |= 0x800000u;
    std::uint32_t shift = static_cast<std::uint32_t>(14 - exponent);
    std::uint32_t half_mantissa = mantissa >> shift;
    if ((mantissa >> (shift - 1)) & 1u) {
      ++half_mantissa;
    }
    return static_cast<std::uint16_t>(sign | half_mantissa);
  }
  std::uint32_t half = sign | (static_cast<std::uint32_t>(exponent) << 10) |
                       (mantissa >> 13);
  if (mantissa & 0x1000u) {
    ++half; // round half up; carries into the exponent correctly
  }
  return static_cast<std::uint16_t>(half);
}

float HalfToFloat(std::uint16_t half) {
  std::uint32_t sign = static_cast<std::uint32_t>(half & 0x8000u) << 16;
  std::uint32_t exponent = (half >> 10) & 0x1fu;
  std::uint32_t mantissa = half & 0x3ffu;
  std::uint32_t bits;
  if (exponent == 0) {
    if (mantissa == 0) {
      bits = sign;
    } else {
      exponent = 127 - 15 + 1;
      while ((mantissa & 0x400u) == 0) {
        mantissa <<= 1;
        --exponent;
      }
      mantissa &= 0x3ffu;
      bits = sign | (exponent << 23) | (mantissa << 13);
    }
  } else if (exponent == 0x1f) {
    bits = sign | 0x7f800000u | (mantissa << 13);
  } else {
    bits = sign | ((exponent - 15 + 127) << 23) | (mantissa << 13);
  }
  float out;
  std::memcpy(&out, &bits, sizeof(out));
  return out;
}

} // namespace

std::size_t DTypeSize(DType dtype) {
  switch (dtype) {
  case DType::kFloat16:
  case DType::kInt16:
    return 2;
  case DType::kFloat32:
  case DType::kInt32:
    return 4;
  case DType::kFloat64:
  case DType::kInt64:
    return 8;
  case DType::kInt8:
  case DType::kUInt8:
  case DType::kBool:
    return 1;
  case DType::kUnknown:
    break;
  }
  return 0;
}

const char *DTypeName(DType dtype) {
  switch (dtype) {
  case DType::kFloat16:
    return "float16";
  case DType::kFloat32:
    return "float32";
  case DType::kFloat64:
    return "float64";
  case DType::kInt8:
    return "int8";
  case DType::kInt16:
    return "int16";
  case DType::kInt32:
    return "int32";
  case DType::kInt64:
    return "int64";
  case DType::kUInt8:
    return "uint8";
  case DType::kBool:
    return "bool";
  case DType::kUnknown:
    break;
  }
  return "unknown";
}

DType ParseDType(const std::string &name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (s.rfind("tensor(", 0) == 0 && s.back() == ')') {
    s = s.substr(7, s.size() - 8);
  }
  if (s == "float16" || s == "fp16" || s == "half" || s == "<f2")
    return DType::kFloat16;
  if (s == "float32" || s == "float" || s == "fp32" || s == "<f4")
    return DType::kFloat32;
  if (s == "float64" || s == "double" || s == "<f8")
    return DType::kFloat64;
  if (s == "int8")
    return DType::kInt8;
  if (s == "int16")
    return DType::kInt16;
  if (s == "int32" || s == "int" || s == "<i4")
    return DType::kInt32;
  if (s == "int64" || s == "long" || s == "<i8")
    return DType::kInt64;
  if (s == "uint8")
    return DType::kUInt8;
  if (s == "bool")
    return DType::kBool;
  return DType::kUnknown;
}

std::size_t NumElements(const std::vector<int64_t> &shape) {
  std::size_t n = 1;
  for (int64_t dim : shape) {
    if (dim < 0) {
      throw std::invalid_argument("negative dimension in " + ShapeString(shape));
    }
    const auto d = static_cast<std::size_t>(dim);
    if (d != 0 && n > std::numeric_limits<std::size_t>::max() / d) {
      throw std::overflow_error("element count overflows in " +
                                ShapeString(shape));
    }
    n *= d;
  }
  return n;
}

std::size_t Tensor::NumElements() const { return blockpipe::NumElements(shape); }

Tensor MakeZeros(DType dtype, const std::vector<int64_t> &shape) {
  Tensor t;
  t.dtype = dtype;
  t.shape = shape;
  t.data.assign(NumElements(shape) * DTypeSize(dtype), 0);
  return t;
}

Tensor Concat(const std::vector<const Tensor *> &parts, std::size_t axis) {
  if (parts.empty()) {
    throw std::invalid_argument("Concat requires at least one tensor");
  }
  const Tensor &first = *parts.front();
  if (axis >= first.shape.size()) {
    throw std::out_of_range("Concat axis out of range");
  }
  std::vector<int64_t> out_shape = first.shape;
  out_shape[axis] = 0;
  for (const Tensor *part : parts) {
    if (part->dtype != first.dtype ||
        part->shape.size() != first.shape.size()) {
      throw std::invalid_argument("Concat dtype/rank mismatch");
    }
    for (std::size_t d = 0; d < first.shape.size(); ++d) {
      if (d != axis && part->shape[d] != first.shape[d]) {
        throw std::invalid_argument("Concat shape mismatch: " +
                                    ShapeString(part->shape) + " vs " +
                                    ShapeString(first.shape));
      }
    }
    out_shape[axis] += part->shape[axis];
  }

  const std::size_t item = DTypeSize(first.dtype);
  std::size_t outer = 1;
  for (std::size_t d = 0; d < axis; ++d) {
    outer *= static_cast<std::size_t>(first.shape[d]);
  }
  std::size_t inner = item;
  for (std::size_t d = axis + 1; d < first.shape.size(); ++d) {
    inner *= static_cast<std::size_t>(first.shape[d]);
  }

  Tensor out = MakeZeros(first.dtype, out_shape);
  std::uint8_t *dst = out.data.data();
  for (std::size_t o = 0; o < outer; ++o) {
    for (const Tensor *part : parts) {
      std::size_t chunk = static_cast<std::size_t>(part->shape[axis]) * inner;
      if (chunk > 0) {
        std::memcpy(dst, part->data.data() + o * chunk, chunk);
        dst += chunk;
      }
    }
  }
  return out;
}

Tensor Slice(const Tensor &tensor, std::size_t axis, int64_t begin,
             int64_t end) {
  if (axis >= tensor.shape.size()) {
    throw std::out_of_range("Slice axis out of range");
  }
  const int64_t dim = tensor.shape[axis];
  begin = std::max<int64_t>(0, std::min(begin, dim));
  end = std::max<int64_t>(begin, std::min(end, dim));

  const std::size_t item = DTypeSize(tensor.dtype);
  std::size_t outer = 1;
  for (std::size_t d = 0; d < axis; ++d) {
    outer *= static_cast<std::size_t>(tensor.shape[d]);
  }
  std::size_t inner = item;
  for (std::size_t d = axis + 1; d < tensor.shape.size(); ++d) {
    inner *= static_cast<std::size_t>(tensor.shape[d]);
  }

  std::vector<int64_t> out_shape = tensor.shape;
  out_shape[axis] = end - begin;
  Tensor out = MakeZeros(tensor.dtype, out_shape);
  const std::size_t src_stride = static_cast<std::size_t>(dim) * inner;
  const std::size_t chunk = static_cast<std::size_t>(end - begin) * inner;
  for (std::size_t o = 0; o < outer && chunk > 0; ++o) {
    std::memcpy(out.data.data() + o * chunk,
                tensor.data.data() + o * src_stride +
                    static_cast<std::size_t>(begin) * inner,
                chunk);
  }
  return out;
}

Tensor CastTo(const Tensor &tensor, DType dtype) {
  if (tensor.dtype == dtype) {
    return tensor;
  }
  const std::size_t n = tensor.NumElements();
  Tensor out = MakeZeros(dtype, tensor.shape);
  if (tensor.dtype == DType::kFloat32 && dtype == DType::kFloat16) {
    const float *src = tensor.As<float>();
    std::uint16_t *dst = out.MutableAs<std::uint16_t>();
    for (std::size_t i = 0; i < n; ++i) {
      dst[i] = FloatToHalf(src[i]);
    }
    return out;
  }
  if (tensor.dtype == DType::kFloat16 && dtype == DType::kFloat32) {
    const std::uint16_t *src = tensor.As<std::uint16_t>();
    float *dst = out.MutableAs<float>();
    for (std::size_t i = 0; i < n; ++i) {
      dst[i] = HalfToFloat(src[i]);
    }
    return out;
  }
  throw std::invalid_argument(std::string("unsupported cast ") +
                              DTypeName(tensor.dtype) + " -> " +
                              DTypeName(dtype));
}

std::string ShapeString(const std::vector<int64_t> &shape) {
  std::ostringstream oss;
  oss << "[";
  for (std::size_t i = 0; i < shape.size(); ++i) {
    if (i) {
      oss << ", ";
    }
    oss << shape[i];
  }
  oss << "]";
  return oss.str();
}

} // namespace blockpipe
