#pragma once

#include "runtime/tensors/tensor.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace blockpipe {

// ---------------------------------------------------------------------------
// MappedFile — RAII read-only memory map of one weight file.
// ---------------------------------------------------------------------------
class MappedFile {
public:
  MappedFile() = default;
  // Throws LoadError when the file cannot be opened or mapped.
  explicit MappedFile(const std::filesystem::path &path);
  ~MappedFile();

  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  MappedFile(MappedFile &&o) noexcept;
  MappedFile &operator=(MappedFile &&o) noexcept;

  const std::uint8_t *data() const { return data_; }
  std::size_t size() const { return size_; }
  const std::filesystem::path &path() const { return path_; }

private:
  void Release();

  std::filesystem::path path_;
  int fd_{-1};
  std::uint8_t *data_{nullptr};
  std::size_t size_{0};
};

// Entry of weights_metadata.json:
//   {"<initializer name>": {"file_path": "w_0.bin", "shape": [4096, 4096],
//                           "dtype": "float16"}}
// "safe_filename" is accepted in place of "file_path".
struct WeightEntry {
  std::string name;
  std::string file;
  std::vector<int64_t> shape;
  DType dtype{DType::kFloat32};
};

// Throws LoadError on unreadable or malformed manifests.
std::vector<WeightEntry>
LoadWeightManifest(const std::filesystem::path &manifest_path);

// Maps `entry` from `weights_dir` and copies it into an owned tensor. The
// mapping is handed back through `mapping` so the caller controls its
// lifetime. Throws LoadError on a missing file or size mismatch.
Tensor MaterializeWeight(const WeightEntry &entry,
                         const std::filesystem::path &weights_dir,
                         MappedFile &mapping);

} // namespace blockpipe
