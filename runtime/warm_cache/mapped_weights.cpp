#include "runtime/warm_cache/mapped_weights.h"

#include "runtime/errors.h"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>

using json = nlohmann::json;

namespace blockpipe {

MappedFile::MappedFile(const std::filesystem::path &path) : path_(path) {
  fd_ = ::open(path.c_str(), O_RDONLY);
  if (fd_ < 0) {
    throw LoadError("cannot open weight file " + path.string() + ": " +
                    std::strerror(errno));
  }
  struct stat st {};
  if (::fstat(fd_, &st) != 0) {
    int err = errno;
    Release();
    throw LoadError("cannot stat weight file " + path.string() + ": " +
                    std::strerror(err));
  }
  size_ = static_cast<std::size_t>(st.st_size);
  if (size_ == 0) {
    return;
  }
  void *addr = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (addr == MAP_FAILED) {
    int err = errno;
    Release();
    throw LoadError("cannot mmap weight file " + path.string() + ": " +
                    std::strerror(err));
  }
  data_ = static_cast<std::uint8_t *>(addr);
}

MappedFile::~MappedFile() { Release(); }

MappedFile::MappedFile(MappedFile &&o) noexcept
    : path_(std::move(o.path_)), fd_(o.fd_), data_(o.data_), size_(o.size_) {
  o.fd_ = -1;
  o.data_ = nullptr;
  o.size_ = 0;
}

MappedFile &MappedFile::operator=(MappedFile &&o) noexcept {
  if (this != &o) {
    Release();
    path_ = std::move(o.path_);
    fd_ = o.fd_;
    data_ = o.data_;
    size_ = o.size_;
    o.fd_ = -1;
    o.data_ = nullptr;
    o.size_ = 0;
  }
  return *this;
}

void MappedFile::Release() {
  if (data_) {
    ::munmap(data_, size_);
    data_ = nullptr;
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  size_ = 0;
}

std::vector<WeightEntry>
LoadWeightManifest(const std::filesystem::path &manifest_path) {
  std::ifstream in(manifest_path);
  if (!in.is_open()) {
    throw LoadError("cannot open weights manifest " + manifest_path.string());
  }
  json root;
  try {
    in >> root;
  } catch (const json::exception &ex) {
    throw LoadError("invalid weights manifest " + manifest_path.string() +
                    ": " + ex.what());
  }
  if (!root.is_object()) {
    throw LoadError("weights manifest must be a JSON object");
  }

  std::vector<WeightEntry> entries;
  for (auto it = root.begin(); it != root.end(); ++it) {
    const json &info = it.value();
    WeightEntry entry;
    entry.name = it.key();
    if (info.contains("file_path") && info["file_path"].is_string()) {
      entry.file = info["file_path"].get<std::string>();
    } else if (info.contains("safe_filename") &&
               info["safe_filename"].is_string()) {
      entry.file = info["safe_filename"].get<std::string>();
    } else {
      throw LoadError("weight '" + entry.name + "' has no file path");
    }
    if (!info.contains("shape") || !info["shape"].is_array()) {
      throw LoadError("weight '" + entry.name + "' has no shape");
    }
    entry.shape = info["shape"].get<std::vector<int64_t>>();
    entry.dtype = ParseDType(info.value("dtype", std::string("float32")));
    if (entry.dtype == DType::kUnknown) {
      throw LoadError("weight '" + entry.name + "' has unsupported dtype");
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

Tensor MaterializeWeight(const WeightEntry &entry,
                         const std::filesystem::path &weights_dir,
                         MappedFile &mapping) {
  mapping = MappedFile(weights_dir / entry.file);
  std::size_t expected = 0;
  try {
    expected = NumElements(entry.shape) * DTypeSize(entry.dtype);
  } catch (const std::exception &ex) {
    throw LoadError("weight '" + entry.name + "': " + ex.what());
  }
  if (mapping.size() < expected) {
    throw LoadError("weight file " + mapping.path().string() + " holds " +
                    std::to_string(mapping.size()) + " bytes, expected " +
                    std::to_string(expected));
  }
  Tensor tensor;
  tensor.dtype = entry.dtype;
  tensor.shape = entry.shape;
  tensor.data.assign(mapping.data(), mapping.data() + expected);
  return tensor;
}

} // namespace blockpipe
