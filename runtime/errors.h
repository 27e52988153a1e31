#pragma once

#include <stdexcept>
#include <string>

namespace blockpipe {

enum class ErrorKind {
  kConfig,
  kLoad,
  kWorkerTimeout,
  kWorkerExecution,
  kInputPreparation,
  kForwarding,
  kLicense,
  kFormat,
};

inline const char *ErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kConfig:
    return "config_error";
  case ErrorKind::kLoad:
    return "load_error";
  case ErrorKind::kWorkerTimeout:
    return "worker_timeout";
  case ErrorKind::kWorkerExecution:
    return "worker_execution_error";
  case ErrorKind::kInputPreparation:
    return "input_preparation_error";
  case ErrorKind::kForwarding:
    return "forwarding_error";
  case ErrorKind::kLicense:
    return "license_error";
  case ErrorKind::kFormat:
    return "format_error";
  }
  return "unknown_error";
}

class PipelineError : public std::runtime_error {
public:
  PipelineError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }
  const char *kind_name() const { return ErrorKindName(kind_); }

private:
  ErrorKind kind_;
};

// Missing or invalid node/model configuration. Fatal at startup.
class ConfigError : public PipelineError {
public:
  explicit ConfigError(const std::string &message)
      : PipelineError(ErrorKind::kConfig, message) {}
};

// A single load strategy failed; callers fall through to the next one.
class LoadError : public PipelineError {
public:
  explicit LoadError(const std::string &message)
      : PipelineError(ErrorKind::kLoad, message) {}
};

class WorkerTimeoutError : public PipelineError {
public:
  explicit WorkerTimeoutError(const std::string &message)
      : PipelineError(ErrorKind::kWorkerTimeout, message) {}
};

class WorkerExecutionError : public PipelineError {
public:
  explicit WorkerExecutionError(const std::string &message)
      : PipelineError(ErrorKind::kWorkerExecution, message) {}
};

class InputPreparationError : public PipelineError {
public:
  explicit InputPreparationError(const std::string &message)
      : PipelineError(ErrorKind::kInputPreparation, message) {}
};

class ForwardingError : public PipelineError {
public:
  explicit ForwardingError(const std::string &message)
      : PipelineError(ErrorKind::kForwarding, message) {}
};

// Runtime license re-check failed. Never absorbed into a partial result.
class LicenseError : public PipelineError {
public:
  explicit LicenseError(const std::string &message)
      : PipelineError(ErrorKind::kLicense, message) {}
};

// Tensor payload does not match its declared shape/dtype.
class FormatError : public PipelineError {
public:
  explicit FormatError(const std::string &message)
      : PipelineError(ErrorKind::kFormat, message) {}
};

} // namespace blockpipe
