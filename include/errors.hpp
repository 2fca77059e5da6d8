#pragma once
#include <stdexcept>
#include <string>

// Contract violations: raised immediately, never retried.
struct ShapeError : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

struct InvalidArgument : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// Anything the persistence backend reports. `code` is the sqlite result code (0 if none).
class BackendError : public std::runtime_error {
public:
  explicit BackendError(const std::string& what, int code = 0)
    : std::runtime_error(what), code_(code) {}
  int code() const { return code_; }

private:
  int code_;
};

// Connection/operation failures the Connector may retry.
struct TransientBackendError : BackendError {
  using BackendError::BackendError;
};

struct SchemaError : BackendError {
  using BackendError::BackendError;
};

struct OperationCancelled : BackendError {
  using BackendError::BackendError;
};
