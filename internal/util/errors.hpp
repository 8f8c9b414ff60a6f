#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace chronicle::util {

/*
  Central error taxonomy.

  Conflicts and stream precondition failures are reported through
  result values (see internal/events/append_result.hpp and
  internal/documents/put_result.hpp). The kinds below that are fatal to
  the current operation are thrown as StoreError subclasses.
*/

enum class ErrorKind {
  kConcurrencyConflict,
  kStreamNotFound,
  kStreamAlreadyExists,
  kDocumentNotFound,
  kStorageUnavailable,
  kSerializationError,
  kProjectionFailed,
  kInvalidArgument,
};

std::string_view Describe(ErrorKind kind);

// Outcome of a conflict-capable write.
enum class WriteStatus {
  kOk,
  kConcurrencyConflict,
  kStreamNotFound,
  kStreamAlreadyExists,
};

std::string_view Describe(WriteStatus status);

class StoreError : public std::runtime_error {
 public:
  StoreError(ErrorKind kind, std::string key, const std::string& msg)
      : std::runtime_error(msg), kind_(kind), key_(std::move(key)) {
  }

  ErrorKind Kind() const {
    return kind_;
  }

  // stream id or "type/id" of the record involved; may be empty
  const std::string& Key() const {
    return key_;
  }

 private:
  ErrorKind   kind_;
  std::string key_;
};

class StorageUnavailable : public StoreError {
 public:
  StorageUnavailable(std::string key, const std::string& msg) : StoreError(ErrorKind::kStorageUnavailable, std::move(key), msg) {
  }
};

class SerializationError : public StoreError {
 public:
  SerializationError(std::string key, const std::string& msg) : StoreError(ErrorKind::kSerializationError, std::move(key), msg) {
  }
};

class ProjectionFailed : public StoreError {
 public:
  ProjectionFailed(std::string key, const std::string& msg) : StoreError(ErrorKind::kProjectionFailed, std::move(key), msg) {
  }
};

class InvalidArgument : public StoreError {
 public:
  InvalidArgument(std::string key, const std::string& msg) : StoreError(ErrorKind::kInvalidArgument, std::move(key), msg) {
  }
};

/*
  Runs fn, rethrowing StoreErrors unchanged and turning any other
  exception from the storage stack into StorageUnavailable for key.
*/
template <typename F>
auto GuardStorage(const std::string& key, F&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const StoreError&) {
    throw;
  } catch (const std::exception& e) {
    throw StorageUnavailable(key, e.what());
  }
}

} // namespace chronicle::util
