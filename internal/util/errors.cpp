#include "errors.hpp"

namespace chronicle::util {

std::string_view Describe(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kConcurrencyConflict:
      return "ConcurrencyConflict";
    case ErrorKind::kStreamNotFound:
      return "StreamNotFound";
    case ErrorKind::kStreamAlreadyExists:
      return "StreamAlreadyExists";
    case ErrorKind::kDocumentNotFound:
      return "DocumentNotFound";
    case ErrorKind::kStorageUnavailable:
      return "StorageUnavailable";
    case ErrorKind::kSerializationError:
      return "SerializationError";
    case ErrorKind::kProjectionFailed:
      return "ProjectionFailed";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgument";
  }
  return "Unknown";
}

std::string_view Describe(WriteStatus status) {
  switch (status) {
    case WriteStatus::kOk:
      return "Ok";
    case WriteStatus::kConcurrencyConflict:
      return Describe(ErrorKind::kConcurrencyConflict);
    case WriteStatus::kStreamNotFound:
      return Describe(ErrorKind::kStreamNotFound);
    case WriteStatus::kStreamAlreadyExists:
      return Describe(ErrorKind::kStreamAlreadyExists);
  }
  return "Unknown";
}

} // namespace chronicle::util
