#include "internal/events/expected_version.hpp"

namespace chronicle::events {

std::string ExpectedVersion::ToString() const {
  switch (kind_) {
    case Kind::kAny:
      return "any";
    case Kind::kNoStream:
      return "no-stream";
    case Kind::kStreamExists:
      return "stream-exists";
    case Kind::kExact:
      return std::to_string(version_);
  }
  return "unknown";
}

} // namespace chronicle::events
