#pragma once

#include <cstdint>
#include <string>

namespace chronicle::events {

/*
  Optimistic concurrency precondition for AppendToStream.

    Any()          - no check
    NoStream()     - the stream must have no events yet
    StreamExists() - the stream must already have events
    Exactly(n)     - the stream must be at version n (0 == no events)
*/
class ExpectedVersion {
 public:
  enum class Kind { kAny, kNoStream, kStreamExists, kExact };

  static ExpectedVersion Any() {
    return ExpectedVersion(Kind::kAny, 0);
  }
  static ExpectedVersion NoStream() {
    return ExpectedVersion(Kind::kNoStream, 0);
  }
  static ExpectedVersion StreamExists() {
    return ExpectedVersion(Kind::kStreamExists, 0);
  }
  static ExpectedVersion Exactly(uint64_t version) {
    return ExpectedVersion(Kind::kExact, version);
  }

  Kind GetKind() const {
    return kind_;
  }
  uint64_t Version() const {
    return version_;
  }

  std::string ToString() const;

 private:
  ExpectedVersion(Kind kind, uint64_t version) : kind_(kind), version_(version) {
  }

  Kind     kind_;
  uint64_t version_;
};

} // namespace chronicle::events
