#pragma once

#include <cstdint>
#include <string>

#include "internal/util/errors.hpp"

namespace chronicle::events {

struct AppendResult {
  util::WriteStatus status = util::WriteStatus::kOk;

  // stream version after the append, or the observed version on failure
  uint64_t version = 0;

  // global sequence number of the last appended event; 0 on failure
  uint64_t last_sequence = 0;

  std::string message;

  bool ok() const {
    return status == util::WriteStatus::kOk;
  }
};

} // namespace chronicle::events
