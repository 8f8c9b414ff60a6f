#pragma once

#include <string>

#include "internal/util/errors.hpp"

namespace chronicle::documents {

struct PutResult {
  util::WriteStatus status = util::WriteStatus::kOk;

  // new token on success
  std::string version_token;

  std::string message;

  bool ok() const {
    return status == util::WriteStatus::kOk;
  }
};

} // namespace chronicle::documents
