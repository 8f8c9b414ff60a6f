#pragma once

#include <cstdint>
#include <string>

namespace chronicle::db::model {

struct StreamRecord {
  std::string id;
  std::string aggregate_type;
  uint64_t    version       = 0;
  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace chronicle::db::model
