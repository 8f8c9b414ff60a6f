#pragma once

#include <cstdint>
#include <string>

namespace chronicle::db::model {

struct EventRecord {
  uint64_t    sequence = 0;
  std::string stream_id;
  uint64_t    version = 0;
  std::string type;
  std::string data;
  uint64_t    recorded_at_ms = 0;
};

} // namespace chronicle::db::model
