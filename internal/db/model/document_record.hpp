#pragma once

#include <cstdint>
#include <string>

namespace chronicle::db::model {

struct DocumentRecord {
  std::string type;
  std::string id;
  std::string data;
  std::string version_token;
  uint64_t    updated_at_ms = 0;
};

} // namespace chronicle::db::model
