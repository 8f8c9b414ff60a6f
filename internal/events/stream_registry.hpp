#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/stream_record.hpp"

namespace chronicle::events {

/*
  Read side of the stream table. Versions only move inside
  EventLog::AppendToStream.
*/
class StreamRegistry {
 public:
  explicit StreamRegistry(std::shared_ptr<db::Repository> repo);

  // nullopt when the stream has no events
  std::optional<uint64_t> GetVersion(const std::string& stream_id) const;

  std::optional<db::model::StreamRecord> GetStream(const std::string& stream_id) const;

  // Ordered by stream id. An empty aggregate_type lists every stream.
  std::vector<db::model::StreamRecord> ListStreams(const std::string& aggregate_type = {}) const;

 private:
  std::shared_ptr<db::Repository> repo_;
};

} // namespace chronicle::events
