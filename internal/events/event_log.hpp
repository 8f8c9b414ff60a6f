#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/codec/codec.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/append_result.hpp"
#include "internal/events/event_stream.hpp"
#include "internal/events/expected_version.hpp"
#include "internal/events/recorded_event.hpp"
#include "internal/projection/projection_engine.hpp"

namespace chronicle::events {

/*
  EventLog

  Append-only, per-stream versioned event storage.

  AppendToStream runs one transaction:
    lock stream row -> check expectation -> advance stream version
    -> insert events -> inline projections -> commit

  Conflicts and stream preconditions come back as AppendResult; storage
  failures throw util::StorageUnavailable and a failing projection rule
  throws util::ProjectionFailed. Nothing is retried.
*/
class EventLog {
 public:
  EventLog(std::shared_ptr<db::Repository> repo, std::shared_ptr<const codec::Codec> codec,
           std::shared_ptr<const projection::ProjectionEngine> projections, uint32_t page_size);

  AppendResult AppendToStream(const std::string& stream_id, const std::string& aggregate_type, ExpectedVersion expected,
                              std::vector<codec::EncodedEvent> events);

  // Encodes each message with the store codec.
  template <typename... TEvents>
  AppendResult Append(const std::string& stream_id, const std::string& aggregate_type, ExpectedVersion expected,
                      const TEvents&... messages) {
    std::vector<codec::EncodedEvent> encoded;
    encoded.reserve(sizeof...(messages));
    (encoded.push_back(codec_->Encode(messages)), ...);
    return AppendToStream(stream_id, aggregate_type, expected, std::move(encoded));
  }

  EventStream FetchStream(const std::string& stream_id, uint64_t from_version = 1, uint64_t to_version = kLatestVersion) const;

  // Events across all streams in global sequence order.
  std::vector<RecordedEvent> FetchAll(uint64_t after_sequence, std::optional<uint64_t> limit = std::nullopt) const;

  // Administrative: removes the stream's events and registry row.
  // Returns false when the stream did not exist.
  bool HardDeleteStream(const std::string& stream_id);

  void DeleteAllEventData();

 private:
  std::shared_ptr<db::Repository>                     repo_;
  std::shared_ptr<const codec::Codec>                 codec_;
  std::shared_ptr<const projection::ProjectionEngine> projections_;
  uint32_t                                            page_size_;
};

} // namespace chronicle::events
