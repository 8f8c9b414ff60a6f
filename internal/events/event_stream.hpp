#pragma once

#include <cstdint>
#include <deque>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/events/recorded_event.hpp"

namespace chronicle::events {

inline constexpr uint64_t kLatestVersion = std::numeric_limits<uint64_t>::max();

/*
  Lazy, finite, restartable read of one stream.

  Nothing is read until the first Next(). Each page is fetched in its
  own short read transaction. An open upper bound is pinned to the
  stream version observed by the first fetch, so events appended while
  iterating are not returned and Rewind() replays exactly the same
  sequence.
*/
class EventStream {
 public:
  EventStream(std::shared_ptr<db::Repository> repo, std::string stream_id, uint64_t from_version, uint64_t to_version, uint32_t page_size);

  // Next event in version order, nullopt at the end.
  std::optional<RecordedEvent> Next();

  void Rewind();

  // Drains the remaining events.
  std::vector<RecordedEvent> ToVector();

  const std::string& StreamId() const {
    return stream_id_;
  }

 private:
  void FetchPage();

  std::shared_ptr<db::Repository> repo_;
  std::string                     stream_id_;
  uint64_t                        from_version_;
  uint64_t                        to_version_;
  uint32_t                        page_size_;

  std::optional<uint64_t>  pinned_to_;
  uint64_t                 next_version_;
  std::deque<RecordedEvent> buffer_;
  bool                     exhausted_ = false;
};

} // namespace chronicle::events
