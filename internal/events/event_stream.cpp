#include "internal/events/event_stream.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chronicle::events {

EventStream::EventStream(std::shared_ptr<db::Repository> repo, std::string stream_id, uint64_t from_version, uint64_t to_version,
                         uint32_t page_size)
    : repo_(std::move(repo)),
      stream_id_(std::move(stream_id)),
      from_version_(std::max<uint64_t>(from_version, 1)),
      to_version_(to_version),
      page_size_(page_size == 0 ? 1 : page_size),
      next_version_(from_version_) {
}

void EventStream::FetchPage() {
  util::GuardStorage(stream_id_, [&] {
    auto tx = repo_->Begin();

    if (!pinned_to_.has_value()) {
      const auto stream = repo_->GetStream(*tx, stream_id_);
      pinned_to_        = std::min(to_version_, stream ? stream->version : 0);
    }

    if (next_version_ > *pinned_to_) {
      exhausted_ = true;
      tx->Rollback();
      return;
    }

    auto page = repo_->ReadStreamEvents(*tx, stream_id_, next_version_, *pinned_to_, page_size_);
    tx->Rollback();

    CHRONICLE_LOG_DEBUG("Fetched stream page", {observability::StringField("stream_id", stream_id_),
                                                observability::UintField("from_version", next_version_),
                                                observability::UintField("events", page.size())});

    if (page.empty()) {
      // hard-deleted underneath us
      exhausted_ = true;
      return;
    }
    next_version_ = page.back().version + 1;
    for (auto& e : page) buffer_.push_back(std::move(e));
  });
}

std::optional<RecordedEvent> EventStream::Next() {
  if (buffer_.empty() && !exhausted_) {
    FetchPage();
  }
  if (buffer_.empty()) {
    return std::nullopt;
  }
  auto e = std::move(buffer_.front());
  buffer_.pop_front();
  return e;
}

void EventStream::Rewind() {
  buffer_.clear();
  next_version_ = from_version_;
  exhausted_    = false;
}

std::vector<RecordedEvent> EventStream::ToVector() {
  std::vector<RecordedEvent> out;
  while (auto e = Next()) out.push_back(std::move(*e));
  return out;
}

} // namespace chronicle::events
