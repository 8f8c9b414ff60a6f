#include "internal/events/event_log.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace chronicle::events {

namespace {

AppendResult Rejected(util::WriteStatus status, uint64_t observed, std::string message) {
  AppendResult r;
  r.status  = status;
  r.version = observed;
  r.message = std::move(message);
  return r;
}

} // namespace

EventLog::EventLog(std::shared_ptr<db::Repository> repo, std::shared_ptr<const codec::Codec> codec,
                   std::shared_ptr<const projection::ProjectionEngine> projections, uint32_t page_size)
    : repo_(std::move(repo)), codec_(std::move(codec)), projections_(std::move(projections)), page_size_(page_size == 0 ? 1 : page_size) {
}

AppendResult EventLog::AppendToStream(const std::string& stream_id, const std::string& aggregate_type, ExpectedVersion expected,
                                      std::vector<codec::EncodedEvent> events) {
  if (stream_id.empty()) {
    throw util::InvalidArgument(stream_id, "stream id must not be empty");
  }
  if (events.empty()) {
    throw util::InvalidArgument(stream_id, "append requires at least one event");
  }

  const auto result = util::GuardStorage(stream_id, [&]() -> AppendResult {
    auto tx = repo_->Begin();

    const auto     stream  = repo_->LockStream(*tx, stream_id);
    const uint64_t current = stream ? stream->version : 0;

    switch (expected.GetKind()) {
      case ExpectedVersion::Kind::kAny:
        break;
      case ExpectedVersion::Kind::kNoStream:
        if (current > 0) {
          return Rejected(util::WriteStatus::kStreamAlreadyExists, current, "stream " + stream_id + " already exists");
        }
        break;
      case ExpectedVersion::Kind::kStreamExists:
        if (current == 0) {
          return Rejected(util::WriteStatus::kStreamNotFound, current, "stream " + stream_id + " not found");
        }
        break;
      case ExpectedVersion::Kind::kExact:
        if (current != expected.Version()) {
          return Rejected(util::WriteStatus::kConcurrencyConflict, current,
                          "stream " + stream_id + " expected version " + expected.ToString() + " but is at " + std::to_string(current));
        }
        break;
    }

    const uint64_t now         = util::ToUnixMillis(util::Now());
    const uint64_t new_version = current + events.size();

    db::Result r;
    if (stream) {
      r = repo_->UpdateStreamVersion(*tx, stream_id, current, new_version, now);
    } else {
      db::model::StreamRecord record;
      record.id             = stream_id;
      record.aggregate_type = aggregate_type;
      record.version        = new_version;
      record.created_at_ms  = now;
      record.updated_at_ms  = now;
      r = repo_->InsertStream(*tx, record);
    }
    if (r.IsRace()) {
      // another writer moved the stream after our read
      return Rejected(util::WriteStatus::kConcurrencyConflict, current, r.message);
    }
    if (!r) {
      throw util::StorageUnavailable(stream_id, r.Describe());
    }

    std::vector<RecordedEvent> records;
    records.reserve(events.size());
    uint64_t version = current;
    for (auto& e : events) {
      RecordedEvent record;
      record.stream_id = stream_id;
      record.version   = ++version;
      record.type      = std::move(e.type);
      record.data      = std::move(e.data);
      records.push_back(std::move(record));
    }

    r = repo_->AppendEvents(*tx, records);
    if (r.IsRace()) {
      return Rejected(util::WriteStatus::kConcurrencyConflict, current, r.message);
    }
    if (!r) {
      throw util::StorageUnavailable(stream_id, r.Describe());
    }

    if (projections_) {
      projections_->Apply(*repo_, *tx, records);
    }

    tx->Commit();

    AppendResult ok;
    ok.version       = new_version;
    ok.last_sequence = records.back().sequence;
    return ok;
  });

  if (result.ok()) {
    CHRONICLE_LOG_INFO("Appended events", {observability::StringField("stream_id", stream_id),
                                           observability::StringField("aggregate_type", aggregate_type),
                                           observability::UintField("count", events.size()),
                                           observability::UintField("version", result.version)});
  } else {
    CHRONICLE_LOG_WARN("Append rejected", {observability::StringField("stream_id", stream_id),
                                           observability::StringField("status", util::Describe(result.status)),
                                           observability::StringField("expected", expected.ToString()),
                                           observability::UintField("actual", result.version)});
  }
  return result;
}

EventStream EventLog::FetchStream(const std::string& stream_id, uint64_t from_version, uint64_t to_version) const {
  return EventStream(repo_, stream_id, from_version, to_version, page_size_);
}

std::vector<RecordedEvent> EventLog::FetchAll(uint64_t after_sequence, std::optional<uint64_t> limit) const {
  return util::GuardStorage("$all", [&] {
    auto tx     = repo_->Begin();
    auto events = repo_->ReadAllEvents(*tx, after_sequence, limit);
    tx->Rollback();
    return events;
  });
}

bool EventLog::HardDeleteStream(const std::string& stream_id) {
  const bool existed = util::GuardStorage(stream_id, [&] {
    auto tx     = repo_->Begin();
    const auto stream = repo_->LockStream(*tx, stream_id);
    if (!stream) {
      tx->Rollback();
      return false;
    }
    const auto r = repo_->DeleteStream(*tx, stream_id);
    if (!r) {
      throw util::StorageUnavailable(stream_id, r.message);
    }
    tx->Commit();
    return true;
  });

  if (existed) {
    CHRONICLE_LOG_WARN("Hard deleted stream", {observability::StringField("stream_id", stream_id)});
  }
  return existed;
}

void EventLog::DeleteAllEventData() {
  util::GuardStorage("$all", [&] {
    auto tx = repo_->Begin();
    const auto r = repo_->DeleteAllEventData(*tx);
    if (!r) {
      throw util::StorageUnavailable("$all", r.message);
    }
    tx->Commit();
  });
  CHRONICLE_LOG_WARN("Deleted all event data");
}

} // namespace chronicle::events
