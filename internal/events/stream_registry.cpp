#include "internal/events/stream_registry.hpp"

#include "internal/util/errors.hpp"

namespace chronicle::events {

StreamRegistry::StreamRegistry(std::shared_ptr<db::Repository> repo) : repo_(std::move(repo)) {
}

std::optional<uint64_t> StreamRegistry::GetVersion(const std::string& stream_id) const {
  const auto stream = GetStream(stream_id);
  if (!stream || stream->version == 0) return std::nullopt;
  return stream->version;
}

std::optional<db::model::StreamRecord> StreamRegistry::GetStream(const std::string& stream_id) const {
  return util::GuardStorage(stream_id, [&] {
    auto tx     = repo_->Begin();
    auto stream = repo_->GetStream(*tx, stream_id);
    tx->Rollback();
    return stream;
  });
}

std::vector<db::model::StreamRecord> StreamRegistry::ListStreams(const std::string& aggregate_type) const {
  return util::GuardStorage(aggregate_type, [&] {
    auto tx      = repo_->Begin();
    auto streams = repo_->ListStreams(*tx, aggregate_type);
    tx->Rollback();
    return streams;
  });
}

} // namespace chronicle::events
