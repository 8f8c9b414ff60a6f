#include "internal/projection/projection_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace chronicle::projection {

ProjectionEngine::ProjectionEngine(std::vector<std::shared_ptr<const Projection>> projections, std::shared_ptr<const codec::Codec> codec)
    : projections_(std::move(projections)), codec_(std::move(codec)) {
  for (const auto& projection : projections_) {
    if (!projection) {
      throw std::invalid_argument("null projection");
    }
    const auto& document_type = projection->DocumentType();
    if (!by_document_type_.emplace(document_type, projection.get()).second) {
      throw std::invalid_argument("projection for " + document_type + " registered twice");
    }
    for (const auto& event_type : projection->EventTypes()) {
      by_event_type_[event_type].push_back(projection.get());
    }
  }
}

bool ProjectionEngine::ApplyOne(db::Repository& repo, db::Transaction& tx, const Projection& projection,
                                const events::RecordedEvent& event) const {
  const auto& document_type = projection.DocumentType();
  std::string key;

  try {
    key = projection.DocumentKey(*codec_, event);

    // shared documents are not covered by the stream lock
    const auto current = util::GuardStorage(document_type + "/" + key, [&] { return repo.LockDocument(tx, document_type, key); });
    const auto next    = projection.Apply(*codec_, event, current ? std::optional<std::string>(current->data) : std::nullopt);
    if (!next.has_value()) {
      return false;
    }

    db::model::DocumentRecord record;
    record.type          = document_type;
    record.id            = key;
    record.data          = *next;
    record.version_token = util::NewVersionToken();
    record.updated_at_ms = util::ToUnixMillis(util::Now());

    const auto r = repo.UpsertDocument(tx, record);
    if (!r) {
      throw util::StorageUnavailable(document_type + "/" + key, r.message);
    }
    return true;
  } catch (const util::StorageUnavailable&) {
    throw;
  } catch (const std::exception& e) {
    CHRONICLE_LOG_ERROR("Projection failed",
                        {observability::StringField("document_type", document_type), observability::StringField("document_id", key),
                         observability::StringField("stream_id", event.stream_id), observability::UintField("version", event.version),
                         observability::StringField("event_type", event.type), observability::StringField("error", e.what())});
    throw util::ProjectionFailed(document_type + "/" + key, e.what());
  }
}

void ProjectionEngine::Apply(db::Repository& repo, db::Transaction& tx, const std::vector<events::RecordedEvent>& events) const {
  for (const auto& event : events) {
    const auto it = by_event_type_.find(event.type);
    if (it == by_event_type_.end()) continue;

    for (const auto* projection : it->second) {
      ApplyOne(repo, tx, *projection, event);
    }
  }
}

uint64_t ProjectionEngine::Rebuild(db::Repository& repo, const std::string& document_type, uint32_t page_size) const {
  const auto it = by_document_type_.find(document_type);
  if (it == by_document_type_.end()) {
    throw util::InvalidArgument(document_type, "no projection registered for " + document_type);
  }
  const Projection& projection = *it->second;
  if (page_size == 0) page_size = 1;

  const auto event_types = projection.EventTypes();
  uint64_t   applied     = 0;

  auto tx = repo.Begin();

  for (const auto& doc : repo.ListDocuments(*tx, document_type)) {
    const auto r = repo.DeleteDocument(*tx, document_type, doc.id);
    if (!r) {
      throw util::StorageUnavailable(document_type + "/" + doc.id, r.message);
    }
  }

  uint64_t after = 0;
  for (;;) {
    const auto page = repo.ReadAllEvents(*tx, after, page_size);
    for (const auto& event : page) {
      if (std::find(event_types.begin(), event_types.end(), event.type) != event_types.end()) {
        ApplyOne(repo, *tx, projection, event);
        ++applied;
      }
      after = event.sequence;
    }
    if (page.size() < page_size) break;
  }

  tx->Commit();

  CHRONICLE_LOG_INFO("Projection rebuilt",
                     {observability::StringField("document_type", document_type), observability::UintField("events", applied)});
  return applied;
}

bool ProjectionEngine::HasDocumentType(const std::string& document_type) const {
  return by_document_type_.contains(document_type);
}

std::vector<std::string> ProjectionEngine::DocumentTypes() const {
  std::vector<std::string> out;
  out.reserve(projections_.size());
  for (const auto& projection : projections_) out.push_back(projection->DocumentType());
  return out;
}

} // namespace chronicle::projection
