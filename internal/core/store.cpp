#include "internal/core/store.hpp"

#include <stdexcept>

#include "internal/codec/json_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace chronicle::core {

Store::Store(std::shared_ptr<db::Repository> repository, StoreOptions options)
    : repository_(std::move(repository)),
      codec_(options.codec ? std::move(options.codec) : std::make_shared<codec::JsonCodec>()),
      page_size_(options.fetch_page_size == 0 ? 1 : options.fetch_page_size) {
  if (!repository_) {
    throw std::invalid_argument("store requires a repository");
  }

  projections_ = std::make_shared<projection::ProjectionEngine>(std::move(options.projections), codec_);
  events_      = std::make_shared<events::EventLog>(repository_, codec_, projections_, page_size_);
  streams_     = std::make_shared<events::StreamRegistry>(repository_);
  documents_   = std::make_shared<documents::DocumentStore>(repository_, codec_, std::move(options.indexes));
  aggregates_  = std::make_shared<aggregate::AggregateRebuilder>(events_, codec_);

  CHRONICLE_LOG_DEBUG("Store ready", {observability::UintField("projections", projections_->DocumentTypes().size()),
                                      observability::IntField("fetch_page_size", page_size_)});
}

uint64_t Store::RebuildProjection(const std::string& document_type) {
  return util::GuardStorage(document_type, [&] { return projections_->Rebuild(*repository_, document_type, page_size_); });
}

void Store::ApplySchema(db::SchemaMode mode) {
  util::GuardStorage("$schema", [&] { repository_->ApplySchema(mode); });
}

void Store::DropSchema() {
  util::GuardStorage("$schema", [&] { repository_->DropSchema(); });
}

void Store::RecreateSchema() {
  DropSchema();
  ApplySchema(db::SchemaMode::CreateAll);
  CHRONICLE_LOG_WARN("Recreated schema");
}

} // namespace chronicle::core
