#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/aggregate/aggregate_rebuilder.hpp"
#include "internal/codec/codec.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/documents/document_store.hpp"
#include "internal/documents/index_registry.hpp"
#include "internal/events/event_log.hpp"
#include "internal/events/stream_registry.hpp"
#include "internal/projection/projection.hpp"
#include "internal/projection/projection_engine.hpp"

namespace chronicle::core {

struct StoreOptions {
  // inline projections; fixed for the lifetime of the store
  std::vector<std::shared_ptr<const projection::Projection>> projections;

  documents::IndexRegistry indexes;

  uint32_t fetch_page_size = 256;

  // defaults to JsonCodec
  std::shared_ptr<const codec::Codec> codec;
};

/*
  Store

  Long-lived handle over one repository. Create it once at startup and
  pass it explicitly to the code that needs it. Every operation opens
  its own short transaction, so the handle is safe to share between
  threads.
*/
class Store {
 public:
  Store(std::shared_ptr<db::Repository> repository, StoreOptions options);

  events::EventLog& Events() {
    return *events_;
  }
  const events::EventLog& Events() const {
    return *events_;
  }

  const events::StreamRegistry& Streams() const {
    return *streams_;
  }

  documents::DocumentStore& Documents() {
    return *documents_;
  }
  const documents::DocumentStore& Documents() const {
    return *documents_;
  }

  const aggregate::AggregateRebuilder& Aggregates() const {
    return *aggregates_;
  }

  const projection::ProjectionEngine& Projections() const {
    return *projections_;
  }

  const codec::Codec& Codec() const {
    return *codec_;
  }

  // Replays the whole log into one projection's documents.
  uint64_t RebuildProjection(const std::string& document_type);

  void ApplySchema(db::SchemaMode mode);

  void DropSchema();

  // Drop, then create the current schema from scratch.
  void RecreateSchema();

 private:
  std::shared_ptr<db::Repository>                     repository_;
  std::shared_ptr<const codec::Codec>                 codec_;
  uint32_t                                            page_size_;
  std::shared_ptr<const projection::ProjectionEngine> projections_;
  std::shared_ptr<events::EventLog>                   events_;
  std::shared_ptr<events::StreamRegistry>             streams_;
  std::shared_ptr<documents::DocumentStore>           documents_;
  std::shared_ptr<aggregate::AggregateRebuilder>      aggregates_;
};

} // namespace chronicle::core
